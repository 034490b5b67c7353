/**@file ProcessManagerBase.hpp
 * @date 20261018 09:12:40 */

#ifndef __PROCESS_MANAGER_BASE_HPP__
#define __PROCESS_MANAGER_BASE_HPP__

#include <signal.h>
#include <mutex>

namespace pcmsink {

/**@brief Run state and signal handling of a long living service
 *
 * Loop() is for the process main thread: it blocks the control signals
 * and waits for them on a signalfd. Dispatch() only starts the service
 * and leaves signals to the embedding code.*/
class ProcessManagerBase
{
public:
	enum State
	{
		STATE_NULL      = 0,
		STATE_RUNNING   = 2,
	};
	ProcessManagerBase();
	virtual ~ProcessManagerBase() {};
	bool            Dispatch();
	int             Loop();
	void            Stop();
	bool            IsRunning();
protected:
	virtual bool    doStart() = 0;
	virtual bool    doStop() = 0;
private:
	int             loop();
	void            setupSignals();
	static void     signalError(int sig, siginfo_t *si, void *ptr);
	State           state_;
	std::mutex      state_mtx_;
	sigset_t        sigset_;
	bool            signals_;
};

////////////////////////////////////////////////////////////////////////
// inline

inline void
ProcessManagerBase::setupSignals()
{
	struct sigaction sigact;
	sigact.sa_flags = SA_SIGINFO;
	sigact.sa_sigaction = ProcessManagerBase::signalError;
	sigemptyset(&sigact.sa_mask);
	sigaction(SIGFPE, &sigact, 0);
	sigaction(SIGILL, &sigact, 0);
	sigaction(SIGSEGV, &sigact, 0);
	sigaction(SIGBUS, &sigact, 0);

	sigemptyset(&sigset_);
	sigaddset(&sigset_, SIGQUIT);
	sigaddset(&sigset_, SIGINT);
	sigaddset(&sigset_, SIGTERM);
	sigaddset(&sigset_, SIGUSR1);
	sigaddset(&sigset_, SIGHUP);
	sigaddset(&sigset_, SIGPIPE);
	sigprocmask(SIG_BLOCK, &sigset_, NULL);
}

} // namespace

#endif // __PROCESS_MANAGER_BASE_HPP__
