/**@file ProcessManagerBase.cpp
 * @date 20261018 09:12:40 */

#include "ProcessManagerBase.hpp"
#include <errno.h>
#include <execinfo.h>
#include <poll.h>
#include <stdlib.h>
#include <string.h>
#include <ucontext.h>
#include <unistd.h>
#include <sys/signalfd.h>
#include <sstream>
#include <iostream>
#include <pcmsink.h>
#include "logging.hpp"

namespace pcmsink {

ProcessManagerBase::ProcessManagerBase()
	: state_(STATE_NULL)
	, signals_(false)
{
	sigemptyset(&sigset_);
}

void
ProcessManagerBase::signalError(int sig, siginfo_t *si, void *ptr)
{
	void*  ErrorAddr;
	void*  Trace[16];
	int    x;
	int    TraceSize;
	char** Messages;
	std::stringstream msg;
	msg << _("ProcessManager: received signal: ") << strsignal(sig)
			<< " (" << si->si_addr << ")" << std::endl;
#if __WORDSIZE == 64 // os type
	ErrorAddr = (void*)((ucontext_t*)ptr)->uc_mcontext.gregs[REG_RIP];
#else
	ErrorAddr = (void*)((ucontext_t*)ptr)->uc_mcontext.gregs[REG_EIP];
#endif
	TraceSize = backtrace(Trace, 16);
	Trace[1] = ErrorAddr;
	Messages = backtrace_symbols(Trace, TraceSize);
	if (Messages)
	{
		const char intend[] = "  ";
		msg << intend << _("== Backtrace ==") << std::endl;
		for (x = 1; x < TraceSize; x++)
			msg << intend << Messages[x] << std::endl;
		msg << intend << _("== End Backtrace ==");
		LOG(ERROR) << msg.str();
		free(Messages);
	}
	FlushLogging();
	exit(2); // need restart status
}

/**@brief Wait for control signals until stopped
 * @return process exit status*/
int
ProcessManagerBase::loop()
{
	int rs_code = 0;
	struct signalfd_siginfo fdsi;
	int sfd = signalfd(-1, &sigset_, SFD_NONBLOCK | SFD_CLOEXEC);
	if (sfd == -1)
	{
		LOG(ERROR) << _("ProcessManager: error registering process."
		                " Can't get signalfd.");
		Stop();
		rs_code = 1;
	}
	while (sfd != -1 && IsRunning())
	{
		struct pollfd pfd = {sfd, POLLIN, 0};
		int rs = poll(&pfd, 1, 100);
		if (rs == -1)
		{
			if (errno == EINTR)
				continue;
			LOG(ERROR) << _("ProcessManager: error signals wait.")
			           << _(" Message: ") << strerror(errno);
			Stop();
			rs_code = 1;
			break;
		}
		else if (rs == 0)
		{
			continue;
		}
		ssize_t s = read(sfd, &fdsi, sizeof(struct signalfd_siginfo));
		if (s != sizeof(struct signalfd_siginfo))
		{
			if (s == -1 && errno == EAGAIN)
				continue;
			LOG(ERROR) << _("ProcessManager: error signals read.")
			           << _(" Message: ") << strerror(errno);
			Stop();
			rs_code = 1;
			break;
		}
		if (fdsi.ssi_signo == SIGUSR1 || fdsi.ssi_signo == SIGHUP)
		{
			LOG(INFO) << _("ProcessManager: received signal: ")
			          << strsignal(fdsi.ssi_signo)
			          << _(" Flushing logs.");
			FlushLogging();
			continue;
		}
		if (fdsi.ssi_signo == SIGPIPE)
			continue;
		LOG(INFO) << _("ProcessManager: received signal: ")
		          << strsignal(fdsi.ssi_signo)
		          << _(" STOPPING");
		Stop();
		break;
	}
	if (sfd != -1)
		close(sfd);
	return rs_code;
}

/**@brief Start the service and serve signals in the calling thread
 * @return process exit status: 0 on signal stop, 1 if the service
 * couldn't start*/
int
ProcessManagerBase::Loop()
{
	{
		std::lock_guard<std::mutex> lock(state_mtx_);
		if (state_ != STATE_NULL)
			return 1;
		setupSignals();
		signals_ = true;
		VLOG(2) << _("ProcessManager: initializing.");
		if (!doStart())
		{
			LOG(ERROR) << _("ProcessManager: initializing failed.");
			return 1;
		}
		state_ = STATE_RUNNING;
	}
	VLOG(2) << _("ProcessManager: starting main loop.");
	int rs = loop();
	VLOG(2) << _("ProcessManager: cleaning.");
	if (!doStop())
	{
		LOG(ERROR) << _("ProcessManager: cleaning process failed.");
		return 1;
	}
	return rs;
}

/**@brief Start the service without signal handling*/
bool
ProcessManagerBase::Dispatch()
{
	std::lock_guard<std::mutex> lock(state_mtx_);
	if (state_ != STATE_NULL)
		return false;
	signals_ = false;
	VLOG(2) << _("ProcessManager: dispatching.");
	if (!doStart())
	{
		LOG(ERROR) << _("ProcessManager: initializing failed.");
		return false;
	}
	state_ = STATE_RUNNING;
	return true;
}

/**@brief Stop the service
 *
 * Under Loop() this only ends the signal wait, Loop() cleans up. A
 * dispatched service is cleaned up right here.*/
void
ProcessManagerBase::Stop()
{
	std::lock_guard<std::mutex> lock(state_mtx_);
	if (state_ == STATE_NULL)
		return;
	state_ = STATE_NULL;
	VLOG(2) << _("ProcessManager: stopping.");
	if (!signals_ && !doStop())
		LOG(ERROR) << _("ProcessManager: cleaning process failed.");
}

bool
ProcessManagerBase::IsRunning()
{
	std::lock_guard<std::mutex> lock(state_mtx_);
	return state_ == STATE_RUNNING;
}

} // namespace
