/**@file CompressDispatcher.hpp
 * @date 20261018 09:12:40 */

#ifndef __COMPRESS_DISPATCHER_HPP__
#define __COMPRESS_DISPATCHER_HPP__

#include <chrono>
#include <map>
#include <memory>
#include <string>
#include <thread>
#include <vector>

#include "Config.hpp"
#include "EncoderWorker.hpp"
#include "Events.hpp"
#include "Messages.hpp"
#include "Storage.hpp"

namespace pcmsink {

/**@brief Delays closed segments and feeds them to the encoder pool
 *
 * Sockets:
 *
 * 	inproc://segments   PULL  closed segments from the receiver
 * 	inproc://jobs/N     PUSH  one per worker, jobs for worker N
 * 	inproc://reports    PULL  READY and job reports from the workers
 * 	inproc://dispatcher PAIR  control channel to the service
 *
 * Segments and reports are bound in the constructor, so the receiver
 * may connect before Start() runs. A job goes only to a worker with
 * nothing in flight, and never while the same path is still being
 * encoded. The dispatcher also runs the retention sweep, so it works
 * with compression disabled too.*/
class CompressDispatcher
{
public:
	typedef std::chrono::steady_clock SteadyClock;

	CompressDispatcher(void* zmq_ctx, const Config& cfg, EventSink& sink,
	                   Clock clock);
	~CompressDispatcher();

	bool         IsValid() const;
	static void* Start(CompressDispatcher* self);

	static const char* CTL_ADDR;

private:
	CompressDispatcher() = delete;
	CompressDispatcher(const CompressDispatcher&) = delete;
	CompressDispatcher& operator=(const CompressDispatcher&) = delete;

	bool startWorkers();
	void stopWorkers();
	bool waitWorkersReady(const size_t timeout_ms);
	void schedule(const Message& msg);
	void pushEligible();
	int  idleWorker() const;
	bool inFlight(const std::string& path) const;
	void processReport();
	void sweep();
	long pollTimeout() const;
	void closeSocks();

	typedef std::multimap<SteadyClock::time_point, Message> PendingJobs;

	void*         zmq_ctx_;
	void*         sock_ctl_;
	void*         sock_segments_;
	void*         sock_reports_;
	const Config& cfg_;
	EventSink&    sink_;
	Clock         clock_;
	PendingJobs   pending_;
	SteadyClock::time_point next_sweep_;

	// indexed by worker, an empty path means idle
	std::vector<void*>       sock_jobs_;
	std::vector<std::string> assigned_;
	std::vector<std::unique_ptr<EncoderWorker> > workers_instances_;
	std::vector<std::unique_ptr<std::thread> >   workers_threads_;

	static const long SWEEP_INTERVAL_SEC = 3600;
};

} // namespace

#endif // __COMPRESS_DISPATCHER_HPP__
