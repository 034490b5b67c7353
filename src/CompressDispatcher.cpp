/**@file CompressDispatcher.cpp
 * @date 20261018 09:12:40 */

#include "CompressDispatcher.hpp"
#include <zmq.h>
#include <algorithm>
#include <sstream>
#include <logging.hpp>
#include "CompressionJob.hpp"
#include "Utils.hpp"

namespace pcmsink {

const char* CompressDispatcher::CTL_ADDR = "inproc://dispatcher";
const long  CompressDispatcher::SWEEP_INTERVAL_SEC;

CompressDispatcher::CompressDispatcher(void* zmq_ctx, const Config& cfg,
                                       EventSink& sink, Clock clock)
	: zmq_ctx_(zmq_ctx)
	, sock_ctl_(NULL)
	, sock_segments_(NULL)
	, sock_reports_(NULL)
	, cfg_(cfg)
	, sink_(sink)
	, clock_(clock)
	, next_sweep_(SteadyClock::now())
{
	int hwm = cfg_.MsgHWM();
	sock_segments_ = createBindSock(zmq_ctx_, "inproc://segments",
	                                ZMQ_PULL, hwm);
	sock_reports_  = createBindSock(zmq_ctx_, "inproc://reports",
	                                ZMQ_PULL, hwm);
	VLOG_IF(2, !sock_segments_) << _("Error with segments socket.");
	VLOG_IF(2, !sock_reports_)  << _("Error with reports socket.");
}

CompressDispatcher::~CompressDispatcher()
{
	closeSocks();
}

bool
CompressDispatcher::IsValid() const
{
	return sock_segments_ && sock_reports_;
}

void
CompressDispatcher::closeSocks()
{
	void** socks[] = {&sock_ctl_, &sock_segments_, &sock_reports_};
	for (size_t i = 0; i < sizeof(socks)/sizeof(socks[0]); ++i)
	{
		if (*socks[i])
		{
			zmq_close(*socks[i]);
			*socks[i] = NULL;
		}
	}
	for (size_t i = 0; i < sock_jobs_.size(); ++i)
		zmq_close(sock_jobs_[i]);
	sock_jobs_.clear();
}

bool
CompressDispatcher::startWorkers()
{
	for (size_t i = 0; i < cfg_.Workers(); ++i)
	{
		std::stringstream addr;
		addr << "inproc://jobs/" << i;
		void* sock = createBindSock(zmq_ctx_, addr.str(), ZMQ_PUSH,
		                            cfg_.MsgHWM());
		if (!sock)
		{
			LOG(ERROR) << _("CompressDispatcher: error with jobs socket ")
			           << addr.str();
			return false;
		}
		sock_jobs_.push_back(sock);
		assigned_.push_back(std::string());
		workers_instances_.push_back(std::unique_ptr<EncoderWorker>(
			new EncoderWorker(zmq_ctx_, cfg_, addr.str())));
		workers_threads_.push_back(std::unique_ptr<std::thread>(
			new std::thread(EncoderWorker::Start,
			                workers_instances_.back().get())));
	}
	if (!waitWorkersReady(100*TICK))
	{
		LOG(ERROR) << _("CompressDispatcher: some encoder workers"
		                " weren't ready in the given timeout.");
		return false;
	}
	VLOG(2) << "CompressDispatcher: " << workers_threads_.size()
	        << " encoder workers started.";
	return true;
}

bool
CompressDispatcher::waitWorkersReady(const size_t timeout_ms)
{
	SteadyClock::time_point deadline = SteadyClock::now()
		+ std::chrono::milliseconds(timeout_ms);
	zmq_pollitem_t item = {sock_reports_, 0, ZMQ_POLLIN, 0};
	size_t ready = 0;
	while (ready < workers_threads_.size() && deadline > SteadyClock::now())
	{
		int rs = zmq_poll(&item, 1, TICK);
		if (rs == -1 && errno != EINTR)
		{
			VLOG(2) << _("CompressDispatcher: error waiting workers.")
			        << _(" Message: ") << zmq_strerror(errno);
			return false;
		}
		if (rs <= 0)
			continue;
		Message msg(sock_reports_);
		if (msg == MSG_READY)
			++ready;
	}
	return ready == workers_threads_.size();
}

/**@brief Stop and join every worker
 *
 * A worker busy with a job finishes it first, bounded by the encoder
 * timeout.*/
void
CompressDispatcher::stopWorkers()
{
	for (size_t i = 0; i < workers_instances_.size(); ++i)
	{
		if (!MSG_STOP.Send(sock_jobs_[i], Message::NONBLOCKING_MODE))
			workers_instances_[i]->Break();
	}
	for (size_t i = 0; i < workers_threads_.size(); ++i)
	{
		if (workers_threads_[i])
		{
			workers_threads_[i]->join();
			workers_threads_[i].reset();
		}
	}
	workers_threads_.clear();
	workers_instances_.clear();
	assigned_.clear();
}

void
CompressDispatcher::schedule(const Message& msg)
{
	const std::string path = msg.Path();
	if (!cfg_.CompressionEnabled())
	{
		VLOG(2) << "CompressDispatcher: compression disabled, keeping "
		        << path;
		return;
	}
	pending_.insert(std::make_pair(SteadyClock::now()
		+ std::chrono::seconds(cfg_.CompressDelay()), msg));
	sink_.JobScheduled(path, cfg_.CompressDelay());
}

/// index of a worker with nothing in flight, -1 if all are busy
int
CompressDispatcher::idleWorker() const
{
	for (size_t i = 0; i < assigned_.size(); ++i)
	{
		if (assigned_[i].empty())
			return (int)i;
	}
	return -1;
}

bool
CompressDispatcher::inFlight(const std::string& path) const
{
	return std::find(assigned_.begin(), assigned_.end(), path)
		!= assigned_.end();
}

/**@brief Hand due jobs to idle workers
 *
 * A job stays pending until some worker is free, so a slow encoder
 * queues jobs here rather than behind a busy worker.*/
void
CompressDispatcher::pushEligible()
{
	SteadyClock::time_point now = SteadyClock::now();
	PendingJobs::iterator job = pending_.begin();
	while (job != pending_.end() && job->first <= now)
	{
		int worker = idleWorker();
		if (worker < 0)
			break;
		const std::string path = job->second.Path();
		if (inFlight(path))
		{
			++job;
			continue;
		}
		if (!job->second.Send(sock_jobs_[worker],
		                      Message::NONBLOCKING_MODE))
		{
			LOG(WARNING) << _("CompressDispatcher: can't hand job to"
			                  " worker ") << worker
			             << _(", will retry: ") << path;
			break;
		}
		VLOG(2) << "CompressDispatcher: job " << path << " pushed to"
		        << " worker " << worker;
		assigned_[worker] = path;
		pending_.erase(job++);
	}
}

void
CompressDispatcher::processReport()
{
	Message msg(sock_reports_);
	if (msg == MSG_ERROR)
	{
		LOG(ERROR) << _("CompressDispatcher: an encoder worker failed.");
		return;
	}
	if (msg.Type() != Message::TYPE_REPORT)
	{
		VLOG(2) << "CompressDispatcher: unexpected message on reports"
		        << " socket, type " << (int)msg.Type();
		return;
	}
	JobReport report = msg.Report();
	std::vector<std::string>::iterator worker =
		std::find(assigned_.begin(), assigned_.end(), report.path);
	if (worker != assigned_.end())
		worker->clear();
	else
		VLOG(2) << "CompressDispatcher: report for a job nobody runs: "
		        << report.path;
	if (report.status == JOB_SUCCEEDED)
		report.output = CompressionJob(cfg_, report.path).OutputPath();
	sink_.JobFinished(report);
}

void
CompressDispatcher::sweep()
{
	next_sweep_ = SteadyClock::now()
		+ std::chrono::seconds(SWEEP_INTERVAL_SEC);
	if (cfg_.RetentionDays() == 0)
		return;
	size_t removed = Storage::SweepRetention(cfg_.DataDir(),
	                                         cfg_.RetentionDays(),
	                                         clock_());
	LOG_IF(INFO, removed > 0)
		<< _("Retention: removed ") << removed
		<< _(" day directories older than ") << cfg_.RetentionDays()
		<< _(" days");
}

/**@brief ms until the earliest job that could be pushed, bounded by
 * 10 ticks
 *
 * Jobs waiting for their own path to finish don't count, a report
 * wakes the poll for them.*/
long
CompressDispatcher::pollTimeout() const
{
	long rs = 10*TICK;
	if (idleWorker() < 0)
		return rs;
	for (PendingJobs::const_iterator job = pending_.begin();
	     job != pending_.end(); ++job)
	{
		if (inFlight(job->second.Path()))
			continue;
		long due = std::chrono::duration_cast<std::chrono::milliseconds>(
			job->first - SteadyClock::now()).count();
		if (due < rs)
			rs = due > 0 ? due : 0;
		break;
	}
	return rs;
}

void*
CompressDispatcher::Start(CompressDispatcher* self)
{
	self->sock_ctl_ = createConnectSock(self->zmq_ctx_, CTL_ADDR, ZMQ_PAIR,
	                                    self->cfg_.MsgHWM());
	if (!self->sock_ctl_ || !self->IsValid())
	{
		LOG(ERROR) << _("CompressDispatcher: error initializing"
		                " communications.");
		self->closeSocks();
		return NULL;
	}
	if (self->cfg_.CompressionEnabled() && !self->startWorkers())
	{
		self->stopWorkers();
		MSG_ERROR.Send(self->sock_ctl_, Message::BLOCKING_MODE);
		self->closeSocks();
		return NULL;
	}
	MSG_READY.Send(self->sock_ctl_, Message::BLOCKING_MODE);
	self->sweep();

	zmq_pollitem_t items[3] = {
		{self->sock_ctl_,      0, ZMQ_POLLIN, 0},
		{self->sock_segments_, 0, ZMQ_POLLIN, 0},
		{self->sock_reports_,  0, ZMQ_POLLIN, 0}
	};
	for (;;)
	{
		int rs = zmq_poll(items, 3, self->pollTimeout());
		if (rs == -1)
		{
			if (errno == EINTR)
				continue;
			LOG(ERROR) << _("CompressDispatcher: error polling.")
			           << _(" Message: ") << zmq_strerror(errno);
			break;
		}
		if (items[0].revents & ZMQ_POLLIN)
		{
			Message msg(self->sock_ctl_);
			if (msg == MSG_STOP)
			{
				VLOG(2) << "CompressDispatcher: received MSG_STOP.";
				break;
			}
		}
		if (items[1].revents & ZMQ_POLLIN)
		{
			Message msg(self->sock_segments_);
			if (msg.Type() == Message::TYPE_SEGMENT)
				self->schedule(msg);
			else
				VLOG(2) << "CompressDispatcher: unexpected message on"
				        << " segments socket, type " << (int)msg.Type();
		}
		if (items[2].revents & ZMQ_POLLIN)
			self->processReport();
		self->pushEligible();
		if (SteadyClock::now() >= self->next_sweep_)
			self->sweep();
	}
	LOG_IF(WARNING, !self->pending_.empty())
		<< _("CompressDispatcher: dropping ") << self->pending_.size()
		<< _(" pending compression jobs");
	for (PendingJobs::const_iterator i = self->pending_.begin();
	     i != self->pending_.end(); ++i)
	{
		VLOG(2) << "CompressDispatcher: dropped " << i->second.Path();
	}
	self->pending_.clear();
	self->stopWorkers();
	self->closeSocks();
	VLOG(2) << "CompressDispatcher: stopped.";
	return NULL;
}

} // namespace
