/**@file Service.cpp
 * @date 20261018 09:12:40 */

#include "Service.hpp"
#include <zmq.h>
#include <chrono>
#include <vector>
#include <logging.hpp>
#include "Messages.hpp"
#include "Subprocess.hpp"
#include "Utils.hpp"

namespace pcmsink {

Service::Service(const Config& cfg, EventSink& sink, Clock clock)
	: cfg_(cfg)
	, sink_(sink)
	, clock_(clock)
	, degraded_(false)
	, zmq_ctx_(NULL)
	, sock_receiver_(NULL)
	, sock_dispatcher_(NULL)
{
}

Service::~Service()
{
	Stop();
}

uint16_t
Service::Port() const
{
	return receiver_instance_ ? receiver_instance_->Port() : 0;
}

bool
Service::ProbeEncoder(const std::string& encoder)
{
	std::vector<std::string> args;
	args.push_back(encoder);
	args.push_back("-version");
	Subprocess::Result rs = Subprocess::Run(args, PROBE_TIMEOUT_SEC);
	VLOG_IF(2, !rs.Succeeded()) << "Service: encoder probe output: "
	                            << rs.output;
	return rs.Succeeded();
}

bool
Service::createSocks()
{
	sock_receiver_   = createBindSock(zmq_ctx_, Receiver::CTL_ADDR,
	                                  ZMQ_PAIR, cfg_.MsgHWM());
	sock_dispatcher_ = createBindSock(zmq_ctx_, CompressDispatcher::CTL_ADDR,
	                                  ZMQ_PAIR, cfg_.MsgHWM());
	VLOG_IF(2, sock_receiver_ == NULL)   << _("Error with receiver socket.");
	VLOG_IF(2, sock_dispatcher_ == NULL) << _("Error with dispatcher socket.");
	return sock_receiver_ && sock_dispatcher_;
}

bool
Service::waitChildrenReady(const size_t timeout_ms)
{
	std::chrono::steady_clock::time_point deadline
		= std::chrono::steady_clock::now()
			+ std::chrono::milliseconds(timeout_ms);
	zmq_pollitem_t poll_items[2] = {
		{sock_receiver_,   0, ZMQ_POLLIN, 0},
		{sock_dispatcher_, 0, ZMQ_POLLIN, 0}
	};
	bool receiver_ready = false;
	bool dispatcher_ready = false;
	while (deadline > std::chrono::steady_clock::now())
	{
		int rs = zmq_poll(poll_items, 2, TICK);
		if (rs == -1 && errno == EINTR)
			continue;
		if (rs == -1)
		{
			VLOG(2) << _("Service: error threads initialization.")
			        << _(" Message: ") << zmq_strerror(errno);
			return false;
		}
		if (rs == 0)
			continue;
		if (poll_items[0].revents & ZMQ_POLLIN)
		{
			Message msg(sock_receiver_);
			if (msg == MSG_ERROR)
				return false;
			if (msg == MSG_READY)
				receiver_ready = true;
		}
		if (poll_items[1].revents & ZMQ_POLLIN)
		{
			Message msg(sock_dispatcher_);
			if (msg == MSG_ERROR)
				return false;
			if (msg == MSG_READY)
				dispatcher_ready = true;
		}
		if (receiver_ready && dispatcher_ready)
			return true;
	}
	VLOG_IF(2, !receiver_ready) << _("Service: receiver is not ready.");
	VLOG_IF(2, !dispatcher_ready) << _("Service: dispatcher is not ready.");
	return false;
}

bool
Service::doStart()
{
	VLOG(2) << "Service: starting." << cfg_.GetOptions();
	if (cfg_.CompressionEnabled() && !ProbeEncoder(cfg_.Encoder()))
	{
		LOG(WARNING) << _("Encoder '") << cfg_.Encoder()
		             << _("' is not available. Compression disabled,"
		                  " recording continues.");
		cfg_.DisableCompression();
		degraded_ = true;
	}
	zmq_ctx_ = zmq_ctx_new();
	if (!zmq_ctx_)
	{
		LOG(ERROR) << _("Service: error creating communication context.")
		           << _(" Message: ") << zmq_strerror(errno);
		return false;
	}
	if (!createSocks())
	{
		LOG(ERROR) << _("Error creating inter-thread communications.")
		           << _(" Use verbose for more info.");
		doStop();
		return false;
	}
	dispatcher_instance_.reset(
		new CompressDispatcher(zmq_ctx_, cfg_, sink_, clock_));
	receiver_instance_.reset(new Receiver(zmq_ctx_, cfg_, sink_, clock_));
	if (!dispatcher_instance_->IsValid())
	{
		LOG(ERROR) << _("Error creating inter-thread communications.")
		           << _(" Use verbose for more info.");
		doStop();
		return false;
	}
	if (!receiver_instance_->Listen())
	{
		doStop();
		return false;
	}
	dispatcher_thread_.reset(new std::thread(CompressDispatcher::Start,
	                                         dispatcher_instance_.get()));
	receiver_thread_.reset(new std::thread(Receiver::Start,
	                                       receiver_instance_.get()));
	if (!waitChildrenReady(500*TICK))
	{
		LOG(ERROR) << _("Service: some threads weren't ready in the given"
		                " timeout.");
		doStop();
		return false;
	}
	VLOG(2) << _("Service: all threads started.");
	return true;
}

/**@brief Stop the receiver first, so its last segment is handed off
 * before the dispatcher goes away*/
bool
Service::doStop()
{
	VLOG(2) << _("Service: stopping.");
	if (receiver_thread_)
	{
		MSG_STOP.Send(sock_receiver_, Message::NONBLOCKING_MODE);
		receiver_thread_->join();
		receiver_thread_.reset();
	}
	if (dispatcher_thread_)
	{
		MSG_STOP.Send(sock_dispatcher_, Message::NONBLOCKING_MODE);
		dispatcher_thread_->join();
		dispatcher_thread_.reset();
	}
	receiver_instance_.reset();
	dispatcher_instance_.reset();
	if (sock_receiver_)
		zmq_close(sock_receiver_);
	if (sock_dispatcher_)
		zmq_close(sock_dispatcher_);
	sock_receiver_ = NULL;
	sock_dispatcher_ = NULL;
	if (zmq_ctx_)
		zmq_ctx_destroy(zmq_ctx_);
	zmq_ctx_ = NULL;
	return true;
}

} // namespace
