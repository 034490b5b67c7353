/**@file EncoderWorker.cpp
 * @date 20261018 09:12:40 */

#include <EncoderWorker.hpp>
#include <logging.hpp>
#include <zmq.h>
#include "CompressionJob.hpp"
#include "Messages.hpp"
#include "Utils.hpp"

namespace pcmsink {

void*
EncoderWorker::Start(EncoderWorker* self)
{
	self->break_ = false;
	int hwm = self->cfg_.MsgHWM();
	void* sock_in_  =
		createConnectSock(self->zmq_ctx_, self->jobs_addr_, ZMQ_PULL, hwm);
	void* sock_out_ =
		createConnectSock(self->zmq_ctx_, "inproc://reports", ZMQ_PUSH, hwm);
	VLOG_IF(2, !sock_in_) << "EncoderWorker (" << self << "):"
	                      << _(" error with input socket.");
	VLOG_IF(2, !sock_out_) << "EncoderWorker (" << self << "):"
	                       << _(" error with output socket.");
	if (!sock_in_ || !sock_out_)
	{
		LOG(ERROR) << "EncoderWorker (" << self << "):"
		           << _(" error initializing communications.");
		if (sock_in_)
			zmq_close(sock_in_);
		if (sock_out_)
			zmq_close(sock_out_);
		return NULL;
	}
	MSG_READY.Send(sock_out_, Message::BLOCKING_MODE);
	zmq_pollitem_t event = {sock_in_, 0, ZMQ_POLLIN, 0};
	while (!self->break_)
	{
		int rs = zmq_poll(&event, 1, 10*TICK);
		if (rs == 0)
			continue;
		if (rs == -1)
		{
			if (errno == EINTR)
				continue;
			VLOG(2) << "EncoderWorker (" << self << "):"
			        << _(" error polling.") << zmq_strerror(errno);
			MSG_ERROR.Send(sock_out_);
			break;
		}
		Message msg(sock_in_);
		if (msg == MSG_STOP)
		{
			VLOG(2) << "EncoderWorker (" << self << "):"
			        << _(" received MSG_STOP. Stopping.");
			break;
		}
		if (msg.Type() != Message::TYPE_SEGMENT || msg.Path().empty())
		{
			LOG(WARNING) << "EncoderWorker (" << self << "):"
			             << _(" received unexpected message type.")
			             << _(" Type: ") << (int)msg.Type();
			continue;
		}
		CompressionJob job(self->cfg_, msg.Path());
		JobReport report = job.Run();
		LOG_IF(ERROR, report.status == JOB_FAILED
		           && !report.diagnostics.empty())
			<< _("Encoder output for ") << get_base_name(report.path)
			<< ": " << report.diagnostics;
		if (!Message(report).Send(sock_out_, Message::BLOCKING_MODE))
		{
			LOG(ERROR) << "EncoderWorker (" << self << "):"
			           << _(" failed to send report for ")
			           << report.path;
		}
	}
	if (self->break_)
		VLOG(2) << "EncoderWorker (" << self << "): breaked.";
	zmq_close(sock_in_);
	zmq_close(sock_out_);
	return NULL;
}

} // namespace
