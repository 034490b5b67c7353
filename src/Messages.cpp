/**@file Messages.cpp
 * @date 20261018 09:12:40*/

#include "Messages.hpp"
#include <logging.hpp>
#include <pcmsink.h>
#include "Utils.hpp"
#include <cassert>

namespace pcmsink {

const size_t Message::SEGMENT_HEADER_SIZE = sizeof(MessageType);
const size_t Message::REPORT_HEADER_SIZE  = sizeof(MessageType)
                                          + sizeof(uint8_t)
                                          + sizeof(u32le)*3;

/**@fun Message::Message()
 * @brief makes empty message*/

/**@fun Message::Message(const Message&)
 * @brief copy ctor*/

/**@fun Message::Message(void*, SendMode)
 * @brief fetching ctor*/
Message::Message(void* sock, SendMode mode)
	: datasz_(0)
{
	Fetch(sock, mode);
}

/**@fun Message::Message(const SegmentInfo&)
 * @brief TYPE_SEGMENT ctor
 *
 * Only the path travels, the job reads sizes from the disk.*/
Message::Message(const SegmentInfo& segment)
{
	datasz_ = SEGMENT_HEADER_SIZE + segment.path.length();
	data_.reset(new uint8_t[datasz_]);
	memset(data_.get(), 0, datasz_);
	uint8_t* pos = data_.get();

	add_to_buf(pos, TYPE_SEGMENT);
	add_to_buf(pos, segment.path.c_str(), segment.path.length());
	assert(pos == data_.get() + datasz_);
}

/**@fun Message::Message(const JobReport&)
 * @brief TYPE_REPORT ctor
 *
 * Diagnostics stay with the worker, it logs them itself.*/
Message::Message(const JobReport& report)
{
	datasz_ = REPORT_HEADER_SIZE + report.path.length();
	data_.reset(new uint8_t[datasz_]);
	memset(data_.get(), 0, datasz_);
	uint8_t* pos = data_.get();

	add_to_buf(pos, TYPE_REPORT);
	add_to_buf(pos, (uint8_t)report.status);
	add_to_buf(pos, u32le(report.original_size));
	add_to_buf(pos, u32le(report.compressed_size));
	add_to_buf(pos, u32le(report.elapsed_ms));
	add_to_buf(pos, report.path.c_str(), report.path.length());
	assert(pos == data_.get() + datasz_);
}

/**@fun Message::Message(const std::string&)
 * @brief TYPE_INFO ctor*/
Message::Message(const std::string& msg)
{
	datasz_ = sizeof(MessageType) + msg.length();
	data_.reset(new uint8_t[datasz_]);
	memset(data_.get(), 0, datasz_);
	uint8_t* pos = data_.get();

	add_to_buf(pos, TYPE_INFO);
	add_to_buf(pos, msg.c_str(), msg.length());
	assert(pos == data_.get() + datasz_);
}

size_t
Message::pathOffset() const
{
	switch (Type())
	{
		case TYPE_SEGMENT: return SEGMENT_HEADER_SIZE;
		case TYPE_REPORT:  return REPORT_HEADER_SIZE;
		default:           return datasz_;
	}
}

uint32_t
Message::u32At(size_t off) const
{
	u32le val = 0;
	if (!data_ || datasz_ < off + sizeof(val.bytes))
		return 0;
	memcpy(val.bytes, data_.get() + off, sizeof(val.bytes));
	return val;
}

/**@brief Segment or report path, empty for other types*/
std::string
Message::Path() const
{
	std::string rs;
	size_t off = pathOffset();
	if (data_ && datasz_ > off)
		rs.assign((const char*)data_.get() + off, datasz_ - off);
	return rs;
}

JobReport
Message::Report() const
{
	JobReport rs;
	if (Type() != TYPE_REPORT || datasz_ < REPORT_HEADER_SIZE)
		return rs;
	const size_t base = sizeof(MessageType) + sizeof(uint8_t);
	rs.status = (JobStatus)data_[sizeof(MessageType)];
	rs.original_size = u32At(base);
	rs.compressed_size = u32At(base + sizeof(u32le));
	rs.elapsed_ms = u32At(base + sizeof(u32le)*2);
	rs.path = Path();
	return rs;
}

/**@brief Send message into socket
 * @param blocking sending mode (blocking/nonblocking)
 * @return on success returns true, otherwise - false*/
bool
Message::Send(void* sock, SendMode blocking) const
{
	zmq_msg_t msg;
	if (!sock || !data_ || datasz_ == 0)
		return false;
	if (zmq_msg_init_size(&msg, datasz_) == -1)
	{
		VLOG(2) << _("Message: error initializing zmq_msg_t in send.")
		        << _(" Message: ") << zmq_strerror(errno);
		return false;
	}
	memcpy(zmq_msg_data(&msg), data_.get(), datasz_);
	int rs = zmq_msg_send(&msg, sock, blocking ? 0 : ZMQ_DONTWAIT);
	if (rs == -1)
	{
		VLOG_IF(2, errno != EAGAIN && errno != EWOULDBLOCK)
			<< _("Message: error message sending.")
			<< _(" Message: ") << zmq_strerror(errno);
		zmq_msg_close(&msg);
		return false;
	}
	if ((size_t)rs != datasz_)
	{
		VLOG(2) << _("Message: not all data was sent.")
		        << _(" Message: ") << zmq_strerror(errno);
		return false;
	}
	return true;
}

/**@brief Get message from socket
 * @param blocking receiving mode (blocking/nonblocking)*/
void
Message::Fetch(void* zmq_sock, SendMode blocking)
{
	Clear();
	zmq_msg_t msg;
	if (zmq_msg_init(&msg) == -1)
	{
		VLOG(2) << _("Message: error initializing zmq_msg in fetch.")
		        << _(" Message: ") << zmq_strerror(errno);
		return;
	}
	if (zmq_msg_recv(&msg, zmq_sock, blocking ? 0 : ZMQ_DONTWAIT) == -1)
	{
		VLOG_IF(2, errno != EAGAIN)
			<< _("Message: error receiving data "
			     "in message initialization.")
			<< _(" Message: ") << zmq_strerror(errno);
	}
	else
	{
		datasz_ = zmq_msg_size(&msg);
		void *msgdata = zmq_msg_data(&msg);
		if (datasz_ > 0 && msgdata != NULL)
		{
			data_.reset(new uint8_t[datasz_]);
			memcpy(data_.get(), msgdata, datasz_);
		}
		else
		{
			datasz_ = 0;
			VLOG(2) << _("Message: error retrieving data"
			             " from zmq_msg.");
		}
	}
	zmq_msg_close(&msg);
}

/**@fun Message::Clear()
 * @brief Clear resources.*/

/**@fun Message::Type()
 * @brief Get Message type.*/

/**@fun Message::What() const
 * @brief Get info message
 *
 * For types, other then TYPE_INFO returns empty string.*/

/**@fun Message::operator=(const Message&)
 * @brief Valid copy internal resources.*/

} // namespace
