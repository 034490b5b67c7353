/**@file Messages.hpp
 * @date 20261018 09:12:40*/

#ifndef __MESSAGES_HPP__
#define __MESSAGES_HPP__

#include <zmq.h>
#include <stdint.h>
#include <string>
#include <endians.hpp>
#include <algorithm>
#include <memory>
#include <cstring>
#include "Events.hpp"

namespace pcmsink {

/**@brief Inter-thread message
 *
 * Travels over inproc sockets between the receiver, the dispatcher and
 * encoder workers. First byte is the type.
 *
 * TYPE_SEGMENT - closed segment notice (receiver -> dispatcher) and
 *                compression job (dispatcher -> worker):
 *
 * 	+---+=======+
 * 	|TYP| PATH  |
 * 	+---+=======+
 *
 * TYPE_REPORT - job outcome (worker -> dispatcher):
 *
 * 	+---+---+---+---+---+---+---+---+---+---+---+---+---+---+=======+
 * 	|TYP|STS|   ORIGINAL    |  COMPRESSED   |  ELAPSED_MS   | PATH  |
 * 	+---+---+---+---+---+---+---+---+---+---+---+---+---+---+=======+
 *
 * TYPE_INFO - control words (READY, STOP, ERROR).*/
class Message
{
public:
	enum MessageType :uint8_t
	{
		TYPE_INFO    = 1,
		TYPE_SEGMENT = 2,
		TYPE_REPORT  = 3,
		TYPE_UNKNOWN = 0
	};

	enum SendMode :bool
	{
		BLOCKING_MODE    = true,
		NONBLOCKING_MODE = false
	};

	Message() : datasz_(0) { }
	Message(void* sock, SendMode mode = BLOCKING_MODE);
	explicit Message(const SegmentInfo& segment);
	Message(const JobReport& report);
	Message(const std::string& msg);
	Message(const Message& msg) : datasz_(0) { operator=(msg); }
	~Message() { Clear(); }

	void        Clear();
	MessageType Type() const;
	bool        Send (void* sock, SendMode mode = NONBLOCKING_MODE) const;
	void        Fetch(void* zmq_sock, SendMode blocking = NONBLOCKING_MODE);

	std::string Path() const;
	JobReport   Report() const;
	std::string What() const;

	bool     operator==(const Message& rhv) const;
	Message& operator=(const Message& copy);

protected:
	size_t pathOffset() const;
	uint32_t u32At(size_t off) const;

	size_t                     datasz_;
	std::unique_ptr<uint8_t[]> data_;

	static const size_t SEGMENT_HEADER_SIZE;
	static const size_t REPORT_HEADER_SIZE;
};

const Message MSG_READY("READY");
const Message MSG_ERROR("ERROR");
const Message MSG_STOP("STOP");


////////////////////////////////////////////////////////////////////////
// inline

inline void
Message::Clear()
{
	if(data_)
		data_.reset();
	datasz_ = 0;
}

inline Message::MessageType
Message::Type() const
{
	return data_ && datasz_ > 0 ? (Message::MessageType)data_[0] : TYPE_UNKNOWN;
}

inline std::string
Message::What() const
{
	std::string rs;
	if (Type() == TYPE_INFO)
		rs.assign((const char*)data_.get() + 1, datasz_ - 1);
	return rs;
}

inline bool
Message::operator==(const Message& rhv) const
{
	if (datasz_ != rhv.datasz_ || datasz_ == 0)
		return false;
	uint8_t* lhv_data = data_.get();
	uint8_t* rhv_data = rhv.data_.get();
	if (!lhv_data || !rhv_data)
		return false;
	return std::equal(lhv_data, lhv_data + datasz_, rhv_data);
}

inline Message&
Message::operator=(const Message& copy)
{
	if (this == &copy)
		return *this;
	Clear();
	if (copy.datasz_ == 0 || !copy.data_)
		return *this;
	datasz_ = copy.datasz_;
	data_.reset(new uint8_t[datasz_]);
	memcpy(data_.get(), copy.data_.get(), datasz_);
	return *this;
}

} // namespace

#endif // __MESSAGES_HPP__
