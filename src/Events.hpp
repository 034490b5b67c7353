/**@file Events.hpp
 * @date 20261018 09:12:40
 *
 * Structured events emitted by the receiver and the dispatcher. Each
 * component gets the sink by reference; calls come from several
 * threads.*/

#ifndef __EVENTS_HPP__
#define __EVENTS_HPP__

#include <stdint.h>
#include <string>

namespace pcmsink {

enum JobStatus :uint8_t
{
	JOB_SUCCEEDED         = 1,
	JOB_FAILED            = 2,
	JOB_SKIPPED_MISSING   = 3,
	JOB_SKIPPED_TOO_SMALL = 4
};

const char* JobStatusName(JobStatus status);

struct JobReport
{
	JobReport()
		: status(JOB_FAILED)
		, original_size(0)
		, compressed_size(0)
		, elapsed_ms(0)
	{
	}
	JobStatus   status;
	std::string path;            //!< source segment
	std::string output;          //!< compressed artifact (if succeeded)
	uint32_t    original_size;
	uint32_t    compressed_size;
	uint32_t    elapsed_ms;
	std::string diagnostics;     //!< encoder output, not transferred
};

enum CloseReason :uint8_t
{
	CLOSE_FULL     = 1, //!< target size reached
	CLOSE_PEER     = 2, //!< orderly close by the sender
	CLOSE_TIMEOUT  = 3, //!< idle timeout
	CLOSE_ERROR    = 4, //!< transport or storage failure
	CLOSE_SHUTDOWN = 5
};

const char* CloseReasonName(CloseReason reason);

struct SegmentInfo
{
	std::string path;
	uint32_t    declared;
	uint32_t    written;
	CloseReason reason;
	double      seconds;         //!< wall time the segment was open
};

class EventSink
{
public:
	virtual ~EventSink() {}
	virtual void Listening(uint16_t /*port*/) {}
	virtual void Connected(const std::string& /*peer*/) {}
	virtual void Disconnected(const std::string& /*peer*/,
	                          CloseReason /*reason*/,
	                          uint64_t /*bytes*/) {}
	virtual void SegmentOpened(const std::string& /*path*/,
	                           uint32_t /*declared*/) {}
	virtual void SegmentClosed(const SegmentInfo& /*info*/) {}
	virtual void JobScheduled(const std::string& /*path*/,
	                          unsigned /*delay_sec*/) {}
	virtual void JobFinished(const JobReport& /*report*/) {}
};

/**@brief Renders events through the process logger*/
class LogSink : public EventSink
{
public:
	void Listening(uint16_t port);
	void Connected(const std::string& peer);
	void Disconnected(const std::string& peer, CloseReason reason,
	                  uint64_t bytes);
	void SegmentOpened(const std::string& path, uint32_t declared);
	void SegmentClosed(const SegmentInfo& info);
	void JobScheduled(const std::string& path, unsigned delay_sec);
	void JobFinished(const JobReport& report);
};

} // namespace

#endif // __EVENTS_HPP__
