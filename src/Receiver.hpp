/**@file Receiver.hpp
 * @date 20261018 09:12:40 */

#ifndef __RECEIVER_HPP__
#define __RECEIVER_HPP__

#include <chrono>
#include <memory>
#include <string>

#include "Config.hpp"
#include "Events.hpp"
#include "SegmentWriter.hpp"
#include "Storage.hpp"

namespace pcmsink {

/**@brief Ingestion thread
 *
 * Accepts one sender at a time and cuts its byte stream into segment
 * files. Closed segments are announced on inproc://segments. Control
 * (MSG_STOP) comes over the inproc://receiver PAIR socket, which is
 * watched both while accepting and while receiving.
 *
 * Segments are opened lazily, on the first chunk after a connect or a
 * rollover, so a connection that delivers nothing leaves no file.*/
class Receiver
{
public:
	typedef std::chrono::steady_clock SteadyClock;

	Receiver(void* zmq_ctx, const Config& cfg, EventSink& sink, Clock clock);
	~Receiver();

	bool         Listen();
	uint16_t     Port() const { return port_; }
	static void* Start(Receiver* self);

	static const char* CTL_ADDR;

private:
	Receiver() = delete;
	Receiver(const Receiver&) = delete;
	Receiver& operator=(const Receiver&) = delete;

	enum WaitStatus
	{
		WAIT_TIMEOUT = 0,
		WAIT_READY   = 1,
		WAIT_STOP    = 2,
		WAIT_ERROR   = 3
	};

	WaitStatus  wait(int fd, long timeout_ms);
	void        setupConnection(int fd);
	CloseReason serve(int fd, const std::string& peer);
	bool        appendData(const uint8_t* data, size_t datasz);
	bool        openSegment();
	void        closeSegment(CloseReason reason);
	void        closeSocks();

	void*         zmq_ctx_;
	void*         sock_ctl_;
	void*         sock_segments_;
	int           listen_fd_;
	uint16_t      port_;
	const Config& cfg_;
	EventSink&    sink_;
	Clock         clock_;
	bool          stop_;

	std::unique_ptr<uint8_t[]>     buf_;
	size_t                         filled_;
	std::unique_ptr<SegmentWriter> segment_;
	SteadyClock::time_point        segment_started_;
};

} // namespace

#endif // __RECEIVER_HPP__
