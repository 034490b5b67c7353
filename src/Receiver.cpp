/**@file Receiver.cpp
 * @date 20261018 09:12:40 */

#include "Receiver.hpp"
#include <arpa/inet.h>
#include <errno.h>
#include <fcntl.h>
#include <netinet/in.h>
#include <netinet/tcp.h>
#include <string.h>
#include <sys/socket.h>
#include <unistd.h>
#include <sstream>
#include <zmq.h>
#include <logging.hpp>
#include "Messages.hpp"
#include "Utils.hpp"

namespace pcmsink {

const char* Receiver::CTL_ADDR = "inproc://receiver";

namespace {

const int MIN_RCVBUF = 64*1024;

std::string
peer_name(const struct sockaddr_in& addr)
{
	char host[INET_ADDRSTRLEN] = "?";
	inet_ntop(AF_INET, &addr.sin_addr, host, sizeof(host));
	std::stringstream rs;
	rs << host << ":" << ntohs(addr.sin_port);
	return rs.str();
}

} // namespace

Receiver::Receiver(void* zmq_ctx, const Config& cfg, EventSink& sink,
                   Clock clock)
	: zmq_ctx_(zmq_ctx)
	, sock_ctl_(NULL)
	, sock_segments_(NULL)
	, listen_fd_(-1)
	, port_(0)
	, cfg_(cfg)
	, sink_(sink)
	, clock_(clock)
	, stop_(false)
	, buf_(new uint8_t[cfg.ChunkSize()])
	, filled_(0)
{
}

Receiver::~Receiver()
{
	closeSocks();
	if (listen_fd_ != -1)
		close(listen_fd_);
}

void
Receiver::closeSocks()
{
	if (sock_ctl_)
		zmq_close(sock_ctl_);
	if (sock_segments_)
		zmq_close(sock_segments_);
	sock_ctl_ = NULL;
	sock_segments_ = NULL;
}

/**@brief Bind the listening socket on all interfaces
 *
 * Runs in the caller's thread before Start(), so a bind failure can
 * stop the process before anything else is started.*/
bool
Receiver::Listen()
{
	listen_fd_ = socket(AF_INET, SOCK_STREAM | SOCK_CLOEXEC | SOCK_NONBLOCK,
	                    0);
	if (listen_fd_ == -1)
	{
		LOG(ERROR) << _("Receiver: can't create socket.")
		           << _(" Message: ") << strerror(errno);
		return false;
	}
	const int on = 1;
	if (setsockopt(listen_fd_, SOL_SOCKET, SO_REUSEADDR, &on, sizeof(on))
			== -1)
	{
		LOG(WARNING) << _("Receiver: can't set SO_REUSEADDR.")
		             << _(" Message: ") << strerror(errno);
	}
	struct sockaddr_in addr;
	memset(&addr, 0, sizeof(addr));
	addr.sin_family = AF_INET;
	addr.sin_addr.s_addr = htonl(INADDR_ANY);
	addr.sin_port = htons(cfg_.Port());
	if (bind(listen_fd_, (struct sockaddr*)&addr, sizeof(addr)) == -1
	 || listen(listen_fd_, 1) == -1)
	{
		LOG(ERROR) << _("Receiver: can't listen on port ") << cfg_.Port()
		           << _(" Message: ") << strerror(errno);
		close(listen_fd_);
		listen_fd_ = -1;
		return false;
	}
	socklen_t addrlen = sizeof(addr);
	if (getsockname(listen_fd_, (struct sockaddr*)&addr, &addrlen) == 0)
		port_ = ntohs(addr.sin_port);
	else
		port_ = cfg_.Port();
	sink_.Listening(port_);
	return true;
}

/**@brief Wait for fd (if any) or the control socket
 * @param fd file descriptor, -1 to watch the control socket only*/
Receiver::WaitStatus
Receiver::wait(int fd, long timeout_ms)
{
	zmq_pollitem_t items[2] = {
		{sock_ctl_, 0,  ZMQ_POLLIN, 0},
		{NULL,      fd, ZMQ_POLLIN, 0}
	};
	int rs = zmq_poll(items, fd == -1 ? 1 : 2, timeout_ms);
	if (rs == -1)
	{
		if (errno == EINTR)
			return WAIT_TIMEOUT;
		LOG(ERROR) << _("Receiver: error polling.")
		           << _(" Message: ") << zmq_strerror(errno);
		return WAIT_ERROR;
	}
	if (items[0].revents & ZMQ_POLLIN)
	{
		Message msg(sock_ctl_);
		if (msg == MSG_STOP)
		{
			VLOG(2) << "Receiver: received MSG_STOP.";
			stop_ = true;
			return WAIT_STOP;
		}
		VLOG(2) << "Receiver: unexpected control message.";
	}
	if (fd != -1 && (items[1].revents & (ZMQ_POLLIN | ZMQ_POLLERR)))
		return WAIT_READY;
	return WAIT_TIMEOUT;
}

void
Receiver::setupConnection(int fd)
{
	const int on = 1;
	if (setsockopt(fd, IPPROTO_TCP, TCP_NODELAY, &on, sizeof(on)) == -1)
	{
		LOG(WARNING) << _("Receiver: can't set TCP_NODELAY.")
		             << _(" Message: ") << strerror(errno);
	}
	int rcvbuf = (int)cfg_.ChunkSize()*4;
	if (rcvbuf < MIN_RCVBUF)
		rcvbuf = MIN_RCVBUF;
	if (setsockopt(fd, SOL_SOCKET, SO_RCVBUF, &rcvbuf, sizeof(rcvbuf)) == -1)
	{
		LOG(WARNING) << _("Receiver: can't set SO_RCVBUF.")
		             << _(" Message: ") << strerror(errno);
	}
}

bool
Receiver::openSegment()
{
	time_t now = clock_();
	segment_.reset(new SegmentWriter(cfg_.Format(), cfg_.SegmentBytes()));
	std::string path = Storage::SegmentPath(cfg_.DataDir(), now);
	if (!segment_->Open(path, now))
	{
		segment_.reset();
		return false;
	}
	segment_started_ = SteadyClock::now();
	sink_.SegmentOpened(path, segment_->Target());
	return true;
}

/**@brief Close the active segment and hand it to the dispatcher
 *
 * The hand-off never blocks. If the queue is full the segment just
 * stays uncompressed.*/
void
Receiver::closeSegment(CloseReason reason)
{
	if (!segment_ || !segment_->IsOpen())
		return;
	SegmentInfo info;
	info.path = segment_->Path();
	info.declared = segment_->Target();
	info.written = segment_->Written();
	info.reason = reason;
	info.seconds = std::chrono::duration_cast<
		std::chrono::duration<double> >(SteadyClock::now()
			- segment_started_).count();
	if (!segment_->Close())
		LOG(ERROR) << _("Receiver: segment may be incomplete on disk: ")
		           << info.path;
	segment_.reset();
	sink_.SegmentClosed(info);

	if (!Message(info).Send(sock_segments_, Message::NONBLOCKING_MODE))
	{
		LOG(ERROR) << _("Receiver: can't hand over segment to the"
		                " compression queue: ") << info.path;
	}
}

/**@brief Write data across segment boundaries
 *
 * The part that completes a segment closes it, the rest goes to the
 * next one.*/
bool
Receiver::appendData(const uint8_t* data, size_t datasz)
{
	while (datasz > 0)
	{
		if (!segment_ && !openSegment())
			return false;
		size_t n = segment_->Remaining();
		if (n > datasz)
			n = datasz;
		if (!segment_->Append(data, n))
			return false;
		data += n;
		datasz -= n;
		if (segment_->IsFull())
			closeSegment(CLOSE_FULL);
	}
	return true;
}

CloseReason
Receiver::serve(int fd, const std::string& peer)
{
	const size_t chunksz = cfg_.ChunkSize();
	const long idle_ms = (long)cfg_.IdleTimeout()*1000;
	SteadyClock::time_point deadline = SteadyClock::now()
		+ std::chrono::milliseconds(idle_ms);
	uint64_t received = 0;
	CloseReason reason = CLOSE_PEER;
	filled_ = 0;
	sink_.Connected(peer);
	for (;;)
	{
		long left = std::chrono::duration_cast<std::chrono::milliseconds>(
			deadline - SteadyClock::now()).count();
		if (left <= 0)
		{
			LOG(WARNING) << _("Receiver: no data from ") << peer
			             << _(" for ") << cfg_.IdleTimeout()
			             << _(" seconds, dropping connection");
			reason = CLOSE_TIMEOUT;
			break;
		}
		WaitStatus ws = wait(fd, left);
		if (ws == WAIT_STOP)
		{
			reason = CLOSE_SHUTDOWN;
			break;
		}
		if (ws == WAIT_ERROR)
		{
			reason = CLOSE_ERROR;
			break;
		}
		if (ws == WAIT_TIMEOUT)
			continue;
		ssize_t n = read(fd, buf_.get() + filled_, chunksz - filled_);
		if (n == 0)
		{
			reason = CLOSE_PEER;
			break;
		}
		if (n < 0)
		{
			if (errno == EINTR || errno == EAGAIN || errno == EWOULDBLOCK)
				continue;
			LOG(WARNING) << _("Receiver: read error from ") << peer
			             << _(" Message: ") << strerror(errno);
			reason = CLOSE_ERROR;
			break;
		}
		received += n;
		filled_ += n;
		deadline = SteadyClock::now() + std::chrono::milliseconds(idle_ms);
		if (filled_ < chunksz)
			continue;
		filled_ = 0;
		if (!appendData(buf_.get(), chunksz))
		{
			LOG(ERROR) << _("Receiver: storage error, dropping connection"
			                " from ") << peer;
			reason = CLOSE_ERROR;
			break;
		}
	}

	if (filled_ > 0)
	{
		PCMFormat fmt = cfg_.Format();
		size_t align = pcm_block_align(&fmt);
		size_t aligned = filled_ - filled_ % align;
		LOG_IF(WARNING, aligned != filled_)
			<< _("Receiver: dropping ") << filled_ - aligned
			<< _(" bytes of an incomplete sample frame");
		if (aligned > 0 && !appendData(buf_.get(), aligned))
			reason = CLOSE_ERROR;
		filled_ = 0;
	}
	closeSegment(reason);
	close(fd);
	sink_.Disconnected(peer, reason, received);
	return reason;
}

void*
Receiver::Start(Receiver* self)
{
	int hwm = self->cfg_.MsgHWM();
	self->stop_ = false;
	self->sock_ctl_ = createConnectSock(self->zmq_ctx_, CTL_ADDR,
	                                    ZMQ_PAIR, hwm);
	self->sock_segments_ = createConnectSock(self->zmq_ctx_,
	                                         "inproc://segments",
	                                         ZMQ_PUSH, hwm);
	if (!self->sock_ctl_ || !self->sock_segments_ || self->listen_fd_ == -1)
	{
		LOG(ERROR) << _("Receiver: error initializing communications.");
		if (self->sock_ctl_)
			MSG_ERROR.Send(self->sock_ctl_, Message::BLOCKING_MODE);
		self->closeSocks();
		return NULL;
	}
	MSG_READY.Send(self->sock_ctl_, Message::BLOCKING_MODE);
	while (!self->stop_)
	{
		WaitStatus ws = self->wait(self->listen_fd_, 10*TICK);
		if (ws == WAIT_STOP)
			break;
		if (ws == WAIT_TIMEOUT)
			continue;
		int fd = -1;
		struct sockaddr_in addr;
		socklen_t addrlen = sizeof(addr);
		if (ws == WAIT_READY)
			fd = accept4(self->listen_fd_, (struct sockaddr*)&addr,
			             &addrlen, SOCK_CLOEXEC);
		if (fd == -1)
		{
			if (ws == WAIT_READY && (errno == EINTR || errno == EAGAIN
			 || errno == EWOULDBLOCK || errno == ECONNABORTED))
			{
				continue;
			}
			LOG(ERROR) << _("Receiver: server error, retrying in ")
			           << self->cfg_.RetryDelay() << _(" seconds.")
			           << _(" Message: ") << strerror(errno);
			if (self->wait(-1, (long)self->cfg_.RetryDelay()*1000)
					== WAIT_STOP)
			{
				break;
			}
			continue;
		}
		self->setupConnection(fd);
		if (self->serve(fd, peer_name(addr)) == CLOSE_SHUTDOWN)
			break;
	}
	self->closeSocks();
	VLOG(2) << "Receiver: stopped.";
	return NULL;
}

} // namespace
