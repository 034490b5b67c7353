/**@file Service.hpp
 * @date 20261018 09:12:40 */

#ifndef __SERVICE_HPP__
#define __SERVICE_HPP__

#include <memory>
#include <string>
#include <thread>

#include "ProcessManagerBase.hpp"
#include "CompressDispatcher.hpp"
#include "Config.hpp"
#include "Events.hpp"
#include "Receiver.hpp"
#include "Storage.hpp"

namespace pcmsink {

/**@brief The recorder: receiver thread plus compression dispatcher
 *
 * Only a listening socket that can't be bound makes doStart() fail. An
 * encoder that doesn't answer `-version` disables compression and the
 * service keeps recording (degraded mode).*/
class Service : public ProcessManagerBase
{
public:
	Service(const Config& cfg, EventSink& sink,
	        Clock clock = Clock(system_time));
	~Service();

	uint16_t Port() const;
	bool     Degraded() const { return degraded_; }

	static bool ProbeEncoder(const std::string& encoder);

protected:
	virtual bool doStart();
	virtual bool doStop();

private:
	Service() = delete;
	Service(const Service&) = delete;
	Service& operator=(const Service&) = delete;

	bool createSocks();
	bool waitChildrenReady(const size_t timeout_ms);

	Config     cfg_;
	EventSink& sink_;
	Clock      clock_;
	bool       degraded_;
	void*      zmq_ctx_;
	void*      sock_receiver_;
	void*      sock_dispatcher_;

	std::unique_ptr<Receiver>           receiver_instance_;
	std::unique_ptr<CompressDispatcher> dispatcher_instance_;
	std::unique_ptr<std::thread>        receiver_thread_;
	std::unique_ptr<std::thread>        dispatcher_thread_;

	static const unsigned PROBE_TIMEOUT_SEC = 5;
};

} // namespace

#endif // __SERVICE_HPP__
