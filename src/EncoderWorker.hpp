/**@file EncoderWorker.hpp
 * @date 20261018 09:12:40 */

#ifndef __ENCODER_WORKER_HPP__
#define __ENCODER_WORKER_HPP__

#include <string>
#include "Config.hpp"

namespace pcmsink {

/**@brief Pool thread running compression jobs
 *
 * Pulls TYPE_SEGMENT jobs from its own jobs address and pushes a
 * TYPE_REPORT for each of them to inproc://reports. Stops on MSG_STOP.*/
class EncoderWorker
{
public:
	EncoderWorker(void* zmq_ctx, const Config& cfg,
	              const std::string& jobs_addr)
		: zmq_ctx_(zmq_ctx)
		, break_(false)
		, cfg_(cfg)
		, jobs_addr_(jobs_addr)
	{
	}

	static void* Start(EncoderWorker* self);
	void Break() { break_ = true; }
private:
	EncoderWorker() = delete;
	EncoderWorker& operator=(const EncoderWorker&) = delete;
	EncoderWorker(const EncoderWorker&) = delete;
	void*         zmq_ctx_;
	bool          break_;
	const Config& cfg_;
	std::string   jobs_addr_;
};

} // namespace

#endif // __ENCODER_WORKER_HPP__
