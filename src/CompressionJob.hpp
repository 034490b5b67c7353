/**@file CompressionJob.hpp
 * @date 20261018 09:12:40 */

#ifndef __COMPRESSION_JOB_HPP__
#define __COMPRESSION_JOB_HPP__

#include <string>
#include <vector>
#include "Config.hpp"
#include "Events.hpp"

namespace pcmsink {

/**@brief Converts one finished segment into a compressed artifact
 *
 * Runs once and never retries. The encoder writes to a temporary name
 * which is renamed into place only after a clean exit, so a failed run
 * leaves nothing the browsing side would recognize.*/
class CompressionJob
{
public:
	CompressionJob(const Config& cfg, const std::string& path)
		: cfg_(cfg)
		, path_(path)
	{
	}

	JobReport   Run() const;

	std::string OutputPath() const;
	std::string TemporaryPath() const;
	std::vector<std::string> EncoderArgs(const std::string& output) const;

private:
	CompressionJob() = delete;
	void removeTemporary() const;

	const Config& cfg_;
	std::string   path_;
};

} // namespace

#endif // __COMPRESSION_JOB_HPP__
