/**@file CompressionJob.cpp
 * @date 20261018 09:12:40 */

#include "CompressionJob.hpp"
#include <errno.h>
#include <stdio.h>
#include <string.h>
#include <unistd.h>
#include <chrono>
#include <sstream>
#include <logging.hpp>
#include "Storage.hpp"
#include "Subprocess.hpp"
#include "Utils.hpp"

namespace pcmsink {

std::string
CompressionJob::OutputPath() const
{
	return Storage::ReplaceExtension(path_,
		cfg_.CompressionCodec() == Config::CODEC_OPUS
			? Storage::EXT_OPUS : Storage::EXT_FLAC);
}

std::string
CompressionJob::TemporaryPath() const
{
	return OutputPath() + ".tmp";
}

/**@brief ffmpeg command line
 *
 * The muxer is named explicitly because the output name ends with
 * ".tmp".*/
std::vector<std::string>
CompressionJob::EncoderArgs(const std::string& output) const
{
	std::vector<std::string> args;
	args.push_back(cfg_.Encoder());
	args.push_back("-i");
	args.push_back(path_);
	args.push_back("-y");
	if (cfg_.CompressionCodec() == Config::CODEC_OPUS)
	{
		std::stringstream bitrate;
		bitrate << cfg_.OpusBitrate() << "k";
		args.push_back("-c:a");
		args.push_back("libopus");
		args.push_back("-b:a");
		args.push_back(bitrate.str());
		args.push_back("-vbr");
		args.push_back("on");
		args.push_back("-compression_level");
		args.push_back("10");
		args.push_back("-application");
		args.push_back("voip");
		args.push_back("-loglevel");
		args.push_back("error");
		args.push_back("-f");
		args.push_back("opus");
	}
	else
	{
		std::stringstream level;
		level << cfg_.FlacLevel();
		args.push_back("-compression_level");
		args.push_back(level.str());
		args.push_back("-loglevel");
		args.push_back("error");
		args.push_back("-f");
		args.push_back("flac");
	}
	args.push_back(output);
	return args;
}

void
CompressionJob::removeTemporary() const
{
	std::string tmp = TemporaryPath();
	if (unlink(tmp.c_str()) == -1 && errno != ENOENT)
	{
		LOG(WARNING) << _("CompressionJob: can't remove ") << tmp
		             << _(" Message: ") << strerror(errno);
	}
}

JobReport
CompressionJob::Run() const
{
	typedef std::chrono::steady_clock SteadyClock;
	JobReport rs;
	rs.path = path_;

	size_t size = 0;
	if (!file_size(path_, size))
	{
		rs.status = JOB_SKIPPED_MISSING;
		return rs;
	}
	rs.original_size = size;
	if (size < cfg_.MinCompressBytes())
	{
		rs.status = JOB_SKIPPED_TOO_SMALL;
		return rs;
	}

	const std::string output = OutputPath();
	const std::string tmp = TemporaryPath();
	LOG(INFO) << _("Compressing ") << get_base_name(path_) << _(" to ")
	          << Config::CodecName(cfg_.CompressionCodec()) << "...";
	SteadyClock::time_point start = SteadyClock::now();
	Subprocess::Result run = Subprocess::Run(EncoderArgs(tmp),
	                                         cfg_.EncoderTimeout());
	rs.elapsed_ms = std::chrono::duration_cast<std::chrono::milliseconds>(
		SteadyClock::now() - start).count();
	rs.diagnostics = run.output;

	if (!run.Succeeded())
	{
		if (!run.started)
			LOG(ERROR) << _("CompressionJob: can't start encoder for ")
			           << get_base_name(path_);
		else if (run.timed_out)
			LOG(ERROR) << _("Compression timeout (>")
			           << cfg_.EncoderTimeout() << "s) for " << path_;
		else if (run.signal != 0)
			LOG(ERROR) << _("CompressionJob: encoder killed by signal ")
			           << run.signal << " for " << get_base_name(path_);
		else
			LOG(ERROR) << _("CompressionJob: encoder exited with ")
			           << run.exit_code << " for " << get_base_name(path_);
		removeTemporary();
		rs.status = JOB_FAILED;
		return rs;
	}

	size_t compressed = 0;
	if (!file_size(tmp, compressed))
	{
		LOG(ERROR) << _("Compression output file not created: ") << output;
		rs.status = JOB_FAILED;
		return rs;
	}
	if (rename(tmp.c_str(), output.c_str()) == -1)
	{
		LOG(ERROR) << _("CompressionJob: can't rename ") << tmp
		           << _(" to ") << output
		           << _(" Message: ") << strerror(errno);
		removeTemporary();
		rs.status = JOB_FAILED;
		return rs;
	}
	rs.status = JOB_SUCCEEDED;
	rs.output = output;
	rs.compressed_size = compressed;

	if (cfg_.DeleteSource())
	{
		if (unlink(path_.c_str()) == -1)
			LOG(ERROR) << _("Failed to delete original WAV: ")
			           << get_base_name(path_)
			           << _(" Message: ") << strerror(errno);
		else
			LOG(INFO) << _("Deleted original WAV: ") << get_base_name(path_);
	}
	return rs;
}

} // namespace
