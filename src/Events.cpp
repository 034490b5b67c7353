/**@file Events.cpp
 * @date 20261018 09:12:40 */

#include "Events.hpp"
#include <iomanip>
#include <logging.hpp>
#include <pcmsink.h>
#include "Utils.hpp"

namespace pcmsink {

const char*
JobStatusName(JobStatus status)
{
	switch (status)
	{
		case JOB_SUCCEEDED:         return "succeeded";
		case JOB_FAILED:            return "failed";
		case JOB_SKIPPED_MISSING:   return "skipped (missing)";
		case JOB_SKIPPED_TOO_SMALL: return "skipped (too small)";
	}
	return "unknown";
}

const char*
CloseReasonName(CloseReason reason)
{
	switch (reason)
	{
		case CLOSE_FULL:     return "complete";
		case CLOSE_PEER:     return "closed by peer";
		case CLOSE_TIMEOUT:  return "idle timeout";
		case CLOSE_ERROR:    return "error";
		case CLOSE_SHUTDOWN: return "shutdown";
	}
	return "unknown";
}

namespace {

inline double
megabytes(uint64_t bytes)
{
	return bytes / 1024.0 / 1024.0;
}

} // namespace

void
LogSink::Listening(uint16_t port)
{
	LOG(INFO) << _("Listening on 0.0.0.0:") << port;
}

void
LogSink::Connected(const std::string& peer)
{
	LOG(INFO) << _("Connected: ") << peer;
}

void
LogSink::Disconnected(const std::string& peer, CloseReason reason,
                      uint64_t bytes)
{
	LOG(INFO) << _("Connection closed: ") << peer
	          << " (" << CloseReasonName(reason) << ", "
	          << std::fixed << std::setprecision(2) << megabytes(bytes)
	          << " MB)";
}

void
LogSink::SegmentOpened(const std::string& path, uint32_t declared)
{
	LOG(INFO) << _("Starting new segment: ") << path
	          << " (" << declared << _(" bytes declared)");
}

void
LogSink::SegmentClosed(const SegmentInfo& info)
{
	if (info.reason == CLOSE_FULL)
	{
		LOG(INFO) << _("Segment complete: ") << info.path
		          << _(" Duration: ") << std::fixed << std::setprecision(1)
		          << info.seconds << "s"
		          << _(" Size: ") << std::setprecision(2)
		          << megabytes(info.written + PCM_HEADER_SIZE) << " MB";
		return;
	}
	LOG(WARNING) << _("Segment truncated (") << CloseReasonName(info.reason)
	             << "): " << info.path << " "
	             << info.written << "/" << info.declared
	             << _(" bytes written; header declares the full size");
}

void
LogSink::JobScheduled(const std::string& path, unsigned delay_sec)
{
	LOG(INFO) << _("Compression scheduled for ") << path
	          << _(" in ") << delay_sec << _(" seconds");
}

void
LogSink::JobFinished(const JobReport& report)
{
	switch (report.status)
	{
		case JOB_SUCCEEDED: {
			double reduction = report.original_size == 0 ? 0.0
				: 100.0 * ((double)report.original_size
				         - report.compressed_size) / report.original_size;
			LOG(INFO) << _("Compression complete: ")
			          << get_base_name(report.output)
			          << std::fixed << std::setprecision(2)
			          << _(" Original: ")
			          << megabytes(report.original_size) << " MB"
			          << _(" Compressed: ")
			          << megabytes(report.compressed_size) << " MB"
			          << std::setprecision(1)
			          << _(" Reduction: ") << reduction << "% ("
			          << report.elapsed_ms / 1000.0 << "s)";
			} break;
		case JOB_FAILED:
			LOG(ERROR) << _("Compression failed: ")
			           << get_base_name(report.path);
			break;
		case JOB_SKIPPED_MISSING:
			LOG(WARNING) << _("Segment no longer exists: ") << report.path;
			break;
		case JOB_SKIPPED_TOO_SMALL:
			LOG(INFO) << _("Skipping compression of partial segment: ")
			          << get_base_name(report.path)
			          << " (" << std::fixed << std::setprecision(2)
			          << megabytes(report.original_size) << " MB)";
			break;
	}
}

} // namespace
