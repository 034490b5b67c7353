/**@file tHelpers.hpp
 * @date 20261018 09:12:40
 *
 * @brief Shared fixtures: scratch directories, stand-in encoders, an
 * event recorder and a loopback sender.*/

#ifndef __THELPERS_HPP__
#define __THELPERS_HPP__

#include <arpa/inet.h>
#include <dirent.h>
#include <ftw.h>
#include <netinet/in.h>
#include <stdio.h>
#include <stdlib.h>
#include <string.h>
#include <sys/socket.h>
#include <sys/stat.h>
#include <unistd.h>
#include <algorithm>
#include <atomic>
#include <chrono>
#include <condition_variable>
#include <fstream>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

#include <Config.hpp>
#include <Events.hpp>
#include <Storage.hpp>

namespace pcmsink_test {

using namespace pcmsink;

inline int
rm_entry(const char* path, const struct stat*, int, struct FTW*)
{
	return remove(path);
}

/**@brief mkdtemp directory removed with its content*/
class TempDir
{
public:
	TempDir()
	{
		char tmpl[] = "/tmp/pcmsink_test.XXXXXX";
		char* path = mkdtemp(tmpl);
		if (path)
			path_ = path;
	}
	~TempDir()
	{
		if (!path_.empty())
			nftw(path_.c_str(), rm_entry, 16, FTW_DEPTH | FTW_PHYS);
	}
	const std::string& Path() const { return path_; }

	std::string Write(const std::string& name, const std::string& content,
	                  mode_t mode = 0644) const
	{
		std::string path = path_ + "/" + name;
		std::ofstream out(path.c_str(), std::ios::binary | std::ios::trunc);
		out << content;
		out.close();
		chmod(path.c_str(), mode);
		return path;
	}
private:
	std::string path_;
};

/// copies the -i argument to the last argument, like a lossless codec
/// that gains nothing
const char* const COPY_ENCODER =
	"#!/bin/sh\n"
	"if [ \"$1\" = \"-version\" ]; then echo 'stand-in encoder'; exit 0; fi\n"
	"in=''\n"
	"prev=''\n"
	"for a in \"$@\"; do\n"
	"  if [ \"$prev\" = \"-i\" ]; then in=\"$a\"; fi\n"
	"  prev=\"$a\"\n"
	"  out=\"$a\"\n"
	"done\n"
	"cp \"$in\" \"$out\"\n";

/// like COPY_ENCODER, but the first job run from its directory takes
/// three seconds
const char* const SLOW_ONCE_ENCODER =
	"#!/bin/sh\n"
	"if [ \"$1\" = \"-version\" ]; then echo 'stand-in encoder'; exit 0; fi\n"
	"if mkdir \"$(dirname \"$0\")/slow.lock\" 2>/dev/null; then sleep 3; fi\n"
	"in=''\n"
	"prev=''\n"
	"for a in \"$@\"; do\n"
	"  if [ \"$prev\" = \"-i\" ]; then in=\"$a\"; fi\n"
	"  prev=\"$a\"\n"
	"  out=\"$a\"\n"
	"done\n"
	"cp \"$in\" \"$out\"\n";

/// answers the probe, then fails every job leaving a partial output
const char* const FAILING_ENCODER =
	"#!/bin/sh\n"
	"if [ \"$1\" = \"-version\" ]; then echo 'stand-in encoder'; exit 0; fi\n"
	"for a in \"$@\"; do out=\"$a\"; done\n"
	"echo partial > \"$out\"\n"
	"echo 'Invalid data found when processing input' >&2\n"
	"exit 1\n";

inline std::string
read_file(const std::string& path)
{
	std::ifstream in(path.c_str(), std::ios::binary);
	return std::string((std::istreambuf_iterator<char>(in)),
	                   std::istreambuf_iterator<char>());
}

inline bool
path_exists(const std::string& path)
{
	struct stat st;
	return stat(path.c_str(), &st) == 0;
}

/**@brief Recordings under root (one level of date directories), sorted*/
inline std::vector<std::string>
list_recordings(const std::string& root, Storage::Extension ext)
{
	std::vector<std::string> rs;
	DIR* dir = opendir(root.c_str());
	if (!dir)
		return rs;
	struct dirent* day;
	while ((day = readdir(dir)) != NULL)
	{
		if (day->d_name[0] == '.')
			continue;
		std::string daypath = root + "/" + day->d_name;
		DIR* sub = opendir(daypath.c_str());
		if (!sub)
			continue;
		struct dirent* entry;
		while ((entry = readdir(sub)) != NULL)
		{
			std::string path = daypath + "/" + entry->d_name;
			if (entry->d_name[0] != '.'
			 && Storage::GetExtension(path) == ext)
			{
				rs.push_back(path);
			}
		}
		closedir(sub);
	}
	closedir(dir);
	std::sort(rs.begin(), rs.end());
	return rs;
}

/**@brief Builds Config from a command line*/
inline int
parse_config(Config& cfg, const std::vector<std::string>& args)
{
	std::vector<std::string> store;
	store.push_back("pcmsink");
	store.insert(store.end(), args.begin(), args.end());
	std::vector<char*> argv;
	for (size_t i = 0; i < store.size(); ++i)
		argv.push_back(&store[i][0]);
	argv.push_back(NULL);
	return cfg.ParseArgs((int)store.size(), &argv[0]);
}

/**@brief Wall clock advancing one minute per reading
 *
 * Consecutive segments get distinct names.*/
struct StepClock
{
	StepClock(time_t start, time_t step = 60)
		: now(new std::atomic<long>(start))
		, step(step)
	{
	}
	time_t operator()() const { return (time_t)now->fetch_add(step); }

	std::shared_ptr<std::atomic<long> > now;
	time_t step;
};

/**@brief EventSink keeping everything it sees*/
class RecordingSink : public EventSink
{
public:
	typedef std::unique_lock<std::mutex> Lock;

	void Connected(const std::string&)
	{
		Lock lock(mtx_);
		++connected_;
		cv_.notify_all();
	}
	void Disconnected(const std::string&, CloseReason reason, uint64_t bytes)
	{
		Lock lock(mtx_);
		disconnects_.push_back(reason);
		received_ += bytes;
		cv_.notify_all();
	}
	void SegmentOpened(const std::string& path, uint32_t)
	{
		Lock lock(mtx_);
		opened_.push_back(path);
		cv_.notify_all();
	}
	void SegmentClosed(const SegmentInfo& info)
	{
		Lock lock(mtx_);
		closed_.push_back(info);
		cv_.notify_all();
	}
	void JobScheduled(const std::string& path, unsigned)
	{
		Lock lock(mtx_);
		scheduled_.push_back(path);
		cv_.notify_all();
	}
	void JobFinished(const JobReport& report)
	{
		Lock lock(mtx_);
		reports_.push_back(report);
		cv_.notify_all();
	}

	bool WaitDisconnects(size_t n, long timeout_ms = 10000)
	{
		Lock lock(mtx_);
		return cv_.wait_for(lock, std::chrono::milliseconds(timeout_ms),
			[&]{ return disconnects_.size() >= n; });
	}
	bool WaitOpened(size_t n, long timeout_ms = 10000)
	{
		Lock lock(mtx_);
		return cv_.wait_for(lock, std::chrono::milliseconds(timeout_ms),
			[&]{ return opened_.size() >= n; });
	}
	bool WaitReports(size_t n, long timeout_ms = 10000)
	{
		Lock lock(mtx_);
		return cv_.wait_for(lock, std::chrono::milliseconds(timeout_ms),
			[&]{ return reports_.size() >= n; });
	}

	std::vector<CloseReason> Disconnects()
		{ Lock lock(mtx_); return disconnects_; }
	std::vector<SegmentInfo> Closed()
		{ Lock lock(mtx_); return closed_; }
	std::vector<std::string> Scheduled()
		{ Lock lock(mtx_); return scheduled_; }
	std::vector<JobReport>   Reports()
		{ Lock lock(mtx_); return reports_; }
	uint64_t Received() { Lock lock(mtx_); return received_; }

	RecordingSink() : connected_(0), received_(0) {}
private:
	std::mutex               mtx_;
	std::condition_variable  cv_;
	size_t                   connected_;
	uint64_t                 received_;
	std::vector<CloseReason> disconnects_;
	std::vector<std::string> opened_;
	std::vector<SegmentInfo> closed_;
	std::vector<std::string> scheduled_;
	std::vector<JobReport>   reports_;
};

/**@brief Sender connection to 127.0.0.1*/
class Sender
{
public:
	Sender(uint16_t port)
		: fd_(socket(AF_INET, SOCK_STREAM, 0))
	{
		struct sockaddr_in addr;
		memset(&addr, 0, sizeof(addr));
		addr.sin_family = AF_INET;
		addr.sin_addr.s_addr = htonl(INADDR_LOOPBACK);
		addr.sin_port = htons(port);
		if (fd_ != -1
		 && connect(fd_, (struct sockaddr*)&addr, sizeof(addr)) == -1)
		{
			close(fd_);
			fd_ = -1;
		}
	}
	~Sender() { Close(); }

	bool IsConnected() const { return fd_ != -1; }

	/// writes in pieces of `piece` bytes, the way a firmware would not
	bool Send(const std::string& data, size_t piece = 777)
	{
		for (size_t pos = 0; pos < data.size(); pos += piece)
		{
			size_t len = std::min(piece, data.size() - pos);
			if (write(fd_, data.data() + pos, len) != (ssize_t)len)
				return false;
		}
		return true;
	}
	void Close()
	{
		if (fd_ != -1)
			close(fd_);
		fd_ = -1;
	}
private:
	int fd_;
};

/**@brief Distinct little-endian 16-bit samples, offset by `first`*/
inline std::string
ramp(size_t bytes, uint16_t first = 0)
{
	std::string rs(bytes, '\0');
	for (size_t i = 0; i + 1 < bytes; i += 2)
	{
		uint16_t val = (uint16_t)(first + i/2);
		rs[i] = (char)(val & 0xff);
		rs[i + 1] = (char)(val >> 8);
	}
	return rs;
}

} // namespace

#endif // __THELPERS_HPP__
