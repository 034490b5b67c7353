/**@file Storage.hpp
 * @date 20261018 09:12:40
 *
 * On-disk layout shared with the browsing front end:
 *
 * 	<root>/YYYY-MM-DD/YYYY-MM-DD_HHMM.wav   - raw segment
 * 	<root>/YYYY-MM-DD/YYYY-MM-DD_HHMM.flac  - lossless artifact
 * 	<root>/YYYY-MM-DD/YYYY-MM-DD_HHMM.opus  - lossy artifact
 *
 * Any recording may be replaced by its compressed artifact or deleted
 * at any time. Readers must tolerate a file vanishing between listing
 * and fetch.*/

#ifndef __STORAGE_HPP__
#define __STORAGE_HPP__

#include <ctime>
#include <string>
#include <functional>

namespace pcmsink {

/// wall clock source, seconds since epoch
typedef std::function<time_t()> Clock;

inline time_t
system_time()
{
	return time(NULL);
}

class Storage
{
public:
	enum Extension
	{
		EXT_WAV     = 0,
		EXT_FLAC    = 1,
		EXT_OPUS    = 2,
		EXT_UNKNOWN = -1
	};

	static std::string SegmentPath(const std::string& root, time_t when);
	static std::string DateDir(const std::string& root, time_t when);
	static std::string ReplaceExtension(const std::string& path,
	                                    Extension ext);
	static const char* Suffix(Extension ext);
	static Extension   GetExtension(const std::string& path);
	static const char* ContentType(const std::string& path);
	static bool        IsRecording(const std::string& path);
	static bool        MakeDirs(const std::string& path);
	static size_t      SweepRetention(const std::string& root,
	                                  unsigned days, time_t now);

private:
	Storage() = delete;
	static bool removeTree(const std::string& path);
};

} // namespace

#endif // __STORAGE_HPP__
