/**@file Storage.cpp
 * @date 20261018 09:12:40 */

#include "Storage.hpp"
#include <ctype.h>
#include <dirent.h>
#include <errno.h>
#include <ftw.h>
#include <stdio.h>
#include <string.h>
#include <sys/stat.h>
#include <sys/types.h>
#include <unistd.h>
#include <vector>
#include <logging.hpp>
#include <pcmsink.h>

namespace pcmsink {

namespace {

const char* const SUFFIXES[] = {".wav", ".flac", ".opus"};
const char* const CONTENT_TYPES[] = {"audio/wav", "audio/flac", "audio/opus"};

inline std::string
format_time(time_t when, const char* fmt)
{
	struct tm tm;
	localtime_r(&when, &tm);
	char buf[64];
	if (strftime(buf, sizeof(buf), fmt, &tm) == 0)
		return std::string();
	return std::string(buf);
}

/// YYYY-MM-DD -> days since epoch, -1 for other names
long
parse_date_dir(const char* name)
{
	int y, m, d;
	char tail;
	if (strlen(name) != 10
	 || sscanf(name, "%4d-%2d-%2d%c", &y, &m, &d, &tail) != 3)
	{
		return -1;
	}
	if (m < 1 || m > 12 || d < 1 || d > 31)
		return -1;
	struct tm tm;
	memset(&tm, 0, sizeof(tm));
	tm.tm_year = y - 1900;
	tm.tm_mon = m - 1;
	tm.tm_mday = d;
	return (long)(timegm(&tm) / 86400);
}

int
remove_entry(const char* path, const struct stat*, int, struct FTW*)
{
	if (remove(path) == -1)
	{
		LOG(ERROR) << _("Storage: error removing ") << "'" << path << "'"
		           << _(" Message: ") << strerror(errno);
		return -1;
	}
	return 0;
}

} // namespace

std::string
Storage::DateDir(const std::string& root, time_t when)
{
	return root + "/" + format_time(when, "%Y-%m-%d");
}

std::string
Storage::SegmentPath(const std::string& root, time_t when)
{
	return DateDir(root, when) + "/"
	     + format_time(when, "%Y-%m-%d_%H%M") + Suffix(EXT_WAV);
}

const char*
Storage::Suffix(Extension ext)
{
	if (ext < EXT_WAV || ext > EXT_OPUS)
		return "";
	return SUFFIXES[ext];
}

Storage::Extension
Storage::GetExtension(const std::string& path)
{
	std::string::size_type dot = path.find_last_of('.');
	std::string::size_type slash = path.find_last_of('/');
	if (dot == std::string::npos
	 || (slash != std::string::npos && dot < slash))
	{
		return EXT_UNKNOWN;
	}
	std::string suffix = path.substr(dot);
	for (std::string::iterator i = suffix.begin(); i != suffix.end(); ++i)
		*i = tolower(*i);
	for (int i = EXT_WAV; i <= EXT_OPUS; ++i)
	{
		if (suffix == SUFFIXES[i])
			return (Extension)i;
	}
	return EXT_UNKNOWN;
}

std::string
Storage::ReplaceExtension(const std::string& path, Extension ext)
{
	std::string::size_type dot = path.find_last_of('.');
	std::string::size_type slash = path.find_last_of('/');
	std::string stem = path;
	if (dot != std::string::npos
	 && (slash == std::string::npos || dot > slash))
	{
		stem = path.substr(0, dot);
	}
	return stem + Suffix(ext);
}

/**@brief MIME type for the browsing front end
 * @return NULL if path is not a recording*/
const char*
Storage::ContentType(const std::string& path)
{
	Extension ext = GetExtension(path);
	if (ext == EXT_UNKNOWN)
		return NULL;
	return CONTENT_TYPES[ext];
}

bool
Storage::IsRecording(const std::string& path)
{
	return GetExtension(path) != EXT_UNKNOWN;
}

/**@brief mkdir -p
 *
 * Existing directories are fine. Fails if some component exists and is
 * not a directory.*/
bool
Storage::MakeDirs(const std::string& path)
{
	if (path.empty())
		return false;
	std::string::size_type pos = 0;
	do
	{
		pos = path.find('/', pos + 1);
		std::string part = path.substr(0, pos);
		if (mkdir(part.c_str(), 0755) == -1 && errno != EEXIST)
		{
			LOG(ERROR) << _("Storage: error creating directory ")
			           << "'" << part << "'"
			           << _(" Message: ") << strerror(errno);
			return false;
		}
	} while (pos != std::string::npos);
	struct stat st;
	if (stat(path.c_str(), &st) == -1 || !S_ISDIR(st.st_mode))
	{
		LOG(ERROR) << _("Storage: not a directory ")
		           << "'" << path << "'";
		return false;
	}
	return true;
}

bool
Storage::removeTree(const std::string& path)
{
	return nftw(path.c_str(), remove_entry, 16, FTW_DEPTH | FTW_PHYS) == 0;
}

/**@brief Remove date directories older than `days` days
 *
 * Only entries named YYYY-MM-DD are considered; the date comes from the
 * name, not from the modification time.
 * @return count of removed directories*/
size_t
Storage::SweepRetention(const std::string& root, unsigned days, time_t now)
{
	if (days == 0)
		return 0;
	DIR* dir = opendir(root.c_str());
	if (!dir)
	{
		LOG(WARNING) << _("Storage: can't open data directory ")
		             << "'" << root << "'"
		             << _(" Message: ") << strerror(errno);
		return 0;
	}
	long today = parse_date_dir(format_time(now, "%Y-%m-%d").c_str());
	std::vector<std::string> expired;
	struct dirent* entry;
	while ((entry = readdir(dir)) != NULL)
	{
		long day = parse_date_dir(entry->d_name);
		if (day < 0 || today - day <= (long)days)
			continue;
		std::string path = root + "/" + entry->d_name;
		struct stat st;
		if (lstat(path.c_str(), &st) == 0 && S_ISDIR(st.st_mode))
			expired.push_back(path);
	}
	closedir(dir);
	size_t removed = 0;
	for (size_t i = 0; i < expired.size(); ++i)
	{
		LOG(INFO) << _("Storage: deleting old directory ") << expired[i];
		if (removeTree(expired[i]))
			++removed;
	}
	return removed;
}

} // namespace
