/**@file SegmentWriter.cpp
 * @date 20261018 09:12:40 */

#include <SegmentWriter.hpp>
#include <errno.h>
#include <string.h>
#include <unistd.h>
#include <logging.hpp>
#include "Storage.hpp"
#include "Utils.hpp"

namespace pcmsink {

SegmentWriter::~SegmentWriter()
{
	Close();
}

/**@brief Create the segment file and write its header
 *
 * Parent directories are created as needed. An existing file with the
 * same name is truncated.*/
bool
SegmentWriter::Open(const std::string& path, time_t created)
{
	if (fstream_)
	{
		LOG(ERROR) << _("SegmentWriter: already open: ") << path_;
		return false;
	}
	std::string::size_type slash = path.find_last_of('/');
	if (slash != std::string::npos && slash > 0
	 && !Storage::MakeDirs(path.substr(0, slash)))
	{
		LOG(ERROR) << _("SegmentWriter: can't create directory for ")
		           << "'" << path << "'";
		return false;
	}
	LOG_IF(WARNING, file_exists(path))
		<< _("SegmentWriter: overwriting existing segment ")
		<< "'" << path << "'";
	uint8_t header[PCM_HEADER_SIZE];
	if (pcm_encode_header(&format_, target_, header) != PCM_HEADER_SIZE)
	{
		LOG(ERROR) << _("SegmentWriter: can't encode header for ")
		           << "'" << path << "'";
		return false;
	}
	fstream_ = fopen(path.c_str(), "wbe");
	if (!fstream_)
	{
		LOG(ERROR) << _("SegmentWriter: error opening output.")
		           << _(" Filename: '") << path << "'."
		           << _(" Message: ") << strerror(errno);
		return false;
	}
	if (fwrite_unlocked(header, sizeof(header), 1, fstream_) != 1)
	{
		LOG(ERROR) << _("SegmentWriter: error header writing.")
		           << _(" Filename: '") << path << "'."
		           << _(" Message: ") << strerror(errno);
		fclose(fstream_);
		fstream_ = NULL;
		return false;
	}
	path_ = path;
	written_ = 0;
	created_ = created;
	VLOG(2) << "SegmentWriter: opened " << path_
	        << " (declared " << target_ << " bytes)";
	return true;
}

bool
SegmentWriter::Append(const uint8_t* data, size_t datasz)
{
	if (!fstream_)
	{
		LOG(ERROR) << _("SegmentWriter: append to closed segment");
		return false;
	}
	if (datasz == 0)
		return true;
	if (fwrite_unlocked(data, datasz, 1, fstream_) != 1)
	{
		LOG(ERROR) << _("SegmentWriter: error data writing.")
		           << _(" Filename: '") << path_ << "'."
		           << _(" Message: ") << strerror(errno);
		return false;
	}
	written_ += datasz;
	return true;
}

/**@brief Flush and release the file
 *
 * The declared size stays as written by Open().*/
bool
SegmentWriter::Close()
{
	if (!fstream_)
		return true;
	bool rs = true;
	if (fflush(fstream_) != 0 || fsync(fileno(fstream_)) != 0)
	{
		LOG(ERROR) << _("SegmentWriter: error flushing.")
		           << _(" Filename: '") << path_ << "'."
		           << _(" Message: ") << strerror(errno);
		rs = false;
	}
	if (fclose(fstream_) != 0)
	{
		LOG(ERROR) << _("SegmentWriter: error closing.")
		           << _(" Filename: '") << path_ << "'."
		           << _(" Message: ") << strerror(errno);
		rs = false;
	}
	fstream_ = NULL;
	VLOG(2) << "SegmentWriter: closed " << path_ << " ("
	        << written_ << "/" << target_ << " bytes)";
	return rs;
}

} // namespace
