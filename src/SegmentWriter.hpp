/**@file SegmentWriter.hpp
 * @date 20261018 09:12:40*/

#ifndef __SEGMENT_WRITER_HPP__
#define __SEGMENT_WRITER_HPP__

#include <cstdio>
#include <ctime>
#include <string>
#include <pcmsink.h>

namespace pcmsink {

/**@brief One open segment file
 *
 * The header is written on Open() and declares the target size. It is
 * never rewritten, not even by Close() on a short segment.*/
class SegmentWriter
{
public:
	SegmentWriter(const PCMFormat& format, uint32_t target)
		: format_(format)
		, target_(target)
		, written_(0)
		, created_(0)
		, fstream_(NULL)
	{
	}
	~SegmentWriter();

	bool        Open(const std::string& path, time_t created = 0);
	bool        Append(const uint8_t* data, size_t datasz);
	bool        Close();

	bool        IsOpen()    const { return fstream_ != NULL; }
	bool        IsFull()    const { return written_ >= target_; }
	uint32_t    Remaining() const { return IsFull() ? 0 : target_ - written_; }
	uint32_t    Written()   const { return written_; }
	uint32_t    Target()    const { return target_; }
	time_t      Created()   const { return created_; }
	std::string Path()      const { return path_; }

private:
	SegmentWriter() = delete;
	SegmentWriter(const SegmentWriter&) = delete;
	SegmentWriter& operator=(const SegmentWriter&) = delete;

	PCMFormat   format_;
	uint32_t    target_;
	uint32_t    written_;
	time_t      created_;
	std::string path_;
	FILE*       fstream_;
};

} // namespace

#endif // __SEGMENT_WRITER_HPP__
