/**@file WaveHeader.cpp
 * @date 20261018 09:12:40 */

#include <pcmsink.h>
#include <endians.hpp>
#include <string.h>
#include "Utils.hpp"

using pcmsink::add_to_buf;
using pcmsink::get_from_buf;

namespace {

const uint32_t RIFF_FIXED_PART = PCM_HEADER_SIZE - 8;

inline uint16_t
read_u16(const uint8_t*& pos)
{
	u16le val = 0;
	get_from_buf(pos, val.bytes);
	return val;
}

inline uint32_t
read_u32(const uint8_t*& pos)
{
	u32le val = 0;
	get_from_buf(pos, val.bytes);
	return val;
}

inline bool
read_tag(const uint8_t*& pos, const char (&tag)[4])
{
	bool rs = memcmp(pos, tag, sizeof(tag)) == 0;
	pos += sizeof(tag);
	return rs;
}

} // namespace

extern "C" {

int
pcm_format_valid(const PCMFormat* fmt)
{
	if (!fmt || fmt->sample_rate == 0 || fmt->channels == 0)
		return 0;
	switch (fmt->bits_per_sample)
	{
		case 8: case 16: case 24: case 32:
			return 1;
		default:
			return 0;
	}
}

uint16_t
pcm_bytes_per_sample(const PCMFormat* fmt)
{
	return fmt->bits_per_sample / 8;
}

uint16_t
pcm_block_align(const PCMFormat* fmt)
{
	return fmt->channels * pcm_bytes_per_sample(fmt);
}

uint32_t
pcm_byte_rate(const PCMFormat* fmt)
{
	return fmt->sample_rate * pcm_block_align(fmt);
}

uint64_t
pcm_segment_bytes(const PCMFormat* fmt, uint32_t seconds)
{
	return (uint64_t)pcm_byte_rate(fmt) * seconds;
}

/**@brief Serialize segment header
 * @param buf must hold at least PCM_HEADER_SIZE bytes
 * @return PCM_HEADER_SIZE on success, -1 on invalid format or size*/
int
pcm_encode_header(const PCMFormat* fmt, uint32_t datasz, uint8_t* buf)
{
	if (!buf || !pcm_format_valid(fmt))
		return -1;
	if (datasz > 0xFFFFFFFFUL - RIFF_FIXED_PART)
		return -1;
	uint8_t* pos = buf;
	add_to_buf(pos, RIFF_ID, sizeof(RIFF_ID));
	add_to_buf(pos, u32le(RIFF_FIXED_PART + datasz));
	add_to_buf(pos, WAVE_ID, sizeof(WAVE_ID));
	add_to_buf(pos, FMT_ID, sizeof(FMT_ID));
	add_to_buf(pos, u32le(PCM_FMT_SIZE));
	add_to_buf(pos, u16le(WAVE_FORMAT_PCM));
	add_to_buf(pos, u16le(fmt->channels));
	add_to_buf(pos, u32le(fmt->sample_rate));
	add_to_buf(pos, u32le(pcm_byte_rate(fmt)));
	add_to_buf(pos, u16le(pcm_block_align(fmt)));
	add_to_buf(pos, u16le(fmt->bits_per_sample));
	add_to_buf(pos, DATA_ID, sizeof(DATA_ID));
	add_to_buf(pos, u32le(datasz));
	return (int)(pos - buf);
}

/**@brief Parse segment header
 * @return PCM_HEADER_SIZE on success, -1 on malformed header*/
int
pcm_decode_header(const uint8_t* buf, size_t bufsz, PCMFormat* fmt,
                  uint32_t* datasz)
{
	if (!buf || !fmt || !datasz || bufsz < PCM_HEADER_SIZE)
		return -1;
	const uint8_t* pos = buf;
	if (!read_tag(pos, RIFF_ID))
		return -1;
	uint32_t riffsz = read_u32(pos);
	if (!read_tag(pos, WAVE_ID) || !read_tag(pos, FMT_ID))
		return -1;
	if (read_u32(pos) != PCM_FMT_SIZE)
		return -1;
	if (read_u16(pos) != WAVE_FORMAT_PCM)
		return -1;
	PCMFormat rs;
	rs.channels = read_u16(pos);
	rs.sample_rate = read_u32(pos);
	uint32_t byte_rate = read_u32(pos);
	uint16_t block_align = read_u16(pos);
	rs.bits_per_sample = read_u16(pos);
	if (!pcm_format_valid(&rs)
	 || byte_rate != pcm_byte_rate(&rs)
	 || block_align != pcm_block_align(&rs))
	{
		return -1;
	}
	if (!read_tag(pos, DATA_ID))
		return -1;
	uint32_t declared = read_u32(pos);
	if (riffsz != RIFF_FIXED_PART + declared)
		return -1;
	*fmt = rs;
	*datasz = declared;
	return (int)(pos - buf);
}

int
pcm_read_header(FILE* stream, PCMFormat* fmt, uint32_t* datasz)
{
	if (!stream)
		return -1;
	uint8_t buf[PCM_HEADER_SIZE];
	if (fread(buf, 1, sizeof(buf), stream) != sizeof(buf))
		return -1;
	return pcm_decode_header(buf, sizeof(buf), fmt, datasz);
}

} // extern "C"
