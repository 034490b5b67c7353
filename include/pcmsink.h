/**@file pcmsink.h
 * @date 20261018 09:12:40
 *
 * Raw PCM stream recorder. Segments are stored as canonical RIFF/WAVE
 * files whose header is written before the payload exists.
 *
 * # Segment file structure:
 *
 * 	+---+---+---+---+---+---+---+---+---+---+---+---+
 * 	| R | I | F | F |   RIFF_SIZE   | W | A | V | E |->
 * 	+---+---+---+---+---+---+---+---+---+---+---+---+
 * 	+---+---+---+---+---+---+---+---+---+---+---+---+
 * 	| f | m | t |   |    FMT_SIZE   |  TAG  |  CH   |->
 * 	+---+---+---+---+---+---+---+---+---+---+---+---+
 * 	+---+---+---+---+---+---+---+---+---+---+---+---+
 * 	|     RATE      |   BYTE_RATE   | ALIGN | BITS  |->
 * 	+---+---+---+---+---+---+---+---+---+---+---+---+
 * 	+---+---+---+---+---+---+---+---+=========+
 * 	| d | a | t | a |   DATA_SIZE   |  PCM    |
 * 	+---+---+---+---+---+---+---+---+=========+
 *
 * 	RIFF_SIZE - 36 + DATA_SIZE (file size minus 8 for a full segment)
 * 	FMT_SIZE  - 16
 * 	TAG       - 1 (integer PCM)
 * 	CH        - channels count
 * 	RATE      - samples per second
 * 	BYTE_RATE - RATE*CH*BITS/8
 * 	ALIGN     - CH*BITS/8
 * 	BITS      - bits per sample (8, 16, 24 or 32)
 * 	DATA_SIZE - declared payload length
 * 	PCM       - interleaved samples exactly as received from the sender
 *
 * All integers are little-endian. DATA_SIZE is the segment's target
 * size, fixed when the file is created. A segment cut short by a lost
 * connection keeps it, so its header declares more payload than the
 * file holds.
 * */

#ifndef __PCMSINK_H__
#define __PCMSINK_H__

#include <stdio.h>
#include <stddef.h>
#include <stdint.h>
#include "pcmsink_config.h"

#ifdef __cplusplus
extern "C" {
#endif

#define PCM_HEADER_SIZE 44

static const char     RIFF_ID[4]      = {'R', 'I', 'F', 'F'};
static const char     WAVE_ID[4]      = {'W', 'A', 'V', 'E'};
static const char     FMT_ID[4]       = {'f', 'm', 't', ' '};
static const char     DATA_ID[4]      = {'d', 'a', 't', 'a'};
static const uint32_t PCM_FMT_SIZE    = 16;
static const uint16_t WAVE_FORMAT_PCM = 1;

typedef struct
{
	uint32_t sample_rate;
	uint16_t channels;
	uint16_t bits_per_sample;
} PCMFormat;

PCMSINK_API int      pcm_format_valid     (const PCMFormat* fmt);
PCMSINK_API uint16_t pcm_bytes_per_sample (const PCMFormat* fmt);
PCMSINK_API uint16_t pcm_block_align      (const PCMFormat* fmt);
PCMSINK_API uint32_t pcm_byte_rate        (const PCMFormat* fmt);
PCMSINK_API uint64_t pcm_segment_bytes    (const PCMFormat* fmt,
                                           uint32_t seconds);
PCMSINK_API int      pcm_encode_header    (const PCMFormat* fmt,
                                           uint32_t datasz,
                                           uint8_t* buf);
PCMSINK_API int      pcm_decode_header    (const uint8_t* buf,
                                           size_t bufsz,
                                           PCMFormat* fmt,
                                           uint32_t* datasz);
PCMSINK_API int      pcm_read_header      (FILE* stream,
                                           PCMFormat* fmt,
                                           uint32_t* datasz);

#ifdef __cplusplus
}
#endif

#endif // __PCMSINK_H__
