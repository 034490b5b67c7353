/**@file Config.hpp
 * @date 20261018 09:12:40 */

#ifndef __CONFIG_HPP__
#define __CONFIG_HPP__

#include <string>
#include <stdint.h>
#include <pcmsink.h>

namespace pcmsink {

/**@brief Process configuration
 *
 * Filled once from the command line and then passed by const reference
 * to every component.*/
class Config
{
public:
	enum Codec
	{
		CODEC_NONE = 0,
		CODEC_FLAC = 1,
		CODEC_OPUS = 2
	};

	Config()
	{
		SetDefaults();
	}
	~Config();
	int  ParseArgs(int argc, char* argv[]);
	void SetDefaults();
	void DisableCompression() { codec_ = CODEC_NONE; }

	std::string GetOptions() const;
	void        PrintInfo() const;
	void        PrintHelp() const;

	int         Verbose()          const { return verbose_; }
	std::string LogFile()          const { return log_file_; }
	std::string InspectFile()      const { return inspect_file_; }

	uint16_t    Port()             const { return port_; }
	std::string DataDir()          const { return data_dir_; }
	PCMFormat   Format()           const { return format_; }
	size_t      ChunkSize()        const { return chunk_size_; }
	uint32_t    SegmentSeconds()   const { return segment_seconds_; }
	uint32_t    SegmentBytes()     const;
	unsigned    IdleTimeout()      const { return idle_timeout_; }
	unsigned    RetryDelay()       const { return retry_delay_; }

	Codec       CompressionCodec() const { return codec_; }
	bool        CompressionEnabled() const { return codec_ != CODEC_NONE; }
	unsigned    CompressDelay()    const { return compress_delay_; }
	unsigned    MinPercent()       const { return min_percent_; }
	size_t      MinCompressBytes() const;
	int         FlacLevel()        const { return flac_level_; }
	unsigned    OpusBitrate()      const { return opus_bitrate_; }
	bool        DeleteSource()     const { return delete_source_; }
	std::string Encoder()          const { return encoder_; }
	unsigned    EncoderTimeout()   const { return encoder_timeout_; }
	size_t      Workers()          const { return workers_; }
	unsigned    RetentionDays()    const { return retention_days_; }
	int         MsgHWM()           const { return 1000; }

	static const char* CodecName(Codec codec);

private:
	bool        validate() const;

	int         verbose_;
	std::string log_file_;
	std::string inspect_file_;
	uint16_t    port_;
	std::string data_dir_;
	PCMFormat   format_;
	size_t      chunk_size_;
	uint32_t    segment_seconds_;
	unsigned    idle_timeout_;
	unsigned    retry_delay_;
	Codec       codec_;
	unsigned    compress_delay_;
	unsigned    min_percent_;
	int         flac_level_;
	unsigned    opus_bitrate_;
	bool        delete_source_;
	std::string encoder_;
	unsigned    encoder_timeout_;
	size_t      workers_;
	unsigned    retention_days_;
};

} // namespace

#endif // __CONFIG_HPP__
