/**@file Config.cpp
 * @date 20261018 09:12:40 */

#include "Config.hpp"
#include <getopt.h>
#include <errno.h>
#include <stdlib.h>
#include <string.h>
#include <logging.hpp>
#include <iostream>
#include <iomanip>
#include <sstream>
#include <vector>

namespace pcmsink {

Config::~Config()
{
}

void
Config::SetDefaults()
{
	verbose_ = 1;
	log_file_.clear();
	inspect_file_.clear();
	port_ = 9000;
	data_dir_ = "/data/audio";
	format_.sample_rate = 16000;
	format_.channels = 1;
	format_.bits_per_sample = 16;
	chunk_size_ = 19200;
	segment_seconds_ = 600;
	idle_timeout_ = 30;
	retry_delay_ = 5;
	codec_ = CODEC_FLAC;
	compress_delay_ = 10;
	min_percent_ = 50;
	flac_level_ = 5;
	opus_bitrate_ = 64;
	delete_source_ = true;
	encoder_ = "ffmpeg";
	encoder_timeout_ = 300;
	workers_ = 2;
	retention_days_ = 0;
}

const char*
Config::CodecName(Codec codec)
{
	switch (codec)
	{
		case CODEC_FLAC: return "flac";
		case CODEC_OPUS: return "opus";
		default:         return "none";
	}
}

uint32_t
Config::SegmentBytes() const
{
	return (uint32_t)pcm_segment_bytes(&format_, segment_seconds_);
}

/**@brief Smallest segment file worth compressing
 *
 * Percentage of a full segment file (header included). Compared with
 * the size on disk, never with the header's declared size.*/
size_t
Config::MinCompressBytes() const
{
	uint64_t full = (uint64_t)SegmentBytes() + PCM_HEADER_SIZE;
	return (size_t)(full * min_percent_ / 100);
}

namespace {

inline bool
parse_uint(const std::string& str, unsigned long max, unsigned long& val,
           const char* name)
{
	if (str.empty())
		return true;
	char* end = NULL;
	errno = 0;
	unsigned long rs = strtoul(str.c_str(), &end, 10);
	if (errno != 0 || !end || *end != '\0' || str[0] == '-' || rs > max)
	{
		LOG(ERROR) << _("Config: invalid value for ") << name
		           << ": \"" << str << "\"";
		return false;
	}
	val = rs;
	return true;
}

} // namespace

int
Config::ParseArgs(int argc, char* argv[])
{
	std::string opt_p, opt_r, opt_c, opt_b, opt_k, opt_s, opt_t, opt_R,
	            opt_z, opt_D, opt_m, opt_L, opt_B, opt_T, opt_j, opt_n;
	bool verbose = false, keep = false;

	const char *sopts = "p:d:r:c:b:k:s:t:R:z:D:m:L:B:Ke:T:j:n:l:I:vh";

	const struct option lopts[] = {
		{ "port",            required_argument, NULL, 'p' },
		{ "data-dir",        required_argument, NULL, 'd' },
		{ "rate",            required_argument, NULL, 'r' },
		{ "channels",        required_argument, NULL, 'c' },
		{ "bits",            required_argument, NULL, 'b' },
		{ "chunk",           required_argument, NULL, 'k' },
		{ "segment",         required_argument, NULL, 's' },
		{ "idle-timeout",    required_argument, NULL, 't' },
		{ "retry-delay",     required_argument, NULL, 'R' },
		{ "codec",           required_argument, NULL, 'z' },
		{ "delay",           required_argument, NULL, 'D' },
		{ "min-percent",     required_argument, NULL, 'm' },
		{ "flac-level",      required_argument, NULL, 'L' },
		{ "opus-bitrate",    required_argument, NULL, 'B' },
		{ "keep-source",     no_argument,       NULL, 'K' },
		{ "encoder",         required_argument, NULL, 'e' },
		{ "encoder-timeout", required_argument, NULL, 'T' },
		{ "workers",         required_argument, NULL, 'j' },
		{ "retention",       required_argument, NULL, 'n' },
		{ "log",             required_argument, NULL, 'l' },
		{ "inspect",         required_argument, NULL, 'I' },
		{ "verbose",         no_argument,       NULL, 'v' },

		{ "help",            no_argument,       NULL, 'h' },
		{ NULL,              no_argument,       NULL, '\0'}
	};

	optind = 0;
	int i, opt = 0;
	opt = getopt_long(argc, argv, sopts, lopts, &i);
	while (opt != -1)
	{
		switch (opt)
		{
			case 'p': opt_p = optarg; break;
			case 'd': data_dir_ = optarg; break;
			case 'r': opt_r = optarg; break;
			case 'c': opt_c = optarg; break;
			case 'b': opt_b = optarg; break;
			case 'k': opt_k = optarg; break;
			case 's': opt_s = optarg; break;
			case 't': opt_t = optarg; break;
			case 'R': opt_R = optarg; break;
			case 'z': opt_z = optarg; break;
			case 'D': opt_D = optarg; break;
			case 'm': opt_m = optarg; break;
			case 'L': opt_L = optarg; break;
			case 'B': opt_B = optarg; break;
			case 'K': keep = true; break;
			case 'e': encoder_ = optarg; break;
			case 'T': opt_T = optarg; break;
			case 'j': opt_j = optarg; break;
			case 'n': opt_n = optarg; break;
			case 'l': log_file_ = optarg; break;
			case 'I': inspect_file_ = optarg; break;
			case 'v': verbose = true; break;
			case 'h': PrintHelp(); return 0;
			case '?': return -1;
		}
		opt = getopt_long(argc, argv, sopts, lopts, &i);
	}
	if (optind < argc)
	{
		LOG(ERROR) << _("Config: unexpected argument: ") << argv[optind];
		return -1;
	}

	unsigned long port = port_, rate = format_.sample_rate,
	              channels = format_.channels,
	              bits = format_.bits_per_sample, chunk = chunk_size_,
	              segment = segment_seconds_, idle = idle_timeout_,
	              retry = retry_delay_, delay = compress_delay_,
	              percent = min_percent_, level = flac_level_,
	              bitrate = opus_bitrate_, timeout = encoder_timeout_,
	              workers = workers_, retention = retention_days_;
	if (!parse_uint(opt_p, 0xffff, port, "port")
	 || !parse_uint(opt_r, 384000, rate, "rate")
	 || !parse_uint(opt_c, 32, channels, "channels")
	 || !parse_uint(opt_b, 32, bits, "bits")
	 || !parse_uint(opt_k, 0x1000000, chunk, "chunk")
	 || !parse_uint(opt_s, 86400, segment, "segment")
	 || !parse_uint(opt_t, 86400, idle, "idle-timeout")
	 || !parse_uint(opt_R, 3600, retry, "retry-delay")
	 || !parse_uint(opt_D, 86400, delay, "delay")
	 || !parse_uint(opt_m, 100, percent, "min-percent")
	 || !parse_uint(opt_L, 8, level, "flac-level")
	 || !parse_uint(opt_B, 512, bitrate, "opus-bitrate")
	 || !parse_uint(opt_T, 86400, timeout, "encoder-timeout")
	 || !parse_uint(opt_j, 256, workers, "workers")
	 || !parse_uint(opt_n, 36500, retention, "retention"))
	{
		return -1;
	}
	VLOG_IF(2, workers > 16)
		<< _("Config: Too many workers requested. Resetting to 16.");
	port_ = port;
	format_.sample_rate = rate;
	format_.channels = channels;
	format_.bits_per_sample = bits;
	chunk_size_ = chunk;
	segment_seconds_ = segment;
	idle_timeout_ = idle;
	retry_delay_ = retry;
	compress_delay_ = delay;
	min_percent_ = percent;
	flac_level_ = level;
	opus_bitrate_ = bitrate;
	encoder_timeout_ = timeout;
	workers_ = workers > 16 ? 16 : (workers == 0 ? 1 : workers);
	retention_days_ = retention;
	if (keep) delete_source_ = false;
	if (verbose) verbose_ = 2;

	if (!opt_z.empty())
	{
		if (opt_z == "flac")
			codec_ = CODEC_FLAC;
		else if (opt_z == "opus")
			codec_ = CODEC_OPUS;
		else if (opt_z == "none")
			codec_ = CODEC_NONE;
		else
		{
			LOG(WARNING) << _("Config: unknown codec \"") << opt_z
			             << _("\". Compression disabled.");
			codec_ = CODEC_NONE;
		}
	}
	if (!inspect_file_.empty())
		return 1;
	return validate() ? 1 : -1;
}

bool
Config::validate() const
{
	if (!pcm_format_valid(&format_))
	{
		LOG(ERROR) << _("Config: unsupported stream format: ")
		           << format_.sample_rate << " Hz, "
		           << format_.channels << " ch, "
		           << format_.bits_per_sample << " bits";
		return false;
	}
	const uint16_t align = pcm_block_align(&format_);
	if (chunk_size_ == 0 || chunk_size_ % align != 0)
	{
		LOG(ERROR) << _("Config: chunk size ") << chunk_size_
		           << _(" is not a whole number of samples (block align ")
		           << align << ")";
		return false;
	}
	if (segment_seconds_ == 0)
	{
		LOG(ERROR) << _("Config: segment duration must be positive");
		return false;
	}
	if (pcm_segment_bytes(&format_, segment_seconds_)
	    > 0xFFFFFFFFULL - (PCM_HEADER_SIZE - 8))
	{
		LOG(ERROR) << _("Config: segment of ") << segment_seconds_
		           << _(" seconds doesn't fit a WAV file");
		return false;
	}
	if (idle_timeout_ == 0)
	{
		LOG(ERROR) << _("Config: idle timeout must be positive");
		return false;
	}
	if (retry_delay_ == 0)
	{
		LOG(ERROR) << _("Config: retry delay must be positive");
		return false;
	}
	if (data_dir_.empty())
	{
		LOG(ERROR) << _("Config: empty data directory");
		return false;
	}
	return true;
}

template<class T>
inline std::stringstream&
append_opt(std::stringstream& ss, std::string varname, T val, bool endl = true)
{
	ss << std::setw(2) << "" << std::left << std::setw(16) << varname
	   << "= " << std::boolalpha << val;
	if(endl)
		ss << std::endl;
	return ss;
}

inline std::vector<std::string>
split(std::string str, size_t len)
{
	std::vector<std::string> rs;
	if (str.empty() || len < 15)
		return rs;
	while(str.length() > len)
	{
		size_t splitpos = len;
		while (str[splitpos] != ' ' && splitpos > 0)
			--splitpos;
		if (splitpos == 0)
		{
			splitpos = len;
			while(str[splitpos] != ' ' && splitpos < str.length())
				++splitpos;
		}
		rs.push_back(str.substr(0, splitpos));
		if (splitpos >= str.length())
			return rs;
		str = str.substr(splitpos + 1);
	}
	rs.push_back(str);
	return rs;
}

template<class T>
inline std::stringstream&
append_hlp(std::stringstream& ss, std::string opt_short, std::string opt_long,
		T default_val, std::string desc)
{
	const size_t totaln = 80;
	const size_t optln = 24;
	const size_t defln = 14;
	const size_t dscln = totaln - optln - defln;
	std::stringstream opt;
	std::stringstream def;
	std::stringstream defempty;

	std::vector<std::string> desc_pieces = split(desc, dscln);
	std::vector<std::string>::iterator i = desc_pieces.begin();

	opt << "-" << opt_short << "(--" << opt_long << ")";
	def << std::boolalpha << " [" << default_val << "] ";
	defempty << std::boolalpha << " [" << "] ";
	ss << std::left << std::setfill(' ')
	   << std::setw(optln) << opt.str()
	   << std::setw(defln) << (def.str() == defempty.str() ? "" : def.str());
	if (i != desc_pieces.end())
		ss << *i++;
	ss << std::endl;
	for(; i != desc_pieces.end(); ++i)
		ss << std::setw(optln + defln) << "" << *i << std::endl;
	return ss;
}

std::string
Config::GetOptions() const
{
	std::stringstream ss;
	ss << "Options" << std::endl;
	append_opt(ss, "Port"          , Port());
	append_opt(ss, "DataDir"       , DataDir());
	append_opt(ss, "SampleRate"    , format_.sample_rate);
	append_opt(ss, "Channels"      , format_.channels);
	append_opt(ss, "BitsPerSample" , format_.bits_per_sample);
	append_opt(ss, "ChunkSize"     , ChunkSize());
	append_opt(ss, "Segment"       , SegmentSeconds());
	append_opt(ss, "SegmentBytes"  , SegmentBytes());
	append_opt(ss, "IdleTimeout"   , IdleTimeout());
	append_opt(ss, "RetryDelay"    , RetryDelay());
	append_opt(ss, "Codec"         , CodecName(codec_));
	append_opt(ss, "Delay"         , CompressDelay());
	append_opt(ss, "MinBytes"      , MinCompressBytes());
	append_opt(ss, "FlacLevel"     , FlacLevel());
	append_opt(ss, "OpusBitrate"   , OpusBitrate());
	append_opt(ss, "DeleteSource"  , DeleteSource());
	append_opt(ss, "Encoder"       , Encoder());
	append_opt(ss, "EncoderTimeout", EncoderTimeout());
	append_opt(ss, "Workers"       , Workers());
	append_opt(ss, "Retention"     , RetentionDays());
	append_opt(ss, "Verbose"       , verbose_ > 1, false);
	return ss.str();
}

void
Config::PrintInfo() const
{
	std::cout << _("PCM stream recorder (pcmsink ver. ")
	          << pcmsink_VERSION_MAJOR << "."
	          << pcmsink_VERSION_MINOR << "."
	          << pcmsink_VERSION_PATCH << ")" << std::endl
	          << _("Usage: pcmsink [options]") << std::endl;
}

void
Config::PrintHelp() const
{
	PrintInfo();
	std::stringstream ss;
	ss << std::endl << _("Options:") << std::endl;
	append_hlp(ss, "p", "port", Port(), "TCP port to listen on");
	append_hlp(ss, "d", "data-dir", DataDir(), "recordings root");
	append_hlp(ss, "r", "rate", format_.sample_rate, "sample rate, Hz");
	append_hlp(ss, "c", "channels", format_.channels, "channels count");
	append_hlp(ss, "b", "bits", format_.bits_per_sample,
		"bits per sample (8, 16, 24 or 32)");
	append_hlp(ss, "k", "chunk", ChunkSize(),
		"bytes per network read, whole samples only");
	append_hlp(ss, "s", "segment", SegmentSeconds(),
		"segment duration, seconds");
	append_hlp(ss, "t", "idle-timeout", IdleTimeout(),
		"seconds without data before the connection is dropped");
	append_hlp(ss, "R", "retry-delay", RetryDelay(),
		"seconds to wait after an accept failure");
	append_hlp(ss, "z", "codec", CodecName(codec_),
		"compress finished segments: flac, opus or none");
	append_hlp(ss, "D", "delay", CompressDelay(),
		"seconds between segment completion and compression");
	append_hlp(ss, "m", "min-percent", MinPercent(),
		"smaller segments (percent of a full one) are not compressed");
	append_hlp(ss, "L", "flac-level", FlacLevel(), "FLAC level, 0-8");
	append_hlp(ss, "B", "opus-bitrate", OpusBitrate(), "Opus kbps");
	append_hlp(ss, "K", "keep-source", !DeleteSource(),
		"keep WAV after successful compression");
	append_hlp(ss, "e", "encoder", Encoder(), "encoder binary");
	append_hlp(ss, "T", "encoder-timeout", EncoderTimeout(),
		"seconds an encoder run may take");
	append_hlp(ss, "j", "workers", Workers(), "parallel encoder runs");
	append_hlp(ss, "n", "retention", RetentionDays(),
		"days of recordings to keep (0 - keep everything)");
	append_hlp(ss, "l", "log", "", "append log to this file");
	append_hlp(ss, "I", "inspect", "",
		"print header and payload size of a segment file and exit");
	append_hlp(ss, "v", "verbose", Verbose() > 1, "make a lot of noise");
	append_hlp(ss, "h", "help", "", "print this message");
	std::cout << std::boolalpha << ss.str() << std::endl;
}

} // namespace
