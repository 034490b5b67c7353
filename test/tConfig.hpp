/**@file tConfig.hpp
 * @date 20261018 09:12:40 */

#include <Config.hpp>
#include "tHelpers.hpp"

using namespace pcmsink_test;

TEST(TestConfig, Defaults)
{
	Config cfg;
	ASSERT_EQ(parse_config(cfg, std::vector<std::string>()), 1);
	EXPECT_EQ(cfg.Port(), 9000);
	EXPECT_EQ(cfg.DataDir(), "/data/audio");
	EXPECT_EQ(cfg.Format().sample_rate, 16000u);
	EXPECT_EQ(cfg.Format().channels, 1);
	EXPECT_EQ(cfg.Format().bits_per_sample, 16);
	EXPECT_EQ(cfg.ChunkSize(), 19200u);
	EXPECT_EQ(cfg.SegmentBytes(), 19200000u);
	EXPECT_EQ(cfg.IdleTimeout(), 30u);
	EXPECT_EQ(cfg.RetryDelay(), 5u);
	EXPECT_EQ(cfg.CompressionCodec(), Config::CODEC_FLAC);
	EXPECT_EQ(cfg.CompressDelay(), 10u);
	EXPECT_EQ(cfg.MinCompressBytes(), 9600022u);
	EXPECT_EQ(cfg.FlacLevel(), 5);
	EXPECT_EQ(cfg.OpusBitrate(), 64u);
	EXPECT_TRUE(cfg.DeleteSource());
	EXPECT_EQ(cfg.Encoder(), "ffmpeg");
	EXPECT_EQ(cfg.EncoderTimeout(), 300u);
	EXPECT_EQ(cfg.Workers(), 2u);
	EXPECT_EQ(cfg.RetentionDays(), 0u);
}

TEST(TestConfig, Options)
{
	Config cfg;
	const char* args[] = {"--port", "0", "-d", "/tmp/x", "-r", "8000",
	                      "-c", "2", "-b", "24", "-k", "4800", "-s", "60",
	                      "--codec", "opus", "-B", "32", "-K", "-j", "3",
	                      "--retention", "7", "-v"};
	ASSERT_EQ(parse_config(cfg, std::vector<std::string>(args,
		args + sizeof(args)/sizeof(args[0]))), 1);
	EXPECT_EQ(cfg.Port(), 0);
	EXPECT_EQ(cfg.DataDir(), "/tmp/x");
	EXPECT_EQ(cfg.SegmentBytes(), 8000u*2*3*60);
	EXPECT_EQ(cfg.CompressionCodec(), Config::CODEC_OPUS);
	EXPECT_EQ(cfg.OpusBitrate(), 32u);
	EXPECT_FALSE(cfg.DeleteSource());
	EXPECT_EQ(cfg.Workers(), 3u);
	EXPECT_EQ(cfg.RetentionDays(), 7u);
	EXPECT_EQ(cfg.Verbose(), 2);
}

TEST(TestConfig, MisalignedChunk)
{
	Config cfg;
	const char* args[] = {"-c", "2", "-k", "19202"};
	ASSERT_EQ(parse_config(cfg, std::vector<std::string>(args, args + 4)),
	          -1);
}

TEST(TestConfig, InvalidFormat)
{
	{
		Config cfg;
		const char* args[] = {"-b", "12"};
		ASSERT_EQ(parse_config(cfg, std::vector<std::string>(args, args + 2)),
		          -1);
	}
	{
		Config cfg;
		const char* args[] = {"-r", "abc"};
		ASSERT_EQ(parse_config(cfg, std::vector<std::string>(args, args + 2)),
		          -1);
	}
	{
		Config cfg;
		const char* args[] = {"-s", "0"};
		ASSERT_EQ(parse_config(cfg, std::vector<std::string>(args, args + 2)),
		          -1);
	}
	{
		Config cfg;
		const char* args[] = {"-s", "86400", "-c", "32", "-b", "32",
		                      "-k", "128"};
		ASSERT_EQ(parse_config(cfg, std::vector<std::string>(args, args + 8)),
		          -1) << "segment too big for WAV";
	}
	{
		Config cfg;
		const char* args[] = {"--retry-delay", "0"};
		ASSERT_EQ(parse_config(cfg, std::vector<std::string>(args, args + 2)),
		          -1);
	}
}

TEST(TestConfig, UnknownCodecDisablesCompression)
{
	Config cfg;
	std::vector<std::string> args;
	args.push_back("-z");
	args.push_back("mp3");
	ASSERT_EQ(parse_config(cfg, args), 1);
	ASSERT_EQ(cfg.CompressionCodec(), Config::CODEC_NONE);
	ASSERT_FALSE(cfg.CompressionEnabled());
}

TEST(TestConfig, WorkersClamped)
{
	Config cfg;
	std::vector<std::string> args;
	args.push_back("-j");
	args.push_back("40");
	ASSERT_EQ(parse_config(cfg, args), 1);
	ASSERT_EQ(cfg.Workers(), 16u);
	args[1] = "0";
	ASSERT_EQ(parse_config(cfg, args), 1);
	ASSERT_EQ(cfg.Workers(), 1u);
}

TEST(TestConfig, HelpAndStrayArguments)
{
	Config cfg;
	std::vector<std::string> args;
	args.push_back("--help");
	ASSERT_EQ(parse_config(cfg, args), 0);
	args[0] = "stray";
	ASSERT_EQ(parse_config(cfg, args), -1);
}
