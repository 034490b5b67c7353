/**@file tService.hpp
 * @date 20261018 09:12:40
 *
 * End to end: the whole service on a loopback ephemeral port, 8 kHz
 * mono 16-bit with one second segments (16000 bytes), 1600 byte
 * chunks and a one minute per reading clock. Compression starts right
 * away on one worker unless a case asks otherwise.*/

#include <Service.hpp>
#include <sstream>
#include <thread>
#include "tHelpers.hpp"

using namespace pcmsink_test;

class TestService : public ::testing::Test
{
protected:
	void SetUp()
	{
		ASSERT_FALSE(tmp.Path().empty());
		copy_encoder = tmp.Write("copy-encoder", COPY_ENCODER, 0755);
		slow_once_encoder = tmp.Write("slow-once-encoder",
		                              SLOW_ONCE_ENCODER, 0755);
		failing_encoder = tmp.Write("failing-encoder", FAILING_ENCODER,
		                            0755);
		root = tmp.Path() + "/audio";
	}

	void start(const std::string& encoder, const char* codec = "flac",
	           const char* delay = "0", const char* workers = "1")
	{
		const char* base[] = {"-p", "0", "-d", "", "-r", "8000",
		                      "-c", "1", "-b", "16", "-k", "1600",
		                      "-s", "1", "-t", "1", "-D", "0",
		                      "-T", "10", "-j", "1", "-K", "-z", ""};
		std::vector<std::string> args(base,
			base + sizeof(base)/sizeof(base[0]));
		args[3] = root;
		args[17] = delay;
		args[21] = workers;
		args.back() = codec;
		args.push_back("-e");
		args.push_back(encoder);
		ASSERT_EQ(parse_config(cfg, args), 1);
		svc.reset(new Service(cfg, sink, StepClock(1792314760)));
		ASSERT_TRUE(svc->Dispatch());
		ASSERT_NE(svc->Port(), 0);
	}

	void TearDown()
	{
		if (svc)
			svc->Stop();
		svc.reset();
	}

	uint32_t declared(const std::string& path)
	{
		FILE* f = fopen(path.c_str(), "rb");
		if (!f)
			return 0;
		PCMFormat fmt;
		uint32_t rs = 0;
		if (pcm_read_header(f, &fmt, &rs) != PCM_HEADER_SIZE)
			rs = 0;
		fclose(f);
		return rs;
	}

	TempDir                  tmp;
	std::string              root;
	std::string              copy_encoder;
	std::string              slow_once_encoder;
	std::string              failing_encoder;
	Config                   cfg;
	RecordingSink            sink;
	std::unique_ptr<Service> svc;
};

TEST_F(TestService, ExactSegmentThenDisconnect)
{
	start(copy_encoder);
	const std::string data = ramp(16000);
	{
		Sender sender(svc->Port());
		ASSERT_TRUE(sender.IsConnected());
		ASSERT_TRUE(sender.Send(data));
	}
	ASSERT_TRUE(sink.WaitDisconnects(1));
	ASSERT_EQ(sink.Disconnects()[0], CLOSE_PEER);
	ASSERT_TRUE(sink.WaitReports(1));

	std::vector<std::string> wavs = list_recordings(root, Storage::EXT_WAV);
	ASSERT_EQ(wavs.size(), 1u);
	ASSERT_EQ(declared(wavs[0]), 16000u);
	std::string content = read_file(wavs[0]);
	ASSERT_EQ(content.size(), PCM_HEADER_SIZE + 16000u);
	ASSERT_EQ(content.substr(PCM_HEADER_SIZE), data);

	std::vector<SegmentInfo> closed = sink.Closed();
	ASSERT_EQ(closed.size(), 1u);
	ASSERT_EQ(closed[0].reason, CLOSE_FULL);
	ASSERT_EQ(sink.Scheduled().size(), 1u);
	std::vector<JobReport> reports = sink.Reports();
	ASSERT_EQ(reports[0].status, JOB_SUCCEEDED);
	ASSERT_EQ(reports[0].output,
	          Storage::ReplaceExtension(wavs[0], Storage::EXT_FLAC));
	ASSERT_TRUE(path_exists(reports[0].output));
}

TEST_F(TestService, PartialSegmentThenSilence)
{
	start(copy_encoder);
	// 3 whole chunks, a sample-aligned tail and one odd byte
	const std::string data = ramp(5001);
	Sender sender(svc->Port());
	ASSERT_TRUE(sender.IsConnected());
	ASSERT_TRUE(sender.Send(data));
	ASSERT_TRUE(sink.WaitDisconnects(1, 5000));
	ASSERT_EQ(sink.Disconnects()[0], CLOSE_TIMEOUT);
	ASSERT_TRUE(sink.WaitReports(1));

	std::vector<std::string> wavs = list_recordings(root, Storage::EXT_WAV);
	ASSERT_EQ(wavs.size(), 1u);
	ASSERT_EQ(declared(wavs[0]), 16000u) << "header stays overstated";
	std::string content = read_file(wavs[0]);
	ASSERT_EQ(content.size(), PCM_HEADER_SIZE + 5000u);
	ASSERT_EQ(content.substr(PCM_HEADER_SIZE), data.substr(0, 5000));

	ASSERT_EQ(sink.Closed()[0].reason, CLOSE_TIMEOUT);
	ASSERT_EQ(sink.Reports()[0].status, JOB_SKIPPED_TOO_SMALL);
	ASSERT_TRUE(list_recordings(root, Storage::EXT_FLAC).empty());
}

TEST_F(TestService, BackToBackSegmentsLoseNothing)
{
	start(copy_encoder, "none");
	const std::string data = ramp(32000);
	{
		Sender sender(svc->Port());
		ASSERT_TRUE(sender.IsConnected());
		ASSERT_TRUE(sender.Send(data, 1111));
	}
	ASSERT_TRUE(sink.WaitDisconnects(1));

	std::vector<std::string> wavs = list_recordings(root, Storage::EXT_WAV);
	ASSERT_EQ(wavs.size(), 2u);
	std::string joined;
	for (size_t i = 0; i < wavs.size(); ++i)
	{
		std::string content = read_file(wavs[i]);
		ASSERT_EQ(content.size(), PCM_HEADER_SIZE + 16000u);
		joined += content.substr(PCM_HEADER_SIZE);
	}
	ASSERT_EQ(joined, data);
	ASSERT_TRUE(sink.Scheduled().empty()) << "compression disabled";
}

TEST_F(TestService, SegmentCount)
{
	start(copy_encoder, "none");
	{
		Sender sender(svc->Port());
		ASSERT_TRUE(sender.IsConnected());
		ASSERT_TRUE(sender.Send(ramp(40000)));
	}
	ASSERT_TRUE(sink.WaitDisconnects(1));
	std::vector<std::string> wavs = list_recordings(root, Storage::EXT_WAV);
	ASSERT_EQ(wavs.size(), 3u);
	ASSERT_EQ(read_file(wavs[2]).size(), PCM_HEADER_SIZE + 8000u);
	std::vector<SegmentInfo> closed = sink.Closed();
	ASSERT_EQ(closed.size(), 3u);
	ASSERT_EQ(closed[0].reason, CLOSE_FULL);
	ASSERT_EQ(closed[1].reason, CLOSE_FULL);
	ASSERT_EQ(closed[2].reason, CLOSE_PEER);
	ASSERT_EQ(closed[2].written, 8000u);
}

TEST_F(TestService, EncoderFailure)
{
	start(failing_encoder);
	{
		Sender sender(svc->Port());
		ASSERT_TRUE(sender.IsConnected());
		ASSERT_TRUE(sender.Send(ramp(16000)));
	}
	ASSERT_TRUE(sink.WaitReports(1));
	ASSERT_EQ(sink.Reports()[0].status, JOB_FAILED);
	std::vector<std::string> wavs = list_recordings(root, Storage::EXT_WAV);
	ASSERT_EQ(wavs.size(), 1u);
	ASSERT_EQ(read_file(wavs[0]).size(), PCM_HEADER_SIZE + 16000u);
	ASSERT_TRUE(list_recordings(root, Storage::EXT_FLAC).empty());
	ASSERT_FALSE(path_exists(
		Storage::ReplaceExtension(wavs[0], Storage::EXT_FLAC) + ".tmp"));
}

TEST_F(TestService, DegradedModeStillRecords)
{
	start(tmp.Path() + "/no-such-encoder");
	ASSERT_TRUE(svc->Degraded());
	{
		Sender sender(svc->Port());
		ASSERT_TRUE(sender.IsConnected());
		ASSERT_TRUE(sender.Send(ramp(16000)));
	}
	ASSERT_TRUE(sink.WaitDisconnects(1));
	ASSERT_EQ(list_recordings(root, Storage::EXT_WAV).size(), 1u);
	std::this_thread::sleep_for(std::chrono::milliseconds(200));
	ASSERT_TRUE(sink.Scheduled().empty());
}

TEST_F(TestService, ReconnectAfterDisconnect)
{
	start(copy_encoder, "none");
	for (int i = 0; i < 2; ++i)
	{
		Sender sender(svc->Port());
		ASSERT_TRUE(sender.IsConnected());
		ASSERT_TRUE(sender.Send(ramp(3200)));
		sender.Close();
		ASSERT_TRUE(sink.WaitDisconnects(i + 1));
	}
	ASSERT_EQ(list_recordings(root, Storage::EXT_WAV).size(), 2u);
	ASSERT_EQ(sink.Received(), 6400u);
}

TEST_F(TestService, ConnectionWithoutDataLeavesNoFile)
{
	start(copy_encoder, "none");
	{
		Sender sender(svc->Port());
		ASSERT_TRUE(sender.IsConnected());
	}
	ASSERT_TRUE(sink.WaitDisconnects(1));
	ASSERT_TRUE(list_recordings(root, Storage::EXT_WAV).empty());
}

TEST_F(TestService, BindFailure)
{
	start(copy_encoder, "none");
	Config busy = cfg;
	std::vector<std::string> args;
	args.push_back("-p");
	std::stringstream port;
	port << svc->Port();
	args.push_back(port.str());
	args.push_back("-d");
	args.push_back(root);
	args.push_back("-z");
	args.push_back("none");
	ASSERT_EQ(parse_config(busy, args), 1);
	RecordingSink other;
	Service second(busy, other);
	ASSERT_FALSE(second.Dispatch());
}

TEST_F(TestService, CompressionWaitsForDelay)
{
	start(copy_encoder, "flac", "2");
	{
		Sender sender(svc->Port());
		ASSERT_TRUE(sender.IsConnected());
		ASSERT_TRUE(sender.Send(ramp(16000)));
	}
	ASSERT_TRUE(sink.WaitDisconnects(1));
	ASSERT_FALSE(sink.WaitReports(1, 1000)) << "ran before the delay";
	ASSERT_TRUE(list_recordings(root, Storage::EXT_FLAC).empty());
	ASSERT_TRUE(sink.WaitReports(1, 5000));
	ASSERT_EQ(sink.Scheduled().size(), 1u);
	ASSERT_EQ(sink.Reports()[0].status, JOB_SUCCEEDED);
	ASSERT_EQ(list_recordings(root, Storage::EXT_FLAC).size(), 1u);
}

TEST_F(TestService, ShutdownClosesActiveSegment)
{
	start(copy_encoder, "none");
	const std::string data = ramp(8000);
	Sender sender(svc->Port());
	ASSERT_TRUE(sender.IsConnected());
	ASSERT_TRUE(sender.Send(data));
	ASSERT_TRUE(sink.WaitOpened(1));
	// let the receiver drain the socket
	std::this_thread::sleep_for(std::chrono::milliseconds(500));
	svc->Stop();

	std::vector<SegmentInfo> closed = sink.Closed();
	ASSERT_EQ(closed.size(), 1u);
	ASSERT_EQ(closed[0].reason, CLOSE_SHUTDOWN);
	ASSERT_EQ(closed[0].written, 8000u);
	ASSERT_EQ(sink.Disconnects().size(), 1u);
	ASSERT_EQ(sink.Disconnects()[0], CLOSE_SHUTDOWN);

	std::vector<std::string> wavs = list_recordings(root, Storage::EXT_WAV);
	ASSERT_EQ(wavs.size(), 1u);
	ASSERT_EQ(declared(wavs[0]), 16000u);
	std::string content = read_file(wavs[0]);
	ASSERT_EQ(content.size(), PCM_HEADER_SIZE + 8000u);
	ASSERT_EQ(content.substr(PCM_HEADER_SIZE), data);
}

TEST_F(TestService, IdleWorkerTakesNextJob)
{
	// the first job takes 3 s, the other two must not queue behind it
	start(slow_once_encoder, "flac", "0", "2");
	{
		Sender sender(svc->Port());
		ASSERT_TRUE(sender.IsConnected());
		ASSERT_TRUE(sender.Send(ramp(48000)));
	}
	ASSERT_TRUE(sink.WaitReports(3, 15000));
	std::vector<JobReport> reports = sink.Reports();
	for (size_t i = 0; i < reports.size(); ++i)
		ASSERT_EQ(reports[i].status, JOB_SUCCEEDED) << reports[i].path;
	ASSERT_LT(reports[0].elapsed_ms, 2000u);
	ASSERT_LT(reports[1].elapsed_ms, 2000u);
	ASSERT_GE(reports[2].elapsed_ms, 2500u) << "slow job finishes last";
	ASSERT_EQ(list_recordings(root, Storage::EXT_FLAC).size(), 3u);
}
