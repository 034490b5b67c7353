/**@file tSegmentWriter.hpp
 * @date 20261018 09:12:40 */

#include <SegmentWriter.hpp>
#include <Subprocess.hpp>
#include "tHelpers.hpp"

using namespace pcmsink_test;

class TestSegmentWriter : public ::testing::Test
{
protected:
	void SetUp()
	{
		ASSERT_FALSE(tmp.Path().empty());
		fmt.sample_rate = 8000;
		fmt.channels = 1;
		fmt.bits_per_sample = 16;
	}
	uint32_t declared(const std::string& path)
	{
		FILE* f = fopen(path.c_str(), "rb");
		if (!f)
			return 0;
		PCMFormat decoded;
		uint32_t rs = 0;
		if (pcm_read_header(f, &decoded, &rs) != PCM_HEADER_SIZE)
			rs = 0;
		fclose(f);
		return rs;
	}
	TempDir   tmp;
	PCMFormat fmt;
};

TEST_F(TestSegmentWriter, FullSegment)
{
	const std::string path = tmp.Path() + "/2026-10-18/2026-10-18_0912.wav";
	const std::string data = ramp(1600);
	SegmentWriter seg(fmt, 1600);
	ASSERT_TRUE(seg.Open(path, 1792314760));
	ASSERT_TRUE(seg.IsOpen());
	ASSERT_EQ(seg.Remaining(), 1600u);
	ASSERT_TRUE(seg.Append((const uint8_t*)data.data(), 1000));
	ASSERT_FALSE(seg.IsFull());
	ASSERT_EQ(seg.Remaining(), 600u);
	ASSERT_TRUE(seg.Append((const uint8_t*)data.data() + 1000, 600));
	ASSERT_TRUE(seg.IsFull());
	ASSERT_EQ(seg.Written(), 1600u);
	ASSERT_EQ(seg.Created(), 1792314760);
	ASSERT_TRUE(seg.Close());
	ASSERT_FALSE(seg.IsOpen());

	std::string content = read_file(path);
	ASSERT_EQ(content.size(), PCM_HEADER_SIZE + 1600u);
	ASSERT_EQ(content.substr(PCM_HEADER_SIZE), data);
	ASSERT_EQ(declared(path), 1600u);
}

TEST_F(TestSegmentWriter, TruncatedKeepsDeclaredSize)
{
	const std::string path = tmp.Path() + "/short.wav";
	{
		SegmentWriter seg(fmt, 16000);
		ASSERT_TRUE(seg.Open(path));
		ASSERT_TRUE(seg.Append((const uint8_t*)ramp(300).data(), 300));
		ASSERT_TRUE(seg.Close());
		ASSERT_TRUE(seg.Close()) << "second close is a no-op";
		ASSERT_FALSE(seg.Append((const uint8_t*)"ab", 2));
	}
	ASSERT_EQ(read_file(path).size(), PCM_HEADER_SIZE + 300u);
	ASSERT_EQ(declared(path), 16000u);
}

TEST_F(TestSegmentWriter, DestructorCloses)
{
	const std::string path = tmp.Path() + "/dtor.wav";
	{
		SegmentWriter seg(fmt, 16000);
		ASSERT_TRUE(seg.Open(path));
		ASSERT_TRUE(seg.Append((const uint8_t*)ramp(10).data(), 10));
	}
	ASSERT_EQ(read_file(path).size(), PCM_HEADER_SIZE + 10u);
}

TEST_F(TestSegmentWriter, CollisionTruncates)
{
	const std::string path = tmp.Write("same.wav", std::string(5000, 'x'));
	SegmentWriter seg(fmt, 16000);
	ASSERT_TRUE(seg.Open(path));
	ASSERT_TRUE(seg.Close());
	ASSERT_EQ(read_file(path).size(), (size_t)PCM_HEADER_SIZE);
}

TEST_F(TestSegmentWriter, StorageError)
{
	tmp.Write("blocker", "not a directory");
	SegmentWriter seg(fmt, 16000);
	ASSERT_FALSE(seg.Open(tmp.Path() + "/blocker/2026-10-18/x.wav"));
	ASSERT_FALSE(seg.IsOpen());
	ASSERT_FALSE(seg.Append((const uint8_t*)"ab", 2));
}

TEST_F(TestSegmentWriter, NotInheritedByChildren)
{
	const std::string path = tmp.Path() + "/2026-10-18/2026-10-18_0913.wav";
	SegmentWriter seg(fmt, 1600);
	ASSERT_TRUE(seg.Open(path, 1792314820));
	std::vector<std::string> args;
	args.push_back("/bin/sh");
	args.push_back("-c");
	args.push_back("ls -l /proc/$$/fd");
	Subprocess::Result rs = Subprocess::Run(args, 10);
	ASSERT_TRUE(rs.Succeeded()) << rs.output;
	ASSERT_EQ(rs.output.find("2026-10-18_0913.wav"), std::string::npos)
		<< rs.output;
	ASSERT_TRUE(seg.Close());
}
