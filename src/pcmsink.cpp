/**@file pcmsink.cpp
 * @date 20261018 09:12:40
 *
 * @brief pcmsink entry point.*/

#include <errno.h>
#include <stdio.h>
#include <string.h>
#include <iostream>
#include <logging.hpp>
#include <pcmsink.h>
#include "Config.hpp"
#include "Events.hpp"
#include "Service.hpp"
#include "Utils.hpp"

INIT_LOGGING

using namespace pcmsink;

/**@brief Print a segment header next to the payload actually on disk*/
int
inspect(const std::string& path)
{
	FILE* f = fopen(path.c_str(), "rb");
	if (!f)
	{
		LOG(ERROR) << _("Can't open ") << path
		           << _(" Message: ") << strerror(errno);
		return 1;
	}
	PCMFormat fmt;
	uint32_t declared = 0;
	int rs = pcm_read_header(f, &fmt, &declared);
	fclose(f);
	if (rs != PCM_HEADER_SIZE)
	{
		LOG(ERROR) << _("Not a PCM WAV segment: ") << path;
		return 1;
	}
	size_t size = 0;
	if (!file_size(path, size))
	{
		LOG(ERROR) << _("Can't stat ") << path;
		return 1;
	}
	size_t actual = size - PCM_HEADER_SIZE;
	std::cout << path << std::endl
	          << "  rate      " << fmt.sample_rate << std::endl
	          << "  channels  " << fmt.channels << std::endl
	          << "  bits      " << fmt.bits_per_sample << std::endl
	          << "  declared  " << declared << std::endl
	          << "  actual    " << actual << std::endl;
	if (actual < declared)
		std::cout << _("  header overstates the payload by ")
		          << declared - actual << _(" bytes") << std::endl;
	return 0;
}

int
main(int argc, char* argv[])
{
	Config cfg;
	int rs = cfg.ParseArgs(argc, argv);
	if (rs == 0)
		return 0;
	if (rs < 0)
	{
		cfg.PrintInfo();
		std::cerr << _("Try --help for more info.") << std::endl;
		return 1;
	}
	InitLogging(cfg.Verbose(), cfg.LogFile());
	if (!cfg.InspectFile().empty())
		return inspect(cfg.InspectFile());
	LOG(INFO) << _("Starting pcmsink ") << pcmsink_VERSION_MAJOR << "."
	          << pcmsink_VERSION_MINOR << "." << pcmsink_VERSION_PATCH;
	VLOG(2) << cfg.GetOptions();
	LogSink sink;
	Service svc(cfg, sink);
	rs = svc.Loop();
	LOG(INFO) << _("pcmsink stopped.");
	FlushLogging();
	return rs;
}
