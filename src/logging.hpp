#include <easylogging++.h>

#ifndef __LOGGING_HPP__
#define __LOGGING_HPP__

#include <string>

namespace pcmsink {

#define INIT_LOGGING INITIALIZE_EASYLOGGINGPP

using namespace el;

/**@brief Configure the default logger
 *
 * Records go to stdout and, if log_file is not empty, are appended to
 * log_file too. verbose_level 2 enables VLOG(2) tracing.*/
inline void InitLogging(int verbose_level = 1,
                        const std::string& log_file = "")
{
	Configurations conf;
	conf.setToDefault();
	conf.setGlobally(ConfigurationType::Format,
	                 "%datetime %level %msg");
	conf.setGlobally(ConfigurationType::ToStandardOutput, "true");
	if (log_file.empty())
	{
		conf.setGlobally(ConfigurationType::ToFile, "false");
	}
	else
	{
		conf.setGlobally(ConfigurationType::ToFile, "true");
		conf.setGlobally(ConfigurationType::Filename, log_file);
	}
	Loggers::reconfigureLogger("default", conf);
	Loggers::setVerboseLevel(verbose_level < 4 ? verbose_level : 1);
}

inline void FlushLogging()
{
	Loggers::flushAll();
}

} // namespace

#endif // __LOGGING_HPP__
