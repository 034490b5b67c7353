/**@file test.cpp
 * @date 20261018 09:12:40
 *
 * @brief pcmsink test launcher.*/

#include <stdlib.h>
#include <time.h>
// Google Testing Framework
#include <gtest/gtest.h>
#include <logging.hpp>

INIT_LOGGING

#include "tWaveHeader.hpp"
#include "tStorage.hpp"
#include "tConfig.hpp"
#include "tMessages.hpp"
#include "tSegmentWriter.hpp"
#include "tSubprocess.hpp"
#include "tCompressionJob.hpp"
#include "tService.hpp"

// test cases

int main(int argc, char *argv[])
{
	setenv("TZ", "UTC", 1);
	tzset();
	pcmsink::InitLogging(1);
	::testing::InitGoogleTest(&argc, argv);
	return RUN_ALL_TESTS();
}
