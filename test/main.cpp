#include <gtest/gtest.h>

#include "utils/log.hpp"

int main(int argc, char **argv)
{
	// Parser diagnostics are verbose; only warnings and errors reach the test output.
	assview::SetLogPriority(assview::LogPriority::Warn);
	testing::InitGoogleTest(&argc, argv);
	return RUN_ALL_TESTS();
}
