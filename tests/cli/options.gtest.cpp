#include "cli/options.hpp"

#include <gtest/gtest.h>

namespace ttt::cli::gtest {

TEST(Options, Defaults) {
	const auto options = parseOptions({});
	EXPECT_EQ(options.startPlayer, "X");
	EXPECT_FALSE(options.help);
	EXPECT_EQ(options.startingMark(), Mark::X);
}

TEST(Options, StartPlayer) {
	EXPECT_EQ(parseOptions({"--start-player", "O"}).startingMark(), Mark::O);
	EXPECT_EQ(parseOptions({"--start-player=X"}).startingMark(), Mark::X);
	EXPECT_EQ(parseOptions({"-s", "O"}).startingMark(), Mark::O);
}

TEST(Options, UnknownStartPlayerFallsBackToX) {
	const auto options = parseOptions({"-s", "Z"});
	EXPECT_EQ(options.startPlayer, "Z");
	EXPECT_EQ(options.startingMark(), Mark::X);
}

TEST(Options, Help) {
	EXPECT_TRUE(parseOptions({"--help"}).help);
	EXPECT_TRUE(parseOptions({"-h"}).help);
}

TEST(Options, InvalidCommandLine) {
	EXPECT_THROW(parseOptions({"--unknown"}), boost::program_options::error);
	EXPECT_THROW(parseOptions({"--start-player"}), boost::program_options::error);
}

} // namespace ttt::cli::gtest
