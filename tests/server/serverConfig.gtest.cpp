#include "server/serverConfig.hpp"

#include <gtest/gtest.h>

namespace ttt::gtest {

using server::parseArguments;

TEST(ServerConfig, Defaults) {
	const auto parsed = parseArguments({});
	ASSERT_TRUE(parsed.has_value());
	EXPECT_FALSE(parsed->showHelp);
	EXPECT_EQ(parsed->config.port, 9001u);
	EXPECT_EQ(parsed->config.maxConnections, 1000u);
	EXPECT_EQ(parsed->config.tickInterval, std::chrono::milliseconds{16});
	EXPECT_FALSE(parsed->config.enforceSeats);
}

TEST(ServerConfig, AllFlags) {
	const auto parsed = parseArguments({"--port", "9100", "--max-connections", "4", "--tick-ms", "50", "--enforce-seats"});
	ASSERT_TRUE(parsed.has_value());
	EXPECT_EQ(parsed->config.port, 9100u);
	EXPECT_EQ(parsed->config.maxConnections, 4u);
	EXPECT_EQ(parsed->config.tickInterval, std::chrono::milliseconds{50});
	EXPECT_TRUE(parsed->config.enforceSeats);
}

TEST(ServerConfig, Help) {
	const auto parsed = parseArguments({"--help"});
	ASSERT_TRUE(parsed.has_value());
	EXPECT_TRUE(parsed->showHelp);

	const auto text = server::usage("ttt_server");
	EXPECT_NE(text.find("Usage: ttt_server"), std::string::npos);
	EXPECT_NE(text.find("--enforce-seats"), std::string::npos);
}

TEST(ServerConfig, InvalidArguments) {
	EXPECT_FALSE(parseArguments({"--port"}).has_value());
	EXPECT_FALSE(parseArguments({"--port", "65536"}).has_value());
	EXPECT_FALSE(parseArguments({"--port", "-1"}).has_value());
	EXPECT_FALSE(parseArguments({"--port", "90a"}).has_value());
	EXPECT_FALSE(parseArguments({"--max-connections", "0"}).has_value());
	EXPECT_FALSE(parseArguments({"--tick-ms", "0"}).has_value());
	EXPECT_FALSE(parseArguments({"--tick-ms", "10001"}).has_value());
	EXPECT_FALSE(parseArguments({"--verbose"}).has_value());
	EXPECT_FALSE(parseArguments({"9001"}).has_value());
}

TEST(ServerConfig, CollectArguments) {
	const char* argv[] = {"ttt_server", "--port", "9100"};
	const auto args    = server::collectArguments(3, argv);
	ASSERT_EQ(args.size(), 2u);
	EXPECT_EQ(args[0], "--port");
	EXPECT_EQ(args[1], "9100");

	EXPECT_TRUE(server::collectArguments(1, argv).empty());

	// Some launchers start processes without a program name.
	const char* noArgs[] = {nullptr};
	EXPECT_TRUE(server::collectArguments(0, noArgs).empty());
	EXPECT_TRUE(server::collectArguments(0, nullptr).empty());
}

} // namespace ttt::gtest
