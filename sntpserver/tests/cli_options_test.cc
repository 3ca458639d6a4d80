// Copyright (c) 2025 The SNTP Server Authors
/**
 * @file cli_options_test.cc
 * @brief Command line parsing of the example server.
 */
#include "cli_options.hpp"

#include <gtest/gtest.h>

#include <chrono>
#include <string>
#include <vector>

namespace sntpserver_example {
namespace {

bool Parse(std::vector<const char*> args, CliOptions* opts,
           std::string* error) {
  args.insert(args.begin(), "sntpserver_example");
  return ParseCommandLine(static_cast<int>(args.size()), args.data(), opts,
                          error);
}

}  // namespace

TEST(CliOptionsTest, DefaultsWithoutArguments) {
  CliOptions opts;
  std::string error;
  ASSERT_TRUE(Parse({}, &opts, &error));
  EXPECT_EQ(opts.host, "");
  EXPECT_EQ(opts.port, 123);
  EXPECT_EQ(opts.min_interval, std::chrono::seconds(10));
  EXPECT_EQ(opts.max_clients, 10000u);
  EXPECT_EQ(opts.client_ttl, std::chrono::hours(24));
  EXPECT_FALSE(opts.debug);
  EXPECT_FALSE(opts.show_help);
}

TEST(CliOptionsTest, ParsesAllOptions) {
  CliOptions opts;
  std::string error;
  ASSERT_TRUE(Parse({"--host", "::1", "--port", "12300", "--min-interval",
                     "0.5", "--max-clients", "0", "--client-ttl", "60",
                     "--debug"},
                    &opts, &error))
      << error;
  EXPECT_EQ(opts.host, "::1");
  EXPECT_EQ(opts.port, 12300);
  EXPECT_EQ(opts.min_interval, std::chrono::milliseconds(500));
  EXPECT_EQ(opts.max_clients, 0u);
  EXPECT_EQ(opts.client_ttl, std::chrono::seconds(60));
  EXPECT_TRUE(opts.debug);
}

/**
 * @test CliOptionsTest.RejectsOutOfRangePort
 * @brief Port values that do not fit 16 bits or are not numbers fail
 *        instead of wrapping to another port.
 */
TEST(CliOptionsTest, RejectsOutOfRangePort) {
  for (const char* bad : {"70000", "65536", "-1", "abc", "12x", ""}) {
    CliOptions opts;
    std::string error;
    EXPECT_FALSE(Parse({"--port", bad}, &opts, &error)) << bad;
    EXPECT_NE(error.find("--port"), std::string::npos);
    EXPECT_EQ(opts.port, 123);
  }
  CliOptions opts;
  std::string error;
  EXPECT_TRUE(Parse({"--port", "65535"}, &opts, &error));
  EXPECT_EQ(opts.port, 65535);
}

TEST(CliOptionsTest, RejectsDurationsThatWouldOverflow) {
  for (const char* bad : {"1e300", "inf", "nan", "-1", "1e10", "ten"}) {
    CliOptions opts;
    std::string error;
    EXPECT_FALSE(Parse({"--min-interval", bad}, &opts, &error)) << bad;
    EXPECT_FALSE(Parse({"--client-ttl", bad}, &opts, &error)) << bad;
  }
  CliOptions opts;
  std::string error;
  ASSERT_TRUE(Parse({"--client-ttl", "1e9"}, &opts, &error));
  EXPECT_EQ(opts.client_ttl, std::chrono::seconds(1000000000));
}

TEST(CliOptionsTest, RejectsNegativeOrMalformedClientCount) {
  for (const char* bad : {"-5", "1.5", "many"}) {
    CliOptions opts;
    std::string error;
    EXPECT_FALSE(Parse({"--max-clients", bad}, &opts, &error)) << bad;
  }
}

TEST(CliOptionsTest, UnknownOptionAndMissingValue) {
  CliOptions opts;
  std::string error;
  EXPECT_FALSE(Parse({"--verbose"}, &opts, &error));
  EXPECT_NE(error.find("unknown option"), std::string::npos);

  EXPECT_FALSE(Parse({"--port"}, &opts, &error));
  EXPECT_NE(error.find("missing value"), std::string::npos);
}

TEST(CliOptionsTest, HelpFlag) {
  CliOptions opts;
  std::string error;
  ASSERT_TRUE(Parse({"-h"}, &opts, &error));
  EXPECT_TRUE(opts.show_help);
}

}  // namespace sntpserver_example
