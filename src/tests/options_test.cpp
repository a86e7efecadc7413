#include <gtest/gtest.h>
#include <sstream>
#include <string>
#include <vector>
#include "cli/options.hpp"

using namespace gntp::cli;

class OptionsTest : public ::testing::Test {
protected:
    // Parses args as if they followed the program name
    ProgramOptions parse(std::vector<const char*> args) {
        args.insert(args.begin(), "gntpd");
        errors.str("");
        return parse_command_line(static_cast<int>(args.size()), args.data(), errors);
    }

    std::ostringstream errors;
};

TEST_F(OptionsTest, Defaults) {
    const ProgramOptions options = parse({});

    EXPECT_TRUE(options.valid);
    EXPECT_EQ(options.host, "0.0.0.0");
    EXPECT_EQ(options.port, 23053);
    EXPECT_TRUE(options.passwords.empty());
    EXPECT_TRUE(options.store_path.empty());
    EXPECT_FALSE(options.discard_resources);
    EXPECT_EQ(options.memory_limit_mb, 64u);
    EXPECT_TRUE(options.log_file.empty());
    EXPECT_FALSE(options.verbose);
    EXPECT_EQ(options.read_timeout.count(), 0);
    EXPECT_FALSE(options.ignore_unauthorized_notify);
    EXPECT_FALSE(options.show_help);
    EXPECT_TRUE(errors.str().empty());
}

TEST_F(OptionsTest, ShortFlags) {
    const ProgramOptions options = parse({"-h", "127.0.0.1", "-p", "9000", "-k", "one", "-s", "/tmp/res",
                                          "-l", "gntpd.log", "-v"});

    ASSERT_TRUE(options.valid) << errors.str();
    EXPECT_EQ(options.host, "127.0.0.1");
    EXPECT_EQ(options.port, 9000);
    ASSERT_EQ(options.passwords.size(), 1u);
    EXPECT_EQ(options.passwords[0], "one");
    EXPECT_EQ(options.store_path, "/tmp/res");
    EXPECT_EQ(options.log_file, "gntpd.log");
    EXPECT_TRUE(options.verbose);
}

TEST_F(OptionsTest, LongFlags) {
    const ProgramOptions options = parse({"--host", "::1", "--port", "1", "--password", "pw",
                                          "--discard-resources", "--read-timeout", "30",
                                          "--ignore-unauthorized-notify", "--verbose"});

    ASSERT_TRUE(options.valid) << errors.str();
    EXPECT_EQ(options.host, "::1");
    EXPECT_EQ(options.port, 1);
    EXPECT_TRUE(options.discard_resources);
    EXPECT_EQ(options.read_timeout.count(), 30);
    EXPECT_TRUE(options.ignore_unauthorized_notify);
    EXPECT_TRUE(options.verbose);
}

TEST_F(OptionsTest, RepeatedPasswords) {
    const ProgramOptions options = parse({"-k", "first", "--password", "second", "-k", "third"});

    ASSERT_TRUE(options.valid);
    EXPECT_EQ(options.passwords, (std::vector<std::string>{"first", "second", "third"}));
}

TEST_F(OptionsTest, Help) {
    const ProgramOptions options = parse({"--help"});
    EXPECT_TRUE(options.valid);
    EXPECT_TRUE(options.show_help);
}

//==============================================
// INVALID ARGUMENTS
//==============================================

TEST_F(OptionsTest, UnknownArgument) {
    EXPECT_FALSE(parse({"--bogus"}).valid);
    EXPECT_NE(errors.str().find("Unknown argument: --bogus"), std::string::npos);
    EXPECT_NE(errors.str().find("Usage: gntpd"), std::string::npos);
}

TEST_F(OptionsTest, MissingValue) {
    EXPECT_FALSE(parse({"-p"}).valid);
    EXPECT_NE(errors.str().find("Missing value for -p"), std::string::npos);

    EXPECT_FALSE(parse({"-v", "--password"}).valid);
}

TEST_F(OptionsTest, InvalidPort) {
    for (const char* port : {"0", "65536", "-1", "80x", "http"}) {
        EXPECT_FALSE(parse({"-p", port}).valid) << port;
        EXPECT_NE(errors.str().find("Invalid value for -p"), std::string::npos) << port;
    }
    EXPECT_TRUE(parse({"-p", "65535"}).valid);
}

TEST_F(OptionsTest, InvalidReadTimeout) {
    EXPECT_FALSE(parse({"--read-timeout", "-5"}).valid);
    EXPECT_FALSE(parse({"--read-timeout", "86401"}).valid);
    EXPECT_FALSE(parse({"--read-timeout", "soon"}).valid);
    EXPECT_TRUE(parse({"--read-timeout", "86400"}).valid);
}

TEST_F(OptionsTest, MemoryLimit) {
    EXPECT_EQ(parse({"--memory-limit", "8"}).memory_limit_mb, 8u);
    EXPECT_TRUE(parse({"--memory-limit", "65536"}).valid);

    for (const char* limit : {"0", "65537", "-1", "lots"}) {
        EXPECT_FALSE(parse({"--memory-limit", limit}).valid) << limit;
        EXPECT_NE(errors.str().find("Invalid value for --memory-limit"), std::string::npos) << limit;
    }
}

TEST_F(OptionsTest, EmptyHost) {
    EXPECT_FALSE(parse({"-h", ""}).valid);
    EXPECT_NE(errors.str().find("Host must not be empty"), std::string::npos);
}

TEST_F(OptionsTest, StoreConflictsWithDiscard) {
    EXPECT_FALSE(parse({"-s", "/tmp/res", "--discard-resources"}).valid);
    EXPECT_NE(errors.str().find("mutually exclusive"), std::string::npos);
}

TEST(PrintUsageTest, ListsEveryOption) {
    std::ostringstream out;
    print_usage("gntpd", out);

    const std::string usage = out.str();
    for (const char* flag : {"--host", "--port", "--password", "--store", "--discard-resources", "--memory-limit",
                             "--log-file", "--verbose", "--read-timeout", "--ignore-unauthorized-notify", "--help"}) {
        EXPECT_NE(usage.find(flag), std::string::npos) << flag;
    }
    EXPECT_NE(usage.find("23053"), std::string::npos);
}
