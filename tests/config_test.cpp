#include <gtest/gtest.h>

#include <sstream>
#include <string>
#include <vector>

#include "src/config/config.hpp"

namespace {
    config::RunConfig parse(std::vector<std::string> args) {
        args.insert(args.begin(), "volley");
        std::vector<char*> argv;
        argv.reserve(args.size() + 1);
        for (auto& arg : args) {
            argv.push_back(arg.data());
        }
        argv.push_back(nullptr);
        return config::parse_args(static_cast<int>(args.size()), argv.data());
    }
}  // namespace

TEST(ConfigTest, DefaultsAreUsableWithoutFlags) {
    const config::RunConfig cfg = parse({});

    EXPECT_EQ(cfg.url_, "https://postman-echo.com/post");
    EXPECT_EQ(cfg.requests_per_tick_, 10);
    EXPECT_EQ(cfg.duration_s_, 1);
    EXPECT_FALSE(cfg.verbose_);
    EXPECT_NO_THROW(config::validate(cfg));
}

TEST(ConfigTest, ParsesSingleAndDoubleDashFlags) {
    const config::RunConfig cfg = parse({"-url", "http://localhost:9000/post", "--key=abc", "-rqs", "5", "--duration", "3", "-verbose", "--max-inflight=4"});

    EXPECT_EQ(cfg.url_, "http://localhost:9000/post");
    EXPECT_EQ(cfg.api_key_, "abc");
    EXPECT_EQ(cfg.requests_per_tick_, 5);
    EXPECT_EQ(cfg.duration_s_, 3);
    EXPECT_TRUE(cfg.verbose_);
    EXPECT_EQ(cfg.max_inflight_bursts_, 4);
}

TEST(ConfigTest, VerboseAcceptsExplicitBoolean) {
    EXPECT_FALSE(parse({"-verbose=false"}).verbose_);
    EXPECT_TRUE(parse({"-verbose=true"}).verbose_);
    EXPECT_THROW(parse({"-verbose=maybe"}), config::ConfigError);
}

TEST(ConfigTest, RejectsMalformedInput) {
    EXPECT_THROW(parse({"-rqs", "ten"}), config::ConfigError);
    EXPECT_THROW(parse({"-duration", "3s"}), config::ConfigError);
    EXPECT_THROW(parse({"-bogus", "1"}), config::ConfigError);
    EXPECT_THROW(parse({"stray"}), config::ConfigError);
    EXPECT_THROW(parse({"-rqs"}), config::ConfigError);
}

TEST(ConfigTest, ValidateRejectsNonPositiveCounts) {
    EXPECT_THROW(config::validate(parse({"-rqs", "0"})), config::ConfigError);
    EXPECT_THROW(config::validate(parse({"-rqs", "-2"})), config::ConfigError);
    EXPECT_THROW(config::validate(parse({"-duration", "0"})), config::ConfigError);
    EXPECT_THROW(config::validate(parse({"-timeout-ms", "0"})), config::ConfigError);
    EXPECT_THROW(config::validate(parse({"-max-inflight", "0"})), config::ConfigError);
    EXPECT_THROW(config::validate(parse({"-drain-ms", "-1"})), config::ConfigError);
    EXPECT_THROW(config::validate(parse({"-url", ""})), config::ConfigError);
}

TEST(ConfigTest, HelpIsRecognised) {
    EXPECT_TRUE(parse({"--help"}).show_help_);
    EXPECT_NE(config::usage("volley").find("-rqs"), std::string::npos);
}

TEST(ConfigTest, PrintEchoesResolvedFlags) {
    std::ostringstream out;
    config::print(parse({"-rqs", "2", "-key", "k"}), out);

    EXPECT_EQ(out.str(), "url: https://postman-echo.com/post\nkey: k\nrqs: 2\nduration: 1\nverbose: false\n");
}
