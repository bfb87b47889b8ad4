/**
 * @file test_export.cpp
 * @brief Unit tests for JSON / TOML snapshots (GoogleTest)
 *
 * @copyright (c) 2026. MIT License.
 */

#include <gtest/gtest.h>

#include "envflag/Export.hpp"
#include "envflag/FlagSet.hpp"

#include <chrono>
#include <cstdlib>
#include <limits>

using namespace envflag;
using namespace std::chrono_literals;
using nlohmann::json;

namespace {

struct Sample {
    bool verbose = false;
    std::int64_t port = 0;
    std::uint64_t big = 0;
    double ratio = 0;
    Duration timeout{};
    std::string name;
    StringList hosts;
};

void register_sample(FlagSet& flags, Sample& s) {
    flags.var(s.verbose, "verbose", true, "verbose", kNoEnv);
    flags.var(s.port, "port", 8080, "port", kNoEnv);
    flags.var(s.big, "big", 1, "big", kNoEnv);
    flags.var(s.ratio, "ratio", 0.5, "ratio", kNoEnv);
    flags.var(s.timeout, "timeout", 90s, "timeout", kNoEnv);
    flags.var(s.name, "name", "svc", "name", kNoEnv);
    flags.var(s.hosts, "hosts", "a, b", "hosts", kNoEnv);
}

} // namespace

TEST(ExportJson, NativeTypes) {
    Sample s;
    FlagSet flags("test", ErrorHandling::PanicOnError);
    register_sample(flags, s);
    ASSERT_TRUE(flags.parse({"--port", "9090"}));

    json j = to_json(flags);
    EXPECT_EQ(j["verbose"], true);
    EXPECT_EQ(j["port"], 9090);
    EXPECT_EQ(j["big"], 1u);
    EXPECT_DOUBLE_EQ(j["ratio"].get<double>(), 0.5);
    EXPECT_EQ(j["timeout"], "1m30s");
    EXPECT_EQ(j["name"], "svc");
    EXPECT_EQ(j["hosts"], json::array({"a", "b"}));
}

TEST(ExportJson, DescribeReportsSources) {
    setenv("DESCRIBE_LEVEL", "3", 1);

    std::int64_t level = 0;
    std::string mode;
    std::string secret;
    FlagSet flags("test", ErrorHandling::PanicOnError);
    flags.var(level, "level", 1, "Log level");
    flags.var(mode, "mode", "fast", "Mode");
    flags.var(secret, "secret", "", "Secret", kNoEnv);
    flags.set_prefix("describe");
    ASSERT_TRUE(flags.parse({"--mode", "slow"}));

    json d = describe(flags);
    EXPECT_EQ(d["level"]["type"], "int64");
    EXPECT_EQ(d["level"]["value"], 3);
    EXPECT_EQ(d["level"]["default"], "1");
    EXPECT_EQ(d["level"]["source"], "environment");
    EXPECT_EQ(d["level"]["env"], "DESCRIBE_LEVEL");
    EXPECT_EQ(d["level"]["usage"], "Log level");

    EXPECT_EQ(d["mode"]["source"], "command-line");
    EXPECT_TRUE(d["mode"]["env"].is_null());

    EXPECT_EQ(d["secret"]["source"], "default");
    EXPECT_TRUE(d["secret"]["env"].is_null());

    unsetenv("DESCRIBE_LEVEL");
}

TEST(ExportToml, Table) {
    Sample s;
    FlagSet flags("test", ErrorHandling::PanicOnError);
    register_sample(flags, s);
    ASSERT_TRUE(flags.parse({"--name", "api"}));

    toml::table tbl = to_toml(flags);
    EXPECT_EQ(tbl["verbose"].value<bool>(), true);
    EXPECT_EQ(tbl["port"].value<std::int64_t>(), 8080);
    EXPECT_EQ(tbl["timeout"].value<std::string>(), "1m30s");
    EXPECT_EQ(tbl["name"].value<std::string>(), "api");
    ASSERT_NE(tbl["hosts"].as_array(), nullptr);
    EXPECT_EQ(tbl["hosts"].as_array()->size(), 2u);

    const std::string text = to_toml_string(flags);
    EXPECT_NE(text.find("name = "), std::string::npos);
    EXPECT_NE(text.find("api"), std::string::npos);
}

TEST(ExportToml, HugeUnsignedBecomesFloat) {
    std::uint64_t big = 0;
    FlagSet flags("test", ErrorHandling::PanicOnError);
    flags.var(big, "big", std::numeric_limits<std::uint64_t>::max(), "big", kNoEnv);
    ASSERT_TRUE(flags.parse(std::vector<std::string>{}));

    toml::table tbl = to_toml(flags);
    EXPECT_TRUE(tbl["big"].is_floating_point());
}
