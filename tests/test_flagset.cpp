/**
 * @file test_flagset.cpp
 * @brief Unit tests for FlagSet registration, parsing and re-resolution (GoogleTest)
 *
 * @copyright (c) 2026. MIT License.
 */

#include <gtest/gtest.h>

#include "envflag/Errors.hpp"
#include "envflag/FlagSet.hpp"

#include <chrono>
#include <cstdlib>
#include <string>
#include <vector>

using namespace envflag;
using namespace std::chrono_literals;

// ============================================================================
// Test Utilities
// ============================================================================

/**
 * @brief RAII wrapper for environment variable
 */
class EnvGuard {
public:
    EnvGuard(const std::string& name, const std::string& value)
        : name_(name), had_value_(false) {
        const char* old = std::getenv(name.c_str());
        if (old) {
            old_value_ = old;
            had_value_ = true;
        }
        setenv(name.c_str(), value.c_str(), 1);
    }

    ~EnvGuard() {
        if (had_value_) {
            setenv(name_.c_str(), old_value_.c_str(), 1);
        } else {
            unsetenv(name_.c_str());
        }
    }

    void set(const std::string& value) {
        setenv(name_.c_str(), value.c_str(), 1);
    }

private:
    std::string name_;
    std::string old_value_;
    bool had_value_;
};

const std::vector<std::string> kNoArgs;

// ============================================================================
// Registration
// ============================================================================

TEST(FlagSetRegister, InitializesStorageToDefault) {
    bool b = true;
    std::int64_t i = 99;
    std::uint64_t u = 99;
    double d = 9.9;
    Duration t = 99s;
    std::string s = "junk";
    StringList l;

    FlagSet flags("test", ErrorHandling::PanicOnError);
    flags.var(b, "enabled", false, "bool");
    flags.var(i, "int", -3, "int");
    flags.var(u, "uint", 7, "uint");
    flags.var(d, "ratio", 0.25, "double");
    flags.var(t, "timeout", 1500ms, "duration");
    flags.var(s, "name", "default", "string");
    flags.var(l, "hosts", "a,b", "list");

    EXPECT_FALSE(b);
    EXPECT_EQ(i, -3);
    EXPECT_EQ(u, 7u);
    EXPECT_DOUBLE_EQ(d, 0.25);
    EXPECT_EQ(t, 1500ms);
    EXPECT_EQ(s, "default");
    EXPECT_EQ(l.raw(), "a,b");
    EXPECT_TRUE(l.value().empty());

    EXPECT_EQ(flags.flags().size(), 7u);
    EXPECT_EQ(flags.lookup("timeout")->type(), FlagType::Duration);
    EXPECT_EQ(flags.lookup("timeout")->default_text(), "1.5s");
    EXPECT_EQ(flags.lookup("enabled")->default_text(), "false");
}

TEST(FlagSetRegister, EnvDirectives) {
    std::string a, b, c;
    FlagSet flags("test");
    flags.var(a, "alpha", "", "auto");
    flags.var(b, "beta", "", "explicit", "my_beta");
    flags.var(c, "gamma", "", "suppressed", kNoEnv);

    EXPECT_EQ(flags.lookup("alpha")->env_directive().policy, EnvPolicy::Auto);
    EXPECT_EQ(flags.lookup("beta")->env_directive().policy, EnvPolicy::Explicit);
    EXPECT_EQ(flags.lookup("beta")->env_directive().name, "MY_BETA");
    EXPECT_EQ(flags.lookup("gamma")->env_directive().policy, EnvPolicy::Suppressed);
}

TEST(FlagSetRegister, DuplicateNameRejected) {
    std::int64_t first = 0;
    std::int64_t second = 5;
    FlagSet flags("test");
    flags.var(first, "count", 1, "count");

    EXPECT_THROW(flags.var(second, "count", 2, "again"), DuplicateFlagError);
    EXPECT_EQ(second, 5);
    EXPECT_EQ(flags.flags().size(), 1u);
}

TEST(FlagSetRegister, EmptyNameRejected) {
    bool b = false;
    FlagSet flags("test");
    EXPECT_THROW(flags.var(b, "", false, "nameless"), RegistrationError);
}

TEST(FlagSetRegister, RegistrationAfterParseRejected) {
    bool a = false;
    bool b = false;
    FlagSet flags("test", ErrorHandling::PanicOnError);
    flags.var(a, "early", false, "early");
    ASSERT_TRUE(flags.parse(kNoArgs));

    EXPECT_THROW(flags.var(b, "late", false, "late"), RegistrationError);
}

TEST(FlagSetRegister, LookupUnknown) {
    FlagSet flags("test");
    EXPECT_EQ(flags.lookup("missing"), nullptr);
}

// ============================================================================
// Command line
// ============================================================================

TEST(FlagSetParse, LongAndSingleDashForms) {
    std::int64_t port = 0;
    std::string host;
    bool verbose = false;
    double ratio = 0;

    FlagSet flags("test", ErrorHandling::PanicOnError);
    flags.var(port, "port", 80, "port", kNoEnv);
    flags.var(host, "host", "localhost", "host", kNoEnv);
    flags.var(verbose, "verbose", false, "verbose", kNoEnv);
    flags.var(ratio, "ratio", 0.5, "ratio", kNoEnv);

    ASSERT_TRUE(flags.parse({"-port", "8080", "--host=example.org", "-verbose", "-ratio=0.75"}));
    EXPECT_EQ(port, 8080);
    EXPECT_EQ(host, "example.org");
    EXPECT_TRUE(verbose);
    EXPECT_DOUBLE_EQ(ratio, 0.75);
    EXPECT_TRUE(flags.lookup("port")->changed());
    EXPECT_EQ(flags.lookup("host")->source(), ValueSource::CommandLine);
    EXPECT_TRUE(flags.parsed());
}

TEST(FlagSetParse, BoolDefaultTrueStaysTrue) {
    bool color = false;
    FlagSet flags("test", ErrorHandling::PanicOnError);
    flags.var(color, "color", true, "color", kNoEnv);

    ASSERT_TRUE(flags.parse(kNoArgs));
    EXPECT_TRUE(color);
    EXPECT_FALSE(flags.lookup("color")->changed());
}

TEST(FlagSetParse, BoolExplicitFalse) {
    bool color = true;
    FlagSet flags("test", ErrorHandling::PanicOnError);
    flags.var(color, "color", true, "color", kNoEnv);

    ASSERT_TRUE(flags.parse({"--color=false"}));
    EXPECT_FALSE(color);
}

TEST(FlagSetParse, DurationFromCommandLine) {
    Duration timeout{};
    FlagSet flags("test", ErrorHandling::PanicOnError);
    flags.var(timeout, "timeout", 5s, "timeout", kNoEnv);

    ASSERT_TRUE(flags.parse({"-timeout", "1h30m"}));
    EXPECT_EQ(timeout, 90min);
}

TEST(FlagSetParse, BadDurationFromCommandLine) {
    Duration timeout{};
    FlagSet flags("test", ErrorHandling::ContinueOnError);
    flags.var(timeout, "timeout", 5s, "timeout", kNoEnv);

    EXPECT_FALSE(flags.parse({"--timeout", "soon"}));
    EXPECT_NE(flags.error().find("soon"), std::string::npos);
    EXPECT_EQ(timeout, 5s);
}

TEST(FlagSetParse, BadDurationLeavesEveryFlagUnset) {
    std::int64_t port = 0;
    Duration timeout{};
    FlagSet flags("test", ErrorHandling::ContinueOnError);
    flags.var(port, "port", 80, "port", kNoEnv);
    flags.var(timeout, "timeout", 5s, "timeout", kNoEnv);

    EXPECT_FALSE(flags.parse({"--port", "7000", "--timeout", "soon"}));
    EXPECT_EQ(port, 80);
    EXPECT_EQ(timeout, 5s);
    for (const char* name : {"port", "timeout"}) {
        EXPECT_FALSE(flags.lookup(name)->changed()) << name;
        EXPECT_EQ(flags.lookup(name)->source(), ValueSource::Default) << name;
    }
}

TEST(FlagSetParse, BoolAcceptsEnvironmentSpellings) {
    bool verbose = false;
    bool color = true;
    FlagSet flags("test", ErrorHandling::PanicOnError);
    flags.var(verbose, "verbose", false, "verbose", kNoEnv);
    flags.var(color, "color", true, "color", kNoEnv);

    ASSERT_TRUE(flags.parse({"--verbose=TRUE", "-color=F"}));
    EXPECT_TRUE(verbose);
    EXPECT_FALSE(color);
}

TEST(FlagSetParse, ValueTokenMayLookLikeAFlag) {
    std::string label;
    std::string mode;
    std::int64_t count = 1;
    FlagSet flags("test", ErrorHandling::PanicOnError);
    flags.var(label, "label", "", "label", kNoEnv);
    flags.var(mode, "mode", "", "mode", kNoEnv);
    flags.var(count, "count", 1, "count", kNoEnv);

    ASSERT_TRUE(flags.parse({"--label", "-h", "-mode", "-count"}));
    EXPECT_EQ(label, "-h");
    EXPECT_EQ(mode, "-count");
    EXPECT_EQ(count, 1);
    EXPECT_FALSE(flags.lookup("count")->changed());
}

TEST(FlagSetParse, StringListFromCommandLine) {
    StringList hosts;
    FlagSet flags("test", ErrorHandling::PanicOnError);
    flags.var(hosts, "hosts", "x", "hosts", kNoEnv);

    ASSERT_TRUE(flags.parse({"--hosts", "a, b ,c"}));
    EXPECT_EQ(hosts.value(), (std::vector<std::string>{"a", "b", "c"}));
    EXPECT_EQ(hosts.raw(), "a, b ,c");
}

TEST(FlagSetParse, StringListDefaultMaterialized) {
    StringList hosts;
    FlagSet flags("test", ErrorHandling::PanicOnError);
    flags.var(hosts, "hosts", "x,y", "hosts", kNoEnv);

    ASSERT_TRUE(flags.parse(kNoArgs));
    EXPECT_EQ(hosts.value(), (std::vector<std::string>{"x", "y"}));
}

TEST(FlagSetParse, PositionalArgumentsKept) {
    bool verbose = false;
    FlagSet flags("test", ErrorHandling::PanicOnError);
    flags.var(verbose, "verbose", false, "verbose", kNoEnv);

    ASSERT_TRUE(flags.parse({"--verbose", "input.txt", "--", "-x"}));
    EXPECT_TRUE(verbose);
    EXPECT_EQ(flags.args(), (std::vector<std::string>{"input.txt", "-x"}));
}

TEST(FlagSetParse, ArgcArgvSkipsProgramName) {
    std::int64_t n = 0;
    FlagSet flags("prog", ErrorHandling::PanicOnError);
    flags.var(n, "count", 1, "count", kNoEnv);

    const char* argv[] = {"prog", "-count", "3"};
    ASSERT_TRUE(flags.parse(3, argv));
    EXPECT_EQ(n, 3);
}

TEST(FlagSetParse, ParseTwiceRejected) {
    FlagSet flags("test", ErrorHandling::PanicOnError);
    ASSERT_TRUE(flags.parse(kNoArgs));
    EXPECT_THROW(flags.parse(kNoArgs), ParseStateError);
}

// ============================================================================
// Error handling policies
// ============================================================================

TEST(FlagSetErrors, ContinueOnErrorReturnsFalse) {
    std::int64_t n = 1;
    FlagSet flags("test", ErrorHandling::ContinueOnError);
    flags.var(n, "number", 1, "number", kNoEnv);

    EXPECT_FALSE(flags.parse({"--number", "abc"}));
    EXPECT_FALSE(flags.error().empty());
}

TEST(FlagSetErrors, UnknownFlagContinue) {
    FlagSet flags("test", ErrorHandling::ContinueOnError);
    EXPECT_FALSE(flags.parse({"--nope"}));
    EXPECT_FALSE(flags.error().empty());
}

TEST(FlagSetErrors, RejectedCommandLineRestoresValues) {
    EnvGuard env("PARTIAL_PORT", "9000");
    std::int64_t port = 0;
    std::string host;
    FlagSet flags("test", ErrorHandling::ContinueOnError);
    flags.set_prefix("partial");
    flags.var(port, "port", 80, "port");
    flags.var(host, "host", "localhost", "host", kNoEnv);

    EXPECT_FALSE(flags.parse({"--port", "7000", "--host", "db", "--nope"}));
    EXPECT_EQ(port, 80);
    EXPECT_EQ(host, "localhost");
    EXPECT_FALSE(flags.lookup("port")->changed());
    EXPECT_EQ(flags.lookup("port")->source(), ValueSource::Default);

    int visited = 0;
    flags.visit([&visited](const Flag&) { ++visited; });
    EXPECT_EQ(visited, 0);

    flags.reparse();
    EXPECT_EQ(port, 9000);
    EXPECT_EQ(flags.lookup("port")->source(), ValueSource::Environment);
    EXPECT_EQ(host, "localhost");
}

TEST(FlagSetErrors, PanicOnErrorThrows) {
    std::int64_t n = 1;
    FlagSet flags("test", ErrorHandling::PanicOnError);
    flags.var(n, "number", 1, "number", kNoEnv);

    EXPECT_THROW(flags.parse({"--number", "abc"}), ArgumentParseError);
}

TEST(FlagSetErrors, ExitOnErrorExits) {
    EXPECT_EXIT({
        FlagSet flags("test", ErrorHandling::ExitOnError);
        flags.parse({"--nope"});
    }, ::testing::ExitedWithCode(2), "");
}

TEST(FlagSetErrors, HelpContinue) {
    bool v = false;
    FlagSet flags("test", ErrorHandling::ContinueOnError);
    flags.var(v, "verbose", false, "Print more", kNoEnv);

    EXPECT_FALSE(flags.parse({"-help"}));
    EXPECT_EQ(flags.error(), "help requested");
}

TEST(FlagSetErrors, HelpPanicCarriesUsage) {
    bool v = false;
    FlagSet flags("test", ErrorHandling::PanicOnError);
    flags.var(v, "verbose", false, "Print more", kNoEnv);

    try {
        flags.parse({"--help"});
        FAIL() << "expected HelpRequested";
    } catch (const HelpRequested& e) {
        EXPECT_NE(e.usage().find("verbose"), std::string::npos);
    }
}

TEST(FlagSetErrors, HelpExitsZero) {
    EXPECT_EXIT({
        FlagSet flags("test", ErrorHandling::ExitOnError);
        flags.parse({"-h"});
    }, ::testing::ExitedWithCode(0), "");
}

TEST(FlagSetErrors, UserDefinedHelpFlagWins) {
    bool help = false;
    FlagSet flags("test", ErrorHandling::PanicOnError);
    flags.var(help, "help", false, "custom help", kNoEnv);

    ASSERT_TRUE(flags.parse({"--help"}));
    EXPECT_TRUE(help);
}

TEST(FlagSetErrors, EnvCoercionIgnoresPolicy) {
    EnvGuard env("RATIO", "half");
    double ratio = 0.5;
    FlagSet flags("test", ErrorHandling::ContinueOnError);
    flags.var(ratio, "ratio", 0.5, "ratio");

    EXPECT_THROW(flags.parse(kNoArgs), EnvCoercionError);
}

// ============================================================================
// Re-resolution
// ============================================================================

TEST(FlagSetReparse, PicksUpEnvironmentChanges) {
    EnvGuard env("TEST_LEVEL", "1");
    std::int64_t level = 0;
    FlagSet flags("test", ErrorHandling::PanicOnError);
    flags.var(level, "level", 0, "level", "TEST_LEVEL");

    ASSERT_TRUE(flags.parse(kNoArgs));
    EXPECT_EQ(level, 1);

    env.set("2");
    flags.reparse();
    EXPECT_EQ(level, 2);
}

TEST(FlagSetReparse, CommandLineStaysPinned) {
    EnvGuard env("TEST_LEVEL", "1");
    std::int64_t level = 0;
    FlagSet flags("test", ErrorHandling::PanicOnError);
    flags.var(level, "level", 0, "level", "TEST_LEVEL");

    ASSERT_TRUE(flags.parse({"--level", "9"}));
    env.set("2");
    flags.reparse();

    EXPECT_EQ(level, 9);
    EXPECT_TRUE(flags.lookup("level")->changed());
}

TEST(FlagSetReparse, RemovedVariableKeepsLastValue) {
    std::string mode;
    FlagSet flags("test", ErrorHandling::PanicOnError);
    flags.var(mode, "mode", "default", "mode");
    {
        EnvGuard env("MODE", "fast");
        ASSERT_TRUE(flags.parse(kNoArgs));
        EXPECT_EQ(mode, "fast");
    }
    flags.reparse();
    EXPECT_EQ(mode, "fast");
}

TEST(FlagSetReparse, NewPrefixAppliesWithoutDoublePrefix) {
    EnvGuard first("ONE_SIZE", "1");
    EnvGuard second("TWO_SIZE", "2");
    std::int64_t size = 0;
    FlagSet flags("test", ErrorHandling::PanicOnError);
    flags.var(size, "size", 0, "size");
    flags.set_prefix("one");

    ASSERT_TRUE(flags.parse(kNoArgs));
    EXPECT_EQ(size, 1);
    EXPECT_EQ(flags.lookup("size")->env_name(), "ONE_SIZE");

    flags.set_prefix("two");
    EXPECT_EQ(flags.lookup("size")->env_name(), "ONE_SIZE");
    flags.reparse();
    EXPECT_EQ(size, 2);
    EXPECT_EQ(flags.lookup("size")->env_name(), "TWO_SIZE");

    flags.reparse();
    EXPECT_EQ(flags.lookup("size")->env_name(), "TWO_SIZE");
}

TEST(FlagSetReparse, ListRematerialized) {
    EnvGuard env("TAGS", "a,b");
    StringList tags;
    FlagSet flags("test", ErrorHandling::PanicOnError);
    flags.var(tags, "tags", "", "tags");

    ASSERT_TRUE(flags.parse(kNoArgs));
    EXPECT_EQ(tags.value(), (std::vector<std::string>{"a", "b"}));

    env.set(" c ");
    flags.reparse();
    EXPECT_EQ(tags.value(), (std::vector<std::string>{"c"}));
}

TEST(FlagSetReparse, BeforeParseResolvesEnvironment) {
    EnvGuard env("EARLY", "true");
    bool early = false;
    FlagSet flags("test", ErrorHandling::PanicOnError);
    flags.var(early, "early", false, "early");

    flags.reparse();
    EXPECT_TRUE(early);
    EXPECT_FALSE(flags.parsed());
}

// ============================================================================
// Visiting
// ============================================================================

TEST(FlagSetVisit, OnlySetFlags) {
    EnvGuard env("FROM_ENV", "x");
    std::string from_env, from_cli, untouched;
    FlagSet flags("test", ErrorHandling::PanicOnError);
    flags.var(from_env, "fromEnv", "", "env");
    flags.var(from_cli, "fromCli", "", "cli", kNoEnv);
    flags.var(untouched, "untouched", "", "none", kNoEnv);

    ASSERT_TRUE(flags.parse({"--fromCli", "y"}));

    std::vector<std::string> seen;
    flags.visit([&seen](const Flag& f) { seen.push_back(f.name()); });
    EXPECT_EQ(seen, (std::vector<std::string>{"fromEnv", "fromCli"}));

    std::vector<std::string> all;
    flags.visit_all([&all](const Flag& f) { all.push_back(f.name()); });
    EXPECT_EQ(all.size(), 3u);
}
