/**
 * @file DaemonOptionsTest.cpp
 * @brief Unit tests for drivewatchd option parsing and logging setup
 */

#include <gtest/gtest.h>

#include "daemon/DaemonOptions.hpp"
#include "services/PersistenceLayer.hpp"

#include <string>
#include <vector>

namespace {

// GOptionContext rewrites argc/argv in place, so the strings must be mutable
class Argv {
public:
    explicit Argv(std::vector<std::string> args) : storage_(std::move(args)) {
        for (auto& arg : storage_) {
            pointers_.push_back(arg.data());
        }
        pointers_.push_back(nullptr);
        argc_ = static_cast<int>(storage_.size());
        argv_ = pointers_.data();
    }

    auto parse() -> util::Result<DaemonOptions> { return parse_daemon_options(argc_, argv_); }

    [[nodiscard]] auto argc() const -> int { return argc_; }

private:
    std::vector<std::string> storage_;
    std::vector<char*> pointers_;
    int argc_ = 0;
    char** argv_ = nullptr;
};

}  // namespace

// ============================================================================
// Parsing
// ============================================================================

TEST(DaemonOptionsTest, Parse_DefaultsWithoutArguments) {
    Argv args({"drivewatchd"});
    auto options = args.parse();

    ASSERT_TRUE(options.has_value());
    EXPECT_FALSE(options->config_path.has_value());
    EXPECT_FALSE(options->data_dir.has_value());
    EXPECT_FALSE(options->verbose);
    EXPECT_FALSE(options->system_bus);
}

TEST(DaemonOptionsTest, Parse_ShortAndLongForms) {
    Argv args({"drivewatchd", "-c", "/etc/drivewatch.conf", "--data-dir", "/var/lib/drivewatch",
               "-v", "--system"});
    auto options = args.parse();

    ASSERT_TRUE(options.has_value());
    EXPECT_EQ(options->config_path, std::filesystem::path{"/etc/drivewatch.conf"});
    EXPECT_EQ(options->data_dir, std::filesystem::path{"/var/lib/drivewatch"});
    EXPECT_TRUE(options->verbose);
    EXPECT_TRUE(options->system_bus);
    EXPECT_EQ(args.argc(), 1);
}

TEST(DaemonOptionsTest, Parse_UnknownOptionIsInvalid) {
    Argv args({"drivewatchd", "--frobnicate"});
    auto options = args.parse();

    ASSERT_FALSE(options.has_value());
    EXPECT_EQ(options.error().kind, util::ErrorKind::InvalidArgument);
    EXPECT_FALSE(options.error().message.empty());
}

// ============================================================================
// Logging setup
// ============================================================================

// Test: stderr mirroring follows --verbose when the log file is writable
TEST(DaemonOptionsTest, LogSetup_ConsoleOnlyWhenVerbose) {
    DaemonOptions quiet;
    auto setup = log_setup_for(quiet, true);
    EXPECT_FALSE(setup.console);
    EXPECT_EQ(setup.level, util::LogLevel::INFO);

    DaemonOptions verbose;
    verbose.verbose = true;
    setup = log_setup_for(verbose, true);
    EXPECT_TRUE(setup.console);
    EXPECT_EQ(setup.level, util::LogLevel::DEBUG);
}

TEST(DaemonOptionsTest, LogSetup_ConsoleWhenNoLogFile) {
    auto setup = log_setup_for(DaemonOptions{}, false);
    EXPECT_TRUE(setup.console);
    EXPECT_EQ(setup.level, util::LogLevel::INFO);
}

// ============================================================================
// Data directory
// ============================================================================

TEST(DaemonOptionsTest, ResolveDataDir_Precedence) {
    Config config;
    config.general.data_dir = "/srv/drivewatch";

    DaemonOptions options;
    options.data_dir = std::filesystem::path{"/tmp/override"};
    EXPECT_EQ(resolve_data_dir(options, config), std::filesystem::path{"/tmp/override"});

    EXPECT_EQ(resolve_data_dir(DaemonOptions{}, config), std::filesystem::path{"/srv/drivewatch"});

    config.general.data_dir.clear();
    EXPECT_EQ(resolve_data_dir(DaemonOptions{}, config), PersistenceLayer::default_data_dir());
}
