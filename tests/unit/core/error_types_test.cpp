#include <gtest/gtest.h>
#include <spdlog/fmt/fmt.h>
#include <spdlog/spdlog.h>

#include <dsm/core/exit_codes.h>
#include <dsm/core/log_level.h>
#include <dsm/core/types.h>

#include "../../common/test_helpers.h"

using namespace dsm;

TEST(ErrorTypesTest, ErrorToStringNamesEveryDomainCode) {
    EXPECT_STREQ(errorToString(ErrorCode::InvalidIdentifier), "Invalid site identifier");
    EXPECT_STREQ(errorToString(ErrorCode::DuplicateSite), "Site already exists");
    EXPECT_STREQ(errorToString(ErrorCode::PortRangeExhausted), "Port range exhausted");
    EXPECT_STREQ(errorToString(ErrorCode::MissingVariable), "Missing template variable");
}

TEST(ErrorTypesTest, FormatterUsesErrorName) {
    EXPECT_EQ(fmt::format("{}", ErrorCode::NotFound), errorToString(ErrorCode::NotFound));
}

TEST(ErrorTypesTest, ResultCarriesValueOrError) {
    Result<int> ok = 42;
    ASSERT_TRUE(ok);
    EXPECT_EQ(ok.value(), 42);

    Result<int> failed = Error{ErrorCode::NotFound, "no such site"};
    ASSERT_FALSE(failed);
    EXPECT_EQ(failed.error().code, ErrorCode::NotFound);
    EXPECT_EQ(failed.error().message, "no such site");

    Result<void> done;
    EXPECT_TRUE(done);
    Result<void> bad = ErrorCode::IOError;
    EXPECT_FALSE(bad);
    EXPECT_TRUE(bad.error() == ErrorCode::IOError);
}

TEST(ExitCodesTest, ValidationErrorsAreUsageErrors) {
    EXPECT_EQ(exitCodeFor(ErrorCode::InvalidIdentifier), exit_code::Usage);
    EXPECT_EQ(exitCodeFor(ErrorCode::DuplicateSite), exit_code::Usage);
    EXPECT_EQ(exitCodeFor(ErrorCode::NotFound), exit_code::Usage);
    EXPECT_EQ(exitCodeFor(ErrorCode::InvalidArgument), exit_code::Usage);
}

TEST(ExitCodesTest, TimeoutsHaveTheirOwnCode) {
    EXPECT_EQ(exitCodeFor(ErrorCode::ProcessStartTimeout), 2);
    EXPECT_EQ(exitCodeFor(ErrorCode::ProcessStopTimeout), 2);
}

TEST(ExitCodesTest, OperationalFailuresExitOne) {
    EXPECT_EQ(exitCodeFor(ErrorCode::Success), 0);
    EXPECT_EQ(exitCodeFor(ErrorCode::DatabaseBootstrapFailed), 1);
    EXPECT_EQ(exitCodeFor(ErrorCode::PortRangeExhausted), 1);
    EXPECT_EQ(exitCodeFor(ErrorCode::MissingVariable), 1);
    EXPECT_EQ(exitCodeFor(ErrorCode::IOError), 1);
}

TEST(LogLevelTest, ParsesNamesCaseInsensitively) {
    EXPECT_TRUE(parseLogLevel("DEBUG") == spdlog::level::debug);
    EXPECT_TRUE(parseLogLevel("warning") == spdlog::level::warn);
    EXPECT_TRUE(parseLogLevel("off") == spdlog::level::off);
    EXPECT_FALSE(parseLogLevel("loud").has_value());
}

TEST(LogLevelTest, EnvironmentWinsOverFlags) {
    dsm::tests::ScopedEnv env("DSM_LOG_LEVEL", "error");
    applyLogLevel(true, "trace");
    EXPECT_EQ(spdlog::get_level(), spdlog::level::err);
}

TEST(LogLevelTest, VerboseMeansDebugOtherwiseWarn) {
    dsm::tests::ScopedEnv env("DSM_LOG_LEVEL", nullptr);
    applyLogLevel(true);
    EXPECT_EQ(spdlog::get_level(), spdlog::level::debug);
    applyLogLevel(false);
    EXPECT_EQ(spdlog::get_level(), spdlog::level::warn);
    applyLogLevel(false, "info");
    EXPECT_EQ(spdlog::get_level(), spdlog::level::info);
}
