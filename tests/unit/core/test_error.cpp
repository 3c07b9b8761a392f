//
// Created by gregorian-rayne on 2/16/26.
//

#include "sbt/error.hpp"

#include <gtest/gtest.h>
#include <sstream>

namespace sbt
{
    TEST(ErrorTest, BasicConstruction) {
        const Error error(ErrorCode::InvalidArgument, "invalid value");

        EXPECT_EQ(error.code(), ErrorCode::InvalidArgument);
        EXPECT_EQ(error.message(), "invalid value");
        EXPECT_FALSE(error.has_context());
    }

    TEST(ErrorTest, ConstructionWithContext) {
        const Error error(ErrorCode::NotFound, "report missing", "/ws/clangScanBuildReports");

        EXPECT_EQ(error.code(), ErrorCode::NotFound);
        EXPECT_TRUE(error.has_context());
        EXPECT_EQ(error.context().value(), "/ws/clangScanBuildReports");
    }

    TEST(ErrorTest, Factories) {
        EXPECT_EQ(Error::invalid_argument("bad").code(), ErrorCode::InvalidArgument);
        EXPECT_EQ(Error::not_found("gone").code(), ErrorCode::NotFound);
        EXPECT_EQ(Error::parse_error("bad json").code(), ErrorCode::ParseError);
        EXPECT_EQ(Error::io_error("write failed").code(), ErrorCode::IoError);
        EXPECT_EQ(Error::config_error("bad key").code(), ErrorCode::ConfigError);
        EXPECT_EQ(Error::internal_error("oops").code(), ErrorCode::InternalError);

        const auto with_ctx = Error::config_error("negative", "bug_threshold");
        EXPECT_EQ(with_ctx.context().value(), "bug_threshold");
    }

    TEST(ErrorTest, WithContextAppends) {
        const auto error = Error::io_error("copy failed");
        const auto with_ctx = error.with_context("run 3");

        EXPECT_FALSE(error.has_context());
        EXPECT_EQ(with_ctx.context().value(), "run 3");

        const auto more_ctx = with_ctx.with_context("bugSummary.json");
        EXPECT_EQ(more_ctx.context().value(), "run 3; bugSummary.json");
    }

    TEST(ErrorTest, ToString) {
        EXPECT_EQ(Error::parse_error("invalid syntax").to_string(), "[ParseError] invalid syntax");
        EXPECT_EQ(Error::io_error("open failed", "/tmp/a.json").to_string(),
                  "[IoError] open failed (context: /tmp/a.json)");
    }

    TEST(ErrorTest, StreamOutput) {
        std::ostringstream oss;
        oss << Error::not_found("missing", "key") << " / " << ErrorCode::ConfigError;
        EXPECT_EQ(oss.str(), "[NotFound] missing (context: key) / ConfigError");
    }

    TEST(ErrorTest, ErrorCodeToString) {
        EXPECT_STREQ(error_code_to_string(ErrorCode::None), "None");
        EXPECT_STREQ(error_code_to_string(ErrorCode::InvalidArgument), "InvalidArgument");
        EXPECT_STREQ(error_code_to_string(ErrorCode::NotFound), "NotFound");
        EXPECT_STREQ(error_code_to_string(ErrorCode::ParseError), "ParseError");
        EXPECT_STREQ(error_code_to_string(ErrorCode::IoError), "IoError");
        EXPECT_STREQ(error_code_to_string(ErrorCode::ConfigError), "ConfigError");
        EXPECT_STREQ(error_code_to_string(ErrorCode::InternalError), "InternalError");
    }

    TEST(ErrorTest, Equality) {
        const auto e1 = Error::not_found("missing", "key");
        const auto e2 = Error::not_found("missing", "key");
        const auto e3 = Error::not_found("missing", "other");
        const auto e4 = Error::io_error("missing", "key");

        EXPECT_EQ(e1, e2);
        EXPECT_NE(e1, e3);
        EXPECT_NE(e1, e4);
    }

}  // namespace sbt
