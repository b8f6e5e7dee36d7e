#include <gtest/gtest.h>

#include "error.hpp"

#include <string>

using cadbridge::ErrorKind;

TEST(ErrorTaxonomy, WireTagsAreStable) {
    EXPECT_STREQ(cadbridge::type_tag(ErrorKind::InvalidUserInput), "InvalidUserInput");
    EXPECT_STREQ(cadbridge::type_tag(ErrorKind::BadRequest), "BadRequest");
    EXPECT_STREQ(cadbridge::type_tag(ErrorKind::ExecutionError), "FusionExecutionError");
    EXPECT_STREQ(cadbridge::type_tag(ErrorKind::ServerError), "ServerError");
    EXPECT_STREQ(cadbridge::type_tag(ErrorKind::InternalServerError), "InternalServerError");
    EXPECT_STREQ(cadbridge::type_tag(ErrorKind::ConnectionError), "FusionServerConnectionError");
    EXPECT_STREQ(cadbridge::type_tag(ErrorKind::TimeoutError), "FusionServerTimeoutError");
    EXPECT_STREQ(cadbridge::type_tag(ErrorKind::ResponseParseError), "FusionServerResponseError");
    EXPECT_STREQ(cadbridge::type_tag(ErrorKind::RequestError), "FusionServerRequestError");
    EXPECT_STREQ(cadbridge::type_tag(ErrorKind::UnknownError), "UnknownError");
}

TEST(ErrorTaxonomy, ClientErrorsMapTo400AndTheRestTo500) {
    EXPECT_EQ(cadbridge::http_status_for(ErrorKind::InvalidUserInput), 400u);
    EXPECT_EQ(cadbridge::http_status_for(ErrorKind::BadRequest), 400u);
    EXPECT_EQ(cadbridge::http_status_for(ErrorKind::ExecutionError), 500u);
    EXPECT_EQ(cadbridge::http_status_for(ErrorKind::InternalServerError), 500u);
    EXPECT_EQ(cadbridge::http_status_for(ErrorKind::UnknownError), 500u);
}

TEST(ErrorTaxonomy, ExecutionErrorNamesTheAction) {
    cadbridge::Error error = cadbridge::make_execution_error("set_parameter", "boom");
    EXPECT_EQ(error.kind, ErrorKind::ExecutionError);
    EXPECT_EQ(error.action, "set_parameter");
    EXPECT_EQ(error.message, "Error executing action 'set_parameter': boom");
    EXPECT_EQ(cadbridge::to_string(error), "[FusionExecutionError] Error executing action 'set_parameter': boom");
}

TEST(ErrorTaxonomy, ResultHoldsValueOrError) {
    cadbridge::Result<int> ok = 42;
    ASSERT_FALSE(cadbridge::is_error(ok));
    EXPECT_EQ(cadbridge::get_value(ok), 42);

    cadbridge::Result<int> failed = cadbridge::make_invalid_input("nope");
    ASSERT_TRUE(cadbridge::is_error(failed));
    EXPECT_EQ(cadbridge::get_error(failed).kind, ErrorKind::InvalidUserInput);
    EXPECT_EQ(cadbridge::get_error(failed).message, "nope");
}
