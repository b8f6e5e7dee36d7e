#include <gtest/gtest.h>

#include "json_codec.hpp"

#include <string>

using cadbridge::codec::decode_params;

TEST(JsonCodec, EmptyBodyDecodesToEmptyObject) {
    for (const std::string body : {"", "   ", "\r\n"}) {
        auto params = decode_params(body);
        ASSERT_FALSE(cadbridge::is_error(params)) << "body: '" << body << "'";
        EXPECT_TRUE(cadbridge::get_value(params).is_object());
        EXPECT_TRUE(cadbridge::get_value(params).empty());
    }
}

TEST(JsonCodec, MalformedBodyIsBadRequest) {
    auto params = decode_params("{\"code\": ");
    ASSERT_TRUE(cadbridge::is_error(params));
    const auto& error = cadbridge::get_error(params);
    EXPECT_EQ(error.kind, cadbridge::ErrorKind::BadRequest);
    EXPECT_EQ(error.message.rfind("Invalid JSON format: ", 0), 0u) << error.message;
}

TEST(JsonCodec, NonObjectBodyIsBadRequest) {
    auto params = decode_params("[1, 2, 3]");
    ASSERT_TRUE(cadbridge::is_error(params));
    EXPECT_EQ(cadbridge::get_error(params).kind, cadbridge::ErrorKind::BadRequest);
    EXPECT_EQ(cadbridge::get_error(params).message, "Request body must be a JSON object");
}

TEST(JsonCodec, ActionNameStripsSlashesAndQuery) {
    EXPECT_EQ(cadbridge::codec::action_from_target("/execute_code"), "execute_code");
    EXPECT_EQ(cadbridge::codec::action_from_target("/execute_code/"), "execute_code");
    EXPECT_EQ(cadbridge::codec::action_from_target("//get_user_parameters?x=1"), "get_user_parameters");
    EXPECT_EQ(cadbridge::codec::action_from_target("/"), "");
}

TEST(JsonCodec, EnvelopesCarryExactlyOneOfResultOrError) {
    auto ok = cadbridge::codec::success_envelope("2\n");
    EXPECT_EQ(ok["success"], true);
    EXPECT_EQ(ok["result"], "2\n");
    EXPECT_FALSE(ok.contains("error"));

    auto failed = cadbridge::codec::error_envelope(cadbridge::make_invalid_input("bad"));
    EXPECT_EQ(failed["success"], false);
    EXPECT_EQ(failed["error"]["type"], "InvalidUserInput");
    EXPECT_EQ(failed["error"]["message"], "bad");
    EXPECT_FALSE(failed.contains("result"));
}

TEST(JsonCodec, SerializeReplacesInvalidUtf8) {
    nlohmann::json value = std::string("ok\xff");
    EXPECT_NO_THROW({
        std::string text = cadbridge::codec::serialize(value);
        EXPECT_FALSE(text.empty());
    });
}

TEST(JsonCodec, TypedAccessorsFallBack) {
    nlohmann::json params = {{"name", "width"}, {"count", 3}, {"flag", true}};
    EXPECT_EQ(cadbridge::codec::as_string(params["name"]), "width");
    EXPECT_EQ(cadbridge::codec::as_string(params["count"], "x"), "x");
    EXPECT_EQ(cadbridge::codec::as_int64(params["count"]), 3);
    EXPECT_EQ(cadbridge::codec::as_int64(params["name"], -1), -1);
    EXPECT_TRUE(cadbridge::codec::as_bool(params["flag"]));
    EXPECT_EQ(cadbridge::codec::find_key(params, "missing"), nullptr);
    EXPECT_NE(cadbridge::codec::find_key(params, "name"), nullptr);
}
