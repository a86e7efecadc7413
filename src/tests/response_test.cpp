#include <gtest/gtest.h>
#include <sstream>
#include <stdexcept>
#include <string>
#include "crypto/crypto_error.hpp"
#include "protocol/gntp_error.hpp"
#include "protocol/response.hpp"
#include "test_utils.hpp"

using namespace gntp::protocol;

class ResponseTest : public ::testing::Test {
protected:
    void SetUp() override {
        gntp::test::quiet_logging();
    }
};

TEST_F(ResponseTest, OkForNotify) {
    Response response = Response::ok(MessageType::NOTIFY);
    response.add_header(headers::NOTIFICATION_ID, "42");

    EXPECT_EQ(response.get_type(), ResponseType::OK);
    EXPECT_EQ(response.serialize(),
              "GNTP/1.0 -OK NONE\r\n"
              "Response-Action: NOTIFY\r\n"
              "Notification-ID: 42\r\n"
              "\r\n");
}

TEST_F(ResponseTest, OkForSubscribeCarriesTtl) {
    const Response response = Response::ok(MessageType::SUBSCRIBE);
    EXPECT_EQ(response.get_headers().get_or(headers::SUBSCRIPTION_TTL, ""), "300");
}

TEST_F(ResponseTest, ErrorResponse) {
    const Response response = Response::error(ErrorCode::UNKNOWN_APPLICATION, "Missing");
    EXPECT_EQ(response.get_type(), ResponseType::ERROR);
    EXPECT_EQ(response.serialize(),
              "GNTP/1.0 -ERROR NONE\r\n"
              "Error-Code: 401\r\n"
              "Error-Description: Missing\r\n"
              "\r\n");
}

TEST_F(ResponseTest, LineBreaksInValuesAreFlattened) {
    Response response = Response::error(ErrorCode::INVALID_REQUEST, "bad\r\ninjected: header");
    EXPECT_EQ(response.get_headers().get_or(headers::ERROR_DESCRIPTION, ""), "bad  injected: header");
}

TEST_F(ResponseTest, OriginHeaders) {
    OriginInfo origin;
    origin.machine_name = "host";
    origin.software_name = "gntpd";
    origin.software_version = "1.0.0";
    origin.platform_name = "Linux";
    origin.platform_version = "6.1";

    Response response = Response::ok(MessageType::REGISTER);
    response.add_origin_headers(origin);

    const auto& block = response.get_headers();
    EXPECT_EQ(block.get_or(headers::ORIGIN_MACHINE_NAME, ""), "host");
    EXPECT_EQ(block.get_or(headers::ORIGIN_SOFTWARE_NAME, ""), "gntpd");
    EXPECT_EQ(block.get_or(headers::ORIGIN_SOFTWARE_VERSION, ""), "1.0.0");
    EXPECT_EQ(block.get_or(headers::ORIGIN_PLATFORM_NAME, ""), "Linux");
    EXPECT_EQ(block.get_or(headers::ORIGIN_PLATFORM_VERSION, ""), "6.1");
}

TEST_F(ResponseTest, LocalOriginIsFilled) {
    const OriginInfo origin = OriginInfo::local();
    EXPECT_FALSE(origin.machine_name.empty());
    EXPECT_EQ(origin.software_name, "gntpd");
    EXPECT_FALSE(origin.platform_name.empty());
}

TEST_F(ResponseTest, WriteAndParse) {
    Response response = Response::ok(MessageType::NOTIFY);
    response.add_header(headers::NOTIFICATION_ID, "");

    std::ostringstream out;
    response.write(out);

    const Response parsed = Response::parse(out.str());
    EXPECT_EQ(parsed.get_type(), ResponseType::OK);
    EXPECT_EQ(parsed.get_headers().get_or(headers::RESPONSE_ACTION, ""), "NOTIFY");
    ASSERT_TRUE(parsed.get_headers().has(headers::NOTIFICATION_ID));
}

TEST_F(ResponseTest, ParseRejectsForeignStatus) {
    EXPECT_THROW(Response::parse("HTTP/1.1 200 OK\r\n\r\n"), GntpException);
    EXPECT_THROW(Response::parse(""), GntpException);
}

//==============================================
// ERROR MAPPING
//==============================================

TEST_F(ResponseTest, MapsProtocolErrors) {
    const Response response = map_exception(GntpException(ErrorCode::UNKNOWN_NOTIFICATION, "Alert"));
    EXPECT_EQ(response.get_headers().get_or(headers::ERROR_CODE, ""), "402");
    EXPECT_EQ(response.get_headers().get_or(headers::ERROR_DESCRIPTION, ""), "Alert");
}

TEST_F(ResponseTest, EmptyDetailUsesCodeName) {
    const Response response = map_exception(GntpException(ErrorCode::UNKNOWN_PROTOCOL_VERSION));
    EXPECT_EQ(response.get_headers().get_or(headers::ERROR_CODE, ""), "302");
    EXPECT_EQ(response.get_headers().get_or(headers::ERROR_DESCRIPTION, ""), "Unknown protocol version");
}

TEST_F(ResponseTest, MapsDecryptionFailure) {
    const Response response = map_exception(gntp::crypto::DecryptionError("bad padding"));
    EXPECT_EQ(response.get_headers().get_or(headers::ERROR_CODE, ""), "300");
    EXPECT_EQ(response.get_headers().get_or(headers::ERROR_DESCRIPTION, ""), "Unable to decrypt message");
}

TEST_F(ResponseTest, MapsAnythingElseToInternalError) {
    const Response response = map_exception(std::runtime_error("disk full"));
    EXPECT_EQ(response.get_type(), ResponseType::ERROR);
    EXPECT_EQ(response.get_headers().get_or(headers::ERROR_CODE, ""), "500");
    EXPECT_EQ(response.get_headers().get_or(headers::ERROR_DESCRIPTION, ""), "disk full");
}

TEST(GntpErrorTest, CodeValues) {
    EXPECT_EQ(error_code_value(ErrorCode::INVALID_REQUEST), 300);
    EXPECT_EQ(error_code_value(ErrorCode::UNKNOWN_PROTOCOL), 301);
    EXPECT_EQ(error_code_value(ErrorCode::UNKNOWN_PROTOCOL_VERSION), 302);
    EXPECT_EQ(error_code_value(ErrorCode::NOT_AUTHORIZED), 400);
    EXPECT_EQ(error_code_value(ErrorCode::UNKNOWN_APPLICATION), 401);
    EXPECT_EQ(error_code_value(ErrorCode::UNKNOWN_NOTIFICATION), 402);
    EXPECT_EQ(error_code_value(ErrorCode::INTERNAL_SERVER_ERROR), 500);
}

TEST(GntpErrorTest, MessageIncludesDetail) {
    const GntpException error(ErrorCode::NOT_AUTHORIZED, "Incorrect password");
    EXPECT_STREQ(error.what(), "Not authorized: Incorrect password");
    EXPECT_EQ(error.detail(), "Incorrect password");
}
