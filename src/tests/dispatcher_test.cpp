#include <gtest/gtest.h>
#include <gmock/gmock.h>
#include <chrono>
#include <string>
#include "protocol/dispatcher.hpp"
#include "protocol/gntp_error.hpp"
#include "registry/notification_sink.hpp"
#include "registry/registry.hpp"
#include "test_utils.hpp"

using namespace gntp::protocol;
using gntp::registry::Application;
using gntp::registry::Notification;
using gntp::registry::NotificationType;
using ::testing::_;
using ::testing::Field;
using ::testing::Return;
using ::testing::SaveArg;
using ::testing::StrictMock;

namespace {

class MockRegistry : public gntp::registry::Registry {
public:
    MOCK_METHOD(std::optional<Application>, resolve_application, (const std::string& name), (const, override));
    MOCK_METHOD(Application, register_application, (const std::string& name, const std::string& icon), (override));
    MOCK_METHOD(std::optional<NotificationType>, resolve_notification_type,
                (const Application& application, const std::string& name), (const, override));
    MOCK_METHOD(NotificationType, register_notification_type,
                (const Application& application, const std::string& name, const std::string& display_name,
                 bool enabled, const std::string& icon),
                (override));
    MOCK_METHOD(std::optional<std::vector<uint8_t>>, matching_key,
                (gntp::crypto::HashAlgorithm algorithm, const std::string& hash_hex, const std::string& salt_hex),
                (const, override));
    MOCK_METHOD(bool, requires_authentication, (), (const, override));
};

class MockNotificationSink : public gntp::registry::NotificationSink {
public:
    MOCK_METHOD(void, display, (const Notification& notification), (override));
};

} // namespace

class DispatcherTest : public ::testing::Test {
protected:
    void SetUp() override {
        gntp::test::quiet_logging(boost::log::trivial::fatal);

        app.id = 1;
        app.name = "Test";
        app.icon = "app.png";

        alert.id = 2;
        alert.application = "Test";
        alert.name = "Alert";
        alert.display_name = "Alert";
        alert.enabled = true;
        alert.icon = "alert.png";
    }

    static PendingRequest notify_request() {
        PendingRequest request;
        request.message_type = MessageType::NOTIFY;
        request.headers.set(headers::APPLICATION_NAME, "Test");
        request.headers.set(headers::NOTIFICATION_NAME, "Alert");
        request.headers.set(headers::NOTIFICATION_TITLE, "Hi");
        request.received_at = std::chrono::system_clock::now();
        return request;
    }

    ErrorCode error_for(const PendingRequest& request) {
        try {
            dispatcher.dispatch(request);
        } catch (const GntpException& e) {
            return e.code();
        }
        ADD_FAILURE() << "Expected GntpException";
        return ErrorCode::INTERNAL_SERVER_ERROR;
    }

    StrictMock<MockRegistry> registry;
    StrictMock<MockNotificationSink> sink;
    Dispatcher dispatcher{registry, sink};
    Application app;
    NotificationType alert;
};

//==============================================
// REGISTER
//==============================================

TEST_F(DispatcherTest, RegisterApplicationAndTypes) {
    PendingRequest request;
    request.message_type = MessageType::REGISTER;
    request.headers.set(headers::APPLICATION_NAME, "Test");
    request.headers.set(headers::APPLICATION_ICON, "app.png");
    request.notification_types.push_back({"Alert", "Alert!", true, "alert.png"});
    request.notification_types.push_back({"Info", "Info", false, ""});

    EXPECT_CALL(registry, register_application("Test", "app.png")).WillOnce(Return(app));
    EXPECT_CALL(registry, register_notification_type(Field(&Application::name, "Test"), "Alert", "Alert!", true, "alert.png"))
        .WillOnce(Return(alert));
    EXPECT_CALL(registry, register_notification_type(_, "Info", "Info", false, ""))
        .WillOnce(Return(NotificationType()));

    const Response response = dispatcher.dispatch(request);
    EXPECT_EQ(response.get_type(), ResponseType::OK);
    EXPECT_EQ(response.get_headers().get_or(headers::RESPONSE_ACTION, ""), "REGISTER");
}

TEST_F(DispatcherTest, RegisterWithoutApplicationName) {
    PendingRequest request;
    request.message_type = MessageType::REGISTER;
    EXPECT_EQ(error_for(request), ErrorCode::INVALID_REQUEST);
}

//==============================================
// NOTIFY
//==============================================

TEST_F(DispatcherTest, NotifyDisplaysNotification) {
    PendingRequest request = notify_request();
    request.headers.set(headers::NOTIFICATION_ID, "n-1");
    request.headers.set(headers::NOTIFICATION_TEXT, "Body");
    request.headers.set(headers::NOTIFICATION_STICKY, "yes");
    request.headers.set(headers::NOTIFICATION_PRIORITY, "2");
    request.headers.set(headers::NOTIFICATION_COALESCING_ID, "group");

    Notification shown;
    EXPECT_CALL(registry, resolve_application("Test")).WillOnce(Return(app));
    EXPECT_CALL(registry, resolve_notification_type(_, "Alert")).WillOnce(Return(alert));
    EXPECT_CALL(sink, display(_)).WillOnce(SaveArg<0>(&shown));

    const Response response = dispatcher.dispatch(request);
    EXPECT_EQ(response.get_type(), ResponseType::OK);
    EXPECT_EQ(response.get_headers().get_or(headers::RESPONSE_ACTION, ""), "NOTIFY");
    EXPECT_EQ(response.get_headers().get_or(headers::NOTIFICATION_ID, ""), "n-1");

    EXPECT_EQ(shown.application.name, "Test");
    EXPECT_EQ(shown.type.name, "Alert");
    EXPECT_EQ(shown.id, "n-1");
    EXPECT_EQ(shown.title, "Hi");
    EXPECT_EQ(shown.text, "Body");
    EXPECT_TRUE(shown.sticky);
    EXPECT_EQ(shown.priority, 2);
    EXPECT_EQ(shown.coalescing_id, "group");
    EXPECT_EQ(shown.timestamp, request.received_at);
}

TEST_F(DispatcherTest, NotifyIconFallsBackToType) {
    EXPECT_CALL(registry, resolve_application("Test")).WillOnce(Return(app));
    EXPECT_CALL(registry, resolve_notification_type(_, "Alert")).WillOnce(Return(alert));
    EXPECT_CALL(sink, display(Field(&Notification::icon, "alert.png")));

    dispatcher.dispatch(notify_request());
}

TEST_F(DispatcherTest, NotifyWithoutIdStillEchoesHeader) {
    EXPECT_CALL(registry, resolve_application("Test")).WillOnce(Return(app));
    EXPECT_CALL(registry, resolve_notification_type(_, "Alert")).WillOnce(Return(alert));
    EXPECT_CALL(sink, display(_));

    const Response response = dispatcher.dispatch(notify_request());
    ASSERT_TRUE(response.get_headers().has(headers::NOTIFICATION_ID));
    EXPECT_EQ(*response.get_headers().get(headers::NOTIFICATION_ID), "");
}

TEST_F(DispatcherTest, InvalidPriorityBecomesZero) {
    PendingRequest request = notify_request();
    request.headers.set(headers::NOTIFICATION_PRIORITY, "urgent");

    EXPECT_CALL(registry, resolve_application("Test")).WillOnce(Return(app));
    EXPECT_CALL(registry, resolve_notification_type(_, "Alert")).WillOnce(Return(alert));
    EXPECT_CALL(sink, display(Field(&Notification::priority, 0)));

    dispatcher.dispatch(request);
}

TEST_F(DispatcherTest, NegativePriority) {
    PendingRequest request = notify_request();
    request.headers.set(headers::NOTIFICATION_PRIORITY, "-2");

    EXPECT_CALL(registry, resolve_application("Test")).WillOnce(Return(app));
    EXPECT_CALL(registry, resolve_notification_type(_, "Alert")).WillOnce(Return(alert));
    EXPECT_CALL(sink, display(Field(&Notification::priority, -2)));

    dispatcher.dispatch(request);
}

TEST_F(DispatcherTest, DisabledTypeNotDisplayed) {
    alert.enabled = false;
    EXPECT_CALL(registry, resolve_application("Test")).WillOnce(Return(app));
    EXPECT_CALL(registry, resolve_notification_type(_, "Alert")).WillOnce(Return(alert));

    const Response response = dispatcher.dispatch(notify_request());
    EXPECT_EQ(response.get_type(), ResponseType::OK);
}

TEST_F(DispatcherTest, UnknownApplication) {
    EXPECT_CALL(registry, resolve_application("Test")).WillOnce(Return(std::nullopt));
    EXPECT_EQ(error_for(notify_request()), ErrorCode::UNKNOWN_APPLICATION);
}

TEST_F(DispatcherTest, UnknownNotificationType) {
    EXPECT_CALL(registry, resolve_application("Test")).WillOnce(Return(app));
    EXPECT_CALL(registry, resolve_notification_type(_, "Alert")).WillOnce(Return(std::nullopt));
    EXPECT_EQ(error_for(notify_request()), ErrorCode::UNKNOWN_NOTIFICATION);
}

TEST_F(DispatcherTest, NotifyRequiresNames) {
    PendingRequest request = notify_request();
    request.headers.set(headers::NOTIFICATION_NAME, "");
    EXPECT_EQ(error_for(request), ErrorCode::INVALID_REQUEST);
}

TEST_F(DispatcherTest, ResourcesPassedToSink) {
    PendingRequest request = notify_request();
    request.resources.reference("icon");
    Resource resource;
    resource.identifier = "icon";
    resource.length = 3;
    request.resources.attach(resource);

    EXPECT_CALL(registry, resolve_application("Test")).WillOnce(Return(app));
    EXPECT_CALL(registry, resolve_notification_type(_, "Alert")).WillOnce(Return(alert));
    EXPECT_CALL(sink, display(Field(&Notification::resources, ::testing::SizeIs(1))));

    dispatcher.dispatch(request);
}

TEST_F(DispatcherTest, MissingResourceRejected) {
    PendingRequest request = notify_request();
    request.resources.reference("never-sent");
    EXPECT_EQ(error_for(request), ErrorCode::INVALID_REQUEST);
}

//==============================================
// OTHER OUTCOMES
//==============================================

TEST_F(DispatcherTest, SubscribeUnsupported) {
    PendingRequest request;
    request.message_type = MessageType::SUBSCRIBE;
    EXPECT_EQ(error_for(request), ErrorCode::INTERNAL_SERVER_ERROR);
}

// Strict mocks fail the test on any registry or sink call
TEST_F(DispatcherTest, IgnoredNotifyTouchesNothing) {
    PendingRequest request = notify_request();
    request.ignored = true;
    request.headers.set(headers::NOTIFICATION_ID, "n-9");

    const Response response = dispatcher.dispatch(request);
    EXPECT_EQ(response.get_type(), ResponseType::OK);
    EXPECT_EQ(response.get_headers().get_or(headers::NOTIFICATION_ID, ""), "n-9");
}
