#include "courier/errors.hpp"
#include "courier/resource_names.hpp"

#include <gmock/gmock.h>
#include <gtest/gtest.h>

namespace {

using namespace courier;

class TestResourceNames : public testing::Test {};

// MARK: - Tests:

TEST_F(TestResourceNames, short_names_are_qualified) {
    EXPECT_EQ(qualify_topic("demo", "orders"), "projects/demo/topics/orders");
    EXPECT_EQ(qualify_subscription("demo", "orders-sub"), "projects/demo/subscriptions/orders-sub");
}

TEST_F(TestResourceNames, qualified_names_pass_through) {
    EXPECT_EQ(qualify_topic("other", "projects/demo/topics/orders"), "projects/demo/topics/orders");
    EXPECT_EQ(qualify_subscription("", "projects/demo/subscriptions/s-1"), "projects/demo/subscriptions/s-1");
}

TEST_F(TestResourceNames, malformed_names_are_rejected) {
    EXPECT_THROW(qualify_topic("demo", "projects/demo/subscriptions/orders"), PubSubError);
    EXPECT_THROW(qualify_topic("demo", "projects//topics/orders"), PubSubError);
    EXPECT_THROW(qualify_topic("demo", "1orders"), PubSubError);
    EXPECT_THROW(qualify_topic("demo", "ab"), PubSubError);
    EXPECT_THROW(qualify_topic("demo", "google-topic"), PubSubError);
    EXPECT_THROW(qualify_topic("demo", "has space"), PubSubError);
}

TEST_F(TestResourceNames, short_name_without_project_is_rejected) {
    try {
        qualify_topic("", "orders");
        FAIL() << "expected PubSubError";
    } catch (const PubSubError& e) {
        EXPECT_EQ(e.code(), StatusCode::InvalidArgument);
    }
}

TEST_F(TestResourceNames, components) {
    EXPECT_EQ(short_name("projects/demo/topics/orders"), "orders");
    EXPECT_EQ(short_name("orders"), "orders");
    EXPECT_EQ(project_of("projects/demo/subscriptions/s-1"), "projects/demo");
    EXPECT_THROW(project_of("topics/orders"), PubSubError);
}

TEST_F(TestResourceNames, resource_id_charset) {
    EXPECT_TRUE(is_valid_resource_id("a-b_c.d~e+f%g"));
    EXPECT_TRUE(is_valid_resource_id(std::string(255, 'a')));
    EXPECT_FALSE(is_valid_resource_id(std::string(256, 'a')));
    EXPECT_FALSE(is_valid_resource_id("abc/def"));
}

} // namespace
