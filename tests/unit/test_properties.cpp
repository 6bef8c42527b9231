#include <gtest/gtest.h>
#include "utils/properties.h"
#include <map>
#include <string>
#include <vector>

using namespace meshcore;

TEST(PropertiesTest, DefaultConstructor) {
    Properties props;
    EXPECT_TRUE(props.empty());
    EXPECT_EQ(0u, props.size());
}

TEST(PropertiesTest, SetAndGetString) {
    Properties props;
    props.set("appId", std::string("auth"));

    EXPECT_EQ("auth", props.getString("appId"));
    EXPECT_EQ("fallback", props.getString("missing", "fallback"));
}

TEST(PropertiesTest, NumericCoercion) {
    Properties props;
    props.set("connections", 12);
    props.set("openedAt", static_cast<int64_t>(1700000000123LL));
    props.set("load", 42.5);

    EXPECT_EQ(12, props.getInt("connections"));
    EXPECT_DOUBLE_EQ(12.0, props.getDouble("connections"));
    EXPECT_EQ(1700000000123LL, props.getInt64("openedAt"));
    EXPECT_EQ(12, props.getInt64("connections"));
    EXPECT_EQ(42, props.getInt("load"));
    EXPECT_DOUBLE_EQ(42.5, props.getDouble("load"));
}

TEST(PropertiesTest, NumericFromText) {
    Properties props;
    props.set("port", std::string("8080"));
    props.set("bad", std::string("eighty"));

    EXPECT_EQ(8080, props.getInt("port"));
    EXPECT_EQ(-1, props.getInt("bad", -1));
}

TEST(PropertiesTest, MissingNumbersReadAsDefault) {
    Properties props;
    EXPECT_EQ(0, props.getInt("currentConnections"));
    EXPECT_DOUBLE_EQ(0.0, props.getDouble("loadPercent"));
}

TEST(PropertiesTest, StringListAndMap) {
    Properties props;
    props.set("serviceNames", std::vector<std::string>{"login", "logout"});
    props.set("mappings", std::map<std::string, std::string>{{"login", "auth"}});

    EXPECT_EQ((std::vector<std::string>{"login", "logout"}), props.getStringList("serviceNames"));
    EXPECT_EQ("auth", props.getStringMap("mappings").at("login"));
    EXPECT_TRUE(props.getStringList("missing").empty());
    EXPECT_TRUE(props.getStringMap("serviceNames").empty());
}

TEST(PropertiesTest, GetAsTemplateMethod) {
    Properties props;
    props.set("count", 5);

    EXPECT_EQ(5, props.getAs<int>("count").value());
    EXPECT_FALSE(props.getAs<std::string>("count").has_value());
    EXPECT_FALSE(props.getAs<int>("missing").has_value());
}

TEST(PropertiesTest, HasRemoveAndKeys) {
    Properties props;
    props.set("a", 1);
    props.set("b", 2);

    EXPECT_TRUE(props.has("a"));
    EXPECT_TRUE(props.remove("a"));
    EXPECT_FALSE(props.remove("a"));
    EXPECT_FALSE(props.has("a"));
    EXPECT_EQ(std::vector<std::string>{"b"}, props.keys());
}

TEST(PropertiesTest, MergeOverwrites) {
    Properties base;
    base.set("a", 1);
    base.set("b", 2);

    Properties other;
    other.set("b", 20);
    other.set("c", 30);

    base.merge(other);
    EXPECT_EQ(3u, base.size());
    EXPECT_EQ(20, base.getInt("b"));
}

TEST(PropertiesTest, CopyIsIndependent) {
    Properties original;
    original.set("key", std::string("value"));

    Properties copy(original);
    copy.set("key", std::string("changed"));

    EXPECT_EQ("value", original.getString("key"));
    EXPECT_EQ("changed", copy.getString("key"));
}
