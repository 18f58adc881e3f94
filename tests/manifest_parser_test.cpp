#include <gtest/gtest.h>
#include "fluttersec/extract/manifest_parser.hpp"
#include "test_helpers.hpp"

using namespace fluttersec;
using extract::ManifestParser;

TEST(ManifestParserTest, ParsesTextManifest) {
    std::string xml =
        "<?xml version=\"1.0\" encoding=\"utf-8\"?>\n"
        "<manifest xmlns:android=\"http://schemas.android.com/apk/res/android\"\n"
        "    package=\"com.example.shop\" android:versionName=\"2.1.0\">\n"
        "  <application android:label=\"Shop\" android:icon=\"@mipmap/ic_launcher\"/>\n"
        "</manifest>\n";

    auto info = ManifestParser::parse(std::vector<uint8_t>(xml.begin(), xml.end()));
    ASSERT_TRUE(info.has_value());
    EXPECT_EQ(info->package_name, "com.example.shop");
    EXPECT_EQ(info->version_name, "2.1.0");
    ASSERT_TRUE(info->label.has_value());
    EXPECT_EQ(*info->label, "Shop");
}

TEST(ManifestParserTest, ResourceLabelIsNotUsed) {
    std::string xml =
        "<manifest xmlns:android=\"http://schemas.android.com/apk/res/android\" package=\"com.example.x\">"
        "<application android:label=\"@string/app_name\"/></manifest>";

    auto info = ManifestParser::parse(std::vector<uint8_t>(xml.begin(), xml.end()));
    ASSERT_TRUE(info.has_value());
    EXPECT_FALSE(info->label.has_value());
}

TEST(ManifestParserTest, ParsesCompiledManifest) {
    auto data = test::buildBinaryManifest("com.example.bank", "5.0.2", "Bank");

    auto info = ManifestParser::parse(data);
    ASSERT_TRUE(info.has_value());
    EXPECT_EQ(info->package_name, "com.example.bank");
    EXPECT_EQ(info->version_name, "5.0.2");
    ASSERT_TRUE(info->label.has_value());
    EXPECT_EQ(*info->label, "Bank");
}

TEST(ManifestParserTest, TruncatedCompiledManifestDoesNotCrash) {
    auto data = test::buildBinaryManifest("com.example.bank", "5.0.2", "Bank");
    data.resize(data.size() / 2);
    auto info = ManifestParser::parse(data);
    if (info) {
        EXPECT_TRUE(info->package_name.empty() || info->package_name == "com.example.bank");
    }
}
