/**
 * @file test_script_json.cpp
 * @brief JSON export tests
 */

#include <gtest/gtest.h>
#include "codec/ScriptCodec.hpp"
#include "codec/ScriptJson.hpp"
#include "logging/Logger.hpp"

using namespace block_script;
using namespace block_script::codec;
using json = nlohmann::json;

class ScriptJsonTest : public ::testing::Test {
protected:
    void SetUp() override {
        block_script::Logger::init("test_script_json.log", "debug");
        registry = descriptors::DescriptorRegistry::builtin();
    }

    std::shared_ptr<const descriptors::DescriptorRegistry> registry;
};

TEST_F(ScriptJsonTest, SettingShapes) {
    using namespace block_script::settings;

    EXPECT_EQ(settingValueToJson(SettingValue("x"))["shape"], "fixed");
    EXPECT_EQ(settingValueToJson(SettingValue(5))["value"], 5);
    EXPECT_EQ(settingValueToJson(SettingValue(Bytes{1, 2, 3}))["base64"], "AQID");
    EXPECT_EQ(settingValueToJson(SettingValue(VariableRef{"v"}))["name"], "v");
    EXPECT_EQ(settingValueToJson(SettingValue(Interpolated{"<a>"}))["template"], "<a>");

    json list = settingValueToJson(SettingValue(SettingList{SettingValue("a"), SettingValue(VariableRef{"b"})}));
    EXPECT_EQ(list["shape"], "list");
    ASSERT_EQ(list["items"].size(), 2u);
    EXPECT_EQ(list["items"][1]["shape"], "variable");

    json dict = settingValueToJson(SettingValue(SettingDict{{"k", SettingValue("v")}}));
    EXPECT_EQ(dict["shape"], "dict");
    EXPECT_EQ(dict["entries"][0]["key"], "k");
}

TEST_F(ScriptJsonTest, ScriptExport) {
    auto script = decodeScript(
        "BLOCK:Parse\n"
        "  DISABLED\n"
        "  MODE:Regex\n"
        "  pattern = \"(\\\\d+)\"\n"
        "  => CAP @digits\n"
        "\n"
        "BLOCK:Keycheck\n"
        "  KEYCHAIN FAIL AND\n"
        "    INTKEY @data.RESPONSECODE EqualTo 403\n"
        "\n"
        "BLOCK:RawCode\n"
        "  int a = 1;\n",
        *registry);

    json j = scriptToJson(script);
    ASSERT_EQ(j["blocks"].size(), 3u);

    const json& parse = j["blocks"][0];
    EXPECT_EQ(parse["id"], "Parse");
    EXPECT_EQ(parse["family"], "parse");
    EXPECT_EQ(parse["disabled"], true);
    EXPECT_EQ(parse["line"], 1);
    EXPECT_EQ(parse["mode"], "Regex");
    EXPECT_EQ(parse["output_variable"], "digits");
    EXPECT_EQ(parse["capture"], true);
    EXPECT_EQ(parse["settings"]["pattern"]["value"], "(\\d+)");

    const json& keycheck = j["blocks"][1];
    ASSERT_EQ(keycheck["keychains"].size(), 1u);
    EXPECT_EQ(keycheck["keychains"][0]["status"], "FAIL");
    EXPECT_EQ(keycheck["keychains"][0]["mode"], "AND");
    EXPECT_EQ(keycheck["keychains"][0]["keys"][0]["type"], "INTKEY");
    EXPECT_EQ(keycheck["keychains"][0]["keys"][0]["right"]["value"], 403);

    EXPECT_EQ(j["blocks"][2]["code"][0], "int a = 1;");
}

TEST_F(ScriptJsonTest, RegistryExport) {
    json j = registryToJson(*registry);
    ASSERT_EQ(j.size(), registry->size());

    bool found = false;
    for (const auto& entry : j) {
        if (entry["id"] != "HashString") continue;
        found = true;
        EXPECT_EQ(entry["family"], "function");
        EXPECT_EQ(entry["returns"], "String");
        EXPECT_EQ(entry["parameters"][1]["enum_type"], "HashFunction");
    }
    EXPECT_TRUE(found);
}
