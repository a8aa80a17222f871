/**
 * @file test_script_codec.cpp
 * @brief Script text decode/encode tests
 */

#include <gtest/gtest.h>
#include "codec/ScriptCodec.hpp"
#include "common/ScriptError.hpp"
#include "logging/Logger.hpp"

using namespace block_script;
using namespace block_script::blocks;
using namespace block_script::codec;

namespace {

const char* kLoginScript =
    "BLOCK:HttpRequest\n"
    "  url = \"https://example.com/login\"\n"
    "  method = POST\n"
    "  content = $\"user=<input.USER>&pass=<input.PASS>\"\n"
    "\n"
    "BLOCK:Parse\n"
    "  LABEL:Get token\n"
    "  MODE:CSS\n"
    "  cssSelector = \"input[name=token]\"\n"
    "  attributeName = \"value\"\n"
    "  => VAR @token\n"
    "\n"
    "BLOCK:HashString\n"
    "  DISABLED\n"
    "  input = @token\n"
    "  hashFunction = SHA256\n"
    "  => CAP @hashed\n"
    "\n"
    "BLOCK:Keycheck\n"
    "  KEYCHAIN SUCCESS OR\n"
    "    STRINGKEY @data.SOURCE Contains \"Welcome\"\n"
    "\n"
    "BLOCK:RawCode\n"
    "  data.Log(token);\n";

} // namespace

class ScriptCodecTest : public ::testing::Test {
protected:
    void SetUp() override {
        block_script::Logger::init("test_script_codec.log", "debug");
        registry = descriptors::DescriptorRegistry::builtin();
    }

    std::shared_ptr<const descriptors::DescriptorRegistry> registry;
};

TEST_F(ScriptCodecTest, DecodePreservesOrder) {
    Script script = decodeScript(kLoginScript, *registry);

    ASSERT_EQ(script.size(), 5u);
    EXPECT_EQ(script[0].id(), "HttpRequest");
    EXPECT_EQ(script[1].id(), "Parse");
    EXPECT_EQ(script[2].id(), "HashString");
    EXPECT_EQ(script[3].id(), "Keycheck");
    EXPECT_EQ(script[4].id(), "RawCode");

    EXPECT_NE(script[0].as<FunctionBlock>(), nullptr);
    EXPECT_NE(script[1].as<ParseBlock>(), nullptr);
    EXPECT_NE(script[3].as<KeycheckBlock>(), nullptr);
    EXPECT_NE(script[4].as<RawCodeBlock>(), nullptr);

    EXPECT_EQ(script[1].base().label(), "Get token");
    EXPECT_EQ(script[1].base().sourceLine(), 6);
    EXPECT_TRUE(script[2].isDisabled());
}

TEST_F(ScriptCodecTest, RoundTrip) {
    Script script = decodeScript(kLoginScript, *registry);
    std::string encoded = encodeScript(script);
    Script decoded = decodeScript(encoded, *registry);

    EXPECT_EQ(decoded, script);
    EXPECT_EQ(encodeScript(decoded), encoded);
}

TEST_F(ScriptCodecTest, EncodeLayout) {
    Script script = decodeScript("BLOCK:RawCode\nint a;\nBLOCK:RawCode\nint b;\n", *registry);

    EncodeOptions options;
    options.indent = 4;
    EXPECT_EQ(encodeScript(script, options), "BLOCK:RawCode\n    int a;\n\nBLOCK:RawCode\n    int b;\n");
}

TEST_F(ScriptCodecTest, EncodeWithoutDefaults) {
    Script script = decodeScript("BLOCK:Parse\nMODE:LR\nleftDelim = \"<b>\"\n=> VAR @x\n", *registry);

    EncodeOptions options;
    options.printDefaults = false;
    EXPECT_EQ(encodeScript(script, options),
              "BLOCK:Parse\n  MODE:LR\n  leftDelim = \"<b>\"\n  => VAR @x\n");
}

TEST_F(ScriptCodecTest, EmptyScript) {
    EXPECT_TRUE(decodeScript("", *registry).empty());
    EXPECT_TRUE(decodeScript("\n  \n\r\n", *registry).empty());
    EXPECT_EQ(encodeScript({}), "");
}

TEST_F(ScriptCodecTest, CrLfLineEndings) {
    Script script = decodeScript("BLOCK:Parse\r\nMODE:Json\r\njToken = \"a.b\"\r\n=> VAR @v\r\n", *registry);
    ASSERT_EQ(script.size(), 1u);
    EXPECT_EQ(script[0].as<ParseBlock>()->mode(), ParseMode::Json);
    EXPECT_EQ(script[0].as<ParseBlock>()->outputVariable(), "v");
}

TEST_F(ScriptCodecTest, UnknownBlockId) {
    try {
        decodeScript("BLOCK:RawCode\nint a;\n\nBLOCK:Teleport\n", *registry);
        FAIL() << "Expected UnknownKindError";
    } catch (const UnknownKindError& e) {
        EXPECT_EQ(e.line(), 4);
        EXPECT_EQ(e.excerpt(), "BLOCK:Teleport");
    }
}

TEST_F(ScriptCodecTest, TextBeforeFirstHeader) {
    try {
        decodeScript("\nhello\nBLOCK:RawCode\n", *registry);
        FAIL() << "Expected ParseError";
    } catch (const ParseError& e) {
        EXPECT_EQ(e.line(), 2);
        EXPECT_EQ(e.excerpt(), "hello");
    }
}

TEST_F(ScriptCodecTest, ErrorsKeepScriptLineNumbers) {
    const char* text =
        "BLOCK:RawCode\n"
        "int a;\n"
        "\n"
        "BLOCK:Parse\n"
        "  MODE:Foo\n";
    try {
        decodeScript(text, *registry);
        FAIL() << "Expected ParseError";
    } catch (const ParseError& e) {
        EXPECT_EQ(e.line(), 5);
        EXPECT_EQ(e.excerpt(), "MODE:Foo");
    }
}

TEST_F(ScriptCodecTest, LongExcerptIsTruncated) {
    std::string text = "BLOCK:Parse\nMODE:" + std::string(100, 'X') + "\n";
    try {
        decodeScript(text, *registry);
        FAIL() << "Expected ParseError";
    } catch (const ParseError& e) {
        EXPECT_EQ(e.excerpt().size(), 50u);
        EXPECT_EQ(e.excerpt().substr(0, 5), "MODE:");
    }
}

TEST_F(ScriptCodecTest, EncodeRejectsUnknownSetting) {
    Script script = decodeScript("BLOCK:Parse\nMODE:LR\n", *registry);
    script[0].base().setSetting("bogus", settings::SettingValue("x"));
    EXPECT_THROW(encodeScript(script), InvalidSettingError);
}
