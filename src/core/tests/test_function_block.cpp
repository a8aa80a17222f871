/**
 * @file test_function_block.cpp
 * @brief Function block (crypto calls, requests) tests
 */

#include <gtest/gtest.h>
#include "blocks/BlockInstance.hpp"
#include "common/ScriptError.hpp"
#include "descriptors/DescriptorRegistry.hpp"
#include "logging/Logger.hpp"

using namespace block_script;
using namespace block_script::blocks;
using namespace block_script::settings;

class FunctionBlockTest : public ::testing::Test {
protected:
    void SetUp() override {
        block_script::Logger::init("test_function_block.log", "debug");
        registry = descriptors::DescriptorRegistry::builtin();
    }

    FunctionBlock makeBlock(const std::string& id) const {
        return FunctionBlock(registry->get(id));
    }

    static std::vector<SourceLine> body(const std::vector<std::string>& lines) {
        std::vector<SourceLine> out;
        for (size_t i = 0; i < lines.size(); ++i) {
            out.push_back({static_cast<int>(i) + 2, lines[i]});
        }
        return out;
    }

    std::string generate(const FunctionBlock& block, codegen::DefinedVariables& variables) const {
        codegen::GenerationContext context{variables};
        return block.generate(context);
    }

    std::shared_ptr<const descriptors::DescriptorRegistry> registry;
};

TEST_F(FunctionBlockTest, DefaultOutputVariable) {
    EXPECT_EQ(makeBlock("HashString").outputVariable(), "hashStringOutput");
    EXPECT_EQ(makeBlock("AESEncrypt").outputVariable(), "aESEncryptOutput");
    EXPECT_EQ(makeBlock("HttpRequest").outputVariable(), "");
}

TEST_F(FunctionBlockTest, DecodeHashString) {
    FunctionBlock block = makeBlock("HashString");
    block.deserialize(body({"input = @password", "hashFunction = SHA256", "=> CAP @hashed"}));

    EXPECT_EQ(block.setting("input").value, SettingValue(VariableRef{"password"}));
    EXPECT_EQ(block.setting("hashFunction").value, SettingValue(EnumValue{"SHA256"}));
    EXPECT_EQ(block.outputVariable(), "hashed");
    EXPECT_TRUE(block.isCapture());

    codegen::DefinedVariables variables;
    EXPECT_EQ(generate(block, variables),
              "var hashed = HashString(data, password, HashFunction.SHA256);\n"
              "data.MarkForCapture(nameof(hashed));\n");
}

TEST_F(FunctionBlockTest, RejectsEnumValueOutsideSchema) {
    FunctionBlock block = makeBlock("Hmac");
    // MD4 is a hash function but not an HMAC one
    EXPECT_THROW(block.deserialize(body({"hashFunction = MD4"})), ParseError);
}

TEST_F(FunctionBlockTest, ByteArraySettings) {
    FunctionBlock block = makeBlock("Hmac");
    block.deserialize(body({"input = AQID", "key = @globals.secret", "hashFunction = SHA1", "=> VAR @sig"}));

    codegen::DefinedVariables variables;
    EXPECT_EQ(generate(block, variables),
              "var sig = Hmac(data, Convert.FromBase64String(\"AQID\"), globals.secret, HashFunction.SHA1);\n");
}

TEST_F(FunctionBlockTest, EmptyByteArray) {
    FunctionBlock block = makeBlock("NTLMHash");
    block.setSetting("input", SettingValue("pass"));

    codegen::DefinedVariables variables;
    EXPECT_EQ(generate(block, variables), "var nTLMHashOutput = NTLMHash(data, \"pass\");\n");

    FunctionBlock hash = makeBlock("Hash");
    EXPECT_EQ(generate(hash, variables), "var hashOutput = Hash(data, new byte[0], HashFunction.MD5);\n");
}

TEST_F(FunctionBlockTest, AsyncRequestWithoutOutput) {
    FunctionBlock block = makeBlock("HttpRequest");
    block.deserialize(body({
        "url = $\"https://example.com/login?u=<user>\"",
        "method = POST",
        "content = \"a=1&b=2\"",
        "headers = {(\"Accept\", \"*/*\")}",
        "autoRedirect = False",
    }));

    codegen::DefinedVariables variables;
    EXPECT_EQ(generate(block, variables),
              "await HttpRequest(data, $\"https://example.com/login?u={user}\", HttpMethod.POST, \"a=1&b=2\", "
              "\"application/x-www-form-urlencoded\", new Dictionary<string, string> { { \"Accept\", \"*/*\" } }, "
              "new Dictionary<string, string>(), 10000, false);\n");
    EXPECT_TRUE(variables.empty());
}

TEST_F(FunctionBlockTest, OutputDeclarationOnNonReturningBlock) {
    FunctionBlock block = makeBlock("HttpRequest");
    try {
        block.deserialize(body({"method = GET", "=> VAR @response"}));
        FAIL() << "Expected ParseError";
    } catch (const ParseError& e) {
        EXPECT_EQ(e.line(), 3);
    }
}

TEST_F(FunctionBlockTest, SerializeWritesOutputOnlyWhenReturning) {
    SerializeOptions options;
    options.printDefaults = false;

    FunctionBlock hash = makeBlock("HashString");
    hash.setSetting("input", SettingValue("abc"));
    std::vector<std::string> expected = {"input = \"abc\"", "=> VAR @hashStringOutput"};
    EXPECT_EQ(hash.serialize(options), expected);

    FunctionBlock request = makeBlock("HttpRequest");
    request.setDisabled(true);
    std::vector<std::string> requestExpected = {"DISABLED"};
    EXPECT_EQ(request.serialize(options), requestExpected);
}

TEST_F(FunctionBlockTest, RedeclarationAcrossKinds) {
    codegen::DefinedVariables variables;
    variables.add("hashed");

    FunctionBlock block = makeBlock("HashString");
    block.setOutputVariable("hashed");
    EXPECT_EQ(generate(block, variables).rfind("hashed = HashString(", 0), 0u);
}

TEST_F(FunctionBlockTest, MissingMethodIsUnsupported) {
    descriptors::BlockDescriptor d;
    d.id = "Nothing";
    d.family = descriptors::BlockFamily::Function;

    FunctionBlock block(std::make_shared<const descriptors::BlockDescriptor>(d));
    codegen::DefinedVariables variables;
    EXPECT_THROW(generate(block, variables), UnsupportedOperationError);
}
