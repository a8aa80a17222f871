/**
 * @file test_raw_code_block.cpp
 * @brief Raw code block tests
 */

#include <gtest/gtest.h>
#include "blocks/BlockInstance.hpp"
#include "common/ScriptError.hpp"
#include "descriptors/DescriptorRegistry.hpp"
#include "logging/Logger.hpp"

using namespace block_script;
using namespace block_script::blocks;

class RawCodeBlockTest : public ::testing::Test {
protected:
    void SetUp() override {
        block_script::Logger::init("test_raw_code_block.log", "debug");
        registry = descriptors::DescriptorRegistry::builtin();
    }

    RawCodeBlock makeBlock() const {
        return RawCodeBlock(registry->get("RawCode"));
    }

    std::shared_ptr<const descriptors::DescriptorRegistry> registry;
};

TEST_F(RawCodeBlockTest, KeepsCodeLines) {
    RawCodeBlock block = makeBlock();
    block.deserialize({{2, ""}, {3, "DISABLED"}, {4, "  var x = 1;"}, {5, ""}, {6, "  data.Log(x);  "}, {7, ""}});

    EXPECT_TRUE(block.isDisabled());
    std::vector<std::string> expected = {"var x = 1;", "", "data.Log(x);"};
    EXPECT_EQ(block.lines(), expected);
    EXPECT_EQ(block.code(), "var x = 1;\n\ndata.Log(x);\n");
}

TEST_F(RawCodeBlockTest, GenerateEmitsCodeVerbatim) {
    RawCodeBlock block = makeBlock();
    block.setCode("\nif (x > 1)\n{\n    x++;\n}\n");

    codegen::DefinedVariables variables;
    codegen::GenerationContext context{variables};
    EXPECT_EQ(block.generate(context), "if (x > 1)\n{\nx++;\n}\n");
}

TEST_F(RawCodeBlockTest, SerializeWritesOnlyHeaderAndCode) {
    RawCodeBlock block = makeBlock();
    block.setLabel("Custom");
    block.setCode("int a = 0;");

    std::vector<std::string> expected = {"LABEL:Custom", "int a = 0;"};
    EXPECT_EQ(block.serialize(), expected);
}

TEST_F(RawCodeBlockTest, UnknownSettingRejected) {
    RawCodeBlock block = makeBlock();
    block.setSetting("bogus", settings::SettingValue(1));
    EXPECT_THROW(block.serialize(), InvalidSettingError);
}
