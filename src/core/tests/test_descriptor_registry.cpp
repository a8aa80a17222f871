/**
 * @file test_descriptor_registry.cpp
 * @brief Descriptor registry and YAML catalog tests
 */

#include <gtest/gtest.h>
#include "descriptors/DescriptorRegistry.hpp"
#include "common/ScriptError.hpp"
#include "logging/Logger.hpp"
#include <algorithm>
#include <filesystem>
#include <fstream>

using namespace block_script;
using namespace block_script::descriptors;

namespace fs = std::filesystem;

class DescriptorRegistryTest : public ::testing::Test {
protected:
    void SetUp() override {
        block_script::Logger::init("test_descriptor_registry.log", "debug");
        catalog_dir = fs::temp_directory_path() / "block_script_registry_test";
        fs::create_directories(catalog_dir);
    }

    void TearDown() override {
        std::error_code ec;
        fs::remove_all(catalog_dir, ec);
    }

    std::string writeCatalog(const std::string& name, const std::string& content) {
        fs::path path = catalog_dir / name;
        std::ofstream file(path);
        file << content;
        return path.string();
    }

    fs::path catalog_dir;
};

TEST_F(DescriptorRegistryTest, BuiltinsAreRegistered) {
    auto registry = DescriptorRegistry::builtin();
    EXPECT_TRUE(registry->isFrozen());

    for (const char* id : {"Parse", "Keycheck", "RawCode", "HttpRequest", "Hash", "HashString", "NTLMHash",
                           "Hmac", "HmacString", "ScryptString", "AESEncrypt", "AESDecrypt", "JwtEncode"}) {
        EXPECT_TRUE(registry->contains(id)) << id;
    }
    EXPECT_EQ(registry->size(), 13u);
}

TEST_F(DescriptorRegistryTest, ParseDescriptorDefaults) {
    auto parse = DescriptorRegistry::builtin()->get("Parse");
    EXPECT_EQ(parse->family, BlockFamily::Parse);

    const ParamSchema* input = parse->findParameter("input");
    ASSERT_NE(input, nullptr);
    EXPECT_EQ(input->defaultValue, settings::SettingValue(settings::Interpolated{"<data.SOURCE>"}));

    const ParamSchema* caseSensitive = parse->findParameter("caseSensitive");
    ASSERT_NE(caseSensitive, nullptr);
    EXPECT_EQ(caseSensitive->type, ParamType::Bool);
    EXPECT_EQ(caseSensitive->defaultValue, settings::SettingValue(true));

    EXPECT_EQ(parse->parameters.front().name, "input");
}

TEST_F(DescriptorRegistryTest, FunctionDescriptors) {
    auto registry = DescriptorRegistry::builtin();

    auto hash = registry->get("HashString");
    EXPECT_EQ(hash->family, BlockFamily::Function);
    EXPECT_EQ(hash->method, "HashString");
    EXPECT_TRUE(hash->returnsValue());
    EXPECT_EQ(hash->defaultOutputVariable, "hashStringOutput");

    const ParamSchema* fn = hash->findParameter("hashFunction");
    ASSERT_NE(fn, nullptr);
    EXPECT_EQ(fn->enumType, "HashFunction");
    EXPECT_TRUE(fn->allowsEnumValue("SHA256"));
    EXPECT_FALSE(fn->allowsEnumValue("sha256"));

    auto request = registry->get("HttpRequest");
    EXPECT_TRUE(request->async);
    EXPECT_FALSE(request->returnsValue());
}

TEST_F(DescriptorRegistryTest, GetUnknownThrows) {
    auto registry = DescriptorRegistry::builtin();
    EXPECT_THROW(registry->get("DoesNotExist"), UnknownKindError);
    EXPECT_EQ(registry->find("DoesNotExist"), nullptr);
}

TEST_F(DescriptorRegistryTest, AddRejectsDuplicatesAndEmptyIds) {
    DescriptorRegistry registry;
    BlockDescriptor d;
    d.id = "Custom";
    registry.add(d);
    EXPECT_THROW(registry.add(d), std::invalid_argument);

    BlockDescriptor empty;
    EXPECT_THROW(registry.add(empty), std::invalid_argument);
}

TEST_F(DescriptorRegistryTest, FrozenRegistryRejectsChanges) {
    DescriptorRegistry registry;
    registry.registerBuiltins();
    registry.freeze();

    BlockDescriptor d;
    d.id = "Late";
    EXPECT_THROW(registry.add(d), std::logic_error);
    EXPECT_THROW(registry.loadCatalog("whatever.yaml"), std::logic_error);
}

TEST_F(DescriptorRegistryTest, IdsAreSorted) {
    auto ids = DescriptorRegistry::builtin()->ids();
    ASSERT_FALSE(ids.empty());
    EXPECT_TRUE(std::is_sorted(ids.begin(), ids.end()));
}

TEST_F(DescriptorRegistryTest, LoadCatalog) {
    std::string path = writeCatalog("catalog.yaml", R"(
descriptors:
  - id: Base64Encode
    name: Base64 Encode
    family: function
    category: Conversion
    method: Base64Encode
    returns: String
    output_variable: base64Output
    parameters:
      - { name: input, type: String, default: "" }
  - id: Pick
    family: function
    returns: String
    parameters:
      - { name: items, type: ListOfStrings, default: ["a", "b"] }
      - { name: mode, type: Enum, enum_type: PickMode, values: [First, Last] }
)");

    DescriptorRegistry registry;
    registry.registerBuiltins();
    ASSERT_TRUE(registry.loadCatalog(path));

    auto encode = registry.get("Base64Encode");
    EXPECT_EQ(encode->name, "Base64 Encode");
    EXPECT_EQ(encode->category, "Conversion");
    EXPECT_EQ(encode->defaultOutputVariable, "base64Output");
    ASSERT_EQ(encode->parameters.size(), 1u);
    EXPECT_EQ(encode->parameters[0].defaultValue, settings::SettingValue(""));

    auto pick = registry.get("Pick");
    EXPECT_EQ(pick->name, "Pick");
    EXPECT_EQ(pick->method, "Pick");
    EXPECT_EQ(pick->defaultOutputVariable, "PickOutput");
    const ParamSchema* mode = pick->findParameter("mode");
    ASSERT_NE(mode, nullptr);
    EXPECT_EQ(mode->defaultValue, settings::SettingValue(settings::EnumValue{"First"}));
    const ParamSchema* items = pick->findParameter("items");
    ASSERT_NE(items, nullptr);
    EXPECT_EQ(items->defaultValue.as<settings::SettingList>().size(), 2u);
}

TEST_F(DescriptorRegistryTest, LoadCatalogRejectsUnknownFamily) {
    std::string path = writeCatalog("bad_family.yaml", R"(
descriptors:
  - id: Good
    family: function
  - id: Weird
    family: loop
)");

    DescriptorRegistry registry;
    EXPECT_FALSE(registry.loadCatalog(path));
    // Nothing from a rejected catalog is kept
    EXPECT_FALSE(registry.contains("Good"));
}

TEST_F(DescriptorRegistryTest, LoadCatalogRejectsUnknownParameterType) {
    std::string path = writeCatalog("bad_type.yaml", R"(
descriptors:
  - id: Thing
    parameters:
      - { name: x, type: Matrix }
)");

    DescriptorRegistry registry;
    EXPECT_FALSE(registry.loadCatalog(path));
    EXPECT_EQ(registry.size(), 0u);
}

TEST_F(DescriptorRegistryTest, LoadCatalogRejectsInvalidParameterName) {
    std::string path = writeCatalog("bad_param_name.yaml", R"(
descriptors:
  - id: Thing
    parameters:
      - { name: "my param", type: String }
)");

    DescriptorRegistry registry;
    EXPECT_FALSE(registry.loadCatalog(path));
    EXPECT_FALSE(registry.contains("Thing"));
}

TEST_F(DescriptorRegistryTest, LoadCatalogRejectsDuplicateParameterName) {
    std::string path = writeCatalog("dup_param.yaml", R"(
descriptors:
  - id: Thing
    parameters:
      - { name: dup, type: String }
      - { name: dup, type: Int }
)");

    DescriptorRegistry registry;
    EXPECT_FALSE(registry.loadCatalog(path));
    EXPECT_FALSE(registry.contains("Thing"));
}

TEST_F(DescriptorRegistryTest, LoadCatalogRejectsRedefinition) {
    std::string path = writeCatalog("redefine.yaml", R"(
descriptors:
  - id: Parse
    family: parse
)");

    DescriptorRegistry registry;
    registry.registerBuiltins();
    EXPECT_FALSE(registry.loadCatalog(path));
}

TEST_F(DescriptorRegistryTest, LoadCatalogMissingFile) {
    DescriptorRegistry registry;
    EXPECT_FALSE(registry.loadCatalog((catalog_dir / "missing.yaml").string()));
}
