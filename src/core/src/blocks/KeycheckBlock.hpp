#pragma once

/**
 * @file KeycheckBlock.hpp
 * @brief Condition block setting the bot status from keychains
 *
 *   BLOCK:Keycheck
 *     banIfNoMatch = False
 *     KEYCHAIN SUCCESS OR
 *       STRINGKEY @data.SOURCE Contains "Welcome"
 *     KEYCHAIN FAIL AND
 *       INTKEY @data.RESPONSECODE EqualTo 401
 *
 * Keychains are checked in order; the first one whose keys match sets
 * data.STATUS to its status.
 */

#include "BlockBase.hpp"
#include <optional>

namespace block_script {
namespace blocks {

enum class KeyType {
    String,
    Int,
    Float,
    Bool
};

struct KeyTypeInfo {
    KeyType type;
    const char* token;            // STRINGKEY
    const char* comparisonEnum;   // StrComparison
    descriptors::ParamType valueType;
    std::vector<std::string> comparisons;
};

const KeyTypeInfo& keyTypeInfo(KeyType type);
const KeyTypeInfo* findKeyType(const std::string& token);

struct Key {
    KeyType type = KeyType::String;
    settings::SettingValue left;
    std::string comparison;
    settings::SettingValue right;

    bool operator==(const Key& other) const {
        return type == other.type && left == other.left &&
               comparison == other.comparison && right == other.right;
    }
};

enum class KeychainMode {
    OR,
    AND
};

struct Keychain {
    std::string resultStatus = "SUCCESS";
    KeychainMode mode = KeychainMode::OR;
    std::vector<Key> keys;

    bool operator==(const Keychain& other) const {
        return resultStatus == other.resultStatus && mode == other.mode && keys == other.keys;
    }
};

class KeycheckBlock : public BlockBase {
public:
    explicit KeycheckBlock(std::shared_ptr<const descriptors::BlockDescriptor> descriptor);

    const std::vector<Keychain>& keychains() const { return m_keychains; }
    std::vector<Keychain>& keychains() { return m_keychains; }

    std::vector<std::string> serialize(const SerializeOptions& options = {}) const;
    void deserialize(const std::vector<SourceLine>& lines);
    std::string generate(codegen::GenerationContext& context) const;

    bool operator==(const KeycheckBlock& other) const;
    bool operator!=(const KeycheckBlock& other) const { return !(*this == other); }

private:
    Keychain readKeychain(const SourceLine& line) const;
    Key readKey(const SourceLine& line, const KeyTypeInfo& info) const;
    std::string condition(const Keychain& keychain) const;

    std::vector<Keychain> m_keychains;
};

} // namespace blocks
} // namespace block_script
