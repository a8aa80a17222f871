/**
 * @file BuiltinDescriptors.cpp
 * @brief Built-in block descriptor table
 */

#include "DescriptorRegistry.hpp"
#include "../logging/Logger.hpp"
#include <cctype>

namespace block_script {
namespace descriptors {

using settings::Bytes;
using settings::EnumValue;
using settings::SettingDict;
using settings::SettingValue;

namespace {

const std::vector<std::string> kHashFunctions = {"MD4", "MD5", "SHA1", "SHA256", "SHA384", "SHA512"};
const std::vector<std::string> kHmacFunctions = {"MD5", "SHA1", "SHA256", "SHA384", "SHA512"};
const std::vector<std::string> kCipherModes = {"CBC", "ECB", "OFB", "CFB", "CTS"};
const std::vector<std::string> kPaddingModes = {"None", "PKCS7", "Zeros", "ANSIX923", "ISO10126"};
const std::vector<std::string> kHttpMethods = {"GET", "POST", "PUT", "DELETE", "PATCH", "HEAD", "OPTIONS"};
const std::vector<std::string> kJwtAlgorithms = {"HS256", "HS384", "HS512"};

ParamSchema stringParam(const std::string& name, const std::string& def = "") {
    return {name, ParamType::String, SettingValue(def), "", {}};
}

ParamSchema intParam(const std::string& name, int def) {
    return {name, ParamType::Int, SettingValue(def), "", {}};
}

ParamSchema boolParam(const std::string& name, bool def) {
    return {name, ParamType::Bool, SettingValue(def), "", {}};
}

ParamSchema bytesParam(const std::string& name) {
    return {name, ParamType::ByteArray, SettingValue(Bytes{}), "", {}};
}

ParamSchema dictParam(const std::string& name) {
    return {name, ParamType::DictOfStrings, SettingValue(SettingDict{}), "", {}};
}

ParamSchema enumParam(const std::string& name, const std::string& enum_type,
                      const std::vector<std::string>& values, const std::string& def) {
    return {name, ParamType::Enum, SettingValue(EnumValue{def}), enum_type, values};
}

BlockDescriptor function(const std::string& id, const std::string& name, const std::string& category,
                         const std::string& description, const std::string& return_type,
                         std::vector<ParamSchema> parameters) {
    BlockDescriptor d;
    d.id = id;
    d.name = name;
    d.category = category;
    d.description = description;
    d.family = BlockFamily::Function;
    d.method = id;
    d.returnType = return_type;
    d.parameters = std::move(parameters);
    if (!return_type.empty()) {
        std::string output = id;
        output[0] = static_cast<char>(std::tolower(static_cast<unsigned char>(output[0])));
        d.defaultOutputVariable = output + "Output";
    }
    return d;
}

BlockDescriptor parseDescriptor() {
    BlockDescriptor d;
    d.id = "Parse";
    d.name = "Parse";
    d.category = "Parsing";
    d.description = "Extracts data from a string using delimiters, CSS selectors, JSON paths or regular expressions";
    d.family = BlockFamily::Parse;
    d.parameters = {
        {"input", ParamType::String, SettingValue(settings::Interpolated{"<data.SOURCE>"}), "", {}},
        stringParam("prefix"),
        stringParam("suffix"),
        // LR
        stringParam("leftDelim"),
        stringParam("rightDelim"),
        boolParam("caseSensitive", true),
        // CSS
        stringParam("cssSelector"),
        stringParam("attributeName", "innerText"),
        // Json
        stringParam("jToken"),
        // Regex
        stringParam("pattern"),
        stringParam("outputFormat"),
    };
    return d;
}

BlockDescriptor keycheckDescriptor() {
    BlockDescriptor d;
    d.id = "Keycheck";
    d.name = "Keycheck";
    d.category = "Conditions";
    d.description = "Sets the bot status according to the first keychain whose keys match";
    d.family = BlockFamily::Keycheck;
    d.parameters = {boolParam("banIfNoMatch", true)};
    return d;
}

BlockDescriptor rawCodeDescriptor() {
    BlockDescriptor d;
    d.id = "RawCode";
    d.name = "Raw Code";
    d.category = "Utility";
    d.description = "Host-language statements emitted verbatim";
    d.family = BlockFamily::RawCode;
    return d;
}

BlockDescriptor httpRequestDescriptor() {
    auto d = function("HttpRequest", "Http Request", "Requests",
                      "Performs an HTTP request and stores the response in the bot data", "",
                      {
                          stringParam("url", "https://example.com"),
                          enumParam("method", "HttpMethod", kHttpMethods, "GET"),
                          stringParam("content"),
                          stringParam("contentType", "application/x-www-form-urlencoded"),
                          dictParam("headers"),
                          dictParam("cookies"),
                          intParam("timeoutMilliseconds", 10000),
                          boolParam("autoRedirect", true),
                      });
    d.async = true;
    return d;
}

std::vector<BlockDescriptor> cryptoDescriptors() {
    return {
        function("Hash", "Hash", "Crypto", "Hashes data using the specified hashing function", "ByteArray",
                 {bytesParam("input"), enumParam("hashFunction", "HashFunction", kHashFunctions, "MD5")}),
        function("HashString", "Hash String", "Crypto",
                 "Hashes a UTF8 string to a HEX-encoded lowercase string using the specified hashing function",
                 "String",
                 {stringParam("input"), enumParam("hashFunction", "HashFunction", kHashFunctions, "MD5")}),
        function("NTLMHash", "NTLM Hash", "Crypto", "Hashes a string using NTLM", "ByteArray",
                 {stringParam("input")}),
        function("Hmac", "Hmac", "Crypto",
                 "Computes the HMAC signature of some data using the specified secret key and hashing function",
                 "ByteArray",
                 {bytesParam("input"), bytesParam("key"),
                  enumParam("hashFunction", "HashFunction", kHmacFunctions, "MD5")}),
        function("HmacString", "Hmac String", "Crypto",
                 "Computes the HMAC signature as a HEX-encoded lowercase string from a given UTF8 string",
                 "String",
                 {stringParam("input"), bytesParam("key"),
                  enumParam("hashFunction", "HashFunction", kHmacFunctions, "MD5")}),
        function("ScryptString", "Scrypt String", "Crypto", "Hashes data using the Scrypt algorithm", "String",
                 {stringParam("password"), stringParam("salt"), intParam("iterationCount", 16384),
                  intParam("blockSize", 8), intParam("threadCount", 1)}),
        function("AESEncrypt", "AES Encrypt", "Crypto", "Encrypts data with AES", "ByteArray",
                 {bytesParam("plainText"), bytesParam("key"), bytesParam("iv"),
                  enumParam("mode", "CipherMode", kCipherModes, "CBC"),
                  enumParam("padding", "PaddingMode", kPaddingModes, "None"), intParam("blockSize", 128)}),
        function("AESDecrypt", "AES Decrypt", "Crypto", "Decrypts data with AES", "ByteArray",
                 {bytesParam("cipherText"), bytesParam("key"), bytesParam("iv"),
                  enumParam("mode", "CipherMode", kCipherModes, "CBC"),
                  enumParam("padding", "PaddingMode", kPaddingModes, "None"), intParam("blockSize", 128)}),
        function("JwtEncode", "JWT Encode", "Crypto",
                 "Generates a JSON Web Token using a secret key, payload and optional extra headers", "String",
                 {enumParam("algorithm", "JwtAlgorithmName", kJwtAlgorithms, "HS256"), stringParam("secret"),
                  stringParam("extraHeaders", "{}"), stringParam("payload", "{}")}),
    };
}

} // namespace

void DescriptorRegistry::registerBuiltins() {
    add(parseDescriptor());
    add(keycheckDescriptor());
    add(rawCodeDescriptor());
    add(httpRequestDescriptor());
    for (auto& d : cryptoDescriptors()) {
        add(std::move(d));
    }
    LOG_DEBUG("Registered {} built-in block descriptors", m_descriptors.size());
}

} // namespace descriptors
} // namespace block_script
