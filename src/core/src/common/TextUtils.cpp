/**
 * @file TextUtils.cpp
 */

#include "TextUtils.hpp"
#include <algorithm>
#include <cctype>

namespace block_script {
namespace text {

namespace {

const char* kBase64Alphabet =
    "ABCDEFGHIJKLMNOPQRSTUVWXYZabcdefghijklmnopqrstuvwxyz0123456789+/";

int base64Index(char c) {
    if (c >= 'A' && c <= 'Z') return c - 'A';
    if (c >= 'a' && c <= 'z') return c - 'a' + 26;
    if (c >= '0' && c <= '9') return c - '0' + 52;
    if (c == '+') return 62;
    if (c == '/') return 63;
    return -1;
}

std::string sanitizeIdentifier(const std::string& name) {
    std::string result;
    result.reserve(name.size() + 1);
    for (char c : name) {
        if (std::isalnum(static_cast<unsigned char>(c)) || c == '_') {
            result.push_back(c);
        }
    }
    if (result.empty()) {
        return "_";
    }
    if (std::isdigit(static_cast<unsigned char>(result.front()))) {
        result.insert(result.begin(), '_');
    }
    return result;
}

} // namespace

std::string trim(const std::string& s) {
    const char* ws = " \t\r\n\f\v";
    size_t start = s.find_first_not_of(ws);
    if (start == std::string::npos) return "";
    size_t end = s.find_last_not_of(ws);
    return s.substr(start, end - start + 1);
}

bool startsWith(const std::string& s, const std::string& prefix) {
    return s.size() >= prefix.size() && s.compare(0, prefix.size(), prefix) == 0;
}

bool iequals(const std::string& a, const std::string& b) {
    return a.size() == b.size() &&
           std::equal(a.begin(), a.end(), b.begin(), [](char x, char y) {
               return std::toupper(static_cast<unsigned char>(x)) ==
                      std::toupper(static_cast<unsigned char>(y));
           });
}

std::string truncatePretty(const std::string& s, size_t max_length) {
    if (s.size() <= max_length) return s;
    size_t cut = max_length <= 3 ? max_length : max_length - 3;
    // Never split a UTF-8 sequence: back up over continuation bytes
    while (cut > 0 && (static_cast<unsigned char>(s[cut]) & 0xC0) == 0x80) {
        cut--;
    }
    return max_length <= 3 ? s.substr(0, cut) : s.substr(0, cut) + "...";
}

std::vector<std::string> splitLines(const std::string& text) {
    std::vector<std::string> lines;
    std::string current;
    for (char c : text) {
        if (c == '\n') {
            if (!current.empty() && current.back() == '\r') current.pop_back();
            lines.push_back(current);
            current.clear();
        } else {
            current.push_back(c);
        }
    }
    if (!current.empty()) {
        if (current.back() == '\r') current.pop_back();
        lines.push_back(current);
    }
    return lines;
}

bool isGlobalVariable(const std::string& name) {
    return startsWith(name, kGlobalsPrefix);
}

bool isIdentifier(const std::string& s) {
    if (s.empty() || std::isdigit(static_cast<unsigned char>(s.front()))) return false;
    return std::all_of(s.begin(), s.end(), [](char c) {
        return std::isalnum(static_cast<unsigned char>(c)) || c == '_';
    });
}

bool isVariablePath(const std::string& s) {
    size_t start = 0;
    while (true) {
        size_t dot = s.find('.', start);
        std::string segment = dot == std::string::npos ? s.substr(start) : s.substr(start, dot - start);
        if (!isIdentifier(segment)) return false;
        if (dot == std::string::npos) return true;
        start = dot + 1;
    }
}

std::string makeValidVariableName(const std::string& name) {
    if (isGlobalVariable(name)) {
        std::string rest = name.substr(std::string(kGlobalsPrefix).size());
        return std::string(kGlobalsPrefix) + sanitizeIdentifier(rest);
    }
    return sanitizeIdentifier(name);
}

std::string base64Encode(const std::vector<std::uint8_t>& data) {
    std::string out;
    out.reserve(((data.size() + 2) / 3) * 4);

    size_t i = 0;
    while (i + 2 < data.size()) {
        std::uint32_t n = (data[i] << 16) | (data[i + 1] << 8) | data[i + 2];
        out.push_back(kBase64Alphabet[(n >> 18) & 0x3F]);
        out.push_back(kBase64Alphabet[(n >> 12) & 0x3F]);
        out.push_back(kBase64Alphabet[(n >> 6) & 0x3F]);
        out.push_back(kBase64Alphabet[n & 0x3F]);
        i += 3;
    }

    size_t remaining = data.size() - i;
    if (remaining == 1) {
        std::uint32_t n = data[i] << 16;
        out.push_back(kBase64Alphabet[(n >> 18) & 0x3F]);
        out.push_back(kBase64Alphabet[(n >> 12) & 0x3F]);
        out += "==";
    } else if (remaining == 2) {
        std::uint32_t n = (data[i] << 16) | (data[i + 1] << 8);
        out.push_back(kBase64Alphabet[(n >> 18) & 0x3F]);
        out.push_back(kBase64Alphabet[(n >> 12) & 0x3F]);
        out.push_back(kBase64Alphabet[(n >> 6) & 0x3F]);
        out.push_back('=');
    }

    return out;
}

std::optional<std::vector<std::uint8_t>> base64Decode(const std::string& encoded) {
    if (encoded.size() % 4 != 0) return std::nullopt;

    std::vector<std::uint8_t> out;
    out.reserve(encoded.size() / 4 * 3);

    for (size_t i = 0; i < encoded.size(); i += 4) {
        int v[4];
        int padding = 0;
        for (int k = 0; k < 4; ++k) {
            char c = encoded[i + k];
            if (c == '=') {
                // Padding only allowed in the last two positions of the last quad
                if (i + 4 != encoded.size() || k < 2) return std::nullopt;
                v[k] = 0;
                ++padding;
            } else {
                if (padding > 0) return std::nullopt;
                v[k] = base64Index(c);
                if (v[k] < 0) return std::nullopt;
            }
        }

        std::uint32_t n = (v[0] << 18) | (v[1] << 12) | (v[2] << 6) | v[3];
        out.push_back(static_cast<std::uint8_t>((n >> 16) & 0xFF));
        if (padding < 2) out.push_back(static_cast<std::uint8_t>((n >> 8) & 0xFF));
        if (padding < 1) out.push_back(static_cast<std::uint8_t>(n & 0xFF));
    }

    return out;
}

} // namespace text
} // namespace block_script
