/**
 * @file RawCodeBlock.cpp
 */

#include "RawCodeBlock.hpp"
#include "../common/TextUtils.hpp"

namespace block_script {
namespace blocks {

RawCodeBlock::RawCodeBlock(std::shared_ptr<const descriptors::BlockDescriptor> descriptor)
    : BlockBase(std::move(descriptor)) {}

void RawCodeBlock::assignLines(std::vector<std::string> lines) {
    for (auto& line : lines) {
        line = text::trim(line);
    }
    while (!lines.empty() && lines.back().empty()) lines.pop_back();
    size_t first = 0;
    while (first < lines.size() && lines[first].empty()) first++;
    m_lines.assign(lines.begin() + static_cast<std::ptrdiff_t>(first), lines.end());
}

void RawCodeBlock::setCode(const std::string& code) {
    assignLines(text::splitLines(code));
}

std::string RawCodeBlock::code() const {
    std::string out;
    for (const auto& line : m_lines) {
        out += line + "\n";
    }
    return out;
}

std::vector<std::string> RawCodeBlock::serialize(const SerializeOptions& /*options*/) const {
    // Body lines are code, so there is no room for setting lines
    validateSettings();

    std::vector<std::string> out;
    writeHeader(out);
    out.insert(out.end(), m_lines.begin(), m_lines.end());
    return out;
}

void RawCodeBlock::deserialize(const std::vector<SourceLine>& lines) {
    std::vector<std::string> code;
    for (size_t i = readHeader(lines); i < lines.size(); ++i) {
        code.push_back(lines[i].text);
    }
    assignLines(std::move(code));
}

std::string RawCodeBlock::generate(codegen::GenerationContext& /*context*/) const {
    validateSettings();
    return code();
}

bool RawCodeBlock::operator==(const RawCodeBlock& other) const {
    return baseEquals(other) && m_lines == other.m_lines;
}

} // namespace blocks
} // namespace block_script
