/**
 * @file ScriptCodec.cpp
 */

#include "ScriptCodec.hpp"
#include "../common/ScriptError.hpp"
#include "../common/TextUtils.hpp"
#include "../logging/Logger.hpp"
#include <algorithm>

namespace block_script {
namespace codec {

using blocks::BlockInstance;
using blocks::Script;

namespace {

const std::string kBlockHeader = "BLOCK:";

bool isHeader(const std::string& trimmed) {
    return text::startsWith(trimmed, kBlockHeader);
}

} // namespace

Script decodeScript(const std::string& text, const descriptors::DescriptorRegistry& registry) {
    std::vector<std::string> raw = text::splitLines(text);
    Script script;

    size_t i = 0;
    while (i < raw.size()) {
        std::string header = text::trim(raw[i]);
        int header_line = static_cast<int>(i) + 1;

        if (header.empty()) {
            i++;
            continue;
        }

        if (!isHeader(header)) {
            throw ParseError("Expected a BLOCK: header", header_line, header);
        }

        std::string id = text::trim(header.substr(kBlockHeader.size()));
        auto descriptor = registry.find(id);
        if (!descriptor) {
            throw UnknownKindError("Unknown block id '" + id + "'", header_line, header);
        }

        // Body runs up to the next header
        std::vector<SourceLine> body;
        for (i++; i < raw.size() && !isHeader(text::trim(raw[i])); ++i) {
            body.push_back({static_cast<int>(i) + 1, raw[i]});
        }

        BlockInstance block = BlockInstance::create(descriptor);
        block.base().setSourceLine(header_line);
        block.deserialize(body);

        LOG_TRACE("Decoded block {} at line {} ({} body lines)", id, header_line, body.size());
        script.push_back(std::move(block));
    }

    LOG_DEBUG("Decoded script: {} blocks, {} lines", script.size(), raw.size());
    return script;
}

std::string encodeScript(const Script& script, const EncodeOptions& options) {
    blocks::SerializeOptions serialize_options;
    serialize_options.printDefaults = options.printDefaults;

    const std::string indent(static_cast<size_t>(std::max(options.indent, 0)), ' ');

    std::string out;
    for (size_t i = 0; i < script.size(); ++i) {
        const BlockInstance& block = script[i];
        if (i > 0) out += "\n";

        out += kBlockHeader + block.id() + "\n";
        for (const auto& line : block.serialize(serialize_options)) {
            out += line.empty() ? "\n" : indent + line + "\n";
        }
    }

    LOG_DEBUG("Encoded script: {} blocks", script.size());
    return out;
}

} // namespace codec
} // namespace block_script
