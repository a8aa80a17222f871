#pragma once

/**
 * @file CSharpWriter.hpp
 * @brief Translation of setting values to C# expressions
 */

#include "../descriptors/BlockDescriptor.hpp"
#include "../settings/SettingValue.hpp"
#include <string>
#include <vector>

namespace block_script {
namespace codegen {

/**
 * C# expression for a setting value of the given parameter
 *
 * Variables prefixed with "globals." are members of the runtime's
 * persistent store and are never sanitized or declared; "<name>"
 * placeholders of interpolated strings become "{name}" holes of a C#
 * interpolated string.
 */
std::string resolve(const settings::SettingValue& value, const descriptors::ParamSchema& param);

std::string stringLiteral(const std::string& s);
std::string interpolatedLiteral(const std::string& templ);
std::string variableExpression(const std::string& name);

std::string joinArguments(const std::vector<std::string>& arguments);

} // namespace codegen
} // namespace block_script
