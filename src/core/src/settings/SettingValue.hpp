#pragma once

/**
 * @file SettingValue.hpp
 * @brief Value model for block settings
 *
 * A setting value is either fixed (a literal known when the script is
 * written), a reference to a variable, an interpolated string template, or
 * a list / dictionary whose elements are themselves setting values.
 */

#include <cstdint>
#include <string>
#include <utility>
#include <variant>
#include <vector>

namespace block_script {
namespace settings {

struct EnumValue {
    std::string value;

    bool operator==(const EnumValue& other) const { return value == other.value; }
    bool operator!=(const EnumValue& other) const { return !(*this == other); }
};

struct VariableRef {
    std::string name;

    bool operator==(const VariableRef& other) const { return name == other.name; }
    bool operator!=(const VariableRef& other) const { return !(*this == other); }
};

// Template text with <variable> placeholders, e.g. "user=<name>&pass=<pass>"
struct Interpolated {
    std::string text;

    bool operator==(const Interpolated& other) const { return text == other.text; }
    bool operator!=(const Interpolated& other) const { return !(*this == other); }
};

using Bytes = std::vector<std::uint8_t>;

struct SettingValue;

using SettingList = std::vector<SettingValue>;
using SettingDict = std::vector<std::pair<std::string, SettingValue>>;  // insertion ordered

struct SettingValue {
    using Variant = std::variant<
        std::string,
        int,
        double,
        bool,
        EnumValue,
        Bytes,
        VariableRef,
        Interpolated,
        SettingList,
        SettingDict
    >;

    Variant value;

    SettingValue() : value(std::string()) {}
    SettingValue(std::string v) : value(std::move(v)) {}
    SettingValue(const char* v) : value(std::string(v)) {}
    SettingValue(int v) : value(v) {}
    SettingValue(double v) : value(v) {}
    SettingValue(bool v) : value(v) {}
    SettingValue(EnumValue v) : value(std::move(v)) {}
    SettingValue(Bytes v) : value(std::move(v)) {}
    SettingValue(VariableRef v) : value(std::move(v)) {}
    SettingValue(Interpolated v) : value(std::move(v)) {}
    SettingValue(SettingList v) : value(std::move(v)) {}
    SettingValue(SettingDict v) : value(std::move(v)) {}

    template <typename T>
    bool is() const { return std::holds_alternative<T>(value); }

    template <typename T>
    const T& as() const { return std::get<T>(value); }

    bool isVariable() const { return is<VariableRef>(); }
    bool isInterpolated() const { return is<Interpolated>(); }

    /**
     * True when the value (and every element, for collections) is a literal
     */
    bool isFixed() const;

    bool operator==(const SettingValue& other) const;
    bool operator!=(const SettingValue& other) const { return !(*this == other); }
};

/**
 * The value currently bound to one parameter of a block instance
 */
struct Setting {
    std::string name;
    SettingValue value;

    bool operator==(const Setting& other) const {
        return name == other.name && value == other.value;
    }
    bool operator!=(const Setting& other) const { return !(*this == other); }
};

} // namespace settings
} // namespace block_script
