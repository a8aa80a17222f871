/**
 * @file SettingValue.cpp
 */

#include "SettingValue.hpp"

namespace block_script {
namespace settings {

bool SettingValue::isFixed() const {
    if (is<VariableRef>() || is<Interpolated>()) {
        return false;
    }
    if (is<SettingList>()) {
        for (const auto& item : as<SettingList>()) {
            if (!item.isFixed()) return false;
        }
    }
    if (is<SettingDict>()) {
        for (const auto& entry : as<SettingDict>()) {
            if (!entry.second.isFixed()) return false;
        }
    }
    return true;
}

bool SettingValue::operator==(const SettingValue& other) const {
    return value == other.value;
}

} // namespace settings
} // namespace block_script
