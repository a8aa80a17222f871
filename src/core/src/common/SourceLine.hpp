#pragma once

#include <string>

namespace block_script {

// One line of script text with its 1-based position in the source
struct SourceLine {
    int number = 0;
    std::string text;
};

} // namespace block_script
