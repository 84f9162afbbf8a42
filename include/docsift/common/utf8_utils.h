#pragma once

#include <cstddef>
#include <string_view>

namespace docsift::common {

inline bool isContinuationByte(char c) {
    return (static_cast<unsigned char>(c) & 0xC0) == 0x80;
}

// Length in code points. Stray continuation bytes are not counted.
inline size_t utf8Length(std::string_view input) {
    size_t n = 0;
    for (char c : input) {
        if (!isContinuationByte(c)) {
            ++n;
        }
    }
    return n;
}

} // namespace docsift::common
