#pragma once

#include <algorithm>
#include <cstdint>
#include <string>
#include <string_view>

namespace coedit::collab::text {

// Document positions count code points, the text is stored as UTF-8.

inline bool is_continuation(char c) noexcept {
    return (static_cast<unsigned char>(c) & 0xC0) == 0x80;
}

inline std::int64_t length(std::string_view s) noexcept {
    std::int64_t n = 0;
    for (char c : s) {
        if (!is_continuation(c)) ++n;
    }
    return n;
}

// Byte offset of code point `index`; clamps to s.size().
inline std::size_t byte_offset(std::string_view s, std::int64_t index) noexcept {
    if (index <= 0) return 0;
    std::int64_t seen = 0;
    for (std::size_t i = 0; i < s.size(); ++i) {
        if (is_continuation(s[i])) continue;
        if (seen == index) return i;
        ++seen;
    }
    return s.size();
}

inline void insert(std::string& s, std::int64_t position, std::string_view piece) {
    s.insert(byte_offset(s, position), piece);
}

inline void erase(std::string& s, std::int64_t position, std::int64_t count) {
    const std::size_t from = byte_offset(s, position);
    const std::int64_t available = length(std::string_view(s).substr(from));
    const std::size_t to = from + byte_offset(std::string_view(s).substr(from), std::min(count, available));
    s.erase(from, to - from);
}

} // namespace coedit::collab::text
