#include "eden/lexer/source.hpp"

#include <algorithm>

namespace eden::lexer {

auto utf8_char_length(char lead) -> size_t {
    auto c = static_cast<unsigned char>(lead);
    if ((c & 0x80) == 0) {
        return 1;
    }
    if ((c & 0xE0) == 0xC0) {
        return 2;
    }
    if ((c & 0xF0) == 0xE0) {
        return 3;
    }
    if ((c & 0xF8) == 0xF0) {
        return 4;
    }
    return 1;
}

Source::Source(std::string content) : content_(std::move(content)) {}

auto Source::at(size_t offset) const -> char {
    if (offset >= content_.size()) {
        return '\0';
    }
    return content_[offset];
}

auto Source::char_at(size_t offset) const -> std::string_view {
    if (offset >= content_.size()) {
        return {};
    }

    size_t len = utf8_char_length(content_[offset]);
    if (offset + len > content_.size()) {
        return slice(offset, offset + 1);
    }

    // Every trailing byte must be a continuation byte
    for (size_t i = 1; i < len; ++i) {
        if ((static_cast<unsigned char>(content_[offset + i]) & 0xC0) != 0x80) {
            return slice(offset, offset + 1);
        }
    }

    return slice(offset, offset + len);
}

auto Source::slice(size_t start, size_t end) const -> std::string_view {
    if (start >= content_.size()) {
        return {};
    }
    end = std::min(end, content_.size());
    return std::string_view(content_).substr(start, end - start);
}

auto Source::matches(size_t offset, std::string_view prefix) const -> bool {
    return slice(offset, offset + prefix.size()) == prefix;
}

auto Source::from_string(std::string content) -> Source {
    return Source(std::move(content));
}

} // namespace eden::lexer
