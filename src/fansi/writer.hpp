#pragma once

#include "./style.hpp"

#include <string>
#include <string_view>

namespace fansi {

/**
 * @brief Accumulates text and the ANSI control sequences that switch between text styles.
 */
class text_writer {
    std::string _buf;
    std::size_t _vis_size = 0;

    text_style _style;

public:
    void write(std::string_view s) noexcept {
        _buf.append(s);
        _vis_size += s.size();
    }

    void putc(char c) noexcept { write(std::string_view(&c, 1)); }

    /// Emit the shortest control sequence that changes the current style to the given one
    void put_style(const text_style&) noexcept;

    std::string      take_string() noexcept { return std::move(_buf); }
    std::string_view string() const noexcept { return _buf; }
    /// The number of characters written, excluding control sequences
    auto visual_size() const noexcept { return _vis_size; }
};

}  // namespace fansi
