#include "./styled.hpp"

#include "./style.hpp"
#include "./writer.hpp"

#include <magic_enum.hpp>
#include <neo/assert.hpp>
#include <neo/utility.hpp>

#include <cctype>
#include <cstdlib>
#include <map>
#include <vector>

#include <unistd.h>

bool fansi::detect_should_style() noexcept {
    auto no_color = std::getenv("NO_COLOR");
    if (no_color && *no_color) {
        return false;
    }
    return ::isatty(STDERR_FILENO) != 0;
}

using namespace fansi;

namespace {

constexpr text_style default_style{};

struct text_styler {
    std::string_view input;
    should_style     should;
    text_writer      out{};

    std::string_view::iterator s_iter = input.cbegin(), s_place = s_iter, s_stop = input.cend();

    bool do_style = (should == should_style::force)
        ? true
        : (should == should_style::never ? false : detect_should_style());

    std::vector<text_style> _style_stack = {default_style};

    std::string_view pending() const noexcept { return std::string_view(s_place, s_iter); }

    std::string render() noexcept {
        while (s_iter != s_stop) {
            if (*s_iter == '`') {
                out.write(pending());
                ++s_iter;
                if (s_iter == s_stop) {
                    // A trailing backtick has nothing to escape. Keep it.
                    out.putc('`');
                    s_place = s_iter;
                    break;
                }
                out.putc(*s_iter);
                ++s_iter;
                s_place = s_iter;
            } else if (*s_iter == '.') {
                out.write(pending());
                s_place = s_iter;
                ++s_iter;
                if (s_iter == s_stop || !std::isalpha(static_cast<unsigned char>(*s_iter))) {
                    continue;
                }
                s_place = s_iter;
                _push_style();
            } else if (*s_iter == ']' && _style_stack.size() > 1) {
                out.write(pending());
                s_place = ++s_iter;
                _pop_style();
            } else {
                ++s_iter;
            }
        }
        out.write(pending());
        return out.take_string();
    }

    void _push_style() noexcept {
        _read_style();
        neo_assert(expects,
                   s_iter != s_stop && *s_iter == '[',
                   "Style sequence should be followed by an opening square bracket",
                   input);
        if (do_style) {
            out.put_style(_style_stack.back());
        }
        s_place = ++s_iter;
    }

    void _read_style() noexcept {
        auto& style = _style_stack.emplace_back(_style_stack.back());
        while (s_iter != s_stop) {
            if (*s_iter == neo::oper::any_of('[', '.')) {
                _apply_class(style, pending());
                if (*s_iter == '[') {
                    return;
                }
                s_place = ++s_iter;
                continue;
            }
            ++s_iter;
        }
    }

    void _apply_class(text_style& style, std::string_view cls) const noexcept {
        if (auto color = magic_enum::enum_cast<std_color>(cls)) {
            style.fg_color = *color;
        }
#define CASE(Name)                                                                                 \
    else if (cls == #Name) {                                                                       \
        style.Name = true;                                                                         \
    }
        CASE(bold)
        CASE(faint)
        CASE(italic)
        CASE(underline)
        CASE(reverse)
        CASE(strike)
#undef CASE
        else if (cls == "br") {
            style.bright = true;
        }
        else {
            neo_assert(expects, false, "Invalid text style class in input string", cls, input);
        }
    }

    void _pop_style() noexcept {
        _style_stack.pop_back();
        if (do_style) {
            out.put_style(_style_stack.back());
        }
    }
};

}  // namespace

std::string fansi::stylize(std::string_view str, fansi::should_style should) {
    return text_styler{str, should}.render();
}

const std::string& detail::cached_rendering(const char* ptr) noexcept {
    thread_local std::map<const char*, std::string> cache;
    auto                                            found = cache.find(ptr);
    if (found == cache.end()) {
        found = cache.emplace(ptr, stylize(ptr)).first;
    }
    return found->second;
}
