#include "./argument.hpp"

#include <neo/ufmt.hpp>

#include <fmt/color.h>
#include <fmt/format.h>

using namespace debate;

using strv = std::string_view;

using namespace std::literals;

strv argument::try_match_short(strv given) const noexcept {
    for (auto& cand : short_spellings) {
        if (given.starts_with(cand)) {
            return cand;
        }
    }
    return "";
}

strv argument::try_match_long(strv given) const noexcept {
    for (auto& cand : long_spellings) {
        if (!given.starts_with(cand)) {
            continue;
        }
        auto tail = given.substr(cand.size());
        // Either '--argument value' or '--argument=value'
        if (tail.empty() || tail[0] == '=') {
            return cand;
        }
    }
    return "";
}

std::string argument::preferred_spelling() const noexcept {
    if (!long_spellings.empty()) {
        return "--"s + long_spellings.front();
    } else if (!short_spellings.empty()) {
        return "-"s + short_spellings.front();
    } else {
        return valname;
    }
}

std::vector<std::string> argument::all_spellings() const noexcept {
    std::vector<std::string> ret;
    for (auto& l : long_spellings) {
        ret.push_back("--"s + l);
    }
    for (auto& s : short_spellings) {
        ret.push_back("-"s + s);
    }
    return ret;
}

namespace {

std::string value_name(const argument& arg) {
    if (!arg.valname.empty()) {
        return arg.valname;
    }
    return arg.long_spellings.empty() ? "<value>" : ("<" + arg.long_spellings.front() + ">");
}

}  // namespace

std::string argument::syntax_string() const noexcept {
    auto pref_spell = preferred_spelling();
    if (nargs == 0) {
        return neo::ufmt("[{}]", pref_spell);
    }
    char sep_char = pref_spell.starts_with("--") ? '=' : ' ';
    auto one      = neo::ufmt("{}{}{}", pref_spell, sep_char, value_name(*this));
    if (required) {
        return can_repeat ? neo::ufmt("{} [{} [...]]", one, one) : one;
    }
    return can_repeat ? neo::ufmt("[{} [{} [...]]]", one, one) : neo::ufmt("[{}]", one);
}

std::string argument::help_string() const noexcept {
    std::string ret;
    auto        valstr = value_name(*this);
    for (auto& l : long_spellings) {
        ret.append(fmt::format(fmt::emphasis::bold, "--{}", l));
        if (nargs != 0) {
            ret.append(fmt::format(fmt::emphasis::italic, "={}", valstr));
        }
        ret.push_back('\n');
    }
    for (auto& s : short_spellings) {
        ret.append(fmt::format(fmt::emphasis::bold, "-{}", s));
        if (nargs != 0) {
            ret.append(fmt::format(fmt::emphasis::italic, " {}", valstr));
        }
        ret.push_back('\n');
    }
    ret.append("  ");
    for (auto c : help) {
        ret.push_back(c);
        if (c == '\n') {
            ret.append(2, ' ');
        }
    }
    ret.push_back('\n');
    return ret;
}
