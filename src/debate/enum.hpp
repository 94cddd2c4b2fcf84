#pragma once

#include "./argument_parser.hpp"
#include "./error.hpp"

#include <boost/leaf/exception.hpp>
#include <magic_enum.hpp>

#include <algorithm>
#include <string>
#include <type_traits>

namespace debate {

/**
 * @brief Convert an enumerator identifier to the spelling used on the command line:
 * underscores become hyphens, and trailing underscores (used to dodge keywords) are dropped.
 */
inline std::string kebab_enum_name(std::string_view ident) {
    std::string ret{ident};
    std::ranges::replace(ret, '_', '-');
    auto trim_pos = ret.find_last_not_of('-');
    ret.erase(trim_pos == std::string::npos ? 0 : trim_pos + 1);
    return ret;
}

/// A comma-separated list of the command-line spellings of E's enumerators
template <typename E>
std::string enum_choices_string() {
    std::string ret;
    for (auto name : magic_enum::enum_names<E>()) {
        if (!ret.empty()) {
            ret.append(", ");
        }
        ret.append(kebab_enum_name(name));
    }
    return ret;
}

template <typename E>
class enum_putter {
    E* _dest;

public:
    constexpr explicit enum_putter(E& e)
        : _dest(&e) {}

    void operator()(std::string_view given, std::string_view full_arg) const {
        auto entries  = magic_enum::enum_entries<E>();
        auto matching = std::ranges::find(entries, given, [](auto&& p) {
            return kebab_enum_name(p.second);
        });
        if (matching == std::ranges::end(entries)) {
            BOOST_LEAF_THROW_EXCEPTION(invalid_arguments(
                                           "Invalid argument value given for enum-bound argument"),
                                       e_invalid_arg_value{std::string(given)},
                                       e_valid_arg_values{enum_choices_string<E>()},
                                       e_arg_spelling{std::string(full_arg)});
        }

        *_dest = matching->first;
    }
};

template <typename E>
constexpr auto make_enum_putter(E& dest) noexcept {
    return enum_putter<E>(dest);
}

}  // namespace debate
