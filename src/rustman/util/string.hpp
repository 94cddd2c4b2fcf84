#pragma once

#include <cctype>
#include <iterator>
#include <string>
#include <string_view>

namespace rustman {

inline namespace string_utils {

inline std::string_view sview(std::string_view::const_iterator beg,
                              std::string_view::const_iterator end) {
    return std::string_view(beg, end);
}

inline std::string_view trim_view(std::string_view s) {
    auto iter = s.begin();
    auto end  = s.end();
    while (iter != end && std::isspace(static_cast<unsigned char>(*iter))) {
        ++iter;
    }
    auto riter = s.rbegin();
    auto rend  = std::make_reverse_iterator(iter);
    while (riter != rend && std::isspace(static_cast<unsigned char>(*riter))) {
        ++riter;
    }
    return sview(iter, riter.base());
}

inline std::string to_lower(std::string_view s) {
    std::string ret;
    ret.reserve(s.size());
    for (auto c : s) {
        ret.push_back(static_cast<char>(std::tolower(static_cast<unsigned char>(c))));
    }
    return ret;
}

}  // namespace string_utils

}  // namespace rustman
