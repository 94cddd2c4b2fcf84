#include "./path.hpp"

#include <boost/leaf/result.hpp>

using namespace rustman;

fs::path rustman::normalize_path(path_ref p_) noexcept {
    auto p = p_.lexically_normal();
    while (!p.empty() && p.filename().empty() && p != p.root_path()) {
        p = p.parent_path();
    }
    return p;
}

result<fs::path> rustman::resolve_path_strong(path_ref p_) noexcept {
    std::error_code ec;
    auto            p = fs::canonical(p_, ec);
    if (ec) {
        return boost::leaf::new_error(ec, e_resolve_path{p_});
    }
    return normalize_path(p);
}
