#include "./cargo.hpp"

#include "./error.hpp"

#include <rustman/error/on_error.hpp>
#include <rustman/util/fs/io.hpp>

#include <boost/leaf/exception.hpp>
#include <fmt/core.h>
#include <toml++/toml.hpp>

using namespace rustman;

namespace {

std::optional<std::string> package_string(const toml::table& doc, std::string_view key) {
    auto str = doc["package"][key].value_exact<std::string>();
    if (str && str->empty()) {
        return std::nullopt;
    }
    return str;
}

}  // namespace

cargo_manifest cargo_manifest::from_string(std::string_view content, std::string_view source_name) {
    toml::table doc;
    try {
        doc = toml::parse(content, source_name);
    } catch (const toml::parse_error& err) {
        const auto line = static_cast<int>(err.source().begin.line);
        BOOST_LEAF_THROW_EXCEPTION(invalid_toml(fmt::format("{}:{}: {}",
                                                           source_name,
                                                           line,
                                                           err.description())),
                                   e_toml_parse_error{std::string(err.description())},
                                   e_toml_line{line});
    }
    return cargo_manifest{
        .name        = package_string(doc, "name"),
        .description = package_string(doc, "description"),
    };
}

cargo_manifest cargo_manifest::from_file(path_ref manifest_path) {
    RUSTMAN_E_SCOPE(e_cargo_manifest_path{manifest_path});
    auto content = rustman::read_file(manifest_path);
    return from_string(content, manifest_path.string());
}
