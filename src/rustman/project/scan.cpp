#include "./scan.hpp"

#include "./error.hpp"

#include <rustman/error/on_error.hpp>
#include <rustman/error/result.hpp>
#include <rustman/error/try_catch.hpp>
#include <rustman/manifest/cargo.hpp>
#include <rustman/manifest/error.hpp>
#include <rustman/util/fs/io.hpp>
#include <rustman/util/log.hpp>
#include <rustman/util/signal.hpp>

#include <boost/leaf/exception.hpp>
#include <fansi/styled.hpp>
#include <neo/ufmt.hpp>

#include <system_error>

using namespace rustman;
using namespace fansi::literals;

namespace {

[[noreturn]] void throw_scan_error(std::error_code ec, path_ref dir, std::string_view what) {
    BOOST_LEAF_THROW_EXCEPTION(std::system_error(ec, neo::ufmt("{} [{}]", what, dir.string())),
                               ec);
}

std::optional<project_info> recover_bad_manifest(path_ref dir, bad_manifest_policy policy) {
    if (policy == bad_manifest_policy::skip) {
        rustman_log(warn, "  (The directory [{}] will not be listed)", dir.string());
        return std::nullopt;
    }
    auto name = dir.filename().string();
    rustman_log(warn, "  (Listing it as '{}' without a description)", name);
    return project_info{
        .name        = std::move(name),
        .description = std::nullopt,
        .path        = dir,
    };
}

std::optional<project_info>
load_project(path_ref dir, path_ref manifest_path, bad_manifest_policy policy) {
    return rustman_leaf_try->std::optional<project_info> {
        auto man = cargo_manifest::from_file(manifest_path);
        if (!man.name) {
            rustman_log(debug,
                        "Manifest [{}] does not declare a package name. Using the directory name.",
                        manifest_path.string());
        }
        return project_info{
            .name        = man.name.value_or(dir.filename().string()),
            .description = std::move(man.description),
            .path        = dir,
        };
    }
    rustman_leaf_catch(e_toml_parse_error err, e_toml_line line)->std::optional<project_info> {
        rustman_log(warn,
                    "Invalid manifest [.bold.yellow[{}]] at line {}: .bold.red[{}]"_styled,
                    manifest_path.string(),
                    line.value,
                    err.value);
        return recover_bad_manifest(dir, policy);
    }
    rustman_leaf_catch(const std::system_error& e, e_read_file_path)->std::optional<project_info> {
        rustman_log(warn,
                    "Unable to read manifest [.bold.yellow[{}]]: .bold.red[{}]"_styled,
                    manifest_path.string(),
                    e.code().message());
        return recover_bad_manifest(dir, policy);
    };
}

bool has_miscased_manifest(path_ref dir) {
    std::error_code ec;
    return fs::exists(dir / "cargo.toml", ec);
}

}  // namespace

std::vector<project_info> rustman::scan_projects(const scan_params& params) {
    RUSTMAN_E_SCOPE(e_scan_directory{params.root});
    auto root = resolve_path_strong(params.root).value();

    std::error_code ec;
    if (!fs::is_directory(root, ec)) {
        throw_scan_error(ec ? ec : std::make_error_code(std::errc::not_a_directory),
                         root,
                         "Not a directory");
    }

    rustman_log(debug, "Scanning for projects in [{}]", root.string());
    std::vector<project_info> ret;
    auto                      iter = fs::directory_iterator{root, ec};
    for (; !ec && iter != fs::directory_iterator{}; iter.increment(ec)) {
        if (params.cancel) {
            params.cancel->cancellation_point();
        }
        const fs::directory_entry& entry = *iter;
        RUSTMAN_E_SCOPE(e_scan_entry{entry.path()});

        std::error_code entry_ec;
        if (!entry.is_directory(entry_ec)) {
            continue;
        }
        auto manifest_path = entry.path() / CARGO_MANIFEST_FILENAME;
        if (!fs::exists(manifest_path, entry_ec)) {
            if (entry_ec) {
                rustman_log(warn,
                            "Unable to check [{}] for a project manifest: {}",
                            entry.path().string(),
                            entry_ec.message());
            } else if (has_miscased_manifest(entry.path())) {
                rustman_log(warn,
                            "There's a [cargo.toml] file in [{}], but Cargo expects the name "
                            "'Cargo.toml'. The directory will be ignored.",
                            entry.path().string());
            } else {
                rustman_log(trace, "No manifest in [{}]", entry.path().string());
            }
            continue;
        }

        auto proj = load_project(entry.path(), manifest_path, params.on_bad_manifest);
        if (proj) {
            rustman_log(debug, "Found project '{}' in [{}]", proj->name, proj->path.string());
            ret.push_back(std::move(*proj));
        }
    }
    if (ec) {
        throw_scan_error(ec, root, "Failed to list the contents of directory");
    }
    return ret;
}
