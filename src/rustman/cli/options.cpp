#include "./options.hpp"

#include <rustman/util/env.hpp>
#include <rustman/util/paths.hpp>

#include <debate/enum.hpp>
#include <fansi/styled.hpp>
#include <magic_enum.hpp>

using namespace rustman;
using namespace debate;
using namespace fansi::literals;

namespace {

/// Read an enum-valued default from the environment, spelled as on the command line
template <typename E>
E enum_from_env(const std::string& key, E def) noexcept {
    auto env = rustman::getenv(key);
    if (!env.has_value()) {
        return def;
    }
    for (auto [value, name] : magic_enum::enum_entries<E>()) {
        if (kebab_enum_name(name) == *env) {
            return value;
        }
    }
    rustman_log(warn,
                "Ignoring invalid value '.bold.yellow[{}]' for .bold[{}] (expected one of: {})"_styled,
                *env,
                key,
                enum_choices_string<E>());
    return def;
}

}  // namespace

cli::options::options() noexcept
    : scan_dir(default_projects_dir()) {}

log::level cli::options::default_from_env(std::string key, log::level def) noexcept {
    return enum_from_env(key, def);
}

bad_manifest_policy cli::options::default_from_env(std::string         key,
                                                   bad_manifest_policy def) noexcept {
    return enum_from_env(key, def);
}

void cli::options::setup_parser(debate::argument_parser& parser) noexcept {
    parser.add_argument({
        .long_spellings  = {"list"},
        .short_spellings = {"l"},
        .help            = "List the projects in the projects directory and choose one to\n"
                           "inspect. This is the default action.",
        .nargs           = 0,
        .action          = store_true(list),
    });
    parser.add_argument({
        .long_spellings  = {"dir"},
        .short_spellings = {"d"},
        .help            = "The directory to search for projects. Each immediate\n"
                           "subdirectory with a Cargo.toml is a project. Defaults to\n"
                           "$RUSTMAN_DIR, or ~/rust",
        .valname         = "<dir>",
        .action          = put_into(scan_dir),
    });
    parser.add_argument({
        .long_spellings  = {"log-level"},
        .short_spellings = {"L"},
        .help            = "Set the logging level. One of 'trace', 'debug', 'info', \n"
                           "'warn', 'error', 'critical', or 'silent'",
        .valname         = "<level>",
        .action          = put_into(log_level),
    });
    parser.add_argument({
        .long_spellings = {"on-bad-manifest"},
        .help           = "What to do with a project whose Cargo.toml cannot be read.\n"
                          "\n"
                          "fallback:\n  List it under its directory name, without a description.\n"
                          "  This is the default.\n\n"
                          "skip:\n  Leave it out of the listing.",
        .valname        = "{fallback,skip}",
        .action         = put_into(on_bad_manifest),
    });
    parser.add_argument({
        .long_spellings  = {"version"},
        .short_spellings = {"V"},
        .help            = "Print the version of rustman and exit",
        .nargs           = 0,
        .action          = store_true(show_version),
    });
}
