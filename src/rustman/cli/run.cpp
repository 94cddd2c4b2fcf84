#include "./run.hpp"

#include "./dispatch_main.hpp"
#include "./options.hpp"

#include <rustman/util/dym.hpp>
#include <rustman/util/log.hpp>

#include <debate/debate.hpp>
#include <debate/enum.hpp>

#include <boost/leaf/handle_errors.hpp>
#include <fansi/styled.hpp>
#include <fmt/ostream.h>

#include <optional>
#include <ostream>

using namespace rustman;
using namespace fansi::literals;

int cli::run(std::string_view                program_name,
             const std::vector<std::string>& argv,
             const cancellation_flag&        cancel,
             std::ostream&                   out,
             std::ostream&                   err) {
    options                 opts;
    debate::argument_parser parser{"Browse the Rust projects in a directory"};
    opts.setup_parser(parser);

    auto result = boost::leaf::try_catch(
        [&]() -> std::optional<int> {
            parser.parse_argv(argv);
            return std::nullopt;
        },
        [&](debate::help_request) {
            out << parser.help_string(program_name);
            return 0;
        },
        [&](debate::unrecognized_argument,
            debate::e_argument_parser p,
            debate::e_arg_spelling    arg) {
            err << p.value.usage_string(program_name) << '\n';
            fmt::print(err,
                       fmt::runtime("Unrecognized argument: \".bold.red[{}]\"\n"_styled),
                       arg.value);
            auto spelling = std::string_view(arg.value).substr(0, arg.value.find('='));
            if (auto dym = rustman::did_you_mean(spelling, p.value.all_spellings())) {
                fmt::print(err, fmt::runtime("  (Did you mean '.br.yellow[{}]'?)\n"_styled), *dym);
            }
            return 2;
        },
        [&](debate::invalid_arguments,
            debate::e_argument_parser         p,
            debate::e_arg_spelling            spell,
            debate::e_invalid_arg_value       val,
            debate::e_valid_arg_values const* valid) {
            err << p.value.usage_string(program_name) << '\n';
            fmt::print(err, "Invalid value '{}' given for '{}'\n", val.value, spell.value);
            if (valid) {
                fmt::print(err, "  (Expected one of: {})\n", valid->value);
            }
            return 2;
        },
        [&](debate::invalid_arguments,
            debate::e_argument_parser p,
            debate::e_arg_spelling    spell,
            debate::e_argument        arg,
            debate::e_wrong_val_num   given) {
            err << p.value.usage_string(program_name) << '\n';
            if (arg.value.nargs == 0) {
                fmt::print(err,
                           "Argument '{}' does not expect any values, but was given one\n",
                           spell.value);
            } else {
                fmt::print(err,
                           "Argument '{}' expected to be given a value, but received {}\n",
                           spell.value,
                           given.value == 0 ? "none" : "too many");
            }
            return 2;
        },
        [&](debate::invalid_repetition, debate::e_argument_parser p, debate::e_arg_spelling sp) {
            fmt::print(err,
                       "{}\nArgument '{}' cannot be provided more than once\n",
                       p.value.usage_string(program_name),
                       sp.value);
            return 2;
        },
        [&](debate::invalid_arguments const& exc, debate::e_argument_parser p) {
            fmt::print(err,
                       "{}\nError: {}\n",
                       p.value.usage_string(program_name),
                       exc.what());
            return 2;
        });
    if (result) {
        // Non-null result from argument parsing, return that value immediately.
        return *result;
    }

    rustman::log::current_log_level = opts.log_level;
    return dispatch_main(opts, cancel);
}
