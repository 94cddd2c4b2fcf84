#include "./argument_parser.hpp"

#include <boost/leaf/error.hpp>
#include <boost/leaf/exception.hpp>
#include <boost/leaf/on_error.hpp>

#include <fmt/format.h>

#include <set>

using strv = std::string_view;

using namespace debate;

namespace {

struct parse_engine {
    debate::detail::parser_state& state;
    const argument_parser&        parser;

    std::set<const argument*> seen{};

    auto current_arg() const noexcept { return state.current_arg(); }
    auto at_end() const noexcept { return state.at_end(); }
    void shift() noexcept { return state.shift(); }

    void see(const argument& arg) {
        auto did_insert = seen.insert(&arg).second;
        if (!did_insert && !arg.can_repeat) {
            BOOST_LEAF_THROW_EXCEPTION(invalid_repetition("Invalid repetition"));
        }
    }

    void run() {
        auto _ = boost::leaf::on_error([this] { return e_argument_parser{parser}; });
        while (!at_end()) {
            parse_another();
        }
        finalize();
    }

    void parse_another() {
        auto given     = current_arg();
        auto did_parse = try_parse_given(given);
        if (!did_parse) {
            BOOST_LEAF_THROW_EXCEPTION(unrecognized_argument("Unrecognized argument"),
                                       e_arg_spelling{std::string(given)});
        }
    }

    bool try_parse_given(const strv given) {
        if (given.size() < 2 || given[0] != '-') {
            // No positional arguments
            return false;
        } else if (given[1] == '-') {
            return try_parse_long(given.substr(2));
        } else {
            return try_parse_short(given.substr(1));
        }
    }

    bool try_parse_long(strv tail) {
        if (tail == "help") {
            BOOST_LEAF_THROW_EXCEPTION(help_request());
        }
        for (const argument& cand : parser.arguments()) {
            auto matched = cand.try_match_long(tail);
            if (matched.empty()) {
                continue;
            }
            tail.remove_prefix(matched.size());
            shift();
            auto long_arg = fmt::format("--{}", matched);
            auto _        = boost::leaf::on_error(e_argument{cand}, e_arg_spelling{long_arg});
            see(cand);
            dispatch_long(cand, tail, long_arg);
            return true;
        }
        return false;
    }

    void dispatch_long(const argument& arg, strv tail, strv given) {
        if (arg.nargs == 0) {
            if (!tail.empty()) {
                BOOST_LEAF_THROW_EXCEPTION(invalid_arguments("Argument does not expect a value"),
                                           e_wrong_val_num{1});
            }
            arg.action(given, given);
            return;
        }
        neo_assert(invariant,
                   tail.empty() || tail[0] == '=',
                   "Invalid argparsing state",
                   tail,
                   given);
        if (!tail.empty()) {
            // '--long-option=value'
            tail.remove_prefix(1);
            arg.action(tail, given);
            return;
        }
        // '--long-option value'
        if (at_end()) {
            BOOST_LEAF_THROW_EXCEPTION(invalid_arguments("Expected a value"), e_wrong_val_num{0});
        }
        arg.action(current_arg(), given);
        shift();
    }

    bool try_parse_short(strv tail) {
        if (tail == "h") {
            BOOST_LEAF_THROW_EXCEPTION(help_request());
        }
        while (!tail.empty()) {
            auto new_tail = try_parse_short_1(tail);
            if (new_tail.size() == tail.size()) {
                // Nothing in the group matched
                return false;
            }
            tail = new_tail;
        }
        return true;
    }

    /// Consume one argument from the front of a group of short switches, returning the rest
    strv try_parse_short_1(const strv tail) {
        for (const argument& cand : parser.arguments()) {
            auto matched = cand.try_match_short(tail);
            if (matched.empty()) {
                continue;
            }
            auto short_tail = tail.substr(matched.size());
            auto short_arg  = fmt::format("-{}", matched);
            auto _          = boost::leaf::on_error(e_argument{cand}, e_arg_spelling{short_arg});
            see(cand);
            return dispatch_short(cand, short_tail, short_arg);
        }
        return tail;
    }

    strv dispatch_short(const argument& arg, strv tail, strv spelling) {
        if (!arg.nargs) {
            // Just a switch. Consume a single character
            arg.action("", spelling);
            if (tail.empty()) {
                shift();
            }
            return tail;
        }
        if (tail.empty()) {
            // The next argument is the value
            shift();
            if (at_end()) {
                BOOST_LEAF_THROW_EXCEPTION(invalid_arguments("Expected a value"),
                                           e_wrong_val_num{0});
            }
            arg.action(current_arg(), spelling);
        } else {
            // The remainder of the argument is the value, as in '-Ltrace'
            arg.action(tail, spelling);
        }
        shift();
        return "";
    }

    void finalize() {
        for (auto& arg : parser.arguments()) {
            if (arg.required && !seen.contains(&arg)) {
                BOOST_LEAF_THROW_EXCEPTION(missing_required("Required argument is missing"),
                                           e_argument{arg});
            }
        }
    }
};

}  // namespace

void debate::detail::parser_state::run(const argument_parser& parser) {
    parse_engine{*this, parser}.run();
}

argument& argument_parser::add_argument(argument arg) noexcept {
    neo_assert(expects,
               !arg.is_positional(),
               "Arguments must have at least one long or short spelling",
               arg.valname);
    neo_assert(expects,
               arg.nargs == 0 || arg.nargs == 1,
               "Arguments take either no value or exactly one value",
               arg.preferred_spelling(),
               arg.nargs);
    _arguments.push_back(std::move(arg));
    return _arguments.back();
}

std::vector<std::string> argument_parser::all_spellings() const noexcept {
    std::vector<std::string> ret = {"--help", "-h"};
    for (auto& arg : _arguments) {
        for (auto& sp : arg.all_spellings()) {
            ret.push_back(std::move(sp));
        }
    }
    return ret;
}

std::string argument_parser::usage_string(std::string_view progname) const noexcept {
    auto ret    = fmt::format("Usage: {}", progname);
    auto indent = ret.size() + 1;
    if (indent > 40) {
        ret.push_back('\n');
        indent = 10;
        ret.append(indent, ' ');
    }

    std::size_t col = indent;
    for (auto& arg : _arguments) {
        auto synstr = arg.syntax_string();
        if (col + synstr.size() > 79 && col > indent) {
            ret.append("\n");
            ret.append(indent - 1, ' ');
            col = indent - 1;
        }
        ret.append(" " + synstr);
        col += synstr.size() + 1;
    }
    return ret;
}

std::string argument_parser::help_string(std::string_view progname) const noexcept {
    std::string ret = usage_string(progname);
    ret.append("\n\n");
    if (!_description.empty()) {
        ret.append(_description);
        ret.append("\n\n");
    }
    auto append_group = [&](std::string_view heading, bool want_required) {
        bool any = false;
        for (auto& arg : arguments()) {
            if (arg.required != want_required) {
                continue;
            }
            if (!any) {
                ret.append(heading);
                ret.append(":\n\n");
            }
            any = true;
            ret.append(arg.help_string());
            ret.append("\n");
        }
    };
    append_group("required arguments", true);
    append_group("optional arguments", false);
    return ret;
}
