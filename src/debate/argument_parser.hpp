#pragma once

#include "./argument.hpp"

#include <fmt/format.h>
#include <neo/assert.hpp>

#include <initializer_list>
#include <list>
#include <string>
#include <string_view>

namespace debate {

class argument_parser;

namespace detail {

struct parser_state {
    void run(const argument_parser& parser);

    virtual std::string_view current_arg() const noexcept = 0;
    virtual bool             at_end() const noexcept      = 0;
    virtual void             shift() noexcept             = 0;
};

template <typename Iter, typename Stop>
struct parser_state_impl : parser_state {
    Iter arg_it;
    Stop arg_stop;

    parser_state_impl(Iter it, Stop st)
        : arg_it(it)
        , arg_stop(st) {}

    bool             at_end() const noexcept override { return arg_it == arg_stop; }
    std::string_view current_arg() const noexcept override {
        neo_assert(invariant, !at_end(), "Get argument past the final argument?");
        return *arg_it;
    }
    void shift() noexcept override {
        neo_assert(invariant, !at_end(), "Advancing argv parser past the end.");
        ++arg_it;
    }
};

}  // namespace detail

/**
 * @brief A parser for a flat set of named options.
 *
 * Options are spelled '--long', '--long=value', '--long value', '-s', '-svalue', or '-s value'.
 * Short switches may be grouped, as in '-abc'. '--help' and '-h' are always recognized and
 * raise help_request. Bare words are not accepted.
 */
class argument_parser {
    std::list<argument> _arguments;
    std::string         _description;

    template <typename R>
    void _parse_argv(R&& range) const {
        auto arg_it   = std::cbegin(range);
        auto arg_stop = std::cend(range);
        detail::parser_state_impl state{arg_it, arg_stop};
        state.run(*this);
    }

public:
    argument_parser() = default;

    explicit argument_parser(std::string description)
        : _description(std::move(description)) {}

    argument& add_argument(argument arg) noexcept;

    std::string usage_string(std::string_view progname) const noexcept;

    std::string help_string(std::string_view progname) const noexcept;

    /// Every option spelling this parser accepts, including '--help' and '-h'
    std::vector<std::string> all_spellings() const noexcept;

    template <typename T>
    void parse_argv(T&& range) const {
        return _parse_argv(range);
    }

    template <typename T>
    void parse_argv(std::initializer_list<T> ilist) const {
        return _parse_argv(ilist);
    }

    auto& arguments() const noexcept { return _arguments; }
};

}  // namespace debate
