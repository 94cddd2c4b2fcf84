#pragma once

#include <boost/leaf.hpp>

#include <tuple>
#include <type_traits>

namespace rustman {

/**
 * @brief A try-block plus the handlers attached to it so far.
 *
 * Built up by the rustman_leaf_try and rustman_leaf_catch macros, and executed with
 * boost::leaf::try_catch (or try_handle_all, if the try-block returns a leaf result<>) once the
 * final handler has been attached.
 */
template <typename Try, typename... Handlers>
struct leaf_handler_seq {
    using result_type = std::invoke_result_t<Try>;
    Try& try_block;

    std::tuple<Handlers&...> handlers{};

    template <typename Catch>
    constexpr auto operator*(Catch c) const noexcept {
        return leaf_handler_seq<Try, Handlers..., typename Catch::handler_type>{
            try_block, std::tuple_cat(handlers, std::tie(c.h))};
    }

    constexpr decltype(auto) invoke() const {
        static_assert(sizeof...(Handlers) != 0,
                      "rustman_leaf_try requires one or more rustman_leaf_catch blocks");
        return std::apply(
            [&](auto&... hs) {
                if constexpr (boost::leaf::is_result_type<result_type>::value) {
                    return boost::leaf::try_handle_all(try_block, hs...);
                } else {
                    return boost::leaf::try_catch(try_block, hs...);
                }
            },
            handlers);
    }
};

struct leaf_make_try_block {
    template <typename Func>
    constexpr decltype(auto) operator->*(Func&& block) const {
        return leaf_handler_seq<Func>{block};
    }
};

template <typename H>
struct leaf_catch_block {
    using handler_type = H;

    handler_type& h;

    leaf_catch_block(H& h)
        : h(h) {}
};

struct leaf_make_catch_block {
    template <typename Func>
    constexpr decltype(auto) operator->*(Func&& block) const {
        return leaf_catch_block<std::remove_cvref_t<Func>>{block};
    }
};

struct leaf_exec_try_catch_sequence {
    template <typename Try, typename... Handlers>
    constexpr decltype(auto) operator+(const leaf_handler_seq<Try, Handlers...> seq) const {
        return seq.invoke();
    }
};

}  // namespace rustman

/**
 * @brief Create a try {} block that handles all errors using Boost.LEAF
 */
#define rustman_leaf_try                                                                           \
    ::rustman::leaf_exec_try_catch_sequence{} + ::rustman::leaf_make_try_block{}->*[&]()

/**
 * @brief Create an error handling block for Boost.LEAF
 */
#define rustman_leaf_catch *::rustman::leaf_make_catch_block{}->*[&]

#define rustman_leaf_catch_all                                                                     \
    rustman_leaf_catch(::boost::leaf::verbose_diagnostic_info const& diagnostic_info            \
                       [[maybe_unused]])
