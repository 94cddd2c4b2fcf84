#include "./signal.hpp"

#include <catch2/catch.hpp>

#include <csignal>

TEST_CASE("A fresh flag is not cancelled") {
    rustman::cancellation_flag flag;
    CHECK_FALSE(flag.is_cancelled());
    CHECK(flag.signal_number() == 0);
    CHECK_NOTHROW(flag.cancellation_point());
}

TEST_CASE("Raising a signal sets the installed flag") {
    rustman::cancellation_flag flag;
    rustman::install_signal_handlers(flag);
    std::raise(SIGTERM);
    CHECK(flag.is_cancelled());
    CHECK(flag.signal_number() == SIGTERM);
    CHECK_THROWS_AS(flag.cancellation_point(), rustman::user_cancelled);
}
