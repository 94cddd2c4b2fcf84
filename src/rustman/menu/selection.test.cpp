#include "./selection.hpp"

#include <catch2/catch.hpp>

using namespace rustman;

TEST_CASE("Parse menu selections") {
    struct case_ {
        std::string_view input;
        selection_kind   kind;
        std::size_t      index;
        invalid_reason   why;
    };

    auto [input, kind, index, why] = GENERATE(Catch::Generators::values<case_>({
        {"q", selection_kind::quit, 0, invalid_reason::none},
        {"Q", selection_kind::quit, 0, invalid_reason::none},
        {"  q \n", selection_kind::quit, 0, invalid_reason::none},
        {"1", selection_kind::index, 0, invalid_reason::none},
        {" 3 ", selection_kind::index, 2, invalid_reason::none},
        {"+2", selection_kind::index, 1, invalid_reason::none},
        {"5", selection_kind::index, 4, invalid_reason::none},
        {"6", selection_kind::invalid, 0, invalid_reason::out_of_range},
        {"0", selection_kind::invalid, 0, invalid_reason::out_of_range},
        {"-1", selection_kind::invalid, 0, invalid_reason::not_a_number},
        {"abc", selection_kind::invalid, 0, invalid_reason::not_a_number},
        {"", selection_kind::invalid, 0, invalid_reason::not_a_number},
        {"   ", selection_kind::invalid, 0, invalid_reason::not_a_number},
        {"2x", selection_kind::invalid, 0, invalid_reason::not_a_number},
        {"1 2", selection_kind::invalid, 0, invalid_reason::not_a_number},
        {"quit", selection_kind::invalid, 0, invalid_reason::not_a_number},
        {"99999999999999999999999", selection_kind::invalid, 0, invalid_reason::not_a_number},
    }));

    INFO("Input: '" << input << "'");
    auto sel = selection::parse(input, 5);
    CHECK(sel.kind == kind);
    if (kind == selection_kind::index) {
        CHECK(sel.index == index);
    }
    if (kind == selection_kind::invalid) {
        CHECK(sel.why == why);
    }
}

TEST_CASE("Selection bounds follow the listing length") {
    for (std::size_t count : {1u, 2u, 10u}) {
        auto last = selection::parse(std::to_string(count), count);
        CHECK(last.kind == selection_kind::index);
        CHECK(last.index == count - 1);

        auto past = selection::parse(std::to_string(count + 1), count);
        CHECK(past.kind == selection_kind::invalid);
        CHECK(past.why == invalid_reason::out_of_range);
    }
}

TEST_CASE("Nothing is selectable from an empty listing") {
    CHECK(selection::parse("1", 0).kind == selection_kind::invalid);
    CHECK(selection::parse("q", 0).kind == selection_kind::quit);
}
