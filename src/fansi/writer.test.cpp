#include <fansi/writer.hpp>

#include <catch2/catch.hpp>

TEST_CASE("Write a string") {
    fansi::text_writer wr;
    wr.write("foo");
    wr.putc('!');
    CHECK(wr.string() == "foo!");
    CHECK(wr.visual_size() == 4);
}

TEST_CASE("Style changes are not visible characters") {
    fansi::text_writer wr;
    wr.put_style(fansi::text_style{.fg_color = fansi::std_color::green, .bold = true});
    wr.write("ok");
    wr.put_style(fansi::text_style{});
    CHECK(wr.string() == "\x1b[1;32mok\x1b[0m");
    CHECK(wr.visual_size() == 2);
}
