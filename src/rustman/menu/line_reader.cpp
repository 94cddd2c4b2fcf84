#include "./line_reader.hpp"

#include <istream>

using namespace rustman;

std::optional<std::string> stream_line_reader::read_line() {
    std::string line;
    if (!std::getline(_in, line)) {
        return std::nullopt;
    }
    if (line.ends_with('\r')) {
        line.pop_back();
    }
    return line;
}
