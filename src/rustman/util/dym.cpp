#include "./dym.hpp"

#include <range/v3/algorithm/min_element.hpp>
#include <range/v3/view/cartesian_product.hpp>
#include <range/v3/view/iota.hpp>

#include <array>
#include <vector>

using namespace rustman;

std::size_t rustman::lev_edit_distance(std::string_view a, std::string_view b) noexcept {
    const auto n_rows    = b.size() + 1;
    const auto n_columns = a.size() + 1;

    std::vector<std::vector<std::size_t>> matrix(n_rows, std::vector<std::size_t>(n_columns, 0));

    auto row_iter = ranges::views::iota(std::size_t{1}, n_rows);
    auto col_iter = ranges::views::iota(std::size_t{1}, n_columns);

    for (auto n : col_iter) {
        matrix[0][n] = n;
    }
    for (auto n : row_iter) {
        matrix[n][0] = n;
    }

    for (auto [row, col] : ranges::views::cartesian_product(row_iter, col_iter)) {
        std::size_t cost = a[col - 1] == b[row - 1] ? 0 : 1;

        auto options = std::array{
            matrix[row - 1][col] + 1,
            matrix[row][col - 1] + 1,
            matrix[row - 1][col - 1] + cost,
        };
        matrix[row][col] = *ranges::min_element(options);
    }

    return matrix.back().back();
}
