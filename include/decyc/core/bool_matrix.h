// core/bool_matrix.h - Square runtime boolean matrix
// Part of the decyc cyclic scheduling library (C++20)
//
// Dependency matrices are square, indexed on both axes by the stable
// node index of one graph snapshot.  bool_matrix owns n*n cells in a
// single row-major std::vector; the dimension is fixed at construction.
//
// Convention used by every producer in the library:
//   cell(row, col) == true  <=>  node `row` depends on node `col`
// i.e. the column is upstream, the row is downstream.

#ifndef DECYC_CORE_BOOL_MATRIX_H
#define DECYC_CORE_BOOL_MATRIX_H

#include <cstddef>
#include <cstdint>
#include <stdexcept>
#include <string>
#include <vector>

namespace decyc {

/// Fixed-dimension square boolean matrix.
///
/// A default-constructed matrix has dimension 0 and is "empty"; the
/// builders return an empty matrix for an empty graph and for an
/// inter-iteration matrix without removed edges.
class bool_matrix {
public:
    bool_matrix() = default;

    /// Construct an n x n matrix with every cell false.
    explicit bool_matrix(std::size_t n)
        : n_(n), cells_(n * n, std::uint8_t{0}) {}

    // -----------------------------------------------------------------
    // Size queries
    // -----------------------------------------------------------------

    [[nodiscard]] std::size_t size() const noexcept { return n_; }
    [[nodiscard]] bool empty() const noexcept { return n_ == 0; }

    // -----------------------------------------------------------------
    // Element access
    // -----------------------------------------------------------------

    [[nodiscard]] bool operator()(std::size_t row, std::size_t col) const noexcept {
        return cells_[row * n_ + col] != 0;
    }

    [[nodiscard]] bool at(std::size_t row, std::size_t col) const {
        check(row, col, "bool_matrix::at");
        return (*this)(row, col);
    }

    void set(std::size_t row, std::size_t col, bool value = true) {
        check(row, col, "bool_matrix::set");
        cells_[row * n_ + col] = value ? std::uint8_t{1} : std::uint8_t{0};
    }

    // -----------------------------------------------------------------
    // Row / column queries
    // -----------------------------------------------------------------

    /// True if any cell in `row` is set (the row's node has an upstream).
    [[nodiscard]] bool row_any(std::size_t row) const noexcept {
        for (std::size_t c = 0; c < n_; ++c) {
            if (cells_[row * n_ + c] != 0) return true;
        }
        return false;
    }

    /// True if any cell in `col` is set (the column's node has a downstream).
    [[nodiscard]] bool column_any(std::size_t col) const noexcept {
        for (std::size_t r = 0; r < n_; ++r) {
            if (cells_[r * n_ + col] != 0) return true;
        }
        return false;
    }

    /// Number of set cells in `row`.
    [[nodiscard]] std::size_t row_count(std::size_t row) const noexcept {
        std::size_t count = 0;
        for (std::size_t c = 0; c < n_; ++c) {
            if (cells_[row * n_ + c] != 0) ++count;
        }
        return count;
    }

    /// Total number of set cells.
    [[nodiscard]] std::size_t count() const noexcept {
        std::size_t total = 0;
        for (auto cell : cells_) {
            if (cell != 0) ++total;
        }
        return total;
    }

    // -----------------------------------------------------------------
    // Comparison
    // -----------------------------------------------------------------

    [[nodiscard]] bool operator==(bool_matrix const& other) const {
        return n_ == other.n_ && cells_ == other.cells_;
    }

private:
    void check(std::size_t row, std::size_t col, char const* where) const {
        if (row >= n_ || col >= n_)
            throw std::out_of_range(std::string(where) + ": cell ("
                + std::to_string(row) + ", " + std::to_string(col)
                + ") outside " + std::to_string(n_) + "x"
                + std::to_string(n_) + " matrix");
    }

    std::size_t n_ = 0;
    std::vector<std::uint8_t> cells_{};
};

} // namespace decyc

#endif // DECYC_CORE_BOOL_MATRIX_H
