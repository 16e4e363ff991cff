// graph/matrix_io.h - Text rendering of dependency matrices
// Part of the decyc cyclic scheduling library (C++20)
//
// write_matrix prints a labelled 0/1 table, one row per node:
//
//        a  b  e  c  d
//     a  0  0  0  0  0
//     b  1  0  0  0  0
//     ...
//
// Cells are right-aligned to the widest label.  Row = downstream node,
// column = upstream node (the bool_matrix convention).

#ifndef DECYC_GRAPH_MATRIX_IO_H
#define DECYC_GRAPH_MATRIX_IO_H

#include "graph_concepts.h"
#include "graph_errors.h"
#include <decyc/core/bool_matrix.h>

#include <cstddef>
#include <iomanip>
#include <ostream>
#include <sstream>
#include <string>
#include <vector>

namespace decyc::graph::io {

/// Write `m` as a table headed by `labels` (one per row and column).
///
/// An empty matrix writes nothing.  Throws invalid_argument_value if
/// the label count differs from the matrix dimension.
template<node_label Node>
void write_matrix(std::ostream& os, bool_matrix const& m,
                  std::vector<Node> const& labels)
{
    if (m.empty()) {
        return;
    }
    if (labels.size() != m.size()) {
        throw invalid_argument_value("write_matrix: "
            + std::to_string(labels.size()) + " labels for a "
            + std::to_string(m.size()) + "x" + std::to_string(m.size())
            + " matrix");
    }

    std::vector<std::string> text;
    text.reserve(labels.size());
    std::size_t width = 1;
    for (auto const& n : labels) {
        std::ostringstream oss;
        oss << n;
        text.push_back(oss.str());
        if (text.back().size() > width) width = text.back().size();
    }

    auto const w = static_cast<int>(width);
    os << std::setw(w) << "";
    for (auto const& t : text) {
        os << ' ' << std::setw(w) << t;
    }
    os << '\n';

    for (std::size_t r = 0; r < m.size(); ++r) {
        os << std::setw(w) << text[r];
        for (std::size_t c = 0; c < m.size(); ++c) {
            os << ' ' << std::setw(w) << (m(r, c) ? 1 : 0);
        }
        os << '\n';
    }
}

/// Rows of 0/1 integers, for comparison against literal tables.
[[nodiscard]] inline std::vector<std::vector<int>> to_nested(bool_matrix const& m) {
    std::vector<std::vector<int>> rows(m.size(), std::vector<int>(m.size(), 0));
    for (std::size_t r = 0; r < m.size(); ++r) {
        for (std::size_t c = 0; c < m.size(); ++c) {
            rows[r][c] = m(r, c) ? 1 : 0;
        }
    }
    return rows;
}

} // namespace decyc::graph::io

#endif // DECYC_GRAPH_MATRIX_IO_H
