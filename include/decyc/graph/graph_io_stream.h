// graph/graph_io_stream.h - Runtime stream-based edge-list I/O
// Part of the decyc cyclic scheduling library (C++20)
//
// Stream-based reading and writing of graphs in the edge-list format.
// Uses <istream> and <ostream> - NOT <iostream> - to avoid pulling
// in static initialisation of std::cin/cout/cerr/clog.
//
// For parsing from a string or a range of lines, use graph_io_parse.h.

#ifndef DECYC_GRAPH_IO_STREAM_H
#define DECYC_GRAPH_IO_STREAM_H

#include "digraph.h"
#include "graph_concepts.h"
#include "graph_io_parse.h"

#include <cstddef>
#include <istream>
#include <ostream>
#include <string>

namespace decyc::graph::io {

// =============================================================================
// Runtime I/O: stream-based writing
// =============================================================================

/// Write every edge as "SRC DST", one per line, in digraph::edges() order.
///
/// Isolated nodes have no edge-list representation and are not written.
template<labelled_graph G>
void write_edge_list(std::ostream& os, G const& g) {
    for (std::size_t u = 0; u < g.node_count(); ++u) {
        for (auto v : g.out_indices(u)) {
            os << g.node_at(u) << ' ' << g.node_at(v) << '\n';
        }
    }
}

// =============================================================================
// Runtime I/O: stream-based reading
// =============================================================================

/// Read an edge-list graph from a stream.  Same format as
/// parse_edge_list(std::string_view).
[[nodiscard]] inline digraph<std::string> read_edge_list(std::istream& is) {
    digraph<std::string> g;
    std::size_t line_no = 0;
    std::string line;

    while (std::getline(is, line)) {
        ++line_no;
        if (auto tokens = parse_edge_line(line, line_no)) {
            g.add_edge(std::string(tokens->source), std::string(tokens->target));
        }
    }

    return g;
}

} // namespace decyc::graph::io

#endif // DECYC_GRAPH_IO_STREAM_H
