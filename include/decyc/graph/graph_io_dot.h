// graph/graph_io_dot.h - Graphviz DOT export
// Part of the decyc cyclic scheduling library (C++20)
//
// Writes labelled graphs in DOT format for visualisation with Graphviz.
// Node labels are quoted.  The overload taking a removed-edge list
// draws those edges dashed with constraint=false, so a decyclified
// graph renders as its DAG with the back-edges overlaid.
// No parsing, no graph_io_detail dependency, no <iostream>.

#ifndef DECYC_GRAPH_IO_DOT_H
#define DECYC_GRAPH_IO_DOT_H

#include "graph_concepts.h"

#include <cstddef>
#include <ostream>
#include <string_view>
#include <vector>

namespace decyc::graph::io {

/// Write a labelled graph in Graphviz DOT format.
///
/// Example output:
/// ```dot
/// digraph G {
///   "a" -> "b";
///   "b" -> "c";
/// }
/// ```
template<labelled_graph G>
void write_dot(std::ostream& os, G const& g,
               std::string_view graph_name = "G")
{
    os << "digraph " << graph_name << " {\n";

    for (std::size_t u = 0; u < g.node_count(); ++u) {
        auto const& nbrs = g.out_indices(u);
        if (nbrs.begin() == nbrs.end()) {
            // Node without out-edges: emit standalone so isolated nodes appear.
            os << "  \"" << g.node_at(u) << "\";\n";
            continue;
        }
        for (auto v : nbrs) {
            os << "  \"" << g.node_at(u) << "\" -> \"" << g.node_at(v) << "\";\n";
        }
    }

    os << "}\n";
}

/// Write a decyclified graph with its removed back-edges drawn dashed.
template<labelled_graph G>
void write_dot(std::ostream& os, G const& g,
               std::vector<edge<typename G::node_type>> const& removed,
               std::string_view graph_name = "G")
{
    os << "digraph " << graph_name << " {\n";

    for (std::size_t u = 0; u < g.node_count(); ++u) {
        auto const& nbrs = g.out_indices(u);
        if (nbrs.begin() == nbrs.end()) {
            os << "  \"" << g.node_at(u) << "\";\n";
            continue;
        }
        for (auto v : nbrs) {
            os << "  \"" << g.node_at(u) << "\" -> \"" << g.node_at(v) << "\";\n";
        }
    }

    for (auto const& e : removed) {
        os << "  \"" << e.source << "\" -> \"" << e.target
           << "\" [style=dashed, constraint=false];\n";
    }

    os << "}\n";
}

} // namespace decyc::graph::io

#endif // DECYC_GRAPH_IO_DOT_H
