// graph/graph_io_parse.h - Edge-list parsers
// Part of the decyc cyclic scheduling library (C++20)
//
// Parses directed graphs with string labels from edge-list text.
//
// TEXT FORMAT (parse_edge_list(std::string_view)):
//   # comment
//   SRC DST              (directed edge SRC -> DST)
//
// Lines starting with # are comments, and a # ends a line early.
// Blank lines are ignored.  Labels are any run of characters other
// than whitespace and '#'.  Nodes are indexed by first appearance.
//
// LINE RANGE (parse_edge_list(R const&)):
//   each element is exactly one "SRC DST" edge; blank elements are
//   malformed.
//
// Malformed lines throw format_error carrying the 1-based line number.

#ifndef DECYC_GRAPH_IO_PARSE_H
#define DECYC_GRAPH_IO_PARSE_H

#include "digraph.h"
#include "graph_concepts.h"
#include "graph_errors.h"
#include "graph_io_detail.h"

#include <cstddef>
#include <optional>
#include <ranges>
#include <string>
#include <string_view>

namespace decyc::graph::io {

/// Source and target label of one parsed edge line.
struct edge_tokens {
    std::string_view source;
    std::string_view target;
};

/// Parse a single "SRC DST" line.
///
/// Returns std::nullopt for a blank or comment-only line.  Throws
/// format_error if the line holds one token or more than two.
[[nodiscard]] inline std::optional<edge_tokens>
parse_edge_line(std::string_view line, std::size_t line_no = 0) {
    auto pos = detail::skip_hspace(line, 0);
    if (detail::at_eol(line, pos)) {
        return std::nullopt;
    }

    auto [source, p1] = detail::scan_token(line, pos);
    pos = detail::skip_hspace(line, p1);
    if (detail::at_eol(line, pos)) {
        throw format_error("parse_edge_line: line " + std::to_string(line_no)
            + ": expected 'source target', got '" + std::string(line) + "'",
            line_no);
    }

    auto [target, p2] = detail::scan_token(line, pos);
    pos = detail::skip_hspace(line, p2);
    if (pos < line.size() && line[pos] == '\r') {
        ++pos;
    }
    if (!detail::at_eol(line, pos)) {
        throw format_error("parse_edge_line: line " + std::to_string(line_no)
            + ": unexpected token after target in '" + std::string(line) + "'",
            line_no);
    }

    return edge_tokens{source, target};
}

/// Parse an edge-list text into a graph.
///
/// Example:
/// ```cpp
/// auto g = io::parse_edge_list(
///     "# loop between b and c\n"
///     "a b\n"
///     "b c\n"
///     "c b\n");
/// // g.nodes() == {"a", "b", "c"}
/// ```
[[nodiscard]] inline digraph<std::string> parse_edge_list(std::string_view text) {
    digraph<std::string> g;
    std::size_t pos = 0;
    std::size_t line_no = 0;

    while (pos < text.size()) {
        ++line_no;
        auto const line = detail::current_line(text, pos);
        if (auto tokens = parse_edge_line(line, line_no)) {
            g.add_edge(std::string(tokens->source), std::string(tokens->target));
        }
        pos = detail::skip_to_eol(text, pos);
    }

    return g;
}

/// Parse a range of "SRC DST" strings, one edge per element.
///
/// Example:
/// ```cpp
/// std::vector<std::string> lines{"a b", "b c", "c b"};
/// auto g = io::parse_edge_list(lines);
/// ```
template<edge_list R>
[[nodiscard]] digraph<std::string> parse_edge_list(R const& lines) {
    digraph<std::string> g;
    std::size_t line_no = 0;

    for (auto const& element : lines) {
        ++line_no;
        std::string_view const line = element;
        auto tokens = parse_edge_line(line, line_no);
        if (!tokens) {
            throw format_error("parse_edge_list: element "
                + std::to_string(line_no) + ": expected 'source target', got '"
                + std::string(line) + "'", line_no);
        }
        g.add_edge(std::string(tokens->source), std::string(tokens->target));
    }

    return g;
}

} // namespace decyc::graph::io

#endif // DECYC_GRAPH_IO_PARSE_H
