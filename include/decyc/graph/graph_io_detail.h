// graph/graph_io_detail.h - Edge-list scanning primitives
// Part of the decyc cyclic scheduling library (C++20)
//
// Low-level character-by-character scanning of tokens and whitespace
// from string_view.  Fully constexpr, no graph type dependencies, no
// iostream.
//
// A token is a maximal run of characters that are not space, tab,
// carriage return, newline or '#'.

#ifndef DECYC_GRAPH_IO_DETAIL_H
#define DECYC_GRAPH_IO_DETAIL_H

#include <cstddef>
#include <string_view>
#include <utility>

namespace decyc::graph::io {
namespace detail {

/// Skip whitespace (space, tab) but NOT newlines.
constexpr std::size_t skip_hspace(std::string_view sv, std::size_t pos) noexcept {
    while (pos < sv.size() && (sv[pos] == ' ' || sv[pos] == '\t'))
        ++pos;
    return pos;
}

/// Skip to end of line (past '\n' or to end of string).
constexpr std::size_t skip_to_eol(std::string_view sv, std::size_t pos) noexcept {
    while (pos < sv.size() && sv[pos] != '\n')
        ++pos;
    if (pos < sv.size()) ++pos;  // skip the '\n'
    return pos;
}

/// Returns true if pos is at end-of-line, end-of-string or a comment.
constexpr bool at_eol(std::string_view sv, std::size_t pos) noexcept {
    return pos >= sv.size() || sv[pos] == '\n' || sv[pos] == '\r' || sv[pos] == '#';
}

constexpr bool is_token_char(char c) noexcept {
    return c != ' ' && c != '\t' && c != '\r' && c != '\n' && c != '#';
}

/// Scan one token starting at pos.  Returns {token, new_pos}; the
/// token is empty if pos is not at a token character.
constexpr std::pair<std::string_view, std::size_t>
scan_token(std::string_view sv, std::size_t pos) noexcept {
    auto const start = pos;
    while (pos < sv.size() && is_token_char(sv[pos]))
        ++pos;
    return {sv.substr(start, pos - start), pos};
}

/// Extent of the current line: [pos, end-of-line) without the '\n'.
constexpr std::string_view current_line(std::string_view sv, std::size_t pos) noexcept {
    auto end = pos;
    while (end < sv.size() && sv[end] != '\n')
        ++end;
    return sv.substr(pos, end - pos);
}

} // namespace detail
} // namespace decyc::graph::io

#endif // DECYC_GRAPH_IO_DETAIL_H
