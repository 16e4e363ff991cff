// graph/graph_errors.h - Exception types raised by the graph layer
// Part of the decyc cyclic scheduling library (C++20)
//
// All failures are contract violations reported synchronously with an
// exception from the standard hierarchy.  The named types let callers
// tell the categories apart without parsing messages:
//
//   invalid_argument_value  std::invalid_argument  cycle count < 1
//   not_found_error         std::out_of_range      unknown node / edge
//   format_error            std::runtime_error     malformed edge-list line
//
// A wrong argument *type* (neither a graph nor an edge list) never
// reaches runtime: entry points are constrained by concepts and the
// call does not compile.
//
// Messages follow the "function: what went wrong" form used across
// the library and name the argument, the constraint, and the value.

#ifndef DECYC_GRAPH_GRAPH_ERRORS_H
#define DECYC_GRAPH_GRAPH_ERRORS_H

#include <cstddef>
#include <stdexcept>
#include <string>

namespace decyc::graph {

/// An argument has the right type but an unusable value.
class invalid_argument_value : public std::invalid_argument {
public:
    using std::invalid_argument::invalid_argument;
};

/// A node or edge named by the caller does not exist.
class not_found_error : public std::out_of_range {
public:
    using std::out_of_range::out_of_range;
};

/// An edge-list line could not be parsed.
///
/// line() is 1-based; 0 means the position is unknown.
class format_error : public std::runtime_error {
public:
    format_error(std::string const& what, std::size_t line)
        : std::runtime_error(what), line_(line) {}

    [[nodiscard]] std::size_t line() const noexcept { return line_; }

private:
    std::size_t line_ = 0;
};

/// Validate a replay cycle count: must be at least 1.
///
/// Usage:
///   require_cycle_count(cycles, "cycle_iterator");
inline void require_cycle_count(std::ptrdiff_t cycles, char const* where) {
    if (cycles < 1) {
        throw invalid_argument_value(std::string(where)
            + ": number of cycles must be at least 1, but "
            + std::to_string(cycles) + " given");
    }
}

} // namespace decyc::graph

#endif // DECYC_GRAPH_GRAPH_ERRORS_H
