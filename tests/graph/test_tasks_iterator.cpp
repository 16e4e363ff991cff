// tests/graph/test_tasks_iterator.cpp
// Tests for tasks_iterator: overlapping replay of several cycles.

#include <decyc/graph/cycle_iterator.h>
#include <decyc/graph/decyclify.h>
#include <decyc/graph/tasks_iterator.h>
#include <gtest/gtest.h>

#include <cstddef>
#include <string>
#include <type_traits>
#include <vector>

using namespace decyc::graph;

using svec = std::vector<std::string>;
using batches = std::vector<svec>;

// =========================================================================
// Compile-time checks
// =========================================================================

static_assert(std::is_constructible_v<tasks_iterator<std::string>, digraph<std::string>, int>);
static_assert(std::is_constructible_v<tasks_iterator<std::string>,
                                      decyclify_result<std::string>, int>);
static_assert(std::is_constructible_v<tasks_iterator<std::string>, svec, int>);
static_assert(!std::is_constructible_v<tasks_iterator<std::string>, int, int>);
static_assert(!std::is_constructible_v<tasks_iterator<std::string>, std::string, int>);

namespace {

template<typename It>
batches drain(It& it, std::size_t limit = 1000) {
    batches out;
    while (out.size() < limit) {
        auto b = it.next();
        if (!b) break;
        out.push_back(to_labels(*b));
    }
    return out;
}

svec const sample_lines{"a b", "a e", "b c", "c b", "c d"};

} // namespace

// =========================================================================
// Overlap on an acyclic graph (no inter-iteration edges)
// =========================================================================

TEST(TasksIterator, DecyclifiedGraphTwoCycles) {
    auto const r = decyclify(sample_lines, std::string("a"));
    tasks_iterator it(r.graph, 2);
    EXPECT_EQ(drain(it), (batches{{"a.0"}, {"b.0", "e.0", "a.1"}, {"c.0", "b.1"},
                                  {"d.0", "c.1"}, {"d.1"}}));
    EXPECT_TRUE(it.done());
    EXPECT_FALSE(it.next().has_value());
}

TEST(TasksIterator, SingleCycleMatchesCycleIterator) {
    auto const g = decyclify(sample_lines).graph;
    tasks_iterator tasks(g, 1);
    cycle_iterator cycles(g, 1);
    EXPECT_EQ(drain(tasks), drain(cycles));
}

TEST(TasksIterator, ChainOverlapsByOneStep) {
    digraph<std::string> g{{"p", "q"}, {"q", "r"}};
    tasks_iterator it(g, 3);
    EXPECT_EQ(drain(it), (batches{{"p.0"}, {"q.0", "p.1"}, {"r.0", "q.1", "p.2"},
                                  {"r.1", "q.2"}, {"r.2"}}));
}

// =========================================================================
// Inter-iteration gating
// =========================================================================

TEST(TasksIterator, CyclicEdgeListTwoCycles) {
    // b in cycle 1 waits for c in cycle 0 (removed edge c -> b) and is
    // released in the same step as c.0.
    tasks_iterator it(sample_lines, 2);
    EXPECT_EQ(drain(it), (batches{{"a.0"}, {"b.0", "e.0", "a.1"}, {"c.0", "b.1"},
                                  {"d.0", "c.1"}, {"d.1"}}));
}

TEST(TasksIterator, DecyclifyResultTwoCycles) {
    auto const r = decyclify(sample_lines, std::string("a"));
    tasks_iterator it(r, 2);
    EXPECT_EQ(drain(it), (batches{{"a.0"}, {"b.0", "e.0", "a.1"}, {"c.0", "b.1"},
                                  {"d.0", "c.1"}, {"d.1"}}));
}

TEST(TasksIterator, TriggerClearsWhenUpstreamIsEmitted) {
    // p -> q -> r -> p; the back-edge (r, p) makes p.1 wait for r.0 only.
    digraph<std::string> g{{"p", "q"}, {"q", "r"}, {"r", "p"}};
    tasks_iterator it(g, 2);
    EXPECT_EQ(it.removed_edges(), (std::vector<edge<std::string>>{{"r", "p"}}));
    EXPECT_EQ(drain(it), (batches{{"p.0"}, {"q.0"}, {"r.0", "p.1"}, {"q.1"}, {"r.1"}}));
}

TEST(TasksIterator, CyclicGraphDecyclifiedInternally) {
    tasks_iterator from_graph(io::parse_edge_list(sample_lines), 2);
    tasks_iterator from_lines(sample_lines, 2);
    auto const r = decyclify(sample_lines);
    tasks_iterator from_result(r, 2);

    auto const expected = drain(from_result);
    EXPECT_EQ(drain(from_graph), expected);
    EXPECT_EQ(drain(from_lines), expected);
    EXPECT_EQ(from_lines.removed_edges(),
              (std::vector<edge<std::string>>{{"c", "b"}}));
}

TEST(TasksIterator, ExposesMatrices) {
    tasks_iterator it(sample_lines, 2);
    EXPECT_EQ(it.nodes(), (svec{"a", "b", "e", "c", "d"}));
    EXPECT_EQ(it.intra_iteration_matrix().count(), 4u);
    ASSERT_EQ(it.inter_iteration_matrix().size(), 5u);
    EXPECT_TRUE(it.inter_iteration_matrix()(1, 3));  // b depends on c
    EXPECT_EQ(it.cycle_count(), 2u);
}

// =========================================================================
// Cycle lifecycle
// =========================================================================

TEST(TasksIterator, ExhaustedCyclesLeaveActiveSet) {
    digraph<std::string> g{{"p", "q"}};
    tasks_iterator it(g, 2);
    EXPECT_EQ(it.active_cycles(), (std::vector<std::size_t>{0, 1}));

    (void)it.next();  // p.0
    (void)it.next();  // q.0 p.1
    EXPECT_EQ(it.active_cycles(), (std::vector<std::size_t>{0, 1}));
    (void)it.next();  // q.1; cycle 0 is exhausted
    EXPECT_EQ(it.active_cycles(), (std::vector<std::size_t>{1}));
    EXPECT_FALSE(it.next().has_value());
    EXPECT_TRUE(it.active_cycles().empty());
    EXPECT_TRUE(it.done());
}

TEST(TasksIterator, DiamondJoinReleasedPerPredecessorColumn) {
    // Cycle 0 emits d twice (columns b and c).  In cycle 1, c is not
    // ready when b clears and is dropped from that batch; the held d
    // goes out once cycle 0 is exhausted.
    digraph<std::string> g{{"a", "b"}, {"a", "c"}, {"b", "d"}, {"c", "d"}};
    tasks_iterator it(g, 2);
    EXPECT_EQ(drain(it), (batches{{"a.0"}, {"b.0", "c.0", "a.1"}, {"d.0", "b.1"},
                                  {"d.0"}, {"d.1"}, {"d.1"}}));
}

TEST(TasksIterator, EmptyGraphIsDoneImmediately) {
    tasks_iterator it(digraph<std::string>{}, 2);
    EXPECT_TRUE(it.done());
    EXPECT_FALSE(it.next().has_value());
}

// =========================================================================
// Invalid arguments
// =========================================================================

TEST(TasksIterator, NonPositiveCyclesThrow) {
    digraph<std::string> g{{"a", "b"}};
    EXPECT_THROW((void)tasks_iterator(g, 0), invalid_argument_value);
    EXPECT_THROW((void)tasks_iterator(g, -5), invalid_argument_value);
    EXPECT_THROW((void)tasks_iterator(sample_lines, 0), invalid_argument_value);
}

TEST(TasksIterator, CyclesCheckedBeforeParsing) {
    // The cycle count is validated first, so a malformed list still
    // reports the bad count.
    EXPECT_THROW((void)tasks_iterator(svec{"broken"}, 0), invalid_argument_value);
    EXPECT_THROW((void)tasks_iterator(svec{"broken"}, 1), format_error);
}
