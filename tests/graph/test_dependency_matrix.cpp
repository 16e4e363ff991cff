// tests/graph/test_dependency_matrix.cpp
// Tests for the intra- and inter-iteration dependency matrices.

#include <decyc/graph/decyclify.h>
#include <decyc/graph/dependency_matrix.h>
#include <decyc/graph/matrix_io.h>
#include <gtest/gtest.h>

#include <random>
#include <string>
#include <vector>

using namespace decyc::graph;
using decyc::bool_matrix;

using svec = std::vector<std::string>;
using sedges = std::vector<edge<std::string>>;
using nested = std::vector<std::vector<int>>;

template<typename T>
concept intra_buildable = requires(T const& t) { build_intra_iteration_matrix(t); };

static_assert(intra_buildable<digraph<std::string>>);
static_assert(intra_buildable<svec>);
static_assert(!intra_buildable<int>);
static_assert(!intra_buildable<std::vector<int>>);

// =========================================================================
// Concrete scenario: a -> b, b -> c, c -> b, c -> d
// =========================================================================

TEST(DependencyMatrix, IntraSample) {
    auto r = decyclify(svec{"a b", "b c", "c b", "c d"}, std::string("a"));
    auto m = build_intra_iteration_matrix(r.graph);
    EXPECT_EQ(io::to_nested(m),
              (nested{{0, 0, 0, 0}, {1, 0, 0, 0}, {0, 1, 0, 0}, {0, 0, 1, 0}}));
}

TEST(DependencyMatrix, InterSample) {
    auto r = decyclify(svec{"a b", "b c", "c b", "c d"}, std::string("a"));
    auto m = build_inter_iteration_matrix(r.graph.nodes(), r.removed_edges);
    EXPECT_EQ(io::to_nested(m),
              (nested{{0, 0, 0, 0}, {0, 0, 1, 0}, {0, 0, 0, 0}, {0, 0, 0, 0}}));

    auto same = build_inter_iteration_matrix(r.graph, r.removed_edges);
    EXPECT_EQ(same, m);
}

TEST(DependencyMatrix, IntraFromEdgeList) {
    auto m = build_intra_iteration_matrix(svec{"x y", "y z"});
    EXPECT_EQ(io::to_nested(m), (nested{{0, 0, 0}, {1, 0, 0}, {0, 1, 0}}));
}

TEST(DependencyMatrix, SelfLoopOnDiagonal) {
    auto r = decyclify(digraph<std::string>{{"a", "a"}});
    auto intra = build_intra_iteration_matrix(r.graph);
    auto inter = build_inter_iteration_matrix(r.graph.nodes(), r.removed_edges);
    EXPECT_EQ(io::to_nested(intra), (nested{{0}}));
    EXPECT_EQ(io::to_nested(inter), (nested{{1}}));
}

// =========================================================================
// Empty inputs
// =========================================================================

TEST(DependencyMatrix, EmptyGraphGivesEmptyMatrices) {
    digraph<std::string> g;
    EXPECT_TRUE(build_intra_iteration_matrix(g).empty());
    EXPECT_TRUE(build_inter_iteration_matrix(g, sedges{}).empty());
}

TEST(DependencyMatrix, NoRemovedEdgesGivesEmptyInter) {
    svec nodes{"a", "b"};
    EXPECT_TRUE(build_inter_iteration_matrix(nodes, sedges{}).empty());
}

TEST(DependencyMatrix, NoNodesGivesEmptyInter) {
    EXPECT_TRUE(build_inter_iteration_matrix(svec{}, sedges{{"a", "b"}}).empty());
}

TEST(DependencyMatrix, UnknownNodeInRemovedEdgeThrows) {
    svec nodes{"a", "b"};
    EXPECT_THROW((void)build_inter_iteration_matrix(nodes, sedges{{"b", "q"}}),
                 not_found_error);
}

TEST(DependencyMatrix, IntraIgnoresSelfEdge) {
    digraph<std::string> g{{"a", "a"}, {"a", "b"}};
    EXPECT_EQ(io::to_nested(build_intra_iteration_matrix(g)), (nested{{0, 0}, {1, 0}}));
}

TEST(DependencyMatrix, IsolatedNodeHasEmptyRowAndColumn) {
    digraph<std::string> g{{"a", "b"}};
    g.add_node("lonely");
    auto m = build_intra_iteration_matrix(g);
    ASSERT_EQ(m.size(), 3u);
    EXPECT_FALSE(m.row_any(2));
    EXPECT_FALSE(m.column_any(2));
}

// =========================================================================
// Properties
// =========================================================================

TEST(DependencyMatrixProperties, DimensionAndComplementarity) {
    std::mt19937 rng(77u);
    std::bernoulli_distribution coin(0.25);

    for (int trial = 0; trial < 100; ++trial) {
        int const n = 1 + trial % 10;
        digraph<int> g;
        for (int i = 0; i < n; ++i) g.add_node(i);
        for (int u = 0; u < n; ++u) {
            for (int v = 0; v < n; ++v) {
                if (coin(rng)) g.add_edge(u, v);
            }
        }

        SCOPED_TRACE("trial " + std::to_string(trial));

        auto const r = decyclify(g);
        auto const intra = build_intra_iteration_matrix(r.graph);
        auto const inter = build_inter_iteration_matrix(r.graph.nodes(), r.removed_edges);

        EXPECT_EQ(intra.size(), static_cast<std::size_t>(n));
        if (!r.removed_edges.empty()) {
            EXPECT_EQ(inter.size(), static_cast<std::size_t>(n));
        }

        std::size_t discarded_seen = 0;
        for (auto const& e : g.edges()) {
            auto const s = g.index_of(e.source);
            auto const t = g.index_of(e.target);
            bool const in_intra = intra(t, s);
            bool const in_inter = !inter.empty() && inter(t, s);
            if (!in_intra && !in_inter) {
                ++discarded_seen;
                continue;
            }
            EXPECT_NE(in_intra, in_inter);
        }
        EXPECT_EQ(discarded_seen, r.discarded_edges.size());
        EXPECT_EQ(intra.count(), r.graph.edge_count());
    }
}
