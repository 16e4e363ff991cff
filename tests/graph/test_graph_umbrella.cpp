// tests/graph/test_graph_umbrella.cpp
// The umbrella header compiles alone and exposes the whole pipeline.

#include <decyc/graph/graph.h>
#include <gtest/gtest.h>

#include <sstream>
#include <string>
#include <vector>

namespace dg = decyc::graph;

TEST(GraphUmbrella, PipelineFromText) {
    std::istringstream in("a b\na e\nb c\nc b\nc d\n");
    auto const g = dg::io::read_edge_list(in);

    auto const r = dg::decyclify(g);
    ASSERT_EQ(r.removed_edges.size(), 1u);
    EXPECT_TRUE(dg::is_acyclic(r.graph));

    auto const intra = dg::build_intra_iteration_matrix(r.graph);
    auto const inter = dg::build_inter_iteration_matrix(r.graph, r.removed_edges);
    EXPECT_EQ(intra.size(), 5u);
    EXPECT_EQ(inter.count(), 1u);

    dg::cycle_iterator cycles(r.graph, 1);
    std::size_t n = 0;
    while (auto b = cycles.next()) n += b->size();
    EXPECT_EQ(n, 5u);

    dg::tasks_iterator tasks(r, 3);
    std::size_t steps = 0;
    while (tasks.next()) ++steps;
    EXPECT_GT(steps, 0u);
    EXPECT_TRUE(tasks.done());
}
