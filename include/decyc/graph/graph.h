// graph/graph.h - Umbrella header for the decyc graph layer
// Part of the decyc cyclic scheduling library (C++20)

#ifndef DECYC_GRAPH_GRAPH_H
#define DECYC_GRAPH_GRAPH_H

#include <decyc/core/bool_matrix.h>

#include "graph_concepts.h"
#include "graph_errors.h"
#include "digraph.h"
#include "graph_equal.h"
#include "topological_sort.h"

#include "graph_io_parse.h"
#include "graph_io_stream.h"
#include "graph_io_dot.h"
#include "matrix_io.h"

#include "decyclify.h"
#include "dependency_matrix.h"
#include "replay.h"
#include "cycle_iterator.h"
#include "tasks_iterator.h"

#endif // DECYC_GRAPH_GRAPH_H
