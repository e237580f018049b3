#pragma once

// Sub-graph umbrella header.

#include <nodeplumb/graph/resolver.hpp>
#include <nodeplumb/graph/runner.hpp>
#include <nodeplumb/graph/slot_graph.hpp>
#include <nodeplumb/graph/sub_graph.hpp>
