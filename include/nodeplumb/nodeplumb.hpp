#pragma once

// Core umbrella header: node descriptors, providers, shared resources,
// triggers and the dispatch backend seam. The sub-graph lives in
// <nodeplumb/graph.hpp>.

#include <nodeplumb/backend.hpp>
#include <nodeplumb/binding.hpp>
#include <nodeplumb/dispatch.hpp>
#include <nodeplumb/error.hpp>
#include <nodeplumb/graph_context.hpp>
#include <nodeplumb/node.hpp>
#include <nodeplumb/node_provider.hpp>
#include <nodeplumb/resource.hpp>
#include <nodeplumb/result.hpp>
#include <nodeplumb/shared_resource.hpp>
#include <nodeplumb/trigger.hpp>
