#pragma once

#include <nodeplumb/backend.hpp>
#include <nodeplumb/graph/sub_graph.hpp>
#include <nodeplumb/graph_context.hpp>
#include <nodeplumb/result.hpp>

#include <cstdint>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace nodeplumb::graph {

// What happened to one node during an invocation.
struct NodeReport {
    std::string    name;
    NodeRole       role = NodeRole::Compute;
    WorkgroupCount workgroups{0, 0, 0}; // Compute only
    std::vector<std::pair<std::string, ResourceExtent>> outputs;
};

// Aggregate counters for one invocation.
struct InvocationStats {
    std::uint32_t nodesDispatched     = 0;
    std::uint32_t zeroDispatches      = 0; // dispatched with a zero workgroup component
    std::uint32_t strategyEvaluations = 0;
    std::uint32_t sizeEvaluations     = 0;
    std::uint32_t resourceReads       = 0; // SharedResource reads by source nodes
    std::uint32_t resourceWrites      = 0; // SharedResource writes by sink nodes
    std::uint32_t outputsProvided     = 0;
    double        resolveUs           = 0.0;
};

struct InvocationReport {
    bool                    executed = false; // false when the gate was closed
    std::vector<NodeReport> nodes;            // execution order
    InvocationStats         stats;

    [[nodiscard]] const NodeReport* find(std::string_view name) const;

    // Print per-node dispatch counts and output extents to stderr.
    void dumpLog() const;
};

// Graph inputs for one invocation: a context named after the boundary node.
[[nodiscard]] inline GraphContext makeGraphInputs() {
    return GraphContext(std::string(kGraphInputNode));
}

// Per-invocation evaluation of a frozen sub-graph.
//
// For each node in order: gather the views its input slots resolve to,
// evaluate its dispatch strategy and output sizes against a context holding
// exactly those views, obtain outputs from the backend, dispatch, and publish
// the outputs for downstream nodes. The gate is consulted once, before any of
// this; a closed gate touches nothing.
//
// Usage:
//   DynamicResolver resolver(backend);
//   auto inputs = makeGraphInputs();
//   inputs.bind("size", ResourceView::ofBuffer(sizeBuf, 16));
//   auto report = resolver.execute(definition, inputs);
//
// Thread safety: thread-confined.
class DynamicResolver {
public:
    explicit DynamicResolver(DispatchBackend& backend) : backend_(&backend) {}

    // Fails with MissingInput when a bound input has no view, or with the
    // backend's error. The definition is never modified.
    [[nodiscard]] Result<InvocationReport> execute(const SubGraphDefinition& definition,
                                                   const GraphContext& inputs) const;

private:
    DispatchBackend* backend_;
};

} // namespace nodeplumb::graph
