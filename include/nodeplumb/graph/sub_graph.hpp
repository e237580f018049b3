#pragma once

#include <nodeplumb/graph/slot_graph.hpp>
#include <nodeplumb/node.hpp>
#include <nodeplumb/node_provider.hpp>
#include <nodeplumb/result.hpp>
#include <nodeplumb/shared_resource.hpp>
#include <nodeplumb/trigger.hpp>

#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace nodeplumb::graph {

// Reserved boundary node. Its output slots are the sub-graph's graph inputs,
// bound by the host for every invocation.
inline constexpr std::string_view kGraphInputNode = "<graph input>";

// Slot names of the nodes created by addInputResource()/addOutputResource().
inline constexpr std::string_view kSourceSlot = "out";
inline constexpr std::string_view kSinkSlot   = "in";

enum class NodeRole : std::uint8_t {
    Compute, // dispatches a NodeDescriptor
    Source,  // publishes a SharedResource on slot "out"
    Sink,    // writes slot "in" into a SharedResource
};

[[nodiscard]] const char* nodeRoleName(NodeRole role);

// Where one input slot of a compiled node gets its view from.
struct InputSource {
    static constexpr std::uint32_t kGraphInput = UINT32_MAX;

    std::string   slot;         // consumer input slot
    std::uint32_t producer = 0; // position in SubGraphDefinition::nodes(), or kGraphInput
    std::string   producerSlot;

    [[nodiscard]] bool fromGraphInput() const { return producer == kGraphInput; }
};

// One node of a frozen sub-graph.
struct CompiledNode {
    std::string                           name;
    NodeRole                              role = NodeRole::Compute;
    std::shared_ptr<const NodeDescriptor> descriptor; // Compute only
    std::optional<SharedResource>         resource;   // Source and Sink only
    ResourceKind                          resourceKind = ResourceKind::Buffer;
    std::vector<InputSource>              inputs;
    std::uint32_t                         registration = 0; // order of addNode*/add*Resource
};

// Immutable, execution-ready sub-graph produced by SubGraphBuilder::build().
// Nodes are stored in topological order; the graph input boundary is not
// part of nodes() and is never dispatched.
//
// Thread safety: immutable after construction.
class SubGraphDefinition {
public:
    [[nodiscard]] const std::string& name() const { return name_; }

    [[nodiscard]] const std::vector<CompiledNode>& nodes() const { return nodes_; }
    [[nodiscard]] std::uint32_t nodeCount() const {
        return static_cast<std::uint32_t>(nodes_.size());
    }

    // Node names in execution order.
    [[nodiscard]] std::vector<std::string> order() const;

    [[nodiscard]] const CompiledNode* find(std::string_view name) const;

    // Position in nodes(), or SlotGraph::kInvalidIndex.
    [[nodiscard]] std::uint32_t indexOf(std::string_view name) const;

    [[nodiscard]] const std::vector<NodeEdge>& nodeEdges() const { return nodeEdges_; }
    [[nodiscard]] const std::vector<SlotEdge>& slotEdges() const { return slotEdges_; }
    [[nodiscard]] const std::vector<SlotInfo>& graphInputs() const { return graphInputs_; }
    [[nodiscard]] const TriggerGate& trigger() const { return trigger_; }

    // Revision each provider had when this definition was built.
    [[nodiscard]] const std::vector<std::pair<std::string, std::uint64_t>>&
    providerRevisions() const {
        return providerRevisions_;
    }

    // Print execution order, slot wiring and trigger mode to stderr.
    void dumpLog() const;

private:
    friend class SubGraphBuilder;
    SubGraphDefinition() = default;

    std::string                                        name_;
    std::vector<CompiledNode>                          nodes_;
    std::vector<NodeEdge>                              nodeEdges_;
    std::vector<SlotEdge>                              slotEdges_;
    std::vector<SlotInfo>                              graphInputs_;
    TriggerGate                                        trigger_;
    std::vector<std::pair<std::string, std::uint64_t>> providerRevisions_;
};

// Composes nodes, providers, external resources and edges into a sub-graph.
// Registration never fails on the spot: problems are recorded and build()
// reports all of them in one error.
//
// Usage:
//   auto def = SubGraphBuilder{}
//       .name("fill")
//       .addInputResource("input", input)
//       .addNode("fill", fillDescriptor)
//       .addOutputResource("output", output)
//       .addSlotEdge("input", "out", "fill", "buffer")
//       .addSlotEdge("fill", "buffer", "output", "in")
//       .trigger(TriggerGate::manual(handle))
//       .build();
//
// Thread safety: thread-confined.
class SubGraphBuilder {
public:
    struct ProviderEntry {
        std::string  node;
        NodeProvider provider;
    };

    SubGraphBuilder() = default;

    SubGraphBuilder& name(std::string_view name);

    SubGraphBuilder& addNode(std::string_view name, NodeDescriptor descriptor);
    SubGraphBuilder& addNode(std::string_view name,
                             std::shared_ptr<const NodeDescriptor> descriptor);

    // Descriptor is pulled from the provider when build() runs.
    SubGraphBuilder& addNodeProvider(std::string_view name, NodeProvider provider);

    // Source node: publishes the resource's current view on output slot "out".
    SubGraphBuilder& addInputResource(std::string_view name, SharedResource resource,
                                      ResourceKind kind = ResourceKind::Buffer);

    // Sink node: stores the view arriving on input slot "in" into the resource.
    SubGraphBuilder& addOutputResource(std::string_view name, SharedResource resource,
                                       ResourceKind kind = ResourceKind::Buffer);

    // Declare an output slot of the graph input boundary node.
    SubGraphBuilder& graphInput(std::string_view slot, ResourceKind kind = ResourceKind::Buffer);

    SubGraphBuilder& addNodeEdge(std::string_view from, std::string_view to);
    SubGraphBuilder& addSlotEdge(std::string_view fromNode, std::string_view fromSlot,
                                 std::string_view toNode, std::string_view toSlot);

    SubGraphBuilder& trigger(TriggerGate gate);

    // Resolve providers, validate every edge, order the nodes, freeze.
    // Every problem found is reported in one aggregated error.
    [[nodiscard]] Result<SubGraphDefinition> build() const;

    [[nodiscard]] bool hasNode(std::string_view name) const;
    [[nodiscard]] std::vector<ProviderEntry> providers() const;

private:
    struct Entry {
        std::string                           name;
        NodeRole                              role = NodeRole::Compute;
        std::shared_ptr<const NodeDescriptor> descriptor;
        std::optional<NodeProvider>           provider;
        std::optional<SharedResource>         resource;
        ResourceKind                          kind = ResourceKind::Buffer;
    };

    // False (and an issue recorded) when the name is taken or reserved.
    bool claimName(std::string_view name);

    std::string           name_;
    std::vector<Entry>    entries_;
    std::vector<Issue>    registrationIssues_;
    std::vector<SlotInfo> graphInputs_;
    std::vector<NodeEdge> nodeEdges_;
    std::vector<SlotEdge> slotEdges_;
    TriggerGate           trigger_;
};

} // namespace nodeplumb::graph
