#pragma once

#include <nodeplumb/error.hpp>
#include <nodeplumb/resource.hpp>
#include <nodeplumb/result.hpp>

#include <cstdint>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

namespace nodeplumb::graph {

// A named, typed connection point on a node.
struct SlotInfo {
    std::string  name;
    ResourceKind kind = ResourceKind::Buffer;
};

// Pure ordering dependency: `from` runs before `to`.
struct NodeEdge {
    std::string from;
    std::string to;
};

// `fromNode.fromSlot` (an output slot) feeds `toNode.toSlot` (an input slot).
struct SlotEdge {
    std::string fromNode;
    std::string fromSlot;
    std::string toNode;
    std::string toSlot;

    [[nodiscard]] std::string describe() const {
        return fromNode + "." + fromSlot + " -> " + toNode + "." + toSlot;
    }
};

// A validated slot edge in arena indices.
struct SlotConnection {
    std::uint32_t fromNode = 0;
    std::uint32_t fromSlot = 0; // index into the producer's outputs
    std::uint32_t toNode   = 0;
    std::uint32_t toSlot   = 0; // index into the consumer's inputs
};

// Arena-indexed slot graph. Nodes are addressed by registration index; edges
// are recorded by name and resolved in validate().
//
// Usage:
//   SlotGraph g;
//   g.addNode("producer", {}, {{"buf", ResourceKind::Buffer}});
//   g.addNode("consumer", {{"buf", ResourceKind::Buffer}}, {});
//   g.addSlotEdge({"producer", "buf", "consumer", "buf"});
//   auto issues = g.validate();          // empty
//   auto order  = g.topologicalOrder();  // [0, 1]
//
// Thread safety: thread-confined.
class SlotGraph {
public:
    static constexpr std::uint32_t kInvalidIndex = UINT32_MAX;

    struct Node {
        std::string           name;
        std::vector<SlotInfo> inputs;
        std::vector<SlotInfo> outputs;
        bool                  boundary = false; // may only be an edge source
        bool                  opaque   = false; // slots unknown; edges to it are not checked
    };

    std::uint32_t addNode(std::string_view name, std::vector<SlotInfo> inputs,
                          std::vector<SlotInfo> outputs);

    // Boundary node: produces slots from outside the graph, never consumes.
    std::uint32_t addBoundaryNode(std::string_view name, std::vector<SlotInfo> outputs);

    // A name that exists but whose slots are not known yet. Edges touching it
    // are skipped by validate() so the missing definition is reported once,
    // by whoever registered it, and not once per edge.
    std::uint32_t addOpaqueNode(std::string_view name);

    void addNodeEdge(NodeEdge edge);
    void addSlotEdge(SlotEdge edge);

    [[nodiscard]] std::uint32_t indexOf(std::string_view name) const;
    [[nodiscard]] bool contains(std::string_view name) const {
        return indexOf(name) != kInvalidIndex;
    }

    [[nodiscard]] std::uint32_t nodeCount() const {
        return static_cast<std::uint32_t>(nodes_.size());
    }
    [[nodiscard]] const Node& node(std::uint32_t index) const { return nodes_[index]; }

    [[nodiscard]] const std::vector<NodeEdge>& nodeEdges() const { return nodeEdges_; }
    [[nodiscard]] const std::vector<SlotEdge>& slotEdges() const { return slotEdges_; }

    // Resolve every recorded edge and collect every problem:
    //   UnknownNodeReference  -- an endpoint names no node (or targets a boundary)
    //   UnknownSlotReference  -- no such output slot on the producer / input slot on the consumer
    //   SlotKindMismatch      -- buffer slot wired to texture slot or vice versa
    //   SlotAlreadyConnected  -- a second producer for one input slot
    // On success, connections() and the dependency lists are populated.
    [[nodiscard]] std::vector<Issue> validate();

    // Requires a clean validate(). Fails with CyclicGraph, naming the first
    // back edge a depth-first walk (in registration order) finds. Among nodes
    // whose dependencies are satisfied, the earliest registered goes first.
    [[nodiscard]] Result<std::vector<std::uint32_t>> topologicalOrder() const;

    [[nodiscard]] const std::vector<SlotConnection>& connections() const { return connections_; }

    // Deduplicated successors of each node, in the order first declared.
    [[nodiscard]] const std::vector<std::vector<std::uint32_t>>& successors() const {
        return adj_;
    }

    [[nodiscard]] bool validated() const { return validated_; }

private:
    std::uint32_t pushNode(Node node);
    void addDependency(std::uint32_t from, std::uint32_t to);

    [[nodiscard]] static std::uint32_t findSlot(const std::vector<SlotInfo>& slots,
                                                std::string_view name);

    std::vector<Node>                              nodes_;
    std::unordered_map<std::string, std::uint32_t> index_;

    std::vector<NodeEdge> nodeEdges_;
    std::vector<SlotEdge> slotEdges_;

    // Populated by validate().
    std::vector<SlotConnection>             connections_;
    std::vector<std::vector<std::uint32_t>> adj_;
    std::vector<std::uint32_t>              inDegree_;
    std::vector<bool>                       adjMatrix_; // flat nodeCount x nodeCount
    bool                                    validated_ = false;
};

} // namespace nodeplumb::graph
