#include <nodeplumb/graph/sub_graph.hpp>

#include <cstdio>
#include <utility>

namespace nodeplumb::graph {

const char* nodeRoleName(NodeRole role) {
    switch (role) {
    case NodeRole::Compute:
        return "compute";
    case NodeRole::Source:
        return "source";
    case NodeRole::Sink:
        return "sink";
    }
    return "unknown";
}

// SubGraphDefinition

std::vector<std::string> SubGraphDefinition::order() const {
    std::vector<std::string> names;
    names.reserve(nodes_.size());
    for (const auto& n : nodes_) {
        names.push_back(n.name);
    }
    return names;
}

const CompiledNode* SubGraphDefinition::find(std::string_view name) const {
    auto idx = indexOf(name);
    return idx == SlotGraph::kInvalidIndex ? nullptr : &nodes_[idx];
}

std::uint32_t SubGraphDefinition::indexOf(std::string_view name) const {
    for (std::uint32_t i = 0; i < static_cast<std::uint32_t>(nodes_.size()); ++i) {
        if (nodes_[i].name == name) return i;
    }
    return SlotGraph::kInvalidIndex;
}

void SubGraphDefinition::dumpLog() const {
    std::fprintf(stderr, "[nodeplumb::graph] sub-graph '%s': %u nodes, trigger %.*s\n",
                 name_.c_str(), nodeCount(),
                 static_cast<int>(triggerModeName(trigger_.mode()).size()),
                 triggerModeName(trigger_.mode()).data());

    for (const auto& gi : graphInputs_) {
        std::fprintf(stderr, "  input  %-20s (%.*s)\n", gi.name.c_str(),
                     static_cast<int>(resourceKindName(gi.kind).size()),
                     resourceKindName(gi.kind).data());
    }

    for (std::uint32_t i = 0; i < nodeCount(); ++i) {
        const auto& n = nodes_[i];
        std::fprintf(stderr, "  [%u] %-20s (%s)\n", i, n.name.c_str(), nodeRoleName(n.role));
        for (const auto& in : n.inputs) {
            const char* producer = in.fromGraphInput()
                                       ? kGraphInputNode.data()
                                       : nodes_[in.producer].name.c_str();
            std::fprintf(stderr, "        %-12s <- %s.%s\n", in.slot.c_str(), producer,
                         in.producerSlot.c_str());
        }
    }

    for (const auto& e : nodeEdges_) {
        std::fprintf(stderr, "  order  %s -> %s\n", e.from.c_str(), e.to.c_str());
    }
}

// SubGraphBuilder

SubGraphBuilder& SubGraphBuilder::name(std::string_view name) {
    name_ = std::string(name);
    return *this;
}

bool SubGraphBuilder::claimName(std::string_view name) {
    if (name == kGraphInputNode) {
        registrationIssues_.push_back({ErrorKind::DuplicateNodeName, std::string(name),
                                       "name is reserved for the graph input boundary"});
        return false;
    }
    if (hasNode(name)) {
        registrationIssues_.push_back({ErrorKind::DuplicateNodeName, std::string(name),
                                       "a node with this name is already registered"});
        return false;
    }
    return true;
}

SubGraphBuilder& SubGraphBuilder::addNode(std::string_view name, NodeDescriptor descriptor) {
    return addNode(name, std::make_shared<const NodeDescriptor>(std::move(descriptor)));
}

SubGraphBuilder& SubGraphBuilder::addNode(std::string_view name,
                                          std::shared_ptr<const NodeDescriptor> descriptor) {
    if (!claimName(name)) return *this;
    // The name stays claimed so edges to it resolve; build() fails anyway.
    if (!descriptor) {
        registrationIssues_.push_back({ErrorKind::MissingShader, std::string(name),
                                       "null node descriptor"});
    }
    Entry e;
    e.name = std::string(name);
    e.role = NodeRole::Compute;
    e.descriptor = std::move(descriptor);
    entries_.push_back(std::move(e));
    return *this;
}

SubGraphBuilder& SubGraphBuilder::addNodeProvider(std::string_view name, NodeProvider provider) {
    if (!claimName(name)) return *this;
    Entry e;
    e.name = std::string(name);
    e.role = NodeRole::Compute;
    e.provider = std::move(provider);
    entries_.push_back(std::move(e));
    return *this;
}

SubGraphBuilder& SubGraphBuilder::addInputResource(std::string_view name,
                                                   SharedResource resource, ResourceKind kind) {
    if (!claimName(name)) return *this;
    Entry e;
    e.name = std::string(name);
    e.role = NodeRole::Source;
    e.resource = std::move(resource);
    e.kind = kind;
    entries_.push_back(std::move(e));
    return *this;
}

SubGraphBuilder& SubGraphBuilder::addOutputResource(std::string_view name,
                                                    SharedResource resource, ResourceKind kind) {
    if (!claimName(name)) return *this;
    Entry e;
    e.name = std::string(name);
    e.role = NodeRole::Sink;
    e.resource = std::move(resource);
    e.kind = kind;
    entries_.push_back(std::move(e));
    return *this;
}

SubGraphBuilder& SubGraphBuilder::graphInput(std::string_view slot, ResourceKind kind) {
    for (const auto& gi : graphInputs_) {
        if (gi.name == slot) {
            registrationIssues_.push_back(
                {ErrorKind::DuplicateBindingName,
                 std::string(kGraphInputNode) + "." + std::string(slot),
                 "graph input slot is already declared"});
            return *this;
        }
    }
    graphInputs_.push_back({std::string(slot), kind});
    return *this;
}

SubGraphBuilder& SubGraphBuilder::addNodeEdge(std::string_view from, std::string_view to) {
    nodeEdges_.push_back({std::string(from), std::string(to)});
    return *this;
}

SubGraphBuilder& SubGraphBuilder::addSlotEdge(std::string_view fromNode, std::string_view fromSlot,
                                              std::string_view toNode, std::string_view toSlot) {
    slotEdges_.push_back({std::string(fromNode), std::string(fromSlot), std::string(toNode),
                          std::string(toSlot)});
    return *this;
}

SubGraphBuilder& SubGraphBuilder::trigger(TriggerGate gate) {
    trigger_ = std::move(gate);
    return *this;
}

bool SubGraphBuilder::hasNode(std::string_view name) const {
    for (const auto& e : entries_) {
        if (e.name == name) return true;
    }
    return false;
}

std::vector<SubGraphBuilder::ProviderEntry> SubGraphBuilder::providers() const {
    std::vector<ProviderEntry> out;
    for (const auto& e : entries_) {
        if (e.provider) out.push_back({e.name, *e.provider});
    }
    return out;
}

namespace {

void collectSlots(const NodeDescriptor& desc, std::vector<SlotInfo>& inputs,
                  std::vector<SlotInfo>& outputs) {
    for (const auto& b : desc.bindings()) {
        if (b.isInputSlot()) inputs.push_back({b.name, b.kind});
        if (b.isOutputSlot()) outputs.push_back({b.name, b.kind});
    }
}

} // namespace

Result<SubGraphDefinition> SubGraphBuilder::build() const {
    const char* operation = "build sub-graph";

    std::vector<Issue> issues;
    if (name_.empty()) {
        issues.push_back({ErrorKind::MissingName, "<unnamed sub-graph>",
                          "sub-graph needs a name; call name() before build()"});
    }
    issues.insert(issues.end(), registrationIssues_.begin(), registrationIssues_.end());

    // Stage 1: pull every provider once. Descriptors and revisions are
    // snapshotted here; later publishes only take effect on the next build.
    std::vector<std::shared_ptr<const NodeDescriptor>> descriptors(entries_.size());
    std::vector<std::pair<std::string, std::uint64_t>> revisions;

    for (std::size_t i = 0; i < entries_.size(); ++i) {
        const auto& e = entries_[i];
        if (!e.provider) {
            descriptors[i] = e.descriptor;
            continue;
        }

        auto snap = e.provider->snapshot();
        revisions.emplace_back(e.name, snap.revision);

        if (snap.state == ProviderState::Ready) {
            descriptors[i] = std::move(snap.descriptor);
        } else if (snap.state == ProviderState::Failed) {
            issues.push_back({ErrorKind::UnresolvedProvider, e.name,
                              "provider of entity " + std::to_string(e.provider->owner()) +
                                  " failed: " + snap.message});
        } else {
            issues.push_back({ErrorKind::UnresolvedProvider, e.name,
                              "provider of entity " + std::to_string(e.provider->owner()) +
                                  " is still pending"});
        }
    }

    // Stage 2: slot graph. Index 0 is the boundary; entry i is node i + 1.
    SlotGraph g;
    g.addBoundaryNode(kGraphInputNode, graphInputs_);

    for (std::size_t i = 0; i < entries_.size(); ++i) {
        const auto& e = entries_[i];
        std::vector<SlotInfo> inputs;
        std::vector<SlotInfo> outputs;

        switch (e.role) {
        case NodeRole::Compute:
            if (!descriptors[i]) {
                g.addOpaqueNode(e.name);
                continue;
            }
            collectSlots(*descriptors[i], inputs, outputs);
            break;
        case NodeRole::Source:
            outputs.push_back({std::string(kSourceSlot), e.kind});
            break;
        case NodeRole::Sink:
            inputs.push_back({std::string(kSinkSlot), e.kind});
            break;
        }
        g.addNode(e.name, std::move(inputs), std::move(outputs));
    }

    for (const auto& edge : nodeEdges_) {
        g.addNodeEdge(edge);
    }
    for (const auto& edge : slotEdges_) {
        g.addSlotEdge(edge);
    }

    auto graphIssues = g.validate();
    issues.insert(issues.end(), graphIssues.begin(), graphIssues.end());

    if (!issues.empty()) {
        return Error::fromIssues(operation, std::move(issues));
    }

    // Stage 3: order. Only attempted on a clean graph.
    auto sorted = g.topologicalOrder();
    if (!sorted.ok()) {
        Error err = std::move(sorted).error();
        err.operation = operation;
        return err;
    }
    const auto& order = sorted.value();

    // Stage 4: freeze.
    SubGraphDefinition def;
    def.name_ = name_;
    def.nodeEdges_ = nodeEdges_;
    def.slotEdges_ = slotEdges_;
    def.graphInputs_ = graphInputs_;
    def.trigger_ = trigger_;
    def.providerRevisions_ = std::move(revisions);

    std::vector<std::uint32_t> position(g.nodeCount(), InputSource::kGraphInput);
    for (auto idx : order) {
        if (idx == 0) continue; // boundary
        const auto& e = entries_[idx - 1];

        position[idx] = static_cast<std::uint32_t>(def.nodes_.size());

        CompiledNode cn;
        cn.name = e.name;
        cn.role = e.role;
        cn.descriptor = descriptors[idx - 1];
        cn.resource = e.resource;
        cn.resourceKind = e.kind;
        cn.registration = idx - 1;
        def.nodes_.push_back(std::move(cn));
    }

    for (const auto& c : g.connections()) {
        InputSource src;
        src.slot = g.node(c.toNode).inputs[c.toSlot].name;
        src.producer = position[c.fromNode];
        src.producerSlot = g.node(c.fromNode).outputs[c.fromSlot].name;
        def.nodes_[position[c.toNode]].inputs.push_back(std::move(src));
    }

#ifndef NDEBUG
    std::fprintf(stderr, "[nodeplumb::graph] built '%s': %u nodes, %zu slot edges\n",
                 name_.c_str(), def.nodeCount(), slotEdges_.size());
#endif

    return def;
}

} // namespace nodeplumb::graph
