#include <nodeplumb/graph/slot_graph.hpp>

#include <cassert>
#include <functional>
#include <queue>
#include <utility>

namespace nodeplumb::graph {

std::uint32_t SlotGraph::pushNode(Node node) {
    assert(!contains(node.name) && "SlotGraph: node names must be unique");
    auto idx = static_cast<std::uint32_t>(nodes_.size());
    index_.emplace(node.name, idx);
    nodes_.push_back(std::move(node));
    validated_ = false;
    return idx;
}

std::uint32_t SlotGraph::addNode(std::string_view name, std::vector<SlotInfo> inputs,
                                 std::vector<SlotInfo> outputs) {
    Node n;
    n.name = std::string(name);
    n.inputs = std::move(inputs);
    n.outputs = std::move(outputs);
    return pushNode(std::move(n));
}

std::uint32_t SlotGraph::addBoundaryNode(std::string_view name, std::vector<SlotInfo> outputs) {
    Node n;
    n.name = std::string(name);
    n.outputs = std::move(outputs);
    n.boundary = true;
    return pushNode(std::move(n));
}

std::uint32_t SlotGraph::addOpaqueNode(std::string_view name) {
    Node n;
    n.name = std::string(name);
    n.opaque = true;
    return pushNode(std::move(n));
}

void SlotGraph::addNodeEdge(NodeEdge edge) {
    nodeEdges_.push_back(std::move(edge));
    validated_ = false;
}

void SlotGraph::addSlotEdge(SlotEdge edge) {
    slotEdges_.push_back(std::move(edge));
    validated_ = false;
}

std::uint32_t SlotGraph::indexOf(std::string_view name) const {
    auto it = index_.find(std::string(name));
    return it == index_.end() ? kInvalidIndex : it->second;
}

std::uint32_t SlotGraph::findSlot(const std::vector<SlotInfo>& slots, std::string_view name) {
    for (std::uint32_t i = 0; i < static_cast<std::uint32_t>(slots.size()); ++i) {
        if (slots[i].name == name) return i;
    }
    return kInvalidIndex;
}

void SlotGraph::addDependency(std::uint32_t from, std::uint32_t to) {
    const auto n = static_cast<std::size_t>(nodes_.size());
    auto cell = static_cast<std::size_t>(from) * n + to;
    if (adjMatrix_[cell]) return;
    adjMatrix_[cell] = true;
    adj_[from].push_back(to);
    inDegree_[to]++;
}

std::vector<Issue> SlotGraph::validate() {
    const auto n = static_cast<std::size_t>(nodes_.size());

    // Flat bool matrix for deduplication; a node edge and a slot edge between
    // the same pair are one dependency.
    adjMatrix_.assign(n * n, false);
    adj_.assign(n, {});
    inDegree_.assign(n, 0);
    connections_.clear();

    std::vector<Issue> issues;

    // Returns kInvalidIndex (and records an issue) when `name` cannot be used
    // as this end of an edge.
    auto resolveEnd = [&](const std::string& name, bool isTarget,
                          const std::string& subject) -> std::uint32_t {
        auto idx = indexOf(name);
        if (idx == kInvalidIndex) {
            issues.push_back({ErrorKind::UnknownNodeReference, subject,
                              std::string(isTarget ? "target" : "source") + " node '" + name +
                                  "' is not in the graph"});
            return kInvalidIndex;
        }
        if (isTarget && nodes_[idx].boundary) {
            issues.push_back({ErrorKind::UnknownNodeReference, subject,
                              "'" + name + "' is a graph boundary and can only be an edge source"});
            return kInvalidIndex;
        }
        return idx;
    };

    for (const auto& e : nodeEdges_) {
        const std::string subject = e.from + " -> " + e.to;
        auto from = resolveEnd(e.from, false, subject);
        auto to = resolveEnd(e.to, true, subject);
        if (from != kInvalidIndex && to != kInvalidIndex) {
            addDependency(from, to);
        }
    }

    // (consumer node, consumer input slot) -> index of the edge feeding it.
    std::unordered_map<std::uint64_t, std::size_t> fed;

    for (std::size_t ei = 0; ei < slotEdges_.size(); ++ei) {
        const auto& e = slotEdges_[ei];
        const std::string subject = e.describe();
        auto from = resolveEnd(e.fromNode, false, subject);
        auto to = resolveEnd(e.toNode, true, subject);
        if (from == kInvalidIndex || to == kInvalidIndex) continue;

        addDependency(from, to);

        if (nodes_[from].opaque || nodes_[to].opaque) continue;

        auto outSlot = findSlot(nodes_[from].outputs, e.fromSlot);
        if (outSlot == kInvalidIndex) {
            issues.push_back({ErrorKind::UnknownSlotReference, subject,
                              "node '" + e.fromNode + "' has no output slot '" + e.fromSlot + "'"});
        }
        auto inSlot = findSlot(nodes_[to].inputs, e.toSlot);
        if (inSlot == kInvalidIndex) {
            issues.push_back({ErrorKind::UnknownSlotReference, subject,
                              "node '" + e.toNode + "' has no input slot '" + e.toSlot + "'"});
        }
        if (outSlot == kInvalidIndex || inSlot == kInvalidIndex) continue;

        auto outKind = nodes_[from].outputs[outSlot].kind;
        auto inKind = nodes_[to].inputs[inSlot].kind;
        if (outKind != inKind) {
            issues.push_back({ErrorKind::SlotKindMismatch, subject,
                              std::string(resourceKindName(outKind)) + " slot connected to " +
                                  std::string(resourceKindName(inKind)) + " slot"});
            continue;
        }

        auto key = (static_cast<std::uint64_t>(to) << 32) | inSlot;
        auto [it, inserted] = fed.emplace(key, ei);
        if (!inserted) {
            const auto& first = slotEdges_[it->second];
            issues.push_back({ErrorKind::SlotAlreadyConnected, subject,
                              "input slot is already fed by " + first.fromNode + "." +
                                  first.fromSlot});
            continue;
        }

        connections_.push_back({from, outSlot, to, inSlot});
    }

    validated_ = issues.empty();
    return issues;
}

Result<std::vector<std::uint32_t>> SlotGraph::topologicalOrder() const {
    assert(validated_ && "SlotGraph: topologicalOrder() requires a clean validate()");

    const auto n = static_cast<std::uint32_t>(nodes_.size());

    // Depth-first walk with an on-stack marker: 0 = unvisited, 1 = on the
    // current path, 2 = finished. Reaching a node that is on the path is a
    // back edge and therefore a cycle.
    std::vector<std::uint8_t> mark(n, 0);
    std::vector<std::pair<std::uint32_t, std::size_t>> stack;

    for (std::uint32_t root = 0; root < n; ++root) {
        if (mark[root] != 0) continue;
        mark[root] = 1;
        stack.emplace_back(root, 0);

        while (!stack.empty()) {
            auto& frame = stack.back();
            const auto u = frame.first;
            if (frame.second >= adj_[u].size()) {
                mark[u] = 2;
                stack.pop_back();
                continue;
            }
            const auto v = adj_[u][frame.second++];

            if (mark[v] == 1) {
                std::string path;
                bool onCycle = false;
                for (const auto& f : stack) {
                    if (f.first == v) onCycle = true;
                    if (!onCycle) continue;
                    path += nodes_[f.first].name;
                    path += " -> ";
                }
                path += nodes_[v].name;

                std::vector<Issue> issues;
                issues.push_back({ErrorKind::CyclicGraph,
                                  nodes_[u].name + " -> " + nodes_[v].name,
                                  "dependency cycle: " + path});
                return Error::fromIssues("sort sub-graph", std::move(issues));
            }
            if (mark[v] == 0) {
                mark[v] = 1;
                stack.emplace_back(v, 0);
            }
        }
    }

    // Kahn's algorithm. A min-heap on registration index keeps the order
    // stable: among ready nodes the earliest registered runs first.
    std::vector<std::uint32_t> inDeg = inDegree_;
    std::priority_queue<std::uint32_t, std::vector<std::uint32_t>, std::greater<>> ready;
    for (std::uint32_t i = 0; i < n; ++i) {
        if (inDeg[i] == 0) ready.push(i);
    }

    std::vector<std::uint32_t> order;
    order.reserve(n);
    while (!ready.empty()) {
        auto cur = ready.top();
        ready.pop();
        order.push_back(cur);
        for (auto next : adj_[cur]) {
            if (--inDeg[next] == 0) ready.push(next);
        }
    }

    assert(order.size() == n && "acyclic graph must sort completely");
    return order;
}

} // namespace nodeplumb::graph
