#include <nodeplumb/graph/resolver.hpp>

#include <chrono>
#include <cstdio>
#include <utility>

namespace nodeplumb::graph {

namespace {

constexpr const char* kOperation = "execute sub-graph";

double elapsedUs(std::chrono::steady_clock::time_point start) {
    auto d = std::chrono::steady_clock::now() - start;
    return std::chrono::duration<double, std::micro>(d).count();
}

Error backendError(std::string_view node, const Error& cause) {
    std::vector<Issue> issues;
    issues.push_back({ErrorKind::Backend, std::string(node),
                      cause.operation.empty() ? cause.message
                                              : cause.operation + ": " + cause.message});
    return Error::fromIssues(kOperation, std::move(issues));
}

Error missingInput(std::string_view node, std::string_view slot) {
    std::vector<Issue> issues;
    issues.push_back({ErrorKind::MissingInput, std::string(node) + "." + std::string(slot),
                      "input slot has no resource this invocation"});
    return Error::fromIssues(kOperation, std::move(issues));
}

} // namespace

const NodeReport* InvocationReport::find(std::string_view name) const {
    for (const auto& n : nodes) {
        if (n.name == name) return &n;
    }
    return nullptr;
}

void InvocationReport::dumpLog() const {
    if (!executed) {
        std::fprintf(stderr, "[nodeplumb::graph] invocation skipped (gate closed)\n");
        return;
    }

    std::fprintf(stderr,
                 "[nodeplumb::graph] invocation: %u dispatched (%u empty), %u strategy evals, "
                 "%u size evals, %.1f us\n",
                 stats.nodesDispatched, stats.zeroDispatches, stats.strategyEvaluations,
                 stats.sizeEvaluations, stats.resolveUs);

    for (std::uint32_t i = 0; i < static_cast<std::uint32_t>(nodes.size()); ++i) {
        const auto& n = nodes[i];
        if (n.role == NodeRole::Compute) {
            std::fprintf(stderr, "  [%u] %-20s dispatch (%u, %u, %u)\n", i, n.name.c_str(),
                         n.workgroups.x, n.workgroups.y, n.workgroups.z);
        } else {
            std::fprintf(stderr, "  [%u] %-20s (%s)\n", i, n.name.c_str(), nodeRoleName(n.role));
        }
        for (const auto& [slot, extent] : n.outputs) {
            std::fprintf(stderr, "        %-12s %llu bytes, %ux%ux%u\n", slot.c_str(),
                         static_cast<unsigned long long>(extent.byteSize), extent.size.x,
                         extent.size.y, extent.size.z);
        }
    }
}

Result<InvocationReport> DynamicResolver::execute(const SubGraphDefinition& definition,
                                                  const GraphContext& inputs) const {
    auto start = std::chrono::steady_clock::now();

    // Only declared graph inputs are visible inside the graph.
    GraphContext boundary(std::string(kGraphInputNode));
    for (const auto& gi : definition.graphInputs()) {
        if (const auto* view = inputs.find(gi.name)) {
            boundary.bind(gi.name, *view);
        }
    }

    InvocationReport report;
    if (!definition.trigger().isOpen(boundary)) {
        report.stats.resolveUs = elapsedUs(start);
        return report;
    }
    report.executed = true;
    auto& stats = report.stats;

    const auto& nodes = definition.nodes();

    // Views published by each node this invocation, indexed like nodes().
    std::vector<GraphContext> published;
    published.reserve(nodes.size());
    for (const auto& n : nodes) {
        published.emplace_back(n.name);
    }

    for (std::size_t i = 0; i < nodes.size(); ++i) {
        const auto& node = nodes[i];

        GraphContext ctx(node.name);
        for (const auto& in : node.inputs) {
            const ResourceView* view = in.fromGraphInput()
                                           ? boundary.find(in.producerSlot)
                                           : published[in.producer].find(in.producerSlot);
            if (view) ctx.bind(in.slot, *view);
        }

        NodeReport nr;
        nr.name = node.name;
        nr.role = node.role;

        if (node.role == NodeRole::Source) {
            ResourceView view = node.resource->read();
            ++stats.resourceReads;
            published[i].bind(kSourceSlot, view);
            nr.outputs.emplace_back(std::string(kSourceSlot), view.extent);
            report.nodes.push_back(std::move(nr));
            continue;
        }

        if (node.role == NodeRole::Sink) {
            const auto* view = ctx.find(kSinkSlot);
            if (!view) {
#ifndef NDEBUG
                std::fprintf(stderr, "[nodeplumb::graph] '%s': sink '%s' received nothing\n",
                             definition.name().c_str(), node.name.c_str());
#endif
                return missingInput(node.name, kSinkSlot);
            }
            SharedResource sink = *node.resource; // shares the host's cell
            sink.write(*view);
            ++stats.resourceWrites;
            report.nodes.push_back(std::move(nr));
            continue;
        }

        const NodeDescriptor& desc = *node.descriptor;
        const auto& bindings = desc.bindings();

        WorkgroupCount workgroups = desc.dispatch().evaluate(ctx);
        ++stats.strategyEvaluations;

        std::vector<ResourceExtent> extents(bindings.size());
        for (std::size_t b = 0; b < bindings.size(); ++b) {
            if (bindings[b].direction != BindingDirection::Output) continue;
            extents[b] = bindings[b].size.evaluate(ctx);
            ++stats.sizeEvaluations;
        }

        // Every consumed binding must have a view before anything is provided.
        for (const auto& b : bindings) {
            if (b.isInputSlot() && !ctx.contains(b.name)) {
#ifndef NDEBUG
                std::fprintf(stderr, "[nodeplumb::graph] '%s': %s.%s has no resource\n",
                             definition.name().c_str(), node.name.c_str(), b.name.c_str());
#endif
                return missingInput(node.name, b.name);
            }
        }

        DispatchCommand cmd;
        cmd.node = node.name;
        cmd.descriptor = &desc;
        cmd.workgroups = workgroups;
        cmd.resources.reserve(bindings.size());

        for (std::size_t b = 0; b < bindings.size(); ++b) {
            const auto& binding = bindings[b];

            BoundResource br;
            br.name = binding.name;
            br.index = binding.index;
            br.direction = binding.direction;

            if (binding.direction == BindingDirection::Output) {
                OutputRequest req;
                req.node = node.name;
                req.binding = &binding;
                req.extent = extents[b];

                auto provided = backend_->provideOutput(req);
                if (!provided.ok()) return backendError(node.name, provided.error());
                if (provided.value().kind != binding.kind) {
                    return backendError(
                        node.name,
                        Error{"provide output", ErrorKind::Backend,
                              "provided " + std::string(resourceKindName(provided.value().kind)) +
                                  " for " + std::string(resourceKindName(binding.kind)) +
                                  " binding '" + binding.name +
                                  "': resource kind does not match binding"});
                }
                br.view = provided.value();
                ++stats.outputsProvided;
            } else {
                br.view = *ctx.find(binding.name);
            }
            cmd.resources.push_back(br);
        }

        auto dispatched = backend_->dispatch(cmd);
        if (!dispatched.ok()) return backendError(node.name, dispatched.error());

        ++stats.nodesDispatched;
        if (cmd.empty()) ++stats.zeroDispatches;

        // Outputs and in-place bindings feed downstream nodes.
        for (const auto& br : cmd.resources) {
            if (br.direction == BindingDirection::Input) continue;
            published[i].bind(br.name, br.view);
            nr.outputs.emplace_back(std::string(br.name), br.view.extent);
        }

        nr.workgroups = workgroups;
        report.nodes.push_back(std::move(nr));
    }

    stats.resolveUs = elapsedUs(start);
    return report;
}

} // namespace nodeplumb::graph
