#include <nodeplumb/graph/runner.hpp>

#include <cstdio>
#include <utility>

namespace nodeplumb::graph {

const char* tickStatusName(TickStatus status) {
    switch (status) {
    case TickStatus::NotReady:
        return "not ready";
    case TickStatus::GateClosed:
        return "gate closed";
    case TickStatus::Executed:
        return "executed";
    case TickStatus::Failed:
        return "failed";
    }
    return "unknown";
}

SubGraphRunner::SubGraphRunner(SubGraphBuilder builder) : builder_(std::move(builder)) {}

bool SubGraphRunner::providersChanged() const {
    const auto& built = definition_->providerRevisions();
    for (const auto& entry : builder_.providers()) {
        auto current = entry.provider.revision();
        bool found = false;
        for (const auto& [node, revision] : built) {
            if (node != entry.node) continue;
            found = true;
            if (revision != current) return true;
            break;
        }
        if (!found) return true;
    }
    return false;
}

TickResult SubGraphRunner::tick(DispatchBackend& backend, const GraphContext& inputs) {
    ++stats_.ticks;
    TickResult result;

    if (!definition_ || providersChanged()) {
        // A stale definition is never used, even if the rebuild fails.
        definition_.reset();

        auto built = builder_.build();
        if (!built.ok()) {
            ++stats_.failedBuilds;
            ++stats_.notReady;
#ifndef NDEBUG
            std::fprintf(stderr, "[nodeplumb::graph] %s\n", built.error().format().c_str());
#endif
            result.status = TickStatus::NotReady;
            result.error = std::move(built).error();
            return result;
        }

        definition_.emplace(std::move(built).value());
        ++stats_.builds;
        result.rebuilt = true;
    }

    DynamicResolver resolver(backend);
    auto invocation = resolver.execute(*definition_, inputs);
    if (!invocation.ok()) {
        ++stats_.failures;
        result.status = TickStatus::Failed;
        result.error = std::move(invocation).error();
        return result;
    }

    result.report = std::move(invocation).value();
    if (result.report.executed) {
        ++stats_.executions;
        result.status = TickStatus::Executed;
    } else {
        ++stats_.skipped;
        result.status = TickStatus::GateClosed;
    }
    return result;
}

} // namespace nodeplumb::graph
