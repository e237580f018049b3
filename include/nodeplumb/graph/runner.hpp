#pragma once

#include <nodeplumb/backend.hpp>
#include <nodeplumb/graph/resolver.hpp>
#include <nodeplumb/graph/sub_graph.hpp>

#include <cstdint>
#include <optional>

namespace nodeplumb::graph {

enum class TickStatus : std::uint8_t {
    NotReady,   // no usable definition (providers pending/failed, or build error)
    GateClosed, // definition ready, trigger said no
    Executed,   // every node dispatched
    Failed,     // invocation aborted (MissingInput, Backend)
};

[[nodiscard]] const char* tickStatusName(TickStatus status);

struct TickResult {
    TickStatus           status = TickStatus::NotReady;
    std::optional<Error> error;   // NotReady after a failed build, or Failed
    InvocationReport     report;  // GateClosed / Executed
    bool                 rebuilt = false;
};

struct RunnerStats {
    std::uint64_t ticks        = 0;
    std::uint64_t builds       = 0; // successful
    std::uint64_t failedBuilds = 0;
    std::uint64_t executions   = 0;
    std::uint64_t skipped      = 0; // gate closed
    std::uint64_t notReady     = 0;
    std::uint64_t failures     = 0; // per-invocation errors
};

// Per-tick driver for one sub-graph. Holds the composition and the most
// recent definition, rebuilds whenever a provider publishes a new revision,
// and degrades to "does not run this tick" on any failure.
//
// Usage:
//   SubGraphRunner runner(std::move(builder));
//   for (;;) {
//       auto tick = runner.tick(backend, inputs);
//       if (tick.status == TickStatus::NotReady) { ... }
//   }
//
// Thread safety: thread-confined.
class SubGraphRunner {
public:
    explicit SubGraphRunner(SubGraphBuilder builder);

    [[nodiscard]] TickResult tick(DispatchBackend& backend, const GraphContext& inputs);

    // Drop the current definition; the next tick builds again.
    void invalidate() { definition_.reset(); }

    [[nodiscard]] bool deployed() const { return definition_.has_value(); }

    // nullptr until a build succeeds.
    [[nodiscard]] const SubGraphDefinition* definition() const {
        return definition_ ? &*definition_ : nullptr;
    }

    [[nodiscard]] const SubGraphBuilder& builder() const { return builder_; }
    [[nodiscard]] const RunnerStats& stats() const { return stats_; }

private:
    // True when any provider's revision differs from the one the current
    // definition was built against.
    [[nodiscard]] bool providersChanged() const;

    SubGraphBuilder                   builder_;
    std::optional<SubGraphDefinition> definition_;
    RunnerStats                       stats_;
};

} // namespace nodeplumb::graph
