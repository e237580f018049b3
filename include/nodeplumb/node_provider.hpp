#pragma once

#include <nodeplumb/node.hpp>

#include <cstdint>
#include <memory>
#include <string>
#include <string_view>

namespace nodeplumb {

// Opaque id of a host entity (ECS entity, scene object, ...).
using EntityId = std::uint64_t;

enum class ProviderState : std::uint8_t {
    Pending, // descriptor not ready yet (e.g. pipeline still compiling)
    Ready,   // descriptor can be placed in a graph
    Failed,  // authoring side gave up; message says why
};

[[nodiscard]] std::string_view providerStateName(ProviderState state);

// What the execution side sees when it pulls a provider.
struct ProviderSnapshot {
    ProviderState                         state = ProviderState::Pending;
    std::shared_ptr<const NodeDescriptor> descriptor; // set once staged or published
    std::string                           message;    // Failed only
    std::uint64_t                         revision = 0;
};

// Deferred, externally owned node definition. The authoring side stages a
// descriptor, then publishes it (or fails) once whatever it waits on is done.
// The sub-graph builder pulls a snapshot when it builds; a provider that is not
// Ready at that point fails the build with UnresolvedProvider.
//
// Copies share one cell. Every state change bumps the revision, which is how
// a runner notices it has to rebuild.
//
// Thread safety: all methods are thread-safe.
class NodeProvider {
public:
    explicit NodeProvider(EntityId owner);
    NodeProvider(EntityId owner, NodeDescriptor inProgress);

    [[nodiscard]] EntityId owner() const { return owner_; }

    // Replace the descriptor-in-progress. State goes back to Pending.
    void stage(NodeDescriptor descriptor);

    // Mark the staged descriptor ready. Returns false (and changes nothing)
    // when nothing is staged.
    bool markReady();

    // stage() + markReady() in one step.
    void publish(NodeDescriptor descriptor);

    void fail(std::string message);

    [[nodiscard]] ProviderSnapshot snapshot() const;
    [[nodiscard]] ProviderState state() const;
    [[nodiscard]] std::uint64_t revision() const;

    [[nodiscard]] bool sharesWith(const NodeProvider& other) const {
        return cell_ == other.cell_;
    }

private:
    struct Cell;

    EntityId              owner_;
    std::shared_ptr<Cell> cell_;
};

} // namespace nodeplumb
