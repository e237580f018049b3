#include <nodeplumb/node_provider.hpp>

#include <mutex>
#include <utility>

namespace nodeplumb {

struct NodeProvider::Cell {
    mutable std::mutex mutex;
    ProviderSnapshot   snapshot;
};

std::string_view providerStateName(ProviderState state) {
    switch (state) {
    case ProviderState::Pending:
        return "pending";
    case ProviderState::Ready:
        return "ready";
    case ProviderState::Failed:
        return "failed";
    }
    return "unknown";
}

NodeProvider::NodeProvider(EntityId owner) : owner_(owner), cell_(std::make_shared<Cell>()) {}

NodeProvider::NodeProvider(EntityId owner, NodeDescriptor inProgress)
    : owner_(owner), cell_(std::make_shared<Cell>()) {
    cell_->snapshot.descriptor = std::make_shared<const NodeDescriptor>(std::move(inProgress));
}

void NodeProvider::stage(NodeDescriptor descriptor) {
    auto shared = std::make_shared<const NodeDescriptor>(std::move(descriptor));
    std::lock_guard lock(cell_->mutex);
    auto& s = cell_->snapshot;
    s.descriptor = std::move(shared);
    s.state = ProviderState::Pending;
    s.message.clear();
    ++s.revision;
}

bool NodeProvider::markReady() {
    std::lock_guard lock(cell_->mutex);
    auto& s = cell_->snapshot;
    if (!s.descriptor) return false;
    if (s.state == ProviderState::Ready) return true;
    s.state = ProviderState::Ready;
    s.message.clear();
    ++s.revision;
    return true;
}

void NodeProvider::publish(NodeDescriptor descriptor) {
    auto shared = std::make_shared<const NodeDescriptor>(std::move(descriptor));
    std::lock_guard lock(cell_->mutex);
    auto& s = cell_->snapshot;
    s.descriptor = std::move(shared);
    s.state = ProviderState::Ready;
    s.message.clear();
    ++s.revision;
}

void NodeProvider::fail(std::string message) {
    std::lock_guard lock(cell_->mutex);
    auto& s = cell_->snapshot;
    s.state = ProviderState::Failed;
    s.message = std::move(message);
    ++s.revision;
}

ProviderSnapshot NodeProvider::snapshot() const {
    std::lock_guard lock(cell_->mutex);
    return cell_->snapshot;
}

ProviderState NodeProvider::state() const {
    std::lock_guard lock(cell_->mutex);
    return cell_->snapshot.state;
}

std::uint64_t NodeProvider::revision() const {
    std::lock_guard lock(cell_->mutex);
    return cell_->snapshot.revision;
}

} // namespace nodeplumb
