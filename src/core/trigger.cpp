#include <nodeplumb/graph_context.hpp>
#include <nodeplumb/trigger.hpp>

#include <cassert>
#include <mutex>
#include <utility>

namespace nodeplumb {

struct TriggerHandle::Cell {
    mutable std::mutex mutex;
    bool               value = false;
};

TriggerHandle::TriggerHandle(bool initial) : cell_(std::make_shared<Cell>()) {
    cell_->value = initial;
}

void TriggerHandle::set(bool value) {
    std::lock_guard lock(cell_->mutex);
    cell_->value = value;
}

bool TriggerHandle::get() const {
    std::lock_guard lock(cell_->mutex);
    return cell_->value;
}

TriggerGate TriggerGate::manual(TriggerHandle handle) {
    TriggerGate gate;
    gate.mode_ = Mode::Manual;
    gate.handle_ = std::make_shared<TriggerHandle>(std::move(handle));
    return gate;
}

TriggerGate TriggerGate::conditional(TriggerPredicate predicate) {
    assert(predicate && "TriggerGate::conditional requires a predicate");
    TriggerGate gate;
    gate.mode_ = Mode::Conditional;
    gate.predicate_ = predicate;
    return gate;
}

bool TriggerGate::isOpen(const GraphContext& inputs) const {
    switch (mode_) {
    case Mode::Always:
        return true;
    case Mode::Manual:
        return handle_->get();
    case Mode::Conditional:
        return predicate_(inputs);
    }
    return false;
}

std::string_view triggerModeName(TriggerGate::Mode mode) {
    switch (mode) {
    case TriggerGate::Mode::Always:
        return "always";
    case TriggerGate::Mode::Manual:
        return "manual";
    case TriggerGate::Mode::Conditional:
        return "conditional";
    }
    return "unknown";
}

} // namespace nodeplumb
