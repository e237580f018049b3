#pragma once

#include <cstdint>
#include <memory>
#include <string_view>

namespace nodeplumb {

class GraphContext;

// Shared boolean cell flipped by the host and read by the sub-graph.
//
// Thread safety: all methods are thread-safe.
class TriggerHandle {
public:
    explicit TriggerHandle(bool initial = false);

    void set(bool value);
    [[nodiscard]] bool get() const;

    [[nodiscard]] long useCount() const { return cell_.use_count(); }

private:
    struct Cell;
    std::shared_ptr<Cell> cell_;
};

// Predicate over the sub-graph's bound graph inputs.
using TriggerPredicate = bool (*)(const GraphContext&);

// Decides, once per invocation, whether the sub-graph runs. Holds no memory
// of earlier invocations; a manual gate only reads its handle.
class TriggerGate {
public:
    enum class Mode : std::uint8_t {
        Always,
        Manual,
        Conditional,
    };

    // Default: Always.
    TriggerGate() = default;

    [[nodiscard]] static TriggerGate always() { return TriggerGate{}; }
    [[nodiscard]] static TriggerGate manual(TriggerHandle handle);
    [[nodiscard]] static TriggerGate conditional(TriggerPredicate predicate);

    [[nodiscard]] Mode mode() const { return mode_; }

    // `inputs` is the graph input boundary context; only Conditional looks at it.
    [[nodiscard]] bool isOpen(const GraphContext& inputs) const;

    // nullptr unless Manual.
    [[nodiscard]] const TriggerHandle* handle() const { return handle_.get(); }

private:
    Mode                           mode_ = Mode::Always;
    std::shared_ptr<TriggerHandle> handle_;
    TriggerPredicate               predicate_ = nullptr;
};

[[nodiscard]] std::string_view triggerModeName(TriggerGate::Mode mode);

} // namespace nodeplumb
