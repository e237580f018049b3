#pragma once

#include <glm/glm.hpp>

#include <cassert>
#include <cstdint>
#include <variant>

namespace nodeplumb {

class GraphContext;

// Workgroup counts for one vkCmdDispatch. A zero in any component makes the
// dispatch a no-op.
using WorkgroupCount = glm::uvec3;

// Dispatch counts computed from the node's resolved inputs. A plain function
// pointer: strategies read the context they are given and nothing else.
using WorkgroupFn = WorkgroupCount (*)(const GraphContext&);

// Policy for a node's workgroup counts.
//
// Usage:
//   DispatchStrategy::fixed(64, 1, 1);
//   DispatchStrategy::fromContext([](const GraphContext& ctx) {
//       auto bytes = ctx.bufferSize("buffer").value_or(0);
//       return WorkgroupCount{static_cast<std::uint32_t>(bytes / 4), 1, 1};
//   });
class DispatchStrategy {
public:
    enum class Kind : std::uint8_t {
        Fixed,
        FromContext,
    };

    [[nodiscard]] static DispatchStrategy fixed(std::uint32_t x, std::uint32_t y = 1,
                                                std::uint32_t z = 1) {
        return DispatchStrategy(WorkgroupCount{x, y, z});
    }

    [[nodiscard]] static DispatchStrategy fromContext(WorkgroupFn fn) {
        return DispatchStrategy(fn);
    }

    [[nodiscard]] Kind kind() const {
        return std::holds_alternative<WorkgroupCount>(policy_) ? Kind::Fixed : Kind::FromContext;
    }

    // Fixed triples must be positive in every component; context functions
    // must be non-null.
    [[nodiscard]] bool valid() const;

    // Fixed: the constant triple, regardless of ctx.
    // FromContext: whatever the function returns for ctx, zero included.
    [[nodiscard]] WorkgroupCount evaluate(const GraphContext& ctx) const;

private:
    explicit DispatchStrategy(WorkgroupCount count) : policy_(count) {}
    explicit DispatchStrategy(WorkgroupFn fn) : policy_(fn) {}

    std::variant<WorkgroupCount, WorkgroupFn> policy_;
};

// Round-up division for "one workgroup per localSize elements".
// localSize must be non-zero.
[[nodiscard]] inline std::uint32_t workgroupsFor(std::uint64_t elements, std::uint32_t localSize) {
    assert(localSize > 0 && "workgroupsFor: localSize must be non-zero");
    return static_cast<std::uint32_t>(elements / localSize + (elements % localSize != 0 ? 1 : 0));
}

[[nodiscard]] inline bool isEmptyDispatch(const WorkgroupCount& count) {
    return count.x == 0 || count.y == 0 || count.z == 0;
}

} // namespace nodeplumb
