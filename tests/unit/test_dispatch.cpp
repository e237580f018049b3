#include <nodeplumb/binding.hpp>
#include <nodeplumb/dispatch.hpp>
#include <nodeplumb/graph_context.hpp>

#include <cassert>
#include <cstdio>

using namespace nodeplumb;

namespace {

WorkgroupCount quarterOfBuffer(const GraphContext& ctx) {
    auto bytes = ctx.bufferSize("buffer").value_or(0);
    return {static_cast<std::uint32_t>(bytes / 4), 1, 1};
}

// Reports whether the slot was visible at all, separately from its size.
WorkgroupCount presence(const GraphContext& ctx) {
    auto bytes = ctx.bufferSize("buffer");
    if (!bytes) return {7, 7, 7};
    return {static_cast<std::uint32_t>(*bytes), 1, 1};
}

ResourceExtent doubled(const GraphContext& ctx) {
    return ResourceExtent::bytes(ctx.bufferSize("buffer").value_or(0) * 2);
}

GraphContext withBuffer(VkDeviceSize size) {
    GraphContext ctx("fill");
    ctx.bind("buffer", ResourceView::ofBuffer(VK_NULL_HANDLE, size));
    return ctx;
}

} // namespace

int main() {
    std::printf("dispatch strategy test\n");

    // Fixed ignores the context.
    {
        auto s = DispatchStrategy::fixed(8, 4, 2);
        assert(s.kind() == DispatchStrategy::Kind::Fixed);
        assert(s.valid());
        assert(s.evaluate(GraphContext{}) == WorkgroupCount(8, 4, 2));
        assert(s.evaluate(withBuffer(1 << 20)) == WorkgroupCount(8, 4, 2));
        std::printf("  fixed: ok\n");
    }

    // S/4 for several buffer sizes, zero included.
    {
        auto s = DispatchStrategy::fromContext(quarterOfBuffer);
        assert(s.kind() == DispatchStrategy::Kind::FromContext);
        assert(s.valid());
        assert(s.evaluate(withBuffer(0)).x == 0);
        assert(s.evaluate(withBuffer(4)).x == 1);
        assert(s.evaluate(withBuffer(262140)).x == 65535);
        assert(isEmptyDispatch(s.evaluate(withBuffer(0))));
        assert(!isEmptyDispatch(s.evaluate(withBuffer(4))));
        std::printf("  from context: ok\n");
    }

    // Absent and zero-size are different answers.
    {
        auto s = DispatchStrategy::fromContext(presence);
        assert(s.evaluate(GraphContext("fill")) == WorkgroupCount(7, 7, 7));
        assert(s.evaluate(withBuffer(0)) == WorkgroupCount(0, 1, 1));
        std::printf("  absent vs zero: ok\n");
    }

    // Invalid strategies.
    {
        assert(!DispatchStrategy::fixed(0).valid());
        assert(!DispatchStrategy::fixed(1, 1, 0).valid());
        assert(!DispatchStrategy::fromContext(nullptr).valid());
        std::printf("  invalid strategies: ok\n");
    }

    // Size strategies.
    {
        SizeStrategy none;
        assert(none.isFixed());
        assert(none.evaluate(GraphContext{}) == ResourceExtent{});

        auto fixed = SizeStrategy::bytes(256);
        assert(fixed.evaluate(withBuffer(4)).byteSize == 256);

        auto dyn = SizeStrategy::fromContext(doubled);
        assert(!dyn.isFixed());
        assert(dyn.evaluate(withBuffer(100)).byteSize == 200);
        assert(dyn.evaluate(GraphContext{}).byteSize == 0);
        std::printf("  size strategies: ok\n");
    }

    // Context accessors by kind.
    {
        GraphContext ctx("blur");
        ctx.bind("buf", ResourceView::ofBuffer(VK_NULL_HANDLE, 64));
        ctx.bind("img", ResourceView::ofImage(VK_NULL_HANDLE, VK_NULL_HANDLE,
                                              VK_FORMAT_R32_SFLOAT, 640, 480));
        assert(ctx.nodeName() == "blur");
        assert(ctx.slotCount() == 2);
        assert(ctx.bufferSize("buf") == VkDeviceSize{64});
        assert(!ctx.bufferSize("img"));
        assert(!ctx.textureSize("buf"));
        assert(ctx.textureSize("img") == glm::uvec3(640, 480, 1));
        assert(ctx.textureFormat("img") == VK_FORMAT_R32_SFLOAT);
        assert(!ctx.extent("nope"));

        // Rebinding replaces.
        ctx.bind("buf", ResourceView::ofBuffer(VK_NULL_HANDLE, 128));
        assert(ctx.slotCount() == 2);
        assert(ctx.bufferSize("buf") == VkDeviceSize{128});
        std::printf("  graph context: ok\n");
    }

    // Round-up helper.
    {
        assert(workgroupsFor(0, 64) == 0);
        assert(workgroupsFor(1, 64) == 1);
        assert(workgroupsFor(64, 64) == 1);
        assert(workgroupsFor(65, 64) == 2);
        assert(workgroupsFor(std::uint64_t{1} << 36, 1u << 31) == 32);
        assert(workgroupsFor((std::uint64_t{1} << 36) + 1, 1u << 31) == 33);
        assert(workgroupsFor(5, 1) == 5);
        std::printf("  workgroupsFor: ok\n");
    }

    std::printf("dispatch strategy test passed\n");
    return 0;
}
