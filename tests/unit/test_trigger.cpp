#include <nodeplumb/graph/resolver.hpp>
#include <nodeplumb/trigger.hpp>

#include "recording_backend.hpp"

#include <cassert>
#include <cstdio>

using namespace nodeplumb;
using namespace nodeplumb::graph;
using nodeplumb::test::RecordingBackend;

namespace {

WorkgroupCount quarterOfBuffer(const GraphContext& ctx) {
    auto bytes = ctx.bufferSize("buffer").value_or(0);
    return {static_cast<std::uint32_t>(bytes / 4), 1, 1};
}

bool hasWork(const GraphContext& inputs) {
    return inputs.bufferSize("work").value_or(0) > 0;
}

bool anyInput(const GraphContext& inputs) {
    return inputs.slotCount() > 0;
}

SubGraphDefinition fillGraph(SharedResource input, TriggerGate gate) {
    auto fill = NodeBuilder{}
                    .shader("fill.spv")
                    .entryPoint("main")
                    .inputOutput("buffer", 0)
                    .dispatch(DispatchStrategy::fromContext(quarterOfBuffer))
                    .build()
                    .orThrow();
    return SubGraphBuilder{}
        .name("fill")
        .graphInput("work")
        .addInputResource("input", input)
        .addNode("fill", fill)
        .addSlotEdge("input", "out", "fill", "buffer")
        .trigger(gate)
        .build()
        .orThrow();
}

} // namespace

int main() {
    std::printf("trigger gate test\n");

    // Handle basics.
    {
        TriggerHandle h;
        assert(!h.get());
        h.set(true);
        assert(h.get());

        TriggerHandle copy = h;
        copy.set(false);
        assert(!h.get());
        assert(h.useCount() == 2);
        std::printf("  handle: ok\n");
    }

    // Gate modes.
    {
        GraphContext none;
        assert(TriggerGate{}.mode() == TriggerGate::Mode::Always);
        assert(TriggerGate::always().isOpen(none));
        assert(TriggerGate::always().handle() == nullptr);

        TriggerHandle h(false);
        auto manual = TriggerGate::manual(h);
        assert(manual.mode() == TriggerGate::Mode::Manual);
        assert(!manual.isOpen(none));
        h.set(true);
        assert(manual.isOpen(none));
        // Reading never resets the flag.
        assert(manual.isOpen(none));
        assert(manual.handle()->get());

        auto cond = TriggerGate::conditional(hasWork);
        assert(!cond.isOpen(none));
        GraphContext work;
        work.bind("work", ResourceView::ofBuffer(VK_NULL_HANDLE, 16));
        assert(cond.isOpen(work));
        assert(triggerModeName(TriggerGate::Mode::Conditional) == "conditional");
        std::printf("  gate modes: ok\n");
    }

    // Closed manual gate: no strategy evaluation, no resource read, no dispatch.
    {
        SharedResource input(ResourceView::ofBuffer(VK_NULL_HANDLE, 1024));
        TriggerHandle h(false);
        auto def = fillGraph(input, TriggerGate::manual(h));

        RecordingBackend backend;
        DynamicResolver resolver(backend);

        auto closed = resolver.execute(def, makeGraphInputs());
        assert(closed.ok());
        assert(!closed.value().executed);
        assert(closed.value().stats.strategyEvaluations == 0);
        assert(closed.value().stats.sizeEvaluations == 0);
        assert(closed.value().stats.resourceReads == 0);
        assert(input.readCount() == 0);
        assert(backend.dispatches.empty());

        h.set(true);
        auto open = resolver.execute(def, makeGraphInputs());
        assert(open.ok());
        assert(open.value().executed);
        assert(open.value().stats.strategyEvaluations == 1); // one per compute node
        assert(input.readCount() == 1);
        assert(backend.dispatches.size() == 1);
        assert(backend.dispatches[0].workgroups.x == 256);

        // The flag stays set; the next invocation runs again.
        auto again = resolver.execute(def, makeGraphInputs());
        assert(again.value().executed);
        assert(h.get());
        std::printf("  manual gate: ok\n");
    }

    // Conditional gate sees only declared graph inputs.
    {
        SharedResource input(ResourceView::ofBuffer(VK_NULL_HANDLE, 64));
        auto def = fillGraph(input, TriggerGate::conditional(hasWork));

        RecordingBackend backend;
        DynamicResolver resolver(backend);

        auto inputs = makeGraphInputs();
        inputs.bind("work", ResourceView::ofBuffer(VK_NULL_HANDLE, 0));
        assert(!resolver.execute(def, inputs).value().executed);

        inputs.bind("work", ResourceView::ofBuffer(VK_NULL_HANDLE, 8));
        assert(resolver.execute(def, inputs).value().executed);

        // Undeclared slots are invisible to the predicate.
        auto any = fillGraph(input, TriggerGate::conditional(anyInput));
        auto undeclared = makeGraphInputs();
        undeclared.bind("other", ResourceView::ofBuffer(VK_NULL_HANDLE, 8));
        assert(!resolver.execute(any, undeclared).value().executed);
        undeclared.bind("work", ResourceView::ofBuffer(VK_NULL_HANDLE, 8));
        assert(resolver.execute(any, undeclared).value().executed);
        std::printf("  conditional gate: ok\n");
    }

    std::printf("trigger gate test passed\n");
    return 0;
}
