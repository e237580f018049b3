// Headless walk-through of a runtime-sized compute sub-graph.
//
// A host buffer is wired through one compute node that fills it in place.
// The node's descriptor arrives late through a provider (as if its pipeline
// were still compiling), the trigger is manual, and the host buffer grows
// between ticks. The backend prints what a GPU layer would record.

#include <nodeplumb/graph.hpp>
#include <nodeplumb/nodeplumb.hpp>

#include <cstdint>
#include <cstdio>
#include <string>
#include <utility>

namespace {

// One invocation per f32.
nodeplumb::WorkgroupCount onePerFloat(const nodeplumb::GraphContext& ctx) {
    auto bytes = ctx.bufferSize("buffer").value_or(0);
    return {static_cast<std::uint32_t>(bytes / sizeof(float)), 1, 1};
}

class PrintingBackend : public nodeplumb::DispatchBackend {
public:
    nodeplumb::Result<nodeplumb::ResourceView>
    provideOutput(const nodeplumb::OutputRequest& request) override {
        return nodeplumb::Error{"provide output", nodeplumb::ErrorKind::Backend,
                                std::string(request.node) + " has no outputs in this example"};
    }

    nodeplumb::Result<void> dispatch(const nodeplumb::DispatchCommand& command) override {
        if (command.empty()) {
            std::printf("  %.*s: empty dispatch, skipped\n", static_cast<int>(command.node.size()),
                        command.node.data());
            return {};
        }
        std::printf("  %.*s: vkCmdDispatch(%u, %u, %u)\n", static_cast<int>(command.node.size()),
                    command.node.data(), command.workgroups.x, command.workgroups.y,
                    command.workgroups.z);
        for (const auto& r : command.resources) {
            std::printf("    binding %u '%.*s' (%.*s): %llu bytes\n", r.index,
                        static_cast<int>(r.name.size()), r.name.data(),
                        static_cast<int>(nodeplumb::bindingDirectionName(r.direction).size()),
                        nodeplumb::bindingDirectionName(r.direction).data(),
                        static_cast<unsigned long long>(r.view.extent.byteSize));
        }
        return {};
    }
};

} // namespace

int main() {
    using namespace nodeplumb;
    using namespace nodeplumb::graph;

    // Host-owned buffer: 1024 floats to start with.
    SharedResource hostBuffer(ResourceView::ofBuffer(VK_NULL_HANDLE, 1024 * sizeof(float),
                                                     VK_BUFFER_USAGE_STORAGE_BUFFER_BIT));

    NodeProvider fillProvider(/*owner=*/1);
    TriggerHandle trigger(false);

    SubGraphBuilder builder;
    builder.name("fill_buffer_with_f32")
        .addInputResource("input", hostBuffer)
        .addNodeProvider("fill", fillProvider)
        .addOutputResource("output", hostBuffer)
        .addSlotEdge("input", kSourceSlot, "fill", "buffer")
        .addSlotEdge("fill", "buffer", "output", kSinkSlot)
        .trigger(TriggerGate::manual(trigger));

    SubGraphRunner runner(std::move(builder));
    PrintingBackend backend;
    auto inputs = makeGraphInputs();

    auto report = [](int frame, const TickResult& tick) {
        std::printf("frame %d: %s%s\n", frame, tickStatusName(tick.status),
                    tick.rebuilt ? " (rebuilt)" : "");
        if (tick.error) std::printf("  %s\n", tick.error->format().c_str());
    };

    for (int frame = 0; frame < 6; ++frame) {
        switch (frame) {
        case 1: {
            // Pipeline finished compiling.
            auto fill = NodeBuilder{}
                            .label("fill")
                            .shader("shaders/fill_buffer_with_f32.comp.spv")
                            .entryPoint("main")
                            .inputOutput("buffer", 0)
                            .dispatch(DispatchStrategy::fromContext(onePerFloat))
                            .build();
            if (!fill.ok()) {
                std::fprintf(stderr, "%s\n", fill.error().format().c_str());
                return 1;
            }
            fillProvider.publish(std::move(fill).value());
            break;
        }
        case 3:
            trigger.set(true);
            break;
        case 4:
            // Host grows the buffer; no rebuild needed.
            hostBuffer.write(ResourceView::ofBuffer(VK_NULL_HANDLE, 4096 * sizeof(float)));
            break;
        default:
            break;
        }

        auto tick = runner.tick(backend, inputs);
        report(frame, tick);
    }

    if (const auto* def = runner.definition()) def->dumpLog();

    const auto& stats = runner.stats();
    std::printf("ticks %llu, builds %llu, executions %llu, skipped %llu\n",
                static_cast<unsigned long long>(stats.ticks),
                static_cast<unsigned long long>(stats.builds),
                static_cast<unsigned long long>(stats.executions),
                static_cast<unsigned long long>(stats.skipped));
    return 0;
}
