#include <nodeplumb/graph/sub_graph.hpp>

#include <cassert>
#include <cstdio>
#include <memory>
#include <string>
#include <vector>

using namespace nodeplumb;
using namespace nodeplumb::graph;

namespace {

NodeDescriptor producerNode() {
    return NodeBuilder{}
        .label("producer")
        .shader("producer.spv")
        .entryPoint("main")
        .workgroups(1)
        .outputBuffer("buf", 0, SizeStrategy::bytes(1024))
        .build()
        .orThrow();
}

NodeDescriptor consumerNode() {
    return NodeBuilder{}
        .label("consumer")
        .shader("consumer.spv")
        .entryPoint("main")
        .workgroups(1)
        .input("buf", 0)
        .build()
        .orThrow();
}

NodeDescriptor textureNode() {
    return NodeBuilder{}
        .shader("tex.spv")
        .entryPoint("main")
        .workgroups(1)
        .input("img", 0, ResourceKind::Texture)
        .build()
        .orThrow();
}

} // namespace

int main() {
    std::printf("sub-graph builder test\n");

    // Forward references and frozen order.
    {
        auto def = SubGraphBuilder{}
                       .name("pair")
                       .addSlotEdge("producer", "buf", "consumer", "buf")
                       .addNode("consumer", consumerNode())
                       .addNode("producer", producerNode())
                       .build();
        assert(def.ok());
        const auto& d = def.value();
        assert(d.name() == "pair");
        assert(d.nodeCount() == 2);
        assert((d.order() == std::vector<std::string>{"producer", "consumer"}));

        const auto* consumer = d.find("consumer");
        assert(consumer != nullptr);
        assert(consumer->role == NodeRole::Compute);
        assert(consumer->registration == 0);
        assert(consumer->inputs.size() == 1);
        assert(consumer->inputs[0].slot == "buf");
        assert(consumer->inputs[0].producer == d.indexOf("producer"));
        assert(consumer->inputs[0].producerSlot == "buf");
        assert(d.find("ghost") == nullptr);
        assert(d.slotEdges().size() == 1);
        assert(d.trigger().mode() == TriggerGate::Mode::Always);
        std::printf("  forward references: ok\n");
    }

    // Duplicate names: the first registration wins, build() reports.
    {
        SharedResource res;
        SubGraphBuilder b;
        b.name("dups")
            .addNode("n", producerNode())
            .addNode("n", consumerNode())
            .addInputResource("n", res)
            .addNode(std::string(kGraphInputNode), consumerNode());
        assert(b.hasNode("n"));

        auto def = b.build();
        assert(!def.ok());
        assert(def.error().kind == ErrorKind::DuplicateNodeName);
        assert(def.error().count(ErrorKind::DuplicateNodeName) == 3);
        std::printf("  duplicate node names: ok\n");
    }

    // Missing name.
    {
        auto def = SubGraphBuilder{}.addNode("p", producerNode()).build();
        assert(!def.ok());
        assert(def.error().kind == ErrorKind::MissingName);
        std::printf("  missing name: ok\n");
    }

    // Null shared descriptor is rejected, edges to it still resolve.
    {
        auto def = SubGraphBuilder{}
                       .name("null")
                       .addNode("p", producerNode())
                       .addNode("n", std::shared_ptr<const NodeDescriptor>{})
                       .addSlotEdge("p", "buf", "n", "buf")
                       .build();
        assert(!def.ok());
        assert(def.error().kind == ErrorKind::MissingShader);
        assert(def.error().issues.size() == 1);
        assert(def.error().issues[0].subject == "n");
        assert(!def.hasIssue(ErrorKind::UnknownNodeReference));
        std::printf("  null descriptor: ok\n");
    }

    // Two unknown edges are both reported.
    {
        auto def = SubGraphBuilder{}
                       .name("unknown")
                       .addNode("producer", producerNode())
                       .addNode("consumer", consumerNode())
                       .addNodeEdge("producer", "ghost")
                       .addSlotEdge("phantom", "buf", "consumer", "buf")
                       .build();
        assert(!def.ok());
        assert(def.error().operation == "build sub-graph");
        assert(def.error().count(ErrorKind::UnknownNodeReference) == 2);
        std::printf("  aggregated unknown references: ok\n");
    }

    // Slot of the wrong direction.
    {
        auto def = SubGraphBuilder{}
                       .name("direction")
                       .addNode("producer", producerNode())
                       .addNode("consumer", consumerNode())
                       .addSlotEdge("consumer", "buf", "producer", "buf")
                       .build();
        assert(!def.ok());
        assert(def.error().count(ErrorKind::UnknownSlotReference) == 2);
        std::printf("  slot direction: ok\n");
    }

    // Buffer into texture.
    {
        auto def = SubGraphBuilder{}
                       .name("kinds")
                       .addNode("producer", producerNode())
                       .addNode("tex", textureNode())
                       .addSlotEdge("producer", "buf", "tex", "img")
                       .build();
        assert(!def.ok());
        assert(def.error().kind == ErrorKind::SlotKindMismatch);
        std::printf("  kind mismatch: ok\n");
    }

    // Cycle is found only once the graph is otherwise clean.
    {
        auto def = SubGraphBuilder{}
                       .name("cycle")
                       .addNode("a", producerNode())
                       .addNode("b", consumerNode())
                       .addNodeEdge("a", "b")
                       .addNodeEdge("b", "a")
                       .build();
        assert(!def.ok());
        assert(def.error().kind == ErrorKind::CyclicGraph);
        assert(def.error().operation == "build sub-graph");
        assert(def.error().message.find("a -> b -> a") != std::string::npos);

        auto dirty = SubGraphBuilder{}
                         .name("cycle")
                         .addNode("a", producerNode())
                         .addNode("b", consumerNode())
                         .addNodeEdge("a", "b")
                         .addNodeEdge("b", "a")
                         .addNodeEdge("a", "ghost")
                         .build();
        assert(!dirty.ok());
        assert(dirty.error().kind == ErrorKind::UnknownNodeReference);
        assert(!dirty.error().has(ErrorKind::CyclicGraph));
        std::printf("  cycle detection: ok\n");
    }

    // Providers: pending, failed, ready.
    {
        NodeProvider provider(42, consumerNode());
        SubGraphBuilder b;
        b.name("deferred")
            .addNode("producer", producerNode())
            .addNodeProvider("consumer", provider)
            .addSlotEdge("producer", "buf", "consumer", "buf");

        auto pending = b.build();
        assert(!pending.ok());
        assert(pending.error().kind == ErrorKind::UnresolvedProvider);
        assert(pending.error().issues.size() == 1); // edge to it is not re-reported
        assert(pending.error().issues[0].subject == "consumer");

        provider.fail("shader compile error");
        auto failed = b.build();
        assert(!failed.ok());
        assert(failed.error().kind == ErrorKind::UnresolvedProvider);
        assert(failed.error().message.find("shader compile error") != std::string::npos);

        provider.publish(consumerNode());
        auto ready = b.build();
        assert(ready.ok());
        assert((ready.value().order() == std::vector<std::string>{"producer", "consumer"}));
        assert(ready.value().providerRevisions().size() == 1);
        assert(ready.value().providerRevisions()[0].first == "consumer");
        assert(ready.value().providerRevisions()[0].second == provider.revision());
        assert(b.providers().size() == 1);
        assert(b.providers()[0].provider.sharesWith(provider));
        std::printf("  providers: ok\n");
    }

    // Source, sink and graph input boundary.
    {
        SharedResource input(ResourceView::ofBuffer(VK_NULL_HANDLE, 64));
        SharedResource output;
        auto passthrough = NodeBuilder{}
                               .shader("fill.spv")
                               .entryPoint("main")
                               .workgroups(1)
                               .inputOutput("buffer", 0)
                               .input("params", 1)
                               .build()
                               .orThrow();

        auto def = SubGraphBuilder{}
                       .name("fill")
                       .graphInput("params")
                       .addOutputResource("output", output)
                       .addNode("fill", passthrough)
                       .addInputResource("input", input)
                       .addSlotEdge("input", "out", "fill", "buffer")
                       .addSlotEdge(kGraphInputNode, "params", "fill", "params")
                       .addSlotEdge("fill", "buffer", "output", "in")
                       .build();
        assert(def.ok());
        const auto& d = def.value();
        assert((d.order() == std::vector<std::string>{"input", "fill", "output"}));
        assert(d.find("input")->role == NodeRole::Source);
        assert(d.find("output")->role == NodeRole::Sink);
        assert(d.find("input")->resource->sharesWith(input));
        assert(d.graphInputs().size() == 1);

        const auto* fill = d.find("fill");
        bool sawBoundary = false;
        for (const auto& in : fill->inputs) {
            if (in.slot == "params") {
                assert(in.fromGraphInput());
                assert(in.producerSlot == "params");
                sawBoundary = true;
            }
        }
        assert(sawBoundary);

        // The boundary can only be a source.
        auto bad = SubGraphBuilder{}
                       .name("bad")
                       .addNode("fill", passthrough)
                       .addNodeEdge("fill", kGraphInputNode)
                       .build();
        assert(!bad.ok());
        assert(bad.error().kind == ErrorKind::UnknownNodeReference);
        std::printf("  sources, sinks and graph inputs: ok\n");
    }

    std::printf("sub-graph builder test passed\n");
    return 0;
}
