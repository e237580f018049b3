#include <nodeplumb/node_provider.hpp>
#include <nodeplumb/shared_resource.hpp>

#include "recording_backend.hpp"

#include <cassert>
#include <cstdio>
#include <thread>
#include <vector>

using namespace nodeplumb;
using nodeplumb::test::fakeHandle;

int main() {
    std::printf("shared cells test\n");

    // Copies share one cell.
    {
        SharedResource a(ResourceView::ofBuffer(fakeHandle<VkBuffer>(1), 64));
        SharedResource b = a;
        assert(a.sharesWith(b));
        assert(a.useCount() == 2);

        b.write(ResourceView::ofBuffer(fakeHandle<VkBuffer>(2), 128));
        assert(a.read().extent.byteSize == 128);
        assert(a.read().buffer == fakeHandle<VkBuffer>(2));
        assert(a.generation() == 1);
        assert(a.readCount() == 2);

        SharedResource other;
        assert(!other.sharesWith(a));
        assert(!other.read().hasHandle());
        std::printf("  sharing: ok\n");
    }

    // Scoped access modifies in place.
    {
        SharedResource r(ResourceView::ofBuffer(fakeHandle<VkBuffer>(1), 64));
        {
            auto access = r.lock();
            access->extent.byteSize = 96;
        }
        assert(r.read().extent.byteSize == 96);
        assert(r.generation() == 1);
        std::printf("  scoped access: ok\n");
    }

    // Concurrent writers and readers never see a torn view: buffer handle and
    // size are always written together.
    {
        SharedResource r(ResourceView::ofBuffer(fakeHandle<VkBuffer>(1), 1));
        constexpr int kIterations = 10000;

        std::vector<std::thread> threads;
        for (int t = 0; t < 2; ++t) {
            threads.emplace_back([r, t]() mutable {
                for (int i = 1; i <= kIterations; ++i) {
                    auto v = static_cast<std::uint64_t>(i * 2 + t);
                    r.write(ResourceView::ofBuffer(fakeHandle<VkBuffer>(v), v));
                }
            });
        }
        bool torn = false;
        threads.emplace_back([r, &torn]() {
            for (int i = 0; i < kIterations; ++i) {
                auto view = r.read();
                if (view.buffer != fakeHandle<VkBuffer>(view.extent.byteSize)) torn = true;
            }
        });
        for (auto& t : threads) t.join();

        assert(!torn);
        assert(r.generation() == 2 * kIterations);
        std::printf("  concurrent access: ok\n");
    }

    // Provider state machine.
    {
        NodeProvider p(3);
        assert(p.owner() == 3);
        assert(p.state() == ProviderState::Pending);
        assert(p.revision() == 0);
        assert(!p.markReady()); // nothing staged

        auto node = NodeBuilder{}.shader("a.spv").entryPoint("main").workgroups(1).build();
        assert(node.ok());

        NodeProvider copy = p;
        copy.stage(node.value());
        assert(p.state() == ProviderState::Pending);
        assert(p.snapshot().descriptor != nullptr);
        assert(p.markReady());
        assert(p.state() == ProviderState::Ready);
        auto readyRevision = p.revision();
        assert(p.markReady()); // already ready: no new revision
        assert(p.revision() == readyRevision);

        p.fail("timeout");
        auto snap = copy.snapshot();
        assert(snap.state == ProviderState::Failed);
        assert(snap.message == "timeout");
        assert(snap.revision > readyRevision);

        p.publish(node.value());
        assert(copy.state() == ProviderState::Ready);
        assert(copy.snapshot().message.empty());
        assert(providerStateName(ProviderState::Failed) == "failed");
        std::printf("  provider states: ok\n");
    }

    // View factories and kind names.
    {
        auto buf = ResourceView::ofBuffer(fakeHandle<VkBuffer>(3), 256);
        assert(buf.kind == ResourceKind::Buffer);
        assert(buf.hasHandle());
        assert(buf.extent.byteSize == 256);

        auto img = ResourceView::ofImage(fakeHandle<VkImage>(4), fakeHandle<VkImageView>(5),
                                         VK_FORMAT_R8G8B8A8_UNORM, 64, 32);
        assert(img.kind == ResourceKind::Texture);
        assert(img.hasHandle());
        assert(img.extent == ResourceExtent::texels(64, 32));

        assert(resourceKindName(ResourceKind::Buffer) == "buffer");
        assert(resourceKindName(ResourceKind::Texture) == "texture");
        std::printf("  views: ok\n");
    }

    std::printf("shared cells test passed\n");
    return 0;
}
