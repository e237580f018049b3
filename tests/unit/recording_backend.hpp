#pragma once

// Test double for DispatchBackend: records every request and dispatch, hands
// out fake (non-null) handles, never touches a GPU.

#include <nodeplumb/backend.hpp>

#include <cstdint>
#include <cstring>
#include <string>
#include <utility>
#include <vector>

namespace nodeplumb::test {

template <typename Handle>
Handle fakeHandle(std::uint64_t value) {
    static_assert(sizeof(Handle) == sizeof(value), "handle size");
    Handle h;
    std::memcpy(&h, &value, sizeof(h));
    return h;
}

struct RecordedResource {
    std::string      name;
    std::uint32_t    index = 0;
    BindingDirection direction = BindingDirection::Input;
    ResourceView     view;
};

struct RecordedDispatch {
    std::string                   node;
    WorkgroupCount                workgroups{0, 0, 0};
    std::vector<RecordedResource> resources;

    [[nodiscard]] const RecordedResource* find(const std::string& name) const {
        for (const auto& r : resources) {
            if (r.name == name) return &r;
        }
        return nullptr;
    }
};

struct RecordedRequest {
    std::string    node;
    std::string    binding;
    ResourceExtent extent;
};

class RecordingBackend : public DispatchBackend {
public:
    Result<ResourceView> provideOutput(const OutputRequest& request) override {
        requests.push_back({std::string(request.node), request.binding->name, request.extent});
        if (failOutputs) {
            return Error{"allocate output", ErrorKind::Backend, "out of device memory"};
        }

        ResourceView view;
        view.kind = request.binding->kind;
        if (swapOutputKinds) {
            view.kind = view.kind == ResourceKind::Buffer ? ResourceKind::Texture
                                                          : ResourceKind::Buffer;
        }
        view.extent = request.extent;
        if (view.kind == ResourceKind::Buffer) {
            view.buffer = fakeHandle<VkBuffer>(nextHandle_++);
        } else {
            view.image = fakeHandle<VkImage>(nextHandle_++);
            view.imageView = fakeHandle<VkImageView>(nextHandle_++);
            view.format = request.binding->format;
        }
        return view;
    }

    Result<void> dispatch(const DispatchCommand& command) override {
        if (failDispatch) {
            return Error{"record dispatch", ErrorKind::Backend, "device lost"};
        }
        RecordedDispatch d;
        d.node = std::string(command.node);
        d.workgroups = command.workgroups;
        for (const auto& r : command.resources) {
            d.resources.push_back({std::string(r.name), r.index, r.direction, r.view});
        }
        dispatches.push_back(std::move(d));
        return {};
    }

    [[nodiscard]] std::vector<std::string> order() const {
        std::vector<std::string> names;
        for (const auto& d : dispatches) names.push_back(d.node);
        return names;
    }

    [[nodiscard]] const RecordedDispatch* find(const std::string& node) const {
        for (const auto& d : dispatches) {
            if (d.node == node) return &d;
        }
        return nullptr;
    }

    void clear() {
        dispatches.clear();
        requests.clear();
    }

    std::vector<RecordedDispatch> dispatches;
    std::vector<RecordedRequest>  requests;
    bool                          failOutputs  = false;
    bool                          failDispatch = false;
    bool                          swapOutputKinds = false;

private:
    std::uint64_t nextHandle_ = 0x1000;
};

} // namespace nodeplumb::test
