#pragma once

#include <nodeplumb/binding.hpp>
#include <nodeplumb/dispatch.hpp>
#include <nodeplumb/node.hpp>
#include <nodeplumb/resource.hpp>
#include <nodeplumb/result.hpp>

#include <cstdint>
#include <string_view>
#include <vector>

namespace nodeplumb {

// Request for the resource behind one Output binding, sized for this
// invocation.
struct OutputRequest {
    std::string_view       node;
    const ResourceBinding* binding = nullptr;
    ResourceExtent         extent;
};

// One binding of a dispatch, with the view it resolved to.
struct BoundResource {
    std::string_view name;
    std::uint32_t    index     = 0;
    BindingDirection direction = BindingDirection::Input;
    ResourceView     view;
};

// Everything the GPU layer needs to record one compute dispatch.
// `resources` follows the descriptor's binding declaration order.
struct DispatchCommand {
    std::string_view           node;
    const NodeDescriptor*      descriptor = nullptr;
    std::vector<BoundResource> resources;
    WorkgroupCount             workgroups{0, 0, 0};

    [[nodiscard]] bool empty() const { return isEmptyDispatch(workgroups); }
};

// Seam between the resolver and the GPU API layer. Implementations own
// pipelines, allocation and command recording; the resolver only decides what
// is dispatched, in which order, with which sizes.
//
// A command with a zero workgroup component is still passed to dispatch();
// implementations must treat it as a no-op.
class DispatchBackend {
public:
    virtual ~DispatchBackend() = default;

    [[nodiscard]] virtual Result<ResourceView> provideOutput(const OutputRequest& request) = 0;

    [[nodiscard]] virtual Result<void> dispatch(const DispatchCommand& command) = 0;
};

} // namespace nodeplumb
