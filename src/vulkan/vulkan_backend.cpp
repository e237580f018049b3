#include <nodeplumb/barriers.hpp>
#include <nodeplumb/descriptor_batch.hpp>
#include <nodeplumb/vulkan_backend.hpp>

#include <string>
#include <utility>

namespace nodeplumb {

VulkanDispatchBackend::VulkanDispatchBackend(VkDevice device, OutputAllocator allocator)
    : device_(device), allocator_(std::move(allocator)) {}

void VulkanDispatchBackend::registerNode(std::string_view node,
                                         const VulkanNodeBinding& binding) {
    for (auto& [name, existing] : nodes_) {
        if (name == node) {
            existing = binding;
            return;
        }
    }
    nodes_.emplace_back(std::string(node), binding);
}

void VulkanDispatchBackend::setCommandBuffer(VkCommandBuffer cmd) {
    cmd_ = cmd;
    recorded_ = 0;
}

const VulkanNodeBinding* VulkanDispatchBackend::findNode(std::string_view node) const {
    for (const auto& [name, binding] : nodes_) {
        if (name == node) return &binding;
    }
    return nullptr;
}

Result<ResourceView> VulkanDispatchBackend::provideOutput(const OutputRequest& request) {
    if (!allocator_) {
        return Error{"provide output", ErrorKind::Backend,
                     std::string(request.node) + "." + request.binding->name +
                         ": no output allocator installed"};
    }
    return allocator_(request);
}

Result<void> VulkanDispatchBackend::dispatch(const DispatchCommand& command) {
    // Zero in any component: nothing to record.
    if (command.empty()) return {};

    if (cmd_ == VK_NULL_HANDLE) {
        return Error{"record dispatch", ErrorKind::Backend,
                     std::string(command.node) + ": no command buffer set"};
    }

    const auto* binding = findNode(command.node);
    if (!binding || binding->pipeline == VK_NULL_HANDLE) {
        return Error{"record dispatch", ErrorKind::Backend,
                     std::string(command.node) + ": no pipeline registered for this node"};
    }

    if (recorded_ > 0) barrierComputeToCompute(cmd_);

    for (const auto& r : command.resources) {
        if (r.direction == BindingDirection::Output && r.view.kind == ResourceKind::Texture &&
            r.view.image != VK_NULL_HANDLE) {
            transitionToComputeWrite(cmd_, r.view.image);
        }
    }

    if (binding->set != VK_NULL_HANDLE) {
        DescriptorBatch::forCommand(binding->set, command).write(device_);
    }

    vkCmdBindPipeline(cmd_, VK_PIPELINE_BIND_POINT_COMPUTE, binding->pipeline);
    if (binding->set != VK_NULL_HANDLE) {
        std::uint32_t firstSet = command.descriptor ? command.descriptor->bindGroup() : 0;
        vkCmdBindDescriptorSets(cmd_, VK_PIPELINE_BIND_POINT_COMPUTE, binding->layout, firstSet,
                                1, &binding->set, 0, nullptr);
    }
    vkCmdDispatch(cmd_, command.workgroups.x, command.workgroups.y, command.workgroups.z);

    ++recorded_;
    return {};
}

} // namespace nodeplumb
