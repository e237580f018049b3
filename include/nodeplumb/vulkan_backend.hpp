#pragma once

#include <nodeplumb/backend.hpp>
#include <nodeplumb/result.hpp>

#include <vulkan/vulkan.h>

#include <cstdint>
#include <functional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace nodeplumb {

// Pipeline objects the host created for one compute node.
struct VulkanNodeBinding {
    VkPipeline       pipeline = VK_NULL_HANDLE;
    VkPipelineLayout layout   = VK_NULL_HANDLE;
    VkDescriptorSet  set      = VK_NULL_HANDLE; // bound at the node's bindGroup()
};

// Host hook that creates (or recycles) the resource behind an Output binding.
using OutputAllocator = std::function<Result<ResourceView>(const OutputRequest&)>;

// DispatchBackend that records into a Vulkan command buffer. Never creates
// pipelines and never allocates memory: both come from the host.
//
// Per non-empty dispatch it records, in order: a compute-to-compute barrier
// (from the second dispatch on), UNDEFINED -> GENERAL transitions for output
// images, descriptor writes, pipeline and set binds, vkCmdDispatch.
//
// Usage:
//   VulkanDispatchBackend backend(device, allocateOutput);
//   backend.registerNode("fill", {pipeline, layout, set});
//   backend.setCommandBuffer(cmd);
//   resolver.execute(definition, inputs);
//
// Thread safety: thread-confined.
class VulkanDispatchBackend : public DispatchBackend {
public:
    VulkanDispatchBackend(VkDevice device, OutputAllocator allocator);

    void registerNode(std::string_view node, const VulkanNodeBinding& binding);

    // Target for subsequent dispatches. Resets the barrier chain.
    void setCommandBuffer(VkCommandBuffer cmd);

    [[nodiscard]] Result<ResourceView> provideOutput(const OutputRequest& request) override;
    [[nodiscard]] Result<void> dispatch(const DispatchCommand& command) override;

    // Dispatches recorded into the current command buffer.
    [[nodiscard]] std::uint32_t recordedDispatches() const { return recorded_; }

    [[nodiscard]] const VulkanNodeBinding* findNode(std::string_view node) const;

private:
    VkDevice                                             device_;
    OutputAllocator                                      allocator_;
    std::vector<std::pair<std::string, VulkanNodeBinding>> nodes_;
    VkCommandBuffer                                      cmd_      = VK_NULL_HANDLE;
    std::uint32_t                                        recorded_ = 0;
};

} // namespace nodeplumb
