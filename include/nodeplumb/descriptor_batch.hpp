#pragma once

#include <nodeplumb/backend.hpp>

#include <vulkan/vulkan.h>

#include <cstdint>
#include <vector>

namespace nodeplumb {

// Accumulates storage buffer / storage image writes for one descriptor set
// and issues them in one vkUpdateDescriptorSets call.
//
// Usage:
//   DescriptorBatch batch(set);
//   batch.storageBuffer(0, buf, size).storageImage(1, view);
//   batch.write(device);
class DescriptorBatch {
public:
    explicit DescriptorBatch(VkDescriptorSet set) : set_(set) {}

    // One write per resource of the command, at the binding's index.
    [[nodiscard]] static DescriptorBatch forCommand(VkDescriptorSet set,
                                                    const DispatchCommand& command);

    [[nodiscard]] VkDescriptorSet descriptorSet() const { return set_; }

    // size 0 binds the whole buffer.
    DescriptorBatch& storageBuffer(std::uint32_t binding, VkBuffer buffer, VkDeviceSize size);

    DescriptorBatch& storageImage(std::uint32_t binding, VkImageView view,
                                  VkImageLayout layout = VK_IMAGE_LAYOUT_GENERAL);

    [[nodiscard]] std::uint32_t size() const {
        return static_cast<std::uint32_t>(pending_.size());
    }
    [[nodiscard]] bool empty() const { return pending_.empty(); }

    // The write array. Points into this batch; valid while it lives unmodified.
    [[nodiscard]] std::vector<VkWriteDescriptorSet> writes() const;

    void write(VkDevice device) const;

private:
    enum class InfoKind : std::uint8_t { Image, Buffer };

    struct PendingWrite {
        std::uint32_t    binding;
        VkDescriptorType type;
        InfoKind         kind;
        std::uint32_t    infoIndex;
    };

    VkDescriptorSet set_;

    std::vector<VkDescriptorImageInfo>  imageInfos_;
    std::vector<VkDescriptorBufferInfo> bufferInfos_;
    std::vector<PendingWrite>           pending_;
};

} // namespace nodeplumb
