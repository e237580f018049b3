#include <nodeplumb/descriptor_batch.hpp>

namespace nodeplumb {

DescriptorBatch DescriptorBatch::forCommand(VkDescriptorSet set, const DispatchCommand& command) {
    DescriptorBatch batch(set);
    for (const auto& r : command.resources) {
        if (r.view.kind == ResourceKind::Buffer) {
            batch.storageBuffer(r.index, r.view.buffer, r.view.extent.byteSize);
        } else {
            batch.storageImage(r.index, r.view.imageView);
        }
    }
    return batch;
}

DescriptorBatch& DescriptorBatch::storageBuffer(std::uint32_t binding, VkBuffer buffer,
                                                VkDeviceSize size) {
    VkDescriptorBufferInfo info{};
    info.buffer = buffer;
    info.offset = 0;
    info.range = size == 0 ? VK_WHOLE_SIZE : size;
    auto idx = static_cast<std::uint32_t>(bufferInfos_.size());
    bufferInfos_.push_back(info);
    pending_.push_back({binding, VK_DESCRIPTOR_TYPE_STORAGE_BUFFER, InfoKind::Buffer, idx});
    return *this;
}

DescriptorBatch& DescriptorBatch::storageImage(std::uint32_t binding, VkImageView view,
                                               VkImageLayout layout) {
    VkDescriptorImageInfo info{};
    info.sampler = VK_NULL_HANDLE;
    info.imageView = view;
    info.imageLayout = layout;
    auto idx = static_cast<std::uint32_t>(imageInfos_.size());
    imageInfos_.push_back(info);
    pending_.push_back({binding, VK_DESCRIPTOR_TYPE_STORAGE_IMAGE, InfoKind::Image, idx});
    return *this;
}

std::vector<VkWriteDescriptorSet> DescriptorBatch::writes() const {
    // Info vectors are stable now (no more push_back), so pointers are valid.
    std::vector<VkWriteDescriptorSet> out;
    out.reserve(pending_.size());

    for (const auto& pw : pending_) {
        VkWriteDescriptorSet w{};
        w.sType = VK_STRUCTURE_TYPE_WRITE_DESCRIPTOR_SET;
        w.dstSet = set_;
        w.dstBinding = pw.binding;
        w.dstArrayElement = 0;
        w.descriptorCount = 1;
        w.descriptorType = pw.type;

        if (pw.kind == InfoKind::Image) {
            w.pImageInfo = &imageInfos_[pw.infoIndex];
        } else {
            w.pBufferInfo = &bufferInfos_[pw.infoIndex];
        }

        out.push_back(w);
    }
    return out;
}

void DescriptorBatch::write(VkDevice device) const {
    auto w = writes();
    if (!w.empty()) {
        vkUpdateDescriptorSets(device, static_cast<std::uint32_t>(w.size()), w.data(), 0,
                               nullptr);
    }
}

} // namespace nodeplumb
