#pragma once

#include <vulkan/vulkan.h>

#include <glm/glm.hpp>

#include <cstdint>
#include <string_view>

namespace nodeplumb {

enum class ResourceKind : std::uint8_t {
    Buffer,
    Texture,
};

[[nodiscard]] std::string_view resourceKindName(ResourceKind kind);

// Size/shape of a slot resource. Buffers use byteSize; textures use size
// (width, height, depth) and may also report a byte size.
struct ResourceExtent {
    VkDeviceSize byteSize = 0;
    glm::uvec3   size{0, 0, 0};

    [[nodiscard]] static ResourceExtent bytes(VkDeviceSize n) {
        ResourceExtent e;
        e.byteSize = n;
        return e;
    }

    [[nodiscard]] static ResourceExtent texels(std::uint32_t width, std::uint32_t height = 1,
                                               std::uint32_t depth = 1) {
        ResourceExtent e;
        e.size = {width, height, depth};
        return e;
    }

    [[nodiscard]] bool operator==(const ResourceExtent&) const = default;
};

// What a slot carries during one invocation. Never owns memory: the handles
// belong to the host or to the GPU layer that provided them.
struct ResourceView {
    ResourceKind   kind      = ResourceKind::Buffer;
    VkBuffer       buffer    = VK_NULL_HANDLE;
    VkImage        image     = VK_NULL_HANDLE;
    VkImageView    imageView = VK_NULL_HANDLE;
    VkFormat       format    = VK_FORMAT_UNDEFINED;
    ResourceExtent extent;

    // Declared usage, recorded for the GPU layer. The core never checks it.
    VkBufferUsageFlags bufferUsage = 0;
    VkImageUsageFlags  imageUsage  = 0;

    [[nodiscard]] bool hasHandle() const {
        return kind == ResourceKind::Buffer ? buffer != VK_NULL_HANDLE
                                            : imageView != VK_NULL_HANDLE;
    }

    [[nodiscard]] static ResourceView ofBuffer(VkBuffer buffer, VkDeviceSize size,
                                               VkBufferUsageFlags usage = 0);

    [[nodiscard]] static ResourceView ofImage(VkImage image, VkImageView view, VkFormat format,
                                              std::uint32_t width, std::uint32_t height,
                                              VkImageUsageFlags usage = 0);
};

} // namespace nodeplumb
