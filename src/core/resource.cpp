#include <nodeplumb/resource.hpp>

namespace nodeplumb {

std::string_view resourceKindName(ResourceKind kind) {
    switch (kind) {
    case ResourceKind::Buffer:
        return "buffer";
    case ResourceKind::Texture:
        return "texture";
    }
    return "unknown";
}

ResourceView ResourceView::ofBuffer(VkBuffer buffer, VkDeviceSize size,
                                    VkBufferUsageFlags usage) {
    ResourceView v;
    v.kind = ResourceKind::Buffer;
    v.buffer = buffer;
    v.extent = ResourceExtent::bytes(size);
    v.bufferUsage = usage;
    return v;
}

ResourceView ResourceView::ofImage(VkImage image, VkImageView view, VkFormat format,
                                   std::uint32_t width, std::uint32_t height,
                                   VkImageUsageFlags usage) {
    ResourceView v;
    v.kind = ResourceKind::Texture;
    v.image = image;
    v.imageView = view;
    v.format = format;
    v.extent = ResourceExtent::texels(width, height);
    v.imageUsage = usage;
    return v;
}

} // namespace nodeplumb
