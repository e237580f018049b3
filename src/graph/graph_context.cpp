#include <nodeplumb/graph_context.hpp>

namespace nodeplumb {

const ResourceView* GraphContext::find(std::string_view slot) const {
    for (const auto& [name, view] : slots_) {
        if (name == slot) return &view;
    }
    return nullptr;
}

std::optional<ResourceExtent> GraphContext::extent(std::string_view slot) const {
    const auto* view = find(slot);
    if (!view) return std::nullopt;
    return view->extent;
}

std::optional<VkDeviceSize> GraphContext::bufferSize(std::string_view slot) const {
    const auto* view = find(slot);
    if (!view || view->kind != ResourceKind::Buffer) return std::nullopt;
    return view->extent.byteSize;
}

std::optional<glm::uvec3> GraphContext::textureSize(std::string_view slot) const {
    const auto* view = find(slot);
    if (!view || view->kind != ResourceKind::Texture) return std::nullopt;
    return view->extent.size;
}

std::optional<VkFormat> GraphContext::textureFormat(std::string_view slot) const {
    const auto* view = find(slot);
    if (!view || view->kind != ResourceKind::Texture) return std::nullopt;
    return view->format;
}

void GraphContext::bind(std::string_view slot, const ResourceView& view) {
    for (auto& [name, existing] : slots_) {
        if (name == slot) {
            existing = view;
            return;
        }
    }
    slots_.emplace_back(std::string(slot), view);
}

} // namespace nodeplumb
