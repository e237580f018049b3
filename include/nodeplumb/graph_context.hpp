#pragma once

#include <nodeplumb/resource.hpp>

#include <vulkan/vulkan.h>

#include <glm/glm.hpp>

#include <cstddef>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace nodeplumb {

// Read-only view of the slots resolved so far in one invocation, as seen by a
// single node: only that node's input slots that an upstream node (or the
// graph input boundary) has already produced are visible. Handed to dispatch,
// size and trigger strategies.
//
// Absent and zero-size are different answers: a slot nobody produced is
// std::nullopt, a produced empty buffer is 0.
class GraphContext {
public:
    GraphContext() = default;
    explicit GraphContext(std::string nodeName) : node_(std::move(nodeName)) {}

    [[nodiscard]] std::string_view nodeName() const { return node_; }

    [[nodiscard]] bool contains(std::string_view slot) const { return find(slot) != nullptr; }
    [[nodiscard]] std::size_t slotCount() const { return slots_.size(); }

    // nullptr when the slot is not visible.
    [[nodiscard]] const ResourceView* find(std::string_view slot) const;

    [[nodiscard]] std::optional<ResourceExtent> extent(std::string_view slot) const;

    // Byte length of a buffer slot; nullopt for absent or texture slots.
    [[nodiscard]] std::optional<VkDeviceSize> bufferSize(std::string_view slot) const;

    // Width/height/depth of a texture slot; nullopt for absent or buffer slots.
    [[nodiscard]] std::optional<glm::uvec3> textureSize(std::string_view slot) const;

    [[nodiscard]] std::optional<VkFormat> textureFormat(std::string_view slot) const;

    // Make a slot visible. Replaces an existing entry with the same name.
    void bind(std::string_view slot, const ResourceView& view);

    [[nodiscard]] const std::vector<std::pair<std::string, ResourceView>>& slots() const {
        return slots_;
    }

private:
    std::string                                      node_;
    std::vector<std::pair<std::string, ResourceView>> slots_;
};

} // namespace nodeplumb
