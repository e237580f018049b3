#pragma once

#include <nodeplumb/resource.hpp>

#include <vulkan/vulkan.h>

#include <cassert>
#include <cstdint>
#include <string>
#include <string_view>
#include <variant>

namespace nodeplumb {

class GraphContext;

enum class BindingDirection : std::uint8_t {
    Input,       // Consumed from an upstream slot.
    Output,      // Provided by the GPU layer, sized by the binding's SizeStrategy.
    InputOutput, // Consumed, written in place, and passed downstream.
};

[[nodiscard]] std::string_view bindingDirectionName(BindingDirection direction);

// Output extent computed from the node's resolved inputs.
using ExtentFn = ResourceExtent (*)(const GraphContext&);

// Declared size of an Output binding.
class SizeStrategy {
public:
    SizeStrategy() : policy_(ResourceExtent{}) {}

    [[nodiscard]] static SizeStrategy fixed(const ResourceExtent& extent) {
        return SizeStrategy(extent);
    }

    [[nodiscard]] static SizeStrategy bytes(VkDeviceSize n) {
        return SizeStrategy(ResourceExtent::bytes(n));
    }

    [[nodiscard]] static SizeStrategy fromContext(ExtentFn fn) {
        assert(fn && "SizeStrategy::fromContext requires a function");
        return SizeStrategy(fn);
    }

    [[nodiscard]] bool isFixed() const { return std::holds_alternative<ResourceExtent>(policy_); }

    [[nodiscard]] ResourceExtent evaluate(const GraphContext& ctx) const;

private:
    explicit SizeStrategy(const ResourceExtent& extent) : policy_(extent) {}
    explicit SizeStrategy(ExtentFn fn) : policy_(fn) {}

    std::variant<ResourceExtent, ExtentFn> policy_;
};

// One shader binding and the graph slot it exposes. The slot name is the
// binding name; Input and InputOutput bindings are input slots, Output and
// InputOutput bindings are output slots.
struct ResourceBinding {
    std::string      name;
    std::uint32_t    index     = 0;
    BindingDirection direction = BindingDirection::Input;
    ResourceKind     kind      = ResourceKind::Buffer;
    SizeStrategy     size;                       // Output only
    VkFormat         format    = VK_FORMAT_UNDEFINED; // Output textures only

    [[nodiscard]] bool isInputSlot() const { return direction != BindingDirection::Output; }
    [[nodiscard]] bool isOutputSlot() const { return direction != BindingDirection::Input; }

    // Storage buffer or storage image.
    [[nodiscard]] VkDescriptorType descriptorType() const {
        return kind == ResourceKind::Buffer ? VK_DESCRIPTOR_TYPE_STORAGE_BUFFER
                                            : VK_DESCRIPTOR_TYPE_STORAGE_IMAGE;
    }
};

} // namespace nodeplumb
