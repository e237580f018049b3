#pragma once

#include <nodeplumb/binding.hpp>
#include <nodeplumb/dispatch.hpp>
#include <nodeplumb/result.hpp>

#include <vulkan/vulkan.h>

#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace nodeplumb {

// Shader a compute node runs. Either a SPIR-V path for the asset layer to load
// or a module the host already created. The core only carries it.
struct ShaderRef {
    std::filesystem::path path;
    VkShaderModule        module = VK_NULL_HANDLE;

    [[nodiscard]] bool empty() const { return path.empty() && module == VK_NULL_HANDLE; }
};

// The unit of compute work: shader, entry point, ordered bindings, dispatch
// policy. Immutable once built; graphs share it by reference.
//
// Thread safety: immutable after construction.
class NodeDescriptor {
public:
    [[nodiscard]] const std::string& label() const { return label_; }
    [[nodiscard]] const ShaderRef& shader() const { return shader_; }
    [[nodiscard]] const std::string& entryPoint() const { return entryPoint_; }
    [[nodiscard]] std::uint32_t bindGroup() const { return bindGroup_; }
    [[nodiscard]] const DispatchStrategy& dispatch() const { return dispatch_; }

    // In declaration order; this is the order they map onto the shader.
    [[nodiscard]] const std::vector<ResourceBinding>& bindings() const { return bindings_; }

    [[nodiscard]] const ResourceBinding* findBinding(std::string_view name) const;

    // Slot lookups by direction. nullptr when the node has no such slot.
    [[nodiscard]] const ResourceBinding* inputSlot(std::string_view name) const;
    [[nodiscard]] const ResourceBinding* outputSlot(std::string_view name) const;

private:
    friend class NodeBuilder;
    explicit NodeDescriptor(DispatchStrategy dispatch) : dispatch_(dispatch) {}

    std::string                  label_;
    ShaderRef                    shader_;
    std::string                  entryPoint_;
    std::uint32_t                bindGroup_ = 0;
    std::vector<ResourceBinding> bindings_;
    DispatchStrategy             dispatch_;
};

// Fluent builder for NodeDescriptor. Records everything, validates in build().
//
// Usage:
//   auto node = NodeBuilder{}
//       .shader("shaders/fill.spv")
//       .entryPoint("main")
//       .inputOutput("buffer", 0)
//       .dispatch(DispatchStrategy::fromContext(countFromBuffer))
//       .build();
//
// Thread safety: thread-confined.
class NodeBuilder {
public:
    NodeBuilder() = default;

    NodeBuilder& label(std::string_view name);

    // Path-based: the asset layer loads the SPIR-V.
    NodeBuilder& shader(const std::filesystem::path& spvPath);

    // Module-based: host owns the VkShaderModule lifetime.
    NodeBuilder& shaderModule(VkShaderModule module);

    NodeBuilder& entryPoint(std::string_view name);

    // Descriptor set index the bindings live in. Defaults to 0.
    NodeBuilder& bindGroup(std::uint32_t set);

    NodeBuilder& dispatch(DispatchStrategy strategy);

    // Shorthand for dispatch(DispatchStrategy::fixed(x, y, z)).
    NodeBuilder& workgroups(std::uint32_t x, std::uint32_t y = 1, std::uint32_t z = 1);

    NodeBuilder& input(std::string_view name, std::uint32_t index,
                       ResourceKind kind = ResourceKind::Buffer);

    NodeBuilder& inputOutput(std::string_view name, std::uint32_t index,
                             ResourceKind kind = ResourceKind::Buffer);

    NodeBuilder& outputBuffer(std::string_view name, std::uint32_t index, SizeStrategy size);

    NodeBuilder& outputTexture(std::string_view name, std::uint32_t index, VkFormat format,
                               SizeStrategy size);

    // Escape hatch: append a fully specified binding.
    NodeBuilder& binding(ResourceBinding b);

    // Fails with every problem found: DuplicateBindingIndex,
    // DuplicateBindingName, MissingShader, MissingEntryPoint, MissingDispatch,
    // InvalidDispatch.
    [[nodiscard]] Result<NodeDescriptor> build() const;

private:
    std::string                     label_;
    ShaderRef                       shader_;
    std::string                     entryPoint_;
    std::uint32_t                   bindGroup_ = 0;
    std::vector<ResourceBinding>    bindings_;
    std::optional<DispatchStrategy> dispatch_;
};

} // namespace nodeplumb
