#include <nodeplumb/node.hpp>

#include <string>
#include <unordered_map>
#include <utility>

namespace nodeplumb {

const ResourceBinding* NodeDescriptor::findBinding(std::string_view name) const {
    for (const auto& b : bindings_) {
        if (b.name == name) return &b;
    }
    return nullptr;
}

const ResourceBinding* NodeDescriptor::inputSlot(std::string_view name) const {
    const auto* b = findBinding(name);
    return (b && b->isInputSlot()) ? b : nullptr;
}

const ResourceBinding* NodeDescriptor::outputSlot(std::string_view name) const {
    const auto* b = findBinding(name);
    return (b && b->isOutputSlot()) ? b : nullptr;
}

NodeBuilder& NodeBuilder::label(std::string_view name) {
    label_ = std::string(name);
    return *this;
}

NodeBuilder& NodeBuilder::shader(const std::filesystem::path& spvPath) {
    shader_.path = spvPath;
    return *this;
}

NodeBuilder& NodeBuilder::shaderModule(VkShaderModule module) {
    shader_.module = module;
    return *this;
}

NodeBuilder& NodeBuilder::entryPoint(std::string_view name) {
    entryPoint_ = std::string(name);
    return *this;
}

NodeBuilder& NodeBuilder::bindGroup(std::uint32_t set) {
    bindGroup_ = set;
    return *this;
}

NodeBuilder& NodeBuilder::dispatch(DispatchStrategy strategy) {
    dispatch_ = strategy;
    return *this;
}

NodeBuilder& NodeBuilder::workgroups(std::uint32_t x, std::uint32_t y, std::uint32_t z) {
    return dispatch(DispatchStrategy::fixed(x, y, z));
}

NodeBuilder& NodeBuilder::input(std::string_view name, std::uint32_t index, ResourceKind kind) {
    ResourceBinding b;
    b.name = std::string(name);
    b.index = index;
    b.direction = BindingDirection::Input;
    b.kind = kind;
    return binding(std::move(b));
}

NodeBuilder& NodeBuilder::inputOutput(std::string_view name, std::uint32_t index,
                                      ResourceKind kind) {
    ResourceBinding b;
    b.name = std::string(name);
    b.index = index;
    b.direction = BindingDirection::InputOutput;
    b.kind = kind;
    return binding(std::move(b));
}

NodeBuilder& NodeBuilder::outputBuffer(std::string_view name, std::uint32_t index,
                                       SizeStrategy size) {
    ResourceBinding b;
    b.name = std::string(name);
    b.index = index;
    b.direction = BindingDirection::Output;
    b.kind = ResourceKind::Buffer;
    b.size = size;
    return binding(std::move(b));
}

NodeBuilder& NodeBuilder::outputTexture(std::string_view name, std::uint32_t index,
                                        VkFormat format, SizeStrategy size) {
    ResourceBinding b;
    b.name = std::string(name);
    b.index = index;
    b.direction = BindingDirection::Output;
    b.kind = ResourceKind::Texture;
    b.size = size;
    b.format = format;
    return binding(std::move(b));
}

NodeBuilder& NodeBuilder::binding(ResourceBinding b) {
    bindings_.push_back(std::move(b));
    return *this;
}

Result<NodeDescriptor> NodeBuilder::build() const {
    const std::string subject = label_.empty() ? std::string("<unnamed node>") : label_;
    std::vector<Issue> issues;

    if (shader_.empty()) {
        issues.push_back({ErrorKind::MissingShader, subject,
                          "no compute shader set -- call shader(path) or shaderModule(module)"});
    }
    if (entryPoint_.empty()) {
        issues.push_back({ErrorKind::MissingEntryPoint, subject,
                          "no entry point set -- call entryPoint(name)"});
    }
    if (!dispatch_) {
        issues.push_back({ErrorKind::MissingDispatch, subject,
                          "no dispatch strategy set -- call dispatch() or workgroups()"});
    } else if (!dispatch_->valid()) {
        issues.push_back({ErrorKind::InvalidDispatch, subject,
                          "fixed workgroup counts must be positive in x, y and z"});
    }

    // First declaration of an index/name owns it; every later one is reported.
    std::unordered_map<std::uint32_t, const ResourceBinding*> byIndex;
    std::unordered_map<std::string, const ResourceBinding*> byName;
    for (const auto& b : bindings_) {
        auto [idxIt, idxInserted] = byIndex.emplace(b.index, &b);
        if (!idxInserted) {
            issues.push_back({ErrorKind::DuplicateBindingIndex, subject + "." + b.name,
                              "binding index " + std::to_string(b.index) +
                                  " is already used by '" + idxIt->second->name + "'"});
        }
        auto [nameIt, nameInserted] = byName.emplace(b.name, &b);
        if (!nameInserted) {
            issues.push_back({ErrorKind::DuplicateBindingName, subject + "." + b.name,
                              "binding name is already used by index " +
                                  std::to_string(nameIt->second->index)});
        }
    }

    if (!issues.empty()) {
        return Error::fromIssues("build node descriptor", std::move(issues));
    }

    NodeDescriptor node(*dispatch_);
    node.label_ = label_;
    node.shader_ = shader_;
    node.entryPoint_ = entryPoint_;
    node.bindGroup_ = bindGroup_;
    node.bindings_ = bindings_;
    return node;
}

} // namespace nodeplumb
