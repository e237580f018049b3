#include <nodeplumb/binding.hpp>
#include <nodeplumb/dispatch.hpp>
#include <nodeplumb/graph_context.hpp>

namespace nodeplumb {

bool DispatchStrategy::valid() const {
    if (const auto* count = std::get_if<WorkgroupCount>(&policy_)) {
        return !isEmptyDispatch(*count);
    }
    return std::get<WorkgroupFn>(policy_) != nullptr;
}

WorkgroupCount DispatchStrategy::evaluate(const GraphContext& ctx) const {
    if (const auto* count = std::get_if<WorkgroupCount>(&policy_)) {
        return *count;
    }
    return std::get<WorkgroupFn>(policy_)(ctx);
}

ResourceExtent SizeStrategy::evaluate(const GraphContext& ctx) const {
    if (const auto* extent = std::get_if<ResourceExtent>(&policy_)) {
        return *extent;
    }
    return std::get<ExtentFn>(policy_)(ctx);
}

std::string_view bindingDirectionName(BindingDirection direction) {
    switch (direction) {
    case BindingDirection::Input:
        return "input";
    case BindingDirection::Output:
        return "output";
    case BindingDirection::InputOutput:
        return "input/output";
    }
    return "unknown";
}

} // namespace nodeplumb
