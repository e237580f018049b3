#include <nodeplumb/shared_resource.hpp>

#include <utility>

namespace nodeplumb {

struct SharedResource::Cell {
    mutable std::mutex mutex;
    ResourceView       view;
    std::uint64_t      generation = 0;
    mutable std::uint64_t reads   = 0;
};

SharedResource::SharedResource() : cell_(std::make_shared<Cell>()) {}

SharedResource::SharedResource(ResourceView initial) : cell_(std::make_shared<Cell>()) {
    cell_->view = std::move(initial);
}

ResourceView SharedResource::read() const {
    std::lock_guard lock(cell_->mutex);
    ++cell_->reads;
    return cell_->view;
}

void SharedResource::write(const ResourceView& view) {
    std::lock_guard lock(cell_->mutex);
    cell_->view = view;
    ++cell_->generation;
}

SharedResource::Access SharedResource::lock() {
    std::unique_lock lock(cell_->mutex);
    ++cell_->generation;
    return Access(std::move(lock), &cell_->view);
}

std::uint64_t SharedResource::generation() const {
    std::lock_guard lock(cell_->mutex);
    return cell_->generation;
}

std::uint64_t SharedResource::readCount() const {
    std::lock_guard lock(cell_->mutex);
    return cell_->reads;
}

} // namespace nodeplumb
