#pragma once

#include <nodeplumb/resource.hpp>

#include <cstdint>
#include <memory>
#include <mutex>
#include <utility>

namespace nodeplumb {

// Reference-counted, internally synchronized handle to an externally owned
// buffer or texture. Copies share the same cell; the cell lives as long as
// its longest holder. Every read or write takes the cell's mutex for its
// duration, so neither side ever observes a half-written view.
//
// Usage:
//   SharedResource input(ResourceView::ofBuffer(buf, 1024));
//   builder.addInputResource("input", input);
//   input.write(ResourceView::ofBuffer(bigger, 4096)); // next tick sees 4096
//
// Thread safety: all methods are thread-safe.
class SharedResource {
public:
    // Scoped exclusive access. Holds the cell's lock until destroyed.
    class Access {
    public:
        [[nodiscard]] ResourceView& view() { return *view_; }
        [[nodiscard]] const ResourceView& view() const { return *view_; }
        ResourceView* operator->() { return view_; }
        const ResourceView* operator->() const { return view_; }

    private:
        friend class SharedResource;
        Access(std::unique_lock<std::mutex> lock, ResourceView* view)
            : lock_(std::move(lock)), view_(view) {}

        std::unique_lock<std::mutex> lock_;
        ResourceView*                view_;
    };

    SharedResource();
    explicit SharedResource(ResourceView initial);

    // Copy of the current view.
    [[nodiscard]] ResourceView read() const;

    // Replace the current view and bump the generation.
    void write(const ResourceView& view);

    // Modify in place under the lock. Bumps the generation.
    [[nodiscard]] Access lock();

    // Number of write()/lock() calls so far.
    [[nodiscard]] std::uint64_t generation() const;

    // Number of read() calls so far. Diagnostic only.
    [[nodiscard]] std::uint64_t readCount() const;

    // Number of holders sharing this cell.
    [[nodiscard]] long useCount() const { return cell_.use_count(); }

    [[nodiscard]] bool sharesWith(const SharedResource& other) const {
        return cell_ == other.cell_;
    }

private:
    struct Cell;
    std::shared_ptr<Cell> cell_;
};

} // namespace nodeplumb
