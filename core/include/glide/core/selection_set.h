// ==============================================================================
// Core Types - Control Point Selection
// ==============================================================================
// Indices of the control points targeted by batch Increase/Decrease.
// Plain click replaces the selection, Shift+click toggles membership.
// ==============================================================================

#pragma once

#include <cstddef>
#include <set>

namespace Glide {
namespace Core {

class SelectionSet {
public:
    using Indices = std::set<size_t>;

    /// Replace the selection with {index}, or toggle index when additive.
    void toggle(size_t index, bool additive) {
        if (!additive) {
            indices_ = {index};
            return;
        }
        if (auto it = indices_.find(index); it != indices_.end()) {
            indices_.erase(it);
        } else {
            indices_.insert(index);
        }
    }

    void clear() noexcept { indices_.clear(); }

    [[nodiscard]] bool contains(size_t index) const { return indices_.count(index) != 0; }
    [[nodiscard]] bool empty() const noexcept { return indices_.empty(); }
    [[nodiscard]] size_t size() const noexcept { return indices_.size(); }

    [[nodiscard]] const Indices& indices() const noexcept { return indices_; }

    [[nodiscard]] Indices::const_iterator begin() const noexcept { return indices_.begin(); }
    [[nodiscard]] Indices::const_iterator end() const noexcept { return indices_.end(); }

private:
    Indices indices_;
};

} // namespace Core
} // namespace Glide
