#pragma once

/// @file dirty_tracker.hpp
/// @brief Dirty region accumulation shared by picture and window layer sets

#include "fwd.hpp"

#include <tableau_engine/render/types.hpp>

namespace tableau_compositor {

/// Union of rectangles marked dirty since the last clear, plus a full flag
///
/// Not synchronized; owners guard it with their own lock.
class DirtyTracker {
public:
    /// Union `rect` into the region; empty rectangles are ignored
    void add_region(const tableau_render::IntRect& rect) {
        if (rect.is_empty()) {
            return;
        }
        m_region = m_region.union_with(rect);
    }

    /// Empty the region and drop the full flag
    void clear() {
        m_region = tableau_render::IntRect{};
        m_full_dirty = false;
    }

    void mark_full_dirty() noexcept { m_full_dirty = true; }

    [[nodiscard]] const tableau_render::IntRect& region() const noexcept { return m_region; }
    [[nodiscard]] bool is_full_dirty() const noexcept { return m_full_dirty; }

    /// Full flag set or region non-empty
    [[nodiscard]] bool has_dirty() const noexcept { return m_full_dirty || !m_region.is_empty(); }

private:
    tableau_render::IntRect m_region;
    bool m_full_dirty = false;
};

} // namespace tableau_compositor
