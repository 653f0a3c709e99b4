#pragma once

/// @file window_layer_set.hpp
/// @brief Flat layer stack of one window

#include "fwd.hpp"
#include "dirty_tracker.hpp"
#include "layer_ref.hpp"

#include <tableau_engine/render/image.hpp>
#include <tableau_engine/render/types.hpp>

#include <memory>
#include <shared_mutex>
#include <vector>

namespace tableau_compositor {

/// Ordered layers of any kind with their own z-order counter (from 1)
class WindowLayerSet {
public:
    /// @return nullptr for non-positive sizes
    [[nodiscard]] static std::unique_ptr<WindowLayerSet> create(
        WindowId win_id, int width, int height, const tableau_render::Color& bg_color);

    WindowLayerSet(WindowId win_id, int width, int height, const tableau_render::Color& bg_color);

    WindowLayerSet(const WindowLayerSet&) = delete;
    WindowLayerSet& operator=(const WindowLayerSet&) = delete;

    [[nodiscard]] WindowId win_id() const noexcept { return m_win_id; }

    // =========================================================================
    // Geometry
    // =========================================================================

    [[nodiscard]] int width() const;
    [[nodiscard]] int height() const;

    /// Resize; drops the composite buffer and marks full dirty on change.
    /// Non-positive sizes are ignored.
    void set_size(int width, int height);

    [[nodiscard]] tableau_render::Color bg_color() const;
    void set_bg_color(const tableau_render::Color& color);

    // =========================================================================
    // Layers
    // =========================================================================

    /// Append with the next z-order
    /// @return Assigned z-order, 0 for an empty layer
    int add_layer(OwnedLayer layer);

    /// Remove by layer id; the vacated bounds become dirty
    bool remove_layer(LayerId layer_id);

    /// Null reference for unknown ids
    [[nodiscard]] LayerRef get_layer(LayerId layer_id) const;

    [[nodiscard]] std::vector<LayerRef> get_layers_sorted() const;

    /// Layer with the highest z-order, null when empty
    [[nodiscard]] LayerRef get_topmost_layer() const;

    [[nodiscard]] std::size_t layer_count() const;

    /// Drop every layer and restart the counter at 1
    void clear_layers();

    [[nodiscard]] int next_z_order() const;

    // =========================================================================
    // Casts
    // =========================================================================

    [[nodiscard]] CastLayer* get_cast_layer(int cast_id) const;
    bool remove_cast_layer(int cast_id);
    [[nodiscard]] std::size_t cast_layer_count() const;
    [[nodiscard]] std::vector<CastLayer*> all_cast_layers() const;

    // =========================================================================
    // Dirty Tracking
    // =========================================================================

    void add_dirty_region(const tableau_render::IntRect& rect);
    void clear_dirty_region();
    [[nodiscard]] tableau_render::IntRect dirty_region() const;
    [[nodiscard]] bool is_full_dirty() const;
    [[nodiscard]] bool is_dirty() const;
    void mark_full_dirty();
    void clear_all_dirty_flags();

    // =========================================================================
    // Composite Buffer
    // =========================================================================

    [[nodiscard]] std::shared_ptr<tableau_render::IImage> composite_buffer() const;
    void set_composite_buffer(std::shared_ptr<tableau_render::IImage> buffer);

private:
    bool remove_at_locked(std::size_t index);

    mutable std::shared_mutex m_mutex;

    WindowId m_win_id;
    int m_width;
    int m_height;
    tableau_render::Color m_bg_color;

    std::vector<OwnedLayer> m_layers;
    int m_next_z_order = 1;
    DirtyTracker m_dirty;
    std::shared_ptr<tableau_render::IImage> m_buffer;
};

} // namespace tableau_compositor
