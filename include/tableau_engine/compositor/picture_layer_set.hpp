#pragma once

/// @file picture_layer_set.hpp
/// @brief Per-picture layer stack with dirty tracking and a cached composite
///
/// Layers are painted in z-order: the background at 0, then every other
/// layer in the order it was added (one counter shared by all kinds).
/// Composite() repaints the whole stack whenever anything is dirty and
/// otherwise returns the cached buffer.

#include "fwd.hpp"
#include "dirty_tracker.hpp"
#include "layer.hpp"
#include "layer_ref.hpp"

#include <tableau_engine/render/image.hpp>

#include <cstdint>
#include <memory>
#include <shared_mutex>
#include <vector>

namespace tableau_compositor {

// =============================================================================
// Composite Statistics
// =============================================================================

/// Counters accumulated by composite()
struct CompositeStats {
    /// Layers drawn into the buffer
    std::uint32_t layers_drawn = 0;

    /// Layers outside the visible rectangle or hidden
    std::uint32_t layers_clipped = 0;

    /// Layers fully covered by an opaque upper layer
    std::uint32_t layers_occluded = 0;

    /// Calls answered from the cached buffer
    std::uint32_t cache_hits = 0;

    /// Full repaints
    std::uint32_t rebuilds = 0;

    /// Reset statistics
    void reset() {
        layers_drawn = 0;
        layers_clipped = 0;
        layers_occluded = 0;
        cache_hits = 0;
        rebuilds = 0;
    }
};

// =============================================================================
// PictureLayerSet
// =============================================================================

/// Layer stack of one picture
class PictureLayerSet {
public:
    /// @param factory Creates the composite buffer (composite() returns
    ///        nullptr without one)
    explicit PictureLayerSet(PictureId pic_id,
                             std::shared_ptr<tableau_render::IImageFactory> factory = nullptr,
                             bool occlusion_culling = true);

    PictureLayerSet(const PictureLayerSet&) = delete;
    PictureLayerSet& operator=(const PictureLayerSet&) = delete;

    [[nodiscard]] PictureId pic_id() const noexcept { return m_pic_id; }

    // =========================================================================
    // Background & Drawing
    // =========================================================================

    /// Install the background (z-order 0), replacing any previous one
    void set_background(std::unique_ptr<BackgroundLayer> layer);
    [[nodiscard]] BackgroundLayer* background() const;

    /// Install the legacy drawing layer with the next z-order
    /// @return Assigned z-order, 0 for a null layer
    int set_drawing(std::unique_ptr<DrawingLayer> layer);
    [[nodiscard]] DrawingLayer* drawing() const;

    // =========================================================================
    // Stacked Layers
    // =========================================================================

    /// Append layers with the next z-order
    /// @return Assigned z-order, 0 for a null layer
    int add_cast_layer(std::unique_ptr<CastLayer> layer);
    int add_text_layer(std::unique_ptr<TextLayer> layer);
    int add_drawing_entry(std::unique_ptr<DrawingEntry> entry);

    /// Remove by cast id; the vacated bounds become dirty
    bool remove_cast_layer(int cast_id);

    /// Remove a cast by layer id
    bool remove_cast_layer_by_id(LayerId layer_id);

    /// Remove a text layer by layer id
    bool remove_text_layer(LayerId layer_id);

    [[nodiscard]] CastLayer* get_cast_layer(int cast_id) const;
    [[nodiscard]] CastLayer* get_cast_layer_by_id(LayerId layer_id) const;
    [[nodiscard]] TextLayer* get_text_layer(LayerId layer_id) const;

    [[nodiscard]] std::size_t cast_layer_count() const;
    [[nodiscard]] std::size_t text_layer_count() const;
    [[nodiscard]] std::size_t drawing_entry_count() const;

    void clear_cast_layers();
    void clear_text_layers();
    void clear_drawing_entries();

    /// Z-order the next added layer will receive
    [[nodiscard]] int next_z_order() const;

    // =========================================================================
    // Dirty Tracking
    // =========================================================================

    void add_dirty_region(const tableau_render::IntRect& rect);

    /// Empty the region and drop the full flag (layer flags untouched)
    void clear_dirty_region();

    [[nodiscard]] tableau_render::IntRect dirty_region() const;
    [[nodiscard]] bool is_full_dirty() const;

    /// Full flag, non-empty region, or any layer's own dirty flag
    [[nodiscard]] bool is_dirty() const;

    void mark_full_dirty();

    /// Clear every layer flag, then the region and full flag
    void clear_all_dirty_flags();

    // =========================================================================
    // Ordering
    // =========================================================================

    /// Every layer sorted by z-order ascending
    [[nodiscard]] std::vector<LayerRef> get_all_layers_sorted() const;

    /// Every layer with a z-order strictly above `z_order`
    [[nodiscard]] std::vector<LayerRef> get_upper_layers(int z_order) const;

    // =========================================================================
    // Compositing
    // =========================================================================

    /// Paint the stack into the composite buffer sized to `visible_rect`
    /// @return The buffer; unchanged for an empty rect or a clean set
    std::shared_ptr<tableau_render::IImage> composite(const tableau_render::IntRect& visible_rect);

    [[nodiscard]] std::shared_ptr<tableau_render::IImage> composite_buffer() const;
    void set_composite_buffer(std::shared_ptr<tableau_render::IImage> buffer);

    void set_image_factory(std::shared_ptr<tableau_render::IImageFactory> factory);

    void set_occlusion_culling(bool enabled);
    [[nodiscard]] bool occlusion_culling() const;

    [[nodiscard]] CompositeStats stats() const;
    void reset_stats();

private:
    bool is_dirty_locked() const;
    void clear_all_dirty_flags_locked();
    std::vector<LayerRef> all_layers_sorted_locked() const;
    std::vector<LayerRef> upper_layers_locked(int z_order) const;

    template<typename T>
    bool remove_where_locked(std::vector<std::unique_ptr<T>>& list, auto&& pred);

    mutable std::shared_mutex m_mutex;

    PictureId m_pic_id;
    std::unique_ptr<BackgroundLayer> m_background;
    std::unique_ptr<DrawingLayer> m_drawing;
    std::vector<std::unique_ptr<CastLayer>> m_casts;
    std::vector<std::unique_ptr<TextLayer>> m_texts;
    std::vector<std::unique_ptr<DrawingEntry>> m_entries;

    int m_next_z_order = 1;
    DirtyTracker m_dirty;

    std::shared_ptr<tableau_render::IImage> m_buffer;
    std::shared_ptr<tableau_render::IImageFactory> m_factory;
    bool m_occlusion_culling;
    CompositeStats m_stats;
};

} // namespace tableau_compositor
