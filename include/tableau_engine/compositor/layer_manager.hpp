#pragma once

/// @file layer_manager.hpp
/// @brief Registry of picture and window layer sets

#include "fwd.hpp"
#include "config.hpp"
#include "layer.hpp"
#include "layer_ref.hpp"
#include "picture_layer_set.hpp"
#include "window_layer_set.hpp"

#include <tableau_engine/core/error.hpp>
#include <tableau_engine/render/image.hpp>

#include <atomic>
#include <map>
#include <memory>
#include <shared_mutex>
#include <vector>

namespace tableau_compositor {

// =============================================================================
// LayerManager
// =============================================================================

/// Owns every layer set, keyed by surface id
///
/// Layer sets are created lazily on first access. The first creation wins:
/// later calls with other arguments return the existing set unchanged.
/// Layer ids are unique per manager and never reused, even across clear().
class LayerManager {
public:
    explicit LayerManager(LayerManagerConfig config = LayerManagerConfig{},
                          std::shared_ptr<tableau_render::IImageFactory> factory = nullptr);

    LayerManager(const LayerManager&) = delete;
    LayerManager& operator=(const LayerManager&) = delete;

    // =========================================================================
    // Picture Layer Sets
    // =========================================================================

    [[nodiscard]] PictureLayerSet* get_or_create_picture_layer_set(PictureId pic_id);

    /// nullptr for unknown ids
    [[nodiscard]] PictureLayerSet* get_picture_layer_set(PictureId pic_id) const;

    /// Remove the set and every layer it holds
    bool delete_picture_layer_set(PictureId pic_id);

    [[nodiscard]] std::size_t picture_layer_set_count() const;

    /// Ids in ascending order
    [[nodiscard]] std::vector<PictureId> picture_layer_set_ids() const;

    // =========================================================================
    // Window Layer Sets
    // =========================================================================

    /// @return nullptr for a non-positive size when the set does not exist yet
    [[nodiscard]] WindowLayerSet* get_or_create_window_layer_set(
        WindowId win_id, int width, int height, const tableau_render::Color& bg_color);

    /// Uses the configured clear color
    [[nodiscard]] WindowLayerSet* get_or_create_window_layer_set(WindowId win_id, int width, int height);

    [[nodiscard]] WindowLayerSet* get_window_layer_set(WindowId win_id) const;

    bool delete_window_layer_set(WindowId win_id);

    [[nodiscard]] std::size_t window_layer_set_count() const;

    // =========================================================================
    // Global
    // =========================================================================

    /// Allocate a layer id (starts at 1)
    [[nodiscard]] LayerId next_layer_id();

    /// Peek the id next_layer_id() will return
    [[nodiscard]] LayerId peek_next_layer_id() const noexcept;

    /// Destroy every layer set; the id counter is kept
    void clear();

    /// Refuse a new layer of `kind` when the picture already holds the
    /// configured maximum. Kinds without a cap always pass.
    [[nodiscard]] tableau_core::Result<void> check_capacity(PictureId pic_id, LayerKind kind) const;

    /// Forwards to the free occlusion test
    [[nodiscard]] static bool should_skip_layer(const LayerRef& lower, const std::vector<LayerRef>& uppers);

    [[nodiscard]] const LayerManagerConfig& config() const noexcept { return m_config; }

    [[nodiscard]] std::shared_ptr<tableau_render::IImageFactory> image_factory() const;
    void set_image_factory(std::shared_ptr<tableau_render::IImageFactory> factory);

private:
    mutable std::shared_mutex m_mutex;

    LayerManagerConfig m_config;
    std::shared_ptr<tableau_render::IImageFactory> m_factory;

    std::map<PictureId, std::unique_ptr<PictureLayerSet>> m_pictures;
    std::map<WindowId, std::unique_ptr<WindowLayerSet>> m_windows;

    std::atomic<LayerId> m_next_layer_id{1};
};

} // namespace tableau_compositor
