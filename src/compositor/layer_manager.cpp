/// @file layer_manager.cpp
/// @brief LayerManager implementation

#include <tableau_engine/compositor/layer_manager.hpp>
#include <tableau_engine/compositor/occlusion.hpp>
#include <tableau_engine/core/log.hpp>

#include <mutex>

namespace tableau_compositor {

using tableau_core::Err;
using tableau_core::LayerError;
using tableau_core::Ok;

LayerManager::LayerManager(LayerManagerConfig config,
                           std::shared_ptr<tableau_render::IImageFactory> factory)
    : m_config(std::move(config))
    , m_factory(std::move(factory))
{
}

// =============================================================================
// Picture Layer Sets
// =============================================================================

PictureLayerSet* LayerManager::get_or_create_picture_layer_set(PictureId pic_id) {
    std::unique_lock lock(m_mutex);
    auto it = m_pictures.find(pic_id);
    if (it != m_pictures.end()) {
        return it->second.get();
    }

    auto set = std::make_unique<PictureLayerSet>(pic_id, m_factory, m_config.occlusion_culling);
    auto* ptr = set.get();
    m_pictures.emplace(pic_id, std::move(set));
    tableau_core::compositor_logger()->debug("Created PictureLayerSet, picID={}", pic_id);
    return ptr;
}

PictureLayerSet* LayerManager::get_picture_layer_set(PictureId pic_id) const {
    std::shared_lock lock(m_mutex);
    auto it = m_pictures.find(pic_id);
    return it != m_pictures.end() ? it->second.get() : nullptr;
}

bool LayerManager::delete_picture_layer_set(PictureId pic_id) {
    std::unique_lock lock(m_mutex);
    auto it = m_pictures.find(pic_id);
    if (it == m_pictures.end()) {
        tableau_core::compositor_logger()->debug(
            "delete_picture_layer_set: not found, picID={}", pic_id);
        return false;
    }
    m_pictures.erase(it);
    tableau_core::compositor_logger()->debug("Deleted PictureLayerSet, picID={}", pic_id);
    return true;
}

std::size_t LayerManager::picture_layer_set_count() const {
    std::shared_lock lock(m_mutex);
    return m_pictures.size();
}

std::vector<PictureId> LayerManager::picture_layer_set_ids() const {
    std::shared_lock lock(m_mutex);
    std::vector<PictureId> ids;
    ids.reserve(m_pictures.size());
    for (const auto& [id, set] : m_pictures) {
        ids.push_back(id);
    }
    return ids;
}

// =============================================================================
// Window Layer Sets
// =============================================================================

WindowLayerSet* LayerManager::get_or_create_window_layer_set(
    WindowId win_id, int width, int height, const tableau_render::Color& bg_color) {
    std::unique_lock lock(m_mutex);
    auto it = m_windows.find(win_id);
    if (it != m_windows.end()) {
        return it->second.get();
    }

    auto set = WindowLayerSet::create(win_id, width, height, bg_color);
    if (!set) {
        tableau_core::compositor_logger()->warn(
            "get_or_create_window_layer_set: {}", LayerError::invalid_geometry(win_id, width, height).message);
        return nullptr;
    }
    auto* ptr = set.get();
    m_windows.emplace(win_id, std::move(set));
    tableau_core::compositor_logger()->debug(
        "Created WindowLayerSet, winID={}, size={}x{}", win_id, width, height);
    return ptr;
}

WindowLayerSet* LayerManager::get_or_create_window_layer_set(WindowId win_id, int width, int height) {
    return get_or_create_window_layer_set(win_id, width, height, m_config.clear_color);
}

WindowLayerSet* LayerManager::get_window_layer_set(WindowId win_id) const {
    std::shared_lock lock(m_mutex);
    auto it = m_windows.find(win_id);
    return it != m_windows.end() ? it->second.get() : nullptr;
}

bool LayerManager::delete_window_layer_set(WindowId win_id) {
    std::unique_lock lock(m_mutex);
    auto it = m_windows.find(win_id);
    if (it == m_windows.end()) {
        tableau_core::compositor_logger()->debug(
            "delete_window_layer_set: not found, winID={}", win_id);
        return false;
    }
    it->second->clear_layers();
    m_windows.erase(it);
    tableau_core::compositor_logger()->debug("Deleted WindowLayerSet, winID={}", win_id);
    return true;
}

std::size_t LayerManager::window_layer_set_count() const {
    std::shared_lock lock(m_mutex);
    return m_windows.size();
}

// =============================================================================
// Global
// =============================================================================

LayerId LayerManager::next_layer_id() {
    return m_next_layer_id.fetch_add(1, std::memory_order_relaxed);
}

LayerId LayerManager::peek_next_layer_id() const noexcept {
    return m_next_layer_id.load(std::memory_order_relaxed);
}

void LayerManager::clear() {
    std::unique_lock lock(m_mutex);
    for (auto& [id, set] : m_windows) {
        set->clear_layers();
    }
    m_windows.clear();
    m_pictures.clear();
    tableau_core::compositor_logger()->debug("LayerManager cleared");
}

tableau_core::Result<void> LayerManager::check_capacity(PictureId pic_id, LayerKind kind) const {
    std::shared_lock lock(m_mutex);
    auto it = m_pictures.find(pic_id);
    if (it == m_pictures.end()) {
        return Err(LayerError::not_found(pic_id, "picture " + std::to_string(pic_id)));
    }

    const PictureLayerSet& set = *it->second;
    std::size_t count = 0;
    std::size_t limit = 0;
    switch (kind) {
        case LayerKind::Cast:
            count = set.cast_layer_count();
            limit = m_config.max_cast_layers;
            break;
        case LayerKind::Text:
            count = set.text_layer_count();
            limit = m_config.max_text_layers;
            break;
        default:
            return Ok();
    }

    if (count >= limit) {
        auto err = LayerError::resource_exhausted(pic_id, layer_kind_name(kind), limit);
        tableau_core::compositor_logger()->warn("check_capacity: picID={}, {}", pic_id, err.message);
        return Err(std::move(err));
    }
    return Ok();
}

bool LayerManager::should_skip_layer(const LayerRef& lower, const std::vector<LayerRef>& uppers) {
    return tableau_compositor::should_skip_layer(lower, uppers);
}

std::shared_ptr<tableau_render::IImageFactory> LayerManager::image_factory() const {
    std::shared_lock lock(m_mutex);
    return m_factory;
}

void LayerManager::set_image_factory(std::shared_ptr<tableau_render::IImageFactory> factory) {
    std::unique_lock lock(m_mutex);
    m_factory = std::move(factory);
    for (auto& [id, set] : m_pictures) {
        set->set_image_factory(m_factory);
    }
}

} // namespace tableau_compositor
