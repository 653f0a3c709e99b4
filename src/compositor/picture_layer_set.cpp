/// @file picture_layer_set.cpp
/// @brief PictureLayerSet implementation

#include <tableau_engine/compositor/picture_layer_set.hpp>
#include <tableau_engine/compositor/occlusion.hpp>
#include <tableau_engine/core/log.hpp>

#include <algorithm>
#include <mutex>

namespace tableau_compositor {

using tableau_render::IntRect;

PictureLayerSet::PictureLayerSet(PictureId pic_id,
                                 std::shared_ptr<tableau_render::IImageFactory> factory,
                                 bool occlusion_culling)
    : m_pic_id(pic_id)
    , m_factory(std::move(factory))
    , m_occlusion_culling(occlusion_culling)
{
    // A new set has never been composited
    m_dirty.mark_full_dirty();
}

// =============================================================================
// Background & Drawing
// =============================================================================

void PictureLayerSet::set_background(std::unique_ptr<BackgroundLayer> layer) {
    if (!layer) {
        return;
    }
    std::unique_lock lock(m_mutex);
    m_background = std::move(layer);
    m_dirty.mark_full_dirty();
}

BackgroundLayer* PictureLayerSet::background() const {
    std::shared_lock lock(m_mutex);
    return m_background.get();
}

int PictureLayerSet::set_drawing(std::unique_ptr<DrawingLayer> layer) {
    if (!layer) {
        return 0;
    }
    std::unique_lock lock(m_mutex);
    int z = m_next_z_order++;
    layer->set_z_order(z);
    m_drawing = std::move(layer);
    m_dirty.mark_full_dirty();
    return z;
}

DrawingLayer* PictureLayerSet::drawing() const {
    std::shared_lock lock(m_mutex);
    return m_drawing.get();
}

// =============================================================================
// Stacked Layers
// =============================================================================

int PictureLayerSet::add_cast_layer(std::unique_ptr<CastLayer> layer) {
    if (!layer) {
        return 0;
    }
    std::unique_lock lock(m_mutex);
    int z = m_next_z_order++;
    layer->set_z_order(z);
    m_casts.push_back(std::move(layer));
    m_dirty.mark_full_dirty();
    return z;
}

int PictureLayerSet::add_text_layer(std::unique_ptr<TextLayer> layer) {
    if (!layer) {
        return 0;
    }
    std::unique_lock lock(m_mutex);
    int z = m_next_z_order++;
    layer->set_z_order(z);
    m_texts.push_back(std::move(layer));
    m_dirty.mark_full_dirty();
    return z;
}

int PictureLayerSet::add_drawing_entry(std::unique_ptr<DrawingEntry> entry) {
    if (!entry) {
        return 0;
    }
    std::unique_lock lock(m_mutex);
    int z = m_next_z_order++;
    entry->set_z_order(z);
    m_entries.push_back(std::move(entry));
    m_dirty.mark_full_dirty();
    return z;
}

template<typename T>
bool PictureLayerSet::remove_where_locked(std::vector<std::unique_ptr<T>>& list, auto&& pred) {
    auto it = std::find_if(list.begin(), list.end(),
        [&pred](const std::unique_ptr<T>& layer) { return pred(*layer); });
    if (it == list.end()) {
        return false;
    }
    // Repaint the vacated area even if nothing covers it
    m_dirty.add_region((*it)->bounds());
    list.erase(it);
    m_dirty.mark_full_dirty();
    return true;
}

bool PictureLayerSet::remove_cast_layer(int cast_id) {
    std::unique_lock lock(m_mutex);
    bool removed = remove_where_locked(m_casts, [cast_id](const CastLayer& l) { return l.cast_id() == cast_id; });
    if (!removed) {
        tableau_core::compositor_logger()->debug(
            "remove_cast_layer: cast not found, picID={}, castID={}", m_pic_id, cast_id);
    }
    return removed;
}

bool PictureLayerSet::remove_cast_layer_by_id(LayerId layer_id) {
    std::unique_lock lock(m_mutex);
    bool removed = remove_where_locked(m_casts, [layer_id](const CastLayer& l) { return l.id() == layer_id; });
    if (!removed) {
        tableau_core::compositor_logger()->debug(
            "remove_cast_layer_by_id: layer not found, picID={}, layerID={}", m_pic_id, layer_id);
    }
    return removed;
}

bool PictureLayerSet::remove_text_layer(LayerId layer_id) {
    std::unique_lock lock(m_mutex);
    bool removed = remove_where_locked(m_texts, [layer_id](const TextLayer& l) { return l.id() == layer_id; });
    if (!removed) {
        tableau_core::compositor_logger()->debug(
            "remove_text_layer: layer not found, picID={}, layerID={}", m_pic_id, layer_id);
    }
    return removed;
}

CastLayer* PictureLayerSet::get_cast_layer(int cast_id) const {
    std::shared_lock lock(m_mutex);
    for (const auto& layer : m_casts) {
        if (layer->cast_id() == cast_id) {
            return layer.get();
        }
    }
    return nullptr;
}

CastLayer* PictureLayerSet::get_cast_layer_by_id(LayerId layer_id) const {
    std::shared_lock lock(m_mutex);
    for (const auto& layer : m_casts) {
        if (layer->id() == layer_id) {
            return layer.get();
        }
    }
    return nullptr;
}

TextLayer* PictureLayerSet::get_text_layer(LayerId layer_id) const {
    std::shared_lock lock(m_mutex);
    for (const auto& layer : m_texts) {
        if (layer->id() == layer_id) {
            return layer.get();
        }
    }
    tableau_core::compositor_logger()->debug(
        "get_text_layer: layer not found, picID={}, layerID={}", m_pic_id, layer_id);
    return nullptr;
}

std::size_t PictureLayerSet::cast_layer_count() const {
    std::shared_lock lock(m_mutex);
    return m_casts.size();
}

std::size_t PictureLayerSet::text_layer_count() const {
    std::shared_lock lock(m_mutex);
    return m_texts.size();
}

std::size_t PictureLayerSet::drawing_entry_count() const {
    std::shared_lock lock(m_mutex);
    return m_entries.size();
}

void PictureLayerSet::clear_cast_layers() {
    std::unique_lock lock(m_mutex);
    m_casts.clear();
    m_dirty.mark_full_dirty();
}

void PictureLayerSet::clear_text_layers() {
    std::unique_lock lock(m_mutex);
    m_texts.clear();
    m_dirty.mark_full_dirty();
}

void PictureLayerSet::clear_drawing_entries() {
    std::unique_lock lock(m_mutex);
    m_entries.clear();
    m_dirty.mark_full_dirty();
}

int PictureLayerSet::next_z_order() const {
    std::shared_lock lock(m_mutex);
    return m_next_z_order;
}

// =============================================================================
// Dirty Tracking
// =============================================================================

void PictureLayerSet::add_dirty_region(const IntRect& rect) {
    std::unique_lock lock(m_mutex);
    m_dirty.add_region(rect);
}

void PictureLayerSet::clear_dirty_region() {
    std::unique_lock lock(m_mutex);
    m_dirty.clear();
}

IntRect PictureLayerSet::dirty_region() const {
    std::shared_lock lock(m_mutex);
    return m_dirty.region();
}

bool PictureLayerSet::is_full_dirty() const {
    std::shared_lock lock(m_mutex);
    return m_dirty.is_full_dirty();
}

bool PictureLayerSet::is_dirty_locked() const {
    if (m_dirty.has_dirty()) {
        return true;
    }
    if (m_background && m_background->is_dirty()) {
        return true;
    }
    if (m_drawing && m_drawing->is_dirty()) {
        return true;
    }
    auto any_dirty = [](const auto& list) {
        return std::any_of(list.begin(), list.end(), [](const auto& l) { return l->is_dirty(); });
    };
    return any_dirty(m_casts) || any_dirty(m_texts) || any_dirty(m_entries);
}

bool PictureLayerSet::is_dirty() const {
    std::shared_lock lock(m_mutex);
    return is_dirty_locked();
}

void PictureLayerSet::mark_full_dirty() {
    std::unique_lock lock(m_mutex);
    m_dirty.mark_full_dirty();
}

void PictureLayerSet::clear_all_dirty_flags_locked() {
    if (m_background) {
        m_background->set_dirty(false);
    }
    if (m_drawing) {
        m_drawing->set_dirty(false);
    }
    for (auto& l : m_casts) {
        l->set_dirty(false);
    }
    for (auto& l : m_texts) {
        l->set_dirty(false);
    }
    for (auto& l : m_entries) {
        l->set_dirty(false);
    }
    m_dirty.clear();
}

void PictureLayerSet::clear_all_dirty_flags() {
    std::unique_lock lock(m_mutex);
    clear_all_dirty_flags_locked();
}

// =============================================================================
// Ordering
// =============================================================================

std::vector<LayerRef> PictureLayerSet::all_layers_sorted_locked() const {
    std::vector<LayerRef> layers;
    layers.reserve(2 + m_entries.size() + m_casts.size() + m_texts.size());

    if (m_background) {
        layers.emplace_back(m_background.get());
    }
    if (m_drawing) {
        layers.emplace_back(m_drawing.get());
    }
    for (const auto& l : m_entries) {
        layers.emplace_back(l.get());
    }
    for (const auto& l : m_casts) {
        layers.emplace_back(l.get());
    }
    for (const auto& l : m_texts) {
        layers.emplace_back(l.get());
    }

    std::stable_sort(layers.begin(), layers.end(),
        [](const LayerRef& a, const LayerRef& b) { return a.z_order() < b.z_order(); });
    return layers;
}

std::vector<LayerRef> PictureLayerSet::upper_layers_locked(int z_order) const {
    std::vector<LayerRef> uppers;
    for (const auto& layer : all_layers_sorted_locked()) {
        if (layer.z_order() > z_order) {
            uppers.push_back(layer);
        }
    }
    return uppers;
}

std::vector<LayerRef> PictureLayerSet::get_all_layers_sorted() const {
    std::shared_lock lock(m_mutex);
    return all_layers_sorted_locked();
}

std::vector<LayerRef> PictureLayerSet::get_upper_layers(int z_order) const {
    std::shared_lock lock(m_mutex);
    return upper_layers_locked(z_order);
}

// =============================================================================
// Compositing
// =============================================================================

std::shared_ptr<tableau_render::IImage> PictureLayerSet::composite(const IntRect& visible_rect) {
    std::unique_lock lock(m_mutex);

    if (visible_rect.is_empty()) {
        return m_buffer;
    }

    if (!is_dirty_locked() && m_buffer) {
        ++m_stats.cache_hits;
        return m_buffer;
    }

    if (!m_buffer || m_buffer->width() != visible_rect.width() || m_buffer->height() != visible_rect.height()) {
        if (!m_factory) {
            tableau_core::compositor_logger()->warn(
                "composite: no image factory for picture {}, cannot allocate buffer", m_pic_id);
            return nullptr;
        }
        m_buffer = m_factory->create_image(visible_rect.width(), visible_rect.height());
        if (!m_buffer) {
            tableau_core::compositor_logger()->warn(
                "composite: buffer allocation failed for picture {} ({}x{})",
                m_pic_id, visible_rect.width(), visible_rect.height());
            return nullptr;
        }
    }

    m_buffer->clear();

    auto layers = all_layers_sorted_locked();
    for (std::size_t i = 0; i < layers.size(); ++i) {
        const LayerRef& layer = layers[i];

        // Text bounds are only known once the image exists
        auto image = layer.image();

        if (!is_layer_visible(layer, visible_rect)) {
            ++m_stats.layers_clipped;
            continue;
        }

        if (m_occlusion_culling) {
            std::vector<LayerRef> uppers;
            for (std::size_t j = i + 1; j < layers.size(); ++j) {
                if (layers[j].z_order() > layer.z_order()) {
                    uppers.push_back(layers[j]);
                }
            }
            if (should_skip_layer(layer, uppers)) {
                ++m_stats.layers_occluded;
                continue;
            }
        }

        if (!image) {
            continue;
        }

        IntRect bounds = layer.bounds();
        m_buffer->draw_image(*image,
            static_cast<float>(bounds.min_x - visible_rect.min_x),
            static_cast<float>(bounds.min_y - visible_rect.min_y));
        ++m_stats.layers_drawn;
    }

    ++m_stats.rebuilds;
    clear_all_dirty_flags_locked();

    tableau_core::compositor_logger()->trace(
        "composite: picture {} repainted {} layers into {}", m_pic_id, layers.size(), visible_rect.to_string());
    return m_buffer;
}

std::shared_ptr<tableau_render::IImage> PictureLayerSet::composite_buffer() const {
    std::shared_lock lock(m_mutex);
    return m_buffer;
}

void PictureLayerSet::set_composite_buffer(std::shared_ptr<tableau_render::IImage> buffer) {
    std::unique_lock lock(m_mutex);
    m_buffer = std::move(buffer);
}

void PictureLayerSet::set_image_factory(std::shared_ptr<tableau_render::IImageFactory> factory) {
    std::unique_lock lock(m_mutex);
    m_factory = std::move(factory);
}

void PictureLayerSet::set_occlusion_culling(bool enabled) {
    std::unique_lock lock(m_mutex);
    m_occlusion_culling = enabled;
}

bool PictureLayerSet::occlusion_culling() const {
    std::shared_lock lock(m_mutex);
    return m_occlusion_culling;
}

CompositeStats PictureLayerSet::stats() const {
    std::shared_lock lock(m_mutex);
    return m_stats;
}

void PictureLayerSet::reset_stats() {
    std::unique_lock lock(m_mutex);
    m_stats.reset();
}

} // namespace tableau_compositor
