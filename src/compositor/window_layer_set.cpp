/// @file window_layer_set.cpp
/// @brief WindowLayerSet implementation

#include <tableau_engine/compositor/window_layer_set.hpp>
#include <tableau_engine/core/log.hpp>

#include <algorithm>
#include <mutex>

namespace tableau_compositor {

using tableau_render::IntRect;

std::unique_ptr<WindowLayerSet> WindowLayerSet::create(
    WindowId win_id, int width, int height, const tableau_render::Color& bg_color) {
    if (width <= 0 || height <= 0) {
        tableau_core::compositor_logger()->debug(
            "WindowLayerSet::create: invalid size, winID={}, width={}, height={}", win_id, width, height);
        return nullptr;
    }
    return std::make_unique<WindowLayerSet>(win_id, width, height, bg_color);
}

WindowLayerSet::WindowLayerSet(WindowId win_id, int width, int height, const tableau_render::Color& bg_color)
    : m_win_id(win_id)
    , m_width(width)
    , m_height(height)
    , m_bg_color(bg_color)
{
    m_dirty.mark_full_dirty();
}

// =============================================================================
// Geometry
// =============================================================================

int WindowLayerSet::width() const {
    std::shared_lock lock(m_mutex);
    return m_width;
}

int WindowLayerSet::height() const {
    std::shared_lock lock(m_mutex);
    return m_height;
}

void WindowLayerSet::set_size(int width, int height) {
    if (width <= 0 || height <= 0) {
        tableau_core::compositor_logger()->debug(
            "WindowLayerSet::set_size: invalid size ignored, winID={}, width={}, height={}", m_win_id, width, height);
        return;
    }
    std::unique_lock lock(m_mutex);
    if (m_width == width && m_height == height) {
        return;
    }
    m_width = width;
    m_height = height;
    m_dirty.mark_full_dirty();
    m_buffer.reset();
}

tableau_render::Color WindowLayerSet::bg_color() const {
    std::shared_lock lock(m_mutex);
    return m_bg_color;
}

void WindowLayerSet::set_bg_color(const tableau_render::Color& color) {
    std::unique_lock lock(m_mutex);
    m_bg_color = color;
    m_dirty.mark_full_dirty();
}

// =============================================================================
// Layers
// =============================================================================

int WindowLayerSet::add_layer(OwnedLayer layer) {
    LayerRef ref = ref_of(layer);
    if (!ref) {
        return 0;
    }

    std::unique_lock lock(m_mutex);
    int z = m_next_z_order++;
    ref.set_z_order(z);
    m_layers.push_back(std::move(layer));
    m_dirty.mark_full_dirty();
    return z;
}

bool WindowLayerSet::remove_at_locked(std::size_t index) {
    m_dirty.add_region(ref_of(m_layers[index]).bounds());
    m_layers.erase(m_layers.begin() + static_cast<std::ptrdiff_t>(index));
    m_dirty.mark_full_dirty();
    return true;
}

bool WindowLayerSet::remove_layer(LayerId layer_id) {
    std::unique_lock lock(m_mutex);
    for (std::size_t i = 0; i < m_layers.size(); ++i) {
        if (ref_of(m_layers[i]).id() == layer_id) {
            return remove_at_locked(i);
        }
    }
    tableau_core::compositor_logger()->debug(
        "remove_layer: layer not found, winID={}, layerID={}", m_win_id, layer_id);
    return false;
}

LayerRef WindowLayerSet::get_layer(LayerId layer_id) const {
    std::shared_lock lock(m_mutex);
    for (const auto& layer : m_layers) {
        LayerRef ref = ref_of(layer);
        if (ref.id() == layer_id) {
            return ref;
        }
    }
    tableau_core::compositor_logger()->debug(
        "get_layer: layer not found, winID={}, layerID={}", m_win_id, layer_id);
    return LayerRef{};
}

std::vector<LayerRef> WindowLayerSet::get_layers_sorted() const {
    std::shared_lock lock(m_mutex);
    std::vector<LayerRef> sorted;
    sorted.reserve(m_layers.size());
    for (const auto& layer : m_layers) {
        sorted.push_back(ref_of(layer));
    }
    std::stable_sort(sorted.begin(), sorted.end(),
        [](const LayerRef& a, const LayerRef& b) { return a.z_order() < b.z_order(); });
    return sorted;
}

LayerRef WindowLayerSet::get_topmost_layer() const {
    std::shared_lock lock(m_mutex);
    LayerRef top;
    for (const auto& layer : m_layers) {
        LayerRef ref = ref_of(layer);
        if (!top || ref.z_order() > top.z_order()) {
            top = ref;
        }
    }
    return top;
}

std::size_t WindowLayerSet::layer_count() const {
    std::shared_lock lock(m_mutex);
    return m_layers.size();
}

void WindowLayerSet::clear_layers() {
    std::unique_lock lock(m_mutex);
    m_layers.clear();
    m_next_z_order = 1;
    m_dirty.mark_full_dirty();
}

int WindowLayerSet::next_z_order() const {
    std::shared_lock lock(m_mutex);
    return m_next_z_order;
}

// =============================================================================
// Casts
// =============================================================================

CastLayer* WindowLayerSet::get_cast_layer(int cast_id) const {
    std::shared_lock lock(m_mutex);
    for (const auto& layer : m_layers) {
        auto* cast = ref_of(layer).as<CastLayer>();
        if (cast && cast->cast_id() == cast_id) {
            return cast;
        }
    }
    return nullptr;
}

bool WindowLayerSet::remove_cast_layer(int cast_id) {
    std::unique_lock lock(m_mutex);
    for (std::size_t i = 0; i < m_layers.size(); ++i) {
        auto* cast = ref_of(m_layers[i]).as<CastLayer>();
        if (cast && cast->cast_id() == cast_id) {
            return remove_at_locked(i);
        }
    }
    tableau_core::compositor_logger()->debug(
        "remove_cast_layer: cast not found, winID={}, castID={}", m_win_id, cast_id);
    return false;
}

std::size_t WindowLayerSet::cast_layer_count() const {
    std::shared_lock lock(m_mutex);
    return static_cast<std::size_t>(std::count_if(m_layers.begin(), m_layers.end(),
        [](const OwnedLayer& layer) { return ref_of(layer).kind() == LayerKind::Cast; }));
}

std::vector<CastLayer*> WindowLayerSet::all_cast_layers() const {
    std::shared_lock lock(m_mutex);
    std::vector<CastLayer*> casts;
    for (const auto& layer : m_layers) {
        if (auto* cast = ref_of(layer).as<CastLayer>()) {
            casts.push_back(cast);
        }
    }
    return casts;
}

// =============================================================================
// Dirty Tracking
// =============================================================================

void WindowLayerSet::add_dirty_region(const IntRect& rect) {
    std::unique_lock lock(m_mutex);
    m_dirty.add_region(rect);
}

void WindowLayerSet::clear_dirty_region() {
    std::unique_lock lock(m_mutex);
    m_dirty.clear();
}

IntRect WindowLayerSet::dirty_region() const {
    std::shared_lock lock(m_mutex);
    return m_dirty.region();
}

bool WindowLayerSet::is_full_dirty() const {
    std::shared_lock lock(m_mutex);
    return m_dirty.is_full_dirty();
}

bool WindowLayerSet::is_dirty() const {
    std::shared_lock lock(m_mutex);
    if (m_dirty.has_dirty()) {
        return true;
    }
    return std::any_of(m_layers.begin(), m_layers.end(),
        [](const OwnedLayer& layer) { return ref_of(layer).is_dirty(); });
}

void WindowLayerSet::mark_full_dirty() {
    std::unique_lock lock(m_mutex);
    m_dirty.mark_full_dirty();
}

void WindowLayerSet::clear_all_dirty_flags() {
    std::unique_lock lock(m_mutex);
    for (const auto& layer : m_layers) {
        ref_of(layer).set_dirty(false);
    }
    m_dirty.clear();
}

// =============================================================================
// Composite Buffer
// =============================================================================

std::shared_ptr<tableau_render::IImage> WindowLayerSet::composite_buffer() const {
    std::shared_lock lock(m_mutex);
    return m_buffer;
}

void WindowLayerSet::set_composite_buffer(std::shared_ptr<tableau_render::IImage> buffer) {
    std::unique_lock lock(m_mutex);
    m_buffer = std::move(buffer);
}

} // namespace tableau_compositor
