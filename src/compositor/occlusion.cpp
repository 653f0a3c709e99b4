/// @file occlusion.cpp
/// @brief Occlusion culling helpers

#include <tableau_engine/compositor/occlusion.hpp>

namespace tableau_compositor {

bool should_skip_layer(const LayerRef& lower, const std::vector<LayerRef>& uppers) {
    if (!lower || !lower.is_visible()) {
        return true;
    }

    auto bounds = lower.bounds();
    if (bounds.is_empty()) {
        return true;
    }

    for (const auto& upper : uppers) {
        if (!upper || !upper.is_visible() || !upper.is_opaque()) {
            continue;
        }
        if (upper.bounds().contains(bounds)) {
            return true;
        }
    }
    return false;
}

bool is_layer_visible(const LayerRef& layer, const tableau_render::IntRect& visible_rect) {
    if (!layer || !layer.is_visible()) {
        return false;
    }
    return !layer.bounds().intersect(visible_rect).is_empty();
}

tableau_render::IntRect get_visible_region(const LayerRef& layer, const tableau_render::IntRect& visible_rect) {
    if (!layer) {
        return tableau_render::IntRect{};
    }
    return layer.bounds().intersect(visible_rect);
}

} // namespace tableau_compositor
