#pragma once

/// @file occlusion.hpp
/// @brief Visibility clipping and occlusion culling for layer stacks

#include "fwd.hpp"
#include "layer_ref.hpp"

#include <tableau_engine/render/types.hpp>

#include <vector>

namespace tableau_compositor {

/// True if `lower` cannot contribute a pixel: it is null, hidden or empty,
/// or some visible opaque upper layer fully contains its bounds
[[nodiscard]] bool should_skip_layer(const LayerRef& lower, const std::vector<LayerRef>& uppers);

/// Visible and overlapping `visible_rect`
[[nodiscard]] bool is_layer_visible(const LayerRef& layer, const tableau_render::IntRect& visible_rect);

/// Part of the layer inside `visible_rect` (empty for a null layer)
[[nodiscard]] tableau_render::IntRect get_visible_region(const LayerRef& layer,
                                                         const tableau_render::IntRect& visible_rect);

} // namespace tableau_compositor
