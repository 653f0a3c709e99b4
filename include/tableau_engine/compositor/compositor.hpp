#pragma once

/// @file compositor.hpp
/// @brief Main include header for tableau_compositor
///
/// Layer-based compositing for picture and window surfaces:
/// - Layer kinds (background, drawing, cast, text) behind LayerRef
/// - PictureLayerSet with dirty tracking, occlusion culling and a cached buffer
/// - WindowLayerSet flat stacks
/// - LayerManager registry keyed by surface id

#include "fwd.hpp"
#include "config.hpp"
#include "layer.hpp"
#include "layer_ref.hpp"
#include "occlusion.hpp"
#include "dirty_tracker.hpp"
#include "picture_layer_set.hpp"
#include "window_layer_set.hpp"
#include "layer_manager.hpp"
