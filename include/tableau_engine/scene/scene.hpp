#pragma once

/// @file scene.hpp
/// @brief Main include header for tableau_scene
///
/// Hierarchical Z-addressed scene tree:
/// - ZPath / ZOrderCounter for path-based paint order
/// - SceneNode with inherited position, alpha and visibility
/// - SceneGraph owning all nodes with a cached stable paint order

#include "fwd.hpp"
#include "zpath.hpp"
#include "scene_node.hpp"
#include "scene_graph.hpp"
