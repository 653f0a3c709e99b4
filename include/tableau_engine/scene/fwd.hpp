#pragma once

/// @file fwd.hpp
/// @brief Forward declarations for tableau_scene

#include <cstdint>

namespace tableau_scene {

/// Sprite identifier (1-based, never reused within one graph)
using SpriteId = std::int64_t;

/// Counter scope used for nodes without a parent
inline constexpr std::int64_t kRootScope = 0;

class ZPath;
class ZOrderCounter;
class SceneNode;
class SceneGraph;

} // namespace tableau_scene
