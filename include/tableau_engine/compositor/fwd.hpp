#pragma once

/// @file fwd.hpp
/// @brief Forward declarations for tableau_compositor

#include <cstdint>

namespace tableau_compositor {

/// Layer identifier, unique per LayerManager
using LayerId = int;

/// Picture (off-screen surface) identifier
using PictureId = int;

/// Window identifier
using WindowId = int;

/// Z-order reserved for the background layer
inline constexpr int kBackgroundZOrder = 0;

enum class LayerKind : std::uint8_t;

class LayerBase;
class BackgroundLayer;
class DrawingLayer;
class DrawingEntry;
class CastLayer;
class TextLayer;
class LayerRef;

struct CastRecord;
struct TextRecord;
struct CompositeStats;
struct LayerManagerConfig;

class DirtyTracker;
class PictureLayerSet;
class WindowLayerSet;
class LayerManager;

} // namespace tableau_compositor
