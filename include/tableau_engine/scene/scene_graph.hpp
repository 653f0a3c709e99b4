#pragma once

/// @file scene_graph.hpp
/// @brief Owner of all scene nodes and their paint order
///
/// The graph hands out non-owning SceneNode pointers that stay valid until
/// the node is removed or the graph is cleared. Every structural or Z-path
/// change invalidates the cached paint order; draw() re-sorts lazily.

#include "fwd.hpp"
#include "scene_node.hpp"
#include "zpath.hpp"

#include <tableau_engine/core/error.hpp>
#include <tableau_engine/render/image.hpp>

#include <nlohmann/json_fwd.hpp>

#include <functional>
#include <memory>
#include <shared_mutex>
#include <string>
#include <unordered_map>
#include <vector>

namespace tableau_scene {

// =============================================================================
// Draw Snapshot
// =============================================================================

/// Per-node values captured for one paint pass
struct NodeDrawInfo {
    SpriteId id = 0;
    std::shared_ptr<tableau_render::IImage> image;
    tableau_render::Vec2 position;
    float alpha = 1.0f;
    std::optional<ZPath> zpath;
    NodeDrawCallback custom_draw;
};

/// Called after each node is painted (debug overlays)
using DebugDrawCallback = std::function<void(tableau_render::IImage& target, const NodeDrawInfo& node)>;

// =============================================================================
// SceneGraph
// =============================================================================

/// Registry of scene nodes producing a stable, cached paint order
class SceneGraph {
public:
    /// @param factory Used by create_sprite_with_size (may be null)
    explicit SceneGraph(std::shared_ptr<tableau_render::IImageFactory> factory = nullptr);
    ~SceneGraph();

    SceneGraph(const SceneGraph&) = delete;
    SceneGraph& operator=(const SceneGraph&) = delete;

    // =========================================================================
    // Creation
    // =========================================================================

    /// Create a visible root node without a Z-path
    SceneNode* create_sprite(std::shared_ptr<tableau_render::IImage> image);

    /// Create a node with a fresh blank image; nullptr on bad size or no factory
    SceneNode* create_sprite_with_size(std::int32_t width, std::int32_t height);

    /// Create a hidden node. Assign its Z-path and parent before showing it.
    SceneNode* create_sprite_hidden(std::shared_ptr<tableau_render::IImage> image);

    /// Create a root node whose Z-path is exactly [window_z_order]
    SceneNode* create_root_sprite(std::shared_ptr<tableau_render::IImage> image, int window_z_order);

    /// Create a node under `parent` (nullptr for root) with a Z-path drawn
    /// from the parent's counter scope
    SceneNode* create_sprite_with_zpath(std::shared_ptr<tableau_render::IImage> image, SceneNode* parent);

    // =========================================================================
    // Lookup & Removal
    // =========================================================================

    [[nodiscard]] SceneNode* get_sprite(SpriteId id) const;

    /// Remove a node and its whole subtree
    /// @return false for unknown ids
    bool remove_sprite(SpriteId id);

    /// Remove every node. Id and z-order counters keep running.
    void clear();

    [[nodiscard]] std::size_t count() const;

    // =========================================================================
    // Ordering
    // =========================================================================

    /// Invalidate the cached paint order
    void mark_need_sort();

    [[nodiscard]] bool needs_sort() const;

    /// Paint order as ids (re-sorts if needed)
    [[nodiscard]] std::vector<SpriteId> sorted_ids();

    /// Move a node above all of its siblings, rewriting its subtree
    tableau_core::Result<void> bring_to_front(SpriteId id);

    /// Move a node below all of its siblings, rewriting its subtree
    tableau_core::Result<void> send_to_back(SpriteId id);

    /// Move a node under `new_parent` (0 for root) with a fresh local z-order
    tableau_core::Result<void> reparent(SpriteId id, SpriteId new_parent);

    /// Assign a Z-path directly
    tableau_core::Result<void> set_zpath(SpriteId id, ZPath path);

    // =========================================================================
    // Drawing
    // =========================================================================

    /// Paint every effectively visible node onto `surface` in paint order
    void draw(tableau_render::IImage& surface);

    void set_debug_draw_callback(DebugDrawCallback callback);

    // =========================================================================
    // Diagnostics (scene_debug.cpp)
    // =========================================================================

    /// Indented tree of all nodes
    [[nodiscard]] std::string print_hierarchy() const;

    /// Numbered paint order
    [[nodiscard]] std::string print_draw_order();

    /// Summary plus one line per node in paint order
    [[nodiscard]] std::string dump_state_text();

    /// Full state as JSON
    [[nodiscard]] nlohmann::json dump_state_json() const;

    // =========================================================================
    // Counters
    // =========================================================================

    [[nodiscard]] const ZOrderCounter& zorder_counter() const noexcept { return m_counter; }

    /// Id the next created node will receive
    [[nodiscard]] SpriteId next_id() const;

private:
    SceneNode* insert_node_locked(std::shared_ptr<tableau_render::IImage> image);
    void sort_locked();
    void rewrite_descendants_locked(SceneNode& node);
    void collect_subtree_locked(SceneNode& node, std::vector<SpriteId>& out) const;
    [[nodiscard]] std::vector<SceneNode*> siblings_locked(const SceneNode& node) const;
    [[nodiscard]] std::vector<SceneNode*> roots_locked() const;

    mutable std::shared_mutex m_mutex;
    std::unordered_map<SpriteId, std::unique_ptr<SceneNode>> m_nodes;
    std::vector<SceneNode*> m_sorted;
    bool m_need_sort = true;
    SpriteId m_next_id = 1;
    ZOrderCounter m_counter;
    std::shared_ptr<tableau_render::IImageFactory> m_factory;
    DebugDrawCallback m_debug_callback;
};

/// Paint-order comparison: Z-path-less nodes first (by id), then Z-path
/// order with id as the tie breaker
[[nodiscard]] bool paint_order_less(const SceneNode& a, const SceneNode& b);

} // namespace tableau_scene
