#pragma once

/// @file scene_node.hpp
/// @brief Drawable node of the scene tree
///
/// A SceneNode never owns its relatives. The SceneGraph owns every node;
/// parent and child links are plain observers kept consistent by
/// set_parent / add_child / remove_child.

#include "fwd.hpp"
#include "zpath.hpp"

#include <tableau_engine/render/image.hpp>
#include <tableau_engine/render/types.hpp>

#include <functional>
#include <memory>
#include <optional>
#include <utility>
#include <vector>

namespace tableau_scene {

/// Custom paint routine used instead of blitting the node image
/// @param target Surface being painted
/// @param x Absolute x position
/// @param y Absolute y position
/// @param alpha Effective alpha
using NodeDrawCallback = std::function<void(tableau_render::IImage& target, float x, float y, float alpha)>;

// =============================================================================
// SceneNode
// =============================================================================

/// Tree node with position, optional Z-path, visibility and alpha
class SceneNode {
public:
    SceneNode(SpriteId id, std::shared_ptr<tableau_render::IImage> image);

    SceneNode(const SceneNode&) = delete;
    SceneNode& operator=(const SceneNode&) = delete;

    // =========================================================================
    // Identity & Image
    // =========================================================================

    [[nodiscard]] SpriteId id() const noexcept { return m_id; }

    [[nodiscard]] const std::shared_ptr<tableau_render::IImage>& image() const noexcept { return m_image; }

    /// Replace the image (dirty when the pointer changes)
    void set_image(std::shared_ptr<tableau_render::IImage> image);

    /// Image size, (0, 0) without an image
    [[nodiscard]] std::pair<std::int32_t, std::int32_t> size() const;

    // =========================================================================
    // Position, Visibility, Alpha
    // =========================================================================

    [[nodiscard]] tableau_render::Vec2 position() const noexcept { return m_position; }
    void set_position(float x, float y);
    void set_position(const tableau_render::Vec2& pos) { set_position(pos.x, pos.y); }

    [[nodiscard]] bool visible() const noexcept { return m_visible; }
    void set_visible(bool visible);

    [[nodiscard]] float alpha() const noexcept { return m_alpha; }

    /// Set alpha, clamped to [0, 1]
    void set_alpha(float alpha);

    // =========================================================================
    // Z-Path
    // =========================================================================

    [[nodiscard]] const std::optional<ZPath>& zpath() const noexcept { return m_zpath; }
    [[nodiscard]] bool has_zpath() const noexcept { return m_zpath.has_value(); }
    void set_zpath(ZPath path);
    void clear_zpath();

    // =========================================================================
    // Hierarchy
    // =========================================================================

    [[nodiscard]] SceneNode* parent() const noexcept { return m_parent; }
    [[nodiscard]] const std::vector<SceneNode*>& children() const noexcept { return m_children; }
    [[nodiscard]] bool has_children() const noexcept { return !m_children.empty(); }

    /// Detach from the current parent and append to `parent`'s children
    /// (nullptr makes this a root). The Z-path is left untouched.
    void set_parent(SceneNode* parent);

    /// Adopt `child` as the last child; nullptr is ignored
    void add_child(SceneNode* child);

    /// Detach a child by id; unknown ids are ignored
    void remove_child(SpriteId child_id);

    /// Index in the child list, -1 when absent
    [[nodiscard]] int child_index(SpriteId child_id) const;

    /// True if `node` is this node or one of its ancestors
    [[nodiscard]] bool is_self_or_ancestor(const SceneNode* node) const;

    // =========================================================================
    // Effective State
    // =========================================================================

    /// Own position plus every ancestor's
    [[nodiscard]] tableau_render::Vec2 absolute_position() const;

    /// Own alpha times every ancestor's
    [[nodiscard]] float effective_alpha() const;

    /// Own flag and every ancestor's flag
    [[nodiscard]] bool is_effectively_visible() const;

    // =========================================================================
    // Dirty & Draw Callback
    // =========================================================================

    [[nodiscard]] bool is_dirty() const noexcept { return m_dirty; }
    void mark_dirty() noexcept { m_dirty = true; }
    void clear_dirty() noexcept { m_dirty = false; }

    void set_draw_callback(NodeDrawCallback callback) { m_draw_callback = std::move(callback); }
    [[nodiscard]] const NodeDrawCallback& draw_callback() const noexcept { return m_draw_callback; }
    [[nodiscard]] bool has_draw_callback() const noexcept { return static_cast<bool>(m_draw_callback); }

private:
    SpriteId m_id;
    std::shared_ptr<tableau_render::IImage> m_image;
    tableau_render::Vec2 m_position;
    std::optional<ZPath> m_zpath;
    bool m_visible = true;
    float m_alpha = 1.0f;
    SceneNode* m_parent = nullptr;
    std::vector<SceneNode*> m_children;
    bool m_dirty = true;
    NodeDrawCallback m_draw_callback;
};

} // namespace tableau_scene
