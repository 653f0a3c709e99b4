/// @file scene_node.cpp
/// @brief SceneNode implementation

#include <tableau_engine/scene/scene_node.hpp>

#include <algorithm>

namespace tableau_scene {

SceneNode::SceneNode(SpriteId id, std::shared_ptr<tableau_render::IImage> image)
    : m_id(id)
    , m_image(std::move(image))
{}

void SceneNode::set_image(std::shared_ptr<tableau_render::IImage> image) {
    if (m_image == image) {
        return;
    }
    m_image = std::move(image);
    m_dirty = true;
}

std::pair<std::int32_t, std::int32_t> SceneNode::size() const {
    if (!m_image) {
        return {0, 0};
    }
    return {m_image->width(), m_image->height()};
}

void SceneNode::set_position(float x, float y) {
    if (m_position.x == x && m_position.y == y) {
        return;
    }
    m_position = tableau_render::Vec2{x, y};
    m_dirty = true;
}

void SceneNode::set_visible(bool visible) {
    if (m_visible == visible) {
        return;
    }
    m_visible = visible;
    m_dirty = true;
}

void SceneNode::set_alpha(float alpha) {
    alpha = std::clamp(alpha, 0.0f, 1.0f);
    if (m_alpha == alpha) {
        return;
    }
    m_alpha = alpha;
    m_dirty = true;
}

void SceneNode::set_zpath(ZPath path) {
    if (m_zpath && *m_zpath == path) {
        return;
    }
    m_zpath = std::move(path);
    m_dirty = true;
}

void SceneNode::clear_zpath() {
    if (!m_zpath) {
        return;
    }
    m_zpath.reset();
    m_dirty = true;
}

// =============================================================================
// Hierarchy
// =============================================================================

void SceneNode::set_parent(SceneNode* parent) {
    if (m_parent == parent) {
        return;
    }
    if (m_parent) {
        m_parent->remove_child(m_id);
    }
    m_parent = parent;
    if (parent) {
        parent->m_children.push_back(this);
    }
    m_dirty = true;
}

void SceneNode::add_child(SceneNode* child) {
    if (!child || child == this) {
        return;
    }
    if (child->m_parent == this) {
        return;
    }
    child->set_parent(this);
}

void SceneNode::remove_child(SpriteId child_id) {
    auto it = std::find_if(m_children.begin(), m_children.end(),
        [child_id](const SceneNode* c) { return c->id() == child_id; });
    if (it == m_children.end()) {
        return;
    }
    (*it)->m_parent = nullptr;
    (*it)->m_dirty = true;
    m_children.erase(it);
}

int SceneNode::child_index(SpriteId child_id) const {
    for (std::size_t i = 0; i < m_children.size(); ++i) {
        if (m_children[i]->id() == child_id) {
            return static_cast<int>(i);
        }
    }
    return -1;
}

bool SceneNode::is_self_or_ancestor(const SceneNode* node) const {
    for (const SceneNode* cur = this; cur; cur = cur->m_parent) {
        if (cur == node) {
            return true;
        }
    }
    return false;
}

// =============================================================================
// Effective State
// =============================================================================

tableau_render::Vec2 SceneNode::absolute_position() const {
    if (!m_parent) {
        return m_position;
    }
    return m_position + m_parent->absolute_position();
}

float SceneNode::effective_alpha() const {
    if (!m_parent) {
        return m_alpha;
    }
    return m_alpha * m_parent->effective_alpha();
}

bool SceneNode::is_effectively_visible() const {
    if (!m_visible) {
        return false;
    }
    return !m_parent || m_parent->is_effectively_visible();
}

} // namespace tableau_scene
