/// @file scene_graph.cpp
/// @brief SceneGraph creation, ordering and drawing

#include <tableau_engine/scene/scene_graph.hpp>
#include <tableau_engine/core/log.hpp>

#include <algorithm>
#include <mutex>

namespace tableau_scene {

using tableau_core::Err;
using tableau_core::Ok;
using tableau_core::SceneError;

bool paint_order_less(const SceneNode& a, const SceneNode& b) {
    const auto& za = a.zpath();
    const auto& zb = b.zpath();
    if (za && zb) {
        int c = za->compare(*zb);
        if (c != 0) {
            return c < 0;
        }
        return a.id() < b.id();
    }
    if (za.has_value() != zb.has_value()) {
        // Nodes without a Z-path paint first
        return !za.has_value();
    }
    return a.id() < b.id();
}

SceneGraph::SceneGraph(std::shared_ptr<tableau_render::IImageFactory> factory)
    : m_factory(std::move(factory))
{}

SceneGraph::~SceneGraph() = default;

// =============================================================================
// Creation
// =============================================================================

SceneNode* SceneGraph::insert_node_locked(std::shared_ptr<tableau_render::IImage> image) {
    SpriteId id = m_next_id++;
    auto node = std::make_unique<SceneNode>(id, std::move(image));
    SceneNode* raw = node.get();
    m_nodes.emplace(id, std::move(node));
    m_need_sort = true;
    return raw;
}

SceneNode* SceneGraph::create_sprite(std::shared_ptr<tableau_render::IImage> image) {
    std::unique_lock lock(m_mutex);
    return insert_node_locked(std::move(image));
}

SceneNode* SceneGraph::create_sprite_with_size(std::int32_t width, std::int32_t height) {
    if (width <= 0 || height <= 0) {
        tableau_core::scene_logger()->debug("create_sprite_with_size: invalid size {}x{}", width, height);
        return nullptr;
    }
    if (!m_factory) {
        tableau_core::scene_logger()->warn("create_sprite_with_size: no image factory configured");
        return nullptr;
    }

    auto image = m_factory->create_image(width, height);
    if (!image) {
        return nullptr;
    }

    std::unique_lock lock(m_mutex);
    return insert_node_locked(std::move(image));
}

SceneNode* SceneGraph::create_sprite_hidden(std::shared_ptr<tableau_render::IImage> image) {
    std::unique_lock lock(m_mutex);
    SceneNode* node = insert_node_locked(std::move(image));
    node->set_visible(false);
    return node;
}

SceneNode* SceneGraph::create_root_sprite(std::shared_ptr<tableau_render::IImage> image, int window_z_order) {
    std::unique_lock lock(m_mutex);
    SceneNode* node = insert_node_locked(std::move(image));
    node->set_zpath(ZPath{window_z_order});
    return node;
}

SceneNode* SceneGraph::create_sprite_with_zpath(std::shared_ptr<tableau_render::IImage> image, SceneNode* parent) {
    std::unique_lock lock(m_mutex);

    if (parent && m_nodes.find(parent->id()) == m_nodes.end()) {
        tableau_core::scene_logger()->warn("create_sprite_with_zpath: parent {} is not in this graph", parent->id());
        return nullptr;
    }

    SceneNode* node = insert_node_locked(std::move(image));

    std::int64_t scope = parent ? parent->id() : kRootScope;
    int local = m_counter.get_next(scope);

    const ZPath* parent_path = (parent && parent->zpath()) ? &*parent->zpath() : nullptr;
    node->set_zpath(ZPath::from_parent(parent_path, local));

    if (parent) {
        parent->add_child(node);
    }
    return node;
}

// =============================================================================
// Lookup & Removal
// =============================================================================

SceneNode* SceneGraph::get_sprite(SpriteId id) const {
    std::shared_lock lock(m_mutex);
    auto it = m_nodes.find(id);
    return it != m_nodes.end() ? it->second.get() : nullptr;
}

void SceneGraph::collect_subtree_locked(SceneNode& node, std::vector<SpriteId>& out) const {
    out.push_back(node.id());
    for (SceneNode* child : node.children()) {
        collect_subtree_locked(*child, out);
    }
}

bool SceneGraph::remove_sprite(SpriteId id) {
    std::unique_lock lock(m_mutex);

    auto it = m_nodes.find(id);
    if (it == m_nodes.end()) {
        tableau_core::scene_logger()->debug("remove_sprite: unknown sprite {}", id);
        return false;
    }

    SceneNode& node = *it->second;
    std::vector<SpriteId> doomed;
    collect_subtree_locked(node, doomed);

    node.set_parent(nullptr);
    for (SpriteId victim : doomed) {
        m_nodes.erase(victim);
    }

    m_sorted.clear();
    m_need_sort = true;
    return true;
}

void SceneGraph::clear() {
    std::unique_lock lock(m_mutex);
    m_nodes.clear();
    m_sorted.clear();
    m_need_sort = true;
}

std::size_t SceneGraph::count() const {
    std::shared_lock lock(m_mutex);
    return m_nodes.size();
}

SpriteId SceneGraph::next_id() const {
    std::shared_lock lock(m_mutex);
    return m_next_id;
}

// =============================================================================
// Ordering
// =============================================================================

void SceneGraph::mark_need_sort() {
    std::unique_lock lock(m_mutex);
    m_need_sort = true;
}

bool SceneGraph::needs_sort() const {
    std::shared_lock lock(m_mutex);
    return m_need_sort;
}

void SceneGraph::sort_locked() {
    m_sorted.clear();
    m_sorted.reserve(m_nodes.size());
    for (auto& [id, node] : m_nodes) {
        m_sorted.push_back(node.get());
    }
    std::stable_sort(m_sorted.begin(), m_sorted.end(),
        [](const SceneNode* a, const SceneNode* b) { return paint_order_less(*a, *b); });
    m_need_sort = false;
}

std::vector<SpriteId> SceneGraph::sorted_ids() {
    std::unique_lock lock(m_mutex);
    if (m_need_sort) {
        sort_locked();
    }
    std::vector<SpriteId> ids;
    ids.reserve(m_sorted.size());
    for (const SceneNode* node : m_sorted) {
        ids.push_back(node->id());
    }
    return ids;
}

std::vector<SceneNode*> SceneGraph::roots_locked() const {
    std::vector<SceneNode*> roots;
    for (const auto& [id, node] : m_nodes) {
        if (!node->parent()) {
            roots.push_back(node.get());
        }
    }
    std::sort(roots.begin(), roots.end(),
        [](const SceneNode* a, const SceneNode* b) { return paint_order_less(*a, *b); });
    return roots;
}

std::vector<SceneNode*> SceneGraph::siblings_locked(const SceneNode& node) const {
    std::vector<SceneNode*> out;
    if (node.parent()) {
        for (SceneNode* child : node.parent()->children()) {
            if (child != &node && child->has_zpath()) {
                out.push_back(child);
            }
        }
        return out;
    }
    for (SceneNode* root : roots_locked()) {
        if (root != &node && root->has_zpath()) {
            out.push_back(root);
        }
    }
    return out;
}

void SceneGraph::rewrite_descendants_locked(SceneNode& node) {
    if (!node.zpath()) {
        return;
    }
    for (SceneNode* child : node.children()) {
        if (!child->zpath()) {
            continue;
        }
        child->set_zpath(ZPath::from_parent(&*node.zpath(), child->zpath()->local_z_order()));
        rewrite_descendants_locked(*child);
    }
}

tableau_core::Result<void> SceneGraph::bring_to_front(SpriteId id) {
    std::unique_lock lock(m_mutex);

    auto it = m_nodes.find(id);
    if (it == m_nodes.end()) {
        return Err(SceneError::not_found(id));
    }
    SceneNode& node = *it->second;
    if (!node.zpath()) {
        return Err(SceneError::missing_zpath(id));
    }

    std::int64_t scope = node.parent() ? node.parent()->id() : kRootScope;
    int local = m_counter.get_next(scope);

    // Siblings assigned outside the counter (root windows, set_zpath) may
    // already sit above it
    for (const SceneNode* sibling : siblings_locked(node)) {
        local = std::max(local, sibling->zpath()->local_z_order() + 1);
    }

    node.set_zpath(node.zpath()->with_local(local));
    rewrite_descendants_locked(node);
    m_need_sort = true;

    tableau_core::scene_logger()->trace("bring_to_front: sprite {} -> {}", id, node.zpath()->to_string());
    return Ok();
}

tableau_core::Result<void> SceneGraph::send_to_back(SpriteId id) {
    std::unique_lock lock(m_mutex);

    auto it = m_nodes.find(id);
    if (it == m_nodes.end()) {
        return Err(SceneError::not_found(id));
    }
    SceneNode& node = *it->second;
    if (!node.zpath()) {
        return Err(SceneError::missing_zpath(id));
    }

    int min_local = 0;
    bool any = false;
    for (const SceneNode* sibling : siblings_locked(node)) {
        int local = sibling->zpath()->local_z_order();
        if (!any || local < min_local) {
            min_local = local;
            any = true;
        }
    }
    int local = any ? min_local - 1 : -1;

    node.set_zpath(node.zpath()->with_local(local));
    rewrite_descendants_locked(node);
    m_need_sort = true;

    tableau_core::scene_logger()->trace("send_to_back: sprite {} -> {}", id, node.zpath()->to_string());
    return Ok();
}

tableau_core::Result<void> SceneGraph::reparent(SpriteId id, SpriteId new_parent) {
    std::unique_lock lock(m_mutex);

    auto it = m_nodes.find(id);
    if (it == m_nodes.end()) {
        return Err(SceneError::not_found(id));
    }
    SceneNode& node = *it->second;

    SceneNode* parent = nullptr;
    if (new_parent != 0) {
        auto pit = m_nodes.find(new_parent);
        if (pit == m_nodes.end()) {
            return Err(SceneError::not_found(new_parent));
        }
        parent = pit->second.get();
        if (parent->is_self_or_ancestor(&node)) {
            return Err(SceneError::cycle_detected(id, new_parent));
        }
    }

    std::int64_t scope = parent ? parent->id() : kRootScope;
    int local = m_counter.get_next(scope);

    node.set_parent(parent);
    const ZPath* parent_path = (parent && parent->zpath()) ? &*parent->zpath() : nullptr;
    node.set_zpath(ZPath::from_parent(parent_path, local));
    rewrite_descendants_locked(node);
    m_need_sort = true;
    return Ok();
}

tableau_core::Result<void> SceneGraph::set_zpath(SpriteId id, ZPath path) {
    std::unique_lock lock(m_mutex);

    auto it = m_nodes.find(id);
    if (it == m_nodes.end()) {
        return Err(SceneError::not_found(id));
    }
    it->second->set_zpath(std::move(path));
    m_need_sort = true;
    return Ok();
}

// =============================================================================
// Drawing
// =============================================================================

void SceneGraph::set_debug_draw_callback(DebugDrawCallback callback) {
    std::unique_lock lock(m_mutex);
    m_debug_callback = std::move(callback);
}

void SceneGraph::draw(tableau_render::IImage& surface) {
    std::vector<NodeDrawInfo> items;
    DebugDrawCallback debug;

    {
        std::unique_lock lock(m_mutex);
        if (m_need_sort) {
            sort_locked();
        }
        items.reserve(m_sorted.size());
        for (const SceneNode* node : m_sorted) {
            if (!node->is_effectively_visible()) {
                continue;
            }
            items.push_back(NodeDrawInfo{
                node->id(),
                node->image(),
                node->absolute_position(),
                node->effective_alpha(),
                node->zpath(),
                node->draw_callback(),
            });
        }
        debug = m_debug_callback;
    }

    // Paint outside the lock so callbacks may query the graph
    for (const auto& item : items) {
        if (item.custom_draw) {
            item.custom_draw(surface, item.position.x, item.position.y, item.alpha);
        } else if (item.image) {
            surface.draw_image(*item.image, item.position.x, item.position.y, item.alpha);
        }
        if (debug) {
            debug(surface, item);
        }
    }
}

} // namespace tableau_scene
