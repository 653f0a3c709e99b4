/// @file scene_debug.cpp
/// @brief SceneGraph diagnostics: hierarchy, paint order and state dumps

#include <tableau_engine/scene/scene_graph.hpp>

#include <nlohmann/json.hpp>

#include <iomanip>
#include <mutex>
#include <sstream>

namespace tableau_scene {

namespace {

std::string size_string(const SceneNode& node) {
    if (!node.image()) {
        return "nil";
    }
    auto [w, h] = node.size();
    return std::to_string(w) + "x" + std::to_string(h);
}

std::string zpath_string(const SceneNode& node) {
    return node.zpath() ? node.zpath()->to_string() : "none";
}

void print_tree(std::ostringstream& ss, const SceneNode& node, int depth) {
    ss << std::string(static_cast<std::size_t>(depth) * 2, ' ')
       << "- Sprite " << node.id()
       << ": pos=(" << node.position().x << "," << node.position().y << ")"
       << " size=" << size_string(node)
       << " zpath=" << zpath_string(node)
       << " (" << (node.visible() ? "visible" : "hidden") << ")"
       << " children=" << node.children().size() << "\n";

    for (const SceneNode* child : node.children()) {
        print_tree(ss, *child, depth + 1);
    }
}

nlohmann::json node_to_json(const SceneNode& node) {
    nlohmann::json j;
    j["id"] = node.id();
    j["z_path"] = node.zpath() ? nlohmann::json(node.zpath()->values()) : nlohmann::json(nullptr);
    j["position"] = {{"x", node.position().x}, {"y", node.position().y}};

    auto [w, h] = node.size();
    j["size"] = {{"width", w}, {"height", h}};

    j["visible"] = node.visible();
    j["effectively_visible"] = node.is_effectively_visible();
    j["alpha"] = node.alpha();
    j["parent_id"] = node.parent() ? nlohmann::json(node.parent()->id()) : nlohmann::json(nullptr);

    nlohmann::json children = nlohmann::json::array();
    for (const SceneNode* child : node.children()) {
        children.push_back(node_to_json(*child));
    }
    j["children"] = std::move(children);
    return j;
}

} // anonymous namespace

std::string SceneGraph::print_hierarchy() const {
    std::shared_lock lock(m_mutex);

    std::ostringstream ss;
    ss << std::fixed << std::setprecision(0);
    for (const SceneNode* root : roots_locked()) {
        print_tree(ss, *root, 0);
    }
    return ss.str();
}

std::string SceneGraph::print_draw_order() {
    std::unique_lock lock(m_mutex);
    if (m_need_sort) {
        sort_locked();
    }

    std::ostringstream ss;
    ss << "Draw Order:\n";
    int order = 1;
    for (const SceneNode* node : m_sorted) {
        ss << "  " << order++ << ". Sprite " << node->id()
           << " zpath=" << zpath_string(*node)
           << " (" << (node->is_effectively_visible() ? "visible" : "hidden") << ")\n";
    }
    return ss.str();
}

std::string SceneGraph::dump_state_text() {
    std::unique_lock lock(m_mutex);
    if (m_need_sort) {
        sort_locked();
    }

    std::size_t visible = 0;
    for (const SceneNode* node : m_sorted) {
        if (node->is_effectively_visible()) {
            ++visible;
        }
    }

    std::ostringstream ss;
    ss << std::fixed << std::setprecision(2);
    ss << "SceneGraph: " << m_nodes.size() << " sprites (" << visible << " visible), next id "
       << m_next_id << "\n";

    for (const SceneNode* node : m_sorted) {
        auto abs = node->absolute_position();
        ss << "  [" << node->id() << "] zpath=" << zpath_string(*node)
           << " abs=(" << abs.x << "," << abs.y << ")"
           << " alpha=" << node->effective_alpha()
           << " size=" << size_string(*node)
           << " parent=";
        if (node->parent()) {
            ss << node->parent()->id();
        } else {
            ss << "none";
        }
        ss << (node->is_effectively_visible() ? "" : " hidden") << "\n";
    }
    return ss.str();
}

nlohmann::json SceneGraph::dump_state_json() const {
    std::shared_lock lock(m_mutex);

    nlohmann::json j;
    j["total_sprites"] = m_nodes.size();

    nlohmann::json sprites = nlohmann::json::array();
    for (const SceneNode* root : roots_locked()) {
        sprites.push_back(node_to_json(*root));
    }
    j["sprites"] = std::move(sprites);
    return j;
}

} // namespace tableau_scene
