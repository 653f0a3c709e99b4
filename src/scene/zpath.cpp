/// @file zpath.cpp
/// @brief ZPath comparison and ZOrderCounter

#include <tableau_engine/scene/zpath.hpp>

#include <algorithm>
#include <mutex>

namespace tableau_scene {

// =============================================================================
// ZPath
// =============================================================================

ZPath ZPath::from_parent(const ZPath* parent, int local) {
    std::vector<int> path;
    if (parent) {
        path = parent->m_path;
    }
    path.push_back(local);
    return ZPath(std::move(path));
}

bool ZPath::is_prefix_of(const ZPath& other) const {
    if (m_path.size() > other.m_path.size()) {
        return false;
    }
    return std::equal(m_path.begin(), m_path.end(), other.m_path.begin());
}

bool ZPath::less(const ZPath& other) const {
    return compare(other) < 0;
}

int ZPath::compare(const ZPath& other) const {
    std::size_t shared = std::min(m_path.size(), other.m_path.size());
    for (std::size_t i = 0; i < shared; ++i) {
        if (m_path[i] != other.m_path[i]) {
            return m_path[i] < other.m_path[i] ? -1 : 1;
        }
    }
    if (m_path.size() == other.m_path.size()) {
        return 0;
    }
    return m_path.size() < other.m_path.size() ? -1 : 1;
}

std::optional<ZPath> ZPath::parent() const {
    if (m_path.size() <= 1) {
        return std::nullopt;
    }
    return ZPath(std::vector<int>(m_path.begin(), m_path.end() - 1));
}

ZPath ZPath::with_local(int local) const {
    std::vector<int> path = m_path;
    if (path.empty()) {
        path.push_back(local);
    } else {
        path.back() = local;
    }
    return ZPath(std::move(path));
}

std::string ZPath::to_string() const {
    std::string out = "[";
    for (std::size_t i = 0; i < m_path.size(); ++i) {
        if (i > 0) {
            out += ", ";
        }
        out += std::to_string(m_path[i]);
    }
    out += "]";
    return out;
}

// =============================================================================
// ZOrderCounter
// =============================================================================

int ZOrderCounter::get_next(std::int64_t scope) {
    std::unique_lock lock(m_mutex);
    return m_next[scope]++;
}

int ZOrderCounter::current(std::int64_t scope) const {
    std::shared_lock lock(m_mutex);
    auto it = m_next.find(scope);
    return it != m_next.end() ? it->second : 0;
}

void ZOrderCounter::reset(std::int64_t scope) {
    std::unique_lock lock(m_mutex);
    m_next.erase(scope);
}

void ZOrderCounter::reset_all() {
    std::unique_lock lock(m_mutex);
    m_next.clear();
}

std::size_t ZOrderCounter::scope_count() const {
    std::shared_lock lock(m_mutex);
    return m_next.size();
}

} // namespace tableau_scene
