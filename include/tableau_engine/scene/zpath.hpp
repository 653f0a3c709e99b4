#pragma once

/// @file zpath.hpp
/// @brief Hierarchical Z-addressing
///
/// A ZPath is the sequence of local z-orders from the root of the scene tree
/// down to a node. Comparing paths lexicographically (with an ancestor
/// ordered before its descendants) yields a pre-order paint order.

#include "fwd.hpp"

#include <cstddef>
#include <cstdint>
#include <initializer_list>
#include <map>
#include <optional>
#include <shared_mutex>
#include <string>
#include <vector>

namespace tableau_scene {

// =============================================================================
// ZPath
// =============================================================================

/// Immutable integer-sequence paint address
class ZPath {
public:
    ZPath() = default;
    explicit ZPath(std::vector<int> path) : m_path(std::move(path)) {}
    ZPath(std::initializer_list<int> path) : m_path(path) {}

    /// Parent path with `local` appended; a null parent gives `[local]`
    [[nodiscard]] static ZPath from_parent(const ZPath* parent, int local);

    /// Number of elements
    [[nodiscard]] std::size_t depth() const noexcept { return m_path.size(); }

    /// True for the empty path
    [[nodiscard]] bool empty() const noexcept { return m_path.empty(); }

    /// Last element (0 for the empty path)
    [[nodiscard]] int local_z_order() const noexcept {
        return m_path.empty() ? 0 : m_path.back();
    }

    /// Raw elements
    [[nodiscard]] const std::vector<int>& values() const noexcept { return m_path; }

    /// Element access (unchecked)
    [[nodiscard]] int operator[](std::size_t index) const { return m_path[index]; }

    /// True iff this path is a prefix of `other` (equal paths included)
    [[nodiscard]] bool is_prefix_of(const ZPath& other) const;

    /// Strict lexicographic order; a proper prefix is less than its extension
    [[nodiscard]] bool less(const ZPath& other) const;

    /// Three-way comparison: -1, 0 or 1
    [[nodiscard]] int compare(const ZPath& other) const;

    /// Path without its last element; nullopt for depth <= 1
    [[nodiscard]] std::optional<ZPath> parent() const;

    /// Same prefix with a different last element
    [[nodiscard]] ZPath with_local(int local) const;

    /// Format as "[0, 1, 2]"
    [[nodiscard]] std::string to_string() const;

    [[nodiscard]] bool operator<(const ZPath& other) const { return less(other); }
    [[nodiscard]] bool operator==(const ZPath& other) const = default;

private:
    std::vector<int> m_path;
};

// =============================================================================
// ZOrderCounter
// =============================================================================

/// Monotonic local z-order allocator, one sequence per parent scope
class ZOrderCounter {
public:
    ZOrderCounter() = default;

    /// Return the next value for `scope` (starting at 0) and advance it
    int get_next(std::int64_t scope);

    /// Value the next get_next call would return
    [[nodiscard]] int current(std::int64_t scope) const;

    /// Restart one scope at 0
    void reset(std::int64_t scope);

    /// Restart every scope
    void reset_all();

    /// Number of scopes that have allocated at least once
    [[nodiscard]] std::size_t scope_count() const;

private:
    mutable std::shared_mutex m_mutex;
    std::map<std::int64_t, int> m_next;
};

} // namespace tableau_scene
