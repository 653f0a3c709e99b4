#pragma once

/// @file layer.hpp
/// @brief Layer kinds stacked by the picture and window layer sets
///
/// Every kind embeds the LayerBase record (id, bounds, z-order, visibility,
/// dirty and opaque flags). There is no virtual dispatch: the set of kinds
/// is closed and LayerRef provides the shared interface over them.

#include "fwd.hpp"

#include <tableau_engine/render/image.hpp>
#include <tableau_engine/render/types.hpp>

#include <cstdint>
#include <functional>
#include <memory>
#include <optional>
#include <string>

namespace tableau_compositor {

// =============================================================================
// LayerKind
// =============================================================================

/// Closed set of layer kinds
enum class LayerKind : std::uint8_t {
    Background,    // Picture contents, z-order 0
    Drawing,       // Legacy per-picture drawing canvas
    DrawingEntry,  // One freeform draw or transfer operation
    Cast,          // Sprite copied from a source picture
    Text,          // Rendered text string
};

/// Get layer kind name
[[nodiscard]] const char* layer_kind_name(LayerKind kind);

// =============================================================================
// External Collaborator Hooks
// =============================================================================

/// Replace pixels matching `key` with transparency; returns the filtered copy
using ColorKeyFilter = std::function<std::shared_ptr<tableau_render::IImage>(
    const tableau_render::IImage& source, const tableau_render::Color& key)>;

/// Rasterize a text string into an image
using TextRasterizer = std::function<std::shared_ptr<tableau_render::IImage>(const std::string& text)>;

/// Cast state mirrored from the cast manager
struct CastRecord {
    int cast_id = 0;
    PictureId pic_id = 0;
    PictureId src_pic_id = 0;
    int x = 0;
    int y = 0;
    int src_x = 0;
    int src_y = 0;
    int width = 0;
    int height = 0;
    std::optional<tableau_render::Color> trans_color;
    bool visible = true;
};

/// Text state mirrored from the text manager
struct TextRecord {
    PictureId pic_id = 0;
    int x = 0;
    int y = 0;
    std::string text;
    bool visible = true;
};

// =============================================================================
// LayerBase
// =============================================================================

/// Fields shared by every layer kind
class LayerBase {
public:
    [[nodiscard]] LayerId id() const noexcept { return m_id; }
    [[nodiscard]] const tableau_render::IntRect& bounds() const noexcept { return m_bounds; }
    [[nodiscard]] int z_order() const noexcept { return m_z_order; }
    [[nodiscard]] bool is_visible() const noexcept { return m_visible; }
    [[nodiscard]] bool is_dirty() const noexcept { return m_dirty; }
    [[nodiscard]] bool is_opaque() const noexcept { return m_opaque; }

    /// Dirty only when the flag changes
    void set_visible(bool visible) {
        if (m_visible != visible) {
            m_visible = visible;
            m_dirty = true;
        }
    }

    /// Dirty only when the rectangle changes
    void set_bounds(const tableau_render::IntRect& bounds) {
        if (m_bounds != bounds) {
            m_bounds = bounds;
            m_dirty = true;
        }
    }

    void set_dirty(bool dirty) noexcept { m_dirty = dirty; }
    void set_z_order(int z_order) noexcept { m_z_order = z_order; }
    void set_opaque(bool opaque) noexcept { m_opaque = opaque; }

protected:
    LayerBase(LayerId id, const tableau_render::IntRect& bounds, int z_order, bool opaque)
        : m_id(id)
        , m_bounds(bounds)
        , m_z_order(z_order)
        , m_opaque(opaque)
    {}

    LayerId m_id;
    tableau_render::IntRect m_bounds;
    int m_z_order;
    bool m_visible = true;
    bool m_dirty = true;
    bool m_opaque;
};

// =============================================================================
// BackgroundLayer
// =============================================================================

/// Picture background; always at z-order 0 and opaque
class BackgroundLayer : public LayerBase {
public:
    static constexpr LayerKind kKind = LayerKind::Background;

    /// A null image is allowed and gives empty bounds until set_image
    BackgroundLayer(LayerId id, PictureId pic_id, std::shared_ptr<tableau_render::IImage> image);

    [[nodiscard]] PictureId pic_id() const noexcept { return m_pic_id; }
    void set_pic_id(PictureId pic_id) noexcept { m_pic_id = pic_id; }

    [[nodiscard]] std::shared_ptr<tableau_render::IImage> image() const { return m_image; }

    /// Replace the image; bounds follow it
    void set_image(std::shared_ptr<tableau_render::IImage> image);

    /// Background z-order is fixed
    void set_z_order(int) noexcept {}

    void invalidate() noexcept { m_dirty = true; }

private:
    PictureId m_pic_id;
    std::shared_ptr<tableau_render::IImage> m_image;
};

// =============================================================================
// DrawingLayer
// =============================================================================

/// Legacy drawing canvas (one per picture)
class DrawingLayer : public LayerBase {
public:
    static constexpr LayerKind kKind = LayerKind::Drawing;

    DrawingLayer(LayerId id, PictureId pic_id, std::shared_ptr<tableau_render::IImage> image);

    /// Create with a blank canvas; the image is null for non-positive sizes
    [[nodiscard]] static std::unique_ptr<DrawingLayer> create(
        LayerId id, PictureId pic_id, std::int32_t width, std::int32_t height,
        tableau_render::IImageFactory& factory);

    [[nodiscard]] PictureId pic_id() const noexcept { return m_pic_id; }

    [[nodiscard]] std::shared_ptr<tableau_render::IImage> image() const { return m_image; }

    /// Replace the canvas; bounds follow it
    void set_image(std::shared_ptr<tableau_render::IImage> image);

    /// Recreate a blank canvas (contents are not kept)
    void resize(std::int32_t width, std::int32_t height, tableau_render::IImageFactory& factory);

    /// Clear the canvas
    void clear();

    /// Draw onto the canvas at (x, y)
    void draw_image(const tableau_render::IImage& src, int x, int y);

    /// Draw a sub-rectangle of `src` onto the canvas at (dest_x, dest_y)
    void draw_sub_image(const tableau_render::IImage& src, int dest_x, int dest_y,
                        const tableau_render::IntRect& src_rect);

    void invalidate() noexcept { m_dirty = true; }

private:
    PictureId m_pic_id;
    std::shared_ptr<tableau_render::IImage> m_image;
};

// =============================================================================
// DrawingEntry
// =============================================================================

/// Result of one draw or transfer operation, stacked in operation order
class DrawingEntry : public LayerBase {
public:
    static constexpr LayerKind kKind = LayerKind::DrawingEntry;

    /// Create an entry showing `image` at (dest_x, dest_y)
    /// @return nullptr for a null image or non-positive size
    [[nodiscard]] static std::unique_ptr<DrawingEntry> create(
        LayerId id, PictureId pic_id, std::shared_ptr<tableau_render::IImage> image,
        int dest_x, int dest_y);

    DrawingEntry(LayerId id, PictureId pic_id, std::shared_ptr<tableau_render::IImage> image,
                 const tableau_render::IntRect& dest);

    [[nodiscard]] PictureId pic_id() const noexcept { return m_pic_id; }
    [[nodiscard]] int dest_x() const noexcept { return m_bounds.min_x; }
    [[nodiscard]] int dest_y() const noexcept { return m_bounds.min_y; }
    [[nodiscard]] int width() const noexcept { return m_bounds.width(); }
    [[nodiscard]] int height() const noexcept { return m_bounds.height(); }

    [[nodiscard]] std::shared_ptr<tableau_render::IImage> image() const { return m_image; }

    void invalidate() noexcept { m_dirty = true; }

private:
    PictureId m_pic_id;
    std::shared_ptr<tableau_render::IImage> m_image;
};

// =============================================================================
// CastLayer
// =============================================================================

/// Sprite copied from a source picture's sub-rectangle
///
/// The cached image is rebuilt on demand from the source image. A set
/// transparent color is applied through the installed ColorKeyFilter.
class CastLayer : public LayerBase {
public:
    static constexpr LayerKind kKind = LayerKind::Cast;

    /// @return nullptr for non-positive width or height
    [[nodiscard]] static std::unique_ptr<CastLayer> create(LayerId id, const CastRecord& record);

    CastLayer(LayerId id, const CastRecord& record);

    [[nodiscard]] int cast_id() const noexcept { return m_cast_id; }
    [[nodiscard]] PictureId pic_id() const noexcept { return m_pic_id; }
    void set_pic_id(PictureId pic_id) noexcept { m_pic_id = pic_id; }
    [[nodiscard]] PictureId src_pic_id() const noexcept { return m_src_pic_id; }

    [[nodiscard]] tableau_render::IntRect source_rect() const {
        return tableau_render::IntRect::from_xywh(m_src_x, m_src_y, m_width, m_height);
    }
    [[nodiscard]] int x() const noexcept { return m_x; }
    [[nodiscard]] int y() const noexcept { return m_y; }

    [[nodiscard]] const std::optional<tableau_render::Color>& trans_color() const noexcept { return m_trans_color; }
    [[nodiscard]] bool has_trans_color() const noexcept { return m_trans_color.has_value(); }

    /// Move the destination (dirty on change, cache kept)
    void set_position(int x, int y);

    /// Change the source rectangle (dirty and cache dropped on change)
    void set_source_rect(int src_x, int src_y, int width, int height);

    /// Change the transparent color (dirty and cache dropped on change)
    void set_trans_color(std::optional<tableau_render::Color> color);

    /// Mirror the cast manager's record
    void update_from_cast(const CastRecord& record);

    /// Source picture image used to build the cache
    void set_source_image(std::shared_ptr<tableau_render::IImage> source);
    [[nodiscard]] const std::shared_ptr<tableau_render::IImage>& source_image() const noexcept { return m_source; }

    void set_color_key_filter(ColorKeyFilter filter);

    /// Cached image, rebuilt when dropped
    [[nodiscard]] std::shared_ptr<tableau_render::IImage> image();

    /// Install a prepared image as the cache
    void set_cached_image(std::shared_ptr<tableau_render::IImage> image) { m_cache = std::move(image); }

    [[nodiscard]] bool has_cached_image() const noexcept { return static_cast<bool>(m_cache); }

    /// Number of cache rebuilds so far
    [[nodiscard]] std::uint32_t rebuild_count() const noexcept { return m_rebuilds; }

    void invalidate();

private:
    void rebuild_cache();

    int m_cast_id;
    PictureId m_pic_id;
    PictureId m_src_pic_id;
    int m_x;
    int m_y;
    int m_src_x;
    int m_src_y;
    int m_width;
    int m_height;
    std::optional<tableau_render::Color> m_trans_color;

    std::shared_ptr<tableau_render::IImage> m_source;
    std::shared_ptr<tableau_render::IImage> m_cache;
    ColorKeyFilter m_color_key_filter;
    std::uint32_t m_rebuilds = 0;
};

// =============================================================================
// TextLayer
// =============================================================================

/// Rendered text string; bounds follow the image once one exists
class TextLayer : public LayerBase {
public:
    static constexpr LayerKind kKind = LayerKind::Text;

    [[nodiscard]] static std::unique_ptr<TextLayer> create(LayerId id, const TextRecord& record);

    TextLayer(LayerId id, const TextRecord& record);

    [[nodiscard]] PictureId pic_id() const noexcept { return m_pic_id; }
    void set_pic_id(PictureId pic_id) noexcept { m_pic_id = pic_id; }
    [[nodiscard]] int x() const noexcept { return m_x; }
    [[nodiscard]] int y() const noexcept { return m_y; }
    [[nodiscard]] const std::string& text() const noexcept { return m_text; }

    /// Change the text (dirty and cache dropped on change)
    void set_text(const std::string& text);

    /// Move (dirty on change)
    void set_position(int x, int y);

    /// Mirror the text manager's record
    void update_from_text(const TextRecord& record);

    /// Install a rendered image (dirty when the image changes)
    void set_image(std::shared_ptr<tableau_render::IImage> image);

    void set_rasterizer(TextRasterizer rasterizer);

    /// Cached image, rasterized again when dropped
    [[nodiscard]] std::shared_ptr<tableau_render::IImage> image();

    [[nodiscard]] bool has_image() const noexcept { return static_cast<bool>(m_cache); }

    void invalidate();

private:
    void update_bounds();

    PictureId m_pic_id;
    int m_x;
    int m_y;
    std::string m_text;
    std::shared_ptr<tableau_render::IImage> m_cache;
    TextRasterizer m_rasterizer;
};

} // namespace tableau_compositor
