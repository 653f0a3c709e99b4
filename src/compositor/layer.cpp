/// @file layer.cpp
/// @brief Layer kind implementations

#include <tableau_engine/compositor/layer.hpp>
#include <tableau_engine/core/log.hpp>

namespace tableau_compositor {

using tableau_render::IImage;
using tableau_render::IntRect;

namespace {

IntRect image_bounds_at(const std::shared_ptr<IImage>& image, int x, int y) {
    if (!image) {
        return IntRect{};
    }
    return IntRect::from_xywh(x, y, image->width(), image->height());
}

} // anonymous namespace

const char* layer_kind_name(LayerKind kind) {
    switch (kind) {
        case LayerKind::Background: return "Background";
        case LayerKind::Drawing: return "Drawing";
        case LayerKind::DrawingEntry: return "DrawingEntry";
        case LayerKind::Cast: return "Cast";
        case LayerKind::Text: return "Text";
        default: return "Unknown";
    }
}

// =============================================================================
// BackgroundLayer
// =============================================================================

BackgroundLayer::BackgroundLayer(LayerId id, PictureId pic_id, std::shared_ptr<IImage> image)
    : LayerBase(id, image_bounds_at(image, 0, 0), kBackgroundZOrder, true)
    , m_pic_id(pic_id)
    , m_image(std::move(image))
{}

void BackgroundLayer::set_image(std::shared_ptr<IImage> image) {
    m_image = std::move(image);
    if (m_image) {
        m_bounds = image_bounds_at(m_image, 0, 0);
    }
    m_dirty = true;
}

// =============================================================================
// DrawingLayer
// =============================================================================

DrawingLayer::DrawingLayer(LayerId id, PictureId pic_id, std::shared_ptr<IImage> image)
    : LayerBase(id, image_bounds_at(image, 0, 0), 0, false)
    , m_pic_id(pic_id)
    , m_image(std::move(image))
{}

std::unique_ptr<DrawingLayer> DrawingLayer::create(
    LayerId id, PictureId pic_id, std::int32_t width, std::int32_t height,
    tableau_render::IImageFactory& factory) {
    std::shared_ptr<IImage> image;
    if (width > 0 && height > 0) {
        image = factory.create_image(width, height);
    }
    return std::make_unique<DrawingLayer>(id, pic_id, std::move(image));
}

void DrawingLayer::set_image(std::shared_ptr<IImage> image) {
    m_image = std::move(image);
    m_bounds = image_bounds_at(m_image, 0, 0);
    m_dirty = true;
}

void DrawingLayer::resize(std::int32_t width, std::int32_t height, tableau_render::IImageFactory& factory) {
    if (width > 0 && height > 0) {
        set_image(factory.create_image(width, height));
    } else {
        set_image(nullptr);
    }
}

void DrawingLayer::clear() {
    if (m_image) {
        m_image->clear();
        m_dirty = true;
    }
}

void DrawingLayer::draw_image(const IImage& src, int x, int y) {
    if (!m_image) {
        return;
    }
    m_image->draw_image(src, static_cast<float>(x), static_cast<float>(y));
    m_dirty = true;
}

void DrawingLayer::draw_sub_image(const IImage& src, int dest_x, int dest_y, const IntRect& src_rect) {
    if (!m_image) {
        return;
    }
    auto sub = src.sub_image(src_rect);
    if (!sub) {
        return;
    }
    m_image->draw_image(*sub, static_cast<float>(dest_x), static_cast<float>(dest_y));
    m_dirty = true;
}

// =============================================================================
// DrawingEntry
// =============================================================================

DrawingEntry::DrawingEntry(LayerId id, PictureId pic_id, std::shared_ptr<IImage> image, const IntRect& dest)
    : LayerBase(id, dest, 0, false)
    , m_pic_id(pic_id)
    , m_image(std::move(image))
{}

std::unique_ptr<DrawingEntry> DrawingEntry::create(
    LayerId id, PictureId pic_id, std::shared_ptr<IImage> image, int dest_x, int dest_y) {
    if (!image || image->width() <= 0 || image->height() <= 0) {
        tableau_core::compositor_logger()->debug(
            "DrawingEntry::create: invalid image, id={}, picID={}", id, pic_id);
        return nullptr;
    }
    IntRect dest = image_bounds_at(image, dest_x, dest_y);
    return std::make_unique<DrawingEntry>(id, pic_id, std::move(image), dest);
}

// =============================================================================
// CastLayer
// =============================================================================

CastLayer::CastLayer(LayerId id, const CastRecord& record)
    : LayerBase(id, IntRect::from_xywh(record.x, record.y, record.width, record.height), 0, false)
    , m_cast_id(record.cast_id)
    , m_pic_id(record.pic_id)
    , m_src_pic_id(record.src_pic_id)
    , m_x(record.x)
    , m_y(record.y)
    , m_src_x(record.src_x)
    , m_src_y(record.src_y)
    , m_width(record.width)
    , m_height(record.height)
    , m_trans_color(record.trans_color)
{
    m_visible = record.visible;
}

std::unique_ptr<CastLayer> CastLayer::create(LayerId id, const CastRecord& record) {
    if (record.width <= 0 || record.height <= 0) {
        tableau_core::compositor_logger()->debug(
            "CastLayer::create: invalid size, id={}, castID={}, width={}, height={}",
            id, record.cast_id, record.width, record.height);
        return nullptr;
    }
    return std::make_unique<CastLayer>(id, record);
}

void CastLayer::set_position(int x, int y) {
    if (m_x == x && m_y == y) {
        return;
    }
    m_x = x;
    m_y = y;
    m_bounds = IntRect::from_xywh(m_x, m_y, m_width, m_height);
    m_dirty = true;
}

void CastLayer::set_source_rect(int src_x, int src_y, int width, int height) {
    if (m_src_x == src_x && m_src_y == src_y && m_width == width && m_height == height) {
        return;
    }
    m_src_x = src_x;
    m_src_y = src_y;
    m_width = width;
    m_height = height;
    m_bounds = IntRect::from_xywh(m_x, m_y, m_width, m_height);
    m_dirty = true;
    m_cache.reset();
}

void CastLayer::set_trans_color(std::optional<tableau_render::Color> color) {
    if (m_trans_color == color) {
        return;
    }
    m_trans_color = color;
    m_dirty = true;
    m_cache.reset();
}

void CastLayer::update_from_cast(const CastRecord& record) {
    bool pos_changed = m_x != record.x || m_y != record.y;
    bool src_changed = m_src_x != record.src_x || m_src_y != record.src_y ||
                       m_width != record.width || m_height != record.height;
    bool key_changed = m_trans_color != record.trans_color;

    if (pos_changed) {
        m_x = record.x;
        m_y = record.y;
    }
    if (src_changed) {
        m_src_x = record.src_x;
        m_src_y = record.src_y;
        m_width = record.width;
        m_height = record.height;
    }
    if (key_changed) {
        m_trans_color = record.trans_color;
    }
    if (pos_changed || src_changed) {
        m_bounds = IntRect::from_xywh(m_x, m_y, m_width, m_height);
    }
    if (pos_changed || src_changed || key_changed) {
        m_dirty = true;
        if (src_changed || key_changed) {
            m_cache.reset();
        }
    }

    set_visible(record.visible);
}

void CastLayer::set_source_image(std::shared_ptr<IImage> source) {
    m_source = std::move(source);
    m_cache.reset();
    m_dirty = true;
}

void CastLayer::set_color_key_filter(ColorKeyFilter filter) {
    m_color_key_filter = std::move(filter);
    if (m_trans_color) {
        m_cache.reset();
        m_dirty = true;
    }
}

std::shared_ptr<IImage> CastLayer::image() {
    if (!m_cache && m_source) {
        rebuild_cache();
    }
    return m_cache;
}

void CastLayer::rebuild_cache() {
    m_cache.reset();
    if (!m_source || m_width <= 0 || m_height <= 0) {
        return;
    }

    IntRect src_rect = source_rect().intersect(m_source->bounds());
    if (src_rect.is_empty()) {
        return;
    }

    auto sub = m_source->sub_image(src_rect);
    if (sub && m_trans_color && m_color_key_filter) {
        sub = m_color_key_filter(*sub, *m_trans_color);
    }
    m_cache = std::move(sub);
    ++m_rebuilds;

    tableau_core::compositor_logger()->trace(
        "CastLayer {}: rebuilt cache from {} (castID={})", m_id, src_rect.to_string(), m_cast_id);
}

void CastLayer::invalidate() {
    m_dirty = true;
    m_cache.reset();
}

// =============================================================================
// TextLayer
// =============================================================================

TextLayer::TextLayer(LayerId id, const TextRecord& record)
    : LayerBase(id, IntRect{}, 0, false)
    , m_pic_id(record.pic_id)
    , m_x(record.x)
    , m_y(record.y)
    , m_text(record.text)
{
    m_visible = record.visible;
}

std::unique_ptr<TextLayer> TextLayer::create(LayerId id, const TextRecord& record) {
    return std::make_unique<TextLayer>(id, record);
}

void TextLayer::update_bounds() {
    if (m_cache) {
        m_bounds = image_bounds_at(m_cache, m_x, m_y);
    }
}

void TextLayer::set_text(const std::string& text) {
    if (m_text == text) {
        return;
    }
    m_text = text;
    m_dirty = true;
    m_cache.reset();
}

void TextLayer::set_position(int x, int y) {
    if (m_x == x && m_y == y) {
        return;
    }
    m_x = x;
    m_y = y;
    update_bounds();
    m_dirty = true;
}

void TextLayer::update_from_text(const TextRecord& record) {
    set_position(record.x, record.y);
    set_text(record.text);
    set_visible(record.visible);
}

void TextLayer::set_image(std::shared_ptr<IImage> image) {
    if (m_cache == image) {
        return;
    }
    m_cache = std::move(image);
    if (m_cache) {
        update_bounds();
    } else {
        m_bounds = IntRect{};
    }
    m_dirty = true;
}

void TextLayer::set_rasterizer(TextRasterizer rasterizer) {
    m_rasterizer = std::move(rasterizer);
}

std::shared_ptr<IImage> TextLayer::image() {
    if (!m_cache && m_rasterizer && !m_text.empty()) {
        m_cache = m_rasterizer(m_text);
        update_bounds();
    }
    return m_cache;
}

void TextLayer::invalidate() {
    m_dirty = true;
    m_cache.reset();
}

} // namespace tableau_compositor
