/// @file software_image.cpp
/// @brief CPU RGBA8 image backend

#include <tableau_engine/render/software_image.hpp>

#include <algorithm>
#include <cmath>

namespace tableau_render {

namespace {

/// Porter-Duff source over, straight alpha, all channels in [0, 1]
Color blend_over(const Color& src, const Color& dst, float alpha_scale) {
    float src_a = (src.a / 255.0f) * alpha_scale;
    float dst_a = dst.a / 255.0f;

    float out_a = src_a + dst_a * (1.0f - src_a);
    if (out_a <= 0.0f) {
        return Color::transparent();
    }

    auto channel = [&](std::uint8_t s, std::uint8_t d) {
        float v = (s / 255.0f * src_a + d / 255.0f * dst_a * (1.0f - src_a)) / out_a;
        return static_cast<std::uint8_t>(std::clamp(std::lround(v * 255.0f), 0L, 255L));
    };

    return Color{
        channel(src.r, dst.r),
        channel(src.g, dst.g),
        channel(src.b, dst.b),
        static_cast<std::uint8_t>(std::clamp(std::lround(out_a * 255.0f), 0L, 255L)),
    };
}

} // anonymous namespace

// =============================================================================
// SoftwareImage
// =============================================================================

SoftwareImage::SoftwareImage(std::int32_t width, std::int32_t height)
    : m_width(std::max(width, 0))
    , m_height(std::max(height, 0))
    , m_pixels(static_cast<std::size_t>(m_width) * static_cast<std::size_t>(m_height) * 4, 0)
{}

std::shared_ptr<SoftwareImage> SoftwareImage::create(std::int32_t width, std::int32_t height) {
    if (width <= 0 || height <= 0) {
        return nullptr;
    }
    return std::make_shared<SoftwareImage>(width, height);
}

std::shared_ptr<SoftwareImage> SoftwareImage::create_filled(
    std::int32_t width, std::int32_t height, const Color& color) {
    auto image = create(width, height);
    if (image) {
        image->fill(color);
    }
    return image;
}

std::shared_ptr<IImage> SoftwareImage::sub_image(const IntRect& rect) const {
    IntRect clipped = rect.intersect(bounds());
    if (clipped.is_empty()) {
        return nullptr;
    }

    auto out = std::make_shared<SoftwareImage>(clipped.width(), clipped.height());
    for (std::int32_t y = 0; y < clipped.height(); ++y) {
        for (std::int32_t x = 0; x < clipped.width(); ++x) {
            out->set_pixel(x, y, pixel_at(clipped.min_x + x, clipped.min_y + y));
        }
    }
    return out;
}

Color SoftwareImage::pixel_at(std::int32_t x, std::int32_t y) const {
    if (x < 0 || y < 0 || x >= m_width || y >= m_height) {
        return Color::transparent();
    }
    std::size_t idx = (static_cast<std::size_t>(y) * m_width + x) * 4;
    return Color{m_pixels[idx + 0], m_pixels[idx + 1], m_pixels[idx + 2], m_pixels[idx + 3]};
}

void SoftwareImage::set_pixel(std::int32_t x, std::int32_t y, const Color& color) {
    if (x < 0 || y < 0 || x >= m_width || y >= m_height) {
        return;
    }
    std::size_t idx = (static_cast<std::size_t>(y) * m_width + x) * 4;
    m_pixels[idx + 0] = color.r;
    m_pixels[idx + 1] = color.g;
    m_pixels[idx + 2] = color.b;
    m_pixels[idx + 3] = color.a;
}

void SoftwareImage::clear() {
    std::fill(m_pixels.begin(), m_pixels.end(), 0);
}

void SoftwareImage::fill(const Color& color) {
    for (std::size_t i = 0; i < m_pixels.size(); i += 4) {
        m_pixels[i + 0] = color.r;
        m_pixels[i + 1] = color.g;
        m_pixels[i + 2] = color.b;
        m_pixels[i + 3] = color.a;
    }
}

void SoftwareImage::draw_image(const IImage& src, float dx, float dy, float alpha) {
    alpha = std::clamp(alpha, 0.0f, 1.0f);
    if (alpha <= 0.0f) {
        return;
    }

    auto ox = static_cast<std::int32_t>(std::floor(dx));
    auto oy = static_cast<std::int32_t>(std::floor(dy));

    // Destination pixel bounds, clamped to this image
    std::int32_t x0 = std::max(0, ox);
    std::int32_t y0 = std::max(0, oy);
    std::int32_t x1 = std::min(m_width, ox + src.width());
    std::int32_t y1 = std::min(m_height, oy + src.height());

    for (std::int32_t y = y0; y < y1; ++y) {
        for (std::int32_t x = x0; x < x1; ++x) {
            Color s = src.pixel_at(x - ox, y - oy);
            if (s.a == 0) {
                continue;
            }
            set_pixel(x, y, blend_over(s, pixel_at(x, y), alpha));
        }
    }
}

// =============================================================================
// SoftwareImageFactory
// =============================================================================

std::shared_ptr<IImage> SoftwareImageFactory::create_image(std::int32_t width, std::int32_t height) {
    auto image = SoftwareImage::create(width, height);
    if (image) {
        ++m_created;
    }
    return image;
}

} // namespace tableau_render
