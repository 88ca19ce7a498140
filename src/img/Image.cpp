#include "img/Image.hpp"

#include <cmath>
#include <opencv2/imgproc.hpp>

namespace {

static bool is_integral(double v) {
    return std::fabs(v - std::round(v)) < 1e-9;
}

// straight RGBA8 -> premultiplied RGBA float
static cv::Mat premultiply_u8(const cv::Mat& rgba8) {
    cv::Mat out(rgba8.rows, rgba8.cols, CV_32FC4);
    for (int v = 0; v < rgba8.rows; ++v) {
        const cv::Vec4b* src = rgba8.ptr<cv::Vec4b>(v);
        cv::Vec4f* dst = out.ptr<cv::Vec4f>(v);
        for (int u = 0; u < rgba8.cols; ++u) {
            const float a = src[u][3] / 255.0f;
            dst[u][0] = (src[u][0] / 255.0f) * a;
            dst[u][1] = (src[u][1] / 255.0f) * a;
            dst[u][2] = (src[u][2] / 255.0f) * a;
            dst[u][3] = a;
        }
    }
    return out;
}

// premultiplied RGBA float -> straight RGBA8
static cv::Mat unpremultiply_u8(const cv::Mat& rgba32f) {
    cv::Mat out(rgba32f.rows, rgba32f.cols, CV_8UC4);
    for (int v = 0; v < rgba32f.rows; ++v) {
        const cv::Vec4f* src = rgba32f.ptr<cv::Vec4f>(v);
        cv::Vec4b* dst = out.ptr<cv::Vec4b>(v);
        for (int u = 0; u < rgba32f.cols; ++u) {
            const float a = src[u][3];
            if (a <= 0.0f) {
                dst[u] = cv::Vec4b(0, 0, 0, 0);
                continue;
            }
            const float inv = 1.0f / a;
            dst[u][0] = cv::saturate_cast<uchar>(src[u][0] * inv * 255.0f);
            dst[u][1] = cv::saturate_cast<uchar>(src[u][1] * inv * 255.0f);
            dst[u][2] = cv::saturate_cast<uchar>(src[u][2] * inv * 255.0f);
            dst[u][3] = cv::saturate_cast<uchar>(a * 255.0f);
        }
    }
    return out;
}

} // anonymous namespace

namespace img {

Image Image::fromRGBA8(const cv::Mat& rgba) {
    if (rgba.empty() || rgba.depth() != CV_8U) return Image();

    cv::Mat rgba8;
    switch (rgba.channels()) {
        case 4: rgba8 = rgba; break;
        case 3: cv::cvtColor(rgba, rgba8, cv::COLOR_RGB2RGBA); break;
        case 1: cv::cvtColor(rgba, rgba8, cv::COLOR_GRAY2RGBA); break;
        default: return Image();
    }

    return fromPremultiplied(premultiply_u8(rgba8), cv::Point2d(0.0, 0.0));
}

Image Image::fromPremultiplied(const cv::Mat& rgba32f, const cv::Point2d& origin) {
    Image im;
    if (rgba32f.empty() || rgba32f.type() != CV_32FC4) return im;

    im.m_pixels = std::make_shared<const cv::Mat>(rgba32f.clone());
    im.m_origin = origin;
    im.m_extent = types::Rect(origin.x, origin.y, rgba32f.cols, rgba32f.rows);
    return im;
}

Image Image::solid(const types::Color& c) {
    Image im;
    im.m_is_solid = true;
    im.m_color = c;
    im.m_extent = types::Rect::Infinite();
    return im;
}

int Image::pixelWidth() const {
    if (m_extent.isInfinite() || m_extent.isNull()) return 0;
    return static_cast<int>(m_extent.integral().width);
}

int Image::pixelHeight() const {
    if (m_extent.isInfinite() || m_extent.isNull()) return 0;
    return static_cast<int>(m_extent.integral().height);
}

Image Image::cropped(const types::Rect& r) const {
    if (r.isNull()) return *this;

    Image im = *this;
    const types::Rect clipped = m_extent.intersect(r);
    if (clipped.isNull()) {
        // disjoint: keep the location, drop the area
        im.m_extent = r.isInfinite() ? types::Rect::Null()
                                     : types::Rect(r.x, r.y, 0.0, 0.0);
    } else {
        im.m_extent = clipped;
    }
    return im;
}

Image Image::translated(double dx, double dy) const {
    Image im = *this;
    im.m_origin.x += dx;
    im.m_origin.y += dy;
    im.m_extent = m_extent.translated(dx, dy);
    return im;
}

Image Image::withExtent(const types::Rect& r) const {
    Image im = *this;
    im.m_extent = r;
    return im;
}

bool Image::render(const types::Rect& bounds, cv::Mat& out) const {
    if (bounds.isInfinite() || bounds.isNull()) return false;

    const types::Rect b = bounds.integral();
    const int w = static_cast<int>(b.width);
    const int h = static_cast<int>(b.height);

    out = cv::Mat(h, w, CV_32FC4, cv::Scalar::all(0.0));
    if (w == 0 || h == 0) return true;

    // Part of the output grid covered by our extent
    const types::Rect visible = m_extent.intersect(b);
    if (visible.isNull() || visible.isEmpty()) return true;

    const types::Rect vi = visible.integral();
    cv::Rect roi(static_cast<int>(vi.x - b.x), static_cast<int>(vi.y - b.y),
                 static_cast<int>(vi.width), static_cast<int>(vi.height));
    roi &= cv::Rect(0, 0, w, h);
    if (roi.empty()) return true;

    if (m_is_solid) {
        const float a = m_color.a;
        out(roi).setTo(cv::Scalar(m_color.r * a, m_color.g * a, m_color.b * a, a));
        return true;
    }

    if (!m_pixels || m_pixels->empty()) return true;

    // Where backing pixel (0,0) lands in the output grid
    const double dx = m_origin.x - b.x;
    const double dy = m_origin.y - b.y;

    cv::Mat placed(h, w, CV_32FC4, cv::Scalar::all(0.0));
    if (is_integral(dx) && is_integral(dy)) {
        const cv::Rect dst(static_cast<int>(std::lround(dx)), static_cast<int>(std::lround(dy)),
                           m_pixels->cols, m_pixels->rows);
        const cv::Rect clip = dst & cv::Rect(0, 0, w, h);
        if (!clip.empty()) {
            (*m_pixels)(clip - dst.tl()).copyTo(placed(clip));
        }
    } else {
        // Sub-pixel placement: bilinear resample, transparent outside
        const cv::Mat M = (cv::Mat_<double>(2, 3) << 1.0, 0.0, dx,
                                                     0.0, 1.0, dy);
        cv::warpAffine(*m_pixels, placed, M, cv::Size(w, h),
                       cv::INTER_LINEAR, cv::BORDER_CONSTANT, cv::Scalar::all(0.0));
    }

    placed(roi).copyTo(out(roi));
    return true;
}

bool Image::renderRGBA8(cv::Mat& out) const {
    if (isInfinite() || isEmpty()) return false;

    cv::Mat premul;
    if (!render(m_extent, premul)) return false;
    out = unpremultiply_u8(premul);
    return true;
}

} // namespace img
