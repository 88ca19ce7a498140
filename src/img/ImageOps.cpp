#include "img/ImageOps.hpp"

#include <algorithm>
#include <cctype>
#include <cmath>
#include <iostream>
#include <opencv2/imgproc.hpp>

namespace {

using img::Image;
using img::OpStatus;

static inline float clamp01(float v) {
    return std::max(0.0f, std::min(1.0f, v));
}

// Keep premultiplied invariants after any arithmetic: 0 <= c <= a <= 1
static inline cv::Vec4f normalise(cv::Vec4f p) {
    p[3] = clamp01(p[3]);
    p[0] = std::min(clamp01(p[0]), p[3]);
    p[1] = std::min(clamp01(p[1]), p[3]);
    p[2] = std::min(clamp01(p[2]), p[3]);
    return p;
}

static OpStatus require_finite(const Image& in, const char* filter) {
    if (in.isInfinite()) {
        std::cerr << "[OPS] " << filter << " rejected: infinite extent\n";
        return OpStatus::INFINITE_EXTENT;
    }
    return OpStatus::OK;
}

static OpStatus filter_failed(const char* filter, const cv::Exception& e) {
    std::cerr << "[OPS] " << filter << " failed: " << e.what() << "\n";
    return OpStatus::FILTER_FAILED;
}

static Image from_grid(const cv::Mat& premul, const types::Rect& bounds) {
    return Image::fromPremultiplied(premul, cv::Point2d(bounds.x, bounds.y));
}

// Render both layers on the same grid and combine them pixel by pixel.
// fn(S, D) receives premultiplied top (S) and bottom (D).
template <typename Fn>
static OpStatus combine(const Image& top, const Image& bottom, const types::Rect& bounds,
                        const char* filter, Fn fn, Image& out) {
    if (bounds.isNull() || bounds.isEmpty()) {
        out = Image().withExtent(types::Rect(0.0, 0.0, 0.0, 0.0));
        return OpStatus::OK;
    }

    const types::Rect grid = bounds.integral();
    try {
        cv::Mat S, D;
        if (!top.render(grid, S) || !bottom.render(grid, D)) {
            std::cerr << "[OPS] " << filter << " failed: could not render layers\n";
            return OpStatus::FILTER_FAILED;
        }

        cv::Mat R(S.rows, S.cols, CV_32FC4);
        for (int v = 0; v < S.rows; ++v) {
            const cv::Vec4f* s = S.ptr<cv::Vec4f>(v);
            const cv::Vec4f* d = D.ptr<cv::Vec4f>(v);
            cv::Vec4f* r = R.ptr<cv::Vec4f>(v);
            for (int u = 0; u < S.cols; ++u) {
                r[u] = normalise(fn(s[u], d[u]));
            }
        }
        out = from_grid(R, grid);
    } catch (const cv::Exception& e) {
        return filter_failed(filter, e);
    }
    return OpStatus::OK;
}

// Apply fn(p) to every pixel of 'in' over its own extent.
template <typename Fn>
static OpStatus map_pixels(const Image& in, const char* filter, Fn fn, Image& out) {
    const OpStatus st = require_finite(in, filter);
    if (st != OpStatus::OK) return st;

    if (in.isEmpty()) {
        out = in;
        return OpStatus::OK;
    }

    const types::Rect grid = in.extent().integral();
    try {
        cv::Mat P;
        if (!in.render(grid, P)) return OpStatus::FILTER_FAILED;
        for (int v = 0; v < P.rows; ++v) {
            cv::Vec4f* p = P.ptr<cv::Vec4f>(v);
            for (int u = 0; u < P.cols; ++u) {
                p[u] = normalise(fn(p[u]));
            }
        }
        out = from_grid(P, grid);
    } catch (const cv::Exception& e) {
        return filter_failed(filter, e);
    }
    return OpStatus::OK;
}

// --- Porter-Duff / separable blend kernels (premultiplied) ---

static inline cv::Vec4f source_over(const cv::Vec4f& S, const cv::Vec4f& D) {
    const float k = 1.0f - S[3];
    return cv::Vec4f(S[0] + D[0] * k, S[1] + D[1] * k, S[2] + D[2] * k, S[3] + D[3] * k);
}

static inline float union_alpha(const cv::Vec4f& S, const cv::Vec4f& D) {
    return S[3] + D[3] - S[3] * D[3];
}

static inline cv::Vec4f multiply(const cv::Vec4f& S, const cv::Vec4f& D) {
    cv::Vec4f r;
    for (int c = 0; c < 3; ++c) {
        r[c] = S[c] * D[c] + S[c] * (1.0f - D[3]) + D[c] * (1.0f - S[3]);
    }
    r[3] = union_alpha(S, D);
    return r;
}

static inline cv::Vec4f screen(const cv::Vec4f& S, const cv::Vec4f& D) {
    cv::Vec4f r;
    for (int c = 0; c < 3; ++c) {
        r[c] = S[c] + D[c] - S[c] * D[c];
    }
    r[3] = union_alpha(S, D);
    return r;
}

static inline cv::Vec4f overlay(const cv::Vec4f& S, const cv::Vec4f& D) {
    cv::Vec4f r;
    for (int c = 0; c < 3; ++c) {
        const float mix = (2.0f * D[c] <= D[3])
                              ? 2.0f * S[c] * D[c]
                              : S[3] * D[3] - 2.0f * (D[3] - D[c]) * (S[3] - S[c]);
        r[c] = mix + S[c] * (1.0f - D[3]) + D[c] * (1.0f - S[3]);
    }
    r[3] = union_alpha(S, D);
    return r;
}

static inline cv::Vec4f darken(const cv::Vec4f& S, const cv::Vec4f& D) {
    cv::Vec4f r;
    for (int c = 0; c < 3; ++c) {
        r[c] = std::min(S[c] * D[3], D[c] * S[3]) + S[c] * (1.0f - D[3]) + D[c] * (1.0f - S[3]);
    }
    r[3] = union_alpha(S, D);
    return r;
}

// Premultiplied channels already carry the mask's coverage
static inline float luminance(const cv::Vec4f& p) {
    return img::LUMA_R * p[0] + img::LUMA_G * p[1] + img::LUMA_B * p[2];
}

static inline cv::Vec4f scale(const cv::Vec4f& p, float k) {
    return cv::Vec4f(p[0] * k, p[1] * k, p[2] * k, p[3] * k);
}

} // anonymous namespace

namespace img {

const char* OpStatusStr(OpStatus s) {
    switch (s) {
        case OpStatus::OK:               return "OK";
        case OpStatus::INFINITE_EXTENT:  return "INFINITE_EXTENT";
        case OpStatus::EMPTY_EXTENT:     return "EMPTY_EXTENT";
        case OpStatus::BAD_SCALE:        return "BAD_SCALE";
        case OpStatus::UNKNOWN_OPERATOR: return "UNKNOWN_OPERATOR";
        case OpStatus::FILTER_FAILED:    return "FILTER_FAILED";
    }
    return "UNKNOWN";
}

const char* BlendOpStr(BlendOp op) {
    switch (op) {
        case BlendOp::SOURCE_OVER: return "source-over";
        case BlendOp::MULTIPLY:    return "multiply";
        case BlendOp::SCREEN:      return "screen";
        case BlendOp::OVERLAY:     return "overlay";
        case BlendOp::DARKEN:      return "darken";
    }
    return "unknown";
}

const char* MaskOpStr(MaskOp op) {
    switch (op) {
        case MaskOp::SOURCE_IN:       return "source-in";
        case MaskOp::SOURCE_OUT:      return "source-out";
        case MaskOp::BLEND_WITH_MASK: return "blend-with-mask";
    }
    return "unknown";
}

bool parseMaskOp(const std::string& name, MaskOp& out) {
    std::string n = name;
    std::transform(n.begin(), n.end(), n.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

    if (n == "source-in" || n == "sourcein" || n == "dst-in") {
        out = MaskOp::SOURCE_IN;
        return true;
    }
    if (n == "source-out" || n == "sourceout" || n == "dst-out") {
        out = MaskOp::SOURCE_OUT;
        return true;
    }
    if (n == "blend-with-mask" || n == "blend" || n == "multiply") {
        out = MaskOp::BLEND_WITH_MASK;
        return true;
    }
    return false;
}

bool parseBlendOp(const std::string& name, BlendOp& out) {
    std::string n = name;
    std::transform(n.begin(), n.end(), n.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

    if (n == "source-over" || n == "sourceover") { out = BlendOp::SOURCE_OVER; return true; }
    if (n == "multiply")                         { out = BlendOp::MULTIPLY;    return true; }
    if (n == "screen")                           { out = BlendOp::SCREEN;      return true; }
    if (n == "overlay")                          { out = BlendOp::OVERLAY;     return true; }
    if (n == "darken")                           { out = BlendOp::DARKEN;      return true; }
    return false;
}

namespace ops {

OpStatus tint(const Image& in, const types::Color& color, Image& out) {
    const OpStatus st = require_finite(in, "tint");
    if (st != OpStatus::OK) return st;
    if (in.isEmpty()) return OpStatus::EMPTY_EXTENT;

    const Image colour = Image::solid(color).cropped(in.extent());
    return masked(colour, in, MaskOp::SOURCE_IN, out);
}

OpStatus fillColorize(const Image& in, const types::Color& color, Image& out) {
    Image filled;
    const OpStatus st = tint(in, color, filled);
    if (st != OpStatus::OK) return st;

    out = filled.cropped(in.extent());
    return OpStatus::OK;
}

OpStatus invertedAlphaWhiteBackground(const Image& in, Image& out) {
    // white over clear, weighted by (1 - alpha)
    return map_pixels(in, "invertedAlphaWhiteBackground",
                      [](const cv::Vec4f& p) {
                          const float k = 1.0f - p[3];
                          return cv::Vec4f(k, k, k, k);
                      },
                      out);
}

OpStatus motionBlurDown(const Image& in, uint32_t spread_px, Image& out) {
    const OpStatus st = require_finite(in, "motionBlur");
    if (st != OpStatus::OK) return st;

    if (spread_px == 0 || in.isEmpty()) {
        out = in;
        return OpStatus::OK;
    }

    const double s = static_cast<double>(spread_px);
    const types::Rect src = in.extent().integral();
    const types::Rect grid(src.x, src.y - s, src.width, src.height + 2.0 * s);

    try {
        cv::Mat P;
        if (!in.render(grid, P)) return OpStatus::FILTER_FAILED;

        const int len = 2 * static_cast<int>(spread_px) + 1;
        const cv::Mat k(len, 1, CV_32F, cv::Scalar(1.0 / len));
        cv::Mat B;
        cv::filter2D(P, B, CV_32F, k, cv::Point(-1, -1), 0.0, cv::BORDER_CONSTANT);
        out = from_grid(B, grid);
    } catch (const cv::Exception& e) {
        return filter_failed("motionBlur", e);
    }
    return OpStatus::OK;
}

OpStatus blurDown(const Image& in, const BlurDown& blur, Image& out) {
    Image blurredImg;
    const OpStatus st = motionBlurDown(in, blur.spread_px, blurredImg);
    if (st == OpStatus::FILTER_FAILED) {
        std::cerr << "[OPS] blurDown: motion blur unavailable, continuing unblurred\n";
        blurredImg = in;
    } else if (st != OpStatus::OK) {
        return st;
    }

    out = blurredImg.translated(0.0, static_cast<double>(blur.page_y));
    return OpStatus::OK;
}

OpStatus applyingOpacity(const Image& in, float alpha, Image& out) {
    const float a = clamp01(alpha);
    // premultiplied storage: scaling all four channels keeps straight colour
    return map_pixels(in, "applyingOpacity",
                      [a](const cv::Vec4f& p) { return scale(p, a); },
                      out);
}

OpStatus composite(const Image& top, const Image& background, BlendOp op, Image& out) {
    if (top.isInfinite() || background.isInfinite()) {
        std::cerr << "[OPS] composite(" << BlendOpStr(op) << ") rejected: infinite extent\n";
        return OpStatus::INFINITE_EXTENT;
    }

    const types::Rect bounds = top.extent().unite(background.extent());
    const char* name = BlendOpStr(op);

    switch (op) {
        case BlendOp::SOURCE_OVER: return combine(top, background, bounds, name, source_over, out);
        case BlendOp::MULTIPLY:    return combine(top, background, bounds, name, multiply, out);
        case BlendOp::SCREEN:      return combine(top, background, bounds, name, screen, out);
        case BlendOp::OVERLAY:     return combine(top, background, bounds, name, overlay, out);
        case BlendOp::DARKEN:      return combine(top, background, bounds, name, darken, out);
    }

    std::cerr << "[OPS] composite: unknown blend operator " << static_cast<int>(op) << "\n";
    return OpStatus::UNKNOWN_OPERATOR;
}

OpStatus masked(const Image& in, const Image& mask, MaskOp op, Image& out) {
    if (in.isInfinite() || mask.isInfinite()) {
        std::cerr << "[OPS] masked(" << MaskOpStr(op) << ") rejected: infinite extent\n";
        return OpStatus::INFINITE_EXTENT;
    }

    const char* name = MaskOpStr(op);
    switch (op) {
        case MaskOp::SOURCE_IN:
            return combine(in, mask, in.extent().intersect(mask.extent()), name,
                           [](const cv::Vec4f& S, const cv::Vec4f& D) { return scale(S, D[3]); },
                           out);
        case MaskOp::SOURCE_OUT:
            return combine(in, mask, in.extent(), name,
                           [](const cv::Vec4f& S, const cv::Vec4f& D) { return scale(S, 1.0f - D[3]); },
                           out);
        case MaskOp::BLEND_WITH_MASK:
            return combine(in, mask, in.extent(), name,
                           [](const cv::Vec4f& S, const cv::Vec4f& M) {
                               return scale(S, clamp01(luminance(M)));
                           },
                           out);
    }

    std::cerr << "[OPS] masked: unknown mask operator " << static_cast<int>(op) << "\n";
    return OpStatus::UNKNOWN_OPERATOR;
}

OpStatus scaled(const Image& in, double max_w, double max_h, double ratio, Image& out) {
    const OpStatus st = require_finite(in, "scale");
    if (st != OpStatus::OK) return st;
    if (in.isEmpty()) return OpStatus::EMPTY_EXTENT;

    const types::Rect src = in.extent().integral();
    const double base = std::min(max_w / src.width, max_h / src.height);
    if (!(base > 0.0) || !(ratio > 0.0) || !std::isfinite(base)) {
        std::cerr << "[OPS] scale rejected: base=" << base << " ratio=" << ratio << "\n";
        return OpStatus::BAD_SCALE;
    }

    const double k = base / ratio;
    const int dst_w = std::max(1, static_cast<int>(std::lround(src.width * k)));
    const int dst_h = std::max(1, static_cast<int>(std::lround(src.height * k)));

    try {
        cv::Mat P;
        if (!in.render(src, P)) return OpStatus::FILTER_FAILED;

        cv::Mat R;
        cv::resize(P, R, cv::Size(dst_w, dst_h), 0.0, 0.0, cv::INTER_LANCZOS4);

        // Lanczos rings slightly outside [0,1]
        for (int v = 0; v < R.rows; ++v) {
            cv::Vec4f* r = R.ptr<cv::Vec4f>(v);
            for (int u = 0; u < R.cols; ++u) r[u] = normalise(r[u]);
        }
        out = Image::fromPremultiplied(R, cv::Point2d(src.x * k, src.y * k));
    } catch (const cv::Exception& e) {
        return filter_failed("lanczosScale", e);
    }
    return OpStatus::OK;
}

OpStatus centering(const Image& in, const Image& background, Image& out) {
    if (in.isInfinite() || background.isInfinite()) {
        std::cerr << "[OPS] centering rejected: infinite extent\n";
        return OpStatus::INFINITE_EXTENT;
    }
    if (in.isEmpty() || background.isEmpty()) return OpStatus::EMPTY_EXTENT;

    const types::Rect& be = background.extent();
    const types::Rect& me = in.extent();

    const double tx = be.x + (be.width - me.width) / 2.0 - me.x;
    const double ty = (be.y + (be.height - me.height) / 2.0 - me.y) * VERTICAL_CENTERING_FACTOR;

    out = in.translated(tx, ty);
    return OpStatus::OK;
}

OpStatus blurred(const Image& in, double radius, Image& out) {
    const OpStatus st = require_finite(in, "gaussianBlur");
    if (st != OpStatus::OK) return st;

    const double r = std::max(0.0, radius);
    if (r == 0.0 || in.isEmpty()) {
        out = in;
        return OpStatus::OK;
    }

    const double pad = std::ceil(3.0 * r);
    const types::Rect src = in.extent().integral();
    const types::Rect grid(src.x - pad, src.y - pad, src.width + 2.0 * pad, src.height + 2.0 * pad);

    try {
        cv::Mat P;
        if (!in.render(grid, P)) return OpStatus::FILTER_FAILED;

        cv::Mat B;
        cv::GaussianBlur(P, B, cv::Size(0, 0), r, r, cv::BORDER_CONSTANT);
        out = from_grid(B, grid);
    } catch (const cv::Exception& e) {
        return filter_failed("gaussianBlur", e);
    }
    return OpStatus::OK;
}

OpStatus invertedMask(const Image& in, Image& out) {
    return map_pixels(in, "colorInvert",
                      [](const cv::Vec4f& p) {
                          const float a = p[3];
                          const float ia = 1.0f - a;
                          cv::Vec4f r;
                          for (int c = 0; c < 3; ++c) {
                              const float straight = (a > 0.0f) ? p[c] / a : 0.0f;
                              r[c] = (1.0f - straight) * ia;
                          }
                          r[3] = ia;
                          return r;
                      },
                      out);
}

} // namespace ops
} // namespace img
