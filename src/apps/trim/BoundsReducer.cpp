#include "apps/trim/BoundsReducer.hpp"

#include <algorithm>
#include <cmath>
#include <iostream>
#include <limits>

namespace trim {

BoundsReducerConfig sanitise(const BoundsReducerConfig& in) {
    BoundsReducerConfig cfg = in;

    if (!(cfg.ALPHA_THRESHOLD >= 0.0f)) cfg.ALPHA_THRESHOLD = 0.0f;   // also catches NaN
    if (cfg.ALPHA_THRESHOLD > 1.0f) cfg.ALPHA_THRESHOLD = 1.0f;

    return cfg;
}

const char* StatusStr(Status s) {
    switch (s) {
        case Status::OK:               return "OK";
        case Status::NOT_READY:        return "NOT_READY";
        case Status::RENDER_FAIL:      return "RENDER_FAIL";
        case Status::DISPATCH_FAIL:    return "DISPATCH_FAIL";
        case Status::WRITE_FAIL:       return "WRITE_FAIL";
        case Status::CLI_SPAWN_FAIL:   return "CLI_SPAWN_FAIL";
        case Status::CLI_NONZERO_EXIT: return "CLI_NONZERO_EXIT";
        case Status::CLI_BAD_OUTPUT:   return "CLI_BAD_OUTPUT";
    }
    return "UNKNOWN";
}

int alphaThresholdDN(float alpha_threshold) {
    const float t = std::max(0.0f, std::min(1.0f, alpha_threshold));
    return static_cast<int>(std::floor(t * 255.0f));
}

bool isDegenerate(const img::Image& image) {
    const types::Rect& e = image.extent();
    if (e.isInfinite() || e.isEmpty()) return true;
    return std::ceil(e.width) < 1.0 || std::ceil(e.height) < 1.0;
}

bool renderSurface(const img::Image& image, cv::Mat& rgba8) {
    if (isDegenerate(image)) return false;

    const types::Rect& e = image.extent();
    const img::Image shifted = image.translated(-e.x, -e.y);
    return shifted.renderRGBA8(rgba8);
}

Status trimImage(IBoundsReducer& reducer, const img::Image& image, img::Image& out) {
    types::Rect box;
    const Status st = reducer.boundingBox(image, box);
    if (st != Status::OK) return st;

    out = image.cropped(box);   // null box -> unchanged
    return Status::OK;
}

// -------------------- CpuBoundsReducer --------------------

CpuBoundsReducer::CpuBoundsReducer(const BoundsReducerConfig& cfg)
: m_cfg(sanitise(cfg)), m_threshold_dn(alphaThresholdDN(m_cfg.ALPHA_THRESHOLD)) {}

Status CpuBoundsReducer::boundingBox(const img::Image& image, types::Rect& out) {
    out = types::Rect::Null();
    if (isDegenerate(image)) return Status::OK;

    cv::Mat surface;
    try {
        if (!renderSurface(image, surface)) return Status::RENDER_FAIL;
    } catch (const cv::Exception& e) {
        std::cerr << "[TRIM] ERROR: render failed: " << e.what() << "\n";
        return Status::RENDER_FAIL;
    }

    uint32_t min_x = std::numeric_limits<uint32_t>::max();
    uint32_t min_y = std::numeric_limits<uint32_t>::max();
    uint32_t max_x = 0;
    uint32_t max_y = 0;

    for (int v = 0; v < surface.rows; ++v) {
        const cv::Vec4b* row = surface.ptr<cv::Vec4b>(v);
        for (int u = 0; u < surface.cols; ++u) {
            if (static_cast<int>(row[u][3]) <= m_threshold_dn) continue;
            min_x = std::min(min_x, static_cast<uint32_t>(u));
            min_y = std::min(min_y, static_cast<uint32_t>(v));
            max_x = std::max(max_x, static_cast<uint32_t>(u));
            max_y = std::max(max_y, static_cast<uint32_t>(v));
        }
    }

    if (min_x == std::numeric_limits<uint32_t>::max() || min_x > max_x || min_y > max_y) {
        return Status::OK;   // fully transparent
    }

    const types::Rect& e = image.extent();
    out = types::Rect(static_cast<double>(min_x) + e.x,
                      static_cast<double>(min_y) + e.y,
                      static_cast<double>(max_x - min_x + 1),
                      static_cast<double>(max_y - min_y + 1));
    return Status::OK;
}

} // namespace trim
