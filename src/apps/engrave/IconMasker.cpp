#include "apps/engrave/IconMasker.hpp"

#include <chrono>
#include <cmath>
#include <iostream>

namespace engrave {

static inline IconMaskerConfig sanitise(const IconMaskerConfig& in) {
    IconMaskerConfig cfg = in;
    if (!(cfg.MASK_SCALE_RATIO > 0.0f) || !std::isfinite(cfg.MASK_SCALE_RATIO)) {
        cfg.MASK_SCALE_RATIO = IconMaskerConfig{}.MASK_SCALE_RATIO;
    }
    return cfg;
}

static double area(const img::Image& im) {
    return static_cast<double>(im.pixelWidth()) * static_cast<double>(im.pixelHeight());
}

const char* IconMasker::StatusStr(Status s) {
    switch (s) {
        case Status::OK:           return "OK";
        case Status::NO_MASK:      return "NO_MASK";
        case Status::NO_TEMPLATE:  return "NO_TEMPLATE";
        case Status::TRIM_FAIL:    return "TRIM_FAIL";
        case Status::SCALE_FAIL:   return "SCALE_FAIL";
        case Status::ENGRAVE_FAIL: return "ENGRAVE_FAIL";
        case Status::NO_OUTPUT:    return "NO_OUTPUT";
    }
    return "UNKNOWN";
}

IconMasker::IconMasker(trim::IBoundsReducer& reducer, Engraver& engraver, const IconMaskerConfig& cfg)
: m_reducer(reducer), m_engraver(engraver), m_cfg(sanitise(cfg)) {}

bool IconMasker::run(const std::vector<img::Image>& mask_reps,
                     const std::vector<img::Image>& template_reps,
                     const EngravingInputs& inputs,
                     std::vector<img::Image>& out) {
    out.clear();
    m_status = Status::OK;
    m_failed = 0;

    // 1) Pick the mask
    const img::Image* mask = nullptr;
    for (const img::Image& m : mask_reps) {
        if (m.isInfinite() || m.isEmpty()) continue;
        if (!mask || area(m) > area(*mask)) mask = &m;
    }
    if (!mask) {
        std::cerr << "[MASKER] ERROR: no usable mask representation\n";
        return fail(Status::NO_MASK);
    }
    if (template_reps.empty()) {
        std::cerr << "[MASKER] ERROR: template has no representations\n";
        return fail(Status::NO_TEMPLATE);
    }

    // 2) Trim it once
    img::Image trimmed = *mask;
    if (m_cfg.TRIM_MASK) {
        const trim::Status st = trim::trimImage(m_reducer, *mask, trimmed);
        if (st != trim::Status::OK) {
            std::cerr << "[MASKER] ERROR: mask trim (" << m_reducer.name() << ") failed: "
                      << trim::StatusStr(st) << "\n";
            return fail(Status::TRIM_FAIL);
        }
    }
    if (m_cfg.verbose) {
        std::cout << "[MASKER] mask " << mask->pixelWidth() << "x" << mask->pixelHeight()
                  << " -> " << trimmed.pixelWidth() << "x" << trimmed.pixelHeight() << "\n";
    }

    // 3) Every template resolution
    for (const img::Image& tmpl : template_reps) {
        const auto t0 = std::chrono::steady_clock::now();

        img::Image engraved;
        if (!maskOne(trimmed, tmpl, inputs, engraved)) {
            ++m_failed;
            std::cerr << "[MASKER] resolution " << tmpl.pixelWidth() << "x" << tmpl.pixelHeight()
                      << " failed: " << StatusStr(m_status) << "\n";
            if (!m_cfg.SKIP_FAILED_RESOLUTIONS) return false;
            continue;
        }
        out.push_back(engraved);

        if (m_cfg.verbose) {
            const auto t1 = std::chrono::steady_clock::now();
            std::cout << "[MASKER] " << tmpl.pixelWidth() << "x" << tmpl.pixelHeight() << " in "
                      << std::chrono::duration<double, std::milli>(t1 - t0).count() << " ms\n";
        }
    }

    if (out.empty()) {
        std::cerr << "[MASKER] ERROR: all " << template_reps.size() << " resolutions failed\n";
        return fail(Status::NO_OUTPUT);
    }
    m_status = Status::OK;
    return true;
}

bool IconMasker::maskOne(const img::Image& mask, const img::Image& tmpl,
                         const EngravingInputs& inputs, img::Image& out) {
    if (tmpl.isInfinite() || tmpl.isEmpty()) return fail(Status::NO_TEMPLATE);

    // a) Content area of the template
    img::Image crop = tmpl;
    if (m_cfg.TRIM_TEMPLATE) {
        const trim::Status st = trim::trimImage(m_reducer, tmpl, crop);
        if (st != trim::Status::OK) {
            std::cerr << "[MASKER] ERROR: template trim failed: " << trim::StatusStr(st) << "\n";
            return fail(Status::TRIM_FAIL);
        }
    }

    // b) Fit + center the silhouette over it
    const types::Rect& ce = crop.extent();
    img::Image fitted, centered;
    img::OpStatus st = img::ops::scaled(mask, ce.width, ce.height, m_cfg.MASK_SCALE_RATIO, fitted);
    if (st == img::OpStatus::OK) st = img::ops::centering(fitted, crop, centered);
    if (st != img::OpStatus::OK) {
        std::cerr << "[MASKER] ERROR: fitting mask into " << ce.width << "x" << ce.height
                  << " failed: " << img::OpStatusStr(st) << "\n";
        return fail(Status::SCALE_FAIL);
    }

    // c) Engrave against the whole representation
    if (!m_engraver.engrave(centered, tmpl, inputs, out)) {
        std::cerr << "[MASKER] ERROR: engrave failed at " << m_engraver.lastStage() << ": "
                  << Engraver::StatusStr(m_engraver.lastStatus()) << "\n";
        return fail(Status::ENGRAVE_FAIL);
    }
    return true;
}

bool IconMasker::fail(Status s) {
    m_status = s;
    return false;
}

} // namespace engrave
