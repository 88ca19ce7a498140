#include "apps/engrave/Engraver.hpp"

#include <filesystem>
#include <iostream>
#include <random>

#include "icon/IconIO.hpp"

namespace fs = std::filesystem;

namespace engrave {

static inline EngraverConfig sanitise(const EngraverConfig& in) {
    EngraverConfig cfg = in;
    if (!(cfg.FILL_OPACITY >= 0.0f)) cfg.FILL_OPACITY = 0.0f;
    if (cfg.FILL_OPACITY > 1.0f) cfg.FILL_OPACITY = 1.0f;
    return cfg;
}

const char* const Engraver::STAGES[Engraver::NUM_STAGES] = {
    "1_fill_tint",
    "1_fill_opacity",
    "2_top_invert",
    "2_top_tint",
    "2_top_blur",
    "2_top_masked",
    "2_top_opacity",
    "3_bottom_tint",
    "3_bottom_blur",
    "3_bottom_masked",
    "3_bottom_opacity",
    "4_fill_over_bottom",
    "4_top_over",
    "4_template_over",
};

const char* Engraver::StatusStr(Status s) {
    switch (s) {
        case Status::OK:             return "OK";
        case Status::EMPTY_MASK:     return "EMPTY_MASK";
        case Status::EMPTY_TEMPLATE: return "EMPTY_TEMPLATE";
        case Status::STAGE_FAILED:   return "STAGE_FAILED";
    }
    return "UNKNOWN";
}

Engraver::Engraver(const EngraverConfig& cfg)
: m_cfg(sanitise(cfg)) {}

bool Engraver::engrave(const img::Image& mask, const img::Image& tmpl,
                       const EngravingInputs& in, img::Image& out) {
    m_status = Status::OK;
    m_op_status = img::OpStatus::OK;
    m_stage = "";

    if (mask.isInfinite() || mask.isEmpty()) return fail(Status::EMPTY_MASK);
    if (tmpl.isInfinite() || tmpl.isEmpty()) return fail(Status::EMPTY_TEMPLATE);

    using namespace img::ops;

    // 1) fill
    img::Image fill_tint, fill;
    if (!stage(0, tint(mask, in.fill, fill_tint), fill_tint)) return false;
    if (!stage(1, applyingOpacity(fill_tint, m_cfg.FILL_OPACITY, fill), fill)) return false;

    // 2) top bezel
    img::Image top_inv, top_tint, top_blur, top_masked, top;
    if (!stage(2, invertedAlphaWhiteBackground(mask, top_inv), top_inv)) return false;
    if (!stage(3, tint(top_inv, in.top.color, top_tint), top_tint)) return false;
    if (!stage(4, blurDown(top_tint, in.top.blur, top_blur), top_blur)) return false;
    if (!stage(5, masked(top_blur, mask, in.top.mask_op, top_masked), top_masked)) return false;
    if (!stage(6, applyingOpacity(top_masked, in.top.opacity, top), top)) return false;

    // 3) bottom bezel
    img::Image bot_tint, bot_blur, bot_masked, bottom;
    if (!stage(7, tint(mask, in.bottom.color, bot_tint), bot_tint)) return false;
    if (!stage(8, blurDown(bot_tint, in.bottom.blur, bot_blur), bot_blur)) return false;
    if (!stage(9, masked(bot_blur, mask, in.bottom.mask_op, bot_masked), bot_masked)) return false;
    if (!stage(10, applyingOpacity(bot_masked, in.bottom.opacity, bottom), bottom)) return false;

    // 4) back to front: bottom, fill, top, template
    img::Image fill_over_bottom, top_over, result;
    if (!stage(11, composite(fill, bottom, img::BlendOp::SOURCE_OVER, fill_over_bottom), fill_over_bottom)) return false;
    if (!stage(12, composite(top, fill_over_bottom, img::BlendOp::SOURCE_OVER, top_over), top_over)) return false;

    img::Image stacked;
    const img::OpStatus st = composite(tmpl, top_over, img::BlendOp::SOURCE_OVER, stacked);
    if (st == img::OpStatus::OK) result = stacked.cropped(tmpl.extent());
    if (!stage(13, st, result)) return false;

    if (m_cfg.verbose) {
        std::cout << "[ENGRAVE] " << result.pixelWidth() << "x" << result.pixelHeight() << " done\n";
    }
    out = result;
    return true;
}

bool Engraver::stage(std::size_t idx, img::OpStatus st, const img::Image& result) {
    m_stage = STAGES[idx];
    if (st != img::OpStatus::OK) {
        m_op_status = st;
        std::cerr << "[ENGRAVE] ERROR: stage " << m_stage << " failed: " << img::OpStatusStr(st) << "\n";
        return fail(Status::STAGE_FAILED);
    }
    if (m_cfg.sink) m_cfg.sink(m_stage, result);
    return true;
}

bool Engraver::fail(Status s) {
    m_status = s;
    return false;
}

// -------------------- DebugDumpSink --------------------

DebugDumpSink::DebugDumpSink(const std::string& tmp_dir) {
    std::random_device rd;
    std::mt19937 gen(rd());
    std::uniform_int_distribution<int> dist(1000, 10000);
    m_run_id = dist(gen);

    std::error_code ec;
    fs::path base = tmp_dir.empty() ? fs::temp_directory_path(ec) : fs::path(tmp_dir);
    if (ec) base = "/tmp";

    const fs::path dir = base / ("engrave_debug_" + std::to_string(m_run_id));
    m_dir = dir.string();

    fs::create_directories(dir, ec);
    m_dir_ok = !ec;
    if (!m_dir_ok) {
        std::cerr << "[ENGRAVE] debug dump disabled, could not create " << m_dir << ": " << ec.message() << "\n";
    }
}

void DebugDumpSink::operator()(const char* stage, const img::Image& image) const {
    if (!m_dir_ok) return;

    const std::string name = "step_" + std::string(stage) + "_" + std::to_string(m_run_id) + ".png";
    const std::string path = (fs::path(m_dir) / name).string();

    const icon::IoStatus st = icon::writePng(image, path);
    if (st != icon::IoStatus::OK) {
        std::cerr << "[ENGRAVE] debug dump " << path << " failed: " << icon::IoStatusStr(st) << "\n";
    }
}

} // namespace engrave
