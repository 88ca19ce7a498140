#pragma once
#include <cstddef>
#include <cstdint>
#include <functional>
#include <string>

#include "apps/engrave/EngravingInputs.hpp"
#include "img/Image.hpp"
#include "img/ImageOps.hpp"

namespace engrave {

// Called after every pipeline stage with the stage name and its output.
using StageSink = std::function<void(const char* stage, const img::Image& image)>;

// ------------------------------
// Config
// ------------------------------
struct EngraverConfig {
    // Opacity of the flat fill layer.
    float FILL_OPACITY = 0.5f;

    // Optional per-stage observer (debug dumps); empty = none.
    StageSink sink;

    bool verbose = false;
};

// ---------------------------------------------------------------------------
// Engraver: the fixed engraving effect for one resolution.
//
//   fill   = tint(mask, fill)                         -> opacity(FILL_OPACITY)
//   top    = invertedAlphaWhiteBackground(mask) -> tint(top.color)
//            -> blurDown(top.blur) -> masked(mask, top.mask_op) -> opacity
//   bottom = tint(mask, bottom.color) -> blurDown(bottom.blur)
//            -> masked(mask, bottom.mask_op) -> opacity
//   result = template over (top over (fill over bottom)), cropped to the
//            template extent
//
// Deterministic: identical inputs give bit-identical output. Any failed stage
// aborts the call; 'out' is only written on success.
// ---------------------------------------------------------------------------
class Engraver {
public:
    enum class Status : uint8_t {
        OK = 0,
        EMPTY_MASK,
        EMPTY_TEMPLATE,
        STAGE_FAILED,     // see lastStage() / lastOpStatus()
    };

    static const char* StatusStr(Status s);

    // Stage names, in the order the sink sees them.
    static constexpr std::size_t NUM_STAGES = 14;
    static const char* const STAGES[NUM_STAGES];

    explicit Engraver(const EngraverConfig& cfg = {});

    bool engrave(const img::Image& mask, const img::Image& tmpl,
                 const EngravingInputs& inputs, img::Image& out);

    Status lastStatus() const { return m_status; }
    img::OpStatus lastOpStatus() const { return m_op_status; }
    const char* lastStage() const { return m_stage; }

    const EngraverConfig& getConfig() const { return m_cfg; }

private:
    EngraverConfig m_cfg{};

    Status m_status = Status::OK;
    img::OpStatus m_op_status = img::OpStatus::OK;
    const char* m_stage = "";

    // Record stage result, notify the sink. False if the stage failed.
    bool stage(std::size_t idx, img::OpStatus st, const img::Image& result);
    bool fail(Status s);
};

// ---------------------------------------------------------------------------
// DebugDumpSink: writes every stage to
//   <tmp>/engrave_debug_<runId>/step_<stage>_<runId>.png
// runId is random in [1000, 10000], drawn once per sink. Write failures are
// logged and otherwise ignored.
// ---------------------------------------------------------------------------
class DebugDumpSink {
public:
    explicit DebugDumpSink(const std::string& tmp_dir = "");

    void operator()(const char* stage, const img::Image& image) const;

    int runId() const { return m_run_id; }
    const std::string& dir() const { return m_dir; }

private:
    int m_run_id = 0;
    std::string m_dir;
    bool m_dir_ok = false;
};

} // namespace engrave
