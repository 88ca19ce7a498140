#pragma once
#include <cstddef>
#include <cstdint>
#include <vector>

#include "apps/engrave/Engraver.hpp"
#include "apps/trim/BoundsReducer.hpp"

namespace engrave {

// ------------------------------
// Config
// ------------------------------
struct IconMaskerConfig {
    // Silhouette is fitted into the trimmed template, then shrunk by this.
    float MASK_SCALE_RATIO = 2.65f;

    bool TRIM_MASK = true;
    bool TRIM_TEMPLATE = true;

    // true: a failed resolution is logged and dropped (partial output)
    // false: the first failure aborts the run
    bool SKIP_FAILED_RESOLUTIONS = true;

    bool verbose = false;
};

// ---------------------------------------------------------------------------
// IconMasker: engraves one silhouette onto every representation of a
// multi-resolution folder template.
//
// Per template representation: trim it, fit the (trimmed) silhouette into
// the trimmed area, center it there and engrave against the full
// representation. Outputs keep the size and order of the template
// representations. Resolutions are processed one after another.
// ---------------------------------------------------------------------------
class IconMasker {
public:
    enum class Status : uint8_t {
        OK = 0,
        NO_MASK,
        NO_TEMPLATE,
        TRIM_FAIL,
        SCALE_FAIL,
        ENGRAVE_FAIL,
        NO_OUTPUT,        // every resolution failed
    };

    static const char* StatusStr(Status s);

    IconMasker(trim::IBoundsReducer& reducer, Engraver& engraver, const IconMaskerConfig& cfg = {});

    // Largest mask representation is used when there are several.
    bool run(const std::vector<img::Image>& mask_reps,
             const std::vector<img::Image>& template_reps,
             const EngravingInputs& inputs,
             std::vector<img::Image>& out);

    // One template representation; 'mask' is already trimmed (or not).
    bool maskOne(const img::Image& mask, const img::Image& tmpl,
                 const EngravingInputs& inputs, img::Image& out);

    Status lastStatus() const { return m_status; }
    std::size_t failedResolutions() const { return m_failed; }

    const IconMaskerConfig& getConfig() const { return m_cfg; }

private:
    trim::IBoundsReducer& m_reducer;
    Engraver& m_engraver;
    IconMaskerConfig m_cfg{};

    Status m_status = Status::OK;
    std::size_t m_failed = 0;

    bool fail(Status s);
};

} // namespace engrave
