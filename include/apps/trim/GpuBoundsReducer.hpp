#pragma once
#include "apps/trim/BoundsReducer.hpp"
#include "gpu/ComputeRuntime.hpp"

namespace trim {

// ---------------------------------------------------------------------------
// GpuBoundsReducer: one work-item per pixel, atomic min/max into a 4-word box.
//
// Borrows an initialized ComputeRuntime; never creates one. Each call owns its
// surface and accumulator buffers, so distinct reducers (or distinct calls)
// sharing one runtime never touch each other's state. The call blocks until
// the result has been read back.
// ---------------------------------------------------------------------------
class GpuBoundsReducer : public IBoundsReducer {
public:
    explicit GpuBoundsReducer(const gpu::ComputeRuntime& runtime,
                              const BoundsReducerConfig& cfg = {});

    Status boundingBox(const img::Image& image, types::Rect& out) override;
    const char* name() const override { return "gpu"; }

    Status lastStatus() const { return m_status; }

    // Wall time of the last dispatch + wait, in milliseconds.
    double lastDispatchMs() const { return m_last_dispatch_ms; }

private:
    const gpu::ComputeRuntime& m_runtime;
    BoundsReducerConfig m_cfg{};
    int m_threshold_dn = 76;

    Status m_status = Status::OK;
    double m_last_dispatch_ms = 0.0;

    Status fail(Status s);
};

} // namespace trim
