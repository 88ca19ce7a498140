#include "apps/trim/GpuBoundsReducer.hpp"

#include <chrono>
#include <cstdint>
#include <iostream>
#include <limits>

namespace trim {

static constexpr uint32_t BOX_SENTINEL = std::numeric_limits<uint32_t>::max();

GpuBoundsReducer::GpuBoundsReducer(const gpu::ComputeRuntime& runtime,
                                   const BoundsReducerConfig& cfg)
: m_runtime(runtime),
  m_cfg(sanitise(cfg)),
  m_threshold_dn(alphaThresholdDN(m_cfg.ALPHA_THRESHOLD)) {}

Status GpuBoundsReducer::boundingBox(const img::Image& image, types::Rect& out) {
    out = types::Rect::Null();
    m_status = Status::OK;

    // Nothing to reduce: no GPU work at all
    if (isDegenerate(image)) return Status::OK;

    if (!m_runtime.ready()) {
        std::cerr << "[TRIM] ERROR: compute runtime not initialized\n";
        return fail(Status::NOT_READY);
    }

    // 1) Render + upload
    cv::Mat host;
    cv::UMat surface;
    try {
        if (!renderSurface(image, host)) {
            std::cerr << "[TRIM] ERROR: could not render image to surface\n";
            return fail(Status::RENDER_FAIL);
        }
        host.copyTo(surface);
    } catch (const cv::Exception& e) {
        std::cerr << "[TRIM] ERROR: surface upload failed: " << e.what() << "\n";
        return fail(Status::RENDER_FAIL);
    }

    // 2) Accumulator: minX, minY, maxX, maxY
    cv::Mat box_host(1, 4, CV_32SC1);
    uint32_t* b = box_host.ptr<uint32_t>(0);
    b[0] = BOX_SENTINEL;
    b[1] = BOX_SENTINEL;
    b[2] = 0;
    b[3] = 0;

    const auto t0 = std::chrono::steady_clock::now();
    try {
        cv::UMat box;
        box_host.copyTo(box);

        cv::ocl::Kernel kernel;
        if (!kernel.create(m_runtime.kernelName().c_str(), m_runtime.program())) {
            std::cerr << "[TRIM] ERROR: could not create kernel `" << m_runtime.kernelName() << "`\n";
            return fail(Status::DISPATCH_FAIL);
        }

        kernel.args(cv::ocl::KernelArg::ReadOnly(surface),
                    cv::ocl::KernelArg::PtrReadWrite(box),
                    m_threshold_dn);

        size_t global[2] = {static_cast<size_t>(host.cols), static_cast<size_t>(host.rows)};
        cv::ocl::Queue q = m_runtime.queue();
        if (!kernel.run(2, global, nullptr, true, q)) {
            std::cerr << "[TRIM] ERROR: kernel dispatch failed\n";
            return fail(Status::DISPATCH_FAIL);
        }

        // 3) Read back (blocking)
        box.copyTo(box_host);
    } catch (const cv::Exception& e) {
        std::cerr << "[TRIM] ERROR: dispatch threw: " << e.what() << "\n";
        return fail(Status::DISPATCH_FAIL);
    }
    const auto t1 = std::chrono::steady_clock::now();
    m_last_dispatch_ms = std::chrono::duration<double, std::milli>(t1 - t0).count();

    const uint32_t* r = box_host.ptr<uint32_t>(0);
    const uint32_t min_x = r[0], min_y = r[1], max_x = r[2], max_y = r[3];

    if (m_cfg.verbose) {
        std::cout << "[TRIM] gpu " << host.cols << "x" << host.rows
                  << " in " << m_last_dispatch_ms << " ms\n";
    }

    // Untouched accumulator: nothing above the threshold
    if (min_x == BOX_SENTINEL || min_x > max_x || min_y > max_y) return Status::OK;

    const types::Rect& e = image.extent();
    out = types::Rect(static_cast<double>(min_x) + e.x,
                      static_cast<double>(min_y) + e.y,
                      static_cast<double>(max_x - min_x + 1),
                      static_cast<double>(max_y - min_y + 1));
    return Status::OK;
}

Status GpuBoundsReducer::fail(Status s) {
    m_status = s;
    return s;
}

} // namespace trim
