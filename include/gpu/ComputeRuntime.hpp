#pragma once
#include <cstdint>
#include <string>

#include <opencv2/core/ocl.hpp>

#ifndef ICONIC_KERNEL_DIR
#define ICONIC_KERNEL_DIR "kernels"
#endif

namespace gpu {

// ------------------------------
// Config
// ------------------------------
struct ComputeRuntimeConfig {
    // Directory holding the kernel source and its cached binary.
    std::string kernel_dir = ICONIC_KERNEL_DIR;

    std::string source_file = "bounding_box.cl";
    std::string binary_file = "bounding_box.bin";   // written after a source build
    std::string kernel_name = "find_bounding_box";

    // Persist the program binary after compiling from source.
    bool cache_binary = true;

    bool verbose = false;
};

// ---------------------------------------------------------------------------
// ComputeRuntime: owns one OpenCL device, one command queue and the compiled
// bounding-box reduction kernel.
//
// Constructed explicitly and passed by reference to whoever needs it; there is
// no process-wide instance. initialize() is idempotent: once it has succeeded,
// further calls return OK without touching the GPU. After initialization the
// runtime is never mutated and may be shared read-only by any number of
// reducers.
//
// Device, queue and kernel live in OpenCV's default OpenCL context so that
// cv::UMat buffers allocated by callers are valid for the kernel.
// ---------------------------------------------------------------------------
class ComputeRuntime {
public:
    enum class Status : uint8_t {
        OK = 0,
        NOT_INITIALIZED,

        // DEVICE
        NO_DEVICE,
        QUEUE_CREATE_FAIL,

        // KERNEL
        KERNEL_SOURCE_MISSING,
        KERNEL_COMPILE_FAIL,
        KERNEL_CREATE_FAIL,
    };

    static const char* StatusStr(Status s);

    explicit ComputeRuntime(const ComputeRuntimeConfig& cfg = {});

    ComputeRuntime(const ComputeRuntime&) = delete;
    ComputeRuntime& operator=(const ComputeRuntime&) = delete;

    // Device -> queue -> program (binary first, then source) -> kernel.
    Status initialize();

    bool ready() const { return m_ready; }
    Status lastStatus() const { return m_status; }

    // Build log of the last failed compile (empty otherwise).
    const std::string& buildLog() const { return m_build_log; }

    // True if the kernel came from the cached binary rather than source.
    bool loadedFromBinary() const { return m_from_binary; }

    const cv::ocl::Device& device() const { return m_device; }
    const cv::ocl::Queue& queue() const { return m_queue; }

    // cv::ocl::Kernel carries its arguments and copies share them, so each
    // dispatch creates its own kernel object from the shared program.
    const cv::ocl::Program& program() const { return m_program; }
    const std::string& kernelName() const { return m_cfg.kernel_name; }

    const ComputeRuntimeConfig& getConfig() const { return m_cfg; }

private:
    ComputeRuntimeConfig m_cfg{};

    cv::ocl::Context m_context;
    cv::ocl::Device  m_device;
    cv::ocl::Queue   m_queue;
    cv::ocl::Program m_program;
    cv::ocl::Kernel  m_kernel;

    bool m_ready = false;
    bool m_from_binary = false;
    Status m_status = Status::NOT_INITIALIZED;
    std::string m_build_log;

    // Setup helpers
    bool openDevice();
    bool openQueue();
    bool loadProgramBinary();
    bool buildProgramSource();
    bool createKernel();
    void cacheProgramBinary();

    std::string sourcePath() const;
    std::string binaryPath() const;

    bool fail(Status s);
};

} // namespace gpu
