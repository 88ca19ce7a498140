// ComputeRuntime.cpp
#include "gpu/ComputeRuntime.hpp"

#include <fstream>
#include <iostream>
#include <iterator>
#include <vector>

namespace {

static bool read_file(const std::string& path, std::string& out) {
    std::ifstream file(path, std::ios::binary);
    if (!file.is_open()) return false;
    out.assign(std::istreambuf_iterator<char>(file), std::istreambuf_iterator<char>());
    return true;
}

} // anonymous namespace

namespace gpu {

static inline ComputeRuntimeConfig sanitise(const ComputeRuntimeConfig& in) {
    ComputeRuntimeConfig cfg = in;

    if (cfg.kernel_dir.empty()) cfg.kernel_dir = ICONIC_KERNEL_DIR;
    if (cfg.source_file.empty()) cfg.source_file = "bounding_box.cl";
    if (cfg.kernel_name.empty()) cfg.kernel_name = "find_bounding_box";

    // No place to cache to
    if (cfg.binary_file.empty()) cfg.cache_binary = false;

    return cfg;
}

const char* ComputeRuntime::StatusStr(Status s) {
    switch (s) {
        case Status::OK:                    return "OK";
        case Status::NOT_INITIALIZED:       return "NOT_INITIALIZED";
        case Status::NO_DEVICE:             return "NO_DEVICE";
        case Status::QUEUE_CREATE_FAIL:     return "QUEUE_CREATE_FAIL";
        case Status::KERNEL_SOURCE_MISSING: return "KERNEL_SOURCE_MISSING";
        case Status::KERNEL_COMPILE_FAIL:   return "KERNEL_COMPILE_FAIL";
        case Status::KERNEL_CREATE_FAIL:    return "KERNEL_CREATE_FAIL";
    }
    return "UNKNOWN";
}

ComputeRuntime::ComputeRuntime(const ComputeRuntimeConfig& cfg)
: m_cfg(sanitise(cfg)) {}

ComputeRuntime::Status ComputeRuntime::initialize() {
    if (m_ready) return Status::OK;

    m_status = Status::OK;
    m_build_log.clear();
    m_from_binary = false;

    if (!openDevice()) return m_status;
    if (!openQueue()) return m_status;

    // Precompiled binary first, source text second
    if (!loadProgramBinary()) {
        if (!buildProgramSource()) return m_status;
        if (m_cfg.cache_binary) cacheProgramBinary();
    }

    if (!createKernel()) return m_status;

    m_ready = true;
    if (m_cfg.verbose) {
        std::cout << "[GPU] Runtime ready: device=\"" << m_device.name() << "\""
                  << " kernel=" << m_cfg.kernel_name
                  << (m_from_binary ? " (binary)" : " (source)") << "\n";
    }
    return Status::OK;
}

// -------------------- private helpers --------------------

bool ComputeRuntime::openDevice() {
    if (!cv::ocl::haveOpenCL()) {
        std::cerr << "[GPU] ERROR: no OpenCL runtime available\n";
        return fail(Status::NO_DEVICE);
    }
    cv::ocl::setUseOpenCL(true);

    try {
        m_context = cv::ocl::Context::getDefault(true);
        if (m_context.ptr() == nullptr || m_context.ndevices() == 0) {
            std::cerr << "[GPU] ERROR: could not create an OpenCL context\n";
            return fail(Status::NO_DEVICE);
        }

        m_device = cv::ocl::Device::getDefault();
        if (m_device.ptr() == nullptr || !m_device.available()) {
            std::cerr << "[GPU] ERROR: default OpenCL device is not available\n";
            return fail(Status::NO_DEVICE);
        }
    } catch (const cv::Exception& e) {
        std::cerr << "[GPU] ERROR: device init threw: " << e.what() << "\n";
        return fail(Status::NO_DEVICE);
    }
    return true;
}

bool ComputeRuntime::openQueue() {
    try {
        m_queue = cv::ocl::Queue::getDefault();
    } catch (const cv::Exception& e) {
        std::cerr << "[GPU] ERROR: queue creation threw: " << e.what() << "\n";
        return fail(Status::QUEUE_CREATE_FAIL);
    }
    if (m_queue.ptr() == nullptr) {
        std::cerr << "[GPU] ERROR: could not create command queue\n";
        return fail(Status::QUEUE_CREATE_FAIL);
    }
    return true;
}

bool ComputeRuntime::loadProgramBinary() {
    if (m_cfg.binary_file.empty()) return false;

    std::string blob;
    if (!read_file(binaryPath(), blob) || blob.empty()) return false;

    try {
        const cv::ocl::ProgramSource src = cv::ocl::ProgramSource::fromBinary(
            "iconic", m_cfg.kernel_name,
            reinterpret_cast<const unsigned char*>(blob.data()), blob.size());

        cv::String errmsg;
        m_program = m_context.getProg(src, "", errmsg);
        if (m_program.ptr() == nullptr) {
            // Stale binary (driver upgrade, other device): rebuild from source
            std::cerr << "[GPU] Cached kernel binary rejected, rebuilding from source\n";
            return false;
        }
    } catch (const cv::Exception& e) {
        std::cerr << "[GPU] Cached kernel binary unusable: " << e.what() << "\n";
        return false;
    }

    m_from_binary = true;
    return true;
}

bool ComputeRuntime::buildProgramSource() {
    std::string code;
    if (!read_file(sourcePath(), code) || code.empty()) {
        std::cerr << "[GPU] ERROR: kernel source not found at " << sourcePath() << "\n";
        return fail(Status::KERNEL_SOURCE_MISSING);
    }

    try {
        const cv::ocl::ProgramSource src("iconic", m_cfg.kernel_name, code, "");
        cv::String errmsg;
        m_program = m_context.getProg(src, "", errmsg);
        if (m_program.ptr() == nullptr) {
            m_build_log = errmsg;
            std::cerr << "[GPU] ERROR: kernel build failed:\n" << m_build_log << "\n";
            return fail(Status::KERNEL_COMPILE_FAIL);
        }
    } catch (const cv::Exception& e) {
        m_build_log = e.what();
        std::cerr << "[GPU] ERROR: kernel build threw: " << e.what() << "\n";
        return fail(Status::KERNEL_COMPILE_FAIL);
    }
    return true;
}

bool ComputeRuntime::createKernel() {
    if (!m_kernel.create(m_cfg.kernel_name.c_str(), m_program)) {
        std::cerr << "[GPU] ERROR: kernel `" << m_cfg.kernel_name << "` not found in program\n";
        return fail(Status::KERNEL_CREATE_FAIL);
    }
    return true;
}

// Write failures are logged only; the next run compiles from source.
void ComputeRuntime::cacheProgramBinary() {
    std::vector<char> blob;
    try {
        m_program.getBinary(blob);
    } catch (const cv::Exception& e) {
        std::cerr << "[GPU] Could not fetch program binary: " << e.what() << "\n";
        return;
    }
    if (blob.empty()) return;

    std::ofstream file(binaryPath(), std::ios::binary | std::ios::trunc);
    if (!file.is_open()) {
        std::cerr << "[GPU] Could not cache kernel binary at " << binaryPath() << "\n";
        return;
    }
    file.write(blob.data(), static_cast<std::streamsize>(blob.size()));
}

std::string ComputeRuntime::sourcePath() const {
    return m_cfg.kernel_dir + "/" + m_cfg.source_file;
}

std::string ComputeRuntime::binaryPath() const {
    return m_cfg.kernel_dir + "/" + m_cfg.binary_file;
}

bool ComputeRuntime::fail(Status s) {
    m_status = s;
    return false;
}

} // namespace gpu
