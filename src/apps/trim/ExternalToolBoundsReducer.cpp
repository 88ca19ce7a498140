#include "apps/trim/ExternalToolBoundsReducer.hpp"

#include <cerrno>
#include <cstdio>
#include <cstdlib>
#include <cstring>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <iterator>
#include <sstream>
#include <vector>

#include <sys/wait.h>
#include <unistd.h>

#include <opencv2/imgcodecs.hpp>
#include <opencv2/imgproc.hpp>

namespace fs = std::filesystem;

namespace {

// Temp file that is removed when it goes out of scope.
struct TempFile {
    std::string path;
    bool ok = false;

    TempFile(const std::string& dir, const char* suffix) {
        std::string tmpl = dir + "/iconic_trim_XXXXXX" + suffix;
        std::vector<char> buf(tmpl.begin(), tmpl.end());
        buf.push_back('\0');

        const int fd = ::mkstemps(buf.data(), static_cast<int>(std::strlen(suffix)));
        if (fd < 0) return;
        ::close(fd);
        path.assign(buf.data());
        ok = true;
    }

    ~TempFile() {
        if (ok) ::unlink(path.c_str());
    }

    TempFile(const TempFile&) = delete;
    TempFile& operator=(const TempFile&) = delete;
};

static std::string quote_arg(const std::string& arg) {
    std::string q = "'";
    for (char c : arg) {
        if (c == '\'') q += "'\\''";
        else q += c;
    }
    q += "'";
    return q;
}

static std::string read_all(const std::string& path) {
    std::ifstream f(path, std::ios::binary);
    if (!f.is_open()) return {};
    return std::string(std::istreambuf_iterator<char>(f), std::istreambuf_iterator<char>());
}

} // anonymous namespace

namespace trim {

static inline ExternalToolConfig sanitise(const ExternalToolConfig& in) {
    ExternalToolConfig cfg = in;

    if (cfg.argv.empty()) cfg.argv = ExternalToolConfig{}.argv;

    if (cfg.temp_dir.empty()) {
        std::error_code ec;
        const fs::path p = fs::temp_directory_path(ec);
        cfg.temp_dir = ec ? std::string("/tmp") : p.string();
    }
    return cfg;
}

bool parseBoundsOutput(const std::string& text, types::Rect& out) {
    std::istringstream ss(text);
    long v[4] = {0, 0, 0, 0};
    for (long& x : v) {
        if (!(ss >> x)) return false;
    }

    std::string rest;
    if (ss >> rest) return false;   // trailing garbage

    if (v[2] < 0 || v[3] < 0) return false;

    if (v[2] == 0 || v[3] == 0) {
        out = types::Rect::Null();
        return true;
    }
    out = types::Rect(static_cast<double>(v[0]), static_cast<double>(v[1]),
                      static_cast<double>(v[2]), static_cast<double>(v[3]));
    return true;
}

ExternalToolBoundsReducer::ExternalToolBoundsReducer(const ExternalToolConfig& cfg)
: m_cfg(sanitise(cfg)) {}

std::string ExternalToolBoundsReducer::buildCommand(const std::string& input_path,
                                                    const std::string& stderr_path) const {
    std::string cmd;
    for (const std::string& a : m_cfg.argv) {
        if (!cmd.empty()) cmd += ' ';
        cmd += quote_arg(a == "{input}" ? input_path : a);
    }
    cmd += " 2>" + quote_arg(stderr_path);
    return cmd;
}

Status ExternalToolBoundsReducer::boundingBox(const img::Image& image, types::Rect& out) {
    out = types::Rect::Null();
    m_status = Status::OK;
    m_last_command.clear();
    m_last_stderr.clear();

    if (isDegenerate(image)) return Status::OK;

    // 1) Image -> temp PNG
    cv::Mat rgba;
    try {
        if (!renderSurface(image, rgba)) return fail(Status::RENDER_FAIL);
    } catch (const cv::Exception& e) {
        std::cerr << "[TRIM] ERROR: render failed: " << e.what() << "\n";
        return fail(Status::RENDER_FAIL);
    }

    TempFile input(m_cfg.temp_dir, ".png");
    TempFile err(m_cfg.temp_dir, ".err");
    if (!input.ok || !err.ok) {
        std::cerr << "[TRIM] ERROR: could not create temp files in " << m_cfg.temp_dir
                  << ": " << std::strerror(errno) << "\n";
        return fail(Status::WRITE_FAIL);
    }

    try {
        cv::Mat bgra;
        cv::cvtColor(rgba, bgra, cv::COLOR_RGBA2BGRA);
        if (!cv::imwrite(input.path, bgra)) {
            std::cerr << "[TRIM] ERROR: could not write " << input.path << "\n";
            return fail(Status::WRITE_FAIL);
        }
    } catch (const cv::Exception& e) {
        std::cerr << "[TRIM] ERROR: could not write " << input.path << ": " << e.what() << "\n";
        return fail(Status::WRITE_FAIL);
    }

    // 2) Run the tool
    m_last_command = buildCommand(input.path, err.path);
    if (m_cfg.verbose) std::cout << "[TRIM] exec: " << m_last_command << "\n";

    FILE* fp = ::popen(m_last_command.c_str(), "r");
    if (!fp) {
        std::cerr << "[TRIM] ERROR: could not spawn `" << m_last_command << "`: "
                  << std::strerror(errno) << "\n";
        return fail(Status::CLI_SPAWN_FAIL);
    }

    std::string stdout_text;
    char buf[256];
    size_t n = 0;
    while ((n = ::fread(buf, 1, sizeof(buf), fp)) > 0) stdout_text.append(buf, n);

    const int wstatus = ::pclose(fp);
    m_last_stderr = read_all(err.path);

    if (wstatus == -1) {
        std::cerr << "[TRIM] ERROR: could not wait for `" << m_last_command << "`\n";
        return fail(Status::CLI_SPAWN_FAIL);
    }
    if (!WIFEXITED(wstatus) || WEXITSTATUS(wstatus) != 0) {
        std::cerr << "[TRIM] ERROR: `" << m_last_command << "` exited with "
                  << (WIFEXITED(wstatus) ? WEXITSTATUS(wstatus) : -1) << "\n"
                  << m_last_stderr;
        return fail(Status::CLI_NONZERO_EXIT);
    }

    // 3) Parse
    types::Rect local;
    if (!parseBoundsOutput(stdout_text, local)) {
        std::cerr << "[TRIM] ERROR: unexpected output from `" << m_last_command << "`: \""
                  << stdout_text << "\"\n" << m_last_stderr;
        return fail(Status::CLI_BAD_OUTPUT);
    }

    if (local.isNull()) return Status::OK;

    const types::Rect& e = image.extent();
    out = local.translated(e.x, e.y);
    return Status::OK;
}

Status ExternalToolBoundsReducer::fail(Status s) {
    m_status = s;
    return s;
}

} // namespace trim
