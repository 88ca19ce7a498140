#include "apps/cli/Commands.hpp"

#include <algorithm>
#include <cmath>
#include <cstdlib>
#include <iostream>
#include <memory>

#include "apps/engrave/IconMasker.hpp"
#include "apps/trim/BoundsReducer.hpp"
#include "apps/trim/ExternalToolBoundsReducer.hpp"
#include "apps/trim/GpuBoundsReducer.hpp"
#include "gpu/ComputeRuntime.hpp"
#include "icon/IconIO.hpp"
#include "img/ImageOps.hpp"
#include "platform/linux/DesktopEntryIconStore.hpp"

namespace cli {

static const int ICON_SIZES[] = {16, 32, 64, 128, 256, 512, 1024};

void print_usage(const char* exe) {
    std::cerr
        << "Usage:\n"
        << "  " << exe << " get  <source> [--icns <file>] [--iconset <dir>] [--reveal]\n"
        << "  " << exe << " set  <icon> <target> [--reveal]\n"
        << "  " << exe << " mask <mask.png> [target] [--icns <file>] [--iconset <dir>] [--reveal]\n"
        << "       [--template <file>] [--color-scheme auto|light|dark] [--no-trim]\n"
        << "       [--trim gpu|cpu|external] [--kernel-dir <dir>] [--debug-dump]\n"
        << "\nCommon options:\n"
        << "  -v, --verbose    progress and timing\n"
        << "  -h, --help       this text\n"
        << "\nExample:\n"
        << "  " << exe << " mask ~/logo.png ~/Projects --iconset /tmp/projects.iconset\n";
}

bool parse_args(int argc, char** argv, Args& out) {
    if (argc < 2) return false;

    const std::string sub = argv[1];
    if (sub == "-h" || sub == "--help") {
        out.help = true;
        return true;
    }
    if (sub == "get")       out.cmd = Command::GET;
    else if (sub == "set")  out.cmd = Command::SET;
    else if (sub == "mask") out.cmd = Command::MASK;
    else {
        std::cerr << "Unknown command: " << sub << "\n";
        return false;
    }

    for (int i = 2; i < argc; ++i) {
        std::string a = argv[i];

        auto need_value = [&](const char* name) -> const char* {
            if (i + 1 >= argc) {
                std::cerr << "Missing value for " << name << "\n";
                return nullptr;
            }
            return argv[++i];
        };

        if (a == "--icns") {
            const char* v = need_value("--icns");
            if (!v) return false;
            out.icns = v;
        } else if (a == "--iconset") {
            const char* v = need_value("--iconset");
            if (!v) return false;
            out.iconset = v;
        } else if (a == "--template") {
            const char* v = need_value("--template");
            if (!v) return false;
            out.template_path = v;
        } else if (a == "--kernel-dir") {
            const char* v = need_value("--kernel-dir");
            if (!v) return false;
            out.kernel_dir = v;
        } else if (a == "--color-scheme") {
            const char* v = need_value("--color-scheme");
            if (!v) return false;
            const std::string s = v;
            if (s == "auto")       out.scheme = ColorScheme::AUTO;
            else if (s == "light") out.scheme = ColorScheme::LIGHT;
            else if (s == "dark")  out.scheme = ColorScheme::DARK;
            else {
                std::cerr << "Bad --color-scheme: " << s << "\n";
                return false;
            }
        } else if (a == "--trim") {
            const char* v = need_value("--trim");
            if (!v) return false;
            const std::string s = v;
            if (s == "gpu")           out.trim = TrimBackend::GPU;
            else if (s == "cpu")      out.trim = TrimBackend::CPU;
            else if (s == "external") out.trim = TrimBackend::EXTERNAL;
            else {
                std::cerr << "Bad --trim: " << s << "\n";
                return false;
            }
        } else if (a == "-r" || a == "--reveal") {
            out.reveal = true;
        } else if (a == "--no-trim") {
            out.no_trim = true;
        } else if (a == "--debug-dump") {
            out.debug_dump = true;
        } else if (a == "-v" || a == "--verbose") {
            out.verbose = true;
        } else if (a == "-h" || a == "--help") {
            out.help = true;
        } else if (!a.empty() && a[0] == '-') {
            std::cerr << "Unknown arg: " << a << "\n";
            return false;
        } else {
            out.positional.push_back(a);
        }
    }

    if (out.help) return true;

    // Positional arity per command
    const size_t n = out.positional.size();
    switch (out.cmd) {
        case Command::GET:  return n == 1;
        case Command::SET:  return n == 2;
        case Command::MASK: return n == 1 || n == 2;
        case Command::NONE: return false;
    }
    return false;
}

bool isDarkTheme(const char* gtk_theme) {
    if (!gtk_theme) return false;
    const std::string t = gtk_theme;
    const size_t colon = t.rfind(':');
    return colon != std::string::npos && t.substr(colon + 1) == "dark";
}

std::string defaultTemplatePath(ColorScheme scheme, const char* home, const char* gtk_theme) {
    bool dark = false;
    switch (scheme) {
        case ColorScheme::AUTO:  dark = isDarkTheme(gtk_theme); break;
        case ColorScheme::LIGHT: dark = false; break;
        case ColorScheme::DARK:  dark = true; break;
    }

    const std::string base = (home && *home) ? std::string(home) : std::string(".");
    return base + "/.local/share/iconic/folder-" + (dark ? "dark" : "light") + ".icns";
}

bool standardRepresentations(const img::Image& icon, std::vector<img::Image>& out) {
    out.clear();
    if (icon.isInfinite() || icon.isEmpty()) return false;

    const int own = std::max(icon.pixelWidth(), icon.pixelHeight());

    for (int px : ICON_SIZES) {
        if (px > own && px != ICON_SIZES[0]) break;

        const double side = static_cast<double>(px);
        img::Image fitted;
        if (img::ops::scaled(icon, side, side, 1.0, fitted) != img::OpStatus::OK) return false;

        // Exact centering on a transparent square
        const types::Rect canvas_rect(0.0, 0.0, side, side);
        const types::Rect& fe = fitted.extent();
        const img::Image placed = fitted.translated(std::round((side - fe.width) / 2.0 - fe.x),
                                                    std::round((side - fe.height) / 2.0 - fe.y));
        const img::Image canvas = img::Image::solid(types::Color::Clear()).cropped(canvas_rect);

        img::Image square;
        if (img::ops::composite(placed, canvas, img::BlendOp::SOURCE_OVER, square) != img::OpStatus::OK) {
            return false;
        }
        out.push_back(square.cropped(canvas_rect));
    }
    return !out.empty();
}

// -------------------- shared output --------------------

static bool write_outputs(const Args& args, const std::vector<img::Image>& reps) {
    bool ok = true;

    if (!args.iconset.empty()) {
        const icon::IoStatus st = icon::writeIconset(reps, args.iconset);
        if (st == icon::IoStatus::OK) {
            std::cout << "[CLI] Wrote iconset to " << args.iconset << "\n";
            if (args.reveal) platform::revealInFileManager(args.iconset);
        } else {
            std::cerr << "[CLI] ERROR: iconset " << args.iconset << ": " << icon::IoStatusStr(st) << "\n";
            ok = false;
        }
    }

    if (!args.icns.empty()) {
        const icon::IoStatus st = icon::writeIcns(reps, args.icns);
        if (st == icon::IoStatus::OK) {
            std::cout << "[CLI] Wrote icns to " << args.icns << "\n";
            if (args.reveal) platform::revealInFileManager(args.icns);
        } else {
            std::cerr << "[CLI] ERROR: icns " << args.icns << ": " << icon::IoStatusStr(st) << "\n";
            ok = false;
        }
    }
    return ok;
}

// -------------------- get --------------------

int runGet(const Args& args) {
    const std::string& source = args.positional[0];

    if (args.icns.empty() && args.iconset.empty()) {
        std::cerr << "[CLI] ERROR: get needs --icns and/or --iconset\n";
        return EXIT_USAGE;
    }

    platform::DesktopEntryIconStore store;
    img::Image icon;
    const platform::StoreStatus st = store.getIcon(source, icon);
    if (st != platform::StoreStatus::OK) {
        std::cerr << "[CLI] ERROR: could not get icon of " << source << ": "
                  << platform::StoreStatusStr(st) << "\n";
        return EXIT_FAIL;
    }
    if (args.verbose) {
        std::cout << "[CLI] Retrieved " << icon.pixelWidth() << "x" << icon.pixelHeight()
                  << " icon from " << source << "\n";
    }

    std::vector<img::Image> reps;
    if (!standardRepresentations(icon, reps)) {
        std::cerr << "[CLI] ERROR: could not build icon sizes\n";
        return EXIT_FAIL;
    }
    return write_outputs(args, reps) ? EXIT_OK : EXIT_FAIL;
}

// -------------------- set --------------------

int runSet(const Args& args) {
    const std::string& icon_path = args.positional[0];
    const std::string& target = args.positional[1];

    std::vector<img::Image> reps;
    const icon::IoStatus io = icon::loadRepresentations(icon_path, reps);
    img::Image icon;
    if (io != icon::IoStatus::OK || !icon::largestRepresentation(reps, icon)) {
        std::cerr << "[CLI] ERROR: could not load icon " << icon_path << ": "
                  << icon::IoStatusStr(io) << "\n";
        return EXIT_FAIL;
    }

    platform::DesktopEntryIconStore store;
    const platform::StoreStatus st = store.setIcon(target, icon);
    if (st != platform::StoreStatus::OK) {
        std::cerr << "[CLI] ERROR: could not set icon on " << target << ": "
                  << platform::StoreStatusStr(st) << "\n";
        return EXIT_FAIL;
    }

    std::cout << "[CLI] Applied icon to " << target << "\n";
    if (args.reveal) platform::revealInFileManager(target);
    return EXIT_OK;
}

// -------------------- mask --------------------

int runMask(const Args& args) {
    const std::string& mask_path = args.positional[0];
    const std::string target = args.positional.size() > 1 ? args.positional[1] : std::string();

    if (args.icns.empty() && args.iconset.empty() && target.empty()) {
        std::cerr << "[CLI] ERROR: mask needs a target, --icns or --iconset\n";
        return EXIT_USAGE;
    }

    // 1) Inputs
    std::vector<img::Image> mask_reps;
    icon::IoStatus io = icon::loadRepresentations(mask_path, mask_reps);
    if (io != icon::IoStatus::OK) {
        std::cerr << "[CLI] ERROR: could not load mask " << mask_path << ": " << icon::IoStatusStr(io) << "\n";
        return EXIT_FAIL;
    }

    const std::string tmpl_path = !args.template_path.empty()
                                      ? args.template_path
                                      : defaultTemplatePath(args.scheme, std::getenv("HOME"), std::getenv("GTK_THEME"));
    std::vector<img::Image> tmpl_reps;
    io = icon::loadRepresentations(tmpl_path, tmpl_reps);
    if (io != icon::IoStatus::OK) {
        std::cerr << "[CLI] ERROR: could not load template " << tmpl_path << ": " << icon::IoStatusStr(io) << "\n";
        return EXIT_FAIL;
    }
    if (args.verbose) {
        std::cout << "[CLI] template " << tmpl_path << ": " << tmpl_reps.size() << " representations\n";
    }

    // 2) Trim backend
    trim::BoundsReducerConfig trim_cfg;
    trim_cfg.verbose = args.verbose;

    gpu::ComputeRuntimeConfig rt_cfg;
    if (!args.kernel_dir.empty()) rt_cfg.kernel_dir = args.kernel_dir;
    rt_cfg.verbose = args.verbose;
    gpu::ComputeRuntime runtime(rt_cfg);

    std::unique_ptr<trim::IBoundsReducer> reducer;
    switch (args.trim) {
        case TrimBackend::GPU: {
            const gpu::ComputeRuntime::Status st = runtime.initialize();
            if (st != gpu::ComputeRuntime::Status::OK) {
                std::cerr << "[CLI] ERROR: GPU init failed: " << gpu::ComputeRuntime::StatusStr(st)
                          << " (try --trim cpu)\n";
                return EXIT_FAIL;
            }
            reducer.reset(new trim::GpuBoundsReducer(runtime, trim_cfg));
            break;
        }
        case TrimBackend::CPU:
            reducer.reset(new trim::CpuBoundsReducer(trim_cfg));
            break;
        case TrimBackend::EXTERNAL: {
            trim::ExternalToolConfig ext_cfg;
            ext_cfg.verbose = args.verbose;
            reducer.reset(new trim::ExternalToolBoundsReducer(ext_cfg));
            break;
        }
    }

    // 3) Engrave every resolution
    engrave::EngraverConfig eng_cfg;
    eng_cfg.verbose = args.verbose;
    if (args.debug_dump) {
        const engrave::DebugDumpSink sink;
        std::cout << "[CLI] Dumping stages to " << sink.dir() << "\n";
        eng_cfg.sink = sink;
    }
    engrave::Engraver engraver(eng_cfg);

    engrave::IconMaskerConfig masker_cfg;
    masker_cfg.TRIM_MASK = !args.no_trim;
    masker_cfg.verbose = args.verbose;
    engrave::IconMasker masker(*reducer, engraver, masker_cfg);

    std::vector<img::Image> outputs;
    if (!masker.run(mask_reps, tmpl_reps, engrave::EngravingInputs::Default(), outputs)) {
        std::cerr << "[CLI] ERROR: mask failed: " << engrave::IconMasker::StatusStr(masker.lastStatus()) << "\n";
        return EXIT_FAIL;
    }
    if (masker.failedResolutions() > 0) {
        std::cerr << "[CLI] " << masker.failedResolutions() << " of " << tmpl_reps.size()
                  << " resolutions failed; writing the rest\n";
    }

    // 4) Outputs
    bool ok = write_outputs(args, outputs);

    if (!target.empty()) {
        img::Image best;
        platform::DesktopEntryIconStore store;
        const platform::StoreStatus st = icon::largestRepresentation(outputs, best)
                                             ? store.setIcon(target, best)
                                             : platform::StoreStatus::READ_FAIL;
        if (st == platform::StoreStatus::OK) {
            std::cout << "[CLI] Applied masked icon to " << target << "\n";
            if (args.reveal) platform::revealInFileManager(target);
        } else {
            std::cerr << "[CLI] ERROR: could not set icon on " << target << ": "
                      << platform::StoreStatusStr(st) << "\n";
            ok = false;
        }
    }
    return ok ? EXIT_OK : EXIT_FAIL;
}

int run(const Args& args) {
    switch (args.cmd) {
        case Command::GET:  return runGet(args);
        case Command::SET:  return runSet(args);
        case Command::MASK: return runMask(args);
        case Command::NONE: break;
    }
    return EXIT_USAGE;
}

} // namespace cli
