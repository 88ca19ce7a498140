#include "platform/linux/DesktopEntryIconStore.hpp"

#include <cstdio>
#include <filesystem>
#include <fstream>
#include <iostream>

#include <sys/wait.h>

#include "icon/IconIO.hpp"

namespace fs = std::filesystem;

namespace {

static std::string trim_ws(const std::string& s) {
    const size_t b = s.find_first_not_of(" \t\r");
    if (b == std::string::npos) return {};
    const size_t e = s.find_last_not_of(" \t\r");
    return s.substr(b, e - b + 1);
}

static bool is_section(const std::string& line) {
    const std::string t = trim_ws(line);
    return !t.empty() && t.front() == '[' && t.back() == ']';
}

static bool is_desktop_entry_header(const std::string& line) {
    return trim_ws(line) == "[Desktop Entry]";
}

// "Icon=..." / "Icon = ..." but not "Icon[de]=..."
static bool is_icon_key(const std::string& line, std::string* value) {
    const size_t eq = line.find('=');
    if (eq == std::string::npos) return false;
    if (trim_ws(line.substr(0, eq)) != "Icon") return false;
    if (value) *value = trim_ws(line.substr(eq + 1));
    return true;
}

static bool read_lines(const std::string& path, std::vector<std::string>& lines) {
    std::ifstream f(path);
    if (!f.is_open()) return false;
    std::string line;
    while (std::getline(f, line)) lines.push_back(line);
    return true;
}

static std::string shell_quote(const std::string& arg) {
    std::string q = "'";
    for (char c : arg) {
        if (c == '\'') q += "'\\''";
        else q += c;
    }
    q += "'";
    return q;
}

} // anonymous namespace

namespace platform {

const char* StoreStatusStr(StoreStatus s) {
    switch (s) {
        case StoreStatus::OK:          return "OK";
        case StoreStatus::NOT_FOUND:   return "NOT_FOUND";
        case StoreStatus::NO_ICON:     return "NO_ICON";
        case StoreStatus::UNSUPPORTED: return "UNSUPPORTED";
        case StoreStatus::READ_FAIL:   return "READ_FAIL";
        case StoreStatus::WRITE_FAIL:  return "WRITE_FAIL";
    }
    return "UNKNOWN";
}

std::string desktopEntryIcon(const std::vector<std::string>& lines) {
    bool in_entry = false;
    for (const std::string& line : lines) {
        if (is_section(line)) {
            in_entry = is_desktop_entry_header(line);
            continue;
        }
        std::string value;
        if (in_entry && is_icon_key(line, &value)) return value;
    }
    return {};
}

void setDesktopEntryIcon(std::vector<std::string>& lines, const std::string& icon_value) {
    const std::string key = "Icon=" + icon_value;

    bool in_entry = false;
    size_t header = lines.size();
    for (size_t i = 0; i < lines.size(); ++i) {
        if (is_section(lines[i])) {
            in_entry = is_desktop_entry_header(lines[i]);
            if (in_entry) header = i;
            continue;
        }
        if (in_entry && is_icon_key(lines[i], nullptr)) {
            lines[i] = key;
            return;
        }
    }

    if (header < lines.size()) {
        lines.insert(lines.begin() + static_cast<std::ptrdiff_t>(header) + 1, key);
        return;
    }

    // No [Desktop Entry] yet
    if (!lines.empty() && !trim_ws(lines.back()).empty()) lines.push_back("");
    lines.push_back("[Desktop Entry]");
    lines.push_back(key);
}

StoreStatus DesktopEntryIconStore::getIcon(const std::string& path, img::Image& icon) {
    std::error_code ec;
    if (!fs::exists(path, ec)) {
        std::cerr << "[STORE] ERROR: no such file or directory: " << path << "\n";
        return StoreStatus::NOT_FOUND;
    }
    if (!fs::is_directory(path, ec)) {
        std::cerr << "[STORE] ERROR: custom icons are only supported on directories: " << path << "\n";
        return StoreStatus::UNSUPPORTED;
    }

    const fs::path entry = fs::path(path) / ENTRY_FILE;
    std::vector<std::string> lines;
    if (!read_lines(entry.string(), lines)) return StoreStatus::NO_ICON;

    std::string value = desktopEntryIcon(lines);
    if (value.rfind("file://", 0) == 0) value = value.substr(7);
    if (value.empty()) return StoreStatus::NO_ICON;

    fs::path icon_path(value);
    if (icon_path.is_relative()) {
        if (!icon_path.has_extension()) {
            std::cerr << "[STORE] " << path << " uses theme icon \"" << value << "\"; not resolved\n";
            return StoreStatus::NO_ICON;
        }
        icon_path = fs::path(path) / icon_path;
    }

    std::vector<img::Image> reps;
    const icon::IoStatus st = icon::loadRepresentations(icon_path.string(), reps);
    if (st == icon::IoStatus::NOT_FOUND) {
        std::cerr << "[STORE] ERROR: icon " << icon_path.string() << " referenced by "
                  << entry.string() << " is missing\n";
        return StoreStatus::NO_ICON;
    }
    if (st != icon::IoStatus::OK || !icon::largestRepresentation(reps, icon)) {
        std::cerr << "[STORE] ERROR: could not read " << icon_path.string() << ": "
                  << icon::IoStatusStr(st) << "\n";
        return StoreStatus::READ_FAIL;
    }
    return StoreStatus::OK;
}

StoreStatus DesktopEntryIconStore::setIcon(const std::string& path, const img::Image& icon) {
    std::error_code ec;
    if (!fs::exists(path, ec)) {
        std::cerr << "[STORE] ERROR: no such file or directory: " << path << "\n";
        return StoreStatus::NOT_FOUND;
    }
    if (!fs::is_directory(path, ec)) {
        std::cerr << "[STORE] ERROR: custom icons are only supported on directories: " << path << "\n";
        return StoreStatus::UNSUPPORTED;
    }

    // 1) Icon image
    const fs::path icon_path = fs::absolute(fs::path(path) / ICON_FILE, ec);
    if (ec) return StoreStatus::WRITE_FAIL;

    const icon::IoStatus st = icon::writePng(icon, icon_path.string());
    if (st != icon::IoStatus::OK) {
        std::cerr << "[STORE] ERROR: could not write " << icon_path.string() << ": "
                  << icon::IoStatusStr(st) << "\n";
        return StoreStatus::WRITE_FAIL;
    }

    // 2) .directory entry (keep what is already there)
    const fs::path entry = fs::path(path) / ENTRY_FILE;
    std::vector<std::string> lines;
    if (fs::exists(entry, ec) && !read_lines(entry.string(), lines)) {
        std::cerr << "[STORE] ERROR: could not read " << entry.string() << "\n";
        return StoreStatus::READ_FAIL;
    }
    setDesktopEntryIcon(lines, icon_path.string());

    const fs::path tmp = entry.string() + ".tmp";
    {
        std::ofstream f(tmp, std::ios::trunc);
        if (!f.is_open()) {
            std::cerr << "[STORE] ERROR: could not write " << tmp.string() << "\n";
            return StoreStatus::WRITE_FAIL;
        }
        for (const std::string& line : lines) f << line << "\n";
        if (!f.good()) {
            std::cerr << "[STORE] ERROR: short write to " << tmp.string() << "\n";
            return StoreStatus::WRITE_FAIL;
        }
    }
    fs::rename(tmp, entry, ec);
    if (ec) {
        std::cerr << "[STORE] ERROR: could not replace " << entry.string() << ": " << ec.message() << "\n";
        fs::remove(tmp, ec);
        return StoreStatus::WRITE_FAIL;
    }
    return StoreStatus::OK;
}

void revealInFileManager(const std::string& path) {
    std::error_code ec;
    fs::path dir = fs::absolute(path, ec);
    if (ec) {
        std::cerr << "[STORE] could not resolve " << path << "\n";
        return;
    }
    if (!fs::is_directory(dir, ec)) dir = dir.parent_path();

    const std::string cmd = "xdg-open " + shell_quote(dir.string()) + " >/dev/null 2>&1";
    FILE* fp = ::popen(cmd.c_str(), "r");
    if (!fp) {
        std::cerr << "[STORE] could not run xdg-open\n";
        return;
    }
    const int wstatus = ::pclose(fp);
    if (wstatus == -1 || !WIFEXITED(wstatus) || WEXITSTATUS(wstatus) != 0) {
        std::cerr << "[STORE] xdg-open " << dir.string() << " failed\n";
    }
}

} // namespace platform
