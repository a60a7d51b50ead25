#include "infrastructure/PathUtils.hpp"
#include <cstdlib>
#include <filesystem>

namespace codegrader::infrastructure {

namespace fs = std::filesystem;

namespace {
constexpr const char* kAppDir = "codegrader";
}

fs::path PathUtils::GetDataHome() {
    const char* xdgDataHome = std::getenv("XDG_DATA_HOME");
    if (xdgDataHome && *xdgDataHome) {
        return fs::path(xdgDataHome) / kAppDir;
    }
    const char* home = std::getenv("HOME");
    if (home && *home) {
        return fs::path(home) / ".local" / "share" / kAppDir;
    }
    return fs::current_path(); // Fallback
}

fs::path PathUtils::GetConfigHome() {
    const char* xdgConfigHome = std::getenv("XDG_CONFIG_HOME");
    if (xdgConfigHome && *xdgConfigHome) {
        return fs::path(xdgConfigHome) / kAppDir;
    }
    const char* home = std::getenv("HOME");
    if (home && *home) {
        return fs::path(home) / ".config" / kAppDir;
    }
    return fs::current_path();
}

fs::path PathUtils::ResolveUnder(const fs::path& base, const std::string& configured) {
    fs::path path(configured);
    if (path.is_absolute()) return path;
    return base / path;
}

std::string PathUtils::SanitizeFileComponent(const std::string& text, size_t maxLength) {
    std::string out;
    out.reserve(text.size());
    for (char ch : text) {
        if (ch == ' ') continue;
        out.push_back(ch == '/' || ch == '\\' ? '_' : ch);
        if (out.size() == maxLength) break;
    }
    return out;
}

} // namespace codegrader::infrastructure
