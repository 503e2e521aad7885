#include "infrastructure/PathUtils.hpp"
#include <cstdlib>
#include <filesystem>

namespace ssdverifier::infrastructure {

namespace fs = std::filesystem;

namespace {

fs::path XdgDirectory(const char* variable, const char* homeFallback) {
    const char* xdg = std::getenv(variable);
    if (xdg && *xdg) {
        return fs::path(xdg);
    }
    const char* home = std::getenv("HOME");
    if (home && *home) {
        return fs::path(home) / homeFallback;
    }
    return fs::current_path();
}

} // namespace

fs::path PathUtils::GetConfigHome() {
    return XdgDirectory("XDG_CONFIG_HOME", ".config");
}

fs::path PathUtils::GetCacheHome() {
    return XdgDirectory("XDG_CACHE_HOME", ".cache");
}

} // namespace ssdverifier::infrastructure
