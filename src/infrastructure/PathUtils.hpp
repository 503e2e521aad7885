// PathUtils Header
#pragma once
#include <string>
#include <filesystem>

namespace ssdverifier::infrastructure {

class PathUtils {
public:
    static std::filesystem::path GetConfigHome();
    static std::filesystem::path GetCacheHome();
};

} // namespace ssdverifier::infrastructure
