#include "./system_paths.hpp"

#include <hatch/util/algo.hpp>

#include <algorithm>

using namespace hatch;

const std::vector<std::string>& hatch::system_paths() noexcept {
    static const std::vector<std::string> ret = {"/", "/usr", "/usr/local"};
    return ret;
}

const std::vector<std::string>& hatch::system_dirs() noexcept {
    static const std::vector<std::string> ret = [] {
        std::vector<std::string> dirs;
        for (auto suffix : {"bin", "bin64", "include", "lib", "lib64"}) {
            for (auto& root : system_paths()) {
                dirs.push_back((fs::path(root) / suffix).string());
            }
        }
        extend(dirs, system_paths());
        return dirs;
    }();
    return ret;
}

bool hatch::is_system_path(path_ref p) noexcept {
    if (p.empty()) {
        return false;
    }
    auto norm  = normalize_path(p).string();
    auto& dirs = system_dirs();
    return std::find(dirs.begin(), dirs.end(), norm) != dirs.end();
}

std::vector<fs::path> hatch::filter_system_paths(std::vector<fs::path> paths) {
    erase_if(paths, [](const fs::path& p) { return is_system_path(p); });
    return paths;
}

std::vector<fs::path> hatch::filter_and_dedupe(std::vector<fs::path> paths) {
    auto ret = filter_system_paths(std::move(paths));
    dedupe(ret);
    return ret;
}
