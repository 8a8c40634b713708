#include "./path.hpp"

using namespace hatch;

fs::path hatch::normalize_path(path_ref p_) noexcept {
    auto p = p_.lexically_normal();
    while (!p.empty() && p.filename().empty() && p != p.root_path()) {
        p = p.parent_path();
    }
    return p;
}

fs::path hatch::resolve_path_weak(path_ref p) noexcept {
    std::error_code ec;
    auto            canon = fs::weakly_canonical(p, ec);
    if (ec) {
        return normalize_path(p);
    }
    return normalize_path(canon);
}

bool hatch::is_directory_nothrow(path_ref p) noexcept {
    std::error_code ec;
    return fs::is_directory(p, ec);
}
