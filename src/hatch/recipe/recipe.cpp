#include "./recipe.hpp"

#include "./errors.hpp"

#include <hatch/error/errors.hpp>
#include <hatch/spec/node.hpp>
#include <hatch/util/algo.hpp>
#include <hatch/util/string.hpp>

#include <boost/leaf/exception.hpp>
#include <neo/ufmt.hpp>

#include <algorithm>

using namespace hatch;

flag_handler_result package_recipe::flag_handler(flag_category,
                                                 std::vector<std::string> flags) const {
    return flag_handler_result{.inject = std::move(flags)};
}

void package_recipe::flags_to_build_system_args(const flag_map& flags, build_toolkit&) const {
    const bool any_flags
        = std::any_of(flags.begin(), flags.end(), [](auto& pair) { return !pair.second.empty(); });
    if (any_flags) {
        BOOST_LEAF_THROW_EXCEPTION(
            setup_error(neo::ufmt("The build system of '{}' cannot take command line arguments "
                                  "for compiler flags",
                                  recipe_name())));
    }
}

std::vector<fs::path> package_recipe::libs(const spec_node& self) const {
    auto suffix = self.arch.is_darwin() ? "dylib" : "so";
    auto found  = find_libraries(self.name, self.prefix, suffix);
    if (found.empty()) {
        BOOST_LEAF_THROW_EXCEPTION(install_error(neo::ufmt("Unable to recursively locate {} "
                                                           "libraries in {}",
                                                           self.name,
                                                           self.prefix.string())),
                                   e_no_libraries{self.name});
    }
    return found;
}

std::vector<fs::path> package_recipe::headers(const spec_node& self) const {
    auto found = find_headers(self.prefix / "include");
    if (found.empty()) {
        BOOST_LEAF_THROW_EXCEPTION(install_error(neo::ufmt("Unable to locate {} headers in {}",
                                                           self.name,
                                                           (self.prefix / "include").string())),
                                   e_no_headers{self.name});
    }
    return found;
}

std::vector<fs::path> hatch::file_directories(const std::vector<fs::path>& files) {
    std::vector<fs::path> dirs;
    for (auto& file : files) {
        dirs.push_back(file.parent_path());
    }
    dedupe(dirs);
    return dirs;
}

std::vector<fs::path> hatch::header_directories(const std::vector<fs::path>& headers) {
    std::vector<fs::path> dirs;
    for (auto& dir : file_directories(headers)) {
        fs::path acc;
        bool     found_include = false;
        for (auto& part : dir) {
            acc /= part;
            if (part == "include") {
                found_include = true;
                break;
            }
        }
        dirs.push_back(found_include ? acc : dir);
    }
    dedupe(dirs);
    return dirs;
}

namespace {

std::vector<fs::path> files_named(path_ref dir, const std::string& filename, bool recursive) {
    std::vector<fs::path> ret;
    std::error_code       ec;
    if (!fs::is_directory(dir, ec)) {
        return ret;
    }
    auto matches = [&](const fs::directory_entry& entry) {
        return entry.path().filename() == filename && !entry.is_directory(ec);
    };
    if (recursive) {
        for (auto& entry : fs::recursive_directory_iterator{dir, ec}) {
            if (matches(entry)) {
                ret.push_back(entry.path());
            }
        }
    } else {
        for (auto& entry : fs::directory_iterator{dir, ec}) {
            if (matches(entry)) {
                ret.push_back(entry.path());
            }
        }
    }
    std::sort(ret.begin(), ret.end());
    return ret;
}

}  // namespace

std::vector<fs::path>
hatch::find_libraries(std::string_view libname, path_ref root, std::string_view suffix) {
    std::string filename = starts_with(libname, "lib") ? std::string(libname)
                                                       : "lib" + std::string(libname);
    filename += ".";
    filename += suffix;

    std::vector<fs::path> found;
    for (auto subdir : {"lib", "lib64"}) {
        extend(found, files_named(root / subdir, filename, false));
    }
    if (found.empty()) {
        found = files_named(root, filename, true);
    }
    dedupe(found);
    return found;
}

std::vector<fs::path> hatch::find_headers(path_ref root) {
    static const std::vector<std::string> header_exts
        = {".h", ".hh", ".hpp", ".hxx", ".H", ".inc", ".cuh", ".mod"};
    std::vector<fs::path> ret;
    std::error_code       ec;
    if (!fs::is_directory(root, ec)) {
        return ret;
    }
    for (auto& entry : fs::recursive_directory_iterator{root, ec}) {
        if (entry.is_directory(ec)) {
            continue;
        }
        auto ext = entry.path().extension().string();
        if (std::find(header_exts.begin(), header_exts.end(), ext) != header_exts.end()) {
            ret.push_back(entry.path());
        }
    }
    std::sort(ret.begin(), ret.end());
    return ret;
}

void capability_table::register_recipe(const package_recipe& recipe) {
    auto scopes = recipe.capability_scopes();
    auto name   = recipe.recipe_name();
    if (std::find(scopes.begin(), scopes.end(), name) == scopes.end()) {
        scopes.insert(scopes.begin(), name);
    }
    dedupe(scopes);
    _scopes.insert_or_assign(std::move(name), std::move(scopes));
}

void capability_table::register_dag(const spec_node& root) {
    for (auto node : root.traverse()) {
        register_recipe(node->package());
    }
}

const std::vector<std::string>& capability_table::scopes_for(std::string_view recipe_name) const {
    auto found = _scopes.find(recipe_name);
    if (found == _scopes.end()) {
        BOOST_LEAF_THROW_EXCEPTION(
            setup_error(neo::ufmt("Recipe '{}' has no registered capability scopes",
                                  recipe_name)));
    }
    return found->second;
}
