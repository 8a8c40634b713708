#include "./from_yaml.hpp"

#include "./errors.hpp"
#include "./prep.hpp"

#include <hatch/error/on_error.hpp>
#include <hatch/util/yaml/parse.hpp>

#include <boost/leaf/exception.hpp>
#include <fmt/core.h>
#include <yaml-cpp/yaml.h>

#include <set>
#include <string>

using namespace hatch;

using std::string;
using strv = std::string_view;

namespace {

template <typename... Args>
[[noreturn]] void fail(strv context, strv message, Args&&... args) {
    auto fmtd = fmt::format(fmt::runtime(message), args...);
    throw std::runtime_error(fmt::format("{} - Failed to read toolchain file: {}", context, fmtd));
}

string read_string(const YAML::Node& node, strv key, strv context) {
    if (!node.IsScalar()) {
        fail(context, "'{}' must be a string", key);
    }
    return node.as<string>();
}

std::vector<string> read_string_seq(const YAML::Node& node, strv key, strv context) {
    if (node.IsNull()) {
        return {};
    }
    if (!node.IsSequence()) {
        fail(context, "'{}' must be a list of strings", key);
    }
    std::vector<string> ret;
    for (auto item : node) {
        ret.push_back(read_string(item, key, context));
    }
    return ret;
}

std::map<string, string> read_string_map(const YAML::Node& node, strv key, strv context) {
    if (node.IsNull()) {
        return {};
    }
    if (!node.IsMap()) {
        fail(context, "'{}' must be a mapping of strings", key);
    }
    std::map<string, string> ret;
    for (auto pair : node) {
        auto item_key = pair.first.as<string>();
        HATCH_E_SCOPE(e_toolchain_key{item_key});
        ret.emplace(item_key, read_string(pair.second, item_key, context));
    }
    return ret;
}

std::vector<fs::path> read_path_seq(const YAML::Node& node, strv key, strv context) {
    auto strs = read_string_seq(node, key, context);
    return {strs.begin(), strs.end()};
}

}  // namespace

toolchain hatch::parse_toolchain_yaml(strv content, strv context) {
    auto data = parse_yaml_string(content);
    return parse_toolchain_yaml_data(data, context);
}

toolchain hatch::parse_toolchain_yaml_file(path_ref fpath) {
    auto data = parse_yaml_file(fpath);
    return parse_toolchain_yaml_data(data, fpath.string());
}

toolchain hatch::parse_toolchain_yaml_data(const YAML::Node& data, strv context) {
    if (!data.IsMap()) {
        fail(context, "Root of toolchain data must be a mapping");
    }

    toolchain_prep prep;

    for (auto pair : data) {
        auto key = pair.first.as<string>();
        HATCH_E_SCOPE(e_toolchain_key{key});
        const auto& value = pair.second;
        if (key == "name") {
            prep.name = read_string(value, key, context);
        } else if (key == "version") {
            prep.version = read_string(value, key, context);
        } else if (key == "paths") {
            for (auto& [lang, exe] : read_string_map(value, key, context)) {
                if (lang == "cc") {
                    prep.cc = exe;
                } else if (lang == "cxx") {
                    prep.cxx = exe;
                } else if (lang == "f77") {
                    prep.f77 = exe;
                } else if (lang == "fc") {
                    prep.fc = exe;
                } else {
                    fail(context, "Unknown language '{}' in 'paths'", lang);
                }
            }
        } else if (key == "link_paths") {
            prep.link_paths = read_string_map(value, key, context);
        } else if (key == "rpath_arg") {
            prep.rpath_arg = read_string(value, key, context);
        } else if (key == "linker_arg") {
            prep.linker_arg = read_string(value, key, context);
        } else if (key == "enable_new_dtags") {
            prep.enable_new_dtags = read_string(value, key, context);
        } else if (key == "disable_new_dtags") {
            prep.disable_new_dtags = read_string(value, key, context);
        } else if (key == "extra_rpaths") {
            prep.extra_rpaths = read_path_seq(value, key, context);
        } else if (key == "implicit_rpaths") {
            prep.implicit_rpaths = read_path_seq(value, key, context);
        } else if (key == "modules") {
            prep.modules = read_string_seq(value, key, context);
        } else if (key == "target_flags") {
            prep.target_flags = read_string_map(value, key, context);
        } else if (key == "environment") {
            if (!value.IsMap()) {
                fail(context, "'environment' must be a mapping");
            }
            for (auto env_pair : value) {
                auto op = env_pair.first.as<string>();
                if (op == "set") {
                    prep.env_set = read_string_map(env_pair.second, op, context);
                } else if (op == "unset") {
                    prep.env_unset = read_string_seq(env_pair.second, op, context);
                } else if (op == "prepend_path") {
                    prep.env_prepend_path = read_string_map(env_pair.second, op, context);
                } else if (op == "append_path") {
                    prep.env_append_path = read_string_map(env_pair.second, op, context);
                } else {
                    fail(context, "Unknown environment operation '{}'", op);
                }
            }
        } else {
            fail(context, "Unknown toolchain config key '{}'", key);
        }
    }

    if (prep.name.empty()) {
        fail(context, "Toolchain must specify a 'name'");
    }
    return prep.realize();
}
