#include "./config.hpp"

#include <hatch/error/on_error.hpp>
#include <hatch/util/env.hpp>
#include <hatch/util/log.hpp>
#include <hatch/util/yaml/parse.hpp>

#include <boost/leaf/exception.hpp>
#include <neo/ufmt.hpp>
#include <yaml-cpp/yaml.h>

#include <algorithm>
#include <charconv>
#include <thread>

using namespace hatch;

namespace {

[[noreturn]] void bad_value(std::string_view key, std::string_view message) {
    BOOST_LEAF_THROW_EXCEPTION(config_error(neo::ufmt("Invalid value for config:{}: {}",
                                                      key,
                                                      message)),
                               e_config_key{std::string(key)});
}

int parse_jobs(std::string_view key, std::string_view str) {
    int  jobs = 0;
    auto res  = std::from_chars(str.data(), str.data() + str.size(), jobs);
    if (res.ec != std::errc{} || res.ptr != str.data() + str.size() || jobs < 1) {
        bad_value(key, neo::ufmt("expected a positive integer, got '{}'", str));
    }
    return jobs;
}

bool read_bool(std::string_view key, const YAML::Node& node) {
    try {
        return node.as<bool>();
    } catch (const YAML::Exception&) {
        bad_value(key, "expected true or false");
    }
}

std::string read_scalar(std::string_view key, const YAML::Node& node) {
    if (!node.IsScalar()) {
        bad_value(key, "expected a string");
    }
    return node.as<std::string>();
}

}  // namespace

build_config build_config::from_yaml(const YAML::Node& root) {
    build_config ret;
    if (!root.IsMap()) {
        BOOST_LEAF_THROW_EXCEPTION(config_error("Configuration document must be a mapping"));
    }
    auto config = root["config"];
    if (!config) {
        return ret;
    }
    if (!config.IsMap()) {
        BOOST_LEAF_THROW_EXCEPTION(config_error("'config' must be a mapping"));
    }
    for (auto pair : config) {
        auto key = pair.first.as<std::string>();
        HATCH_E_SCOPE(e_config_key{key});
        const auto& value = pair.second;
        if (key == "build_language") {
            ret.build_language = read_scalar(key, value);
        } else if (key == "shared_linking") {
            auto policy = read_scalar(key, value);
            if (policy == "rpath") {
                ret.shared_linking = linking_policy::rpath;
            } else if (policy == "runpath") {
                ret.shared_linking = linking_policy::runpath;
            } else {
                bad_value(key, neo::ufmt("expected 'rpath' or 'runpath', got '{}'", policy));
            }
        } else if (key == "build_jobs") {
            ret.build_jobs = parse_jobs(key, read_scalar(key, value));
        } else if (key == "ccache") {
            ret.ccache = read_bool(key, value);
        } else if (key == "debug") {
            ret.debug = read_bool(key, value);
        } else if (key == "build_env_path") {
            ret.build_env_path = read_scalar(key, value);
        } else if (key == "working_dir") {
            ret.working_dir = read_scalar(key, value);
        } else {
            BOOST_LEAF_THROW_EXCEPTION(config_error(
                neo::ufmt("Unknown configuration key 'config:{}'", key)));
        }
    }
    return ret;
}

build_config build_config::load_file(path_ref fpath) {
    HATCH_E_SCOPE(e_config_path{fpath});
    hatch_log(debug, "Loading build configuration from [{}]", fpath.string());
    return from_yaml(parse_yaml_file(fpath));
}

void build_config::apply_env_overrides() {
    if (auto val = hatch::getenv("HATCH_DEBUG")) {
        debug = is_truthy_string(*val);
    }
    if (auto val = hatch::getenv("HATCH_CCACHE")) {
        ccache = is_truthy_string(*val);
    }
    if (auto val = hatch::getenv("HATCH_BUILD_JOBS")) {
        build_jobs = parse_jobs("build_jobs", *val);
    }
}

int build_config::effective_jobs(bool parallel) const noexcept {
    if (!parallel) {
        return 1;
    }
    int ncpu = static_cast<int>(std::thread::hardware_concurrency());
    return std::max(1, std::min(build_jobs, std::max(ncpu, 1)));
}
