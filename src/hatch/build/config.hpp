#pragma once

#include <hatch/util/fs/path.hpp>

#include <yaml-cpp/node/node.h>

#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>

namespace hatch {

struct e_config_path {
    fs::path value;
};

struct e_config_key {
    std::string value;
};

class config_error : public std::runtime_error {
public:
    using runtime_error::runtime_error;
};

/**
 * @brief Whether binaries record their dependency search paths as RPATH or as RUNPATH.
 */
enum class linking_policy {
    rpath,
    runpath,
};

/**
 * @brief Site options that affect how build environments are synthesized.
 */
struct build_config {
    /// If set, LC_ALL is forced to this value in build environments
    std::optional<std::string> build_language = std::nullopt;

    linking_policy shared_linking = linking_policy::rpath;

    /// Upper bound on build parallelism. Further limited by the host's processor count.
    int build_jobs = 16;

    bool ccache = false;
    bool debug  = false;

    /// Directory containing the compiler wrapper scripts
    fs::path build_env_path = HATCH_DEFAULT_BUILD_ENV_PATH;

    /// Directory where compiler wrappers write their debug logs
    fs::path working_dir = fs::current_path();

    /**
     * @brief Read the "config" mapping of the given YAML document. Missing keys keep their
     * defaults.
     */
    static build_config from_yaml(const YAML::Node& root);

    static build_config load_file(path_ref);

    /**
     * @brief Apply the HATCH_DEBUG, HATCH_CCACHE and HATCH_BUILD_JOBS environment variables.
     */
    void apply_env_overrides();

    /**
     * @brief The number of jobs a build should use: one for serial builds, otherwise build_jobs
     * limited to the host's processor count.
     */
    int effective_jobs(bool parallel) const noexcept;
};

}  // namespace hatch
