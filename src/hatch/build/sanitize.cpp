#include "./sanitize.hpp"

#include "./config.hpp"

#include <hatch/util/log.hpp>
#include <hatch/util/string.hpp>

using namespace hatch;

environment_modifications hatch::sanitizing_modifications(const arch_spec&    host,
                                                          const build_config& config,
                                                          const env_snapshot& current) {
    environment_modifications env;
    env.set_origin("sanitizer");

    // Library search paths can pull unintended external dependencies into a build
    for (auto var : {"LD_LIBRARY_PATH",
                     "LIBRARY_PATH",
                     "CPATH",
                     "LD_RUN_PATH",
                     "DYLD_LIBRARY_PATH",
                     "DYLD_FALLBACK_LIBRARY_PATH"}) {
        env.unset(var);
    }

    // Cray compute-node images need these to be set
    if (host.is_cray_cluster()) {
        env.unset("CRAY_LD_LIBRARY_PATH");
        for (auto& [name, _] : current) {
            if (contains(name, "PKGCONF")) {
                env.unset(name);
            }
        }
    }

    for (auto var : {"CC",
                     "CFLAGS",
                     "CPP",
                     "CPPFLAGS",
                     "CXX",
                     "CCC",
                     "CXXFLAGS",
                     "CXXCPP",
                     "F77",
                     "FFLAGS",
                     "FLIBS",
                     "FC",
                     "FCFLAGS",
                     "FCLIBS",
                     "LDFLAGS",
                     "LIBS"}) {
        env.unset(var);
    }

    // Only MPI providers should set these, for packages that depend on MPI
    for (auto var : {"MPICC", "MPICXX", "MPIFC", "MPIF77", "MPIF90"}) {
        env.unset(var);
    }

    if (config.build_language) {
        env.set("LC_ALL", *config.build_language);
    }

    // The MacPorts linker conflicts with the system linker
    if (auto path = current.find("PATH"); path != current.end()) {
        for (auto& dir : split_path_list(path->second)) {
            if (contains(dir, "/macports/")) {
                env.remove_path("PATH", dir);
            }
        }
    }
    return env;
}

void hatch::clean_environment(const arch_spec& host, const build_config& config) {
    auto env = sanitizing_modifications(host, config, snapshot_environment());
    hatch_log(debug, "Sanitizing the build environment ({} operations)", env.size());
    env.apply();
}
