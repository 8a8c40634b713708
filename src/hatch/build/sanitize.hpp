#pragma once

#include <hatch/env/modifications.hpp>
#include <hatch/spec/arch.hpp>
#include <hatch/util/env.hpp>

namespace hatch {

struct build_config;

/**
 * @brief The operations that remove host toolchain and library state from an environment.
 *
 * Clears dynamic-linker search paths, compiler and flag variables of common build systems, and
 * MPI compiler variables. On Cray machines that are not compute-node images, also clears
 * CRAY_LD_LIBRARY_PATH and every variable whose name contains "PKGCONF". MacPorts directories are
 * removed from PATH.
 */
environment_modifications
sanitizing_modifications(const arch_spec& host, const build_config&, const env_snapshot& current);

/**
 * @brief Sanitize the live process environment immediately.
 *
 * The changes are applied at once, not queued, so that later module loads are not undone. There
 * is no way to roll them back; call this only in a process dedicated to one build.
 */
void clean_environment(const arch_spec& host, const build_config&);

}  // namespace hatch
