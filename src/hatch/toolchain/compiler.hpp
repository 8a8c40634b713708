#pragma once

#include <hatch/env/modifications.hpp>
#include <hatch/spec/arch.hpp>
#include <hatch/util/fs/path.hpp>

#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace hatch {

class spec_node;

enum class language {
    c,
    cxx,
    f77,
    fc,
};

inline constexpr language all_languages[] = {language::c, language::cxx, language::f77, language::fc};

/**
 * @brief The short lower-case key of the language: "cc", "cxx", "f77" or "fc".
 */
std::string_view language_key(language) noexcept;

/**
 * @brief The capabilities a toolchain provides to the build-environment synthesizer.
 *
 * The synthesizer only calls this contract. The object lives for the duration of a build session
 * and is never modified by the build.
 */
class compiler_adapter {
public:
    virtual ~compiler_adapter() = default;

    /// The compiler family name, e.g. "gcc". Names the wrapper subdirectory.
    virtual std::string name() const = 0;
    /// The compiler name and version, e.g. "gcc@9.3.0"
    virtual std::string spec_string() const = 0;

    /// The real executable for the language, if the toolchain supports it
    virtual std::optional<fs::path> executable(language) const = 0;
    /// The path of the wrapper for the language, relative to the wrapper directory
    virtual std::string link_path(language) const = 0;

    virtual std::string rpath_arg(language) const     = 0;
    virtual std::string linker_arg() const            = 0;
    virtual std::string enable_new_dtags() const      = 0;
    virtual std::string disable_new_dtags() const     = 0;

    virtual std::vector<fs::path>    extra_rpaths() const    = 0;
    virtual std::vector<fs::path>    implicit_rpaths() const = 0;
    virtual std::vector<std::string> modules() const         = 0;

    /// Environment changes required by this toolchain
    virtual environment_modifications environment() const = 0;

    /// Optimization flags for the given target architecture
    virtual std::string target_args(const arch_spec&) const = 0;

    /**
     * @brief Throw a setup_error if any of the executables this toolchain provides is missing or
     * not executable.
     */
    virtual void verify_executables() const = 0;

    /**
     * @brief Last-chance toolchain-specific adjustments to a package's build environment.
     */
    virtual void setup_custom_environment(const spec_node&, environment_modifications&) const {}
};

}  // namespace hatch
