#pragma once

#include <optional>
#include <string>
#include <string_view>

namespace hatch {

enum class object_format {
    elf,
    macho,
};

/**
 * @brief The resolved platform, operating system and target microarchitecture of a spec.
 */
struct arch_spec {
    std::string platform;
    std::string os;
    std::string target;

    /// A module that must be loaded to build for this target (Cray-class machines)
    std::optional<std::string> target_module = std::nullopt;

    /**
     * @brief Parse an architecture string of the form "<platform>-<os>-<target>".
     */
    static arch_spec parse(std::string_view str);

    /**
     * @brief The architecture of the running host, with "default" for unknown parts. On a Cray
     * machine running the Cray Linux Environment the OS is the compute-node image ("cnl7").
     */
    static arch_spec host();

    bool is_darwin() const noexcept { return platform == "darwin"; }
    bool is_linux() const noexcept { return platform == "linux"; }
    bool is_cray() const noexcept { return platform == "cray"; }

    /**
     * @brief True on a Cray-class platform whose OS is not a Cray Linux Environment (cnlN)
     * compute-node image.
     */
    bool is_cray_cluster() const noexcept;

    std::string to_string() const;

    friend bool operator==(const arch_spec&, const arch_spec&) = default;
};

/**
 * @brief The compute-node OS name ("cnl<major>") for the contents of a CLE release file, which
 * holds a line such as "RELEASE=7.0.UP03".
 */
std::optional<std::string> cle_release_os(std::string_view release_text);

/**
 * @brief Determine the binary object format family implied by an architecture string. Strings
 * naming "linux" or "cray" are ELF; strings naming "darwin" are Mach-O.
 */
std::optional<object_format> object_format_of(std::string_view arch_str) noexcept;

}  // namespace hatch
