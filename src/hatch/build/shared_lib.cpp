#include "./shared_lib.hpp"

#include <hatch/recipe/executable.hpp>
#include <hatch/spec/arch.hpp>
#include <hatch/util/log.hpp>

using namespace hatch;

std::string_view hatch::dso_suffix(std::string_view arch) noexcept {
    return object_format_of(arch) == object_format::macho ? "dylib" : "so";
}

shared_library_plan hatch::plan_static_to_shared(std::string_view              arch,
                                                 path_ref                      static_lib,
                                                 const shared_library_options& opts) {
    const auto& version        = opts.version;
    const auto  compat_version = opts.compat_version ? opts.compat_version : version;

    fs::path shared_lib = opts.shared_lib.value_or(
        fs::path(static_lib).replace_extension(std::string(dso_suffix(arch))));

    shared_library_plan plan;
    auto&               args   = plan.args;
    const auto          format = object_format_of(arch);
    if (format == object_format::elf) {
        auto soname = shared_lib.filename().string();
        if (compat_version) {
            soname += "." + *compat_version;
        }
        args = {
            "-shared",
            "-Wl,-soname," + soname,
            "-Wl,--whole-archive",
            static_lib.string(),
            "-Wl,--no-whole-archive",
        };
    } else if (format == object_format::macho) {
        auto install_name = shared_lib.string();
        if (compat_version) {
            install_name += "." + *compat_version;
        }
        args = {
            "-dynamiclib",
            "-install_name",
            install_name,
            "-Wl,-force_load," + static_lib.string(),
        };
        if (compat_version) {
            args.push_back("-compatibility_version");
            args.push_back(*compat_version);
        }
        if (version) {
            args.push_back("-current_version");
            args.push_back(*version);
        }
    } else {
        hatch_log(warn, "No shared library conversion flags are known for architecture '{}'", arch);
    }

    args.insert(args.end(), opts.arguments.begin(), opts.arguments.end());

    const auto shared_lib_base = shared_lib;
    if (version) {
        shared_lib += "." + *version;
    } else if (compat_version) {
        shared_lib += "." + *compat_version;
    }
    args.push_back("-o");
    args.push_back(shared_lib.string());
    plan.output = shared_lib;

    auto link_target = shared_lib.filename();
    if (version || compat_version) {
        plan.symlinks.emplace_back(shared_lib_base, link_target);
    }
    if (compat_version && compat_version != version) {
        plan.symlinks.emplace_back(fs::path(shared_lib_base.string() + "." + *compat_version),
                                   link_target);
    }
    return plan;
}

proc_result hatch::static_to_shared_library(std::string_view              arch,
                                            const executable&             compiler,
                                            path_ref                      static_lib,
                                            const shared_library_options& opts) {
    auto plan = plan_static_to_shared(arch, static_lib, opts);
    for (auto& [link, target] : plan.symlinks) {
        hatch_log(debug, "Linking [{}] -> [{}]", link.string(), target.string());
        fs::create_symlink(target, link);
    }
    return compiler(plan.args);
}
