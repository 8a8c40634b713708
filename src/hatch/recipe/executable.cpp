#include "./executable.hpp"

#include "./errors.hpp"

#include <hatch/error/errors.hpp>
#include <hatch/util/env.hpp>
#include <hatch/util/fs/io.hpp>
#include <hatch/util/log.hpp>

#include <boost/leaf/exception.hpp>
#include <boost/leaf/on_error.hpp>
#include <neo/ufmt.hpp>

using namespace hatch;

proc_result executable::operator()(std::vector<std::string> args,
                                   run_options              opts,
                                   std::source_location     loc) const {
    auto frame_scope = boost::leaf::on_error(
        [frame = recipe_frame::here(loc)](e_recipe_trace& trace) { trace.value.push_back(frame); });

    auto command = _command;
    command.insert(command.end(), args.begin(), args.end());

    auto env = _default_env;
    for (auto& [key, value] : opts.extra_env) {
        env.insert_or_assign(key, value);
    }

    auto cmd_str = quote_command(command);
    hatch_log(debug, "Running: {}", cmd_str);
    auto res = run_proc(proc_options{
        .command   = command,
        .cwd       = opts.cwd,
        .extra_env = std::move(env),
    });

    if (_log_path) {
        append_file(*_log_path, neo::ufmt("==> [{}]\n{}", cmd_str, res.output));
    }

    if (!res.okay() && opts.fail_on_error) {
        auto message = res.signal != 0
            ? neo::ufmt("Command terminated by signal {}:\n    '{}'", res.signal, cmd_str)
            : neo::ufmt("Command exited with status {}:\n    '{}'", res.retc, cmd_str);
        BOOST_LEAF_THROW_EXCEPTION(process_error(message, command, res.retc, res.signal));
    }
    return res;
}

std::vector<std::string> make_executable::make_args(std::vector<std::string> args,
                                                    options&                 opts) const {
    const bool disabled = getenv_bool("HATCH_NO_PARALLEL_MAKE");
    const bool parallel = !disabled && opts.parallel.value_or(_jobs > 1);
    if (parallel) {
        args.insert(args.begin(), neo::ufmt("-j{}", _jobs));
        if (!opts.jobs_env.empty()) {
            opts.run.extra_env.insert_or_assign(opts.jobs_env, std::to_string(_jobs));
        }
    }
    return args;
}

proc_result make_executable::operator()(std::vector<std::string> args,
                                        options                  opts,
                                        std::source_location     loc) const {
    auto full_args = make_args(std::move(args), opts);
    return executable::operator()(std::move(full_args), std::move(opts.run), loc);
}
