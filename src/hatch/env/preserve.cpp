#include "./preserve.hpp"

#include <hatch/util/env.hpp>
#include <hatch/util/log.hpp>

#include <exception>

using namespace hatch;

preserve_environment::preserve_environment(std::initializer_list<std::string> names) {
    for (auto& name : names) {
        _saved.emplace_back(name, hatch::getenv(name));
    }
}

preserve_environment::~preserve_environment() {
    for (auto& [name, value] : _saved) {
        try {
            auto now = hatch::getenv(name);
            if (now == value) {
                continue;
            }
            hatch_log(debug, "Restoring environment variable {} after module loads", name);
            if (value) {
                hatch::setenv(name, *value);
            } else {
                hatch::unsetenv(name);
            }
        } catch (const std::exception& e) {
            hatch_log(error, "Failed to restore environment variable {}: {}", name, e.what());
        }
    }
}
