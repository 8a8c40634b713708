#include "./parse.hpp"

#include "./errors.hpp"

#include <hatch/error/on_error.hpp>
#include <hatch/util/fs/io.hpp>

#include <boost/leaf/exception.hpp>
#include <yaml-cpp/exceptions.h>
#include <yaml-cpp/node/parse.h>

#include <string>

using namespace hatch;

YAML::Node hatch::parse_yaml_file(const std::filesystem::path& fpath) {
    HATCH_E_SCOPE(e_parse_yaml_file_path{fpath});
    auto content = hatch::read_file(fpath);
    return parse_yaml_string(content);
}

YAML::Node hatch::parse_yaml_string(std::string_view sv) {
    try {
        return YAML::Load(std::string(sv));
    } catch (YAML::Exception const& exc) {
        BOOST_LEAF_THROW_EXCEPTION(exc, e_yaml_parse_error{exc.what()});
    }
}
