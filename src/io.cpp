#include "tweetprep/io.hpp"

#include <stdexcept>

#include <fmt/format.h>

namespace tweetprep::io {

NoSuchFile::NoSuchFile(std::string const& file)
    : m_message(fmt::format("No such file: {}", file)) {}

auto NoSuchFile::what() const noexcept -> char const* {
    return m_message.c_str();
}

auto resolve_path(std::string const& file) -> boost::filesystem::path {
    boost::filesystem::path p(file);
    if (not boost::filesystem::exists(p)) {
        throw NoSuchFile(file);
    }
    return p;
}

auto open_input(std::string const& file) -> std::ifstream {
    auto path = resolve_path(file);
    if (boost::filesystem::is_directory(path)) {
        throw std::runtime_error(fmt::format("Cannot read file: {} is a directory", file));
    }
    std::ifstream is(path.string());
    if (not is) {
        throw std::runtime_error(fmt::format("Cannot read file: {}", file));
    }
    return is;
}

auto read_string_vector(std::string const& filename) -> std::vector<std::string> {
    std::vector<std::string> vec;
    auto is = open_input(filename);
    for_each_line(is, [&](std::string const& line) { vec.push_back(line); });
    return vec;
}

}  // namespace tweetprep::io
