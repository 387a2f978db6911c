#pragma once

#include <exception>
#include <fstream>
#include <istream>
#include <string>
#include <vector>

#include <boost/filesystem.hpp>

namespace tweetprep::io {

/// Indicates that a file was not found.
///
/// As opposed to the standard c++ IO error, this one preserves the file name in the message for
/// more informative logging.
class NoSuchFile: public std::exception {
  public:
    explicit NoSuchFile(std::string const& file);
    [[nodiscard]] auto what() const noexcept -> char const* override;

  private:
    std::string m_message;
};

/// Resolves string as a path; throws NoSuchFile if the file does not exist.
[[nodiscard]] auto resolve_path(std::string const& file) -> boost::filesystem::path;

/// Opens an existing file for reading; throws NoSuchFile, or `std::runtime_error` if the path
/// is a directory or the file cannot be opened.
[[nodiscard]] auto open_input(std::string const& file) -> std::ifstream;

/// Reads a vector of strings from a newline-delimited text file; throws NoSuchFile.
[[nodiscard]] auto read_string_vector(std::string const& filename) -> std::vector<std::string>;

template <typename Function>
void for_each_line(std::istream& is, Function fn) {
    std::string line;
    while (std::getline(is, line)) {
        fn(line);
    }
}

}  // namespace tweetprep::io
