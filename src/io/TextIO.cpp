#include "io/TextIO.hpp"

#include <fstream>
#include <sstream>
#include <stdexcept>

namespace fs = std::filesystem;

namespace io {

std::string read_text_file(const fs::path& path) {
    std::ifstream in(path, std::ios::in | std::ios::binary);
    if (!in) {
        throw std::runtime_error("failed to open file: " + path.string());
    }

    std::ostringstream oss;
    oss << in.rdbuf();
    if (in.bad()) {
        throw std::runtime_error("failed to read file: " + path.string());
    }
    return oss.str();
}

void write_text_file(const fs::path& path, const std::string& text) {
    if (path.has_parent_path()) fs::create_directories(path.parent_path());

    std::ofstream out(path, std::ios::out | std::ios::trunc | std::ios::binary);
    if (!out) {
        throw std::runtime_error("failed to open output file: " + path.string());
    }
    out << text;
    if (!out) {
        throw std::runtime_error("failed to write file: " + path.string());
    }
}

}  // namespace io
