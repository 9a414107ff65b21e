#pragma once

#include <filesystem>
#include <string>

namespace io {

// Throws std::runtime_error when the file cannot be opened or read.
std::string read_text_file(const std::filesystem::path& path);

// Creates parent directories. Throws std::runtime_error on failure.
void write_text_file(const std::filesystem::path& path, const std::string& text);

}  // namespace io
