#pragma once

#include <string>
#include <string_view>
#include <filesystem>

namespace fs = std::filesystem;

// Calculates the SHA256 hash of a file as lowercase hex.
// Throws PlugupException if the file cannot be opened.
std::string calculate_sha256(const fs::path& file_path);

std::string sha256_hex(std::string_view data);
