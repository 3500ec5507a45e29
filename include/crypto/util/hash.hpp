#pragma once

#include <string>
#include <filesystem>

namespace dd::crypto::hash {

// Streams the file through BLAKE2b and returns the hex digest.
// Throws std::system_error carrying the errno of a failed open or read.
std::string blake2b(const std::filesystem::path& filepath);

}
