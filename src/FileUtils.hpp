#pragma once
#include <cstdint>
#include <filesystem>
#include <string>

// Reads up to limit + 1 bytes of a file into out, so an oversized file shows up as
// out.size() > limit. A file that shrinks while being read just yields fewer bytes.
// Returns false if the file cannot be opened; throws std::runtime_error on a read fault.
bool read_bounded(const std::filesystem::path& path, std::uint64_t limit, std::string& out);
