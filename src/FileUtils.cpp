#include "FileUtils.hpp"
#include <fstream>
#include <limits>
#include <stdexcept>

bool read_bounded(const std::filesystem::path& path, std::uint64_t limit, std::string& out) {
	std::ifstream in(path, std::ios::binary);
	if (!in) {
		return false;
	}

	std::uint64_t cap = limit < std::numeric_limits<std::uint64_t>::max() ? limit + 1 : limit;
	const std::size_t chunkSize = 64 * 1024;
	char buffer[chunkSize];
	out.clear();

	while (out.size() < cap) {
		std::uint64_t want = cap - out.size();
		if (want > chunkSize) {
			want = chunkSize;
		}
		in.read(buffer, static_cast<std::streamsize>(want));
		std::streamsize got = in.gcount();
		if (got > 0) {
			out.append(buffer, static_cast<std::size_t>(got));
		}
		if (in.eof()) {
			break;
		}
		if (!in) {
			throw std::runtime_error("Failed to read file: " + path.string());
		}
	}
	return true;
}
