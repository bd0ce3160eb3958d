#include "precision/pipeline/gitInfo.hpp"

#include <array>
#include <cstdio>

namespace cutprec::precision::pipeline {

std::optional<std::string> gitCommit() {
	FILE* pipe = popen("git rev-parse HEAD 2>/dev/null", "r");
	if (!pipe) {
		return std::nullopt;
	}

	std::string output;
	std::array<char, 128> buffer{};
	while (fgets(buffer.data(), static_cast<int>(buffer.size()), pipe) != nullptr) {
		output += buffer.data();
	}
	if (pclose(pipe) != 0) {
		return std::nullopt;
	}

	while (!output.empty() && (output.back() == '\n' || output.back() == '\r' || output.back() == ' ')) {
		output.pop_back();
	}
	if (output.empty()) {
		return std::nullopt;
	}
	return output;
}

} // namespace cutprec::precision::pipeline
