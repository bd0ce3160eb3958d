#pragma once

#include <optional>
#include <string>

namespace cutprec::precision::pipeline {

//! Commit hash of the working directory's git checkout. Empty if git is unavailable or this is no repository.
std::optional<std::string> gitCommit();

} // namespace cutprec::precision::pipeline
