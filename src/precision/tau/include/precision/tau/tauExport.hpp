#pragma once

#include "precision/tau/tauCalibration.hpp"

#include <filesystem>

namespace cutprec::precision::tau {

//! Write the curve as CSV (one row per point). Creates parent directories.
//! \return Absolute path of the written file.
//! \throws std::runtime_error if the file cannot be written.
std::filesystem::path writeTauCurveCsv(const std::filesystem::path& path, const TauCurve& curve);

//! Render classification rates and class mean IPN over tau, with the selected tau marked.
//! \return Absolute path of the written file.
//! \throws std::runtime_error if the image cannot be written.
std::filesystem::path writeTauCurvePng(const std::filesystem::path& path, const TauCurve& curve, double bestTau);

} // namespace cutprec::precision::tau
