#pragma once
#include "models/NavigationModel.hpp"
#include <optional>
#include <string>

// Display strings for the navigation and planning screens.
namespace fmt_utils {

double mpsToKmh(double mps);

// "N m" below 1 km, otherwise "X.Y km".
std::string formatDistance(double meters);

// "Hh Mm", or "M min" under an hour.
std::string formatDuration(double seconds);

// "X.Y km/h"
std::string formatSpeed(double mps);

// "--:--" when there is no estimate.
std::string formatTimeRemaining(std::optional<double> seconds);

// No estimate at or below `stopped_mps`.
std::optional<double> estimateTimeRemaining(double distance_remaining_m,
                                            double speed_mps,
                                            double stopped_mps = 0.5);

} // namespace fmt_utils

NavigationViewModel buildViewModel(const NavigationSnapshot &snap);
