#pragma once

#include <chrono>
#include <optional>
#include <string>

// ISO-8601 / RFC 3339 timestamps as exchanged with the control plane.
std::optional<std::chrono::system_clock::time_point> ParseIso8601(const std::string& value);
std::string FormatIso8601(std::chrono::system_clock::time_point time);
