#pragma once

#include <nlohmann/json.hpp>

#include <optional>
#include <string>

constexpr int kMaxJsonDepth = 64;

// Returns a discarded value when the text is malformed or nests deeper than maxDepth.
nlohmann::json ParseJsonWithDepthLimit(const std::string& text, int maxDepth = kMaxJsonDepth);

// Case-insensitive member lookup; returns nullptr when absent or when `object` is not an object.
const nlohmann::json* FindMemberIgnoreCase(const nlohmann::json& object, const std::string& name);

std::optional<std::string> GetStringIgnoreCase(const nlohmann::json& object, const std::string& name);
