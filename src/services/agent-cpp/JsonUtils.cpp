#include "JsonUtils.hpp"

#include <cctype>

namespace {
bool EqualsIgnoreCase(const std::string& left, const std::string& right) {
    if (left.size() != right.size()) {
        return false;
    }
    for (size_t i = 0; i < left.size(); ++i) {
        if (std::tolower(static_cast<unsigned char>(left[i])) != std::tolower(static_cast<unsigned char>(right[i]))) {
            return false;
        }
    }
    return true;
}
} // namespace

nlohmann::json ParseJsonWithDepthLimit(const std::string& text, int maxDepth) {
    bool tooDeep = false;
    nlohmann::json::parser_callback_t callback =
        [&tooDeep, maxDepth](int depth, nlohmann::json::parse_event_t event, nlohmann::json&) {
            if ((event == nlohmann::json::parse_event_t::object_start
                 || event == nlohmann::json::parse_event_t::array_start)
                && depth >= maxDepth) {
                tooDeep = true;
            }
            return !tooDeep;
        };

    nlohmann::json parsed = nlohmann::json::parse(text, callback, false);
    if (tooDeep) {
        return nlohmann::json(nlohmann::json::value_t::discarded);
    }
    return parsed;
}

const nlohmann::json* FindMemberIgnoreCase(const nlohmann::json& object, const std::string& name) {
    if (!object.is_object()) {
        return nullptr;
    }

    const auto exact = object.find(name);
    if (exact != object.end()) {
        return &exact.value();
    }

    for (auto it = object.begin(); it != object.end(); ++it) {
        if (EqualsIgnoreCase(it.key(), name)) {
            return &it.value();
        }
    }
    return nullptr;
}

std::optional<std::string> GetStringIgnoreCase(const nlohmann::json& object, const std::string& name) {
    const nlohmann::json* member = FindMemberIgnoreCase(object, name);
    if (member == nullptr || !member->is_string()) {
        return std::nullopt;
    }
    return member->get<std::string>();
}
