#include "CommandValidator.hpp"
#include "TimeUtils.hpp"
#include "Uuid.hpp"

#include <nlohmann/json.hpp>

#include <chrono>
#include <cstddef>
#include <iostream>
#include <string>

namespace {
int Fail(const std::string& message) {
    std::cerr << message << std::endl;
    return 1;
}

const Uuid kNode = *Uuid::Parse("6f1c2a4e-9b3d-4c1a-8f5e-2d7b9a0c1e34");
const Uuid kOrg = *Uuid::Parse("0b8e7f6a-5c4d-4e3f-9a2b-1c0d9e8f7a6b");
const Uuid kOtherOrg = *Uuid::Parse("11111111-2222-4333-8444-555555555555");
const auto kNow = *ParseIso8601("2026-03-01T12:00:00Z");

nlohmann::json Command() {
    return {
        {"commandId", "a3f1e2d4-5b6c-4d7e-8f90-1a2b3c4d5e6f"},
        {"commandType", "file.download"},
        {"nodeId", kNode.ToString()},
        {"organizationId", kOrg.ToString()},
        {"issuedAt", "2026-03-01T11:59:00Z"},
        {"expiresAt", "2026-03-01T12:05:00Z"},
        {"priority", "High"},
        {"payload", {{"sourceUrl", "https://files.example/a.bin"}}}
    };
}

CommandValidator Validator() {
    return CommandValidator(kNode, kOrg, [] { return kNow; });
}
} // namespace

int main() {
    const auto accepted = Validator().Validate(Command().dump());
    if (!accepted.Accepted()) {
        return Fail(std::string("Valid command rejected: ") + ToString(accepted.rejection));
    }
    if (accepted.envelope->priority != CommandPriority::High) {
        return Fail("Priority not parsed.");
    }
    if (nlohmann::json::parse(accepted.envelope->payloadJson)["sourceUrl"] != "https://files.example/a.bin") {
        return Fail("Inline payload object not preserved: " + accepted.envelope->payloadJson);
    }

    nlohmann::json caseInsensitive = Command();
    caseInsensitive.erase("commandType");
    caseInsensitive["CommandType"] = "file.upload";
    if (!Validator().Validate(caseInsensitive.dump()).Accepted()) {
        return Fail("Member names are matched case-insensitively.");
    }

    const std::string oversized(CommandEnvelope::kMaxPayloadBytes + 1, ' ');
    if (Validator().Validate(oversized).rejection != CommandRejection::PayloadTooLarge) {
        return Fail("Oversized payload not rejected by size.");
    }

    // 90,000 three-byte characters: under the limit in characters, over it in bytes.
    constexpr std::size_t kEuroCount = 90000;
    std::string euros;
    for (std::size_t i = 0; i < kEuroCount; ++i) {
        euros += "\xE2\x82\xAC";
    }
    nlohmann::json wide = Command();
    wide["payload"] = {{"note", euros}};
    const std::string wideMessage = wide.dump();
    if (wideMessage.size() <= CommandEnvelope::kMaxPayloadBytes || kEuroCount >= CommandEnvelope::kMaxPayloadBytes) {
        return Fail("Multi-byte payload fixture is not sized as intended.");
    }
    if (Validator().Validate(wideMessage).rejection != CommandRejection::PayloadTooLarge) {
        return Fail("Payload size must be counted in UTF-8 bytes, not characters.");
    }

    if (Validator().Validate("{not json").rejection != CommandRejection::Malformed) {
        return Fail("Malformed JSON not rejected.");
    }

    std::string deep;
    for (int i = 0; i < 200; ++i) {
        deep += "[";
    }
    if (Validator().Validate(deep).rejection != CommandRejection::Malformed) {
        return Fail("Deeply nested JSON not rejected.");
    }

    nlohmann::json noId = Command();
    noId["commandId"] = "00000000-0000-0000-0000-000000000000";
    if (Validator().Validate(noId.dump()).rejection != CommandRejection::Malformed) {
        return Fail("Nil commandId must be malformed.");
    }

    nlohmann::json noNode = Command();
    noNode.erase("nodeId");
    CommandValidator unenrolled(std::nullopt, kOrg, [] { return kNow; });
    if (unenrolled.Validate(noNode.dump()).rejection != CommandRejection::Malformed) {
        return Fail("A command without a node id must be malformed.");
    }
    noNode["nodeId"] = Uuid().ToString();
    if (unenrolled.Validate(noNode.dump()).rejection != CommandRejection::Malformed) {
        return Fail("A nil node id must be malformed.");
    }

    nlohmann::json otherNode = Command();
    otherNode["nodeId"] = kOtherOrg.ToString();
    if (Validator().Validate(otherNode.dump()).rejection != CommandRejection::NodeMismatch) {
        return Fail("Command for another node not rejected.");
    }

    nlohmann::json noOrg = Command();
    noOrg.erase("organizationId");
    if (Validator().Validate(noOrg.dump()).rejection != CommandRejection::OrganizationMissing) {
        return Fail("Missing organization not rejected.");
    }

    nlohmann::json otherOrg = Command();
    otherOrg["organizationId"] = kOtherOrg.ToString();
    if (Validator().Validate(otherOrg.dump()).rejection != CommandRejection::OrganizationMismatch) {
        return Fail("Cross-tenant command not rejected.");
    }

    CommandValidator unscoped(std::nullopt, std::nullopt, [] { return kNow; });
    if (!unscoped.Validate(noOrg.dump()).Accepted()) {
        return Fail("Without a configured organization the check is skipped.");
    }

    nlohmann::json expired = Command();
    expired["expiresAt"] = "2026-03-01T11:59:59Z";
    if (Validator().Validate(expired.dump()).rejection != CommandRejection::Expired) {
        return Fail("Expired command not rejected.");
    }

    nlohmann::json badTime = Command();
    badTime["expiresAt"] = "tomorrow";
    if (Validator().Validate(badTime.dump()).rejection != CommandRejection::Malformed) {
        return Fail("Unparseable expiry must be malformed.");
    }

    if (SanitizeCommandType("file.download") != "file.download") {
        return Fail("Known type must pass through.");
    }
    if (SanitizeCommandType("attacker.chosen.value") != "Unknown") {
        return Fail("Unknown type must collapse.");
    }
    if (SanitizeCommandType(std::string(65, 'a')) != "Unknown" || SanitizeCommandType("") != "Unknown") {
        return Fail("Empty or long types must collapse.");
    }

    return 0;
}
