#pragma once

#include <string>

// Requirement sentinels. Any other requirement names an exact version id.
inline constexpr const char* SYSTEM_REQUIREMENT = "system";
inline constexpr const char* ANY_REQUIREMENT = "any";

bool is_valid_version_id(const std::string& id);
// Throws RtmException(InvalidArgument) for ids that cannot name a cache directory.
void validate_version_id(const std::string& id);

// Natural ordering of version ids: "ge-8.9" < "ge-8.26" < "ge-9.1".
bool version_compare(const std::string& v1_str, const std::string& v2_str);
