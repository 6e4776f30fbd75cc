#pragma once

#include <compare>
#include <string>
#include <string_view>

// Semantic-version ordering: dot-separated numeric release part, optional
// "-prerelease" suffix that sorts before the plain release. A leading 'v' is ignored.
std::strong_ordering compare_versions(std::string_view v1, std::string_view v2);

// True when v1 < v2.
bool version_compare(std::string_view v1, std::string_view v2);

// First "digits(.digits)+" token of a release tag ("v2.1.0" -> "2.1.0"), or "".
std::string extract_version_token(std::string_view tag);
