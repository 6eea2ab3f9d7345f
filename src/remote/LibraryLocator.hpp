#pragma once

#include <string>
#include <vector>

#ifdef _WIN32
constexpr char kSearchPathSeparator = ';';
#else
constexpr char kSearchPathSeparator = ':';
#endif

// Split a VMMCP_LIBRARY_PATHS style list; empty tokens are dropped.
std::vector<std::string> splitSearchPathList(const std::string& list, char sep = kSearchPathSeparator);

// Architecture-specific default locations of the vendor library, most preferred first.
std::vector<std::string> defaultLibraryCandidates();

// Full search order: explicit path, then extra entries, then the defaults.
std::vector<std::string> libraryCandidates(const std::string& explicitPath,
                                           const std::vector<std::string>& extra);

// Absolute candidates that do not exist are not worth a load attempt.
bool shouldSkipCandidate(const std::string& path);
