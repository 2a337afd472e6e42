#pragma once

#include <string>
#include <set>

namespace treecopy {

// Match a candidate name or relative path against a shell-style pattern.
// Supports: * (any run of chars, '/' included), ? (any single char),
//           [abc], [a-z], [!0-9]. An unterminated '[' is a literal.
// Comparison is case-sensitive.
bool glob_match(const std::string& pattern, const std::string& candidate);

// True if any pattern in the set matches the candidate.
bool glob_match_any(const std::set<std::string>& patterns,
                    const std::string& candidate);

} // namespace treecopy
