#pragma once

#include <string>
#include <vector>

#include "pwf/Validator.hpp"

namespace pwf {

// ^[A-Za-z_$][A-Za-z0-9_$]*$
bool is_identifier(const std::string& s);

// Appends one segment using the canonical path grammar:
//   index            -> path[N]
//   identifier key   -> path.key   (no dot at the root)
//   any other key    -> path['k\'ey']   (\ and ' escaped with a backslash)
std::string append_segment(const std::string& path, const PathSegment& segment);

// "" for the document root.
std::string format_path(const std::vector<PathSegment>& location);

// Location of the violation plus, for required / additionalProperties,
// the missing or unexpected property name.
std::string resolve_path(const RawViolation& violation);

}  // namespace pwf
