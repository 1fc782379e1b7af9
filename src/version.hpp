#pragma once

#include <string>

// Semantic version helpers tolerant of leading zeros ("01.02.03" == "1.2.3").
// Anything after ':' is ignored, build metadata does not affect ordering.
// Invalid versions sort before valid ones.
int version_compare(const std::string& v1, const std::string& v2);

// Compares `version` to a range "low[:high]"; an empty or "_" high bound is unbounded.
// Returns 0 inside the range, -1 below low, 1 above high.
int version_compare_range(const std::string& version, const std::string& range);

std::string version_major(const std::string& version);
std::string version_major_minor(const std::string& version);

bool version_has_meta(const std::string& version);
std::string version_strip_meta(const std::string& version);

// Strict x.y.z[-pre][+meta] grammar, no range syntax.
bool is_version_valid(const std::string& version);

// True if `stored` satisfies an exact request. A request without build
// metadata matches a stored version that carries some.
bool version_matches(const std::string& stored, const std::string& requested);

// "1.0.0:_" -> ">=1.0.0", anything else unchanged.
std::string format_version_range(const std::string& range);
