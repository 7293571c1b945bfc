#pragma once

#include <rasx/pattern_table.h>

#include <filesystem>
#include <string>

namespace rasx {

/// Parse a *.patterns.yaml file into a PatternTable
/// @param pattern_path Path to the pattern file
/// @return PatternTable with entries in file order
/// @throws std::runtime_error if the file cannot be read or a line is malformed
PatternTable ReadPatternTable(const std::filesystem::path& pattern_path);

/// Look for a *.patterns.yaml file in the given directory
/// @param directory Directory to search (not recursive)
/// @return Path to the first pattern file by name, empty path otherwise
std::filesystem::path FindPatternFile(const std::filesystem::path& directory);

} // namespace rasx
