#include "pattern_parser.h"
#include <rasx/logging.h>
#include <algorithm>
#include <fstream>
#include <optional>
#include <sstream>
#include <stdexcept>
#include <filesystem>

namespace rasx {

namespace {

int GetIndentation(const std::string& line) {
    int indent = 0;
    for (char c : line) {
        if (c == ' ' || c == '\t') {
            indent++;
        } else {
            break;
        }
    }
    return indent;
}

std::string Trim(std::string s) {
    s.erase(0, s.find_first_not_of(" \t\r"));
    s.erase(s.find_last_not_of(" \t\r") + 1);
    return s;
}

// Cut a trailing "# comment"; '#' inside single or double quotes is kept.
std::string StripComment(const std::string& line) {
    char quote = 0;
    for (size_t i = 0; i < line.size(); ++i) {
        const char c = line[i];
        if (quote) {
            if (c == quote) quote = 0;
        } else if (c == '"' || c == '\'') {
            quote = c;
        } else if (c == '#') {
            return line.substr(0, i);
        }
    }
    return line;
}

std::string StripQuotes(const std::string& s) {
    if (s.size() >= 2 && ((s.front() == '"' && s.back() == '"') || (s.front() == '\'' && s.back() == '\''))) {
        return s.substr(1, s.size() - 2);
    }
    return s;
}

/**
 * @brief Split "a, b" or "[a, b]" into trimmed, unquoted items.
 */
std::vector<std::string> ParseList(const std::string& value) {
    std::string inner = value;
    if (!inner.empty() && inner.front() == '[') {
        if (inner.back() != ']') {
            throw std::runtime_error("unterminated list '" + value + "'");
        }
        inner = inner.substr(1, inner.size() - 2);
    }
    std::vector<std::string> items;
    std::stringstream ss(inner);
    std::string token;
    while (std::getline(ss, token, ',')) {
        token = StripQuotes(Trim(token));
        if (!token.empty()) {
            items.push_back(token);
        }
    }
    return items;
}

[[noreturn]] void ThrowAt(const std::filesystem::path& path, int line_number, const std::string& what) {
    std::ostringstream oss;
    oss << "Error parsing pattern file " << path.string() << " at line " << line_number << ": " << what;
    throw std::runtime_error(oss.str());
}

} // anonymous namespace

std::filesystem::path FindPatternFile(const std::filesystem::path& directory) {
    std::vector<std::filesystem::path> candidates;
    std::error_code ec;
    for (std::filesystem::directory_iterator it(directory, ec), end; !ec && it != end; it.increment(ec)) {
        if (!it->is_regular_file(ec)) {
            continue;
        }
        const std::string filename = it->path().filename().string();
        const std::string suffix = ".patterns.yaml";
        if (filename.length() > suffix.length() &&
            filename.compare(filename.length() - suffix.length(), suffix.length(), suffix) == 0) {
            candidates.push_back(it->path());
        }
    }
    if (candidates.empty()) {
        return {};
    }
    std::sort(candidates.begin(), candidates.end());
    return candidates.front();
}

PatternTable ReadPatternTable(const std::filesystem::path& pattern_path) {
    std::ifstream file(pattern_path);
    if (!file.is_open()) {
        throw std::runtime_error("Could not open pattern file: " + pattern_path.string());
    }

    PatternTable table;
    table.name = pattern_path.stem().stem().string();
    std::optional<DataBucket> section;
    int section_indent = 0;
    int line_number = 0;
    std::string line;

    while (std::getline(file, line)) {
        line_number++;

        line = StripComment(line);
        const std::string trimmed = Trim(line);
        if (trimmed.empty()) {
            continue;
        }

        const size_t colon_pos = trimmed.find(':');
        if (colon_pos == std::string::npos) {
            ThrowAt(pattern_path, line_number, "expected 'key: value'");
        }
        const std::string key = StripQuotes(Trim(trimmed.substr(0, colon_pos)));
        const std::string value = Trim(trimmed.substr(colon_pos + 1));
        const int indent = GetIndentation(line);

        if (section && indent > section_indent) {
            PatternEntry entry;
            entry.bucket = *section;
            entry.key = key;
            try {
                entry.substrings = ParseList(value);
            } catch (const std::runtime_error& e) {
                ThrowAt(pattern_path, line_number, e.what());
            }
            if (entry.substrings.empty()) {
                ThrowAt(pattern_path, line_number, "entry '" + key + "' has no substrings");
            }
            table.entries.push_back(std::move(entry));
            continue;
        }

        section.reset();
        if (key == "name") {
            table.name = StripQuotes(value);
        } else if (key == "version") {
            try {
                table.version = std::stoi(value);
            } catch (const std::exception&) {
                ThrowAt(pattern_path, line_number, "version must be an integer, got '" + value + "'");
            }
        } else if (key == "geometry" || key == "results") {
            if (!value.empty()) {
                ThrowAt(pattern_path, line_number, "section '" + key + "' must be followed by indented entries");
            }
            section = key == "geometry" ? DataBucket::Geometry : DataBucket::Results;
            section_indent = indent;
        } else {
            debug::LogDebug("Ignoring unknown pattern file key '" + key + "'");
        }
    }

    debug::LogDebug("Loaded pattern table " + table.Label() + " with " + std::to_string(table.entries.size()) +
                    " entries from " + pattern_path.string());
    return table;
}

} // namespace rasx
