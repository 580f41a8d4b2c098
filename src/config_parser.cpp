#include "terranoise/config_parser.hpp"

#include <cctype>
#include <cerrno>
#include <cstdlib>
#include <fstream>
#include <limits>
#include <iostream>
#include <sstream>

namespace terranoise {

namespace {

std::string_view trim(std::string_view s) {
    while (!s.empty() && std::isspace(static_cast<unsigned char>(s.front()))) {
        s.remove_prefix(1);
    }
    while (!s.empty() && std::isspace(static_cast<unsigned char>(s.back()))) {
        s.remove_suffix(1);
    }
    return s;
}

}  // namespace

// ============================================================================
// ConfigValue
// ============================================================================

double ConfigValue::asDouble(double defaultVal) const {
    if (text_.empty()) return defaultVal;

    char* end;
    double val = std::strtod(text_.c_str(), &end);
    if (end == text_.c_str()) return defaultVal;
    return val;
}

int ConfigValue::asInt(int defaultVal) const {
    if (!isInteger()) return defaultVal;

    long long val = std::strtoll(text_.c_str(), nullptr, 10);
    if (val < std::numeric_limits<int>::min() || val > std::numeric_limits<int>::max()) {
        return defaultVal;
    }
    return static_cast<int>(val);
}

uint64_t ConfigValue::asUInt64(uint64_t defaultVal) const {
    if (!isUnsigned()) return defaultVal;
    return static_cast<uint64_t>(std::strtoull(text_.c_str(), nullptr, 10));
}

bool ConfigValue::isNumber() const {
    if (text_.empty()) return false;

    char* end;
    std::strtod(text_.c_str(), &end);
    return end == text_.c_str() + text_.size();
}

bool ConfigValue::isInteger() const {
    if (text_.empty()) return false;

    char* end;
    errno = 0;
    std::strtoll(text_.c_str(), &end, 10);
    return end == text_.c_str() + text_.size() && errno != ERANGE;
}

bool ConfigValue::isUnsigned() const {
    // strtoull accepts a leading '-' and negates the result
    if (text_.empty() || !std::isdigit(static_cast<unsigned char>(text_.front()))) return false;

    char* end;
    errno = 0;
    std::strtoull(text_.c_str(), &end, 10);
    return end == text_.c_str() + text_.size() && errno != ERANGE;
}

// ============================================================================
// ConfigDocument
// ============================================================================

void ConfigDocument::addEntry(ConfigEntry entry) {
    entries_.push_back(std::move(entry));
}

const ConfigEntry* ConfigDocument::get(std::string_view key) const {
    // Return last entry with this key (later overrides earlier)
    for (auto it = entries_.rbegin(); it != entries_.rend(); ++it) {
        if (it->key == key) {
            return &(*it);
        }
    }
    return nullptr;
}

std::string_view ConfigDocument::getString(std::string_view key, std::string_view defaultVal) const {
    if (auto* entry = get(key)) {
        auto sv = entry->value.asString();
        if (!sv.empty()) return sv;
    }
    return defaultVal;
}

double ConfigDocument::getDouble(std::string_view key, double defaultVal) const {
    if (auto* entry = get(key)) {
        return entry->value.asDouble(defaultVal);
    }
    return defaultVal;
}

int ConfigDocument::getInt(std::string_view key, int defaultVal) const {
    if (auto* entry = get(key)) {
        return entry->value.asInt(defaultVal);
    }
    return defaultVal;
}

uint64_t ConfigDocument::getUInt64(std::string_view key, uint64_t defaultVal) const {
    if (auto* entry = get(key)) {
        return entry->value.asUInt64(defaultVal);
    }
    return defaultVal;
}

// ============================================================================
// ConfigParser
// ============================================================================

std::optional<ConfigDocument> ConfigParser::parseFile(const std::string& path) const {
    return parseFileAt(path, 0);
}

ConfigDocument ConfigParser::parseString(std::string_view content, const std::string& basePath) const {
    ConfigDocument doc;
    parseInto(content, basePath, 0, doc);
    return doc;
}

std::optional<ConfigDocument> ConfigParser::parseFileAt(const std::string& path, int depth) const {
    std::ifstream file(path);
    if (!file.is_open()) {
        return std::nullopt;
    }

    std::stringstream buffer;
    buffer << file.rdbuf();

    // Extract base path for relative includes
    std::string basePath;
    auto lastSlash = path.find_last_of("/\\");
    if (lastSlash != std::string::npos) {
        basePath = path.substr(0, lastSlash + 1);
    }

    ConfigDocument doc;
    parseInto(buffer.str(), basePath, depth, doc);
    return doc;
}

void ConfigParser::parseInto(std::string_view content, const std::string& basePath,
                             int depth, ConfigDocument& doc) const {
    std::string_view remaining = content;
    int lineNum = 0;

    while (!remaining.empty()) {
        auto lineEnd = remaining.find('\n');
        std::string_view line;
        if (lineEnd == std::string_view::npos) {
            line = remaining;
            remaining = {};
        } else {
            line = remaining.substr(0, lineEnd);
            remaining = remaining.substr(lineEnd + 1);
        }
        ++lineNum;

        // Remove trailing \r if present (Windows line endings)
        if (!line.empty() && line.back() == '\r') {
            line.remove_suffix(1);
        }

        parseLine(line, lineNum, basePath, depth, doc);
    }
}

void ConfigParser::parseLine(std::string_view line, int lineNum, const std::string& basePath,
                             int depth, ConfigDocument& doc) const {
    line = trim(line);
    if (line.empty() || line.front() == '#') {
        return;
    }

    auto colonPos = line.find(':');
    if (colonPos == std::string_view::npos) {
        std::cerr << "[ConfigParser] Line " << lineNum << ": expected 'key: value', got '"
                  << line << "'\n";
        return;
    }

    ConfigEntry entry;
    entry.key = std::string(trim(line.substr(0, colonPos)));
    entry.line = lineNum;
    auto rest = trim(line.substr(colonPos + 1));

    if (entry.key.empty()) {
        std::cerr << "[ConfigParser] Line " << lineNum << ": missing key\n";
        return;
    }

    if (entry.key == "include") {
        if (depth >= kMaxIncludeDepth) {
            std::cerr << "[ConfigParser] Include depth limit reached at '" << rest << "'\n";
            return;
        }

        std::string includePath(rest);
        std::string resolvedPath = includeResolver_ ? includeResolver_(includePath)
                                                    : basePath + includePath;

        if (auto included = parseFileAt(resolvedPath, depth + 1)) {
            for (const auto& e : *included) {
                doc.addEntry(e);
            }
        } else {
            std::cerr << "[ConfigParser] Cannot open included file: " << resolvedPath << '\n';
        }
        return;
    }

    entry.value = ConfigValue(rest);
    doc.addEntry(std::move(entry));
}

}  // namespace terranoise
