#pragma once

#include <cstdint>
#include <functional>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace terranoise {

// ============================================================================
// ConfigValue - A parsed configuration value
// ============================================================================

/**
 * @brief The text after a key's colon, with typed accessors
 *
 * asDouble returns the supplied default when the text does not start with a
 * number. The integer accessors are strict: the whole text must be an integer
 * that fits the result type, otherwise the default is returned.
 */
class ConfigValue {
public:
    ConfigValue() = default;
    explicit ConfigValue(std::string_view text) : text_(text) {}

    [[nodiscard]] std::string_view asString() const { return text_; }

    [[nodiscard]] double asDouble(double defaultVal = 0.0) const;
    [[nodiscard]] int asInt(int defaultVal = 0) const;
    [[nodiscard]] uint64_t asUInt64(uint64_t defaultVal = 0) const;

    /// True if the whole text parses as a number
    [[nodiscard]] bool isNumber() const;

    /// True if the whole text is a base-10 integer within int64_t range
    [[nodiscard]] bool isInteger() const;

    /// True if the whole text is a base-10 integer within uint64_t range, without a sign
    [[nodiscard]] bool isUnsigned() const;

    [[nodiscard]] bool empty() const { return text_.empty(); }

private:
    std::string text_;
};

// ============================================================================
// ConfigEntry / ConfigDocument
// ============================================================================

struct ConfigEntry {
    std::string key;
    ConfigValue value;
    int line = 0;  // 1-based line in the file that defined it
};

/**
 * @brief Entries of a parsed configuration, in file order
 *
 * Multiple entries may share a key; lookups return the last one, so later
 * lines (and files included later) override earlier ones.
 */
class ConfigDocument {
public:
    ConfigDocument() = default;

    void addEntry(ConfigEntry entry);

    // Lookup by key (returns last entry with this key, or nullptr)
    [[nodiscard]] const ConfigEntry* get(std::string_view key) const;
    [[nodiscard]] bool has(std::string_view key) const { return get(key) != nullptr; }

    [[nodiscard]] std::string_view getString(std::string_view key, std::string_view defaultVal = "") const;
    [[nodiscard]] double getDouble(std::string_view key, double defaultVal = 0.0) const;
    [[nodiscard]] int getInt(std::string_view key, int defaultVal = 0) const;
    [[nodiscard]] uint64_t getUInt64(std::string_view key, uint64_t defaultVal = 0) const;

    [[nodiscard]] const std::vector<ConfigEntry>& entries() const { return entries_; }
    [[nodiscard]] auto begin() const { return entries_.begin(); }
    [[nodiscard]] auto end() const { return entries_.end(); }
    [[nodiscard]] bool empty() const { return entries_.empty(); }
    [[nodiscard]] size_t size() const { return entries_.size(); }

private:
    std::vector<ConfigEntry> entries_;
};

// ============================================================================
// ConfigParser
// ============================================================================

/**
 * @brief Parser for line-based configuration files
 *
 * Format:
 * ```
 * # Comments start with #
 * model: ridged
 * frequency: 2.0
 * include: base.noise
 * ```
 *
 * An `include:` line is replaced by the entries of the named file. Relative
 * paths resolve against the including file's directory unless an include
 * resolver is set.
 */
class ConfigParser {
public:
    using IncludeResolver = std::function<std::string(const std::string&)>;

    /// Nesting limit for include directives
    static constexpr int kMaxIncludeDepth = 16;

    ConfigParser() = default;

    void setIncludeResolver(IncludeResolver resolver) { includeResolver_ = std::move(resolver); }

    /// @return Parsed document, or nullopt if the file cannot be read
    [[nodiscard]] std::optional<ConfigDocument> parseFile(const std::string& path) const;

    [[nodiscard]] ConfigDocument parseString(std::string_view content,
                                             const std::string& basePath = "") const;

private:
    std::optional<ConfigDocument> parseFileAt(const std::string& path, int depth) const;
    void parseInto(std::string_view content, const std::string& basePath,
                   int depth, ConfigDocument& doc) const;
    void parseLine(std::string_view line, int lineNum, const std::string& basePath,
                   int depth, ConfigDocument& doc) const;

    IncludeResolver includeResolver_;
};

}  // namespace terranoise
