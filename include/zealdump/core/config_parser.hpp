#pragma once

/**
 * @file config_parser.hpp
 * @brief Line-based "key: value" configuration files
 */

#include <cstdint>
#include <functional>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace zealdump {

// ============================================================================
// ConfigValue - A parsed configuration value
// ============================================================================

class ConfigValue {
public:
    ConfigValue() = default;
    explicit ConfigValue(std::string_view text) : text_(text) {}

    [[nodiscard]] std::string_view asString() const { return text_; }

    // true/yes/on/1 and false/no/off/0; anything else gives defaultVal
    [[nodiscard]] bool asBool(bool defaultVal = false) const;

    // Strict: the whole text must be a decimal or 0x-prefixed hex integer
    [[nodiscard]] std::optional<int64_t> asInteger() const;

    [[nodiscard]] bool empty() const { return text_.empty(); }

private:
    std::string text_;
};

// A single "key: value" line
struct ConfigEntry {
    std::string key;
    ConfigValue value;
    size_t line = 0;  // 1-based line number in the file it came from
};

// ============================================================================
// ConfigDocument - All entries of a config file, in order
// ============================================================================
//
// Lookups return the last entry with a key, so later lines (and lines after
// an include) override earlier ones.
//
class ConfigDocument {
public:
    ConfigDocument() = default;

    void addEntry(ConfigEntry entry);

    [[nodiscard]] const ConfigEntry* get(std::string_view key) const;
    [[nodiscard]] bool has(std::string_view key) const { return get(key) != nullptr; }

    [[nodiscard]] std::string_view getString(std::string_view key, std::string_view defaultVal = "") const;

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
 * @brief Parser for simple configuration files
 *
 * Format:
 * ```
 * # Comments start with #
 * device: /dev/ttyUSB0
 * baud: 57600
 * include: local.conf
 * ```
 *
 * Lines without a colon are ignored. `include:` pulls in another file at
 * that point; its path is resolved by the include resolver if one is set,
 * otherwise relative to the including file.
 */
class ConfigParser {
public:
    using IncludeResolver = std::function<std::string(const std::string&)>;

    // Nested includes deeper than this are skipped (guards include cycles)
    static constexpr int MAX_INCLUDE_DEPTH = 8;

    ConfigParser() = default;

    void setIncludeResolver(IncludeResolver resolver) { includeResolver_ = std::move(resolver); }

    /**
     * @brief Parse a configuration file
     * @return Parsed document, or nullopt if the file cannot be read
     */
    [[nodiscard]] std::optional<ConfigDocument> parseFile(const std::string& path) const;

    /**
     * @brief Parse configuration from a string
     * @param basePath Directory prefix for relative includes (with trailing slash)
     */
    [[nodiscard]] ConfigDocument parseString(std::string_view content,
                                             const std::string& basePath = "") const;

private:
    std::optional<ConfigDocument> parseFileAt(const std::string& path, int depth) const;
    void parseInto(std::string_view content, const std::string& basePath,
                   ConfigDocument& doc, int depth) const;
    void parseLine(std::string_view line, size_t lineNumber, const std::string& basePath,
                   ConfigDocument& doc, int depth) const;

    IncludeResolver includeResolver_;
};

}  // namespace zealdump
