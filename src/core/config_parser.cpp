#include "zealdump/core/config_parser.hpp"

#include <cctype>
#include <cerrno>
#include <cstdlib>
#include <fstream>
#include <iostream>
#include <sstream>

namespace zealdump {

namespace {

std::string_view trim(std::string_view text) {
    while (!text.empty() && std::isspace(static_cast<unsigned char>(text.front()))) {
        text.remove_prefix(1);
    }
    while (!text.empty() && std::isspace(static_cast<unsigned char>(text.back()))) {
        text.remove_suffix(1);
    }
    return text;
}

}  // namespace

// ============================================================================
// ConfigValue
// ============================================================================

bool ConfigValue::asBool(bool defaultVal) const {
    if (text_.empty()) return defaultVal;

    if (text_ == "true" || text_ == "yes" || text_ == "1" || text_ == "on") {
        return true;
    }
    if (text_ == "false" || text_ == "no" || text_ == "0" || text_ == "off") {
        return false;
    }
    return defaultVal;
}

std::optional<int64_t> ConfigValue::asInteger() const {
    if (text_.empty()) return std::nullopt;

    int base = 10;
    if (text_.size() > 2 && text_[0] == '0' && (text_[1] == 'x' || text_[1] == 'X')) {
        base = 16;
    }

    errno = 0;
    char* end;
    long long val = std::strtoll(text_.c_str(), &end, base);
    if (end == text_.c_str() || *end != '\0' || errno == ERANGE) {
        return std::nullopt;
    }
    return static_cast<int64_t>(val);
}

// ============================================================================
// ConfigDocument
// ============================================================================

void ConfigDocument::addEntry(ConfigEntry entry) {
    entries_.push_back(std::move(entry));
}

const ConfigEntry* ConfigDocument::get(std::string_view key) const {
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

// ============================================================================
// ConfigParser
// ============================================================================

std::optional<ConfigDocument> ConfigParser::parseFile(const std::string& path) const {
    return parseFileAt(path, 0);
}

ConfigDocument ConfigParser::parseString(std::string_view content, const std::string& basePath) const {
    ConfigDocument doc;
    parseInto(content, basePath, doc, 0);
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
    auto lastSlash = path.find_last_of('/');
    if (lastSlash != std::string::npos) {
        basePath = path.substr(0, lastSlash + 1);
    }

    ConfigDocument doc;
    parseInto(buffer.str(), basePath, doc, depth);
    return doc;
}

void ConfigParser::parseInto(std::string_view content, const std::string& basePath,
                             ConfigDocument& doc, int depth) const {
    size_t lineNumber = 0;

    while (!content.empty()) {
        auto lineEnd = content.find('\n');
        std::string_view line;
        if (lineEnd == std::string_view::npos) {
            line = content;
            content = {};
        } else {
            line = content.substr(0, lineEnd);
            content = content.substr(lineEnd + 1);
        }
        ++lineNumber;

        // Windows line endings
        if (!line.empty() && line.back() == '\r') {
            line.remove_suffix(1);
        }

        parseLine(line, lineNumber, basePath, doc, depth);
    }
}

void ConfigParser::parseLine(std::string_view line, size_t lineNumber, const std::string& basePath,
                             ConfigDocument& doc, int depth) const {
    line = trim(line);
    if (line.empty() || line[0] == '#') {
        return;
    }

    auto colonPos = line.find(':');
    if (colonPos == std::string_view::npos) {
        std::cerr << "[ConfigParser] Line " << lineNumber
                  << ": ignoring line without ':': " << line << '\n';
        return;
    }

    ConfigEntry entry;
    entry.key = std::string(trim(line.substr(0, colonPos)));
    entry.line = lineNumber;
    auto rest = trim(line.substr(colonPos + 1));

    if (entry.key == "include") {
        if (depth + 1 > MAX_INCLUDE_DEPTH) {
            std::cerr << "[ConfigParser] WARNING: include nested too deeply, skipping "
                      << rest << '\n';
            return;
        }

        std::string includePath(rest);
        std::string resolvedPath;
        if (includeResolver_) {
            resolvedPath = includeResolver_(includePath);
        } else if (!includePath.empty() && includePath[0] == '/') {
            resolvedPath = includePath;
        } else {
            resolvedPath = basePath + includePath;
        }

        if (auto included = parseFileAt(resolvedPath, depth + 1)) {
            for (const auto& includedEntry : *included) {
                doc.addEntry(includedEntry);
            }
        } else {
            std::cerr << "[ConfigParser] WARNING: cannot read include " << resolvedPath << '\n';
        }
        return;
    }

    entry.value = ConfigValue(rest);
    doc.addEntry(std::move(entry));
}

}  // namespace zealdump
