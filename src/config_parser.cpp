#include "finegeo/config_parser.hpp"

#include <cctype>
#include <cstdlib>
#include <fstream>
#include <limits>
#include <sstream>

namespace finegeo {

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

bool ConfigValue::asBool(bool defaultVal) const {
    if (text_ == "true" || text_ == "yes" || text_ == "on" || text_ == "1") {
        return true;
    }
    if (text_ == "false" || text_ == "no" || text_ == "off" || text_ == "0") {
        return false;
    }
    return defaultVal;
}

int ConfigValue::asInt(int defaultVal) const {
    if (text_.empty()) return defaultVal;

    char* end;
    long long val = std::strtoll(text_.c_str(), &end, 10);
    if (end == text_.c_str()) return defaultVal;

    // Saturate so an oversized value stays out of range instead of wrapping
    if (val > std::numeric_limits<int>::max()) return std::numeric_limits<int>::max();
    if (val < std::numeric_limits<int>::min()) return std::numeric_limits<int>::min();
    return static_cast<int>(val);
}

std::string ConfigEntry::location() const {
    if (source.empty()) {
        return "Line " + std::to_string(line);
    }
    return source + ":" + std::to_string(line);
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

int ConfigDocument::getInt(std::string_view key, int defaultVal) const {
    if (auto* entry = get(key)) {
        return entry->value.asInt(defaultVal);
    }
    return defaultVal;
}

bool ConfigDocument::getBool(std::string_view key, bool defaultVal) const {
    if (auto* entry = get(key)) {
        return entry->value.asBool(defaultVal);
    }
    return defaultVal;
}

// ============================================================================
// ConfigParser
// ============================================================================

std::optional<ConfigDocument> ConfigParser::parseFile(const std::string& path) const {
    std::ifstream file(path);
    if (!file.is_open()) {
        return std::nullopt;
    }

    std::stringstream buffer;
    buffer << file.rdbuf();

    std::string basePath;
    auto lastSlash = path.find_last_of("/\\");
    if (lastSlash != std::string::npos) {
        basePath = path.substr(0, lastSlash + 1);
    }

    return parseContent(buffer.str(), basePath, path);
}

ConfigDocument ConfigParser::parseString(std::string_view content, const std::string& basePath) const {
    return parseContent(content, basePath, "");
}

ConfigDocument ConfigParser::parseContent(std::string_view content, const std::string& basePath,
                                          const std::string& source) const {
    ConfigDocument doc;
    std::string_view remaining = content;
    int lineNumber = 0;

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
        ++lineNumber;

        parseLine(line, lineNumber, doc, basePath, source);
    }

    return doc;
}

void ConfigParser::parseLine(std::string_view line, int lineNumber, ConfigDocument& doc,
                             const std::string& basePath, const std::string& source) const {
    line = trim(line);
    if (line.empty() || line.front() == '#') {
        return;
    }

    ConfigEntry entry;
    entry.line = lineNumber;
    entry.source = source;

    auto colonPos = line.find(':');
    if (colonPos == std::string_view::npos) {
        entry.key = std::string(line);
        doc.addEntry(std::move(entry));
        return;
    }

    entry.key = std::string(trim(line.substr(0, colonPos)));
    std::string_view rest = trim(line.substr(colonPos + 1));

    if (entry.key == "include") {
        std::string includePath(rest);
        std::string resolvedPath = includeResolver_ ? includeResolver_(includePath)
                                                    : basePath + includePath;

        if (auto included = parseFile(resolvedPath)) {
            for (const auto& includedEntry : *included) {
                doc.addEntry(includedEntry);
            }
        }
        return;
    }

    entry.value = ConfigValue(rest);
    doc.addEntry(std::move(entry));
}

}  // namespace finegeo
