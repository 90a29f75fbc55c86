#pragma once

#include <functional>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace finegeo {

// ============================================================================
// ConfigValue - Text after the colon, with typed accessors
// ============================================================================

class ConfigValue {
public:
    ConfigValue() = default;
    explicit ConfigValue(std::string_view text) : text_(text) {}

    [[nodiscard]] std::string_view asString() const { return text_; }

    // true/yes/on/1 and false/no/off/0; anything else yields defaultVal
    [[nodiscard]] bool asBool(bool defaultVal = false) const;

    // Decimal integer, saturated to the int range
    [[nodiscard]] int asInt(int defaultVal = 0) const;

    [[nodiscard]] bool empty() const { return text_.empty(); }

private:
    std::string text_;
};

struct ConfigEntry {
    std::string key;
    ConfigValue value;
    int line = 0;         // 1-based line in the file that defined it
    std::string source;   // path of that file, empty for parsed strings

    // "Line N", or "path:N" when the entry came from a file
    [[nodiscard]] std::string location() const;
};

// ============================================================================
// ConfigDocument - Entries of a parsed file, in order
// ============================================================================
//
// Repeated keys are kept; lookups return the last one so later entries (and
// included files) override earlier ones.
//
class ConfigDocument {
public:
    ConfigDocument() = default;

    void addEntry(ConfigEntry entry);

    // Last entry with this key, or nullptr
    [[nodiscard]] const ConfigEntry* get(std::string_view key) const;

    [[nodiscard]] bool has(std::string_view key) const { return get(key) != nullptr; }

    [[nodiscard]] std::string_view getString(std::string_view key, std::string_view defaultVal = "") const;
    [[nodiscard]] int getInt(std::string_view key, int defaultVal = 0) const;
    [[nodiscard]] bool getBool(std::string_view key, bool defaultVal = false) const;

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
 * @brief Parser for `key: value` settings files
 *
 * Format:
 * ```
 * # Comments start with #
 * encode.precision: 9
 * decode.policy: center
 * include: shared.conf
 * ```
 *
 * Keys and values are trimmed. A line without a colon defines a key with an
 * empty value. `include:` pulls in another file at that point, resolved
 * relative to the including file unless an include resolver is set. Missing
 * include files are skipped.
 */
class ConfigParser {
public:
    using IncludeResolver = std::function<std::string(const std::string&)>;

    ConfigParser() = default;

    void setIncludeResolver(IncludeResolver resolver) { includeResolver_ = std::move(resolver); }

    // nullopt if the file cannot be opened
    [[nodiscard]] std::optional<ConfigDocument> parseFile(const std::string& path) const;

    [[nodiscard]] ConfigDocument parseString(std::string_view content,
                                             const std::string& basePath = "") const;

private:
    ConfigDocument parseContent(std::string_view content, const std::string& basePath,
                                const std::string& source) const;
    void parseLine(std::string_view line, int lineNumber, ConfigDocument& doc,
                   const std::string& basePath, const std::string& source) const;

    IncludeResolver includeResolver_;
};

}  // namespace finegeo
