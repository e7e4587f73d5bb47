#pragma once

/**
 * @file config_file.hpp
 * @brief Editable key/value settings file for replaypack tools
 */

#include <cstdint>
#include <filesystem>
#include <string>
#include <string_view>
#include <unordered_map>
#include <variant>
#include <vector>

namespace replaypack {

// Parsed value of a "key: value" line
using ConfigValue = std::variant<bool, int64_t, double, std::string>;

// ============================================================================
// ConfigFile - "key: value" text that survives hand edits
// ============================================================================
//
// Format:
//   # comment
//   compression.level: 9
//   writer.buffer_size: 0x2000
//   debug.logging: no
//
// Values are typed on load: true/false/yes/no are bools, decimal or 0x hex
// integers are ints, other numbers are floats, anything else is a string.
// Comments, blank lines and ordering survive a load/set/save cycle; only the
// changed value is rewritten and new keys are appended at the end.
//
class ConfigFile {
public:
    ConfigFile() = default;
    explicit ConfigFile(std::filesystem::path path);

    // Replaces current content; false if the file cannot be opened
    [[nodiscard]] bool load(const std::filesystem::path& path);

    // Parse from text (path is left unchanged)
    void loadFromString(std::string_view content);

    // Write every line back, creating parent directories
    [[nodiscard]] bool save();
    [[nodiscard]] bool saveAs(const std::filesystem::path& path);

    [[nodiscard]] bool isLoaded() const { return loaded_; }
    [[nodiscard]] bool isDirty() const { return dirty_; }
    [[nodiscard]] const std::filesystem::path& path() const { return path_; }

    // ========================================================================
    // Typed getters
    // ========================================================================

    [[nodiscard]] bool has(std::string_view key) const;

    [[nodiscard]] std::string getString(std::string_view key,
                                        std::string_view defaultVal = "") const;
    [[nodiscard]] int64_t getInt(std::string_view key, int64_t defaultVal = 0) const;
    [[nodiscard]] double getFloat(std::string_view key, double defaultVal = 0.0) const;
    [[nodiscard]] bool getBool(std::string_view key, bool defaultVal = false) const;

    // ========================================================================
    // Setters (mark the file dirty)
    // ========================================================================

    void set(std::string_view key, std::string_view value);
    void set(std::string_view key, const char* value) { set(key, std::string_view(value)); }
    void set(std::string_view key, int64_t value);
    void set(std::string_view key, double value);
    void set(std::string_view key, bool value);

    // Turn the key's line into a comment; the text stays in the file
    void remove(std::string_view key);

    // Comment block placed at the top of a file that has no lines yet;
    // ignored once the file has content
    void setHeader(std::string_view header);

private:
    struct Line {
        std::string content;      // Text written back on save
        std::string key;          // Key if this is a key-value line
        size_t valueStart = 0;    // Offset of the value within content
        bool isKeyValue = false;
    };

    void clear();
    void parseLine(std::string_view lineView);
    [[nodiscard]] static ConfigValue parseValue(std::string_view text);

    [[nodiscard]] const ConfigValue* find(std::string_view key) const;
    void setImpl(std::string_view key, const std::string& formattedValue, ConfigValue value);

    std::filesystem::path path_;
    std::vector<Line> lines_;
    std::unordered_map<std::string, size_t> keyToLine_;
    std::unordered_map<std::string, ConfigValue> values_;
    bool loaded_ = false;
    bool dirty_ = false;
};

}  // namespace replaypack
