#include "replaypack/config_file.hpp"
#include <cctype>
#include <charconv>
#include <cstdlib>
#include <fstream>
#include <sstream>

namespace replaypack {

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

std::string formatValue(double value) {
    std::ostringstream oss;
    oss << value;
    return oss.str();
}

}  // namespace

ConfigFile::ConfigFile(std::filesystem::path path)
    : path_(std::move(path)) {
    // A missing file is not an error here; isLoaded() reports it
    static_cast<void>(load(path_));
}

void ConfigFile::clear() {
    lines_.clear();
    keyToLine_.clear();
    values_.clear();
    loaded_ = false;
    dirty_ = false;
}

bool ConfigFile::load(const std::filesystem::path& path) {
    path_ = path;
    clear();

    std::ifstream file(path);
    if (!file.is_open()) {
        return false;
    }

    std::stringstream buffer;
    buffer << file.rdbuf();
    loadFromString(buffer.str());
    return true;
}

void ConfigFile::loadFromString(std::string_view content) {
    clear();

    size_t pos = 0;
    while (pos < content.size()) {
        size_t lineEnd = content.find('\n', pos);
        std::string_view lineView;
        if (lineEnd == std::string_view::npos) {
            lineView = content.substr(pos);
            pos = content.size();
        } else {
            lineView = content.substr(pos, lineEnd - pos);
            pos = lineEnd + 1;
        }

        if (!lineView.empty() && lineView.back() == '\r') {
            lineView.remove_suffix(1);
        }

        parseLine(lineView);
    }

    loaded_ = true;
}

void ConfigFile::parseLine(std::string_view lineView) {
    Line line;
    line.content = std::string(lineView);

    // Key-value lines start in column 0 with something other than '#'
    bool candidate = !lineView.empty() && lineView[0] != '#' &&
                     !std::isspace(static_cast<unsigned char>(lineView[0]));
    auto colonPos = candidate ? lineView.find(':') : std::string_view::npos;

    if (colonPos != std::string_view::npos) {
        std::string key(trim(lineView.substr(0, colonPos)));

        size_t valueStart = colonPos + 1;
        while (valueStart < lineView.size() &&
               std::isspace(static_cast<unsigned char>(lineView[valueStart]))) {
            valueStart++;
        }

        line.key = key;
        line.valueStart = valueStart;
        line.isKeyValue = true;

        // Later lines override earlier ones for the same key
        keyToLine_[key] = lines_.size();

        auto valueStr = trim(lineView.substr(valueStart));
        if (!valueStr.empty()) {
            values_[key] = parseValue(valueStr);
        } else {
            values_.erase(key);
        }
    }

    lines_.push_back(std::move(line));
}

ConfigValue ConfigFile::parseValue(std::string_view text) {
    if (text == "true" || text == "yes") {
        return true;
    }
    if (text == "false" || text == "no") {
        return false;
    }

    const char* begin = text.data();
    const char* end = text.data() + text.size();

    int64_t intVal = 0;
    bool hex = text.size() > 2 && text[0] == '0' && (text[1] == 'x' || text[1] == 'X');
    auto [intEnd, intEc] = hex ? std::from_chars(begin + 2, end, intVal, 16)
                               : std::from_chars(begin, end, intVal, 10);
    if (intEc == std::errc() && intEnd == end) {
        return intVal;
    }

    // strtod needs a terminated string
    std::string copy(text);
    char* floatEnd = nullptr;
    double floatVal = std::strtod(copy.c_str(), &floatEnd);
    if (floatEnd != copy.c_str() && floatEnd == copy.c_str() + copy.size()) {
        return floatVal;
    }

    return std::string(text);
}

bool ConfigFile::save() {
    return saveAs(path_);
}

bool ConfigFile::saveAs(const std::filesystem::path& path) {
    auto parent = path.parent_path();
    if (!parent.empty()) {
        std::error_code ec;
        std::filesystem::create_directories(parent, ec);
        if (ec) {
            return false;
        }
    }

    std::ofstream file(path, std::ios::trunc);
    if (!file.is_open()) {
        return false;
    }

    for (const auto& line : lines_) {
        file << line.content << '\n';
    }

    if (!file.good()) {
        return false;
    }

    path_ = path;
    dirty_ = false;
    return true;
}

// ============================================================================
// Read access
// ============================================================================

const ConfigValue* ConfigFile::find(std::string_view key) const {
    auto it = values_.find(std::string(key));
    return it != values_.end() ? &it->second : nullptr;
}

bool ConfigFile::has(std::string_view key) const {
    return keyToLine_.find(std::string(key)) != keyToLine_.end();
}

std::string ConfigFile::getString(std::string_view key, std::string_view defaultVal) const {
    const ConfigValue* v = find(key);
    if (!v) {
        return std::string(defaultVal);
    }
    if (auto s = std::get_if<std::string>(v)) {
        return *s;
    }
    // Non-string values read back as their text form
    const Line& line = lines_[keyToLine_.at(std::string(key))];
    return std::string(trim(std::string_view(line.content).substr(line.valueStart)));
}

int64_t ConfigFile::getInt(std::string_view key, int64_t defaultVal) const {
    const ConfigValue* v = find(key);
    if (v) {
        if (auto i = std::get_if<int64_t>(v)) {
            return *i;
        }
    }
    return defaultVal;
}

double ConfigFile::getFloat(std::string_view key, double defaultVal) const {
    const ConfigValue* v = find(key);
    if (v) {
        if (auto d = std::get_if<double>(v)) {
            return *d;
        }
        if (auto i = std::get_if<int64_t>(v)) {
            return static_cast<double>(*i);
        }
    }
    return defaultVal;
}

bool ConfigFile::getBool(std::string_view key, bool defaultVal) const {
    const ConfigValue* v = find(key);
    if (v) {
        if (auto b = std::get_if<bool>(v)) {
            return *b;
        }
    }
    return defaultVal;
}

// ============================================================================
// Write access
// ============================================================================

void ConfigFile::setImpl(std::string_view key, const std::string& formattedValue, ConfigValue value) {
    std::string k(key);
    auto it = keyToLine_.find(k);

    if (it != keyToLine_.end()) {
        // Replace just the value portion of the existing line
        auto& line = lines_[it->second];
        line.content = line.content.substr(0, line.valueStart) + formattedValue;
    } else {
        Line newLine;
        newLine.key = k;
        newLine.content = k + ": " + formattedValue;
        newLine.valueStart = k.size() + 2;
        newLine.isKeyValue = true;

        keyToLine_[k] = lines_.size();
        lines_.push_back(std::move(newLine));
    }

    values_[k] = std::move(value);
    dirty_ = true;
}

void ConfigFile::set(std::string_view key, std::string_view value) {
    setImpl(key, std::string(value), std::string(value));
}

void ConfigFile::set(std::string_view key, int64_t value) {
    setImpl(key, std::to_string(value), value);
}

void ConfigFile::set(std::string_view key, double value) {
    setImpl(key, formatValue(value), value);
}

void ConfigFile::set(std::string_view key, bool value) {
    setImpl(key, value ? "true" : "false", value);
}

void ConfigFile::setHeader(std::string_view header) {
    if (!lines_.empty()) {
        return;
    }

    size_t pos = 0;
    while (pos < header.size()) {
        size_t lineEnd = header.find('\n', pos);
        if (lineEnd == std::string_view::npos) {
            lineEnd = header.size();
        }
        Line line;
        line.content = "# " + std::string(trim(header.substr(pos, lineEnd - pos)));
        lines_.push_back(std::move(line));
        pos = lineEnd + 1;
    }
}

void ConfigFile::remove(std::string_view key) {
    auto it = keyToLine_.find(std::string(key));
    if (it == keyToLine_.end()) {
        return;
    }

    auto& line = lines_[it->second];
    line.content = "# " + line.content;
    line.isKeyValue = false;

    values_.erase(std::string(key));
    keyToLine_.erase(it);
    dirty_ = true;
}

}  // namespace replaypack
