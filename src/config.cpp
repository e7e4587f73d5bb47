#include "replaypack/config.hpp"
#include "replaypack/block_format.hpp"
#include "replaypack/buffered_block_writer.hpp"
#include "replaypack/config_file.hpp"
#include <iostream>
#include <mutex>

namespace replaypack {

namespace {

constexpr const char* KEY_COMPRESSION_LEVEL = "compression.level";
constexpr const char* KEY_WRITER_BUFFER_SIZE = "writer.buffer_size";
constexpr const char* KEY_DEBUG_LOGGING = "debug.logging";

constexpr const char* CONFIG_HEADER =
    "replaypack configuration\n"
    "compression.level: zlib level 0-9\n"
    "writer.buffer_size: bytes buffered per compressed block";

}  // namespace

ConfigManager& ConfigManager::instance() {
    static ConfigManager instance;
    return instance;
}

ConfigManager::ConfigManager()
    : file_(std::make_unique<ConfigFile>())
{
}

ConfigManager::~ConfigManager() = default;

void ConfigManager::init(const std::filesystem::path& configPath) {
    std::unique_lock lock(mutex_);

    configPath_ = configPath;
    setDefaults();

    if (std::filesystem::exists(configPath_) && !loadFromFile()) {
        std::cerr << "[ConfigManager] Cannot read " << configPath_ << ", using defaults\n";
    }

    initialized_ = true;
}

bool ConfigManager::isInitialized() const {
    std::shared_lock lock(mutex_);
    return initialized_;
}

bool ConfigManager::save() {
    std::unique_lock lock(mutex_);
    if (!initialized_) return false;

    if (!file_->saveAs(configPath_)) {
        std::cerr << "[ConfigManager] Cannot write " << configPath_ << "\n";
        return false;
    }
    return true;
}

bool ConfigManager::reload() {
    std::unique_lock lock(mutex_);
    if (!initialized_) return false;

    setDefaults();
    return loadFromFile();
}

void ConfigManager::reset() {
    std::unique_lock lock(mutex_);
    file_ = std::make_unique<ConfigFile>();
    configPath_.clear();
    initialized_ = false;
}

std::filesystem::path ConfigManager::configPath() const {
    std::shared_lock lock(mutex_);
    return configPath_;
}

void ConfigManager::setDefaults() {
    file_ = std::make_unique<ConfigFile>();
    file_->setHeader(CONFIG_HEADER);
}

bool ConfigManager::loadFromFile() {
    auto loaded = std::make_unique<ConfigFile>();
    if (!loaded->load(configPath_)) {
        return false;
    }
    loaded->setHeader(CONFIG_HEADER);
    file_ = std::move(loaded);
    return true;
}

// ============================================================================
// Typed accessors
// ============================================================================

int ConfigManager::compressionLevel() const {
    std::shared_lock lock(mutex_);
    int64_t level = file_->getInt(KEY_COMPRESSION_LEVEL, DEFAULT_COMPRESSION_LEVEL);
    if (level < 0 || level > 9) {
        return DEFAULT_COMPRESSION_LEVEL;
    }
    return static_cast<int>(level);
}

void ConfigManager::setCompressionLevel(int level) {
    std::unique_lock lock(mutex_);
    file_->set(KEY_COMPRESSION_LEVEL, static_cast<int64_t>(level));
}

size_t ConfigManager::writerBufferSize() const {
    std::shared_lock lock(mutex_);
    int64_t size = file_->getInt(KEY_WRITER_BUFFER_SIZE,
                                 static_cast<int64_t>(DEFAULT_WRITER_BUFFER_SIZE));
    if (size <= 0) {
        return DEFAULT_WRITER_BUFFER_SIZE;
    }
    return static_cast<size_t>(size);
}

void ConfigManager::setWriterBufferSize(size_t size) {
    std::unique_lock lock(mutex_);
    file_->set(KEY_WRITER_BUFFER_SIZE, static_cast<int64_t>(size));
}

bool ConfigManager::debugLogging() const {
    std::shared_lock lock(mutex_);
    return file_->getBool(KEY_DEBUG_LOGGING, false);
}

void ConfigManager::setDebugLogging(bool enabled) {
    std::unique_lock lock(mutex_);
    file_->set(KEY_DEBUG_LOGGING, enabled);
}

bool ConfigManager::has(const std::string& key) const {
    std::shared_lock lock(mutex_);
    return file_->has(key);
}

}  // namespace replaypack
