#pragma once

/**
 * @file config.hpp
 * @brief Process-wide codec configuration
 */

#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <memory>
#include <shared_mutex>
#include <string>

namespace replaypack {

class ConfigFile;

// ============================================================================
// ConfigManager - Global codec configuration
// ============================================================================
//
// Settings stored in a human-readable ConfigFile:
//   compression.level: 9        zlib level used by BlockCompressor (0-9)
//   writer.buffer_size: 8192    BufferedBlockWriter capacity in bytes
//   debug.logging: false        per-block trace lines on stderr
//
// Components read it only when it has been initialized; otherwise they use
// their built-in defaults.
//
// Thread safety: All public methods are thread-safe.
//
class ConfigManager {
public:
    static ConfigManager& instance();

    // Initialize with config file path. A missing file leaves the defaults.
    void init(const std::filesystem::path& configPath);

    [[nodiscard]] bool isInitialized() const;

    // Write current settings to the config path
    bool save();

    // Re-read the config file, discarding unsaved changes
    bool reload();

    // Back to the uninitialized state (for testing)
    void reset();

    [[nodiscard]] std::filesystem::path configPath() const;

    // ========================================================================
    // Typed accessors
    // ========================================================================

    // Out-of-range stored values fall back to the default
    [[nodiscard]] int compressionLevel() const;
    void setCompressionLevel(int level);

    [[nodiscard]] size_t writerBufferSize() const;
    void setWriterBufferSize(size_t size);

    [[nodiscard]] bool debugLogging() const;
    void setDebugLogging(bool enabled);

    [[nodiscard]] bool has(const std::string& key) const;

private:
    ConfigManager();
    ~ConfigManager();

    ConfigManager(const ConfigManager&) = delete;
    ConfigManager& operator=(const ConfigManager&) = delete;

    // Caller holds mutex_
    void setDefaults();
    bool loadFromFile();

    mutable std::shared_mutex mutex_;
    std::filesystem::path configPath_;
    std::unique_ptr<ConfigFile> file_;
    bool initialized_ = false;
};

}  // namespace replaypack
