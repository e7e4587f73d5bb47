#include <gtest/gtest.h>
#include "replaypack/config_file.hpp"
#include <filesystem>
#include <fstream>
#include <iterator>
#include <string>

using namespace replaypack;

class ConfigFileTest : public ::testing::Test {
protected:
    void SetUp() override {
        tempDir = std::filesystem::temp_directory_path() / "replaypack_config_file_test";
        std::filesystem::create_directories(tempDir);
    }

    void TearDown() override {
        std::filesystem::remove_all(tempDir);
    }

    static std::string readAll(const std::filesystem::path& path) {
        std::ifstream file(path);
        return std::string((std::istreambuf_iterator<char>(file)),
                           std::istreambuf_iterator<char>());
    }

    std::filesystem::path tempDir;
};

TEST_F(ConfigFileTest, LoadAndSave) {
    auto path = tempDir / "codec.conf";

    {
        std::ofstream file(path);
        file << "writer.buffer_size: 8192\n";
        file << "compression.level: 9\n";
    }

    ConfigFile config;
    EXPECT_TRUE(config.load(path));
    EXPECT_TRUE(config.isLoaded());
    EXPECT_EQ(config.getInt("writer.buffer_size"), 8192);
    EXPECT_EQ(config.getInt("compression.level"), 9);

    config.set("compression.level", int64_t(6));
    EXPECT_TRUE(config.save());

    ConfigFile config2;
    EXPECT_TRUE(config2.load(path));
    EXPECT_EQ(config2.getInt("writer.buffer_size"), 8192);
    EXPECT_EQ(config2.getInt("compression.level"), 6);
}

TEST_F(ConfigFileTest, LoadMissingFile) {
    ConfigFile config;
    EXPECT_FALSE(config.load(tempDir / "absent.conf"));
    EXPECT_FALSE(config.isLoaded());

    ConfigFile viaCtor(tempDir / "absent.conf");
    EXPECT_FALSE(viaCtor.isLoaded());
    EXPECT_EQ(viaCtor.path().string(), (tempDir / "absent.conf").string());
}

TEST_F(ConfigFileTest, PreservesCommentsAndOrder) {
    auto path = tempDir / "comments.conf";

    {
        std::ofstream file(path);
        file << "# replay output settings\n";
        file << "\n";
        file << "writer.buffer_size: 4096\n";
        file << "\n";
        file << "# zlib level\n";
        file << "compression.level: 9\n";
        file << "debug.logging: no\n";
    }

    ConfigFile config;
    EXPECT_TRUE(config.load(path));
    config.set("compression.level", int64_t(1));
    EXPECT_TRUE(config.save());

    std::string content = readAll(path);
    EXPECT_NE(content.find("# replay output settings"), std::string::npos);
    EXPECT_NE(content.find("# zlib level\ncompression.level: 1\n"), std::string::npos);

    auto sizePos = content.find("writer.buffer_size:");
    auto levelPos = content.find("compression.level:");
    auto debugPos = content.find("debug.logging:");
    EXPECT_LT(sizePos, levelPos);
    EXPECT_LT(levelPos, debugPos);
}

TEST_F(ConfigFileTest, NewKeysAppendedAtEnd) {
    auto path = tempDir / "append.conf";

    {
        std::ofstream file(path);
        file << "compression.level: 9\n";
    }

    ConfigFile config;
    EXPECT_TRUE(config.load(path));
    config.set("writer.buffer_size", int64_t(2048));
    EXPECT_TRUE(config.save());

    std::string content = readAll(path);
    EXPECT_LT(content.find("compression.level:"), content.find("writer.buffer_size: 2048"));
}

TEST_F(ConfigFileTest, RemoveCommentsOutLine) {
    auto path = tempDir / "remove.conf";

    {
        std::ofstream file(path);
        file << "compression.level: 9\n";
        file << "debug.logging: true\n";
    }

    ConfigFile config;
    EXPECT_TRUE(config.load(path));
    config.remove("debug.logging");
    EXPECT_FALSE(config.has("debug.logging"));
    EXPECT_FALSE(config.getBool("debug.logging"));
    EXPECT_TRUE(config.save());

    std::string content = readAll(path);
    EXPECT_NE(content.find("compression.level: 9"), std::string::npos);
    EXPECT_NE(content.find("# debug.logging: true"), std::string::npos);

    // The commented line is not a key on reload either
    ConfigFile config2;
    EXPECT_TRUE(config2.load(path));
    EXPECT_FALSE(config2.has("debug.logging"));
}

TEST_F(ConfigFileTest, ValueTypes) {
    ConfigFile config;
    config.loadFromString(
        "flag_on: yes\n"
        "flag_off: false\n"
        "count: -12\n"
        "mask: 0x2000\n"
        "ratio: 0.75\n"
        "name: replay.w3g\n"
        "empty:\n");

    EXPECT_TRUE(config.getBool("flag_on"));
    EXPECT_FALSE(config.getBool("flag_off", true));
    EXPECT_EQ(config.getInt("count"), -12);
    EXPECT_EQ(config.getInt("mask"), 0x2000);
    EXPECT_NEAR(config.getFloat("ratio"), 0.75, 1e-9);
    EXPECT_EQ(config.getString("name"), "replay.w3g");

    // Ints widen to float; strings do not parse as numbers on demand
    EXPECT_NEAR(config.getFloat("count"), -12.0, 1e-9);
    EXPECT_EQ(config.getInt("name", 7), 7);
    EXPECT_EQ(config.getBool("count", true), true);

    // Non-string values still read back as their text
    EXPECT_EQ(config.getString("mask"), "0x2000");

    // A key with no value exists but yields defaults
    EXPECT_TRUE(config.has("empty"));
    EXPECT_EQ(config.getString("empty", "fallback"), "fallback");
}

TEST_F(ConfigFileTest, WindowsLineEndings) {
    ConfigFile config;
    config.loadFromString("compression.level: 3\r\nname: x\r\n");
    EXPECT_EQ(config.getInt("compression.level"), 3);
    EXPECT_EQ(config.getString("name"), "x");
}

TEST_F(ConfigFileTest, IndentedLinesAreNotKeys) {
    ConfigFile config;
    config.loadFromString("  compression.level: 3\n#debug.logging: true\n");
    EXPECT_FALSE(config.has("compression.level"));
    EXPECT_FALSE(config.has("debug.logging"));
}

TEST_F(ConfigFileTest, TypedSetters) {
    auto path = tempDir / "typed.conf";

    ConfigFile config;
    config.set("debug.logging", true);
    config.set("ratio", 0.5);
    config.set("compression.level", int64_t(4));
    config.set("name", "demo");
    EXPECT_TRUE(config.saveAs(path));

    ConfigFile config2;
    EXPECT_TRUE(config2.load(path));
    EXPECT_TRUE(config2.getBool("debug.logging"));
    EXPECT_NEAR(config2.getFloat("ratio"), 0.5, 1e-9);
    EXPECT_EQ(config2.getInt("compression.level"), 4);
    EXPECT_EQ(config2.getString("name"), "demo");
}

TEST_F(ConfigFileTest, HeaderOnNewFile) {
    auto path = tempDir / "nested" / "header.conf";

    ConfigFile config;
    config.setHeader("codec settings\nedit with care");
    config.set("compression.level", int64_t(9));
    EXPECT_TRUE(config.saveAs(path));

    std::string content = readAll(path);
    EXPECT_EQ(content, "# codec settings\n# edit with care\ncompression.level: 9\n");

    // Existing content wins over a header
    ConfigFile loaded;
    EXPECT_TRUE(loaded.load(path));
    loaded.setHeader("other header");
    EXPECT_TRUE(loaded.save());
    EXPECT_EQ(readAll(path), content);
}

TEST_F(ConfigFileTest, DefaultValues) {
    ConfigFile config;

    EXPECT_EQ(config.getString("missing", "default"), "default");
    EXPECT_EQ(config.getInt("missing", 42), 42);
    EXPECT_NEAR(config.getFloat("missing", 1.5), 1.5, 0.001);
    EXPECT_TRUE(config.getBool("missing", true));
}

TEST_F(ConfigFileTest, DuplicateKeyLastWins) {
    ConfigFile config;
    config.loadFromString("compression.level: 2\ncompression.level: 8\n");
    EXPECT_EQ(config.getInt("compression.level"), 8);
}

TEST_F(ConfigFileTest, IsDirtyTracking) {
    auto path = tempDir / "dirty.conf";

    {
        std::ofstream file(path);
        file << "compression.level: 9\n";
    }

    ConfigFile config;
    EXPECT_TRUE(config.load(path));
    EXPECT_FALSE(config.isDirty());

    config.set("compression.level", int64_t(5));
    EXPECT_TRUE(config.isDirty());

    EXPECT_TRUE(config.save());
    EXPECT_FALSE(config.isDirty());
}
