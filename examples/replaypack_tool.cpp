/**
 * @file replaypack_tool.cpp
 * @brief Pack a file into the block container and unpack it again
 *
 * Usage:
 *   replaypack_tool [--config <file>] pack <input> <output>
 *   replaypack_tool [--config <file>] unpack <input> <output>
 *
 * The packed file starts with an 8-byte preamble, tag "RPK1" followed by the
 * uncompressed length (LE uint32), then the compressed blocks. The length is
 * what lets unpack drop the zero padding of the final block.
 */

#include <replaypack/block_decompressor.hpp>
#include <replaypack/buffered_block_writer.hpp>
#include <replaypack/byte_stream.hpp>
#include <replaypack/config.hpp>
#include <replaypack/cursor_buffer.hpp>

#include <algorithm>
#include <array>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <string>
#include <vector>

using namespace replaypack;

namespace {

constexpr DWordString PACK_TAG = dwordString("RPK1");
constexpr size_t PREAMBLE_SIZE = 8;

void printUsage(const char* argv0) {
    std::cerr << "Usage: " << argv0 << " [--config <file>] pack|unpack <input> <output>\n";
}

CursorBuffer makePreamble(uint32_t totalSize) {
    CursorBuffer preamble;
    preamble.writeDString(PACK_TAG);
    preamble.writeUInt32(totalSize);
    return preamble;
}

int pack(const std::filesystem::path& inPath, const std::filesystem::path& outPath) {
    std::ifstream in(inPath, std::ios::binary);
    if (!in) {
        std::cerr << "Cannot open " << inPath << "\n";
        return 1;
    }
    std::ofstream out(outPath, std::ios::binary | std::ios::trunc);
    if (!out) {
        std::cerr << "Cannot create " << outPath << "\n";
        return 1;
    }

    // Placeholder preamble, patched once the total is known
    OStreamSink sink(out);
    if (!sink.write(makePreamble(0).bytes())) {
        return 1;
    }

    IStreamSource source(in);
    BufferedBlockWriter writer(sink);

    IoResult copied = copyStream(writer, source);
    if (!copied) {
        std::cerr << "Pack failed after " << copied.count << " bytes: "
                  << errorKindName(*copied.error) << "\n";
        return 1;
    }

    IoResult closed = writer.close();
    if (!closed) {
        std::cerr << "Pack failed on close: " << errorKindName(*closed.error) << "\n";
        return 1;
    }

    out.seekp(0);
    if (!sink.write(makePreamble(writer.sizeTotal()).bytes())) {
        return 1;
    }

    std::cout << "Packed " << writer.sizeTotal() << " bytes into "
              << writer.blockCount() << " blocks (" << writer.sizeWritten()
              << " compressed bytes, level " << writer.compressor().level() << ")\n";
    return 0;
}

int unpack(const std::filesystem::path& inPath, const std::filesystem::path& outPath) {
    std::ifstream in(inPath, std::ios::binary);
    if (!in) {
        std::cerr << "Cannot open " << inPath << "\n";
        return 1;
    }

    IStreamSource source(in);

    std::array<uint8_t, PREAMBLE_SIZE> raw{};
    IoResult r = source.read(raw);
    if (!r || r.count != PREAMBLE_SIZE) {
        std::cerr << inPath << " is too short for a replaypack file\n";
        return 1;
    }

    CursorBuffer preamble{std::span<const uint8_t>(raw)};
    uint32_t remaining = 0;
    try {
        if (preamble.readDString() != PACK_TAG) {
            std::cerr << inPath << " is not a replaypack file\n";
            return 1;
        }
        remaining = preamble.readUInt32();
    } catch (const CodecError& e) {
        std::cerr << "Bad preamble: " << e.what() << "\n";
        return 1;
    }

    std::ofstream out(outPath, std::ios::binary | std::ios::trunc);
    if (!out) {
        std::cerr << "Cannot create " << outPath << "\n";
        return 1;
    }
    OStreamSink sink(out);

    BlockDecompressor decompressor(source);
    std::vector<uint8_t> chunk(DEFAULT_WRITER_BUFFER_SIZE);
    uint32_t total = remaining;

    while (remaining > 0) {
        IoResult got = decompressor.read(chunk);
        if (!got) {
            std::cerr << "Unpack failed in block " << decompressor.blockCount() + 1 << ": "
                      << errorKindName(*got.error) << "\n";
            return 1;
        }
        if (got.count == 0) {
            std::cerr << "Container ends " << remaining << " bytes short\n";
            return 1;
        }

        size_t keep = std::min<size_t>(got.count, remaining);
        if (!sink.write(std::span<const uint8_t>(chunk.data(), keep))) {
            return 1;
        }
        remaining -= static_cast<uint32_t>(keep);
    }

    std::cout << "Unpacked " << total << " bytes from " << decompressor.blockCount()
              << " blocks\n";
    return 0;
}

}  // namespace

int main(int argc, char** argv) {
    std::vector<std::string> args(argv + 1, argv + argc);

    if (args.size() >= 2 && args[0] == "--config") {
        ConfigManager::instance().init(args[1]);
        args.erase(args.begin(), args.begin() + 2);
    }

    if (args.size() != 3) {
        printUsage(argv[0]);
        return 1;
    }

    try {
        if (args[0] == "pack") {
            return pack(args[1], args[2]);
        }
        if (args[0] == "unpack") {
            return unpack(args[1], args[2]);
        }
    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << "\n";
        return 1;
    }

    printUsage(argv[0]);
    return 1;
}
