#pragma once

// In-memory AVIOContext adapters: the core never touches the filesystem,
// FFmpeg demuxers/muxers read and write caller-owned byte vectors instead.

#include <cstddef>
#include <cstdint>
#include <vector>

extern "C" {
#include <libavformat/avio.h>
}

namespace ac::audio::detail {

struct MemoryReader {
    const uint8_t* data = nullptr;
    size_t size = 0;
    size_t pos = 0;
};

struct MemoryWriter {
    std::vector<uint8_t> bytes;
    size_t pos = 0;
};

/// Seekable read context over reader->data; nullptr on allocation failure
AVIOContext* open_read_context(MemoryReader* reader);

/// Seekable write context appending/overwriting writer->bytes; nullptr on allocation failure
AVIOContext* open_write_context(MemoryWriter* writer);

/// Frees the context and its internal buffer; safe on nullptr
void close_context(AVIOContext** ctx);

} // namespace ac::audio::detail
