#include "memory_io.hpp"
#include <algorithm>
#include <cstring>

extern "C" {
#include <libavutil/error.h>
#include <libavutil/mem.h>
#include <libavformat/version.h>
}

namespace ac::audio::detail {

namespace {

constexpr int kIoBufferSize = 64 * 1024;

int read_packet(void* opaque, uint8_t* buf, int buf_size) {
    auto* reader = static_cast<MemoryReader*>(opaque);
    size_t remaining = reader->size - reader->pos;
    if (remaining == 0) {
        return AVERROR_EOF;
    }
    size_t n = std::min(remaining, static_cast<size_t>(buf_size));
    std::memcpy(buf, reader->data + reader->pos, n);
    reader->pos += n;
    return static_cast<int>(n);
}

int64_t seek_reader(void* opaque, int64_t offset, int whence) {
    auto* reader = static_cast<MemoryReader*>(opaque);
    if (whence & AVSEEK_SIZE) {
        return static_cast<int64_t>(reader->size);
    }
    int64_t base = 0;
    switch (whence & ~AVSEEK_FORCE) {
        case SEEK_SET: base = 0; break;
        case SEEK_CUR: base = static_cast<int64_t>(reader->pos); break;
        case SEEK_END: base = static_cast<int64_t>(reader->size); break;
        default: return AVERROR(EINVAL);
    }
    int64_t target = base + offset;
    if (target < 0 || target > static_cast<int64_t>(reader->size)) {
        return AVERROR(EINVAL);
    }
    reader->pos = static_cast<size_t>(target);
    return target;
}

// The write callback lost its const qualifier before libavformat 61.
#if LIBAVFORMAT_VERSION_MAJOR >= 61
int write_packet(void* opaque, const uint8_t* buf, int buf_size) {
#else
int write_packet(void* opaque, uint8_t* buf, int buf_size) {
#endif
    auto* writer = static_cast<MemoryWriter*>(opaque);
    size_t n = static_cast<size_t>(buf_size);
    if (writer->pos + n > writer->bytes.size()) {
        writer->bytes.resize(writer->pos + n);
    }
    std::memcpy(writer->bytes.data() + writer->pos, buf, n);
    writer->pos += n;
    return buf_size;
}

int64_t seek_writer(void* opaque, int64_t offset, int whence) {
    auto* writer = static_cast<MemoryWriter*>(opaque);
    if (whence & AVSEEK_SIZE) {
        return static_cast<int64_t>(writer->bytes.size());
    }
    int64_t base = 0;
    switch (whence & ~AVSEEK_FORCE) {
        case SEEK_SET: base = 0; break;
        case SEEK_CUR: base = static_cast<int64_t>(writer->pos); break;
        case SEEK_END: base = static_cast<int64_t>(writer->bytes.size()); break;
        default: return AVERROR(EINVAL);
    }
    int64_t target = base + offset;
    if (target < 0) {
        return AVERROR(EINVAL);
    }
    writer->pos = static_cast<size_t>(target);
    return target;
}

} // anonymous namespace

AVIOContext* open_read_context(MemoryReader* reader) {
    auto* buffer = static_cast<unsigned char*>(av_malloc(kIoBufferSize));
    if (!buffer) return nullptr;
    AVIOContext* ctx = avio_alloc_context(buffer, kIoBufferSize, 0, reader,
                                          &read_packet, nullptr, &seek_reader);
    if (!ctx) av_free(buffer);
    return ctx;
}

AVIOContext* open_write_context(MemoryWriter* writer) {
    auto* buffer = static_cast<unsigned char*>(av_malloc(kIoBufferSize));
    if (!buffer) return nullptr;
    AVIOContext* ctx = avio_alloc_context(buffer, kIoBufferSize, 1, writer,
                                          nullptr, &write_packet, &seek_writer);
    if (!ctx) av_free(buffer);
    return ctx;
}

void close_context(AVIOContext** ctx) {
    if (!ctx || !*ctx) return;
    av_freep(&(*ctx)->buffer);
    avio_context_free(ctx);
}

} // namespace ac::audio::detail
