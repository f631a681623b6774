// =============================================================================
// sff-codec - Byte Sources and Sinks Implementation
// =============================================================================

#include "sffc/io/byte_source.h"

#include <algorithm>
#include <cstring>
#include <utility>

#include "sffc/common/error.h"
#include "sffc/common/logger.h"

namespace sffc::io {

// =============================================================================
// MemoryByteSource
// =============================================================================

std::size_t MemoryByteSource::read(std::span<std::uint8_t> buffer) {
    if (position_ >= data_.size()) {
        return 0;
    }
    const auto available = static_cast<std::size_t>(data_.size() - position_);
    const std::size_t count = std::min(buffer.size(), available);
    std::memcpy(buffer.data(), data_.data() + position_, count);
    position_ += count;
    return count;
}

void MemoryByteSource::seek(FileOffset offset) {
    // Seeking past the end is allowed; the next read returns 0
    position_ = offset;
}

// =============================================================================
// StreamByteSource
// =============================================================================

StreamByteSource::StreamByteSource(std::istream& stream, bool seekable, std::string label)
    : stream_(stream), seekable_(seekable), label_(std::move(label)) {
    if (!seekable_) {
        return;
    }

    base_ = stream_.tellg();
    if (base_ < 0) {
        // The stream refused tellg(); treat it as a pipe
        stream_.clear();
        seekable_ = false;
        base_ = 0;
        SFFC_LOG_DEBUG("Stream '{}' is not seekable, falling back to sequential reads", label_);
        return;
    }

    stream_.seekg(0, std::ios::end);
    const std::streamoff end = stream_.tellg();
    stream_.seekg(base_, std::ios::beg);
    if (!stream_.good() || end < base_) {
        throw IOError("Failed to determine stream size", ErrorContext(label_));
    }
    size_ = static_cast<std::uint64_t>(end - base_);
}

std::size_t StreamByteSource::read(std::span<std::uint8_t> buffer) {
    if (buffer.empty()) {
        return 0;
    }
    stream_.read(reinterpret_cast<char*>(buffer.data()),
                 static_cast<std::streamsize>(buffer.size()));
    const auto count = static_cast<std::size_t>(stream_.gcount());
    if (stream_.bad()) {
        throw IOError("Failed to read from stream", ErrorContext(label_).withOffset(position_));
    }
    if (stream_.eof()) {
        // Short read at end of data; clear so later seeks still work
        stream_.clear();
    }
    position_ += count;
    return count;
}

void StreamByteSource::seek(FileOffset offset) {
    if (!seekable_) {
        throw IOError("Cannot seek in a sequential stream",
                      ErrorContext(label_).withOffset(offset));
    }
    stream_.seekg(base_ + static_cast<std::streamoff>(offset), std::ios::beg);
    if (!stream_.good()) {
        stream_.clear();
        throw IOError("Failed to seek in stream", ErrorContext(label_).withOffset(offset));
    }
    position_ = offset;
}

// =============================================================================
// FileByteSource
// =============================================================================

FileByteSource::FileByteSource(std::filesystem::path path) : path_(std::move(path)) {
    stream_.open(path_, std::ios::binary);
    if (!stream_.is_open()) {
        throw IOError("Failed to open SFF file: " + path_.string(), ErrorContext(path_.string()));
    }

    std::error_code ec;
    size_ = std::filesystem::file_size(path_, ec);
    if (ec) {
        throw IOError("Failed to determine file size", ec, ErrorContext(path_.string()));
    }
}

std::size_t FileByteSource::read(std::span<std::uint8_t> buffer) {
    if (buffer.empty()) {
        return 0;
    }
    stream_.read(reinterpret_cast<char*>(buffer.data()),
                 static_cast<std::streamsize>(buffer.size()));
    const auto count = static_cast<std::size_t>(stream_.gcount());
    if (stream_.bad()) {
        throw IOError("Failed to read from file", ErrorContext(path_.string()).withOffset(position_));
    }
    if (stream_.eof()) {
        stream_.clear();
    }
    position_ += count;
    return count;
}

void FileByteSource::seek(FileOffset offset) {
    stream_.seekg(static_cast<std::streamoff>(offset), std::ios::beg);
    if (!stream_.good()) {
        stream_.clear();
        throw IOError("Failed to seek in file", ErrorContext(path_.string()).withOffset(offset));
    }
    position_ = offset;
}

// =============================================================================
// MemoryByteSink
// =============================================================================

void MemoryByteSink::write(std::span<const std::uint8_t> data) {
    const auto end = static_cast<std::size_t>(position_) + data.size();
    if (end > buffer_.size()) {
        buffer_.resize(end);
    }
    std::copy(data.begin(), data.end(), buffer_.begin() + static_cast<std::ptrdiff_t>(position_));
    position_ = end;
}

void MemoryByteSink::seek(FileOffset offset) {
    if (offset > buffer_.size()) {
        throw IOError("Cannot seek past the end of a memory sink",
                      ErrorContext().withOffset(offset));
    }
    position_ = offset;
}

ByteBuffer MemoryByteSink::release() noexcept {
    position_ = 0;
    return std::exchange(buffer_, {});
}

// =============================================================================
// FileByteSink
// =============================================================================

FileByteSink::FileByteSink(std::filesystem::path path) : path_(std::move(path)) {
    stream_.open(path_, std::ios::binary | std::ios::trunc);
    if (!stream_.is_open()) {
        throw IOError("Failed to create output file: " + path_.string(),
                      ErrorContext(path_.string()));
    }
}

void FileByteSink::write(std::span<const std::uint8_t> data) {
    stream_.write(reinterpret_cast<const char*>(data.data()),
                  static_cast<std::streamsize>(data.size()));
    if (!stream_.good()) {
        throw IOError("Failed to write to file", ErrorContext(path_.string()).withOffset(position_));
    }
    position_ += data.size();
}

void FileByteSink::seek(FileOffset offset) {
    stream_.seekp(static_cast<std::streamoff>(offset), std::ios::beg);
    if (!stream_.good()) {
        throw IOError("Failed to seek in output file",
                      ErrorContext(path_.string()).withOffset(offset));
    }
    position_ = offset;
}

void FileByteSink::flush() {
    stream_.flush();
    if (!stream_.good()) {
        throw IOError("Failed to flush output file", ErrorContext(path_.string()));
    }
}

void FileByteSink::close() {
    if (!stream_.is_open()) {
        return;
    }
    flush();
    stream_.close();
}

}  // namespace sffc::io
