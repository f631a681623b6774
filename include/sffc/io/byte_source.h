// =============================================================================
// sff-codec - Byte Sources and Sinks
// =============================================================================
// Abstract byte input and output used by the SFF decoders and writer.
//
// This module provides:
// - ByteSource: read/seek interface over an already-decompressed SFF stream
// - MemoryByteSource: borrowed span or owned buffer
// - StreamByteSource: any std::istream, seekable or sequential (pipes)
// - FileByteSource: owns an std::ifstream opened on a path
// - ByteSink: write/seek interface; seeking is needed to patch the header
// - MemoryByteSink, FileByteSink
//
// Offsets are relative to where the SFF data starts, which for a
// StreamByteSource is the stream position at construction.
// =============================================================================

#ifndef SFFC_IO_BYTE_SOURCE_H
#define SFFC_IO_BYTE_SOURCE_H

#include <cstdint>
#include <filesystem>
#include <fstream>
#include <istream>
#include <optional>
#include <span>
#include <string>
#include <vector>

#include "sffc/common/types.h"

namespace sffc::io {

// =============================================================================
// ByteSource
// =============================================================================

/// @brief Abstract byte input.
///
/// Thread Safety:
/// - Not thread-safe; one reader per source
class ByteSource {
public:
    virtual ~ByteSource() = default;

    /// @brief Read up to buffer.size() bytes.
    /// @return Number of bytes read, 0 at end of data.
    /// @throws IOError on a hard read failure.
    [[nodiscard]] virtual std::size_t read(std::span<std::uint8_t> buffer) = 0;

    /// @brief Move to an absolute offset.
    /// @throws IOError if the source is sequential or the seek fails.
    virtual void seek(FileOffset offset) = 0;

    /// @brief Current absolute offset.
    [[nodiscard]] virtual FileOffset position() const noexcept = 0;

    [[nodiscard]] virtual bool isSeekable() const noexcept = 0;

    /// @brief Total size in bytes, when known.
    [[nodiscard]] virtual std::optional<std::uint64_t> size() const noexcept = 0;

    /// @brief Label used in error messages (usually a file path).
    [[nodiscard]] virtual std::string name() const { return {}; }
};

/// @brief Byte source over a memory buffer.
class MemoryByteSource final : public ByteSource {
public:
    /// @brief Borrow a buffer; it must outlive the source.
    explicit MemoryByteSource(std::span<const std::uint8_t> data) noexcept : data_(data) {}

    /// @brief Take ownership of a buffer.
    explicit MemoryByteSource(ByteBuffer owned) noexcept
        : owned_(std::move(owned)), data_(owned_) {}

    MemoryByteSource(const MemoryByteSource&) = delete;
    MemoryByteSource& operator=(const MemoryByteSource&) = delete;

    [[nodiscard]] std::size_t read(std::span<std::uint8_t> buffer) override;
    void seek(FileOffset offset) override;
    [[nodiscard]] FileOffset position() const noexcept override { return position_; }
    [[nodiscard]] bool isSeekable() const noexcept override { return true; }
    [[nodiscard]] std::optional<std::uint64_t> size() const noexcept override {
        return data_.size();
    }
    [[nodiscard]] std::string name() const override { return "<memory>"; }

private:
    ByteBuffer owned_;
    std::span<const std::uint8_t> data_;
    FileOffset position_ = 0;
};

/// @brief Byte source over a borrowed std::istream.
/// @note A sequential source never seeks; skipping is done by reading.
class StreamByteSource final : public ByteSource {
public:
    /// @param stream Stream positioned at the start of the SFF data.
    /// @param seekable Pass false for pipes and decompressing streams.
    explicit StreamByteSource(std::istream& stream, bool seekable = true,
                              std::string label = "<stream>");

    [[nodiscard]] std::size_t read(std::span<std::uint8_t> buffer) override;
    void seek(FileOffset offset) override;
    [[nodiscard]] FileOffset position() const noexcept override { return position_; }
    [[nodiscard]] bool isSeekable() const noexcept override { return seekable_; }
    [[nodiscard]] std::optional<std::uint64_t> size() const noexcept override { return size_; }
    [[nodiscard]] std::string name() const override { return label_; }

private:
    std::istream& stream_;
    bool seekable_;
    std::string label_;
    std::streamoff base_ = 0;
    FileOffset position_ = 0;
    std::optional<std::uint64_t> size_;
};

/// @brief Byte source that opens and owns a binary file.
class FileByteSource final : public ByteSource {
public:
    /// @throws IOError if the file cannot be opened.
    explicit FileByteSource(std::filesystem::path path);

    [[nodiscard]] std::size_t read(std::span<std::uint8_t> buffer) override;
    void seek(FileOffset offset) override;
    [[nodiscard]] FileOffset position() const noexcept override { return position_; }
    [[nodiscard]] bool isSeekable() const noexcept override { return true; }
    [[nodiscard]] std::optional<std::uint64_t> size() const noexcept override { return size_; }
    [[nodiscard]] std::string name() const override { return path_.string(); }

    [[nodiscard]] const std::filesystem::path& path() const noexcept { return path_; }

private:
    std::filesystem::path path_;
    std::ifstream stream_;
    FileOffset position_ = 0;
    std::uint64_t size_ = 0;
};

// =============================================================================
// ByteSink
// =============================================================================

/// @brief Abstract byte output with random-access overwrite.
class ByteSink {
public:
    virtual ~ByteSink() = default;

    /// @throws IOError on write failure.
    virtual void write(std::span<const std::uint8_t> data) = 0;

    /// @brief Move to an absolute offset already written.
    virtual void seek(FileOffset offset) = 0;

    [[nodiscard]] virtual FileOffset position() const noexcept = 0;

    virtual void flush() {}

    [[nodiscard]] virtual std::string name() const { return {}; }
};

/// @brief Sink that collects bytes in memory.
class MemoryByteSink final : public ByteSink {
public:
    void write(std::span<const std::uint8_t> data) override;
    void seek(FileOffset offset) override;
    [[nodiscard]] FileOffset position() const noexcept override { return position_; }
    [[nodiscard]] std::string name() const override { return "<memory>"; }

    [[nodiscard]] const ByteBuffer& data() const noexcept { return buffer_; }

    /// @brief Move the collected bytes out and reset the sink.
    [[nodiscard]] ByteBuffer release() noexcept;

private:
    ByteBuffer buffer_;
    FileOffset position_ = 0;
};

/// @brief Sink writing to a binary file, truncated on open.
class FileByteSink final : public ByteSink {
public:
    /// @throws IOError if the file cannot be created.
    explicit FileByteSink(std::filesystem::path path);

    void write(std::span<const std::uint8_t> data) override;
    void seek(FileOffset offset) override;
    [[nodiscard]] FileOffset position() const noexcept override { return position_; }
    void flush() override;
    [[nodiscard]] std::string name() const override { return path_.string(); }

    /// @brief Flush and close; further writes fail.
    void close();

private:
    std::filesystem::path path_;
    std::ofstream stream_;
    FileOffset position_ = 0;
};

}  // namespace sffc::io

#endif  // SFFC_IO_BYTE_SOURCE_H
