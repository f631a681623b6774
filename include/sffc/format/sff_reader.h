// =============================================================================
// sff-codec - SFF Stream Reader
// =============================================================================
// Drives the header, record and index codecs over one byte source.
//
// This module provides:
// - SffReader: lazy, forward-only record iteration with end-of-stream checks
// - Explicit index access (manifest index, manifest XML)
// - Random access to records by offset or by indexed read name
// - findIndex / readManifestXml helpers working directly on a source
//
// Usage:
//   sffc::io::FileByteSource source("/path/to/reads.sff");
//   sffc::format::SffReader reader(source);
//   reader.open();
//   for (const auto& record : reader) {
//       // process record...
//   }
//
// Iteration stops with an exception at the first structural violation.
// Records already returned stay valid. Index problems never interrupt
// iteration because the index block is skipped, not decoded.
// =============================================================================

#ifndef SFFC_FORMAT_SFF_READER_H
#define SFFC_FORMAT_SFF_READER_H

#include <cstddef>
#include <filesystem>
#include <iterator>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "sffc/common/error.h"
#include "sffc/common/types.h"
#include "sffc/format/index_codec.h"
#include "sffc/format/sff_format.h"
#include "sffc/io/byte_cursor.h"
#include "sffc/io/byte_source.h"

namespace sffc::format {

// =============================================================================
// Reader Options
// =============================================================================

/// @brief Configuration options for SffReader.
struct ReaderOptions {
    /// @brief Name used in error messages; defaults to the source's name.
    std::string label;

    /// @brief Treat a missing final padding region as an error.
    /// @note By default it is logged as a warning and iteration ends normally.
    bool requireTerminalPadding = false;
};

// =============================================================================
// SffReader Class
// =============================================================================

/// @brief Reader for one SFF byte stream.
///
/// Thread Safety:
/// - Not thread-safe; use one reader per source
class SffReader {
public:
    class Iterator;

    /// @brief End marker for range-based iteration.
    struct Sentinel {};

    // =========================================================================
    // Construction
    // =========================================================================

    /// @brief Read from a borrowed source.
    /// @param source Source positioned at the start of the SFF data; must outlive the reader.
    explicit SffReader(io::ByteSource& source, ReaderOptions options = {});

    /// @brief Open and own a file.
    /// @throws IOError if the file cannot be opened.
    explicit SffReader(const std::filesystem::path& path, ReaderOptions options = {});

    ~SffReader();

    SffReader(const SffReader&) = delete;
    SffReader& operator=(const SffReader&) = delete;
    SffReader(SffReader&&) noexcept;
    SffReader& operator=(SffReader&&) noexcept;

    // =========================================================================
    // Opening
    // =========================================================================

    /// @brief Decode the global header.
    /// @throws FormatError for any header violation, kEmptyFile for empty input.
    void open();

    [[nodiscard]] bool isOpen() const noexcept { return isOpen_; }

    /// @throws StateError if the reader is not open.
    [[nodiscard]] const GlobalHeader& globalHeader() const;

    // =========================================================================
    // Sequential Iteration
    // =========================================================================

    /// @brief Decode the next record.
    /// @return The record, or nothing once all records were read and the
    ///         trailer checks passed.
    /// @throws FormatError for record and stream layout violations.
    [[nodiscard]] std::optional<ReadRecord> next();

    /// @brief Number of records returned so far.
    [[nodiscard]] ReadIndex recordsRead() const noexcept { return recordsRead_; }

    /// @brief True after the stream ended, successfully or not.
    [[nodiscard]] bool isFinished() const noexcept { return finished_; }

    /// @brief Iterator starting at the next unread record.
    [[nodiscard]] Iterator begin();

    [[nodiscard]] Sentinel end() const noexcept { return {}; }

    // =========================================================================
    // Index and Random Access (seekable sources only)
    // =========================================================================

    /// @brief True when the header declares an index block.
    [[nodiscard]] bool hasIndex() const;

    /// @brief Decode the index block.
    /// @note Restores the sequential position afterwards.
    [[nodiscard]] IndexBlock readIndex();

    /// @brief Decoded manifest index, cached after the first call.
    /// @throws FormatError(kUnknownIndexFormat) for other index types.
    [[nodiscard]] const ManifestIndex& manifestIndex();

    /// @brief Manifest XML text.
    /// @throws FormatError(kNoXmlManifest) if the index has no XML.
    [[nodiscard]] std::string readManifestXml();

    /// @brief Decode the record whose read header starts at offset.
    [[nodiscard]] ReadRecord readRecordAt(FileOffset offset);

    /// @brief Look a read up through the manifest index.
    /// @return The record, or nothing if the name is not indexed.
    /// @throws FormatError(kCorruptIndexPointer) if the entry points at another read.
    [[nodiscard]] std::optional<ReadRecord> readRecordByName(std::string_view name);

    /// @brief Build name/offset pairs by walking every record.
    /// @note Works without an index; slower than manifestIndex().
    [[nodiscard]] std::vector<IndexEntry> scanRecordOffsets();

private:
    void requireOpen() const;
    void requireSeekable() const;

    /// @brief Refuse to decode a record where the index block starts.
    void ensureNotAtIndex(ReadIndex readIndex) const;

    /// @brief Run fn with the cursor, then return it to where iteration was.
    template <typename Fn>
    auto atSavedPosition(Fn&& fn) -> decltype(fn());

    /// @brief Checks after the last record: index placement, padding, trailing data.
    void finishStream();

    std::unique_ptr<io::ByteSource> ownedSource_;
    io::ByteSource* source_;
    ReaderOptions options_;
    std::optional<io::ByteCursor> cursor_;

    bool isOpen_ = false;
    bool finished_ = false;
    GlobalHeader header_;
    ReadIndex recordsRead_ = 0;
    std::optional<ManifestIndex> manifestCache_;
};

// =============================================================================
// Iterator
// =============================================================================

/// @brief Single-pass input iterator over SffReader::next().
class SffReader::Iterator {
public:
    using iterator_category = std::input_iterator_tag;
    using value_type = ReadRecord;
    using difference_type = std::ptrdiff_t;
    using pointer = ReadRecord*;
    using reference = ReadRecord&;

    Iterator() = default;

    explicit Iterator(SffReader* reader) : reader_(reader) { advance(); }

    [[nodiscard]] ReadRecord& operator*() noexcept { return *current_; }
    [[nodiscard]] const ReadRecord& operator*() const noexcept { return *current_; }
    [[nodiscard]] ReadRecord* operator->() noexcept { return &*current_; }

    Iterator& operator++() {
        advance();
        return *this;
    }

    void operator++(int) { advance(); }

    friend bool operator==(const Iterator& it, Sentinel) noexcept {
        return !it.current_.has_value();
    }

private:
    void advance() { current_ = reader_->next(); }

    SffReader* reader_ = nullptr;
    std::optional<ReadRecord> current_;
};

// =============================================================================
// Source-Level Helpers
// =============================================================================

/// @brief Decode the header and the index block of a seekable source.
/// @throws FormatError(kNoIndexPresent) when the file has no index.
[[nodiscard]] IndexBlock findIndex(io::ByteSource& source);

/// @brief Return the manifest XML of a seekable source.
/// @throws FormatError(kNoIndexPresent) or FormatError(kNoXmlManifest).
[[nodiscard]] std::string readManifestXml(io::ByteSource& source);

/// @brief Decode every record of a source.
[[nodiscard]] std::vector<ReadRecord> readAllRecords(io::ByteSource& source,
                                                     ReaderOptions options = {});

}  // namespace sffc::format

#endif  // SFFC_FORMAT_SFF_READER_H
