// =============================================================================
// sff-codec - SFF Stream Reader Implementation
// =============================================================================

#include "sffc/format/sff_reader.h"

#include <algorithm>
#include <array>
#include <utility>

#include <fmt/format.h>

#include "sffc/common/logger.h"
#include "sffc/format/header_codec.h"
#include "sffc/format/record_codec.h"

namespace sffc::format {

// =============================================================================
// Construction
// =============================================================================

SffReader::SffReader(io::ByteSource& source, ReaderOptions options)
    : source_(&source), options_(std::move(options)) {
    cursor_.emplace(*source_, options_.label);
}

SffReader::SffReader(const std::filesystem::path& path, ReaderOptions options)
    : ownedSource_(std::make_unique<io::FileByteSource>(path)),
      source_(ownedSource_.get()),
      options_(std::move(options)) {
    cursor_.emplace(*source_, options_.label);
}

SffReader::~SffReader() = default;

SffReader::SffReader(SffReader&&) noexcept = default;
SffReader& SffReader::operator=(SffReader&&) noexcept = default;

// =============================================================================
// Opening
// =============================================================================

void SffReader::open() {
    if (isOpen_) {
        return;
    }
    header_ = decodeGlobalHeader(*cursor_);
    isOpen_ = true;
    SFFC_LOG_DEBUG("Opened SFF stream {}: {} reads of {} flows", cursor_->label(),
                   header_.numberOfReads, header_.flowLength);
}

const GlobalHeader& SffReader::globalHeader() const {
    requireOpen();
    return header_;
}

void SffReader::requireOpen() const {
    if (!isOpen_) {
        throw StateError("Reader is not open");
    }
}

void SffReader::requireSeekable() const {
    if (!source_->isSeekable()) {
        throw IOError("Index and random access need a seekable source",
                      ErrorContext(cursor_->label()));
    }
}

// =============================================================================
// Sequential Iteration
// =============================================================================

std::optional<ReadRecord> SffReader::next() {
    requireOpen();
    if (finished_) {
        return std::nullopt;
    }

    try {
        if (recordsRead_ < header_.numberOfReads) {
            ensureNotAtIndex(recordsRead_);
            ReadRecord record = decodeReadRecord(*cursor_, header_, recordsRead_);
            ++recordsRead_;
            return record;
        }
        finishStream();
    } catch (...) {
        finished_ = true;
        throw;
    }

    finished_ = true;
    SFFC_LOG_DEBUG("Finished SFF stream {} after {} reads", cursor_->label(), recordsRead_);
    return std::nullopt;
}

SffReader::Iterator SffReader::begin() {
    requireOpen();
    return Iterator(this);
}

void SffReader::ensureNotAtIndex(ReadIndex readIndex) const {
    if (!header_.hasIndex() || cursor_->offset() != header_.indexOffset) {
        return;
    }
    ErrorContext context = cursor_->contextAt(header_.indexOffset);
    context.withRead(readIndex).withValues(header_.numberOfReads, readIndex);
    throw FormatError(FormatErrorKind::kIndexBeforeRecordsExhausted,
                      fmt::format("Reached index block at offset {} after only {} of {} reads",
                                  header_.indexOffset, readIndex, header_.numberOfReads),
                      std::move(context));
}

void SffReader::finishStream() {
    FileOffset position = cursor_->offset();

    if (header_.hasIndex()) {
        if (position < header_.indexOffset) {
            ErrorContext context = cursor_->contextAt(position);
            context.withValues(header_.indexOffset, position);
            throw FormatError(FormatErrorKind::kUnexpectedGapBeforeIndex,
                              fmt::format("Gap of {} bytes after final record end {}, before {} "
                                          "where index starts?",
                                          header_.indexOffset - position, position,
                                          header_.indexOffset),
                              std::move(context));
        }
        if (position > header_.indexOffset) {
            ErrorContext context = cursor_->contextAt(header_.indexOffset);
            context.withValues(header_.indexOffset, position);
            throw FormatError(FormatErrorKind::kCorruptIndexPointer,
                              fmt::format("Index offset {} points inside the read records, which "
                                          "end at {}",
                                          header_.indexOffset, position),
                              std::move(context));
        }
        cursor_->skip(header_.indexLength, "index block");
        position = cursor_->offset();
    }

    const auto padding = static_cast<std::size_t>(paddingTo8(position));
    if (padding > 0) {
        std::array<std::uint8_t, kSffAlignment> region{};
        const std::size_t got = cursor_->readUpTo(std::span(region).first(padding));
        const auto filled = std::span(region).first(got);

        if (std::any_of(filled.begin(), filled.end(), [](std::uint8_t b) { return b != 0; })) {
            const auto tail = filled.last(std::min<std::size_t>(got, kSffMagic.size()));
            if (padding >= kSffMagic.size() && std::ranges::equal(tail, kSffMagic)) {
                ErrorContext context = cursor_->contextAt(position);
                context.withObserved(describeBytes(filled));
                throw FormatError(FormatErrorKind::kTrailingPaddingLooksLikeConcatenation,
                                  fmt::format("Your SFF file is invalid, post index {} byte null "
                                              "padding region ended '.sff' which could be the "
                                              "start of a concatenated SFF file? See offset {}",
                                              padding, position),
                                  std::move(context));
            }
            const auto bad = std::find_if(filled.begin(), filled.end(),
                                          [](std::uint8_t b) { return b != 0; });
            const FileOffset badOffset = position + static_cast<FileOffset>(bad - filled.begin());
            ErrorContext context = cursor_->contextAt(badOffset);
            context.withObserved(describeBytes(filled));
            throw FormatError(FormatErrorKind::kBadPadding,
                              fmt::format("Your SFF file is invalid, post index {} byte null "
                                          "padding region contained data at offset {}",
                                          padding, badOffset),
                              std::move(context));
        }

        if (got < padding) {
            if (options_.requireTerminalPadding) {
                ErrorContext context = cursor_->contextAt(position);
                context.withValues(padding, got);
                throw FormatError(FormatErrorKind::kPrematureEOF,
                                  fmt::format("Missing terminal {} byte null padding region at "
                                              "offset {}",
                                              padding, position),
                                  std::move(context));
            }
            SFFC_LOG_WARNING("SFF stream {} is missing a terminal {} byte null padding region "
                             "at offset {}",
                             cursor_->label(), padding, position);
            return;
        }
        position += padding;
    }

    std::array<std::uint8_t, 4> trailer{};
    const std::size_t got = cursor_->readUpTo(trailer);
    if (got == 0) {
        return;
    }
    ErrorContext context = cursor_->contextAt(position);
    context.withObserved(describeBytes(std::span(trailer).first(got)));
    if (got == trailer.size() && trailer == kSffMagic) {
        throw FormatError(FormatErrorKind::kConcatenatedFilesDetected,
                          fmt::format("Additional data at end of SFF file, perhaps multiple SFF "
                                      "files concatenated? See offset {}",
                                      position),
                          std::move(context));
    }
    throw FormatError(FormatErrorKind::kTrailingGarbage,
                      fmt::format("Additional data at end of SFF file, see offset {}", position),
                      std::move(context));
}

// =============================================================================
// Index and Random Access
// =============================================================================

template <typename Fn>
auto SffReader::atSavedPosition(Fn&& fn) -> decltype(fn()) {
    requireOpen();
    requireSeekable();
    const FileOffset saved = cursor_->offset();
    try {
        auto result = fn();
        cursor_->seekTo(saved);
        return result;
    } catch (...) {
        cursor_->seekTo(saved);
        throw;
    }
}

bool SffReader::hasIndex() const {
    requireOpen();
    return header_.hasIndex();
}

IndexBlock SffReader::readIndex() {
    return atSavedPosition([this] { return decodeIndexBlock(*cursor_, header_); });
}

const ManifestIndex& SffReader::manifestIndex() {
    if (!manifestCache_.has_value()) {
        const IndexBlock block = readIndex();
        manifestCache_.emplace(requireManifestIndex(block));
    }
    return *manifestCache_;
}

std::string SffReader::readManifestXml() {
    return atSavedPosition([this] { return decodeManifestXml(*cursor_, header_); });
}

ReadRecord SffReader::readRecordAt(FileOffset offset) {
    requireOpen();
    if (offset < header_.headerLength || offset % kSffAlignment != 0) {
        ErrorContext context = cursor_->contextAt(offset);
        throw FormatError(FormatErrorKind::kCorruptIndexPointer,
                          fmt::format("Offset {} is not a read record boundary", offset),
                          std::move(context));
    }
    return atSavedPosition([this, offset] {
        cursor_->seekTo(offset);
        return decodeReadRecord(*cursor_, header_);
    });
}

std::optional<ReadRecord> SffReader::readRecordByName(std::string_view name) {
    const IndexEntry* entry = manifestIndex().find(name);
    if (entry == nullptr) {
        return std::nullopt;
    }
    ReadRecord record = readRecordAt(entry->recordOffset);
    if (record.name != name) {
        ErrorContext context = cursor_->contextAt(entry->recordOffset);
        context.withObserved(record.name);
        throw FormatError(FormatErrorKind::kCorruptIndexPointer,
                          fmt::format("Index entry for {} points at offset {}, which holds read {}",
                                      name, entry->recordOffset, record.name),
                          std::move(context));
    }
    return record;
}

std::vector<IndexEntry> SffReader::scanRecordOffsets() {
    return atSavedPosition([this] {
        cursor_->seekTo(header_.headerLength);
        std::vector<IndexEntry> entries;
        for (ReadIndex i = 0; i < header_.numberOfReads; ++i) {
            ensureNotAtIndex(i);
            ReadRecord record = decodeReadRecord(*cursor_, header_, i);
            entries.push_back(IndexEntry{std::move(record.name), record.fileOffset});
        }
        return entries;
    });
}

// =============================================================================
// Source-Level Helpers
// =============================================================================

IndexBlock findIndex(io::ByteSource& source) {
    SffReader reader(source);
    reader.open();
    return reader.readIndex();
}

std::string readManifestXml(io::ByteSource& source) {
    SffReader reader(source);
    reader.open();
    return reader.readManifestXml();
}

std::vector<ReadRecord> readAllRecords(io::ByteSource& source, ReaderOptions options) {
    SffReader reader(source, std::move(options));
    reader.open();
    std::vector<ReadRecord> records;
    while (auto record = reader.next()) {
        records.push_back(std::move(*record));
    }
    return records;
}

}  // namespace sffc::format
