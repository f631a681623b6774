// =============================================================================
// sff-codec - SFF Writer Implementation
// =============================================================================

#include "sffc/format/sff_writer.h"

#include <limits>
#include <string>
#include <system_error>
#include <utility>
#include <vector>

#include <fmt/format.h>

#include "sffc/common/error.h"
#include "sffc/common/logger.h"
#include "sffc/format/header_codec.h"
#include "sffc/format/index_codec.h"
#include "sffc/format/record_codec.h"

namespace sffc::format {

// =============================================================================
// SffWriter Implementation
// =============================================================================

SffWriter::SffWriter(io::ByteSink& sink, FlowParameters params, WriterOptions options)
    : sink_(sink), params_(std::move(params)), options_(std::move(options)) {}

std::size_t SffWriter::writeFile(std::span<const ReadRecord> records) {
    if (written_) {
        throw StateError("SffWriter::writeFile may only be called once");
    }
    written_ = true;

    if (records.size() > std::numeric_limits<std::uint32_t>::max()) {
        throw FormatError(FormatErrorKind::kInvalidRecord,
                          fmt::format("{} records exceed the 32-bit read count", records.size()));
    }

    header_ = makeGlobalHeader(params_, static_cast<std::uint32_t>(records.size()));
    for (std::size_t i = 0; i < records.size(); ++i) {
        validateReadRecord(records[i], header_, i);
    }

    const std::string xml =
        options_.manifestXml.empty() ? defaultManifestXml() : options_.manifestXml;
    if (options_.emitIndex) {
        // Only an index that will actually be written has to fit its u32 lengths
        FileOffset offset = header_.headerLength;
        FileOffset lastOffset = 0;
        std::uint64_t entriesSize = 0;
        for (const auto& record : records) {
            lastOffset = offset;
            offset += encodedRecordSize(record, header_);
            entriesSize += record.name.size() + kIndexEntryTrailerSize;
        }
        if (lastOffset <= kMaxIndexableOffset) {
            requireManifestIndexFits(xml.size(), entriesSize);
        }
    }

    const FileOffset base = sink_.position();
    sink_.write(encodeGlobalHeader(header_));

    bool indexable = options_.emitIndex;
    std::vector<IndexEntry> entries;
    if (indexable) {
        entries.reserve(records.size());
    }

    for (const auto& record : records) {
        const FileOffset offset = sink_.position() - base;
        if (indexable && offset > kMaxIndexableOffset) {
            SFFC_LOG_WARNING("Read {} at offset {} is beyond the manifest index range; "
                             "writing {} without an index",
                             record.name, offset, sink_.name());
            indexable = false;
            entries.clear();
        }
        if (indexable) {
            entries.push_back(IndexEntry{record.name, offset});
        }
        sink_.write(encodeReadRecord(record));
    }

    if (indexable) {
        const FileOffset indexOffset = sink_.position() - base;
        const EncodedIndex index = encodeManifestIndex(xml, std::move(entries));
        sink_.write(index.bytes);
        const FileOffset end = sink_.position();

        // Patch the header now that the index location is known
        header_.indexOffset = indexOffset;
        header_.indexLength = index.indexLength;
        sink_.seek(base);
        sink_.write(encodeGlobalHeader(header_));
        sink_.seek(end);
        indexWritten_ = true;
    }

    sink_.flush();
    SFFC_LOG_DEBUG("Wrote {} reads to {}, index={}+{}", records.size(), sink_.name(),
                   header_.indexOffset, header_.indexLength);
    return records.size();
}

std::size_t writeSff(io::ByteSink& sink, const FlowParameters& params,
                     std::span<const ReadRecord> records, WriterOptions options) {
    SffWriter writer(sink, params, std::move(options));
    return writer.writeFile(records);
}

// =============================================================================
// SffFileWriter Implementation
// =============================================================================

SffFileWriter::SffFileWriter(std::filesystem::path outputPath, FlowParameters params,
                             WriterOptions options)
    : outputPath_(std::move(outputPath)),
      tempPath_(outputPath_.string() + ".tmp"),
      params_(std::move(params)),
      options_(std::move(options)),
      sink_(std::make_unique<io::FileByteSink>(tempPath_)) {
    SFFC_LOG_DEBUG("SffFileWriter created: output={}, temp={}", outputPath_.string(),
                   tempPath_.string());
}

SffFileWriter::~SffFileWriter() {
    if (!finalized_ && !aborted_) {
        abort();
    }
}

std::size_t SffFileWriter::write(std::span<const ReadRecord> records) {
    if (finalized_ || aborted_) {
        throw StateError("Writer is finalized or aborted");
    }
    if (written_) {
        throw StateError("Records were already written to this file");
    }
    SffWriter writer(*sink_, params_, options_);
    written_ = true;
    std::size_t count = 0;
    try {
        count = writer.writeFile(records);
    } catch (...) {
        // A rejected or partially written file must never reach finalize()
        abort();
        throw;
    }
    header_ = writer.header();
    return count;
}

void SffFileWriter::finalize() {
    if (finalized_) {
        return;
    }
    if (aborted_) {
        throw StateError("Cannot finalize aborted writer");
    }
    if (!written_) {
        throw StateError("Cannot finalize before records were written");
    }

    sink_->close();
    sink_.reset();

    std::error_code ec;
    std::filesystem::rename(tempPath_, outputPath_, ec);
    if (ec) {
        throw IOError("Failed to rename temporary file to final output", ec,
                      ErrorContext(outputPath_.string()));
    }
    finalized_ = true;

    SFFC_LOG_INFO("SFF file finalized: {}, reads={}", outputPath_.string(),
                  header_.numberOfReads);
}

void SffFileWriter::abort() noexcept {
    if (aborted_ || finalized_) {
        return;
    }
    aborted_ = true;

    // The sink destructor closes the stream and never throws
    sink_.reset();

    std::error_code ec;
    if (std::filesystem::exists(tempPath_, ec)) {
        std::filesystem::remove(tempPath_, ec);
        if (ec) {
            SFFC_LOG_WARNING("Failed to remove temporary file: {}", tempPath_.string());
        }
    }
    SFFC_LOG_DEBUG("SffFileWriter aborted: {}", tempPath_.string());
}

std::size_t writeSffFile(const std::filesystem::path& path, const FlowParameters& params,
                         std::span<const ReadRecord> records, WriterOptions options) {
    SffFileWriter writer(path, params, std::move(options));
    const std::size_t count = writer.write(records);
    writer.finalize();
    return count;
}

}  // namespace sffc::format
