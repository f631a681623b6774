// =============================================================================
// sff-codec - SFF Writer
// =============================================================================
// Serializes read records into a complete SFF stream.
//
// This module provides:
// - SffWriter: header, records and optional ".mft" index onto a ByteSink
// - SffFileWriter: atomic file output via temporary file + rename
// - writeSff / writeSffFile convenience functions
//
// Write order:
//   1. Every record is validated; nothing is written if one is rejected
//   2. Global header with index_offset = index_length = 0
//   3. Read records, each padded to 8 bytes
//   4. Manifest index (optional), then the header is rewritten in place
//      with the real index_offset and index_length
//
// Usage:
//   sffc::format::SffFileWriter writer("reads.sff", {"TACG...", "TCAG"});
//   writer.write(records);
//   writer.finalize();  // Renames reads.sff.tmp to reads.sff
// =============================================================================

#ifndef SFFC_FORMAT_SFF_WRITER_H
#define SFFC_FORMAT_SFF_WRITER_H

#include <cstddef>
#include <filesystem>
#include <memory>
#include <span>
#include <string>

#include "sffc/format/sff_format.h"
#include "sffc/io/byte_source.h"

namespace sffc::format {

// =============================================================================
// Writer Options
// =============================================================================

/// @brief Configuration options for SffWriter.
struct WriterOptions {
    /// @brief Append a ".mft" manifest index after the records.
    bool emitIndex = true;

    /// @brief Manifest XML stored in the index; a comment block is used when empty.
    std::string manifestXml;
};

// =============================================================================
// SffWriter Class
// =============================================================================

/// @brief Writes one SFF stream to a seekable sink.
class SffWriter {
public:
    /// @param sink Destination; must outlive the writer and support seeking back.
    SffWriter(io::ByteSink& sink, FlowParameters params, WriterOptions options = {});

    SffWriter(const SffWriter&) = delete;
    SffWriter& operator=(const SffWriter&) = delete;

    /// @brief Write the header, all records and the optional index.
    /// @return Number of records written.
    /// @throws FormatError(kInvalidRecord) before any output if a record is rejected.
    /// @throws StateError if called a second time.
    /// @throws IOError on sink failure.
    std::size_t writeFile(std::span<const ReadRecord> records);

    /// @brief Header as last written, with the final index fields.
    [[nodiscard]] const GlobalHeader& header() const noexcept { return header_; }

    /// @brief False when no index was requested or it had to be dropped.
    [[nodiscard]] bool indexWritten() const noexcept { return indexWritten_; }

private:
    io::ByteSink& sink_;
    FlowParameters params_;
    WriterOptions options_;

    GlobalHeader header_;
    bool written_ = false;
    bool indexWritten_ = false;
};

/// @brief Write a complete SFF stream to a sink.
std::size_t writeSff(io::ByteSink& sink, const FlowParameters& params,
                     std::span<const ReadRecord> records, WriterOptions options = {});

// =============================================================================
// SffFileWriter Class
// =============================================================================

/// @brief SFF file output with atomic replace semantics.
///
/// The stream is written to "<output>.tmp" and renamed over the output
/// path by finalize(). A writer destroyed before finalize() removes the
/// temporary file, so a header left unpatched never reaches the output path.
class SffFileWriter {
public:
    /// @throws IOError if the temporary file cannot be created.
    SffFileWriter(std::filesystem::path outputPath, FlowParameters params,
                  WriterOptions options = {});

    /// @brief Removes the temporary file if not finalized.
    ~SffFileWriter();

    SffFileWriter(const SffFileWriter&) = delete;
    SffFileWriter& operator=(const SffFileWriter&) = delete;

    /// @brief Write all records to the temporary file.
    /// @throws StateError after finalize() or abort().
    /// @note Any failure aborts the writer before the exception propagates.
    std::size_t write(std::span<const ReadRecord> records);

    /// @brief Close the temporary file and rename it to the output path.
    /// @throws StateError if nothing was written or the writer was aborted.
    /// @throws IOError on flush or rename failure.
    void finalize();

    /// @brief Discard the temporary file.
    void abort() noexcept;

    [[nodiscard]] bool isFinalized() const noexcept { return finalized_; }
    [[nodiscard]] bool isAborted() const noexcept { return aborted_; }

    [[nodiscard]] const std::filesystem::path& outputPath() const noexcept { return outputPath_; }
    [[nodiscard]] const std::filesystem::path& tempPath() const noexcept { return tempPath_; }

    /// @brief Header of the written stream.
    [[nodiscard]] const GlobalHeader& header() const noexcept { return header_; }

private:
    std::filesystem::path outputPath_;
    std::filesystem::path tempPath_;
    FlowParameters params_;
    WriterOptions options_;
    std::unique_ptr<io::FileByteSink> sink_;

    GlobalHeader header_;
    bool written_ = false;
    bool finalized_ = false;
    bool aborted_ = false;
};

/// @brief Write records to path through a temporary file.
/// @note On any failure the temporary file is removed and path is untouched.
std::size_t writeSffFile(const std::filesystem::path& path, const FlowParameters& params,
                         std::span<const ReadRecord> records, WriterOptions options = {});

}  // namespace sffc::format

#endif  // SFFC_FORMAT_SFF_WRITER_H
