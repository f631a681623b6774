// =============================================================================
// sff-codec - SFF Verifier Implementation
// =============================================================================

#include "sffc/format/sff_verifier.h"

#include <algorithm>
#include <string_view>
#include <unordered_map>
#include <utility>
#include <variant>

#include <fmt/format.h>

#include "sffc/common/logger.h"
#include "sffc/format/index_codec.h"
#include "sffc/format/sff_reader.h"

namespace sffc::format {

namespace {

VerificationResult passedCheck(std::string name, std::string details) {
    VerificationResult result;
    result.checkName = std::move(name);
    result.passed = true;
    result.details = std::move(details);
    return result;
}

VerificationResult failedCheck(std::string name, const Error& error) {
    VerificationResult result;
    result.checkName = std::move(name);
    result.passed = false;
    result.errorMessage = error.message();
    result.kind = error.kind();
    result.byteOffset = error.byteOffset();
    return result;
}

/// @brief Compare manifest entries against the offsets found by walking the records.
/// @return Number of entries checked.
std::size_t checkIndexEntries(SffReader& reader, const ManifestIndex& manifest) {
    const std::vector<IndexEntry> scanned = reader.scanRecordOffsets();

    std::unordered_map<std::string_view, FileOffset> offsets;
    offsets.reserve(scanned.size());
    for (const auto& entry : scanned) {
        offsets.emplace(entry.readName, entry.recordOffset);
    }

    for (const auto& entry : manifest.entries()) {
        const auto it = offsets.find(entry.readName);
        if (it == offsets.end()) {
            ErrorContext context;
            context.withOffset(entry.recordOffset).withObserved(entry.readName);
            throw FormatError(FormatErrorKind::kCorruptIndexPointer,
                              fmt::format("Index entry {} names no read in the file",
                                          entry.readName),
                              std::move(context));
        }
        if (it->second != entry.recordOffset) {
            ErrorContext context;
            context.withOffset(entry.recordOffset).withValues(it->second, entry.recordOffset);
            throw FormatError(FormatErrorKind::kCorruptIndexPointer,
                              fmt::format("Index entry {} points at offset {}, but the read "
                                          "starts at {}",
                                          entry.readName, entry.recordOffset, it->second),
                              std::move(context));
        }
    }
    return manifest.size();
}

}  // namespace

const VerificationResult* VerificationSummary::firstFailure() const noexcept {
    const auto it = std::find_if(results.begin(), results.end(),
                                 [](const VerificationResult& r) { return !r.passed; });
    return it == results.end() ? nullptr : &*it;
}

VerificationSummary verifySff(io::ByteSource& source, const VerifyOptions& options) {
    VerificationSummary summary;

    ReaderOptions readerOptions;
    readerOptions.requireTerminalPadding = options.requireTerminalPadding;
    SffReader reader(source, readerOptions);

    // Global header
    auto opened = tryExecute([&reader] { reader.open(); });
    if (!opened) {
        summary.addResult(failedCheck("global header", opened.error()));
        return summary;
    }
    const GlobalHeader& header = reader.globalHeader();
    summary.addResult(passedCheck("global header",
                                  fmt::format("{} reads, {} flows, key '{}'", header.numberOfReads,
                                              header.flowLength, header.keySequence)));

    // Record stream
    auto streamed = tryExecute([&reader] {
        while (reader.next().has_value()) {
        }
        return reader.recordsRead();
    });
    summary.recordsRead = reader.recordsRead();
    if (streamed) {
        summary.addResult(passedCheck("record stream", fmt::format("{} reads", *streamed)));
    } else {
        summary.addResult(failedCheck("record stream", streamed.error()));
        if (options.failFast) {
            return summary;
        }
    }

    if (!options.checkIndex || !header.hasIndex() || !source.isSeekable()) {
        return summary;
    }

    // Index block
    auto block = tryExecute([&reader] { return reader.readIndex(); });
    if (!block) {
        summary.addResult(failedCheck("index block", block.error()));
        return summary;
    }
    const auto* manifest = std::get_if<ManifestIndex>(&*block);
    if (manifest == nullptr) {
        const auto& unknown = std::get<UnknownIndex>(*block);
        summary.addResult(passedCheck(
            "index block",
            fmt::format("'{}' index present, not interpreted", describeBytes(unknown.magic))));
        return summary;
    }
    summary.addResult(passedCheck("index block",
                                  fmt::format("{} entries, {} bytes of XML", manifest->size(),
                                              manifest->xml().size())));

    // Index entries
    auto checked = tryExecute([&reader, manifest] { return checkIndexEntries(reader, *manifest); });
    if (checked) {
        summary.addResult(
            passedCheck("index entries", fmt::format("{} entries match", *checked)));
    } else {
        summary.addResult(failedCheck("index entries", checked.error()));
    }

    SFFC_LOG_DEBUG("Verified {}: {}/{} checks passed", source.name(), summary.passedChecks,
                   summary.totalChecks);
    return summary;
}

}  // namespace sffc::format
