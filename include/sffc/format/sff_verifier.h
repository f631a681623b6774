// =============================================================================
// sff-codec - SFF Verifier
// =============================================================================
// Whole-file structural checks reported as a summary instead of an exception.
//
// This module provides:
// - VerificationResult / VerificationSummary
// - verifySff: header, record stream, index block and index entry checks
//
// Checks performed:
//   "global header"   header decodes
//   "record stream"   every record plus the end-of-stream layout
//   "index block"     the index decodes (seekable sources with an index)
//   "index entries"   every manifest entry names the read at its offset
// =============================================================================

#ifndef SFFC_FORMAT_SFF_VERIFIER_H
#define SFFC_FORMAT_SFF_VERIFIER_H

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

#include "sffc/common/error.h"
#include "sffc/io/byte_source.h"

namespace sffc::format {

// =============================================================================
// Verification Result
// =============================================================================

/// @brief Result of a single verification check.
struct VerificationResult {
    /// @brief Check name.
    std::string checkName;

    /// @brief Whether check passed.
    bool passed = false;

    /// @brief Error message (if failed).
    std::string errorMessage;

    /// @brief Additional details.
    std::string details;

    /// @brief Violated invariant, for structural failures.
    std::optional<FormatErrorKind> kind;

    /// @brief Offset of the offending data, when known.
    std::optional<std::uint64_t> byteOffset;
};

/// @brief Overall verification summary.
struct VerificationSummary {
    std::uint32_t totalChecks = 0;
    std::uint32_t passedChecks = 0;
    std::uint32_t failedChecks = 0;

    /// @brief Records decoded by the stream check.
    std::uint64_t recordsRead = 0;

    std::vector<VerificationResult> results;

    [[nodiscard]] bool passed() const noexcept { return failedChecks == 0; }

    /// @brief First failed check, if any.
    [[nodiscard]] const VerificationResult* firstFailure() const noexcept;

    void addResult(VerificationResult result) {
        ++totalChecks;
        if (result.passed) {
            ++passedChecks;
        } else {
            ++failedChecks;
        }
        results.push_back(std::move(result));
    }
};

// =============================================================================
// Verify Options
// =============================================================================

/// @brief Configuration options for verifySff.
struct VerifyOptions {
    /// @brief Decode the index block and cross-check its entries.
    bool checkIndex = true;

    /// @brief Stop on first failed check.
    bool failFast = false;

    /// @brief Fail when the final padding region is missing.
    bool requireTerminalPadding = false;
};

/// @brief Run every applicable check on a source.
/// @note Index checks are skipped on sequential sources and files without an index.
/// @return The summary; codec errors are recorded in it, never thrown.
[[nodiscard]] VerificationSummary verifySff(io::ByteSource& source,
                                            const VerifyOptions& options = {});

}  // namespace sffc::format

#endif  // SFFC_FORMAT_SFF_VERIFIER_H
