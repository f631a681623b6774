// =============================================================================
// sff-codec - Error Handling Framework Implementation
// =============================================================================

#include "sffc/common/error.h"

#include <format>
#include <sstream>

namespace sffc {

// =============================================================================
// FormatErrorKind Names
// =============================================================================

std::string_view formatErrorKindToString(FormatErrorKind kind) noexcept {
    switch (kind) {
        case FormatErrorKind::kEmptyFile:
            return "EmptyFile";
        case FormatErrorKind::kTooSmall:
            return "TooSmall";
        case FormatErrorKind::kBadMagic:
            return "BadMagic";
        case FormatErrorKind::kAtIndexBlock:
            return "AtIndexBlock";
        case FormatErrorKind::kUnsupportedVersion:
            return "UnsupportedVersion";
        case FormatErrorKind::kUnsupportedFlowgramFormat:
            return "UnsupportedFlowgramFormat";
        case FormatErrorKind::kInconsistentIndex:
            return "InconsistentIndex";
        case FormatErrorKind::kMalformedHeader:
            return "MalformedHeader";
        case FormatErrorKind::kMalformedRecordHeader:
            return "MalformedRecordHeader";
        case FormatErrorKind::kBadPadding:
            return "BadPadding";
        case FormatErrorKind::kPrematureEOF:
            return "PrematureEOF";
        case FormatErrorKind::kUnknownIndexFormat:
            return "UnknownIndexFormat";
        case FormatErrorKind::kUnsupportedIndexVersion:
            return "UnsupportedIndexVersion";
        case FormatErrorKind::kManifestHeaderSizeMismatch:
            return "ManifestHeaderSizeMismatch";
        case FormatErrorKind::kMissingNullTerminator:
            return "MissingNullTerminator";
        case FormatErrorKind::kIndexLengthMismatch:
            return "IndexLengthMismatch";
        case FormatErrorKind::kNoIndexPresent:
            return "NoIndexPresent";
        case FormatErrorKind::kNoXmlManifest:
            return "NoXmlManifest";
        case FormatErrorKind::kIndexBeforeRecordsExhausted:
            return "IndexBeforeRecordsExhausted";
        case FormatErrorKind::kUnexpectedGapBeforeIndex:
            return "UnexpectedGapBeforeIndex";
        case FormatErrorKind::kCorruptIndexPointer:
            return "CorruptIndexPointer";
        case FormatErrorKind::kConcatenatedFilesDetected:
            return "ConcatenatedFilesDetected";
        case FormatErrorKind::kTrailingPaddingLooksLikeConcatenation:
            return "TrailingPaddingLooksLikeConcatenation";
        case FormatErrorKind::kTrailingGarbage:
            return "TrailingGarbage";
        case FormatErrorKind::kInvalidRecord:
            return "InvalidRecord";
    }
    return "Unknown";
}

// =============================================================================
// ErrorContext Implementation
// =============================================================================

std::string ErrorContext::format() const {
    std::ostringstream oss;
    bool hasContent = false;

    auto separate = [&]() {
        if (hasContent) {
            oss << ", ";
        }
        hasContent = true;
    };

    if (!filePath.empty()) {
        separate();
        oss << "file: " << filePath;
    }

    if (readIndex.has_value()) {
        separate();
        oss << "read: " << *readIndex;
    }

    if (byteOffset.has_value()) {
        separate();
        oss << "offset: " << *byteOffset << " (0x" << std::hex << *byteOffset << std::dec << ")";
    }

    if (expectedValue.has_value() && actualValue.has_value()) {
        separate();
        oss << "expected: " << *expectedValue << ", actual: " << *actualValue;
    }

    if (!observedBytes.empty()) {
        separate();
        oss << "seen: '" << observedBytes << "'";
    }

#ifndef NDEBUG
    if (hasContent) {
        oss << " (at " << location.file_name() << ":" << location.line() << ")";
    }
#endif

    return oss.str();
}

// =============================================================================
// SffException Implementation
// =============================================================================

void SffException::formatWhat() {
    std::ostringstream oss;
    oss << "[" << errorCodeToString(code_) << "] " << message_;

    if (context_.has_value()) {
        std::string contextStr = context_->format();
        if (!contextStr.empty()) {
            oss << " (" << contextStr << ")";
        }
    }

    what_ = oss.str();
}

// =============================================================================
// IOError Implementation
// =============================================================================

std::string IOError::formatWithSystemError(const std::string& message, std::error_code ec) {
    return std::format("{}: {} (error code: {})", message, ec.message(), ec.value());
}

}  // namespace sffc
