#pragma once

#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

namespace docrecon {

/**
 * @brief Conversion error / warning codes
 */
namespace ErrorCode {
    constexpr int SUCCESS = 0;

    // Per-item problems (1001-1099), never fatal for the document
    constexpr int INVALID_BOX = 1001;              // Malformed geometry
    constexpr int UNKNOWN_CLASS_LABEL = 1002;      // Layout label outside the class set
    constexpr int TABLE_GRID_INCONSISTENT = 1003;  // Gap / overlap in the table model grid
    constexpr int MISSING_TEXT_SOURCE = 1004;      // Region without native or OCR text
    constexpr int OCR_FAILED = 1006;               // OCR collaborator failed for one region
    constexpr int TABLE_MODEL_FAILED = 1007;       // Table collaborator failed for one region

    // Document-level failures (2001-2099)
    constexpr int PAGE_EXTRACTION_FAILED = 2001;   // PDF source / layout model failed for a page
    constexpr int PAGE_LIMIT_EXCEEDED = 2002;      // DocumentLimits.maxNumPages exceeded
    constexpr int INVALID_CONFIG = 2003;           // ConversionConfig rejected
    constexpr int UNKNOWN_ERROR = 2099;
}

/**
 * @brief Human readable name of an error code ("INVALID_BOX", ...)
 */
const char* ErrorCodeName(int code);

/**
 * @brief Base class of every error raised by the reconstruction core
 */
class ConversionError : public std::runtime_error {
public:
    ConversionError(int code, const std::string& message)
        : std::runtime_error(message), code_(code) {}

    int code() const { return code_; }

private:
    int code_;
};

/**
 * @brief Box with left > right, top > bottom or non-finite coordinates
 */
class InvalidBoxError : public ConversionError {
public:
    explicit InvalidBoxError(const std::string& message)
        : ConversionError(ErrorCode::INVALID_BOX, message) {}
};

/**
 * @brief Layout label outside the fixed region class set
 */
class UnknownClassLabelError : public ConversionError {
public:
    explicit UnknownClassLabelError(const std::string& label)
        : ConversionError(ErrorCode::UNKNOWN_CLASS_LABEL, "Unknown region class label: '" + label + "'"),
          label_(label) {}

    const std::string& label() const { return label_; }

private:
    std::string label_;
};

/**
 * @brief One defect found while checking a table grid
 */
struct GridIssue {
    enum class Kind { Gap, Overlap, OutOfRange, BadSpan };

    Kind kind;
    int row;
    int col;
};

/**
 * @brief Table grid that violates the exactly-once coverage invariant
 *
 * Recoverable: the assembler catches it, degrades the table and records a warning.
 */
class TableGridInconsistencyError : public ConversionError {
public:
    TableGridInconsistencyError(const std::string& message, std::vector<GridIssue> issues)
        : ConversionError(ErrorCode::TABLE_GRID_INCONSISTENT, message), issues_(std::move(issues)) {}

    const std::vector<GridIssue>& issues() const { return issues_; }

private:
    std::vector<GridIssue> issues_;
};

/**
 * @brief Page-level collaborator failure; fails the whole conversion
 */
class PageExtractionError : public ConversionError {
public:
    PageExtractionError(int pageIndex, const std::string& reason)
        : ConversionError(ErrorCode::PAGE_EXTRACTION_FAILED,
                          "Page " + std::to_string(pageIndex) + " extraction failed: " + reason),
          pageIndex_(pageIndex) {}

    int pageIndex() const { return pageIndex_; }

private:
    int pageIndex_;
};

/**
 * @brief Recoverable problem attached to the conversion result
 */
struct ConversionWarning {
    int code = ErrorCode::SUCCESS;
    int pageIndex = -1;      // -1: document level
    int regionIndex = -1;    // detection index on the page, -1: page level
    std::string message;
};

/**
 * @brief Overall outcome of one document conversion
 */
enum class ConversionStatus {
    Pending,
    Success,          // Document produced, no warnings
    PartialSuccess,   // Document produced with degraded items
    Failure           // Atomic failure, no document
};

const char* ToString(ConversionStatus status);

} // namespace docrecon
