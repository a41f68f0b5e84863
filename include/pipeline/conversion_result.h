#pragma once

#include "common/types.hpp"
#include <string>
#include <vector>

namespace docrecon {

/**
 * @brief Conversion statistics
 */
struct ConversionStats {
    double pagePhaseTime = 0.0;     // Parallel per-page phase (ms)
    double orderTime = 0.0;         // Reading order (ms)
    double treeTime = 0.0;          // Tree building (ms)
    double totalTime = 0.0;         // Total (ms)

    int totalPages = 0;             // Pages reported by the source
    int processedPages = 0;
    int detectedRegions = 0;        // Layout detections
    int droppedRegions = 0;         // Low confidence, invalid box, unknown label
    int orderedRegions = 0;
    int droppedTokens = 0;
    int degradedTables = 0;
    int ocrFailures = 0;
    int warnings = 0;

    void Show() const;
};

/**
 * @brief Outcome of one document conversion
 *
 * On Failure the document is empty and errorCode / errorMsg name the cause;
 * failedPage is the page that caused it, -1 for document-level causes.
 */
struct ConversionResult {
    ConversionStatus status = ConversionStatus::Pending;
    int errorCode = ErrorCode::SUCCESS;
    std::string errorMsg;
    int failedPage = -1;

    std::vector<ConversionWarning> warnings;
    DocumentNode document;
    ConversionStats stats;
    std::vector<PageDims> pages;    // Indexed by page index

    bool succeeded() const {
        return status == ConversionStatus::Success || status == ConversionStatus::PartialSuccess;
    }
};

} // namespace docrecon
