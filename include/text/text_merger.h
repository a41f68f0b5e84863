#pragma once

#include "common/types.hpp"
#include <string>
#include <vector>

namespace docrecon {

/**
 * @brief Text Source Merger configuration
 */
struct TextMergerConfig {
    float spanOverlapThreshold = 0.5f;     // Min overlapRatio(token, area) to collect a token
    float nativeCoverageThreshold = 0.8f;  // Native coverage needed to ignore OCR
    float lineOverlapRatio = 0.5f;         // Vertical overlap for tokens on one line

    void Show() const;
    bool Validate(std::string& error_msg) const;
};

/**
 * @brief Token returned by the OCR collaborator
 */
struct OcrToken {
    std::string text;
    Box box;
    float confidence = 0.0f;
};

/**
 * @brief Resolved text of one area (region or table)
 */
struct MergedText {
    std::vector<TextToken> tokens;   // Reading order, page space, inside the area
    std::string text;
    TextSource source = TextSource::Native;
    float nativeCoverage = 0.0f;     // Native share of the text-bearing area
    int droppedTokens = 0;           // Invalid or empty after clipping
    bool missingText = false;        // Neither source had text for the area
};

/**
 * @brief Reconciles native PDF text with OCR tokens
 *
 * Native spans win whenever they cover enough of the text-bearing area; below
 * that OCR is used, but any OCR token duplicating a native span (each box
 * mostly covering the other) is replaced by the span, and a native span lying
 * inside a larger OCR token is dropped. Duplicate text is never merged.
 */
class TextSourceMerger {
public:
    explicit TextSourceMerger(const TextMergerConfig& config);

    /**
     * @brief Resolve the text inside an arbitrary page-space area
     * @param area page-space box (region or table cell)
     * @param nativeSpans native spans of the page, any space
     * @param ocrTokens OCR tokens, any space (Model boxes are page-raster coordinates)
     */
    MergedText merge(const Box& area,
                     const std::vector<TextSpan>& nativeSpans,
                     const std::vector<OcrToken>& ocrTokens,
                     const PageDims& dims, int rotation) const;

    /**
     * @brief Resolve the text of one region against its page
     */
    MergedText mergeRegion(const Region& region, const Page& page,
                           const std::vector<OcrToken>& ocrTokens) const;

    const TextMergerConfig& config() const { return config_; }

private:
    /**
     * @brief Normalizes, filters and clips candidate tokens for an area
     * @return number of tokens dropped
     */
    int collect(const Box& area, TextToken token, const PageDims& dims, int rotation,
                std::vector<TextToken>& out) const;

    TextMergerConfig config_;
};

} // namespace docrecon
