#include "text/text_merger.h"
#include "ordering/reading_order.h"
#include "common/geometry.h"
#include "common/logger.hpp"
#include <algorithm>
#include <cctype>
#include <cmath>
#include <cstddef>

namespace docrecon {

namespace {

bool IsBlank(const std::string& text) {
    return std::all_of(text.begin(), text.end(), [](unsigned char c) { return std::isspace(c); });
}

std::vector<Box> BoxesOf(const std::vector<TextToken>& tokens) {
    std::vector<Box> boxes;
    boxes.reserve(tokens.size());
    for (const auto& token : tokens) {
        boxes.push_back(token.box);
    }
    return boxes;
}

// Share of box covered by other
float CoveredShare(const Box& box, const Box& other) {
    float area = box.area();
    if (area <= 0.0f) {
        return 0.0f;
    }
    return Geometry::clip(box, other).area() / area;
}

// Same text read twice: each box mostly covers the other
bool Duplicates(const Box& a, const Box& b, float threshold) {
    return CoveredShare(a, b) >= threshold && CoveredShare(b, a) >= threshold;
}

} // namespace

// ==================== TextMergerConfig ====================

void TextMergerConfig::Show() const {
    LOG_INFO("  Span Overlap Threshold: %.2f", spanOverlapThreshold);
    LOG_INFO("  Native Coverage Threshold: %.2f", nativeCoverageThreshold);
    LOG_INFO("  Line Overlap Ratio: %.2f", lineOverlapRatio);
}

bool TextMergerConfig::Validate(std::string& error_msg) const {
    if (!(spanOverlapThreshold > 0.0f && spanOverlapThreshold <= 1.0f)) {
        error_msg = "spanOverlapThreshold must be in (0, 1]";
        return false;
    }
    if (!(nativeCoverageThreshold >= 0.0f && nativeCoverageThreshold <= 1.0f)) {
        error_msg = "nativeCoverageThreshold must be in [0, 1]";
        return false;
    }
    if (!(lineOverlapRatio >= 0.0f && lineOverlapRatio <= 1.0f)) {
        error_msg = "lineOverlapRatio must be in [0, 1]";
        return false;
    }
    return true;
}

// ==================== TextSourceMerger ====================

TextSourceMerger::TextSourceMerger(const TextMergerConfig& config)
    : config_(config) {
}

int TextSourceMerger::collect(const Box& area, TextToken token, const PageDims& dims, int rotation,
                              std::vector<TextToken>& out) const {
    if (IsBlank(token.text)) {
        return 0;
    }

    try {
        token.box = Geometry::toSpace(token.box, CoordSpace::Page, dims, rotation);
    } catch (const InvalidBoxError& e) {
        LOG_DEBUG("Dropping token '%s': %s", token.text.c_str(), e.what());
        return 1;
    }

    if (Geometry::overlapRatio(token.box, area) < config_.spanOverlapThreshold) {
        return 0;
    }

    // Tokens poking out of the area are clipped; nothing left means dropped
    if (!Geometry::contains(area, token.box)) {
        token.box = Geometry::clip(token.box, area);
    }
    if (token.box.isEmpty()) {
        LOG_DEBUG("Dropping token '%s': empty after clipping", token.text.c_str());
        return 1;
    }

    out.push_back(std::move(token));
    return 0;
}

MergedText TextSourceMerger::merge(const Box& area,
                                   const std::vector<TextSpan>& nativeSpans,
                                   const std::vector<OcrToken>& ocrTokens,
                                   const PageDims& dims, int rotation) const {
    MergedText result;

    std::vector<TextToken> native;
    for (const auto& span : nativeSpans) {
        TextToken token;
        token.text = span.text;
        token.source = TextSource::Native;
        token.confidence = 1.0f;
        token.box = span.box;
        token.fontSize = span.fontSize;
        result.droppedTokens += collect(area, std::move(token), dims, rotation, native);
    }

    std::vector<TextToken> ocr;
    for (const auto& item : ocrTokens) {
        TextToken token;
        token.text = item.text;
        token.source = TextSource::OCR;
        token.confidence = std::isnan(item.confidence) ? 0.0f : std::clamp(item.confidence, 0.0f, 1.0f);
        token.box = item.box;
        result.droppedTokens += collect(area, std::move(token), dims, rotation, ocr);
    }

    if (native.empty() && ocr.empty()) {
        result.missingText = true;
        return result;
    }

    std::vector<Box> allBoxes = BoxesOf(native);
    std::vector<Box> ocrBoxes = BoxesOf(ocr);
    allBoxes.insert(allBoxes.end(), ocrBoxes.begin(), ocrBoxes.end());

    float textArea = Geometry::unionArea(allBoxes);
    float nativeArea = Geometry::unionArea(BoxesOf(native));
    result.nativeCoverage = textArea > 0.0f ? nativeArea / textArea : (native.empty() ? 0.0f : 1.0f);

    std::vector<TextToken> tokens;
    if (ocr.empty() || result.nativeCoverage >= config_.nativeCoverageThreshold) {
        result.source = TextSource::Native;
        tokens = std::move(native);
    } else {
        result.source = TextSource::OCR;
        const float threshold = config_.spanOverlapThreshold;
        int replaced = 0;
        for (auto& token : ocr) {
            bool duplicated = std::any_of(native.begin(), native.end(), [&](const TextToken& n) {
                return Duplicates(n.box, token.box, threshold);
            });
            if (duplicated) {
                replaced++;
                continue;
            }
            tokens.push_back(std::move(token));
        }

        // A native fragment inside a larger OCR token is already part of its text
        const size_t keptOcr = tokens.size();
        int subsumed = 0;
        for (auto& token : native) {
            bool inside = std::any_of(tokens.begin(), tokens.begin() + static_cast<std::ptrdiff_t>(keptOcr), [&](const TextToken& o) {
                return CoveredShare(token.box, o.box) >= threshold;
            });
            if (inside) {
                subsumed++;
                continue;
            }
            tokens.push_back(std::move(token));
        }
        LOG_TRACE("OCR fallback: coverage %.2f, %d OCR token(s) replaced by native text, "
                  "%d native span(s) inside OCR tokens",
                  result.nativeCoverage, replaced, subsumed);
    }

    result.tokens = ReadingOrderResolver::orderTokens(std::move(tokens), config_.lineOverlapRatio);
    result.text = JoinTokenText(result.tokens);
    return result;
}

MergedText TextSourceMerger::mergeRegion(const Region& region, const Page& page,
                                         const std::vector<OcrToken>& ocrTokens) const {
    return merge(region.box, page.spans, ocrTokens, page.dims(), page.rotation);
}

} // namespace docrecon
