#pragma once

#include "common/types.hpp"
#include <string>
#include <vector>

namespace docrecon {

/**
 * @brief What to do with a layout label outside the region class set
 */
enum class UnknownLabelPolicy {
    Abort,       // Throw UnknownClassLabelError, the caller fails the conversion
    MapToText,   // Treat as Text, record a warning
    Drop         // Skip the detection, record a warning
};

const char* ToString(UnknownLabelPolicy policy);

/**
 * @brief Region Classifier Adapter configuration
 */
struct RegionClassifierConfig {
    float minRegionConfidence = 0.1f;   // Detections below are dropped
    UnknownLabelPolicy unknownLabelPolicy = UnknownLabelPolicy::Abort;

    void Show() const;
    bool Validate(std::string& error_msg) const;
};

/**
 * @brief Raw layout model output for one region
 */
struct LayoutDetection {
    Box box;                 // Usually CoordSpace::Model
    std::string label;
    float score = 0.0f;
};

/**
 * @brief Typed regions of one page plus what was dropped on the way
 */
struct ClassificationResult {
    std::vector<Region> regions;              // Input order
    std::vector<ConversionWarning> warnings;
    int droppedLowConfidence = 0;
    int droppedInvalidBox = 0;
    int droppedUnknownLabel = 0;
};

/**
 * @brief Wraps layout model output into typed, page-space regions
 */
class RegionClassifierAdapter {
public:
    explicit RegionClassifierAdapter(const RegionClassifierConfig& config);

    /**
     * @brief Classify the detections of one page
     * @param detections layout model output, in detection order
     * @param page owning page (dimensions / rotation for normalization)
     * @throws UnknownClassLabelError under UnknownLabelPolicy::Abort
     */
    ClassificationResult classify(const std::vector<LayoutDetection>& detections,
                                  const Page& page) const;

    /**
     * @brief Parse a class label (canonical names and layout model spellings)
     * @throws UnknownClassLabelError
     */
    static RegionClass parseLabel(const std::string& label);

    static bool tryParseLabel(const std::string& label, RegionClass& cls);

    const RegionClassifierConfig& config() const { return config_; }

private:
    RegionClassifierConfig config_;
};

} // namespace docrecon
