#include "layout/region_classifier.h"
#include "common/geometry.h"
#include "common/logger.hpp"
#include <algorithm>
#include <cmath>
#include <unordered_map>

namespace docrecon {

namespace {

// Canonical names plus the spellings emitted by the layout model
const std::unordered_map<std::string, RegionClass>& LabelTable() {
    static const std::unordered_map<std::string, RegionClass> table = {
        {"Text", RegionClass::Text},
        {"Title", RegionClass::Title},
        {"SectionHeader", RegionClass::SectionHeader},
        {"Section-header", RegionClass::SectionHeader},
        {"Table", RegionClass::Table},
        {"Figure", RegionClass::Figure},
        {"Picture", RegionClass::Figure},
        {"Caption", RegionClass::Caption},
        {"ListItem", RegionClass::ListItem},
        {"List-item", RegionClass::ListItem},
        {"Footnote", RegionClass::Footnote},
        {"PageHeader", RegionClass::PageHeader},
        {"Page-header", RegionClass::PageHeader},
        {"PageFooter", RegionClass::PageFooter},
        {"Page-footer", RegionClass::PageFooter},
    };
    return table;
}

} // namespace

const char* ToString(UnknownLabelPolicy policy) {
    switch (policy) {
        case UnknownLabelPolicy::Abort: return "abort";
        case UnknownLabelPolicy::MapToText: return "map_to_text";
        case UnknownLabelPolicy::Drop: return "drop";
    }
    return "unknown";
}

// ==================== RegionClassifierConfig ====================

void RegionClassifierConfig::Show() const {
    LOG_INFO("  Min Region Confidence: %.3f", minRegionConfidence);
    LOG_INFO("  Unknown Label Policy: %s", ToString(unknownLabelPolicy));
}

bool RegionClassifierConfig::Validate(std::string& error_msg) const {
    if (!(minRegionConfidence >= 0.0f && minRegionConfidence <= 1.0f)) {
        error_msg = "minRegionConfidence must be in [0, 1]";
        return false;
    }
    return true;
}

// ==================== RegionClassifierAdapter ====================

RegionClassifierAdapter::RegionClassifierAdapter(const RegionClassifierConfig& config)
    : config_(config) {
}

bool RegionClassifierAdapter::tryParseLabel(const std::string& label, RegionClass& cls) {
    const auto& table = LabelTable();
    auto it = table.find(label);
    if (it == table.end()) {
        return false;
    }
    cls = it->second;
    return true;
}

RegionClass RegionClassifierAdapter::parseLabel(const std::string& label) {
    RegionClass cls;
    if (!tryParseLabel(label, cls)) {
        throw UnknownClassLabelError(label);
    }
    return cls;
}

ClassificationResult RegionClassifierAdapter::classify(const std::vector<LayoutDetection>& detections,
                                                       const Page& page) const {
    ClassificationResult result;
    result.regions.reserve(detections.size());

    const PageDims dims = page.dims();

    for (size_t i = 0; i < detections.size(); ++i) {
        const auto& det = detections[i];
        const int detIndex = static_cast<int>(i);

        float score = det.score;
        if (std::isnan(score)) {
            score = 0.0f;
        }
        score = std::clamp(score, 0.0f, 1.0f);

        if (score < config_.minRegionConfidence) {
            LOG_DEBUG("Page %d: dropping detection %d (%s) with score %.3f < %.3f",
                      page.index, detIndex, det.label.c_str(), score, config_.minRegionConfidence);
            result.droppedLowConfidence++;
            continue;
        }

        RegionClass cls = RegionClass::Text;
        if (!tryParseLabel(det.label, cls)) {
            switch (config_.unknownLabelPolicy) {
                case UnknownLabelPolicy::Abort:
                    LOG_ERROR("Page %d: unknown layout label '%s'", page.index, det.label.c_str());
                    throw UnknownClassLabelError(det.label);
                case UnknownLabelPolicy::MapToText:
                    LOG_WARN("Page %d: unknown layout label '%s' mapped to Text",
                             page.index, det.label.c_str());
                    result.warnings.push_back({ErrorCode::UNKNOWN_CLASS_LABEL, page.index, detIndex,
                                               "Unknown label '" + det.label + "' mapped to Text"});
                    cls = RegionClass::Text;
                    break;
                case UnknownLabelPolicy::Drop:
                    LOG_WARN("Page %d: unknown layout label '%s' dropped",
                             page.index, det.label.c_str());
                    result.warnings.push_back({ErrorCode::UNKNOWN_CLASS_LABEL, page.index, detIndex,
                                               "Unknown label '" + det.label + "' dropped"});
                    result.droppedUnknownLabel++;
                    continue;
            }
        }

        Region region;
        try {
            region.box = Geometry::toSpace(det.box, CoordSpace::Page, dims, page.rotation);
        } catch (const InvalidBoxError& e) {
            LOG_WARN("Page %d: detection %d dropped: %s", page.index, detIndex, e.what());
            result.warnings.push_back({ErrorCode::INVALID_BOX, page.index, detIndex, e.what()});
            result.droppedInvalidBox++;
            continue;
        }

        region.cls = cls;
        region.confidence = score;
        region.pageIndex = page.index;
        region.detectionIndex = detIndex;
        result.regions.push_back(region);
    }

    LOG_DEBUG("Page %d: %zu/%zu regions kept (low conf %d, invalid %d, unknown %d)",
              page.index, result.regions.size(), detections.size(),
              result.droppedLowConfidence, result.droppedInvalidBox, result.droppedUnknownLabel);

    return result;
}

} // namespace docrecon
