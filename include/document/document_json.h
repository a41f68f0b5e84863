#pragma once

#include "pipeline/conversion_result.h"
#include <nlohmann/json.hpp>
#include <string>
#include <vector>

using json = nlohmann::json;

namespace docrecon {

/**
 * @brief Inspection JSON of a conversion result and its document tree
 *
 * Boxes are page space with a top-left origin unless bottomLeftOrigin is
 * requested, in which case they are flipped using the page heights in
 * result.pages.
 */
class DocumentJsonWriter {
public:
    /**
     * @brief Full result: status, error, warnings, pages, stats and tree
     */
    static json BuildResultJson(const ConversionResult& result, bool bottomLeftOrigin = false);

    /**
     * @brief One node and its subtree
     * @param pages page dimensions, used only for bottom-left output
     */
    static json ConvertNodeToJson(const DocumentNode& node,
                                  const std::vector<PageDims>& pages = {},
                                  bool bottomLeftOrigin = false);

    static json ConvertTableToJson(const Table& table, float pageHeight = 0.0f,
                                   bool bottomLeftOrigin = false);

    static json ConvertBoxToJson(const Box& box, float pageHeight = 0.0f,
                                 bool bottomLeftOrigin = false);

    static json ConvertWarningToJson(const ConversionWarning& warning);

    /**
     * @brief Write pretty-printed JSON to a file
     * @return true on success
     */
    static bool SaveToFile(const json& document, const std::string& jsonPath);
};

} // namespace docrecon
