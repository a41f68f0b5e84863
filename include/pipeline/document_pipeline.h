#pragma once

#include "common/types.hpp"
#include "layout/region_classifier.h"
#include "text/text_merger.h"
#include "table/table_assembler.h"
#include "ordering/reading_order.h"
#include "document/tree_builder.h"
#include "pipeline/collaborators.h"
#include "pipeline/conversion_result.h"
#include <nlohmann/json.hpp>
#include <opencv2/opencv.hpp>
#include <string>

namespace docrecon {

/**
 * @brief Document size limits
 */
struct DocumentLimits {
    int maxNumPages = 0;    // 0 = unlimited

    void Show() const;
    bool Validate(std::string& error_msg) const;
};

/**
 * @brief Document Pipeline configuration
 */
struct ConversionConfig {
    RegionClassifierConfig classifierConfig;
    TextMergerConfig mergerConfig;
    TableAssemblerConfig tableConfig;
    ReadingOrderConfig orderConfig;
    TreeBuilderConfig treeConfig;
    DocumentLimits limits;

    int numThreads = 0;     // Page workers, 0 = hardware concurrency
    bool useOcr = true;     // Call the OCR engine when one is supplied

    void Show() const;
    bool Validate(std::string& error_msg) const;

    /**
     * @brief Overlay the fields present in a JSON object onto config
     *
     * Sections: "classifier", "textMerger", "table", "readingOrder",
     * "treeBuilder", "limits"; top-level "numThreads" and "useOcr". Missing
     * keys keep their current value, unknown keys are logged and ignored.
     * config is left untouched on failure.
     * @return false with error_msg set on a wrong type or an invalid result
     */
    static bool LoadFromJson(const nlohmann::json& j, ConversionConfig& config, std::string& error_msg);

    static bool LoadFromFile(const std::string& path, ConversionConfig& config, std::string& error_msg);
};

/**
 * @brief Document reconstruction pipeline
 *
 * Two phases: a parallel per-page phase (classification, text merging, table
 * assembly) where each page task owns its data, then a sequential phase
 * (reading order, tree building) over the immutable page results.
 *
 * Conversion either succeeds with a possibly degraded, warning-annotated
 * document, or fails atomically with one error naming its cause.
 */
class DocumentPipeline {
public:
    explicit DocumentPipeline(const ConversionConfig& config);

    /**
     * @brief Convert one document
     * @param tableModel optional; without it Table regions are resolved as text
     * @param ocr optional OCR engine
     * @note Collaborators are called from several threads when numThreads != 1
     */
    ConversionResult convert(PdfSource& source,
                             LayoutModel& layout,
                             TableModel* tableModel = nullptr,
                             OcrEngine* ocr = nullptr) const;

    /**
     * @brief Per-page phase for one page
     * @throws PageExtractionError when the source or the layout model fails
     * @throws UnknownClassLabelError under UnknownLabelPolicy::Abort
     */
    PageResult processPage(int pageIndex,
                           PdfSource& source,
                           LayoutModel& layout,
                           TableModel* tableModel,
                           OcrEngine* ocr) const;

    const ConversionConfig& config() const { return config_; }

    /**
     * @brief Raster rectangle of a page-space box, clipped to the image
     * @return empty rect when the page has no raster or the box misses it
     */
    static cv::Rect cropRect(const Box& pageBox, const Page& page);

private:
    ConversionConfig config_;
    RegionClassifierAdapter classifier_;
    TextSourceMerger merger_;
    TableAssembler tableAssembler_;
    ReadingOrderResolver orderResolver_;
    DocumentTreeBuilder treeBuilder_;
};

} // namespace docrecon
