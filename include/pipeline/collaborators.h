#pragma once

#include "common/types.hpp"
#include "layout/region_classifier.h"
#include "table/table_assembler.h"
#include "text/text_merger.h"
#include <opencv2/opencv.hpp>
#include <vector>

namespace docrecon {

/**
 * @brief Supplies pages (native spans, dimensions, raster) of one document
 *
 * A throw from either call fails the page and therefore the conversion.
 */
class PdfSource {
public:
    virtual ~PdfSource() = default;

    virtual int pageCount() = 0;
    virtual Page loadPage(int pageIndex) = 0;
};

/**
 * @brief Layout detection model; boxes in the page raster's model space
 */
class LayoutModel {
public:
    virtual ~LayoutModel() = default;

    virtual std::vector<LayoutDetection> detect(const cv::Mat& image, const Page& page) = 0;
};

/**
 * @brief Table structure model; cell boxes in crop-local model pixels
 */
class TableModel {
public:
    virtual ~TableModel() = default;

    virtual TableStructure recognize(const cv::Mat& crop) = 0;
};

/**
 * @brief OCR engine; token boxes in crop-local model pixels
 */
class OcrEngine {
public:
    virtual ~OcrEngine() = default;

    virtual std::vector<OcrToken> recognize(const cv::Mat& crop) = 0;
};

} // namespace docrecon
