#include "pipeline/document_pipeline.h"
#include "common/geometry.h"
#include "common/logger.hpp"
#include "common/thread_pool.hpp"
#include <algorithm>
#include <chrono>
#include <cmath>
#include <future>

namespace docrecon {

namespace {

// Crop-local model pixels -> page raster model space
void OffsetToRaster(Box& box, const cv::Rect& crop) {
    box.left += static_cast<float>(crop.x);
    box.right += static_cast<float>(crop.x);
    box.top += static_cast<float>(crop.y);
    box.bottom += static_cast<float>(crop.y);
    box.space = CoordSpace::Model;
}

void Fail(ConversionResult& result, int code, const std::string& message, int pageIndex = -1) {
    result.status = ConversionStatus::Failure;
    result.errorCode = code;
    result.errorMsg = message;
    result.failedPage = pageIndex;
    result.warnings.clear();
    result.document = DocumentNode();
    LOG_ERROR("Conversion failed [%s]: %s", ErrorCodeName(code), message.c_str());
}

} // namespace

// ==================== ConversionStats ====================

void ConversionStats::Show() const {
    LOG_INFO("========== Document Pipeline Statistics ==========");
    LOG_INFO("Page Phase:    %.2f ms (%.1f%%)", pagePhaseTime,
             totalTime > 0 ? pagePhaseTime / totalTime * 100 : 0);
    LOG_INFO("Reading Order: %.2f ms (%.1f%%)", orderTime,
             totalTime > 0 ? orderTime / totalTime * 100 : 0);
    LOG_INFO("Tree Building: %.2f ms (%.1f%%)", treeTime,
             totalTime > 0 ? treeTime / totalTime * 100 : 0);
    LOG_INFO("Total:         %.2f ms", totalTime);
    LOG_INFO("Pages: %d/%d", processedPages, totalPages);
    LOG_INFO("Regions: %d detected, %d dropped, %d ordered",
             detectedRegions, droppedRegions, orderedRegions);
    LOG_INFO("Dropped Tokens: %d", droppedTokens);
    LOG_INFO("Degraded Tables: %d", degradedTables);
    LOG_INFO("OCR Failures: %d", ocrFailures);
    LOG_INFO("Warnings: %d", warnings);
    LOG_INFO("==================================================");
}

// ==================== DocumentPipeline ====================

DocumentPipeline::DocumentPipeline(const ConversionConfig& config)
    : config_(config),
      classifier_(config.classifierConfig),
      merger_(config.mergerConfig),
      tableAssembler_(config.tableConfig, config.mergerConfig),
      orderResolver_(config.orderConfig),
      treeBuilder_(config.treeConfig) {
}

cv::Rect DocumentPipeline::cropRect(const Box& pageBox, const Page& page) {
    if (page.image.empty()) {
        return cv::Rect();
    }

    Box model;
    try {
        model = Geometry::toSpace(pageBox, CoordSpace::Model, page.dims(), page.rotation);
    } catch (const InvalidBoxError& e) {
        LOG_DEBUG("Page %d: no crop for %s: %s", page.index, pageBox.toString().c_str(), e.what());
        return cv::Rect();
    }

    int x0 = static_cast<int>(std::floor(model.left));
    int y0 = static_cast<int>(std::floor(model.top));
    int x1 = static_cast<int>(std::ceil(model.right));
    int y1 = static_cast<int>(std::ceil(model.bottom));
    return cv::Rect(x0, y0, x1 - x0, y1 - y0) & cv::Rect(0, 0, page.image.cols, page.image.rows);
}

PageResult DocumentPipeline::processPage(int pageIndex,
                                         PdfSource& source,
                                         LayoutModel& layout,
                                         TableModel* tableModel,
                                         OcrEngine* ocr) const {
    auto start = std::chrono::high_resolution_clock::now();

    Page page;
    try {
        page = source.loadPage(pageIndex);
    } catch (const std::exception& e) {
        throw PageExtractionError(pageIndex, std::string("PDF source: ") + e.what());
    }
    page.index = pageIndex;

    if (!(page.width > 0.0f && page.height > 0.0f)) {
        throw PageExtractionError(pageIndex, "invalid page size " + std::to_string(page.width) +
                                             "x" + std::to_string(page.height));
    }
    if (page.rotation != 0 && page.rotation != 90 && page.rotation != 180 && page.rotation != 270) {
        throw PageExtractionError(pageIndex, "unsupported rotation " + std::to_string(page.rotation));
    }

    std::vector<LayoutDetection> detections;
    try {
        detections = layout.detect(page.image, page);
    } catch (const std::exception& e) {
        throw PageExtractionError(pageIndex, std::string("layout model: ") + e.what());
    }

    ClassificationResult classified = classifier_.classify(detections, page);

    PageResult result;
    result.pageIndex = pageIndex;
    result.dims = page.dims();
    result.rotation = page.rotation;
    result.warnings = std::move(classified.warnings);
    result.detectedRegions = static_cast<int>(detections.size());
    result.droppedRegions = classified.droppedLowConfidence + classified.droppedInvalidBox +
                            classified.droppedUnknownLabel;

    for (const auto& region : classified.regions) {
        ResolvedRegion resolved;
        resolved.region = region;

        cv::Rect rect = cropRect(region.box, page);
        cv::Mat crop;
        if (!rect.empty()) {
            crop = page.image(rect);
        }

        // A failed OCR call only costs this region its OCR tokens
        std::vector<OcrToken> ocrTokens;
        if (ocr != nullptr && config_.useOcr && !crop.empty()) {
            try {
                ocrTokens = ocr->recognize(crop);
                for (auto& token : ocrTokens) {
                    OffsetToRaster(token.box, rect);
                }
            } catch (const std::exception& e) {
                LOG_WARN("Page %d region %d: OCR failed: %s", pageIndex, region.detectionIndex, e.what());
                result.warnings.push_back({ErrorCode::OCR_FAILED, pageIndex, region.detectionIndex,
                                           std::string("OCR failed: ") + e.what()});
                result.ocrFailures++;
                ocrTokens.clear();
            }
        }

        if (region.cls == RegionClass::Table && tableModel != nullptr) {
            bool recognized = false;
            TableStructure structure;
            if (crop.empty()) {
                LOG_WARN("Page %d region %d: no raster for table recognition", pageIndex, region.detectionIndex);
                result.warnings.push_back({ErrorCode::TABLE_MODEL_FAILED, pageIndex, region.detectionIndex,
                                           "No raster crop for table recognition, resolved as text"});
            } else {
                try {
                    structure = tableModel->recognize(crop);
                    for (auto& cell : structure.cells) {
                        OffsetToRaster(cell.box, rect);
                    }
                    recognized = true;
                } catch (const std::exception& e) {
                    LOG_WARN("Page %d region %d: table model failed: %s",
                             pageIndex, region.detectionIndex, e.what());
                    result.warnings.push_back({ErrorCode::TABLE_MODEL_FAILED, pageIndex, region.detectionIndex,
                                               std::string("Table model failed, resolved as text: ") + e.what()});
                }
            }

            AssembledTable assembled;
            if (recognized) {
                try {
                    assembled = tableAssembler_.assemble(region, structure, page, ocrTokens);
                } catch (const std::exception& e) {
                    LOG_WARN("Page %d region %d: table assembly failed: %s",
                             pageIndex, region.detectionIndex, e.what());
                    result.warnings.push_back({ErrorCode::TABLE_MODEL_FAILED, pageIndex, region.detectionIndex,
                                               std::string("Table assembly failed, resolved as text: ") + e.what()});
                    recognized = false;
                }
            }

            if (recognized) {
                resolved.tokens = std::move(assembled.tokens);
                resolved.source = assembled.source;
                resolved.missingText = assembled.missingText;
                result.droppedTokens += assembled.droppedTokens;
                if (assembled.table.degraded) {
                    result.degradedTables++;
                }
                result.warnings.insert(result.warnings.end(), assembled.warnings.begin(), assembled.warnings.end());
                resolved.table = std::move(assembled.table);
            }
        }

        if (!resolved.table) {
            MergedText merged = merger_.mergeRegion(region, page, ocrTokens);
            resolved.tokens = std::move(merged.tokens);
            resolved.source = merged.source;
            resolved.missingText = merged.missingText;
            result.droppedTokens += merged.droppedTokens;
        }
        resolved.text = JoinTokenText(resolved.tokens);

        // Figures legitimately carry no text
        if (resolved.missingText && region.cls != RegionClass::Figure) {
            LOG_DEBUG("Page %d region %d (%s): no native or OCR text",
                      pageIndex, region.detectionIndex, ToString(region.cls));
            result.warnings.push_back({ErrorCode::MISSING_TEXT_SOURCE, pageIndex, region.detectionIndex,
                                       std::string("No native or OCR text for ") + ToString(region.cls) +
                                       " region"});
        }

        result.regions.push_back(std::move(resolved));
    }

    auto end = std::chrono::high_resolution_clock::now();
    result.processTimeMs = std::chrono::duration<double, std::milli>(end - start).count();

    LOG_DEBUG("Page %d: %d detection(s), %zu region(s), %zu warning(s), %.2f ms",
              pageIndex, result.detectedRegions, result.regions.size(),
              result.warnings.size(), result.processTimeMs);
    return result;
}

ConversionResult DocumentPipeline::convert(PdfSource& source,
                                           LayoutModel& layout,
                                           TableModel* tableModel,
                                           OcrEngine* ocr) const {
    auto start_total = std::chrono::high_resolution_clock::now();
    ConversionResult result;

    std::string error_msg;
    if (!config_.Validate(error_msg)) {
        Fail(result, ErrorCode::INVALID_CONFIG, "Invalid configuration: " + error_msg);
        return result;
    }

    int pageCount = 0;
    try {
        pageCount = source.pageCount();
    } catch (const std::exception& e) {
        Fail(result, ErrorCode::PAGE_EXTRACTION_FAILED, std::string("PDF source page count failed: ") + e.what());
        return result;
    }
    if (pageCount < 0) {
        Fail(result, ErrorCode::PAGE_EXTRACTION_FAILED, "PDF source reported a negative page count");
        return result;
    }
    result.stats.totalPages = pageCount;

    if (config_.limits.maxNumPages > 0 && pageCount > config_.limits.maxNumPages) {
        Fail(result, ErrorCode::PAGE_LIMIT_EXCEEDED,
             "Document has " + std::to_string(pageCount) + " pages, limit is " +
             std::to_string(config_.limits.maxNumPages));
        return result;
    }

    // ==================== Phase 1: pages in parallel ====================
    auto start_pages = std::chrono::high_resolution_clock::now();
    std::vector<PageResult> pages(static_cast<size_t>(pageCount));

    if (pageCount > 0) {
        size_t workers = config_.numThreads > 0 ? static_cast<size_t>(config_.numThreads)
                                                : std::thread::hardware_concurrency();
        workers = std::max<size_t>(1, std::min(workers, static_cast<size_t>(pageCount)));

        ThreadPool pool(workers);
        std::vector<std::future<PageResult>> futures;
        futures.reserve(pages.size());
        for (int i = 0; i < pageCount; ++i) {
            futures.push_back(pool.enqueue([this, &source, &layout, tableModel, ocr](int pageIndex) {
                return processPage(pageIndex, source, layout, tableModel, ocr);
            }, i));
        }

        // Collected in page order: the lowest failing page index wins
        for (int i = 0; i < pageCount; ++i) {
            try {
                pages[i] = futures[i].get();
            } catch (const PageExtractionError& e) {
                Fail(result, e.code(), e.what(), e.pageIndex());
            } catch (const ConversionError& e) {
                Fail(result, e.code(), "Page " + std::to_string(i) + ": " + e.what(), i);
            } catch (const std::exception& e) {
                Fail(result, ErrorCode::UNKNOWN_ERROR, "Page " + std::to_string(i) + ": " + e.what(), i);
            }
            if (result.status == ConversionStatus::Failure) {
                return result;
            }
        }
    }

    auto end_pages = std::chrono::high_resolution_clock::now();
    result.stats.pagePhaseTime = std::chrono::duration<double, std::milli>(end_pages - start_pages).count();

    result.pages.reserve(pages.size());
    for (const auto& page : pages) {
        result.pages.push_back(page.dims);
        result.warnings.insert(result.warnings.end(), page.warnings.begin(), page.warnings.end());
        result.stats.detectedRegions += page.detectedRegions;
        result.stats.droppedRegions += page.droppedRegions;
        result.stats.droppedTokens += page.droppedTokens;
        result.stats.degradedTables += page.degradedTables;
        result.stats.ocrFailures += page.ocrFailures;
    }
    result.stats.processedPages = pageCount;

    // ==================== Phase 2: sequential order and tree ====================
    auto start_order = std::chrono::high_resolution_clock::now();
    std::vector<OrderedRegion> sequence = orderResolver_.resolveDocument(std::move(pages));
    auto end_order = std::chrono::high_resolution_clock::now();
    result.stats.orderTime = std::chrono::duration<double, std::milli>(end_order - start_order).count();
    result.stats.orderedRegions = static_cast<int>(sequence.size());

    auto start_tree = std::chrono::high_resolution_clock::now();
    result.document = treeBuilder_.build(sequence);
    auto end_tree = std::chrono::high_resolution_clock::now();
    result.stats.treeTime = std::chrono::duration<double, std::milli>(end_tree - start_tree).count();

    result.stats.warnings = static_cast<int>(result.warnings.size());
    result.status = result.warnings.empty() ? ConversionStatus::Success : ConversionStatus::PartialSuccess;

    auto end_total = std::chrono::high_resolution_clock::now();
    result.stats.totalTime = std::chrono::duration<double, std::milli>(end_total - start_total).count();

    LOG_INFO("Converted %d page(s): %d region(s), %zu node(s), %d warning(s), status %s, %.2f ms",
             pageCount, result.stats.orderedRegions, result.document.countNodes(),
             result.stats.warnings, ToString(result.status), result.stats.totalTime);
    return result;
}

} // namespace docrecon
