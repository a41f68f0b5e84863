#include "document/document_json.h"
#include "common/geometry.h"
#include "common/logger.hpp"
#include <cmath>
#include <fstream>

namespace docrecon {

namespace {

double Round1(float value) {
    return std::round(value * 10.0) / 10.0;
}

float PageHeightOf(const std::vector<PageDims>& pages, int pageIndex) {
    if (pageIndex < 0 || pageIndex >= static_cast<int>(pages.size())) {
        return 0.0f;
    }
    return pages[pageIndex].height;
}

} // namespace

json DocumentJsonWriter::ConvertBoxToJson(const Box& box, float pageHeight, bool bottomLeftOrigin) {
    Box out = box;
    bool flipped = bottomLeftOrigin && pageHeight > 0.0f;
    if (flipped) {
        out = Geometry::toBottomLeftOrigin(box, pageHeight);
    }

    json item;
    item["l"] = Round1(out.left);
    item["t"] = Round1(out.top);
    item["r"] = Round1(out.right);
    item["b"] = Round1(out.bottom);
    item["coordOrigin"] = flipped ? "BOTTOMLEFT" : "TOPLEFT";
    return item;
}

json DocumentJsonWriter::ConvertTableToJson(const Table& table, float pageHeight, bool bottomLeftOrigin) {
    json item;
    item["numRows"] = table.rowCount;
    item["numCols"] = table.colCount;
    item["degraded"] = table.degraded;

    json cells = json::array();
    for (const auto& cell : table.cells) {
        json c;
        c["row"] = cell.row;
        c["col"] = cell.col;
        c["rowSpan"] = cell.rowSpan;
        c["colSpan"] = cell.colSpan;
        c["text"] = cell.text();
        c["columnHeader"] = cell.columnHeader;
        c["rowHeader"] = cell.rowHeader;
        c["bbox"] = ConvertBoxToJson(cell.box, pageHeight, bottomLeftOrigin);
        cells.push_back(c);
    }
    item["cells"] = cells;
    return item;
}

json DocumentJsonWriter::ConvertNodeToJson(const DocumentNode& node,
                                           const std::vector<PageDims>& pages,
                                           bool bottomLeftOrigin) {
    json item;
    item["kind"] = ToString(node.kind);

    if (node.kind != NodeKind::Document) {
        item["label"] = ToString(node.label);
    }
    if (node.kind == NodeKind::Heading) {
        item["level"] = node.level;
    }
    if (!node.text.empty()) {
        item["text"] = node.text;
    }

    if (!node.provenance.empty()) {
        json prov = json::array();
        for (const auto& p : node.provenance) {
            json entry;
            entry["page"] = p.pageIndex;
            entry["bbox"] = ConvertBoxToJson(p.box, PageHeightOf(pages, p.pageIndex), bottomLeftOrigin);
            prov.push_back(entry);
        }
        item["provenance"] = prov;
    }

    if (node.table) {
        item["table"] = ConvertTableToJson(*node.table, PageHeightOf(pages, node.table->region.pageIndex),
                                           bottomLeftOrigin);
    }

    if (!node.children.empty()) {
        json children = json::array();
        for (const auto& child : node.children) {
            children.push_back(ConvertNodeToJson(child, pages, bottomLeftOrigin));
        }
        item["children"] = children;
    }
    return item;
}

json DocumentJsonWriter::ConvertWarningToJson(const ConversionWarning& warning) {
    json item;
    item["code"] = warning.code;
    item["name"] = ErrorCodeName(warning.code);
    item["page"] = warning.pageIndex;
    item["region"] = warning.regionIndex;
    item["message"] = warning.message;
    return item;
}

json DocumentJsonWriter::BuildResultJson(const ConversionResult& result, bool bottomLeftOrigin) {
    json response;
    response["status"] = ToString(result.status);
    response["errorCode"] = result.errorCode;
    response["errorMsg"] = result.errorCode == ErrorCode::SUCCESS ? "Success" : result.errorMsg;
    if (result.failedPage >= 0) {
        response["failedPage"] = result.failedPage;
    }

    json warnings = json::array();
    for (const auto& warning : result.warnings) {
        warnings.push_back(ConvertWarningToJson(warning));
    }
    response["warnings"] = warnings;

    json pages = json::array();
    for (size_t i = 0; i < result.pages.size(); ++i) {
        json page;
        page["index"] = i;
        page["width"] = Round1(result.pages[i].width);
        page["height"] = Round1(result.pages[i].height);
        pages.push_back(page);
    }
    response["pages"] = pages;

    const ConversionStats& s = result.stats;
    json stats;
    stats["totalPages"] = s.totalPages;
    stats["processedPages"] = s.processedPages;
    stats["detectedRegions"] = s.detectedRegions;
    stats["droppedRegions"] = s.droppedRegions;
    stats["orderedRegions"] = s.orderedRegions;
    stats["droppedTokens"] = s.droppedTokens;
    stats["degradedTables"] = s.degradedTables;
    stats["ocrFailures"] = s.ocrFailures;
    stats["totalTimeMs"] = std::round(s.totalTime * 100.0) / 100.0;
    response["stats"] = stats;

    if (result.succeeded()) {
        response["document"] = ConvertNodeToJson(result.document, result.pages, bottomLeftOrigin);
    }
    return response;
}

bool DocumentJsonWriter::SaveToFile(const json& document, const std::string& jsonPath) {
    std::ofstream ofs(jsonPath);
    if (!ofs.is_open()) {
        LOG_ERROR("Failed to open file for writing: %s", jsonPath.c_str());
        return false;
    }

    // OCR and native text may carry invalid UTF-8, written as U+FFFD
    ofs << document.dump(2, ' ', false, json::error_handler_t::replace) << "\n";
    if (!ofs.good()) {
        LOG_ERROR("Failed to write JSON to: %s", jsonPath.c_str());
        return false;
    }

    LOG_INFO("Results saved to: %s", jsonPath.c_str());
    return true;
}

} // namespace docrecon
