#include "common/types.hpp"
#include "common/logger.hpp"
#include <algorithm>
#include <cmath>
#include <cstdint>
#include <sstream>
#include <iomanip>

namespace docrecon {

const char* ErrorCodeName(int code) {
    switch (code) {
        case ErrorCode::SUCCESS: return "SUCCESS";
        case ErrorCode::INVALID_BOX: return "INVALID_BOX";
        case ErrorCode::UNKNOWN_CLASS_LABEL: return "UNKNOWN_CLASS_LABEL";
        case ErrorCode::TABLE_GRID_INCONSISTENT: return "TABLE_GRID_INCONSISTENT";
        case ErrorCode::MISSING_TEXT_SOURCE: return "MISSING_TEXT_SOURCE";
        case ErrorCode::OCR_FAILED: return "OCR_FAILED";
        case ErrorCode::TABLE_MODEL_FAILED: return "TABLE_MODEL_FAILED";
        case ErrorCode::PAGE_EXTRACTION_FAILED: return "PAGE_EXTRACTION_FAILED";
        case ErrorCode::PAGE_LIMIT_EXCEEDED: return "PAGE_LIMIT_EXCEEDED";
        case ErrorCode::INVALID_CONFIG: return "INVALID_CONFIG";
        default: return "UNKNOWN_ERROR";
    }
}

const char* ToString(ConversionStatus status) {
    switch (status) {
        case ConversionStatus::Pending: return "Pending";
        case ConversionStatus::Success: return "Success";
        case ConversionStatus::PartialSuccess: return "PartialSuccess";
        case ConversionStatus::Failure: return "Failure";
    }
    return "Unknown";
}

const char* ToString(CoordSpace space) {
    switch (space) {
        case CoordSpace::Page: return "page";
        case CoordSpace::Model: return "model";
        case CoordSpace::Normalized: return "normalized";
    }
    return "unknown";
}

const char* ToString(RegionClass cls) {
    switch (cls) {
        case RegionClass::Text: return "Text";
        case RegionClass::Title: return "Title";
        case RegionClass::SectionHeader: return "SectionHeader";
        case RegionClass::Table: return "Table";
        case RegionClass::Figure: return "Figure";
        case RegionClass::Caption: return "Caption";
        case RegionClass::ListItem: return "ListItem";
        case RegionClass::Footnote: return "Footnote";
        case RegionClass::PageHeader: return "PageHeader";
        case RegionClass::PageFooter: return "PageFooter";
    }
    return "Unknown";
}

const char* ToString(TextSource source) {
    return source == TextSource::Native ? "native" : "ocr";
}

const char* ToString(NodeKind kind) {
    switch (kind) {
        case NodeKind::Document: return "document";
        case NodeKind::Paragraph: return "paragraph";
        case NodeKind::Heading: return "heading";
        case NodeKind::Table: return "table";
        case NodeKind::Figure: return "figure";
        case NodeKind::List: return "list";
    }
    return "unknown";
}

// ==================== Box ====================

bool Box::isWellFormed() const {
    if (!std::isfinite(left) || !std::isfinite(top) ||
        !std::isfinite(right) || !std::isfinite(bottom)) {
        return false;
    }
    return left <= right && top <= bottom;
}

std::string Box::toString() const {
    std::ostringstream oss;
    oss << std::fixed << std::setprecision(1)
        << "[" << left << ", " << top << ", " << right << ", " << bottom
        << "]@" << ToString(space);
    return oss.str();
}

// ==================== Page ====================

PageDims Page::dims() const {
    PageDims d;
    d.width = width;
    d.height = height;

    if (!image.empty()) {
        d.modelWidth = static_cast<float>(image.cols);
        d.modelHeight = static_cast<float>(image.rows);
    } else if (rotation == 90 || rotation == 270) {
        d.modelWidth = height;
        d.modelHeight = width;
    } else {
        d.modelWidth = width;
        d.modelHeight = height;
    }
    return d;
}

// ==================== Tokens ====================

std::string JoinTokenText(const std::vector<TextToken>& tokens) {
    std::string text;
    for (const auto& token : tokens) {
        if (token.text.empty()) continue;
        if (!text.empty()) text += ' ';
        text += token.text;
    }
    return text;
}

// ==================== Table ====================

const TableCell* Table::cellAt(int row, int col) const {
    if (row < 0 || row >= rowCount || col < 0 || col >= colCount) {
        return nullptr;
    }
    for (const auto& cell : cells) {
        if (cell.covers(row, col)) {
            return &cell;
        }
    }
    return nullptr;
}

void Table::checkCoverage() const {
    std::vector<GridIssue> issues;
    std::vector<int> coverage(static_cast<size_t>(rowCount) * colCount, 0);

    for (const auto& cell : cells) {
        if (cell.rowSpan < 1 || cell.colSpan < 1) {
            issues.push_back({GridIssue::Kind::BadSpan, cell.row, cell.col});
            continue;
        }
        // 64-bit ends: model spans are unbounded
        const int64_t rowEnd = static_cast<int64_t>(cell.row) + cell.rowSpan;
        const int64_t colEnd = static_cast<int64_t>(cell.col) + cell.colSpan;
        if (cell.row < 0 || cell.col < 0 || rowEnd > rowCount || colEnd > colCount) {
            issues.push_back({GridIssue::Kind::OutOfRange, cell.row, cell.col});
        }

        const int r1 = static_cast<int>(std::min<int64_t>(rowEnd, rowCount));
        const int c1 = static_cast<int>(std::min<int64_t>(colEnd, colCount));
        for (int r = std::max(cell.row, 0); r < r1; ++r) {
            for (int c = std::max(cell.col, 0); c < c1; ++c) {
                coverage[static_cast<size_t>(r) * colCount + c]++;
            }
        }
    }

    for (int r = 0; r < rowCount; ++r) {
        for (int c = 0; c < colCount; ++c) {
            int count = coverage[static_cast<size_t>(r) * colCount + c];
            if (count == 0) {
                issues.push_back({GridIssue::Kind::Gap, r, c});
            } else if (count > 1) {
                issues.push_back({GridIssue::Kind::Overlap, r, c});
            }
        }
    }

    if (!issues.empty()) {
        std::string message = "Table grid " + std::to_string(rowCount) + "x" + std::to_string(colCount) +
                              " has " + std::to_string(issues.size()) + " coverage defect(s)";
        throw TableGridInconsistencyError(message, std::move(issues));
    }
}

bool Table::hasFullCoverage() const {
    try {
        checkCoverage();
        return true;
    } catch (const TableGridInconsistencyError&) {
        return false;
    }
}

// ==================== DocumentNode ====================

size_t DocumentNode::countNodes() const {
    size_t count = 1;
    for (const auto& child : children) {
        count += child.countNodes();
    }
    return count;
}

void DocumentNode::Show(int indent) const {
    std::string pad(static_cast<size_t>(indent) * 2, ' ');
    std::string summary = text.size() > 60 ? text.substr(0, 57) + "..." : text;

    if (kind == NodeKind::Heading) {
        LOG_INFO("%s- heading(h%d) \"%s\"", pad.c_str(), level, summary.c_str());
    } else if (kind == NodeKind::Table && table) {
        LOG_INFO("%s- table %dx%d%s", pad.c_str(), table->rowCount, table->colCount,
                 table->degraded ? " (degraded)" : "");
    } else {
        LOG_INFO("%s- %s [%s] \"%s\"", pad.c_str(), ToString(kind), ToString(label), summary.c_str());
    }

    for (const auto& child : children) {
        child.Show(indent + 1);
    }
}

} // namespace docrecon
