#include "table/table_assembler.h"
#include "ordering/reading_order.h"
#include "common/geometry.h"
#include "common/logger.hpp"
#include <algorithm>
#include <cmath>
#include <cstdint>
#include <limits>

namespace docrecon {

namespace {

std::string DescribeIssues(const std::vector<GridIssue>& issues) {
    int gaps = 0, overlaps = 0, outOfRange = 0, badSpans = 0;
    for (const auto& issue : issues) {
        switch (issue.kind) {
            case GridIssue::Kind::Gap: gaps++; break;
            case GridIssue::Kind::Overlap: overlaps++; break;
            case GridIssue::Kind::OutOfRange: outOfRange++; break;
            case GridIssue::Kind::BadSpan: badSpans++; break;
        }
    }

    std::string text;
    auto append = [&text](int count, const char* what) {
        if (count == 0) return;
        if (!text.empty()) text += ", ";
        text += std::to_string(count) + " " + what;
    };
    append(gaps, "gap(s)");
    append(overlaps, "overlap(s)");
    append(outOfRange, "out-of-range position(s)");
    append(badSpans, "bad span(s)");

    if (!issues.empty()) {
        text += "; first at (" + std::to_string(issues.front().row) + "," +
                std::to_string(issues.front().col) + ")";
    }
    return text;
}

// End of a model span, saturated at limit
int SpanEnd(int start, int span, int64_t limit) {
    return static_cast<int>(std::min<int64_t>(static_cast<int64_t>(start) + std::max(span, 1), limit));
}

} // namespace

// ==================== TableAssemblerConfig ====================

void TableAssemblerConfig::Show() const {
    LOG_INFO("  Cell Overlap Threshold: %.2f", cellOverlapThreshold);
    LOG_INFO("  Max Grid Cells: %d", maxGridCells);
}

bool TableAssemblerConfig::Validate(std::string& error_msg) const {
    if (!(cellOverlapThreshold > 0.0f && cellOverlapThreshold <= 1.0f)) {
        error_msg = "cellOverlapThreshold must be in (0, 1]";
        return false;
    }
    if (maxGridCells < 1) {
        error_msg = "maxGridCells must be >= 1";
        return false;
    }
    return true;
}

// ==================== TableAssembler ====================

TableAssembler::TableAssembler(const TableAssemblerConfig& config, const TextMergerConfig& mergerConfig)
    : config_(config), merger_(mergerConfig) {
}

void TableAssembler::gridSize(const TableStructure& structure, int& rows, int& cols) {
    rows = structure.numRows;
    cols = structure.numCols;

    if (rows <= 0) {
        rows = 0;
        for (const auto& cell : structure.cells) {
            if (cell.rowStart >= 0) {
                rows = std::max(rows, SpanEnd(cell.rowStart, cell.rowSpan, std::numeric_limits<int>::max()));
            }
        }
    }
    if (cols <= 0) {
        cols = 0;
        for (const auto& cell : structure.cells) {
            if (cell.colStart >= 0) {
                cols = std::max(cols, SpanEnd(cell.colStart, cell.colSpan, std::numeric_limits<int>::max()));
            }
        }
    }
}

bool TableAssembler::clampGrid(int maxCells, int& rows, int& cols) {
    if (static_cast<int64_t>(rows) * cols <= maxCells) {
        return false;
    }
    cols = std::min(cols, maxCells);
    rows = std::max(1, std::min(rows, maxCells / cols));
    return true;
}

void TableAssembler::checkModelGrid(const TableStructure& structure, int rows, int cols) {
    Table raw;
    raw.rowCount = rows;
    raw.colCount = cols;
    raw.cells.reserve(structure.cells.size());

    for (const auto& modelCell : structure.cells) {
        TableCell cell;
        cell.row = modelCell.rowStart;
        cell.col = modelCell.colStart;
        cell.rowSpan = modelCell.rowSpan;
        cell.colSpan = modelCell.colSpan;
        raw.cells.push_back(cell);
    }

    raw.checkCoverage();
}

Box TableAssembler::estimateCellBox(const std::vector<GridCell>& cells, int row, int col,
                                    int rows, int cols, const Box& tableBox) {
    const float inf = std::numeric_limits<float>::infinity();
    float top = inf, left = inf;
    float bottom = -inf, right = -inf;

    for (const auto& cell : cells) {
        if (!cell.hasBox) continue;
        if (cell.r0 == row) top = std::min(top, cell.box.top);
        if (cell.r1 - 1 == row) bottom = std::max(bottom, cell.box.bottom);
        if (cell.c0 == col) left = std::min(left, cell.box.left);
        if (cell.c1 - 1 == col) right = std::max(right, cell.box.right);
    }

    // Even split of the table box for bands no cell describes
    float rowHeight = tableBox.height() / static_cast<float>(rows);
    float colWidth = tableBox.width() / static_cast<float>(cols);
    Box even(tableBox.left + col * colWidth, tableBox.top + row * rowHeight,
             tableBox.left + (col + 1) * colWidth, tableBox.top + (row + 1) * rowHeight,
             CoordSpace::Page);

    Box box(std::isfinite(left) ? left : even.left,
            std::isfinite(top) ? top : even.top,
            std::isfinite(right) ? right : even.right,
            std::isfinite(bottom) ? bottom : even.bottom,
            CoordSpace::Page);
    if (!box.isWellFormed() || box.isEmpty()) {
        box = even;
    }
    return Geometry::clip(box, tableBox);
}

std::vector<TableAssembler::GridCell> TableAssembler::buildCoveringGrid(
        const TableStructure& structure, int rows, int cols,
        const Region& region, const Page& page,
        std::vector<ConversionWarning>& warnings) const {
    const PageDims dims = page.dims();
    std::vector<GridCell> grid;

    for (const auto& modelCell : structure.cells) {
        if (modelCell.rowStart < 0 || modelCell.colStart < 0 ||
            modelCell.rowStart >= rows || modelCell.colStart >= cols) {
            LOG_DEBUG("Table cell (%d,%d) outside the %dx%d grid, dropped",
                      modelCell.rowStart, modelCell.colStart, rows, cols);
            continue;
        }

        GridCell cell;
        cell.r0 = modelCell.rowStart;
        cell.r1 = SpanEnd(modelCell.rowStart, modelCell.rowSpan, rows);
        cell.c0 = modelCell.colStart;
        cell.c1 = SpanEnd(modelCell.colStart, modelCell.colSpan, cols);
        cell.hasBox = false;
        cell.columnHeader = modelCell.columnHeader;
        cell.rowHeader = modelCell.rowHeader;

        try {
            Box box = Geometry::toSpace(modelCell.box, CoordSpace::Page, dims, page.rotation);
            box = Geometry::clip(box, region.box);
            if (!box.isEmpty()) {
                cell.box = box;
                cell.hasBox = true;
            }
        } catch (const InvalidBoxError& e) {
            LOG_WARN("Page %d table %d: cell (%d,%d) box rejected: %s",
                     page.index, region.detectionIndex, cell.r0, cell.c0, e.what());
            warnings.push_back({ErrorCode::INVALID_BOX, page.index, region.detectionIndex,
                                "Table cell (" + std::to_string(cell.r0) + "," +
                                std::to_string(cell.c0) + "): " + e.what()});
        }

        // Fold every overlapping cell into the bounding grid rectangle
        bool merged = true;
        while (merged) {
            merged = false;
            for (auto it = grid.begin(); it != grid.end(); ++it) {
                if (it->r0 < cell.r1 && cell.r0 < it->r1 && it->c0 < cell.c1 && cell.c0 < it->c1) {
                    cell.r0 = std::min(cell.r0, it->r0);
                    cell.r1 = std::max(cell.r1, it->r1);
                    cell.c0 = std::min(cell.c0, it->c0);
                    cell.c1 = std::max(cell.c1, it->c1);
                    if (it->hasBox) {
                        cell.box = cell.hasBox ? Geometry::unite(cell.box, it->box) : it->box;
                        cell.hasBox = true;
                    }
                    cell.columnHeader = cell.columnHeader || it->columnHeader;
                    cell.rowHeader = cell.rowHeader || it->rowHeader;
                    grid.erase(it);
                    merged = true;
                    break;
                }
            }
        }
        grid.push_back(cell);
    }

    std::vector<char> covered(static_cast<size_t>(rows) * cols, 0);
    for (const auto& cell : grid) {
        for (int r = cell.r0; r < cell.r1; ++r) {
            for (int c = cell.c0; c < cell.c1; ++c) {
                covered[static_cast<size_t>(r) * cols + c] = 1;
            }
        }
    }

    std::vector<GridCell> fillers;
    for (int r = 0; r < rows; ++r) {
        for (int c = 0; c < cols; ++c) {
            if (covered[static_cast<size_t>(r) * cols + c]) continue;
            GridCell filler;
            filler.r0 = r;
            filler.r1 = r + 1;
            filler.c0 = c;
            filler.c1 = c + 1;
            filler.box = estimateCellBox(grid, r, c, rows, cols, region.box);
            filler.hasBox = true;
            filler.columnHeader = false;
            filler.rowHeader = false;
            fillers.push_back(filler);
        }
    }

    for (auto& cell : grid) {
        if (!cell.hasBox) {
            cell.box = Geometry::unite(estimateCellBox(grid, cell.r0, cell.c0, rows, cols, region.box),
                                       estimateCellBox(grid, cell.r1 - 1, cell.c1 - 1, rows, cols, region.box));
            cell.hasBox = true;
        }
    }
    grid.insert(grid.end(), fillers.begin(), fillers.end());

    std::sort(grid.begin(), grid.end(), [](const GridCell& a, const GridCell& b) {
        if (a.r0 != b.r0) return a.r0 < b.r0;
        return a.c0 < b.c0;
    });
    return grid;
}

AssembledTable TableAssembler::assemble(const Region& region,
                                        const TableStructure& structure,
                                        const Page& page,
                                        const std::vector<OcrToken>& ocrTokens) const {
    AssembledTable result;
    Table& table = result.table;
    table.region = region;

    int rows = 0, cols = 0;
    gridSize(structure, rows, cols);
    // No usable structure: the region becomes a single empty-grid cell
    rows = std::max(rows, 1);
    cols = std::max(cols, 1);
    const int reportedRows = rows, reportedCols = cols;
    const bool clamped = clampGrid(config_.maxGridCells, rows, cols);
    table.rowCount = rows;
    table.colCount = cols;

    try {
        checkModelGrid(structure, rows, cols);
        if (clamped) {
            std::string message = "Table grid " + std::to_string(reportedRows) + "x" +
                                  std::to_string(reportedCols) + " exceeds " +
                                  std::to_string(config_.maxGridCells) + " cells, clamped to " +
                                  std::to_string(rows) + "x" + std::to_string(cols);
            LOG_WARN("Page %d table %d: %s", page.index, region.detectionIndex, message.c_str());
            table.degraded = true;
            result.warnings.push_back({ErrorCode::TABLE_GRID_INCONSISTENT, page.index, region.detectionIndex,
                                       message});
        }
    } catch (const TableGridInconsistencyError& e) {
        std::string detail = DescribeIssues(e.issues());
        LOG_WARN("Page %d table %d: %s (%s), repairing grid",
                 page.index, region.detectionIndex, e.what(), detail.c_str());
        table.degraded = true;
        result.warnings.push_back({ErrorCode::TABLE_GRID_INCONSISTENT, page.index, region.detectionIndex,
                                   std::string(e.what()) + ": " + detail});
    }

    std::vector<GridCell> grid = buildCoveringGrid(structure, rows, cols, region, page, result.warnings);

    MergedText merged = merger_.mergeRegion(region, page, ocrTokens);
    result.droppedTokens = merged.droppedTokens;
    result.source = merged.source;
    result.missingText = merged.missingText;

    std::vector<std::vector<TextToken>> cellTokens(grid.size());
    for (const auto& token : merged.tokens) {
        int best = -1;
        float bestRatio = 0.0f;
        for (size_t i = 0; i < grid.size(); ++i) {
            float ratio = Geometry::overlapRatio(token.box, grid[i].box);
            if (ratio > bestRatio) {
                bestRatio = ratio;
                best = static_cast<int>(i);
            }
        }
        if (best < 0 || bestRatio < config_.cellOverlapThreshold) {
            LOG_DEBUG("Table token '%s' fits no cell (best overlap %.2f), dropped",
                      token.text.c_str(), bestRatio);
            result.droppedTokens++;
            continue;
        }
        cellTokens[best].push_back(token);
    }

    table.cells.reserve(grid.size());
    for (size_t i = 0; i < grid.size(); ++i) {
        const GridCell& slot = grid[i];
        TableCell cell;
        cell.row = slot.r0;
        cell.col = slot.c0;
        cell.rowSpan = slot.r1 - slot.r0;
        cell.colSpan = slot.c1 - slot.c0;
        cell.columnHeader = slot.columnHeader;
        cell.rowHeader = slot.rowHeader;
        cell.tokens = ReadingOrderResolver::orderTokens(std::move(cellTokens[i]),
                                                        merger_.config().lineOverlapRatio);
        if (cell.tokens.empty()) {
            cell.box = slot.box;
        } else {
            cell.box = cell.tokens.front().box;
            for (const auto& token : cell.tokens) {
                cell.box = Geometry::unite(cell.box, token.box);
            }
        }
        table.cells.push_back(std::move(cell));
    }

    // The repaired grid covers every position exactly once
    table.checkCoverage();

    result.tokens = std::move(merged.tokens);
    LOG_TRACE("Page %d table %d: %dx%d grid, %zu cell(s)%s",
              page.index, region.detectionIndex, rows, cols, table.cells.size(),
              table.degraded ? ", degraded" : "");
    return result;
}

} // namespace docrecon
