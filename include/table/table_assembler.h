#pragma once

#include "common/types.hpp"
#include "text/text_merger.h"
#include <string>
#include <vector>

namespace docrecon {

/**
 * @brief Table Assembler configuration
 */
struct TableAssemblerConfig {
    float cellOverlapThreshold = 0.5f;   // Min overlapRatio(token, cell) to place a token
    int maxGridCells = 10000;            // rows x cols cap, larger model grids are clamped

    void Show() const;
    bool Validate(std::string& error_msg) const;
};

/**
 * @brief One cell reported by the table structure model
 */
struct TableModelCell {
    int rowStart = 0;
    int rowSpan = 1;
    int colStart = 0;
    int colSpan = 1;
    Box box;                      // Usually Model space (page raster)
    bool columnHeader = false;
    bool rowHeader = false;
};

/**
 * @brief Table structure model output for one table region
 */
struct TableStructure {
    int numRows = 0;              // <= 0: derived from the cells
    int numCols = 0;              // <= 0: derived from the cells
    std::vector<TableModelCell> cells;
};

struct AssembledTable {
    Table table;
    std::vector<TextToken> tokens;            // All tokens of the table region
    TextSource source = TextSource::Native;
    bool missingText = false;
    std::vector<ConversionWarning> warnings;
    int droppedTokens = 0;                    // Invalid, clipped away or outside every cell
};

/**
 * @brief Maps a table model cell grid onto the page text
 *
 * The produced grid always satisfies the exactly-once coverage invariant.
 * An inconsistent model grid is repaired (overlapping cells merged, gaps
 * filled with empty cells), the table is marked degraded and a
 * TABLE_GRID_INCONSISTENT warning is returned.
 */
class TableAssembler {
public:
    TableAssembler(const TableAssemblerConfig& config, const TextMergerConfig& mergerConfig);

    /**
     * @brief Assemble the table of one Table region
     * @param region Table region (page space)
     * @param structure model cell grid, boxes in page-raster model space
     * @param page owning page (native spans, dimensions, rotation)
     * @param ocrTokens OCR tokens of the region (may be empty)
     */
    AssembledTable assemble(const Region& region,
                            const TableStructure& structure,
                            const Page& page,
                            const std::vector<OcrToken>& ocrTokens) const;

    /**
     * @brief Checks the raw model grid against a rows x cols table
     * @throws TableGridInconsistencyError on gaps, overlaps, bad or out-of-range spans
     */
    static void checkModelGrid(const TableStructure& structure, int rows, int cols);

    static void gridSize(const TableStructure& structure, int& rows, int& cols);

    /**
     * @brief Shrinks rows x cols to at most maxCells positions
     * @return true if the grid was clamped
     */
    static bool clampGrid(int maxCells, int& rows, int& cols);

private:
    struct GridCell {
        int r0, r1;               // [r0, r1)
        int c0, c1;               // [c0, c1)
        Box box;
        bool hasBox;
        bool columnHeader;
        bool rowHeader;
    };

    std::vector<GridCell> buildCoveringGrid(const TableStructure& structure, int rows, int cols,
                                            const Region& region, const Page& page,
                                            std::vector<ConversionWarning>& warnings) const;

    static Box estimateCellBox(const std::vector<GridCell>& cells, int row, int col,
                               int rows, int cols, const Box& tableBox);

    TableAssemblerConfig config_;
    TextSourceMerger merger_;
};

} // namespace docrecon
