/**
 * @file test_table_assembler.cpp
 * @brief Table Assembler tests (grid repair, token placement, coverage)
 */

#include <gtest/gtest.h>
#include "table/table_assembler.h"
#include <algorithm>
#include <limits>
#include <random>

using namespace docrecon;

namespace {

TableModelCell MakeModelCell(int row, int col, Box box, int rowSpan = 1, int colSpan = 1) {
    TableModelCell cell;
    cell.rowStart = row;
    cell.colStart = col;
    cell.rowSpan = rowSpan;
    cell.colSpan = colSpan;
    cell.box = box;
    cell.box.space = CoordSpace::Model;
    return cell;
}

TextSpan MakeSpan(const std::string& text, Box box) {
    TextSpan span;
    span.text = text;
    span.box = box;
    return span;
}

class TableAssemblerTest : public ::testing::Test {
protected:
    void SetUp() override {
        page_.index = 1;
        page_.width = 600;
        page_.height = 800;

        region_.cls = RegionClass::Table;
        region_.box = Box(0, 0, 200, 100);
        region_.pageIndex = 1;
        region_.detectionIndex = 3;
    }

    AssembledTable Assemble(const TableStructure& structure, const std::vector<OcrToken>& ocr = {}) {
        TableAssembler assembler(TableAssemblerConfig{}, TextMergerConfig{});
        return assembler.assemble(region_, structure, page_, ocr);
    }

    bool HasWarning(const AssembledTable& table, int code) {
        for (const auto& warning : table.warnings) {
            if (warning.code == code) return true;
        }
        return false;
    }

    Page page_;
    Region region_;
};

} // namespace

// ==================== Consistent grids ====================

TEST_F(TableAssemblerTest, ConsistentGridPlacesTokensInCells) {
    page_.spans = {MakeSpan("Name", Box(10, 10, 60, 30)), MakeSpan("Qty", Box(110, 10, 150, 30)),
                   MakeSpan("Apple", Box(10, 60, 60, 80)), MakeSpan("3", Box(110, 60, 120, 80))};

    TableStructure structure;
    structure.numRows = 2;
    structure.numCols = 2;
    structure.cells = {MakeModelCell(0, 0, Box(0, 0, 100, 50)), MakeModelCell(0, 1, Box(100, 0, 200, 50)),
                       MakeModelCell(1, 0, Box(0, 50, 100, 100)), MakeModelCell(1, 1, Box(100, 50, 200, 100))};
    structure.cells[0].columnHeader = true;
    structure.cells[1].columnHeader = true;

    AssembledTable result = Assemble(structure);
    const Table& table = result.table;

    EXPECT_FALSE(table.degraded);
    EXPECT_TRUE(result.warnings.empty());
    EXPECT_EQ(table.rowCount, 2);
    EXPECT_EQ(table.colCount, 2);
    EXPECT_TRUE(table.hasFullCoverage());
    EXPECT_EQ(table.region.detectionIndex, 3);

    EXPECT_EQ(table.cellAt(0, 0)->text(), "Name");
    EXPECT_EQ(table.cellAt(0, 1)->text(), "Qty");
    EXPECT_EQ(table.cellAt(1, 0)->text(), "Apple");
    EXPECT_EQ(table.cellAt(1, 1)->text(), "3");
    EXPECT_TRUE(table.cellAt(0, 0)->columnHeader);
    EXPECT_FALSE(table.cellAt(1, 0)->columnHeader);

    // Cell box is the union of its token boxes
    const Box& box = table.cellAt(1, 0)->box;
    EXPECT_FLOAT_EQ(box.left, 10.0f);
    EXPECT_FLOAT_EQ(box.right, 60.0f);
    EXPECT_EQ(result.tokens.size(), 4u);
}

TEST_F(TableAssemblerTest, GridSizeDerivedFromCells) {
    TableStructure structure;
    structure.cells = {MakeModelCell(0, 0, Box(0, 0, 200, 50), 1, 3),
                       MakeModelCell(1, 0, Box(0, 50, 60, 100)), MakeModelCell(1, 1, Box(60, 50, 130, 100)),
                       MakeModelCell(1, 2, Box(130, 50, 200, 100))};

    int rows = 0, cols = 0;
    TableAssembler::gridSize(structure, rows, cols);
    EXPECT_EQ(rows, 2);
    EXPECT_EQ(cols, 3);

    AssembledTable result = Assemble(structure);
    EXPECT_FALSE(result.table.degraded);
    EXPECT_EQ(result.table.cells.size(), 4u);
    EXPECT_EQ(result.table.cellAt(0, 2)->colSpan, 3);
}

// ==================== Inconsistent grids ====================

/**
 * @brief 2x2 table with a gap at (1,1): an empty cell is filled in and the
 *        inconsistency is reported as a warning
 */
TEST_F(TableAssemblerTest, GapIsFilledWithEmptyCell) {
    page_.spans = {MakeSpan("A", Box(10, 10, 40, 30)), MakeSpan("B", Box(110, 10, 140, 30)),
                   MakeSpan("C", Box(10, 60, 40, 80))};

    TableStructure structure;
    structure.numRows = 2;
    structure.numCols = 2;
    structure.cells = {MakeModelCell(0, 0, Box(0, 0, 100, 50)), MakeModelCell(0, 1, Box(100, 0, 200, 50)),
                       MakeModelCell(1, 0, Box(0, 50, 100, 100))};

    AssembledTable result;
    ASSERT_NO_THROW(result = Assemble(structure));
    const Table& table = result.table;

    EXPECT_TRUE(table.degraded);
    EXPECT_TRUE(HasWarning(result, ErrorCode::TABLE_GRID_INCONSISTENT));
    EXPECT_EQ(result.warnings[0].pageIndex, 1);
    EXPECT_EQ(result.warnings[0].regionIndex, 3);
    EXPECT_TRUE(table.hasFullCoverage());

    const TableCell* filled = table.cellAt(1, 1);
    ASSERT_NE(filled, nullptr);
    EXPECT_EQ(filled->row, 1);
    EXPECT_EQ(filled->col, 1);
    EXPECT_EQ(filled->rowSpan, 1);
    EXPECT_EQ(filled->colSpan, 1);
    EXPECT_TRUE(filled->tokens.empty());

    // Box estimated from the neighbouring row and column bands
    EXPECT_FLOAT_EQ(filled->box.left, 100.0f);
    EXPECT_FLOAT_EQ(filled->box.top, 50.0f);
    EXPECT_FLOAT_EQ(filled->box.right, 200.0f);
    EXPECT_FLOAT_EQ(filled->box.bottom, 100.0f);

    EXPECT_EQ(table.cellAt(0, 1)->text(), "B");
}

TEST_F(TableAssemblerTest, GapCellStillReceivesTextUnderIt) {
    page_.spans = {MakeSpan("D", Box(110, 60, 140, 80))};

    TableStructure structure;
    structure.numRows = 2;
    structure.numCols = 2;
    structure.cells = {MakeModelCell(0, 0, Box(0, 0, 100, 50)), MakeModelCell(0, 1, Box(100, 0, 200, 50)),
                       MakeModelCell(1, 0, Box(0, 50, 100, 100))};

    AssembledTable result = Assemble(structure);
    EXPECT_EQ(result.table.cellAt(1, 1)->text(), "D");
}

TEST_F(TableAssemblerTest, OverlappingCellsAreMerged) {
    TableStructure structure;
    structure.numRows = 2;
    structure.numCols = 2;
    structure.cells = {MakeModelCell(0, 0, Box(0, 0, 200, 50), 1, 2),
                       MakeModelCell(0, 1, Box(100, 0, 200, 50)),
                       MakeModelCell(1, 0, Box(0, 50, 100, 100)),
                       MakeModelCell(1, 1, Box(100, 50, 200, 100))};
    structure.cells[1].columnHeader = true;

    AssembledTable result = Assemble(structure);
    const Table& table = result.table;

    EXPECT_TRUE(table.degraded);
    EXPECT_TRUE(table.hasFullCoverage());
    EXPECT_EQ(table.cells.size(), 3u);

    const TableCell* merged = table.cellAt(0, 1);
    ASSERT_NE(merged, nullptr);
    EXPECT_EQ(merged->col, 0);
    EXPECT_EQ(merged->colSpan, 2);
    EXPECT_TRUE(merged->columnHeader);
}

TEST_F(TableAssemblerTest, ChainedOverlapsMergeTransitively) {
    TableStructure structure;
    structure.numRows = 3;
    structure.numCols = 1;
    structure.cells = {MakeModelCell(0, 0, Box(0, 0, 200, 60), 2, 1),
                       MakeModelCell(1, 0, Box(0, 30, 200, 100), 2, 1),
                       MakeModelCell(2, 0, Box(0, 60, 200, 100))};

    AssembledTable result = Assemble(structure);
    EXPECT_TRUE(result.table.hasFullCoverage());
    ASSERT_EQ(result.table.cells.size(), 1u);
    EXPECT_EQ(result.table.cells[0].rowSpan, 3);
}

TEST_F(TableAssemblerTest, SpansClippedAndOutOfGridCellsDropped) {
    TableStructure structure;
    structure.numRows = 2;
    structure.numCols = 2;
    structure.cells = {MakeModelCell(0, 0, Box(0, 0, 100, 50)),
                       MakeModelCell(0, 1, Box(100, 0, 200, 100), 5, 1),   // reaches past the grid
                       MakeModelCell(1, 0, Box(0, 50, 100, 100), 0, 0),    // non-positive spans
                       MakeModelCell(4, 4, Box(0, 0, 10, 10))};            // outside the grid

    AssembledTable result = Assemble(structure);
    const Table& table = result.table;

    EXPECT_TRUE(table.degraded);
    EXPECT_TRUE(table.hasFullCoverage());
    EXPECT_EQ(table.cells.size(), 3u);
    EXPECT_EQ(table.cellAt(1, 1)->row, 0);
    EXPECT_EQ(table.cellAt(1, 1)->rowSpan, 2);
    EXPECT_EQ(table.cellAt(1, 0)->rowSpan, 1);
}

TEST_F(TableAssemblerTest, EmptyStructureBecomesSingleCell) {
    page_.spans = {MakeSpan("only", Box(20, 20, 80, 40))};

    AssembledTable result = Assemble(TableStructure{});
    const Table& table = result.table;

    EXPECT_TRUE(table.degraded);
    EXPECT_EQ(table.rowCount, 1);
    EXPECT_EQ(table.colCount, 1);
    ASSERT_EQ(table.cells.size(), 1u);
    EXPECT_EQ(table.cells[0].text(), "only");
}

TEST_F(TableAssemblerTest, InvalidCellBoxWarnsAndKeepsGrid) {
    TableStructure structure;
    structure.numRows = 1;
    structure.numCols = 2;
    structure.cells = {MakeModelCell(0, 0, Box(100, 0, 0, 50)), MakeModelCell(0, 1, Box(100, 0, 200, 100))};

    AssembledTable result = Assemble(structure);
    EXPECT_FALSE(result.table.degraded);
    EXPECT_TRUE(HasWarning(result, ErrorCode::INVALID_BOX));
    EXPECT_TRUE(result.table.hasFullCoverage());
    EXPECT_FALSE(result.table.cellAt(0, 0)->box.isEmpty());
}

TEST_F(TableAssemblerTest, HugeSpanIsClampedWithoutOverflow) {
    TableStructure structure;
    structure.cells = {MakeModelCell(0, 0, Box(0, 0, 200, 20)),
                       MakeModelCell(std::numeric_limits<int>::max() - 1, 0, Box(0, 20, 200, 40), 5, 1)};

    int rows = 0, cols = 0;
    TableAssembler::gridSize(structure, rows, cols);
    EXPECT_EQ(rows, std::numeric_limits<int>::max());
    EXPECT_EQ(cols, 1);

    TableAssemblerConfig config;
    config.maxGridCells = 16;
    TableAssembler assembler(config, TextMergerConfig{});

    AssembledTable result;
    ASSERT_NO_THROW(result = assembler.assemble(region_, structure, page_, {}));
    EXPECT_TRUE(result.table.degraded);
    EXPECT_TRUE(HasWarning(result, ErrorCode::TABLE_GRID_INCONSISTENT));
    EXPECT_EQ(result.table.rowCount, 16);
    EXPECT_EQ(result.table.colCount, 1);
    EXPECT_TRUE(result.table.hasFullCoverage());
}

TEST_F(TableAssemblerTest, OversizedReportedGridIsClamped) {
    page_.spans = {MakeSpan("Total", Box(10, 2, 60, 8))};

    TableStructure structure;
    structure.numRows = 200000000;
    structure.numCols = 1;
    structure.cells = {MakeModelCell(0, 0, Box(0, 0, 200, 10))};

    TableAssemblerConfig config;
    config.maxGridCells = 100;
    TableAssembler assembler(config, TextMergerConfig{});

    AssembledTable result;
    ASSERT_NO_THROW(result = assembler.assemble(region_, structure, page_, {}));
    const Table& table = result.table;
    EXPECT_TRUE(table.degraded);
    EXPECT_TRUE(HasWarning(result, ErrorCode::TABLE_GRID_INCONSISTENT));
    EXPECT_EQ(table.rowCount, 100);
    EXPECT_EQ(table.colCount, 1);
    EXPECT_TRUE(table.hasFullCoverage());
    EXPECT_EQ(table.cellAt(0, 0)->text(), "Total");
}

TEST(TableAssembler, ClampGrid) {
    int rows = 10, cols = 10;
    EXPECT_FALSE(TableAssembler::clampGrid(100, rows, cols));
    EXPECT_EQ(rows, 10);

    rows = 3;
    cols = 50000;
    EXPECT_TRUE(TableAssembler::clampGrid(10000, rows, cols));
    EXPECT_EQ(cols, 10000);
    EXPECT_EQ(rows, 1);

    rows = 500;
    cols = 40;
    EXPECT_TRUE(TableAssembler::clampGrid(1000, rows, cols));
    EXPECT_EQ(cols, 40);
    EXPECT_EQ(rows, 25);
}

// ==================== Tokens ====================

TEST_F(TableAssemblerTest, TokenOutsideEveryCellIsDropped) {
    page_.spans = {MakeSpan("in", Box(10, 10, 40, 30)), MakeSpan("stray", Box(150, 60, 190, 80))};

    TableStructure structure;
    structure.numRows = 1;
    structure.numCols = 1;
    structure.cells = {MakeModelCell(0, 0, Box(0, 0, 100, 50))};

    AssembledTable result = Assemble(structure);
    EXPECT_EQ(result.table.cells[0].text(), "in");
    EXPECT_EQ(result.droppedTokens, 1);
}

TEST_F(TableAssemblerTest, OcrTokensUsedWhenNativeMissing) {
    TableStructure structure;
    structure.numRows = 1;
    structure.numCols = 2;
    structure.cells = {MakeModelCell(0, 0, Box(0, 0, 100, 100)), MakeModelCell(0, 1, Box(100, 0, 200, 100))};

    OcrToken left;
    left.text = "left";
    left.box = Box(10, 10, 60, 30, CoordSpace::Model);
    left.confidence = 0.6f;

    AssembledTable result = Assemble(structure, {left});
    EXPECT_EQ(result.source, TextSource::OCR);
    ASSERT_EQ(result.table.cellAt(0, 0)->tokens.size(), 1u);
    EXPECT_EQ(result.table.cellAt(0, 0)->tokens[0].source, TextSource::OCR);
    EXPECT_TRUE(result.table.cellAt(0, 1)->tokens.empty());
}

// ==================== Coverage property ====================

/**
 * @brief Whatever the model reports, the assembled grid covers every
 *        position exactly once
 */
TEST_F(TableAssemblerTest, CoverageHoldsForArbitraryModelGrids) {
    std::mt19937 rng(1234);
    std::uniform_int_distribution<int> start(-1, 4);
    std::uniform_int_distribution<int> span(-1, 3);
    std::uniform_int_distribution<int> count(0, 10);
    std::uniform_real_distribution<float> coord(0.0f, 200.0f);

    for (int iteration = 0; iteration < 200; ++iteration) {
        TableStructure structure;
        structure.numRows = iteration % 3 == 0 ? 0 : 4;
        structure.numCols = iteration % 3 == 0 ? 0 : 3;

        int cells = count(rng);
        for (int i = 0; i < cells; ++i) {
            float x0 = coord(rng), x1 = coord(rng);
            float y0 = coord(rng) / 2, y1 = coord(rng) / 2;
            Box box(std::min(x0, x1), std::min(y0, y1), std::max(x0, x1), std::max(y0, y1));
            structure.cells.push_back(MakeModelCell(start(rng), start(rng), box, span(rng), span(rng)));
        }

        AssembledTable result;
        ASSERT_NO_THROW(result = Assemble(structure)) << "iteration " << iteration;
        EXPECT_TRUE(result.table.hasFullCoverage()) << "iteration " << iteration;
        EXPECT_GE(result.table.rowCount, 1);
        EXPECT_GE(result.table.colCount, 1);
    }
}

TEST(TableAssemblerConfig, Validate) {
    TableAssemblerConfig config;
    std::string error;
    EXPECT_TRUE(config.Validate(error));
    config.cellOverlapThreshold = 0.0f;
    EXPECT_FALSE(config.Validate(error));

    config = TableAssemblerConfig();
    config.maxGridCells = 0;
    EXPECT_FALSE(config.Validate(error));
}
