#pragma once

#include "common/errors.h"
#include <opencv2/opencv.hpp>
#include <optional>
#include <string>
#include <vector>

namespace docrecon {

/**
 * Coordinate space of a Box
 */
enum class CoordSpace {
    Page,        // Page reading space: top-left origin, unrotated, page units
    Model,       // Raster pixel space as seen by the layout / table / OCR models
    Normalized   // Page space divided by page width / height, [0, 1]
};

const char* ToString(CoordSpace space);

/**
 * Axis-aligned box (left, top, right, bottom) in a named coordinate space
 */
struct Box {
    float left = 0.0f;
    float top = 0.0f;
    float right = 0.0f;
    float bottom = 0.0f;
    CoordSpace space = CoordSpace::Page;

    Box() = default;
    Box(float l, float t, float r, float b, CoordSpace s = CoordSpace::Page)
        : left(l), top(t), right(r), bottom(b), space(s) {}

    float width() const { return right - left; }
    float height() const { return bottom - top; }
    float centerX() const { return (left + right) * 0.5f; }
    float centerY() const { return (top + bottom) * 0.5f; }

    // Zero for degenerate or malformed boxes
    float area() const {
        return (width() > 0.0f && height() > 0.0f) ? width() * height() : 0.0f;
    }

    bool isEmpty() const { return area() <= 0.0f; }
    bool isWellFormed() const;

    std::string toString() const;
};

/**
 * Page reading-space size plus the raster size delivered to the models
 */
struct PageDims {
    float width = 0.0f;        // Page width (reading orientation)
    float height = 0.0f;       // Page height (reading orientation)
    float modelWidth = 0.0f;   // Raster width as delivered (rotated frame)
    float modelHeight = 0.0f;  // Raster height as delivered (rotated frame)
};

/**
 * Text run from the PDF text layer
 */
struct TextSpan {
    std::string text;
    Box box;
    float fontSize = 0.0f;     // Font-size hint, 0 when unknown
};

/**
 * One page as supplied by the PDF source
 */
struct Page {
    int index = 0;                    // 0-based
    float width = 0.0f;               // Reading-space width
    float height = 0.0f;              // Reading-space height
    int rotation = 0;                 // 0 / 90 / 180 / 270, clockwise
    std::vector<TextSpan> spans;      // Native text spans
    cv::Mat image;                    // Raster image (may be empty)

    /**
     * @brief Dimensions used for coordinate normalization
     *
     * Without a raster the model space is assumed to be the page rotated,
     * unscaled.
     */
    PageDims dims() const;
};

/**
 * Fixed region class set of the layout model
 */
enum class RegionClass {
    Text,
    Title,
    SectionHeader,
    Table,
    Figure,
    Caption,
    ListItem,
    Footnote,
    PageHeader,
    PageFooter
};

const char* ToString(RegionClass cls);

/**
 * Classified area on one page
 */
struct Region {
    RegionClass cls = RegionClass::Text;
    Box box;                      // Page space
    float confidence = 0.0f;      // [0, 1]
    int pageIndex = 0;
    int detectionIndex = 0;       // Position in the layout model output
};

enum class TextSource {
    Native,
    OCR
};

const char* ToString(TextSource source);

/**
 * Resolved text unit inside a region
 */
struct TextToken {
    std::string text;
    TextSource source = TextSource::Native;
    float confidence = 1.0f;      // 1.0 for native text
    Box box;                      // Page space, non-empty, inside its region
    float fontSize = 0.0f;        // Native font-size hint, 0 for OCR
};

/**
 * Joins token texts with single spaces (tokens already in reading order)
 */
std::string JoinTokenText(const std::vector<TextToken>& tokens);

struct TableCell {
    int row = 0;
    int col = 0;
    int rowSpan = 1;
    int colSpan = 1;
    std::vector<TextToken> tokens;
    Box box;
    bool columnHeader = false;
    bool rowHeader = false;

    std::string text() const { return JoinTokenText(tokens); }
    bool covers(int r, int c) const {
        return r >= row && r < row + rowSpan && c >= col && c < col + colSpan;
    }
};

/**
 * Row/column indexed cell grid of one table region
 *
 * Invariant: every (row, col) in [0, rowCount) x [0, colCount) is covered by
 * exactly one cell.
 */
struct Table {
    Region region;
    int rowCount = 0;
    int colCount = 0;
    std::vector<TableCell> cells;
    bool degraded = false;        // Grid needed gap filling / overlap merging

    /**
     * @brief Cell covering (row, col), nullptr if none or out of range
     */
    const TableCell* cellAt(int row, int col) const;

    /**
     * @brief Verifies exactly-once coverage
     * @throws TableGridInconsistencyError listing every gap / overlap
     */
    void checkCoverage() const;

    bool hasFullCoverage() const;
};

/**
 * Region after text / table resolution (output of the per-page phase)
 */
struct ResolvedRegion {
    Region region;
    std::vector<TextToken> tokens;
    std::string text;
    TextSource source = TextSource::Native;
    bool missingText = false;
    std::optional<Table> table;   // Set for Table regions
};

/**
 * Region with its document-linear sequence index
 */
struct OrderedRegion : ResolvedRegion {
    int sequenceIndex = -1;

    OrderedRegion() = default;
    OrderedRegion(ResolvedRegion resolved, int index)
        : ResolvedRegion(std::move(resolved)), sequenceIndex(index) {}
};

/**
 * Immutable result of one page task
 */
struct PageResult {
    int pageIndex = 0;
    PageDims dims;
    int rotation = 0;
    std::vector<ResolvedRegion> regions;     // Detection order
    std::vector<ConversionWarning> warnings;

    int detectedRegions = 0;
    int droppedRegions = 0;
    int droppedTokens = 0;
    int degradedTables = 0;
    int ocrFailures = 0;
    double processTimeMs = 0.0;
};

struct Provenance {
    int pageIndex = 0;
    Box box;
};

enum class NodeKind {
    Document,     // Root
    Paragraph,
    Heading,
    Table,
    Figure,
    List
};

const char* ToString(NodeKind kind);

/**
 * Node of the reconstructed document tree
 *
 * Tagged by kind; only Document, Heading and List nodes have children.
 */
struct DocumentNode {
    NodeKind kind = NodeKind::Document;
    RegionClass label = RegionClass::Text;   // Source region class
    int level = 0;                           // Heading level (1 = top)
    std::string text;
    std::optional<Table> table;
    std::vector<Provenance> provenance;
    std::vector<DocumentNode> children;

    size_t countNodes() const;
    void Show(int indent = 0) const;
};

} // namespace docrecon
