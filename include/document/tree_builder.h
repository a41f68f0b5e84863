#pragma once

#include "common/types.hpp"
#include <functional>
#include <string>
#include <vector>

namespace docrecon {

/**
 * @brief Maps a Title / SectionHeader region to a heading level (1 = top)
 */
using HeadingLevelStrategy = std::function<int(const OrderedRegion&)>;

/**
 * @brief Default strategy
 *
 * Title -> 1. SectionHeader -> 2, or 1 + numbering depth for numbered
 * headings ("3.2 Results" -> 3).
 */
int DefaultHeadingLevel(const OrderedRegion& region);

/**
 * @brief Numbering depth of a heading text ("3.2.1 Foo" -> 3), 0 if unnumbered
 */
int HeadingNumberingDepth(const std::string& text);

/**
 * @brief Strategy driven by the native font-size hint of the heading tokens
 *
 * Level = 1 + number of breakpoints strictly greater than the largest token
 * font size. Headings without a font-size hint use DefaultHeadingLevel().
 * @param breakpoints font sizes in descending order, e.g. {20, 16, 13}
 */
HeadingLevelStrategy MakeFontSizeHeadingLevelStrategy(std::vector<float> breakpoints);

/**
 * @brief Document Tree Builder configuration
 */
struct TreeBuilderConfig {
    HeadingLevelStrategy headingLevel = DefaultHeadingLevel;
    int maxHeadingLevel = 6;

    void Show() const;
    bool Validate(std::string& error_msg) const;
};

/**
 * @brief Folds the ordered region sequence into a document tree
 *
 * Single left-to-right pass over a stack of open headings: a heading closes
 * every open heading of the same or deeper level and opens a new section;
 * any other node attaches to the innermost open heading (or the root).
 * Consecutive ListItem regions are grouped under one List node.
 */
class DocumentTreeBuilder {
public:
    explicit DocumentTreeBuilder(const TreeBuilderConfig& config);

    /**
     * @brief Build the tree; the root has kind Document and no provenance
     */
    DocumentNode build(const std::vector<OrderedRegion>& sequence) const;

    /**
     * @brief Clamped heading level of a Title / SectionHeader region
     */
    int headingLevel(const OrderedRegion& region) const;

private:
    DocumentNode makeNode(const OrderedRegion& region) const;

    TreeBuilderConfig config_;
};

} // namespace docrecon
