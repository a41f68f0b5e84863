#pragma once

#include "common/types.hpp"
#include <string>
#include <vector>

namespace docrecon {

/**
 * @brief Reading Order Resolver configuration
 */
struct ReadingOrderConfig {
    // Two regions share a column band when their horizontal spans overlap by
    // more than this fraction of the narrower region's width
    float columnOverlapThreshold = 0.5f;

    void Show() const;
    bool Validate(std::string& error_msg) const;
};

/**
 * @brief Orders regions within a page and across pages
 *
 * Per page: PageHeader regions first, then column bands left-to-right with
 * regions top-to-bottom inside a band, then PageFooter regions. Ties on the
 * top coordinate go to the smaller left coordinate, then to the smaller
 * detection index. Bands are found by single-linkage clustering on the
 * horizontal overlap rule. A region spanning several columns does not link
 * them: it is read at its top position, and the regions above it are banded
 * separately from those below. Irregular multi-column layouts are handled on
 * a best-effort basis only.
 */
class ReadingOrderResolver {
public:
    explicit ReadingOrderResolver(const ReadingOrderConfig& config);

    /**
     * @brief Reading order of one page's regions
     * @return indices into regions
     */
    std::vector<size_t> orderPage(const std::vector<Region>& regions) const;

    /**
     * @brief Column bands of the given regions, each band sorted top-to-bottom,
     *        bands sorted left-to-right
     * @param candidates indices into regions to cluster
     */
    std::vector<std::vector<size_t>> detectBands(const std::vector<Region>& regions,
                                                 const std::vector<size_t>& candidates) const;

    /**
     * @brief Concatenates page orders by increasing page index and assigns
     *        document-wide sequence indices
     */
    std::vector<OrderedRegion> resolveDocument(std::vector<PageResult> pages) const;

    /**
     * @brief Line-then-left-to-right order of tokens inside one area
     * @param lineOverlapRatio minimum vertical overlap (fraction of the smaller
     *        height) for two tokens to share a line
     */
    static std::vector<TextToken> orderTokens(std::vector<TextToken> tokens,
                                              float lineOverlapRatio = 0.5f);

    /**
     * @brief Sequence indices strictly increasing and page indices non-decreasing
     */
    static bool isValidSequence(const std::vector<OrderedRegion>& sequence);

    static bool shareBand(const Box& a, const Box& b, float threshold);

    /**
     * @brief Regions sharing a band with two regions that do not share one
     *        (a full-width title over two columns); these never link bands
     */
    std::vector<size_t> findSpanningRegions(const std::vector<Region>& regions,
                                            const std::vector<size_t>& candidates) const;

private:
    ReadingOrderConfig config_;
};

} // namespace docrecon
