#pragma once

#include "common/types.hpp"
#include <opencv2/opencv.hpp>
#include <vector>

namespace docrecon {

/**
 * @brief Box geometry and coordinate-space utilities
 *
 * All functions are pure. Boxes are compared regardless of their space tag;
 * callers normalize first.
 */
class Geometry {
public:
    /**
     * @brief True when the two boxes share a region of positive area
     */
    static bool intersects(const Box& a, const Box& b);

    /**
     * @brief Intersection area divided by the smaller box's area
     * @return value in [0, 1]; 0 when either box has no area
     */
    static float overlapRatio(const Box& a, const Box& b);

    /**
     * @brief True when b lies entirely inside a
     */
    static bool contains(const Box& a, const Box& b);

    /**
     * @brief Smallest box enclosing both (space of a)
     */
    static Box unite(const Box& a, const Box& b);

    /**
     * @brief Intersection of box with bounds; empty box at box's corner when disjoint
     */
    static Box clip(const Box& box, const Box& bounds);

    /**
     * @brief Exact area of the union of the given boxes
     */
    static float unionArea(const std::vector<Box>& boxes);

    /**
     * @brief Converts a box between coordinate spaces
     *
     * Model space is the raster frame: the page reading frame rotated clockwise
     * by `rotation` degrees and scaled to dims.modelWidth x dims.modelHeight.
     * Normalized space is page space divided by the page size. The result is
     * always in unrotated, top-left origin form of the target space.
     *
     * @throws InvalidBoxError for malformed input, unsupported rotation or
     *         degenerate page dimensions
     */
    static Box normalize(const Box& box, CoordSpace sourceSpace, CoordSpace targetSpace,
                         const PageDims& pageDims, int rotation);

    /**
     * @brief Same as normalize() with the box's own space as source
     */
    static Box toSpace(const Box& box, CoordSpace targetSpace,
                       const PageDims& pageDims, int rotation);

    /**
     * @brief Flips a page-space box to bottom-left origin (PDF convention)
     */
    static Box toBottomLeftOrigin(const Box& box, float pageHeight);

    /**
     * @brief Throws InvalidBoxError unless left <= right, top <= bottom and all finite
     */
    static void validate(const Box& box);

    static cv::Rect2f toRect(const Box& box);
    static Box fromRect(const cv::Rect2f& rect, CoordSpace space);
};

} // namespace docrecon
