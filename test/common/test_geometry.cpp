/**
 * @file test_geometry.cpp
 * @brief Box geometry and coordinate-space normalization tests
 */

#include <gtest/gtest.h>
#include "common/geometry.h"
#include <cmath>

using namespace docrecon;

namespace {

PageDims MakeDims(float w, float h, float mw, float mh) {
    PageDims dims;
    dims.width = w;
    dims.height = h;
    dims.modelWidth = mw;
    dims.modelHeight = mh;
    return dims;
}

void ExpectBoxNear(const Box& actual, const Box& expected, float tol = 1e-3f) {
    EXPECT_NEAR(actual.left, expected.left, tol);
    EXPECT_NEAR(actual.top, expected.top, tol);
    EXPECT_NEAR(actual.right, expected.right, tol);
    EXPECT_NEAR(actual.bottom, expected.bottom, tol);
}

} // namespace

// ==================== Predicates ====================

TEST(Geometry, IntersectsRequiresPositiveArea) {
    Box a(0, 0, 10, 10);
    EXPECT_TRUE(Geometry::intersects(a, Box(5, 5, 15, 15)));
    EXPECT_FALSE(Geometry::intersects(a, Box(10, 0, 20, 10)));   // touching edge
    EXPECT_FALSE(Geometry::intersects(a, Box(20, 20, 30, 30)));
}

TEST(Geometry, OverlapRatioUsesSmallerBox) {
    Box big(0, 0, 100, 100);
    Box small(10, 10, 20, 20);
    EXPECT_FLOAT_EQ(Geometry::overlapRatio(big, small), 1.0f);
    EXPECT_FLOAT_EQ(Geometry::overlapRatio(small, big), 1.0f);

    Box half(50, 0, 150, 100);
    EXPECT_FLOAT_EQ(Geometry::overlapRatio(big, half), 0.5f);

    EXPECT_FLOAT_EQ(Geometry::overlapRatio(big, Box(200, 200, 300, 300)), 0.0f);
    EXPECT_FLOAT_EQ(Geometry::overlapRatio(big, Box(5, 5, 5, 50)), 0.0f);   // zero area
}

TEST(Geometry, ContainsAndUnite) {
    Box a(0, 0, 10, 10);
    EXPECT_TRUE(Geometry::contains(a, Box(2, 2, 8, 8)));
    EXPECT_TRUE(Geometry::contains(a, a));
    EXPECT_FALSE(Geometry::contains(a, Box(5, 5, 11, 8)));

    Box u = Geometry::unite(a, Box(20, -5, 30, 5));
    ExpectBoxNear(u, Box(0, -5, 30, 10));
}

TEST(Geometry, ClipDisjointIsEmpty) {
    Box clipped = Geometry::clip(Box(5, 5, 15, 15), Box(0, 0, 10, 10));
    ExpectBoxNear(clipped, Box(5, 5, 10, 10));

    Box none = Geometry::clip(Box(20, 20, 30, 30), Box(0, 0, 10, 10));
    EXPECT_TRUE(none.isEmpty());
}

TEST(Geometry, UnionAreaCountsOverlapOnce) {
    std::vector<Box> boxes = {Box(0, 0, 10, 10), Box(5, 5, 15, 15)};
    EXPECT_NEAR(Geometry::unionArea(boxes), 175.0f, 1e-3f);

    boxes.push_back(Box(2, 2, 4, 4));   // fully inside the first
    EXPECT_NEAR(Geometry::unionArea(boxes), 175.0f, 1e-3f);

    EXPECT_FLOAT_EQ(Geometry::unionArea({}), 0.0f);
}

// ==================== normalize ====================

/**
 * @brief normalize with equal source and target space returns the box unchanged
 */
TEST(Geometry, NormalizeIsIdempotentForSameSpace) {
    PageDims dims = MakeDims(612, 792, 1224, 1584);
    const std::vector<Box> boxes = {
        Box(0, 0, 0, 0), Box(10.5f, 20.25f, 300, 400), Box(-5, -5, 1000, 2000)
    };

    for (CoordSpace space : {CoordSpace::Page, CoordSpace::Model, CoordSpace::Normalized}) {
        for (int rotation : {0, 90, 180, 270}) {
            for (const auto& box : boxes) {
                Box once = Geometry::normalize(box, space, space, dims, rotation);
                Box twice = Geometry::normalize(once, space, space, dims, rotation);
                ExpectBoxNear(once, box, 0.0f);
                ExpectBoxNear(twice, once, 0.0f);
                EXPECT_EQ(once.space, space);
            }
        }
    }
}

TEST(Geometry, NormalizeModelToPageScales) {
    PageDims dims = MakeDims(612, 792, 1224, 1584);
    Box model(122.4f, 158.4f, 612, 792, CoordSpace::Model);

    Box page = Geometry::normalize(model, CoordSpace::Model, CoordSpace::Page, dims, 0);
    ExpectBoxNear(page, Box(61.2f, 79.2f, 306, 396));
    EXPECT_EQ(page.space, CoordSpace::Page);

    Box norm = Geometry::normalize(model, CoordSpace::Model, CoordSpace::Normalized, dims, 0);
    ExpectBoxNear(norm, Box(0.1f, 0.1f, 0.5f, 0.5f));
}

/**
 * @brief A raster rotated 90 degrees clockwise: the reading-space top-left
 *        corner sits at the raster's top-right
 */
TEST(Geometry, NormalizeUndoesRotation90) {
    PageDims dims = MakeDims(100, 200, 200, 100);   // raster is 200 wide, 100 high
    Box model(180, 0, 200, 10, CoordSpace::Model);

    Box page = Geometry::toSpace(model, CoordSpace::Page, dims, 90);
    ExpectBoxNear(page, Box(0, 0, 10, 20));
}

TEST(Geometry, NormalizeUndoesRotation180And270) {
    PageDims dims = MakeDims(100, 200, 100, 200);
    Box model(90, 180, 100, 200, CoordSpace::Model);
    ExpectBoxNear(Geometry::toSpace(model, CoordSpace::Page, dims, 180), Box(0, 0, 10, 20));

    PageDims rotated = MakeDims(100, 200, 200, 100);
    Box bottomLeft(0, 90, 20, 100, CoordSpace::Model);
    ExpectBoxNear(Geometry::toSpace(bottomLeft, CoordSpace::Page, rotated, 270), Box(0, 0, 10, 20));
}

TEST(Geometry, PageModelRoundTripUnderRotation) {
    PageDims dims = MakeDims(612, 792, 1584, 1224);
    Box page(50, 100, 300, 140);

    for (int rotation : {90, 270}) {
        Box model = Geometry::toSpace(page, CoordSpace::Model, dims, rotation);
        EXPECT_EQ(model.space, CoordSpace::Model);
        ExpectBoxNear(Geometry::toSpace(model, CoordSpace::Page, dims, rotation), page, 1e-2f);
    }
}

TEST(Geometry, NormalizeRejectsMalformedBox) {
    PageDims dims = MakeDims(100, 100, 100, 100);
    EXPECT_THROW(Geometry::normalize(Box(10, 0, 5, 10), CoordSpace::Page, CoordSpace::Normalized, dims, 0),
                 InvalidBoxError);
    EXPECT_THROW(Geometry::normalize(Box(0, 10, 5, 0), CoordSpace::Page, CoordSpace::Page, dims, 0),
                 InvalidBoxError);
    EXPECT_THROW(Geometry::normalize(Box(0, 0, NAN, 5), CoordSpace::Model, CoordSpace::Page, dims, 0),
                 InvalidBoxError);
}

TEST(Geometry, NormalizeRejectsBadRotationAndDims) {
    PageDims dims = MakeDims(100, 100, 100, 100);
    EXPECT_THROW(Geometry::normalize(Box(0, 0, 5, 5), CoordSpace::Model, CoordSpace::Page, dims, 45),
                 InvalidBoxError);

    PageDims noRaster = MakeDims(100, 100, 0, 0);
    EXPECT_THROW(Geometry::normalize(Box(0, 0, 5, 5), CoordSpace::Model, CoordSpace::Page, noRaster, 0),
                 InvalidBoxError);
}

TEST(Geometry, BottomLeftOriginFlipsVertically) {
    Box flipped = Geometry::toBottomLeftOrigin(Box(10, 20, 30, 50), 100);
    ExpectBoxNear(flipped, Box(10, 50, 30, 80));
}

TEST(Geometry, RectBridge) {
    Box box(1, 2, 11, 22, CoordSpace::Model);
    cv::Rect2f rect = Geometry::toRect(box);
    EXPECT_FLOAT_EQ(rect.width, 10.0f);
    EXPECT_FLOAT_EQ(rect.height, 20.0f);

    Box back = Geometry::fromRect(rect, CoordSpace::Model);
    ExpectBoxNear(back, box, 0.0f);
    EXPECT_EQ(back.space, CoordSpace::Model);
}
