#include "common/geometry.h"
#include <algorithm>
#include <cmath>
#include <utility>

namespace docrecon {

namespace {

bool IsSupportedRotation(int rotation) {
    return rotation == 0 || rotation == 90 || rotation == 180 || rotation == 270;
}

// Raster size seen in reading orientation
std::pair<float, float> ReadingRasterSize(const PageDims& dims, int rotation) {
    if (rotation == 90 || rotation == 270) {
        return {dims.modelHeight, dims.modelWidth};
    }
    return {dims.modelWidth, dims.modelHeight};
}

cv::Point2f ModelPointToPage(const cv::Point2f& pt, const PageDims& dims, int rotation) {
    const float W = dims.modelWidth;
    const float H = dims.modelHeight;

    // Undo the clockwise rotation of the raster
    float u = pt.x, v = pt.y;
    switch (rotation) {
        case 90:  u = pt.y;     v = W - pt.x; break;
        case 180: u = W - pt.x; v = H - pt.y; break;
        case 270: u = H - pt.y; v = pt.x;     break;
        default: break;
    }

    auto [rw, rh] = ReadingRasterSize(dims, rotation);
    return cv::Point2f(u * dims.width / rw, v * dims.height / rh);
}

cv::Point2f PagePointToModel(const cv::Point2f& pt, const PageDims& dims, int rotation) {
    const float W = dims.modelWidth;
    const float H = dims.modelHeight;

    auto [rw, rh] = ReadingRasterSize(dims, rotation);
    float u = pt.x * rw / dims.width;
    float v = pt.y * rh / dims.height;

    switch (rotation) {
        case 90:  return cv::Point2f(W - v, u);
        case 180: return cv::Point2f(W - u, H - v);
        case 270: return cv::Point2f(v, H - u);
        default:  return cv::Point2f(u, v);
    }
}

Box BoxFromCorners(const cv::Point2f& p1, const cv::Point2f& p2, CoordSpace space) {
    return Box(std::min(p1.x, p2.x), std::min(p1.y, p2.y),
               std::max(p1.x, p2.x), std::max(p1.y, p2.y), space);
}

void RequirePageSize(const PageDims& dims) {
    if (!(dims.width > 0.0f) || !(dims.height > 0.0f)) {
        throw InvalidBoxError("Page dimensions must be positive for normalization");
    }
}

void RequireModelSize(const PageDims& dims) {
    RequirePageSize(dims);
    if (!(dims.modelWidth > 0.0f) || !(dims.modelHeight > 0.0f)) {
        throw InvalidBoxError("Model raster dimensions must be positive for normalization");
    }
}

Box ToPageSpace(const Box& box, CoordSpace source, const PageDims& dims, int rotation) {
    switch (source) {
        case CoordSpace::Page:
            return Box(box.left, box.top, box.right, box.bottom, CoordSpace::Page);
        case CoordSpace::Normalized:
            RequirePageSize(dims);
            return Box(box.left * dims.width, box.top * dims.height,
                       box.right * dims.width, box.bottom * dims.height, CoordSpace::Page);
        case CoordSpace::Model: {
            RequireModelSize(dims);
            cv::Point2f p1 = ModelPointToPage(cv::Point2f(box.left, box.top), dims, rotation);
            cv::Point2f p2 = ModelPointToPage(cv::Point2f(box.right, box.bottom), dims, rotation);
            return BoxFromCorners(p1, p2, CoordSpace::Page);
        }
    }
    return box;
}

Box FromPageSpace(const Box& page, CoordSpace target, const PageDims& dims, int rotation) {
    switch (target) {
        case CoordSpace::Page:
            return page;
        case CoordSpace::Normalized:
            RequirePageSize(dims);
            return Box(page.left / dims.width, page.top / dims.height,
                       page.right / dims.width, page.bottom / dims.height, CoordSpace::Normalized);
        case CoordSpace::Model: {
            RequireModelSize(dims);
            cv::Point2f p1 = PagePointToModel(cv::Point2f(page.left, page.top), dims, rotation);
            cv::Point2f p2 = PagePointToModel(cv::Point2f(page.right, page.bottom), dims, rotation);
            return BoxFromCorners(p1, p2, CoordSpace::Model);
        }
    }
    return page;
}

} // namespace

cv::Rect2f Geometry::toRect(const Box& box) {
    return cv::Rect2f(box.left, box.top, box.width(), box.height());
}

Box Geometry::fromRect(const cv::Rect2f& rect, CoordSpace space) {
    return Box(rect.x, rect.y, rect.x + rect.width, rect.y + rect.height, space);
}

void Geometry::validate(const Box& box) {
    if (!box.isWellFormed()) {
        throw InvalidBoxError("Malformed box " + box.toString());
    }
}

bool Geometry::intersects(const Box& a, const Box& b) {
    cv::Rect2f inter = toRect(a) & toRect(b);
    return inter.area() > 0.0f;
}

float Geometry::overlapRatio(const Box& a, const Box& b) {
    float smaller = std::min(a.area(), b.area());
    if (smaller <= 0.0f) {
        return 0.0f;
    }

    cv::Rect2f inter = toRect(a) & toRect(b);
    float ratio = inter.area() / smaller;
    return std::clamp(ratio, 0.0f, 1.0f);
}

bool Geometry::contains(const Box& a, const Box& b) {
    return b.left >= a.left && b.top >= a.top &&
           b.right <= a.right && b.bottom <= a.bottom;
}

Box Geometry::unite(const Box& a, const Box& b) {
    return Box(std::min(a.left, b.left), std::min(a.top, b.top),
               std::max(a.right, b.right), std::max(a.bottom, b.bottom), a.space);
}

Box Geometry::clip(const Box& box, const Box& bounds) {
    cv::Rect2f inter = toRect(box) & toRect(bounds);
    if (inter.area() <= 0.0f) {
        return Box(box.left, box.top, box.left, box.top, box.space);
    }
    return fromRect(inter, box.space);
}

float Geometry::unionArea(const std::vector<Box>& boxes) {
    std::vector<float> xs;
    xs.reserve(boxes.size() * 2);
    for (const auto& box : boxes) {
        if (box.isEmpty()) continue;
        xs.push_back(box.left);
        xs.push_back(box.right);
    }
    if (xs.empty()) {
        return 0.0f;
    }

    std::sort(xs.begin(), xs.end());
    xs.erase(std::unique(xs.begin(), xs.end()), xs.end());

    // Sweep x slabs, merge covered y intervals in each slab
    double total = 0.0;
    std::vector<std::pair<float, float>> spans;
    for (size_t i = 0; i + 1 < xs.size(); ++i) {
        float x0 = xs[i], x1 = xs[i + 1];
        spans.clear();
        for (const auto& box : boxes) {
            if (box.isEmpty()) continue;
            if (box.left <= x0 && box.right >= x1) {
                spans.emplace_back(box.top, box.bottom);
            }
        }
        if (spans.empty()) continue;

        std::sort(spans.begin(), spans.end());
        double covered = 0.0;
        float cur_start = spans[0].first, cur_end = spans[0].second;
        for (size_t j = 1; j < spans.size(); ++j) {
            if (spans[j].first <= cur_end) {
                cur_end = std::max(cur_end, spans[j].second);
            } else {
                covered += cur_end - cur_start;
                cur_start = spans[j].first;
                cur_end = spans[j].second;
            }
        }
        covered += cur_end - cur_start;
        total += covered * (x1 - x0);
    }
    return static_cast<float>(total);
}

Box Geometry::normalize(const Box& box, CoordSpace sourceSpace, CoordSpace targetSpace,
                        const PageDims& pageDims, int rotation) {
    validate(box);

    if (sourceSpace == targetSpace) {
        Box same = box;
        same.space = targetSpace;
        return same;
    }

    if (!IsSupportedRotation(rotation)) {
        throw InvalidBoxError("Unsupported page rotation " + std::to_string(rotation));
    }

    Box page = ToPageSpace(box, sourceSpace, pageDims, rotation);
    Box result = FromPageSpace(page, targetSpace, pageDims, rotation);
    validate(result);
    return result;
}

Box Geometry::toSpace(const Box& box, CoordSpace targetSpace,
                      const PageDims& pageDims, int rotation) {
    return normalize(box, box.space, targetSpace, pageDims, rotation);
}

Box Geometry::toBottomLeftOrigin(const Box& box, float pageHeight) {
    return Box(box.left, pageHeight - box.bottom, box.right, pageHeight - box.top, box.space);
}

} // namespace docrecon
