#include "ordering/reading_order.h"
#include "common/logger.hpp"
#include <algorithm>
#include <cstddef>
#include <numeric>

namespace docrecon {

namespace {

// top, then left, then detection index
bool TopLeftBefore(const Region& a, const Region& b) {
    if (a.box.top != b.box.top) return a.box.top < b.box.top;
    if (a.box.left != b.box.left) return a.box.left < b.box.left;
    return a.detectionIndex < b.detectionIndex;
}

size_t FindRoot(std::vector<size_t>& parent, size_t i) {
    while (parent[i] != i) {
        parent[i] = parent[parent[i]];
        i = parent[i];
    }
    return i;
}

} // namespace

// ==================== ReadingOrderConfig ====================

void ReadingOrderConfig::Show() const {
    LOG_INFO("  Column Overlap Threshold: %.2f", columnOverlapThreshold);
}

bool ReadingOrderConfig::Validate(std::string& error_msg) const {
    if (!(columnOverlapThreshold >= 0.0f && columnOverlapThreshold <= 1.0f)) {
        error_msg = "columnOverlapThreshold must be in [0, 1]";
        return false;
    }
    return true;
}

// ==================== ReadingOrderResolver ====================

ReadingOrderResolver::ReadingOrderResolver(const ReadingOrderConfig& config)
    : config_(config) {
}

bool ReadingOrderResolver::shareBand(const Box& a, const Box& b, float threshold) {
    float overlap = std::min(a.right, b.right) - std::max(a.left, b.left);
    float narrower = std::min(a.width(), b.width());

    if (narrower <= 0.0f) {
        // A zero-width region joins the band whose span contains it
        return overlap >= 0.0f;
    }
    return overlap > threshold * narrower;
}

std::vector<std::vector<size_t>> ReadingOrderResolver::detectBands(
        const std::vector<Region>& regions,
        const std::vector<size_t>& candidates) const {
    const size_t n = candidates.size();
    std::vector<size_t> parent(n);
    std::iota(parent.begin(), parent.end(), 0);

    for (size_t i = 0; i < n; ++i) {
        for (size_t j = i + 1; j < n; ++j) {
            if (shareBand(regions[candidates[i]].box, regions[candidates[j]].box,
                          config_.columnOverlapThreshold)) {
                size_t ri = FindRoot(parent, i);
                size_t rj = FindRoot(parent, j);
                if (ri != rj) parent[rj] = ri;
            }
        }
    }

    std::vector<std::vector<size_t>> bands;
    std::vector<int> bandOfRoot(n, -1);
    for (size_t i = 0; i < n; ++i) {
        size_t root = FindRoot(parent, i);
        if (bandOfRoot[root] < 0) {
            bandOfRoot[root] = static_cast<int>(bands.size());
            bands.emplace_back();
        }
        bands[bandOfRoot[root]].push_back(candidates[i]);
    }

    for (auto& band : bands) {
        std::stable_sort(band.begin(), band.end(), [&regions](size_t a, size_t b) {
            return TopLeftBefore(regions[a], regions[b]);
        });
    }

    // Band key: leftmost x, then topmost y, then smallest detection index
    struct BandKey {
        float left;
        float top;
        int detIndex;
    };
    std::vector<BandKey> keys;
    keys.reserve(bands.size());
    for (const auto& band : bands) {
        BandKey key{regions[band[0]].box.left, regions[band[0]].box.top, regions[band[0]].detectionIndex};
        for (size_t idx : band) {
            key.left = std::min(key.left, regions[idx].box.left);
            key.top = std::min(key.top, regions[idx].box.top);
            key.detIndex = std::min(key.detIndex, regions[idx].detectionIndex);
        }
        keys.push_back(key);
    }

    std::vector<size_t> order(bands.size());
    std::iota(order.begin(), order.end(), 0);
    std::stable_sort(order.begin(), order.end(), [&keys](size_t a, size_t b) {
        if (keys[a].left != keys[b].left) return keys[a].left < keys[b].left;
        if (keys[a].top != keys[b].top) return keys[a].top < keys[b].top;
        return keys[a].detIndex < keys[b].detIndex;
    });

    std::vector<std::vector<size_t>> sorted;
    sorted.reserve(bands.size());
    for (size_t idx : order) {
        sorted.push_back(std::move(bands[idx]));
    }
    return sorted;
}

std::vector<size_t> ReadingOrderResolver::findSpanningRegions(const std::vector<Region>& regions,
                                                              const std::vector<size_t>& candidates) const {
    const float threshold = config_.columnOverlapThreshold;
    std::vector<size_t> spanning;

    for (size_t i : candidates) {
        std::vector<size_t> linked;
        for (size_t j : candidates) {
            if (j != i && shareBand(regions[i].box, regions[j].box, threshold)) {
                linked.push_back(j);
            }
        }

        // i bridges two regions that are not in one band themselves
        bool bridges = false;
        for (size_t a = 0; a < linked.size() && !bridges; ++a) {
            for (size_t b = a + 1; b < linked.size(); ++b) {
                if (!shareBand(regions[linked[a]].box, regions[linked[b]].box, threshold)) {
                    bridges = true;
                    break;
                }
            }
        }
        if (bridges) {
            spanning.push_back(i);
        }
    }
    return spanning;
}

std::vector<size_t> ReadingOrderResolver::orderPage(const std::vector<Region>& regions) const {
    std::vector<size_t> headers, footers, body;
    for (size_t i = 0; i < regions.size(); ++i) {
        switch (regions[i].cls) {
            case RegionClass::PageHeader: headers.push_back(i); break;
            case RegionClass::PageFooter: footers.push_back(i); break;
            default: body.push_back(i); break;
        }
    }

    auto byTopLeft = [&regions](size_t a, size_t b) {
        return TopLeftBefore(regions[a], regions[b]);
    };
    std::stable_sort(headers.begin(), headers.end(), byTopLeft);
    std::stable_sort(footers.begin(), footers.end(), byTopLeft);

    std::vector<size_t> order;
    order.reserve(regions.size());
    order.insert(order.end(), headers.begin(), headers.end());

    // Spanning regions cut the body into vertical segments, each banded on its own
    std::vector<size_t> spanning = findSpanningRegions(regions, body);
    std::stable_sort(spanning.begin(), spanning.end(), byTopLeft);

    std::vector<size_t> columns;
    for (size_t idx : body) {
        if (std::find(spanning.begin(), spanning.end(), idx) == spanning.end()) {
            columns.push_back(idx);
        }
    }
    std::stable_sort(columns.begin(), columns.end(), byTopLeft);

    size_t bandCount = 0;
    auto emitSegment = [&](const std::vector<size_t>& segment) {
        auto bands = detectBands(regions, segment);
        bandCount += bands.size();
        for (const auto& band : bands) {
            order.insert(order.end(), band.begin(), band.end());
        }
    };

    size_t next = 0;
    for (size_t cut : spanning) {
        std::vector<size_t> segment;
        while (next < columns.size() && byTopLeft(columns[next], cut)) {
            segment.push_back(columns[next++]);
        }
        emitSegment(segment);
        order.push_back(cut);
    }
    emitSegment(std::vector<size_t>(columns.begin() + static_cast<std::ptrdiff_t>(next), columns.end()));

    order.insert(order.end(), footers.begin(), footers.end());

    LOG_TRACE("Ordered %zu regions: %zu header(s), %zu spanning, %zu band(s), %zu footer(s)",
              regions.size(), headers.size(), spanning.size(), bandCount, footers.size());
    return order;
}

std::vector<OrderedRegion> ReadingOrderResolver::resolveDocument(std::vector<PageResult> pages) const {
    std::stable_sort(pages.begin(), pages.end(), [](const PageResult& a, const PageResult& b) {
        return a.pageIndex < b.pageIndex;
    });

    std::vector<OrderedRegion> sequence;
    int nextIndex = 0;

    for (auto& page : pages) {
        std::vector<Region> regions;
        regions.reserve(page.regions.size());
        for (const auto& resolved : page.regions) {
            regions.push_back(resolved.region);
        }

        for (size_t idx : orderPage(regions)) {
            sequence.emplace_back(std::move(page.regions[idx]), nextIndex++);
        }
    }

    LOG_DEBUG("Reading order: %zu regions across %zu page(s)", sequence.size(), pages.size());
    return sequence;
}

std::vector<TextToken> ReadingOrderResolver::orderTokens(std::vector<TextToken> tokens,
                                                         float lineOverlapRatio) {
    if (tokens.size() <= 1) {
        return tokens;
    }

    std::stable_sort(tokens.begin(), tokens.end(), [](const TextToken& a, const TextToken& b) {
        if (a.box.centerY() != b.box.centerY()) return a.box.centerY() < b.box.centerY();
        return a.box.left < b.box.left;
    });

    struct Line {
        float top;
        float bottom;
        std::vector<TextToken> tokens;
    };
    std::vector<Line> lines;

    for (auto& token : tokens) {
        if (!lines.empty()) {
            Line& line = lines.back();
            float overlap = std::min(line.bottom, token.box.bottom) - std::max(line.top, token.box.top);
            float minHeight = std::min(line.bottom - line.top, token.box.height());
            if (minHeight > 0.0f && overlap >= lineOverlapRatio * minHeight) {
                line.top = std::min(line.top, token.box.top);
                line.bottom = std::max(line.bottom, token.box.bottom);
                line.tokens.push_back(std::move(token));
                continue;
            }
        }
        Line line{token.box.top, token.box.bottom, {}};
        line.tokens.push_back(std::move(token));
        lines.push_back(std::move(line));
    }

    std::vector<TextToken> ordered;
    ordered.reserve(tokens.size());
    for (auto& line : lines) {
        std::stable_sort(line.tokens.begin(), line.tokens.end(), [](const TextToken& a, const TextToken& b) {
            return a.box.left < b.box.left;
        });
        for (auto& token : line.tokens) {
            ordered.push_back(std::move(token));
        }
    }
    return ordered;
}

bool ReadingOrderResolver::isValidSequence(const std::vector<OrderedRegion>& sequence) {
    for (size_t i = 0; i + 1 < sequence.size(); ++i) {
        if (sequence[i].sequenceIndex >= sequence[i + 1].sequenceIndex) {
            return false;
        }
        if (sequence[i].region.pageIndex > sequence[i + 1].region.pageIndex) {
            return false;
        }
    }
    return true;
}

} // namespace docrecon
