#include "document/tree_builder.h"
#include "common/logger.hpp"
#include <algorithm>
#include <regex>

namespace docrecon {

// ==================== Heading level strategies ====================

int HeadingNumberingDepth(const std::string& text) {
    static const std::regex pattern("^\\s*(\\d+(\\.\\d+)*)\\.?\\s+\\S");
    std::smatch match;
    if (!std::regex_search(text, match, pattern)) {
        return 0;
    }
    const std::string numbering = match[1].str();
    return 1 + static_cast<int>(std::count(numbering.begin(), numbering.end(), '.'));
}

int DefaultHeadingLevel(const OrderedRegion& region) {
    if (region.region.cls == RegionClass::Title) {
        return 1;
    }
    int depth = HeadingNumberingDepth(region.text);
    return depth > 0 ? 1 + depth : 2;
}

HeadingLevelStrategy MakeFontSizeHeadingLevelStrategy(std::vector<float> breakpoints) {
    std::sort(breakpoints.begin(), breakpoints.end(), std::greater<float>());

    return [breakpoints](const OrderedRegion& region) {
        float fontSize = 0.0f;
        for (const auto& token : region.tokens) {
            fontSize = std::max(fontSize, token.fontSize);
        }
        if (fontSize <= 0.0f) {
            return DefaultHeadingLevel(region);
        }
        int larger = static_cast<int>(std::count_if(breakpoints.begin(), breakpoints.end(),
                                                    [fontSize](float bp) { return bp > fontSize; }));
        return 1 + larger;
    };
}

// ==================== TreeBuilderConfig ====================

void TreeBuilderConfig::Show() const {
    LOG_INFO("  Heading Strategy: %s", headingLevel ? "set" : "none");
    LOG_INFO("  Max Heading Level: %d", maxHeadingLevel);
}

bool TreeBuilderConfig::Validate(std::string& error_msg) const {
    if (!headingLevel) {
        error_msg = "headingLevel strategy must be set";
        return false;
    }
    if (maxHeadingLevel < 1) {
        error_msg = "maxHeadingLevel must be >= 1";
        return false;
    }
    return true;
}

// ==================== DocumentTreeBuilder ====================

DocumentTreeBuilder::DocumentTreeBuilder(const TreeBuilderConfig& config)
    : config_(config) {
}

int DocumentTreeBuilder::headingLevel(const OrderedRegion& region) const {
    int level = config_.headingLevel ? config_.headingLevel(region) : DefaultHeadingLevel(region);
    return std::clamp(level, 1, config_.maxHeadingLevel);
}

DocumentNode DocumentTreeBuilder::makeNode(const OrderedRegion& region) const {
    DocumentNode node;
    node.label = region.region.cls;
    node.text = region.text;
    node.provenance.push_back({region.region.pageIndex, region.region.box});

    switch (region.region.cls) {
        case RegionClass::Title:
        case RegionClass::SectionHeader:
            node.kind = NodeKind::Heading;
            node.level = headingLevel(region);
            break;
        case RegionClass::Table:
            // A table whose structure could not be recognized stays a paragraph
            node.kind = region.table ? NodeKind::Table : NodeKind::Paragraph;
            node.table = region.table;
            break;
        case RegionClass::Figure:
            node.kind = NodeKind::Figure;
            break;
        default:
            node.kind = NodeKind::Paragraph;
            break;
    }
    return node;
}

DocumentNode DocumentTreeBuilder::build(const std::vector<OrderedRegion>& sequence) const {
    DocumentNode root;
    root.kind = NodeKind::Document;

    // Open containers, innermost last. Only the innermost container ever
    // grows, so pointers into its ancestors' children stay valid.
    std::vector<DocumentNode*> open{&root};
    DocumentNode* list = nullptr;
    int headings = 0, lists = 0;

    for (const auto& region : sequence) {
        DocumentNode node = makeNode(region);

        if (region.region.cls == RegionClass::ListItem) {
            if (list == nullptr) {
                DocumentNode group;
                group.kind = NodeKind::List;
                group.label = RegionClass::ListItem;
                open.back()->children.push_back(std::move(group));
                list = &open.back()->children.back();
                lists++;
            }
            list->provenance.push_back(node.provenance.front());
            list->children.push_back(std::move(node));
            continue;
        }
        list = nullptr;

        if (node.kind != NodeKind::Heading) {
            open.back()->children.push_back(std::move(node));
            continue;
        }

        while (open.size() > 1 && open.back()->level >= node.level) {
            open.pop_back();
        }
        open.back()->children.push_back(std::move(node));
        open.push_back(&open.back()->children.back());
        headings++;
    }

    LOG_DEBUG("Document tree: %zu region(s), %d heading(s), %d list(s), %zu node(s)",
              sequence.size(), headings, lists, root.countNodes());
    return root;
}

} // namespace docrecon
