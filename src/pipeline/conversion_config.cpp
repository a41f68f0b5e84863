#include "pipeline/document_pipeline.h"
#include "common/logger.hpp"
#include <fstream>
#include <initializer_list>

using json = nlohmann::json;

namespace docrecon {

namespace {

std::string KeyPath(const std::string& section, const std::string& key) {
    return section.empty() ? key : section + "." + key;
}

void WarnUnknownKeys(const json& obj, const std::string& section,
                     std::initializer_list<const char*> known) {
    for (auto it = obj.begin(); it != obj.end(); ++it) {
        bool found = false;
        for (const char* key : known) {
            if (it.key() == key) {
                found = true;
                break;
            }
        }
        if (!found) {
            LOG_WARN("Ignoring unknown config key '%s'", KeyPath(section, it.key()).c_str());
        }
    }
}

bool ReadFloat(const json& obj, const std::string& section, const char* key,
               float& out, std::string& error_msg) {
    auto it = obj.find(key);
    if (it == obj.end()) return true;
    if (!it->is_number()) {
        error_msg = KeyPath(section, key) + " must be a number";
        return false;
    }
    out = it->get<float>();
    return true;
}

bool ReadInt(const json& obj, const std::string& section, const char* key,
             int& out, std::string& error_msg) {
    auto it = obj.find(key);
    if (it == obj.end()) return true;
    if (!it->is_number_integer()) {
        error_msg = KeyPath(section, key) + " must be an integer";
        return false;
    }
    out = it->get<int>();
    return true;
}

bool ReadBool(const json& obj, const std::string& section, const char* key,
              bool& out, std::string& error_msg) {
    auto it = obj.find(key);
    if (it == obj.end()) return true;
    if (!it->is_boolean()) {
        error_msg = KeyPath(section, key) + " must be a boolean";
        return false;
    }
    out = it->get<bool>();
    return true;
}

// Section object, or nullptr when absent
const json* Section(const json& j, const char* name, std::string& error_msg, bool& ok) {
    auto it = j.find(name);
    if (it == j.end()) return nullptr;
    if (!it->is_object()) {
        error_msg = std::string(name) + " must be an object";
        ok = false;
        return nullptr;
    }
    return &(*it);
}

bool ParsePolicy(const std::string& text, UnknownLabelPolicy& policy) {
    for (auto candidate : {UnknownLabelPolicy::Abort, UnknownLabelPolicy::MapToText, UnknownLabelPolicy::Drop}) {
        if (text == ToString(candidate)) {
            policy = candidate;
            return true;
        }
    }
    return false;
}

} // namespace

// ==================== DocumentLimits ====================

void DocumentLimits::Show() const {
    if (maxNumPages > 0) {
        LOG_INFO("  Max Pages: %d", maxNumPages);
    } else {
        LOG_INFO("  Max Pages: unlimited");
    }
}

bool DocumentLimits::Validate(std::string& error_msg) const {
    if (maxNumPages < 0) {
        error_msg = "maxNumPages must be >= 0";
        return false;
    }
    return true;
}

// ==================== ConversionConfig ====================

void ConversionConfig::Show() const {
    LOG_INFO("========== Document Pipeline Configuration ==========");
    LOG_INFO("Region Classifier Config:");
    classifierConfig.Show();
    LOG_INFO("Text Merger Config:");
    mergerConfig.Show();
    LOG_INFO("Table Assembler Config:");
    tableConfig.Show();
    LOG_INFO("Reading Order Config:");
    orderConfig.Show();
    LOG_INFO("Tree Builder Config:");
    treeConfig.Show();
    LOG_INFO("Document Limits:");
    limits.Show();
    LOG_INFO("Pipeline Config:");
    LOG_INFO("  Threads: %d%s", numThreads, numThreads == 0 ? " (auto)" : "");
    LOG_INFO("  Use OCR: %s", useOcr ? "true" : "false");
    LOG_INFO("=====================================================");
}

bool ConversionConfig::Validate(std::string& error_msg) const {
    if (!classifierConfig.Validate(error_msg)) return false;
    if (!mergerConfig.Validate(error_msg)) return false;
    if (!tableConfig.Validate(error_msg)) return false;
    if (!orderConfig.Validate(error_msg)) return false;
    if (!treeConfig.Validate(error_msg)) return false;
    if (!limits.Validate(error_msg)) return false;
    if (numThreads < 0) {
        error_msg = "numThreads must be >= 0";
        return false;
    }
    return true;
}

bool ConversionConfig::LoadFromJson(const json& j, ConversionConfig& config, std::string& error_msg) {
    if (!j.is_object()) {
        error_msg = "config root must be a JSON object";
        return false;
    }

    ConversionConfig loaded = config;
    bool ok = true;

    WarnUnknownKeys(j, "", {"classifier", "textMerger", "table", "readingOrder",
                            "treeBuilder", "limits", "numThreads", "useOcr"});

    if (const json* s = Section(j, "classifier", error_msg, ok)) {
        WarnUnknownKeys(*s, "classifier", {"minRegionConfidence", "unknownLabelPolicy"});
        if (!ReadFloat(*s, "classifier", "minRegionConfidence",
                       loaded.classifierConfig.minRegionConfidence, error_msg)) return false;
        auto it = s->find("unknownLabelPolicy");
        if (it != s->end()) {
            if (!it->is_string() ||
                !ParsePolicy(it->get<std::string>(), loaded.classifierConfig.unknownLabelPolicy)) {
                error_msg = "classifier.unknownLabelPolicy must be one of abort, map_to_text, drop";
                return false;
            }
        }
    }
    if (!ok) return false;

    if (const json* s = Section(j, "textMerger", error_msg, ok)) {
        WarnUnknownKeys(*s, "textMerger", {"spanOverlapThreshold", "nativeCoverageThreshold", "lineOverlapRatio"});
        if (!ReadFloat(*s, "textMerger", "spanOverlapThreshold",
                       loaded.mergerConfig.spanOverlapThreshold, error_msg)) return false;
        if (!ReadFloat(*s, "textMerger", "nativeCoverageThreshold",
                       loaded.mergerConfig.nativeCoverageThreshold, error_msg)) return false;
        if (!ReadFloat(*s, "textMerger", "lineOverlapRatio",
                       loaded.mergerConfig.lineOverlapRatio, error_msg)) return false;
    }
    if (!ok) return false;

    if (const json* s = Section(j, "table", error_msg, ok)) {
        WarnUnknownKeys(*s, "table", {"cellOverlapThreshold", "maxGridCells"});
        if (!ReadFloat(*s, "table", "cellOverlapThreshold",
                       loaded.tableConfig.cellOverlapThreshold, error_msg)) return false;
        if (!ReadInt(*s, "table", "maxGridCells", loaded.tableConfig.maxGridCells, error_msg)) return false;
    }
    if (!ok) return false;

    if (const json* s = Section(j, "readingOrder", error_msg, ok)) {
        WarnUnknownKeys(*s, "readingOrder", {"columnOverlapThreshold"});
        if (!ReadFloat(*s, "readingOrder", "columnOverlapThreshold",
                       loaded.orderConfig.columnOverlapThreshold, error_msg)) return false;
    }
    if (!ok) return false;

    if (const json* s = Section(j, "treeBuilder", error_msg, ok)) {
        WarnUnknownKeys(*s, "treeBuilder", {"maxHeadingLevel", "headingStrategy", "fontSizeBreakpoints"});
        if (!ReadInt(*s, "treeBuilder", "maxHeadingLevel",
                     loaded.treeConfig.maxHeadingLevel, error_msg)) return false;

        auto it = s->find("headingStrategy");
        if (it != s->end()) {
            std::string strategy = it->is_string() ? it->get<std::string>() : "";
            if (strategy == "default") {
                loaded.treeConfig.headingLevel = DefaultHeadingLevel;
            } else if (strategy == "font_size") {
                auto bp = s->find("fontSizeBreakpoints");
                if (bp == s->end() || !bp->is_array() || bp->empty()) {
                    error_msg = "treeBuilder.fontSizeBreakpoints must be a non-empty array for font_size";
                    return false;
                }
                std::vector<float> breakpoints;
                for (const auto& value : *bp) {
                    if (!value.is_number()) {
                        error_msg = "treeBuilder.fontSizeBreakpoints must contain numbers";
                        return false;
                    }
                    breakpoints.push_back(value.get<float>());
                }
                loaded.treeConfig.headingLevel = MakeFontSizeHeadingLevelStrategy(std::move(breakpoints));
            } else {
                error_msg = "treeBuilder.headingStrategy must be one of default, font_size";
                return false;
            }
        }
    }
    if (!ok) return false;

    if (const json* s = Section(j, "limits", error_msg, ok)) {
        WarnUnknownKeys(*s, "limits", {"maxNumPages"});
        if (!ReadInt(*s, "limits", "maxNumPages", loaded.limits.maxNumPages, error_msg)) return false;
    }
    if (!ok) return false;

    if (!ReadInt(j, "", "numThreads", loaded.numThreads, error_msg)) return false;
    if (!ReadBool(j, "", "useOcr", loaded.useOcr, error_msg)) return false;

    if (!loaded.Validate(error_msg)) {
        return false;
    }

    config = std::move(loaded);
    return true;
}

bool ConversionConfig::LoadFromFile(const std::string& path, ConversionConfig& config, std::string& error_msg) {
    std::ifstream ifs(path);
    if (!ifs.is_open()) {
        error_msg = "Failed to open config file: " + path;
        return false;
    }

    json j;
    try {
        j = json::parse(ifs);
    } catch (const json::exception& e) {
        error_msg = "Failed to parse config file " + path + ": " + e.what();
        return false;
    }

    if (!LoadFromJson(j, config, error_msg)) {
        return false;
    }
    LOG_INFO("Config loaded from: %s", path.c_str());
    return true;
}

} // namespace docrecon
