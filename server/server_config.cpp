#include "server_config.h"
#include "common/logger.hpp"

#include <fstream>
#include <stdexcept>

namespace passport_server {

namespace {

template <typename T>
void readValue(const json& j, const char* key, T& target) {
    if (j.contains(key) && !j[key].is_null()) {
        target = j[key].get<T>();
    }
}

void applySegmenter(const json& j, passport::SegmenterConfig& c) {
    readValue(j, "workMaxSide", c.workMaxSide);
    readValue(j, "targetAspect", c.targetAspect);
    readValue(j, "aspectTolerance", c.aspectTolerance);
    readValue(j, "minAreaRatio", c.minAreaRatio);
    readValue(j, "maxAreaRatio", c.maxAreaRatio);
    readValue(j, "minFillRatio", c.minFillRatio);
    readValue(j, "mergeIoU", c.mergeIoU);
    readValue(j, "mergeContainment", c.mergeContainment);
    readValue(j, "maxRegions", c.maxRegions);
    readValue(j, "deskewMinAngle", c.deskewMinAngle);
    readValue(j, "cannyLow", c.cannyLow);
    readValue(j, "cannyHigh", c.cannyHigh);
}

void applyLocator(const json& j, passport::LocatorConfig& c) {
    readValue(j, "widthTolerance", c.widthTolerance);
    readValue(j, "minCharsetRatio", c.minCharsetRatio);
    readValue(j, "minFitScore", c.minFitScore);
    readValue(j, "minLayoutScore", c.minLayoutScore);
    readValue(j, "repairSplitLines", c.repairSplitLines);
}

void applyParser(const json& j, passport::ParserConfig& c) {
    readValue(j, "maxAmbiguousPositions", c.maxAmbiguousPositions);
    if (j.contains("substitutions")) {
        // ["0O", "1I", ...]: each entry is a digit/letter pair
        std::vector<std::pair<char, char>> pairs;
        for (const auto& entry : j["substitutions"]) {
            std::string pair = entry.get<std::string>();
            if (pair.size() != 2) {
                throw std::invalid_argument("substitution pair must be two characters: " + pair);
            }
            pairs.emplace_back(pair[0], pair[1]);
        }
        c.substitutions = passport::SubstitutionTable(pairs);
    }
}

void applyAssembler(const json& j, passport::AssemblerConfig& c) {
    readValue(j, "centuryPivot", c.centuryPivot);
    readValue(j, "minCharConfidence", c.minCharConfidence);
    readValue(j, "thumbnailMaxSide", c.thumbnailMaxSide);
    readValue(j, "thumbnailQuality", c.thumbnailQuality);
    readValue(j, "fullImageMaxSide", c.fullImageMaxSide);
    readValue(j, "fullImageQuality", c.fullImageQuality);
}

void applyEngine(const json& j, passport::DxOcrEngineConfig& c) {
    readValue(j, "detModelPath", c.detModelPath);
    readValue(j, "detInputSize", c.detInputSize);
    readValue(j, "thresh", c.thresh);
    readValue(j, "boxThresh", c.boxThresh);
    readValue(j, "maxCandidates", c.maxCandidates);
    readValue(j, "unclipRatio", c.unclipRatio);
    readValue(j, "dictPath", c.dictPath);
    readValue(j, "recInputHeight", c.recInputHeight);
    readValue(j, "recConfThreshold", c.recConfThreshold);
    readValue(j, "rowOverlap", c.rowOverlap);
    if (j.contains("recModelPaths")) {
        // {"10": "path", "15": "path", ...}
        c.recModelPaths.clear();
        for (const auto& item : j["recModelPaths"].items()) {
            c.recModelPaths[std::stoi(item.key())] = item.value().get<std::string>();
        }
    }
}

} // namespace

void ServerConfig::Show() const {
    LOG_INFO("ServerConfig: port={} threads={} logDir={} logLevel={} maxFiles={}",
             port, threads, logDir, logLevel, maxFilesPerRequest);
    pipeline.Show();
    engine.Show();
    exportOptions.Show();
}

passport::GenderStyle ParseGenderStyle(const std::string& value) {
    if (value.empty() || value == "letter") return passport::GenderStyle::Letter;
    if (value == "thai") return passport::GenderStyle::Thai;
    throw std::invalid_argument("genderStyle must be 'letter' or 'thai', got '" + value + "'");
}

void ApplyConfigJson(const json& j, ServerConfig& config) {
    readValue(j, "port", config.port);
    readValue(j, "threads", config.threads);
    readValue(j, "logDir", config.logDir);
    readValue(j, "logLevel", config.logLevel);
    readValue(j, "maxFilesPerRequest", config.maxFilesPerRequest);

    if (j.contains("pipeline")) {
        const json& p = j["pipeline"];
        readValue(p, "numWorkers", config.pipeline.numWorkers);
        readValue(p, "documentTimeoutMs", config.pipeline.documentTimeoutMs);
        readValue(p, "enableTextFallback", config.pipeline.enableTextFallback);
        if (p.contains("segmenter")) applySegmenter(p["segmenter"], config.pipeline.segmenterConfig);
        if (p.contains("locator")) applyLocator(p["locator"], config.pipeline.locatorConfig);
        if (p.contains("parser")) applyParser(p["parser"], config.pipeline.parserConfig);
        if (p.contains("assembler")) applyAssembler(p["assembler"], config.pipeline.assemblerConfig);
    }
    if (j.contains("engine")) {
        applyEngine(j["engine"], config.engine);
    }
    if (j.contains("export")) {
        const json& e = j["export"];
        if (e.contains("genderStyle")) {
            config.exportOptions.genderStyle = ParseGenderStyle(e["genderStyle"].get<std::string>());
        }
        readValue(e, "sheetName", config.exportOptions.sheetName);
    }
}

bool LoadConfigFile(const std::string& path, ServerConfig& config, std::string& error_msg) {
    std::ifstream file(path);
    if (!file) {
        error_msg = "cannot open config file " + path;
        return false;
    }
    try {
        json j = json::parse(file);
        ApplyConfigJson(j, config);
    } catch (const json::exception& e) {
        error_msg = "invalid config " + path + ": " + e.what();
        return false;
    } catch (const std::invalid_argument& e) {
        error_msg = "invalid config " + path + ": " + e.what();
        return false;
    }
    return true;
}

} // namespace passport_server
