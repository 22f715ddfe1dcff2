#include "pipeline/passport_pipeline.h"
#include "recognition/dx_ocr_engine.h"
#include "export/export_merger.h"
#include "common/logger.hpp"
#include <nlohmann/json.hpp>
#include <filesystem>
#include <fstream>
#include <iterator>
#include <algorithm>
#include <chrono>
#include <vector>
#include <memory>
#include <cctype>
#include <cstdlib>

namespace fs = std::filesystem;
using json = nlohmann::json;

namespace {

std::vector<uint8_t> readFile(const std::string& path) {
    std::ifstream file(path, std::ios::binary);
    return std::vector<uint8_t>(std::istreambuf_iterator<char>(file), std::istreambuf_iterator<char>());
}

json recordSummary(const passport::PassportRecord& record) {
    json item;
    for (const char* name : passport::kRecordFields) {
        item[name] = record.value(name);
    }
    item["confidence"] = record.confidence;
    item["low_confidence_fields"] = record.lowConfidenceFields;
    item["corrected_fields"] = record.correctedFields;
    item["ambiguous_fields"] = record.ambiguousFields;
    item["mrz_found"] = record.mrzFound;
    return item;
}

} // namespace

int main(int argc, char** argv) {
    // Repeats per image
    int runsPerImage = 3;
    if (argc > 1) {
        runsPerImage = std::atoi(argv[1]);
        if (runsPerImage < 1) runsPerImage = 3;
    }

    LOG_INFO("========================================");
    LOG_INFO("Passport OCR - Benchmark");
    LOG_INFO("========================================\n");

    std::string projectRoot = PASSPORT_ROOT_DIR;
    std::string imagesDir = projectRoot + "/images";
    std::string outputDir = projectRoot + "/benchmark/results";
    fs::create_directories(outputDir);

    LOG_INFO("Images: {}", imagesDir);
    LOG_INFO("Output: {}", outputDir);
    LOG_INFO("Runs per image: {}\n", runsPerImage);

    passport::PipelineConfig config;
    auto engine = std::make_shared<passport::DxOcrEngine>();
    passport::PassportPipeline pipeline(config, engine);
    if (!pipeline.initialize()) {
        LOG_ERROR("Failed to initialize pipeline");
        return -1;
    }
    config.Show();

    std::vector<passport::PageInput> pages;
    if (fs::is_directory(imagesDir)) {
        for (const auto& entry : fs::directory_iterator(imagesDir)) {
            if (!entry.is_regular_file()) continue;
            std::string ext = entry.path().extension().string();
            std::transform(ext.begin(), ext.end(), ext.begin(), ::tolower);
            if (ext == ".png" || ext == ".jpg" || ext == ".jpeg") {
                passport::PageInput page;
                page.name = entry.path().filename().string();
                page.bytes = readFile(entry.path().string());
                pages.push_back(std::move(page));
            }
        }
    }
    std::sort(pages.begin(), pages.end(),
              [](const passport::PageInput& a, const passport::PageInput& b) { return a.name < b.name; });

    if (pages.empty()) {
        LOG_ERROR("No images found in {}", imagesDir);
        return -1;
    }
    LOG_INFO("Loaded {} images into memory\n", pages.size());

    passport::BatchResult last;
    auto startTime = std::chrono::high_resolution_clock::now();
    for (int run = 0; run < runsPerImage; ++run) {
        last = pipeline.processBatch(pages);
        LOG_INFO("Run {}/{}: {} records, {} MRZ found",
                 run + 1, runsPerImage, last.recordCount(), last.stats.mrzFound);
    }
    auto endTime = std::chrono::high_resolution_clock::now();

    double totalTimeMs = std::chrono::duration<double, std::milli>(endTime - startTime).count();
    int totalPages = static_cast<int>(pages.size()) * runsPerImage;
    double avgTimePerPage = totalTimeMs / totalPages;

    LOG_INFO("\n========== Benchmark Results ==========");
    LOG_INFO("Total Pages: {} (Images: {}, Repeats: {})", totalPages, pages.size(), runsPerImage);
    LOG_INFO("Total Time: {:.2f} ms", totalTimeMs);
    LOG_INFO("Average Time: {:.2f} ms/page", avgTimePerPage);
    LOG_INFO("Pages/s: {:.2f}", totalPages / (totalTimeMs / 1000.0));
    LOG_INFO("========================================\n");

    // Per-page results of the last run
    std::vector<passport::PassportRecord> allRecords;
    for (const auto& page : last.pages) {
        json output;
        output["filename"] = page.sourceName;
        output["success"] = page.success;
        output["avg_page_ms"] = avgTimePerPage;
        json records = json::array();
        for (const auto& record : page.records) {
            records.push_back(recordSummary(record));
            allRecords.push_back(record);
        }
        output["passports"] = records;
        json issues = json::array();
        for (const auto& issue : page.issues) {
            issues.push_back({{"kind", passport::ToString(issue.kind)}, {"message", issue.message}});
        }
        output["errors"] = issues;

        std::string jsonPath = outputDir + "/" + fs::path(page.sourceName).stem().string() + "_result.json";
        std::ofstream jsonFile(jsonPath);
        jsonFile << output.dump(4);
    }

    if (!allRecords.empty()) {
        passport::ExportMerger merger;
        passport::ExportResult exported = merger.merge(allRecords);
        std::ofstream xlsx(outputDir + "/" + exported.filename, std::ios::binary);
        xlsx.write(reinterpret_cast<const char*>(exported.workbook.data()),
                   static_cast<std::streamsize>(exported.workbook.size()));
        LOG_INFO("Workbook: {}", exported.filename);
    }

    LOG_INFO("Results saved to: {}", outputDir);
    return 0;
}
