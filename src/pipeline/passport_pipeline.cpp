#include "pipeline/passport_pipeline.h"
#include "common/logger.hpp"
#include "preprocessing/image_ops.h"

#include <algorithm>
#include <atomic>
#include <chrono>
#include <future>
#include <thread>

namespace passport {

void PipelineConfig::Show() const {
    LOG_INFO("PipelineConfig:");
    LOG_INFO("  workers={}, documentTimeoutMs={}, textFallback={}",
             numWorkers == 0 ? std::thread::hardware_concurrency() : numWorkers,
             documentTimeoutMs, enableTextFallback);
    segmenterConfig.Show();
    locatorConfig.Show();
    parserConfig.Show();
    assemblerConfig.Show();
}

void PipelineStats::Show() const {
    LOG_INFO("Batch: {} pages ({} failed), {} regions, MRZ found in {}, {} placeholders ({} timed out), {:.1f} ms",
             pages, failedPages, regions, mrzFound, placeholders, timeouts, totalTimeMs);
}

size_t BatchResult::recordCount() const {
    size_t n = 0;
    for (const auto& page : pages) {
        n += page.records.size();
    }
    return n;
}

PassportPipeline::PassportPipeline(const PipelineConfig& config, std::shared_ptr<OcrEngine> engine)
    : config_(config),
      engine_(std::move(engine)),
      segmenter_(config.segmenterConfig),
      locator_(config.locatorConfig, config.parserConfig.substitutions),
      parser_(config.parserConfig),
      assembler_(config.assemblerConfig),
      pool_(std::make_unique<ThreadPool>(config.numWorkers)) {
    LOG_INFO("PassportPipeline: {} workers, OCR backend '{}'",
             pool_->size(), engine_ ? engine_->name() : "none");
}

PassportPipeline::~PassportPipeline() = default;

bool PassportPipeline::initialize() {
    if (!engine_) {
        LOG_ERROR("PassportPipeline has no OCR engine");
        return false;
    }
    if (!engine_->initialize()) {
        LOG_ERROR("OCR engine '{}' failed to initialize", engine_->name());
        return false;
    }
    return true;
}

PassportRecord PassportPipeline::processRegion(const PassportImageRegion& region,
                                               std::vector<PipelineIssue>& issues) const {
    if (!engine_) {
        throw OcrError("no OCR engine configured");
    }
    std::vector<OcrLine> lines = engine_->recognize(region.image);
    LOG_DEBUG("Page {} region {}: {} OCR lines", region.pageIndex, region.regionIndex, lines.size());

    LocatorResult located = locator_.locate(lines);
    PassportRecord record;
    if (located.found()) {
        ParsedMrz parsed = parser_.parse(*located.block);
        record = assembler_.assemble(parsed, *located.block, region);
        for (const auto& entry : parsed.fields) {
            const MRZField& f = entry.second;
            if (f.hasCheckDigit && !f.checksumValid) {
                issues.push_back({ErrorKind::ChecksumMismatch, region.pageIndex, region.regionIndex,
                                  f.name + (f.ambiguous ? " is ambiguous" : " failed its check digit")});
            }
        }
    } else {
        issues.push_back({ErrorKind::MrzNotFound, region.pageIndex, region.regionIndex,
                          "no MRZ among " + std::to_string(lines.size()) + " text lines"});
        record = assembler_.placeholder(region);
    }

    if (config_.enableTextFallback && (!record.mrzFound || !record.missingFields.empty())) {
        int filled = TextFieldExtractor::mergeInto(record, textExtractor_.extract(lines));
        if (filled > 0) {
            LOG_INFO("Page {} region {}: {} field(s) taken from printed labels",
                     region.pageIndex, region.regionIndex, filled);
            RecordAssembler::updateConfidence(record);
        }
    }
    return record;
}

BatchResult PassportPipeline::processBatch(const std::vector<PageInput>& pages, double rotationDeg) {
    auto start = std::chrono::steady_clock::now();
    BatchResult batch;
    batch.pages.resize(pages.size());

    struct Pending {
        size_t pageSlot;
        PassportImageRegion region;
        std::future<RegionOutcome> future;
        std::chrono::steady_clock::time_point submitted;
        std::shared_ptr<std::atomic<int64_t>> startedNs;   // 0 until a worker picks the task up
    };
    std::vector<Pending> pending;

    // Decode + segment inline, fan regions out to the pool
    for (size_t i = 0; i < pages.size(); ++i) {
        PageResult& page = batch.pages[i];
        page.pageIndex = static_cast<int>(i);
        page.sourceName = pages[i].name;

        cv::Mat image = ImageOps::decode(pages[i].bytes);
        if (image.empty()) {
            std::string format = ImageOps::sniffFormat(pages[i].bytes);
            std::string message = format.empty() ? "not a decodable raster image"
                                                 : format + " input is not supported";
            LOG_WARN("Page {} ({}): {}", i, pages[i].name, message);
            page.issues.push_back({ErrorKind::UnsupportedImageFormat, page.pageIndex, -1, message});
            ++batch.stats.failedPages;
            continue;
        }
        page.success = true;
        image = ImageOps::rotate(image, rotationDeg);

        SegmentationResult segmentation = segmenter_.segment(image, page.pageIndex);
        if (segmentation.fallbackUsed) {
            page.issues.push_back({ErrorKind::SegmentationEmpty, page.pageIndex, -1,
                                   "no passport-shaped region, whole page used"});
        }

        for (auto& region : segmentation.regions) {
            Pending p{i, std::move(region), {}, std::chrono::steady_clock::now(),
                      std::make_shared<std::atomic<int64_t>>(0)};
            PassportImageRegion taskRegion = p.region;   // shares pixels, not ownership
            auto startedNs = p.startedNs;
            p.future = pool_->enqueue([this, taskRegion, startedNs]() {
                startedNs->store(std::chrono::duration_cast<std::chrono::nanoseconds>(
                    std::chrono::steady_clock::now().time_since_epoch()).count());
                RegionOutcome outcome;
                outcome.record = processRegion(taskRegion, outcome.issues);
                return outcome;
            });
            pending.push_back(std::move(p));
        }
    }

    // Join in submission order. A region queued behind k others gets one timeout
    // per round of workers ahead of it; once running it always gets a full timeout.
    const auto timeout = std::chrono::milliseconds(config_.documentTimeoutMs);
    const size_t workers = std::max<size_t>(pool_->size(), 1);
    for (size_t k = 0; k < pending.size(); ++k) {
        Pending& p = pending[k];
        PageResult& page = batch.pages[p.pageSlot];
        const int regionIndex = p.region.regionIndex;
        ++batch.stats.regions;

        const auto rounds = static_cast<std::chrono::milliseconds::rep>(k / workers + 1);
        auto deadline = p.submitted + timeout * rounds;
        std::future_status status = p.future.wait_until(deadline);
        const int64_t startedNs = p.startedNs->load();
        if (status != std::future_status::ready && startedNs != 0) {
            auto begun = std::chrono::steady_clock::time_point(
                std::chrono::duration_cast<std::chrono::steady_clock::duration>(
                    std::chrono::nanoseconds(startedNs)));
            if (begun + timeout > deadline) {
                status = p.future.wait_until(begun + timeout);
            }
        }

        if (status != std::future_status::ready) {
            LOG_WARN("Page {} region {}: no result within {} ms, returning placeholder",
                     page.pageIndex, regionIndex, config_.documentTimeoutMs);
            page.issues.push_back({ErrorKind::DocumentTimeout, page.pageIndex, regionIndex,
                                   "timed out after " + std::to_string(config_.documentTimeoutMs) + " ms"});
            page.records.push_back(assembler_.placeholder(p.region));
            ++batch.stats.timeouts;
            ++batch.stats.placeholders;
            continue;
        }

        try {
            RegionOutcome outcome = p.future.get();
            page.issues.insert(page.issues.end(), outcome.issues.begin(), outcome.issues.end());
            if (outcome.record.mrzFound) {
                ++batch.stats.mrzFound;
            } else {
                ++batch.stats.placeholders;
            }
            page.records.push_back(std::move(outcome.record));
        } catch (const std::exception& e) {
            LOG_ERROR("Page {} region {}: OCR failed: {}", page.pageIndex, regionIndex, e.what());
            page.issues.push_back({ErrorKind::OcrFailure, page.pageIndex, regionIndex, e.what()});
            page.records.push_back(assembler_.placeholder(p.region));
            ++batch.stats.placeholders;
        }
    }

    batch.stats.pages = static_cast<int>(pages.size());
    batch.stats.totalTimeMs = std::chrono::duration<double, std::milli>(
        std::chrono::steady_clock::now() - start).count();
    batch.stats.Show();
    return batch;
}

} // namespace passport
