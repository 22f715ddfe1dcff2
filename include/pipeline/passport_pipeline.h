#pragma once

#include "common/errors.h"
#include "common/thread_pool.hpp"
#include "common/types.hpp"
#include "mrz/mrz_locator.h"
#include "mrz/mrz_parser.h"
#include "pipeline/record_assembler.h"
#include "pipeline/text_field_extractor.h"
#include "recognition/ocr_engine.h"
#include "segmentation/document_segmenter.h"

#include <cstdint>
#include <memory>
#include <string>
#include <vector>

namespace passport {

/**
 * @brief Passport pipeline settings
 */
struct PipelineConfig {
    SegmenterConfig segmenterConfig;
    LocatorConfig locatorConfig;
    ParserConfig parserConfig;
    AssemblerConfig assemblerConfig;

    size_t numWorkers = 0;             // 0 = one per core
    int documentTimeoutMs = 30000;     // per region, from the moment a worker starts it
    bool enableTextFallback = false;   // fill gaps from printed labels

    void Show() const;
};

/**
 * @brief One encoded page as received from the caller
 */
struct PageInput {
    std::string name;
    std::vector<uint8_t> bytes;
};

/**
 * @brief Per-page outcome, records in region order
 */
struct PageResult {
    int pageIndex = 0;
    std::string sourceName;
    bool success = false;              // false only when the page could not be decoded
    std::vector<PassportRecord> records;
    std::vector<PipelineIssue> issues;
};

/**
 * @brief Batch counters
 */
struct PipelineStats {
    int pages = 0;
    int failedPages = 0;
    int regions = 0;
    int mrzFound = 0;
    int placeholders = 0;
    int timeouts = 0;
    double totalTimeMs = 0.0;

    void Show() const;
};

struct BatchResult {
    std::vector<PageResult> pages;     // input order
    PipelineStats stats;

    size_t recordCount() const;
};

/**
 * @brief Page images in, reviewable passport records out
 *
 * Pages are decoded and segmented on the calling thread; every region is
 * then located, parsed and assembled on the worker pool. Results are joined
 * back in page/region order. A region that throws or overruns the
 * per-document timeout becomes a manual-entry placeholder.
 *
 * A timed-out region is abandoned, not cancelled: its worker stays busy until
 * the OCR backend returns. Destruction joins the workers, so a backend that
 * never returns blocks the destructor.
 */
class PassportPipeline {
public:
    /**
     * @param config pipeline settings
     * @param engine OCR backend, shared with the workers
     */
    PassportPipeline(const PipelineConfig& config, std::shared_ptr<OcrEngine> engine);
    ~PassportPipeline();

    PassportPipeline(const PassportPipeline&) = delete;
    PassportPipeline& operator=(const PassportPipeline&) = delete;

    /**
     * @brief Initialise the OCR backend
     * @return false when the engine cannot be used
     */
    bool initialize();

    /**
     * @brief Process a batch of encoded pages
     * @param pages encoded images
     * @param rotationDeg applied to every page before segmentation
     */
    BatchResult processBatch(const std::vector<PageInput>& pages, double rotationDeg = 0.0);

    /**
     * @brief Run OCR, MRZ location, parsing and assembly for one region (synchronous)
     * @throws OcrError when the OCR backend fails
     */
    PassportRecord processRegion(const PassportImageRegion& region,
                                 std::vector<PipelineIssue>& issues) const;

    const PipelineConfig& config() const { return config_; }

private:
    struct RegionOutcome {
        PassportRecord record;
        std::vector<PipelineIssue> issues;
    };

    PipelineConfig config_;
    std::shared_ptr<OcrEngine> engine_;
    DocumentSegmenter segmenter_;
    MrzLocator locator_;
    MrzParser parser_;
    RecordAssembler assembler_;
    TextFieldExtractor textExtractor_;

    // Declared last: joins running tasks before the stages above go away
    std::unique_ptr<ThreadPool> pool_;
};

} // namespace passport
