#pragma once

#include "detection/db_postprocess.h"
#include "recognition/ctc_decoder.h"
#include "recognition/ocr_engine.h"

#include <dxrt/dxrt_api.h>
#include <opencv2/core.hpp>

#include <map>
#include <memory>
#include <string>
#include <vector>

namespace passport {

/**
 * @brief DEEPX OCR backend settings
 */
struct DxOcrEngineConfig {
    std::string detModelPath = std::string(PASSPORT_ROOT_DIR) + "/engine/model_files/server/det_v5_960.dxnn";
    int detInputSize = 960;
    float thresh = 0.3f;
    float boxThresh = 0.6f;
    int maxCandidates = 1500;
    float unclipRatio = 1.5f;

    // Width/height ratio -> recognition model
    std::map<int, std::string> recModelPaths = {
        {10, std::string(PASSPORT_ROOT_DIR) + "/engine/model_files/best/rec_v5_ratio_10.dxnn"},
        {15, std::string(PASSPORT_ROOT_DIR) + "/engine/model_files/best/rec_v5_ratio_15.dxnn"},
        {25, std::string(PASSPORT_ROOT_DIR) + "/engine/model_files/best/rec_v5_ratio_25.dxnn"},
        {35, std::string(PASSPORT_ROOT_DIR) + "/engine/model_files/best/rec_v5_ratio_35.dxnn"}
    };
    std::string dictPath = std::string(PASSPORT_ROOT_DIR) + "/engine/model_files/ppocrv5_dict.txt";
    int recInputHeight = 48;
    float recConfThreshold = 0.3f;    // lines under this are dropped

    float rowOverlap = 0.5f;          // vertical overlap that puts two boxes on one line

    void Show() const;
};

/**
 * @brief Text detection + recognition on the DEEPX NPU runtime
 *
 * Detected boxes on the same row are recognised separately and joined left
 * to right, so an MRZ line cut in two by the detector comes back whole.
 */
class DxOcrEngine : public OcrEngine {
public:
    explicit DxOcrEngine(const DxOcrEngineConfig& config = DxOcrEngineConfig());
    ~DxOcrEngine() override;

    bool initialize() override;
    std::vector<OcrLine> recognize(const cv::Mat& image) override;
    std::string name() const override { return "dxrt"; }

private:
    std::vector<DetectedBox> detect(const cv::Mat& image) const;
    CtcResult recognizeBox(const cv::Mat& image, const DetectedBox& box) const;
    dxrt::InferenceEngine* selectRecModel(float aspect, int& ratio) const;
    std::vector<std::vector<DetectedBox>> groupRows(std::vector<DetectedBox> boxes) const;

    DxOcrEngineConfig config_;
    DBPostProcessor postprocessor_;
    CTCDecoder decoder_;
    std::unique_ptr<dxrt::InferenceEngine> detModel_;
    std::map<int, std::unique_ptr<dxrt::InferenceEngine>> recModels_;
    bool initialized_ = false;
};

} // namespace passport
