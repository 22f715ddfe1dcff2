#include "recognition/dx_ocr_engine.h"
#include "common/errors.h"
#include "common/geometry.h"
#include "common/logger.hpp"
#include "preprocessing/image_ops.h"

#include <opencv2/imgproc.hpp>

#include <algorithm>
#include <climits>
#include <cstdlib>
#include <cstring>

namespace passport {

namespace {

// Gray padding keeps edge text readable; black borders hurt both models
const cv::Scalar kPadColor(114, 114, 114);

cv::Mat contiguous(const cv::Mat& m) {
    return m.isContinuous() ? m : m.clone();
}

} // namespace

void DxOcrEngineConfig::Show() const {
    LOG_INFO("DxOcrEngineConfig:");
    LOG_INFO("  det={} ({}px) thresh={:.2f} boxThresh={:.2f} unclip={:.2f}",
             detModelPath, detInputSize, thresh, boxThresh, unclipRatio);
    for (const auto& entry : recModelPaths) {
        LOG_INFO("  rec ratio_{}={}", entry.first, entry.second);
    }
    LOG_INFO("  dict={} recConfThreshold={:.2f}", dictPath, recConfThreshold);
}

DxOcrEngine::DxOcrEngine(const DxOcrEngineConfig& config)
    : config_(config),
      postprocessor_(config.thresh, config.boxThresh, config.maxCandidates, config.unclipRatio) {
}

DxOcrEngine::~DxOcrEngine() = default;

bool DxOcrEngine::initialize() {
    if (initialized_) {
        LOG_WARN("DxOcrEngine already initialized");
        return true;
    }
    try {
        detModel_ = std::make_unique<dxrt::InferenceEngine>(config_.detModelPath);
        LOG_INFO("Loaded detection model: {}", config_.detModelPath);

        for (const auto& entry : config_.recModelPaths) {
            recModels_[entry.first] = std::make_unique<dxrt::InferenceEngine>(entry.second);
            LOG_INFO("Loaded ratio_{} recognition model: {}", entry.first, entry.second);
        }
    } catch (const std::exception& e) {
        LOG_ERROR("Failed to load DXRT models: {}", e.what());
        return false;
    }
    if (recModels_.empty()) {
        LOG_ERROR("No recognition models configured");
        return false;
    }
    if (!decoder_.loadDictionary(config_.dictPath, true)) {
        return false;
    }
    initialized_ = true;
    return true;
}

std::vector<DetectedBox> DxOcrEngine::detect(const cv::Mat& image) const {
    // Pad to square, then resize to the model input
    cv::Mat padded = ImageOps::padToRatio(image, 1.0f, kPadColor);
    cv::Mat input;
    cv::resize(padded, input, cv::Size(config_.detInputSize, config_.detInputSize));
    input = contiguous(input);

    auto outputs = detModel_->Run(reinterpret_cast<void*>(input.data));
    if (outputs.empty() || !outputs[0]) {
        throw OcrError("detection model returned no output");
    }
    auto shape = outputs[0]->shape();
    if (shape.size() != 4) {
        throw OcrError("unexpected detection output rank " + std::to_string(shape.size()));
    }

    const int outH = static_cast<int>(shape[2]);
    const int outW = static_cast<int>(shape[3]);
    cv::Mat pred(outH, outW, CV_32FC1);
    std::memcpy(pred.data, outputs[0]->data(), static_cast<size_t>(outH) * outW * sizeof(float));

    return postprocessor_.process(pred, image.rows, image.cols, padded.rows, padded.cols);
}

dxrt::InferenceEngine* DxOcrEngine::selectRecModel(float aspect, int& ratio) const {
    int wanted = 35;
    if (aspect <= 10.0f) wanted = 10;
    else if (aspect <= 15.0f) wanted = 15;
    else if (aspect <= 25.0f) wanted = 25;

    auto it = recModels_.find(wanted);
    if (it == recModels_.end()) {
        int bestDiff = INT_MAX;
        for (auto candidate = recModels_.begin(); candidate != recModels_.end(); ++candidate) {
            int diff = std::abs(candidate->first - wanted);
            if (diff < bestDiff) {
                bestDiff = diff;
                it = candidate;
            }
        }
    }
    ratio = it->first;
    return it->second.get();
}

CtcResult DxOcrEngine::recognizeBox(const cv::Mat& image, const DetectedBox& box) const {
    cv::Mat crop = Geometry::cropTextRegion(image, box.points, config_.recInputHeight);
    if (crop.empty()) {
        return CtcResult();
    }

    int ratio = 0;
    dxrt::InferenceEngine* engine =
        selectRecModel(static_cast<float>(crop.cols) / crop.rows, ratio);

    const int targetH = config_.recInputHeight;
    const int targetW = targetH * ratio;
    cv::Mat padded = crop;
    if (static_cast<float>(crop.cols) / crop.rows < static_cast<float>(ratio)) {
        padded = ImageOps::padToRatio(crop, static_cast<float>(ratio), kPadColor);
    }
    cv::Mat input;
    cv::resize(padded, input, cv::Size(targetW, targetH));
    input = contiguous(input);

    auto outputs = engine->Run(reinterpret_cast<void*>(input.data));
    if (outputs.empty() || !outputs[0]) {
        throw OcrError("recognition model ratio_" + std::to_string(ratio) + " returned no output");
    }
    auto shape = outputs[0]->shape();
    if (shape.size() != 3) {
        throw OcrError("unexpected recognition output rank " + std::to_string(shape.size()));
    }
    return decoder_.decode(reinterpret_cast<const float*>(outputs[0]->data()),
                           static_cast<int>(shape[1]), static_cast<int>(shape[2]));
}

std::vector<std::vector<DetectedBox>> DxOcrEngine::groupRows(std::vector<DetectedBox> boxes) const {
    std::sort(boxes.begin(), boxes.end(), [](const DetectedBox& a, const DetectedBox& b) {
        return a.boundingRect().y < b.boundingRect().y;
    });

    std::vector<std::vector<DetectedBox>> rows;
    std::vector<cv::Rect> rowRects;
    for (auto& box : boxes) {
        cv::Rect r = box.boundingRect();
        bool placed = false;
        for (size_t i = 0; i < rows.size() && !placed; ++i) {
            int top = std::max(r.y, rowRects[i].y);
            int bottom = std::min(r.y + r.height, rowRects[i].y + rowRects[i].height);
            int overlap = bottom - top;
            if (overlap > config_.rowOverlap * std::min(r.height, rowRects[i].height)) {
                rows[i].push_back(box);
                rowRects[i] |= r;
                placed = true;
            }
        }
        if (!placed) {
            rows.push_back({box});
            rowRects.push_back(r);
        }
    }

    for (auto& row : rows) {
        std::sort(row.begin(), row.end(), [](const DetectedBox& a, const DetectedBox& b) {
            return a.boundingRect().x < b.boundingRect().x;
        });
    }
    return rows;
}

std::vector<OcrLine> DxOcrEngine::recognize(const cv::Mat& image) {
    if (!initialized_) {
        throw OcrError("DxOcrEngine not initialized");
    }
    if (image.empty()) {
        throw OcrError("empty image");
    }

    auto rows = groupRows(detect(image));
    std::vector<OcrLine> lines;
    lines.reserve(rows.size());

    for (const auto& row : rows) {
        OcrLine line;
        for (const auto& box : row) {
            CtcResult part = recognizeBox(image, box);
            if (part.text.empty() || part.confidence < config_.recConfThreshold) {
                continue;
            }
            if (!line.text.empty()) {
                // Joining space keeps text and confidences aligned
                line.text += ' ';
                line.charConfidences.push_back(1.0f);
            }
            line.text += part.text;
            line.charConfidences.insert(line.charConfidences.end(),
                                        part.charConfidences.begin(), part.charConfidences.end());
            line.box |= box.boundingRect();
        }
        if (line.text.empty()) {
            continue;
        }
        float sum = 0.0f;
        for (float c : line.charConfidences) sum += c;
        line.confidence = sum / line.charConfidences.size();
        lines.push_back(std::move(line));
    }

    LOG_DEBUG("DxOcrEngine: {} rows, {} text lines", rows.size(), lines.size());
    return lines;
}

} // namespace passport
