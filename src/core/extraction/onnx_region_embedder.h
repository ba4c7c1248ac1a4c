#pragma once

#include "core/extraction/region_embedder.h"

#include <QImage>

#include <array>
#include <atomic>
#include <cstdint>
#include <string>

namespace gf {

class ModelRegistry;
class ModelSession;

struct EmbedderCircuitBreaker {
    std::atomic<int> consecutiveFailures{0};
    std::atomic<int64_t> lastFailureTime{0};
    static constexpr int kOpenThreshold = 5;          // Open after 5 consecutive failures
    static constexpr int kHalfOpenDelayMs = 30000;    // Try again after 30s

    bool isOpen() const;
    void recordSuccess();
    void recordFailure();
};

// Image encoder run through ONNX Runtime. Crops are resized to the model's
// square input, normalized with the manifest mean/std and laid out NCHW;
// outputs are L2-normalized.
class OnnxRegionEmbedder : public RegionEmbedder {
public:
    static constexpr const char* kRole = "region-encoder";

    explicit OnnxRegionEmbedder(ModelRegistry* registry);
    ~OnnxRegionEmbedder() override;

    OnnxRegionEmbedder(const OnnxRegionEmbedder&) = delete;
    OnnxRegionEmbedder& operator=(const OnnxRegionEmbedder&) = delete;
    OnnxRegionEmbedder(OnnxRegionEmbedder&&) = delete;
    OnnxRegionEmbedder& operator=(OnnxRegionEmbedder&&) = delete;

    bool initialize();
    bool isAvailable() const;

    int dimensions() const override;
    StageResult<std::vector<std::vector<float>>> embed(const QString& imagePath,
                                                       const std::vector<BoundingBox>& boxes) override;

    // Crops |box| out of |image| and returns the normalized CHW tensor data.
    static std::vector<float> preprocess(const QImage& image,
                                         const BoundingBox& box,
                                         int size,
                                         const std::array<float, 3>& mean,
                                         const std::array<float, 3>& std);

    // Expose for testing
    EmbedderCircuitBreaker& circuitBreaker() { return m_circuitBreaker; }

private:
    ModelRegistry* m_registry = nullptr;
    ModelSession* m_session = nullptr;    // owned by the registry
    std::string m_inputName;
    std::string m_outputName;
    int m_dimensions = 0;
    bool m_available = false;
    EmbedderCircuitBreaker m_circuitBreaker;
};

} // namespace gf
