#include "core/extraction/onnx_region_embedder.h"
#include "core/models/model_registry.h"
#include "core/models/model_session.h"
#include "core/shared/logging.h"
#include "core/vector/vector_index.h"

#include <QRect>

#include <algorithm>
#include <chrono>
#include <cmath>

#include <onnxruntime_cxx_api.h>

namespace gf {

namespace {

int64_t steadyNowMs()
{
    return std::chrono::duration_cast<std::chrono::milliseconds>(
               std::chrono::steady_clock::now().time_since_epoch())
        .count();
}

QRect pixelRect(const QImage& image, const BoundingBox& box)
{
    const int left = static_cast<int>(std::floor(box.x * image.width()));
    const int top = static_cast<int>(std::floor(box.y * image.height()));
    const int right = static_cast<int>(std::ceil((box.x + box.width) * image.width()));
    const int bottom = static_cast<int>(std::ceil((box.y + box.height) * image.height()));
    const QRect rect(QPoint(left, top), QPoint(std::max(left, right - 1), std::max(top, bottom - 1)));
    return rect.intersected(image.rect());
}

} // namespace

bool EmbedderCircuitBreaker::isOpen() const
{
    if (consecutiveFailures.load() < kOpenThreshold) {
        return false;
    }
    // Half-open once the delay has passed: one attempt is let through.
    return steadyNowMs() - lastFailureTime.load() < kHalfOpenDelayMs;
}

void EmbedderCircuitBreaker::recordSuccess()
{
    consecutiveFailures.store(0);
}

void EmbedderCircuitBreaker::recordFailure()
{
    consecutiveFailures.fetch_add(1);
    lastFailureTime.store(steadyNowMs());
}

OnnxRegionEmbedder::OnnxRegionEmbedder(ModelRegistry* registry)
    : m_registry(registry)
{
}

OnnxRegionEmbedder::~OnnxRegionEmbedder() = default;

bool OnnxRegionEmbedder::initialize()
{
    m_available = false;
    if (!m_registry) {
        LOG_WARN(gfExtraction, "OnnxRegionEmbedder: null model registry");
        return false;
    }

    m_session = m_registry->getSession(kRole);
    if (!m_session || !m_session->isAvailable()) {
        LOG_WARN(gfExtraction, "OnnxRegionEmbedder: '%s' session unavailable", kRole);
        return false;
    }

    const ModelManifestEntry& entry = m_session->manifest();
    if (entry.dimensions <= 0) {
        LOG_WARN(gfExtraction, "OnnxRegionEmbedder: manifest declares invalid dimensions %d",
                 entry.dimensions);
        return false;
    }

    m_dimensions = entry.dimensions;
    m_inputName = entry.inputs.empty() ? m_session->inputNames().front()
                                       : entry.inputs.front().toStdString();
    m_outputName = entry.outputs.empty() ? m_session->outputNames().front()
                                         : entry.outputs.front().toStdString();
    m_available = true;

    LOG_INFO(gfExtraction, "OnnxRegionEmbedder ready: model %s, %d dimensions, %dpx input",
             qPrintable(entry.modelId), m_dimensions, entry.imageSize);
    return true;
}

bool OnnxRegionEmbedder::isAvailable() const
{
    return m_available;
}

int OnnxRegionEmbedder::dimensions() const
{
    return m_dimensions;
}

std::vector<float> OnnxRegionEmbedder::preprocess(const QImage& image,
                                                  const BoundingBox& box,
                                                  int size,
                                                  const std::array<float, 3>& mean,
                                                  const std::array<float, 3>& std)
{
    const QRect rect = pixelRect(image, box);
    if (rect.isEmpty() || size <= 0) {
        return {};
    }

    const QImage crop = image.copy(rect)
                            .scaled(size, size, Qt::IgnoreAspectRatio, Qt::SmoothTransformation)
                            .convertToFormat(QImage::Format_RGB888);

    const size_t plane = static_cast<size_t>(size) * static_cast<size_t>(size);
    std::vector<float> tensor(3 * plane);
    for (int y = 0; y < size; ++y) {
        const uchar* row = crop.constScanLine(y);
        for (int x = 0; x < size; ++x) {
            const size_t offset = static_cast<size_t>(y) * static_cast<size_t>(size)
                                  + static_cast<size_t>(x);
            for (size_t c = 0; c < 3; ++c) {
                const float value = static_cast<float>(row[x * 3 + static_cast<int>(c)]) / 255.0f;
                tensor[c * plane + offset] = (value - mean[c]) / std[c];
            }
        }
    }
    return tensor;
}

StageResult<std::vector<std::vector<float>>> OnnxRegionEmbedder::embed(
    const QString& imagePath, const std::vector<BoundingBox>& boxes)
{
    using Result = StageResult<std::vector<std::vector<float>>>;

    if (boxes.empty()) {
        return Result::success({});
    }
    if (!m_available) {
        return Result::failure(StageError::transient(
            QStringLiteral("embedder_unavailable"), QStringLiteral("Region encoder is not loaded")));
    }
    if (m_circuitBreaker.isOpen()) {
        LOG_WARN(gfExtraction, "Region encoder circuit breaker is open, skipping inference");
        return Result::failure(StageError::transient(
            QStringLiteral("embedder_unavailable"), QStringLiteral("Region encoder is cooling down")));
    }

    const QImage image(imagePath);
    if (image.isNull()) {
        return Result::failure(StageError::validation(
            QStringLiteral("corrupt_image"), QStringLiteral("Rendered image could not be decoded")));
    }

    const ModelManifestEntry& entry = m_session->manifest();
    const int size = entry.imageSize;
    const size_t perImage = 3 * static_cast<size_t>(size) * static_cast<size_t>(size);

    std::vector<float> batch;
    batch.reserve(perImage * boxes.size());
    for (const BoundingBox& box : boxes) {
        std::vector<float> tensor = preprocess(image, box, size, entry.mean, entry.std);
        if (tensor.size() != perImage) {
            return Result::failure(StageError::validation(
                QStringLiteral("invalid_region"), QStringLiteral("Region lies outside the image")));
        }
        batch.insert(batch.end(), tensor.begin(), tensor.end());
    }

    const int64_t batchSize = static_cast<int64_t>(boxes.size());
    const int64_t inputShape[4] = {batchSize, 3, size, size};

    try {
        Ort::MemoryInfo memoryInfo = Ort::MemoryInfo::CreateCpu(OrtAllocatorType::OrtArenaAllocator,
                                                                 OrtMemTypeDefault);
        Ort::Value input = Ort::Value::CreateTensor<float>(
            memoryInfo, batch.data(), batch.size(), inputShape, 4);

        const char* inputNames[1] = {m_inputName.c_str()};
        const char* outputNames[1] = {m_outputName.c_str()};
        std::vector<Ort::Value> outputs = m_session->session()->Run(
            Ort::RunOptions{nullptr}, inputNames, &input, 1, outputNames, 1);

        if (outputs.empty() || !outputs[0].IsTensor()) {
            m_circuitBreaker.recordFailure();
            return Result::failure(StageError::transient(
                QStringLiteral("embedder_failed"), QStringLiteral("Region encoder returned no tensor")));
        }

        const std::vector<int64_t> shape = outputs[0].GetTensorTypeAndShapeInfo().GetShape();
        const float* data = outputs[0].GetTensorData<float>();
        if (!data || shape.size() != 2 || shape[0] != batchSize || shape[1] != m_dimensions) {
            LOG_ERROR(gfExtraction, "Region encoder output shape does not match %d dimensions",
                      m_dimensions);
            m_circuitBreaker.recordFailure();
            return Result::failure(StageError::validation(
                QStringLiteral("dimension_mismatch"),
                QStringLiteral("Region encoder output does not match the configured dimensionality")));
        }

        std::vector<std::vector<float>> embeddings;
        embeddings.reserve(boxes.size());
        for (int64_t i = 0; i < batchSize; ++i) {
            const float* row = data + i * m_dimensions;
            embeddings.push_back(normalizeEmbedding(std::vector<float>(row, row + m_dimensions)));
        }
        m_circuitBreaker.recordSuccess();
        return Result::success(std::move(embeddings));
    } catch (const Ort::Exception& ex) {
        LOG_WARN(gfExtraction, "Region encoder inference failed: %s", ex.what());
        m_circuitBreaker.recordFailure();
        return Result::failure(StageError::transient(
            QStringLiteral("embedder_failed"), QStringLiteral("Region encoder failed")));
    }
}

} // namespace gf
