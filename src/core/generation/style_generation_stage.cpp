#include "core/generation/style_generation_stage.h"
#include "core/generation/generation_backend.h"
#include "core/generation/image_storage.h"
#include "core/shared/logging.h"

#include <QElapsedTimer>
#include <QFile>

namespace gf {

StyleGenerationStage::StyleGenerationStage(GenerationBackend* backend,
                                           ImageStorage* storage,
                                           int timeoutMs)
    : m_backend(backend)
    , m_storage(storage)
    , m_timeoutMs(timeoutMs)
{
}

std::optional<StageError> StyleGenerationStage::validateRequest(const QString& photoRef,
                                                                const StyleParams& params) const
{
    if (auto error = validateStyleParams(params)) {
        return error;
    }
    if (!m_storage->resolve(photoRef).has_value()) {
        return StageError::validation(QStringLiteral("invalid_photo_ref"),
                                      QStringLiteral("Photo reference is not a storage reference"));
    }
    if (!m_storage->exists(photoRef)) {
        return StageError::validation(QStringLiteral("photo_not_found"),
                                      QStringLiteral("Photo reference does not resolve to an image"));
    }
    return std::nullopt;
}

StageResult<StyledImage> StyleGenerationStage::generate(const JobId& jobId,
                                                        const QString& photoRef,
                                                        const StyleParams& params)
{
    using Result = StageResult<StyledImage>;

    if (auto error = validateRequest(photoRef, params)) {
        return Result::failure(*error);
    }

    const auto allocation = m_storage->allocateStyled(jobId);
    if (!allocation) {
        return Result::failure(StageError::transient(
            QStringLiteral("storage_unavailable"),
            QStringLiteral("Could not reserve storage for the rendering")));
    }

    GenerationRequest request;
    request.jobId = jobId;
    request.photoPath = m_storage->resolve(photoRef).value();
    request.params = params;
    request.outputPath = allocation->path;
    request.timeoutMs = m_timeoutMs;

    QElapsedTimer timer;
    timer.start();
    const std::optional<StageError> error = m_backend->generate(request);
    const int64_t elapsedMs = timer.elapsed();

    if (error.has_value()) {
        QFile::remove(allocation->path);
        LOG_WARN(gfGeneration, "Generation failed for job %s after %lldms: %s (%s)",
                 qPrintable(jobId), static_cast<long long>(elapsedMs),
                 qPrintable(error->code), qPrintable(errorKindToString(error->kind)));
        return Result::failure(*error);
    }

    StyledImage image;
    image.jobId = jobId;
    image.imageRef = allocation->ref;
    image.params = params;
    image.generationMs = elapsedMs;

    LOG_INFO(gfGeneration, "Job %s styled as '%s' in %lldms",
             qPrintable(jobId), qPrintable(params.style), static_cast<long long>(elapsedMs));
    return Result::success(std::move(image));
}

} // namespace gf
