#pragma once

#include "core/shared/types.h"

#include <QString>

#include <optional>

namespace gf {

class GenerationBackend;
class ImageStorage;

// Produces a restyled rendering of a room photo and stores it, returning
// its storage reference.
class StyleGenerationStage {
public:
    StyleGenerationStage(GenerationBackend* backend, ImageStorage* storage, int timeoutMs);

    StyleGenerationStage(const StyleGenerationStage&) = delete;
    StyleGenerationStage& operator=(const StyleGenerationStage&) = delete;

    // Synchronous submission checks: parameters and a resolvable photo.
    std::optional<StageError> validateRequest(const QString& photoRef,
                                              const StyleParams& params) const;

    // Timeout or backend unavailability fails Transient, rejected
    // parameters fail Validation.
    StageResult<StyledImage> generate(const JobId& jobId,
                                      const QString& photoRef,
                                      const StyleParams& params);

private:
    GenerationBackend* m_backend = nullptr;
    ImageStorage* m_storage = nullptr;
    int m_timeoutMs = 0;
};

} // namespace gf
