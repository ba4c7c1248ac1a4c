#pragma once

#include "core/shared/types.h"

#include <QString>

#include <optional>

namespace gf {

struct GenerationRequest {
    JobId jobId;
    QString photoPath;
    StyleParams params;
    QString outputPath;     // the backend writes the rendering here
    int timeoutMs = 120000;
};

// The generative capability. Implementations block until the rendering is
// written to outputPath or the call fails; nullopt means success.
class GenerationBackend {
public:
    virtual ~GenerationBackend() = default;
    virtual std::optional<StageError> generate(const GenerationRequest& request) = 0;
};

} // namespace gf
