#pragma once

#include "core/shared/types.h"

#include <QString>

#include <vector>

namespace gf {

struct DetectedRegion {
    BoundingBox box;
    QString category;
    float score = 0.0f;
    std::vector<float> embedding;     // empty when the detector does not embed
};

// Locates furniture in a rendered image. Order of the returned regions is
// unspecified; the extraction stage imposes its own.
class RegionDetector {
public:
    virtual ~RegionDetector() = default;
    virtual StageResult<std::vector<DetectedRegion>> detect(const QString& imagePath) = 0;
};

} // namespace gf
