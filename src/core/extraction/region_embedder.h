#pragma once

#include "core/shared/types.h"

#include <QString>

#include <vector>

namespace gf {

// Computes one embedding per box of an image, in box order.
class RegionEmbedder {
public:
    virtual ~RegionEmbedder() = default;
    virtual int dimensions() const = 0;
    virtual StageResult<std::vector<std::vector<float>>> embed(const QString& imagePath,
                                                               const std::vector<BoundingBox>& boxes) = 0;
};

} // namespace gf
