#pragma once

#include "core/shared/types.h"

namespace gf {

class ImageStorage;
class RegionDetector;
class RegionEmbedder;

// Turns a styled rendering into embedded furniture regions.
class FeatureExtractionStage {
public:
    struct Options {
        double minDetectionScore = 0.3;
        int maxRegions = 16;
        int dimensions = 512;
    };

    // |embedder| may be null when the detector always supplies embeddings.
    FeatureExtractionStage(RegionDetector* detector,
                           RegionEmbedder* embedder,
                           ImageStorage* storage,
                           const Options& options);

    FeatureExtractionStage(const FeatureExtractionStage&) = delete;
    FeatureExtractionStage& operator=(const FeatureExtractionStage&) = delete;

    // Zero or more regions, ordered top-to-bottom, then left-to-right, then
    // by category. Region ids are "<jobId>-r<ordinal>" in that order.
    StageResult<std::vector<Region>> extract(const StyledImage& image);

private:
    RegionDetector* m_detector = nullptr;
    RegionEmbedder* m_embedder = nullptr;
    ImageStorage* m_storage = nullptr;
    Options m_options;
};

} // namespace gf
