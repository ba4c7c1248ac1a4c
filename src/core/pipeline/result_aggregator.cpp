#include "core/pipeline/result_aggregator.h"

namespace gf {

MatchResult ResultAggregator::aggregate(const Job& job,
                                        const StyledImage& styledImage,
                                        const std::vector<RegionMatch>& regionMatches)
{
    MatchResult result;
    result.jobId = job.id;
    result.styledImageRef = styledImage.imageRef;
    result.status = JobStatus::Completed;

    for (const RegionMatch& pair : regionMatches) {
        if (pair.match.candidates.empty()) {
            result.unmatchedRegionIds.append(pair.region.regionId);
            continue;
        }
        RegionMatch entry;
        entry.region = pair.region;
        entry.region.embedding.clear();
        entry.match = pair.match;
        entry.match.regionId = pair.region.regionId;
        result.pairs.push_back(std::move(entry));
    }
    return result;
}

} // namespace gf
