#pragma once

#include "core/shared/types.h"

#include <vector>

namespace gf {

// Builds the final response of a job. Pure: no I/O, and the output depends
// only on the arguments.
class ResultAggregator {
public:
    // |regionMatches| must be in extraction order. Regions whose Match has no
    // candidates are listed in unmatchedRegionIds instead of pairs.
    static MatchResult aggregate(const Job& job,
                                 const StyledImage& styledImage,
                                 const std::vector<RegionMatch>& regionMatches);
};

} // namespace gf
