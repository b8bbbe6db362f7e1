/**
 * @file ConfigData.hpp
 * @brief Configuration data structures.
 *
 * This file defines the POD (Plain Old Data) structs used to hold configuration
 * values. It is separated from the logic classes to keep headers lean and
 * avoid circular dependencies.
 */

#pragma once
#include <filesystem>
#include <string>
#include "util/Types.hpp"

namespace ks {

namespace fs = std::filesystem;

// Parameters of the timing synchronization pipeline. All durations in seconds.
struct SyncConfig {
    // Shortest time a line stays on screen after overlap resolution
    Seconds minLineDuration{1.2};
    // Bulk drift below this magnitude is left uncorrected
    Seconds globalOffsetThreshold{2.0};
    // Slack added on both sides of a line's search window
    Seconds windowMargin{1.0};
    // Tokens shorter than this (in characters) are ignored for drift anchoring
    u32 minTokenLength{3};
    // Assumed span of the last line when sizing its search window
    Seconds defaultLineGap{5.0};
    // Assumed span of the last line when distributing unmatched words
    Seconds lastLineDuration{3.0};
    // Smallest gap handed to a run of unmatched words
    Seconds minGapDuration{0.5};
    // Smallest span left to a line after it was pushed forward
    Seconds minPushedDuration{0.5};
};

// Post-synchronization adjustments for video assembly
struct TimelineConfig {
    Seconds introOffset{0.0};
    f64 speedFactor{1.0};
    Seconds trimThreshold{0.0}; // 0 disables lead-in trimming
    Seconds trimLeadIn{5.0};
};

struct OutputConfig {
    bool pretty{true};
    bool includeMatched{true};
};

} // namespace ks
