#include "Lyrics.hpp"

namespace ks::sync {

const char* toString(LineStage stage) {
    switch (stage) {
    case LineStage::Unaligned:
        return "unaligned";
    case LineStage::PartiallyAligned:
        return "partially-aligned";
    case LineStage::FullyTimed:
        return "fully-timed";
    case LineStage::Finalized:
        return "finalized";
    }
    return "unknown";
}

} // namespace ks::sync
