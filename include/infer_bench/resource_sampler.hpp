#pragma once

#include "infer_bench/fwd.hpp"
#include "infer_bench/types.hpp"

#include <chrono>

namespace infer_bench {

class ResourceSampler {
public:
    ResourceSampler(ResourceProbe& probe, std::chrono::milliseconds interval);

    // Samples every interval until `token` fires, feeding `sink`. Blocks the calling thread.
    // Returns the number of samples delivered.
    std::size_t Run(const CancelToken& token, Aggregator& sink);

    // Maps a partial reading to a sample; unmeasured dimensions become zero.
    static ResourceSample Flatten(const ProbeReading& reading) noexcept;

private:
    ResourceProbe& probe_;
    std::chrono::milliseconds interval_;
};

}
