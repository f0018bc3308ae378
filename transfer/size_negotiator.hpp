#pragma once
#include <cstdint>
#include "../common/result.hpp"

class SizeNegotiator {
public:
    // min(requestedUnit, sinkMaxUnit); InvalidConfiguration unless both are positive
    static Result<uint64_t> negotiate(int64_t requestedUnit, int64_t sinkMaxUnit);

    static bool isClamped(int64_t requestedUnit, int64_t sinkMaxUnit) {
        return requestedUnit > sinkMaxUnit;
    }
};
