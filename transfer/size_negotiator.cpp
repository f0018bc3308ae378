#include "size_negotiator.hpp"
#include <algorithm>
#include <string>

Result<uint64_t> SizeNegotiator::negotiate(int64_t requestedUnit, int64_t sinkMaxUnit) {
    if (requestedUnit <= 0) {
        return Result<uint64_t>::Error(ErrorKind::InvalidConfiguration,
                                       "Requested write size must be positive, got " + std::to_string(requestedUnit));
    }
    if (sinkMaxUnit <= 0) {
        return Result<uint64_t>::Error(ErrorKind::InvalidConfiguration,
                                       "Destination maximum write size must be positive, got " + std::to_string(sinkMaxUnit));
    }
    return Result<uint64_t>::Ok(static_cast<uint64_t>(std::min(requestedUnit, sinkMaxUnit)));
}
