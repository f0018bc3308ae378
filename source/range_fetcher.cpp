#include "range_fetcher.hpp"
#include "../common/logger.hpp"
#include <algorithm>

RangeFetcher::RangeFetcher(ObjectStore& store, const std::string& bucket, const std::string& key,
                           uint64_t declaredSize, uint64_t window)
    : store_(store), bucket_(bucket), key_(key), declaredSize_(declaredSize), window_(window),
      offset_(0), fetches_(0), done_(false), endedEarly_(false) {}

Result<Chunk> RangeFetcher::next() {
    if (done_ || offset_ >= declaredSize_) {
        done_ = true;
        return Result<Chunk>::Ok(Chunk{offset_, {}});
    }
    if (window_ == 0) {
        done_ = true;
        return Result<Chunk>::Error(ErrorKind::InvalidConfiguration, "Fetch window must be positive");
    }

    ByteRange range{offset_, std::min(offset_ + window_ - 1, declaredSize_ - 1)};
    Result<std::vector<char>> read = store_.rangeRead(bucket_, key_, range);
    fetches_++;

    if (!read.success) {
        done_ = true;
        if (read.kind == ErrorKind::SourceReadFailure) return Result<Chunk>::From(read);
        return Result<Chunk>::Error(ErrorKind::SourceReadFailure, "Range " + range.header() + " failed: " + read.describe());
    }

    if (read.data.empty()) {
        // object shrank under us, treated as end of data
        done_ = true;
        endedEarly_ = true;
        Logger::debug("Fetcher", "Empty read at offset " + std::to_string(offset_));
        return Result<Chunk>::Ok(Chunk{offset_, {}});
    }

    if (read.data.size() > range.length()) {
        done_ = true;
        return Result<Chunk>::Error(ErrorKind::SourceReadFailure,
                                    "Range " + range.header() + " returned " + std::to_string(read.data.size()) + " bytes");
    }

    Chunk chunk{offset_, std::move(read.data)};
    offset_ += chunk.bytes.size();
    return Result<Chunk>::Ok(std::move(chunk));
}
