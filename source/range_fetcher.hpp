#pragma once
#include <cstdint>
#include <string>
#include <vector>
#include "object_store.hpp"
#include "../common/result.hpp"

struct Chunk {
    uint64_t offset = 0;
    std::vector<char> bytes;   // empty = end of data
};

// sequence of chunks covering an object from offset 0; one pass only
class ChunkSource {
public:
    virtual ~ChunkSource() = default;
    virtual Result<Chunk> next() = 0;
};

// Sequential, contiguous range reads of [0, declaredSize).
// Stops once declaredSize bytes arrived or a read comes back empty.
class RangeFetcher : public ChunkSource {
public:
    RangeFetcher(ObjectStore& store, const std::string& bucket, const std::string& key,
                 uint64_t declaredSize, uint64_t window);

    Result<Chunk> next() override;

    uint64_t bytesFetched() const { return offset_; }
    uint64_t fetchCount() const { return fetches_; }
    bool endedEarly() const { return endedEarly_; }   // zero byte read before declaredSize

private:
    ObjectStore& store_;
    std::string bucket_;
    std::string key_;
    uint64_t declaredSize_;
    uint64_t window_;
    uint64_t offset_;
    uint64_t fetches_;
    bool done_;
    bool endedEarly_;
};
