#pragma once
#include <cstddef>
#include <cstdint>
#include <memory>
#include <optional>
#include <vector>
#include "../common/result.hpp"

struct Segment {
    uint64_t offset;
    std::vector<char> bytes;
};

// Reassembles arbitrary sized chunks into writeUnit sized segments with
// contiguous offsets starting at 0. Bytes short of a full unit wait in the
// pending buffer until more arrive or flushRemainder() is called.
class WriteBuffer {
public:
    // writeUnit must be positive; use create() when it comes from input
    explicit WriteBuffer(size_t writeUnit);

    // InvalidConfiguration for a zero write unit
    static Result<std::unique_ptr<WriteBuffer>> create(size_t writeUnit);

    std::vector<Segment> accept(const char* data, size_t len);
    std::vector<Segment> accept(const std::vector<char>& chunk) { return accept(chunk.data(), chunk.size()); }

    // the final short segment, if any bytes are pending
    std::optional<Segment> flushRemainder();

    size_t pending() const { return pending_.size(); }
    uint64_t nextOffset() const { return nextOffset_; }
    size_t writeUnit() const { return writeUnit_; }

private:
    size_t writeUnit_;
    std::vector<char> pending_;
    uint64_t nextOffset_;
};
