#include "write_buffer.hpp"
#include <algorithm>

WriteBuffer::WriteBuffer(size_t writeUnit) : writeUnit_(writeUnit), nextOffset_(0) {
    pending_.reserve(writeUnit_);
}

Result<std::unique_ptr<WriteBuffer>> WriteBuffer::create(size_t writeUnit) {
    if (writeUnit == 0) {
        return Result<std::unique_ptr<WriteBuffer>>::Error(ErrorKind::InvalidConfiguration, "Write unit must be positive");
    }
    return Result<std::unique_ptr<WriteBuffer>>::Ok(std::make_unique<WriteBuffer>(writeUnit));
}

std::vector<Segment> WriteBuffer::accept(const char* data, size_t len) {
    std::vector<Segment> segments;
    size_t pos = 0;

    // top up what is pending first
    if (!pending_.empty()) {
        size_t take = std::min(writeUnit_ - pending_.size(), len);
        pending_.insert(pending_.end(), data, data + take);
        pos = take;
        if (pending_.size() == writeUnit_) {
            segments.push_back(Segment{nextOffset_, std::move(pending_)});
            nextOffset_ += writeUnit_;
            pending_ = std::vector<char>();
            pending_.reserve(writeUnit_);
        }
    }

    // whole units straight from the input
    while (len - pos >= writeUnit_) {
        segments.push_back(Segment{nextOffset_, std::vector<char>(data + pos, data + pos + writeUnit_)});
        nextOffset_ += writeUnit_;
        pos += writeUnit_;
    }

    pending_.insert(pending_.end(), data + pos, data + len);
    return segments;
}

std::optional<Segment> WriteBuffer::flushRemainder() {
    if (pending_.empty()) return std::nullopt;

    Segment last{nextOffset_, std::move(pending_)};
    nextOffset_ += last.bytes.size();
    pending_ = std::vector<char>();
    return last;
}
