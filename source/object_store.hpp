#pragma once
#include <cctype>
#include <cstdint>
#include <string>
#include <vector>
#include "../common/result.hpp"

struct ObjectInfo {
    uint64_t size = 0;
    std::string etag;                   // without quotes, may be empty
    std::string serverSideEncryption;   // "", "AES256", "aws:kms" or "aws:kms:dsse"
    bool customerKey = false;           // encrypted with a customer supplied key (SSE-C)

    // Only single part objects stored plain or under SSE-S3 carry their
    // content MD5 as ETag. KMS and SSE-C ETags are opaque.
    bool etagIsContentMd5() const {
        if (customerKey) return false;
        if (serverSideEncryption.compare(0, 7, "aws:kms") == 0) return false;
        if (etag.size() != 32) return false;
        for (char c : etag) {
            if (!std::isxdigit(static_cast<unsigned char>(c))) return false;
        }
        return true;
    }
};

// inclusive byte range, rendered as "bytes=<first>-<last>"
struct ByteRange {
    uint64_t first;
    uint64_t last;

    uint64_t length() const { return last - first + 1; }
    std::string header() const {
        return "bytes=" + std::to_string(first) + "-" + std::to_string(last);
    }
};

// read side of a transfer: any store that can report an object's size and serve byte ranges
class ObjectStore {
public:
    virtual ~ObjectStore() = default;

    // NotFound / AccessDenied when the object is missing or not readable
    virtual Result<ObjectInfo> headObject(const std::string& bucket, const std::string& key) = 0;

    // SourceReadFailure on transport or auth errors; an empty result means no data at that offset
    virtual Result<std::vector<char>> rangeRead(const std::string& bucket, const std::string& key, const ByteRange& range) = 0;
};
