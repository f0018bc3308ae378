#pragma once
#include <cstddef>
#include <string>

typedef struct evp_md_ctx_st EVP_MD_CTX;

// Incremental SHA-256 + MD5 over everything written to the destination.
// MD5 is kept only to compare against single part S3 ETags.
class StreamDigest {
public:
    StreamDigest();
    ~StreamDigest();
    StreamDigest(const StreamDigest&) = delete;
    StreamDigest& operator=(const StreamDigest&) = delete;

    void update(const char* data, size_t len);

    // finishes both digests; further updates are ignored
    void finish();

    const std::string& sha256Hex() const { return sha256Hex_; }
    const std::string& md5Hex() const { return md5Hex_; }

private:
    EVP_MD_CTX* sha256Ctx_;
    EVP_MD_CTX* md5Ctx_;
    bool finished_;
    std::string sha256Hex_;
    std::string md5Hex_;
};
