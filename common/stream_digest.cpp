#include "stream_digest.hpp"
#include "hash_utils.hpp"
#include <openssl/evp.h>
#include <stdexcept>

StreamDigest::StreamDigest() : sha256Ctx_(EVP_MD_CTX_new()), md5Ctx_(EVP_MD_CTX_new()), finished_(false) {
    if (sha256Ctx_ == nullptr || md5Ctx_ == nullptr ||
        EVP_DigestInit_ex(sha256Ctx_, EVP_sha256(), nullptr) != 1 ||
        EVP_DigestInit_ex(md5Ctx_, EVP_md5(), nullptr) != 1) {
        EVP_MD_CTX_free(sha256Ctx_);
        EVP_MD_CTX_free(md5Ctx_);
        throw std::runtime_error("Failed to initialise digest contexts");
    }
}

StreamDigest::~StreamDigest() {
    EVP_MD_CTX_free(sha256Ctx_);
    EVP_MD_CTX_free(md5Ctx_);
}

void StreamDigest::update(const char* data, size_t len) {
    if (finished_ || len == 0) return;
    EVP_DigestUpdate(sha256Ctx_, data, len);
    EVP_DigestUpdate(md5Ctx_, data, len);
}

void StreamDigest::finish() {
    if (finished_) return;
    finished_ = true;

    unsigned char out[EVP_MAX_MD_SIZE];
    unsigned int outLen = 0;
    if (EVP_DigestFinal_ex(sha256Ctx_, out, &outLen) == 1) {
        sha256Hex_ = HashUtils::toHex(out, outLen);
    }
    if (EVP_DigestFinal_ex(md5Ctx_, out, &outLen) == 1) {
        md5Hex_ = HashUtils::toHex(out, outLen);
    }
}
