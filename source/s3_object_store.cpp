#include "s3_object_store.hpp"
#include "../common/config.hpp"
#include "../common/logger.hpp"
#include <aws/core/auth/AWSAuthSigner.h>
#include <aws/core/client/ClientConfiguration.h>
#include <aws/s3/model/GetObjectRequest.h>
#include <aws/s3/model/HeadObjectRequest.h>
#include <aws/s3/model/ServerSideEncryption.h>

namespace {
    std::string objectUrl(const std::string& bucket, const std::string& key) {
        return "s3://" + bucket + "/" + key;
    }

    template<typename Error>
    std::string describeError(const Error& error) {
        std::string name = error.GetExceptionName().c_str();
        std::string message = error.GetMessage().c_str();
        std::string status = std::to_string(static_cast<int>(error.GetResponseCode()));
        if (name.empty()) return "HTTP " + status + " " + message;
        return "HTTP " + status + " " + name + (message.empty() ? "" : ": " + message);
    }
}

AwsSdkScope::AwsSdkScope() {
    Aws::InitAPI(options_);
}

AwsSdkScope::~AwsSdkScope() {
    Aws::ShutdownAPI(options_);
}

S3ObjectStore::S3ObjectStore(std::unique_ptr<Aws::S3::S3Client> client) : client_(std::move(client)) {}

Result<std::unique_ptr<S3ObjectStore>> S3ObjectStore::create(const S3Settings& settings) {
    using Created = Result<std::unique_ptr<S3ObjectStore>>;

    Aws::Client::ClientConfiguration config;
    config.region = settings.region.empty() ? Config::DEFAULT_S3_REGION : settings.region.c_str();
    config.connectTimeoutMs = Config::HTTP_TIMEOUT_SECONDS * 1000;
    config.requestTimeoutMs = Config::HTTP_TIMEOUT_SECONDS * 1000;

    bool custom = !settings.endpoint.empty();
    if (custom) {
        std::string host;
        if (settings.endpoint.compare(0, 7, "http://") == 0) {
            config.scheme = Aws::Http::Scheme::HTTP;
            host = settings.endpoint.substr(7);
        } else if (settings.endpoint.compare(0, 8, "https://") == 0) {
            config.scheme = Aws::Http::Scheme::HTTPS;
            host = settings.endpoint.substr(8);
        } else {
            return Created::Error(ErrorKind::InvalidConfiguration,
                                  "S3 endpoint must start with http:// or https://: " + settings.endpoint);
        }
        while (!host.empty() && host.back() == '/') host.pop_back();
        if (host.empty() || host.find('/') != std::string::npos) {
            return Created::Error(ErrorKind::InvalidConfiguration, "S3 endpoint must be scheme://host[:port]: " + settings.endpoint);
        }
        config.endpointOverride = host.c_str();
    }

    // S3 compatible stores are addressed path style
    auto client = std::make_unique<Aws::S3::S3Client>(config, Aws::Client::AWSAuthV4Signer::PayloadSigningPolicy::Never,
                                                      !custom);
    Logger::debug("S3", std::string("Client for region ") + config.region.c_str() +
                        (custom ? " at " + settings.endpoint : ""));
    return Created::Ok(std::unique_ptr<S3ObjectStore>(new S3ObjectStore(std::move(client))));
}

Result<ObjectInfo> S3ObjectStore::headObject(const std::string& bucket, const std::string& key) {
    Aws::S3::Model::HeadObjectRequest request;
    request.SetBucket(bucket.c_str());
    request.SetKey(key.c_str());

    auto outcome = client_->HeadObject(request);
    if (!outcome.IsSuccess()) {
        const auto& error = outcome.GetError();
        return Result<ObjectInfo>::Error(classifyError(error.GetErrorType(), error.GetResponseCode()),
                                         "HEAD " + objectUrl(bucket, key) + " failed: " + describeError(error));
    }

    const auto& result = outcome.GetResult();
    if (result.GetContentLength() < 0) {
        return Result<ObjectInfo>::Error(ErrorKind::SourceReadFailure, "HEAD " + objectUrl(bucket, key) + " returned no size");
    }

    ObjectInfo info;
    info.size = static_cast<uint64_t>(result.GetContentLength());
    info.etag = unquoteEtag(result.GetETag().c_str());
    info.serverSideEncryption =
        Aws::S3::Model::ServerSideEncryptionMapper::GetNameForServerSideEncryption(result.GetServerSideEncryption()).c_str();
    info.customerKey = !result.GetSSECustomerAlgorithm().empty();
    return Result<ObjectInfo>::Ok(info);
}

Result<std::vector<char>> S3ObjectStore::rangeRead(const std::string& bucket, const std::string& key, const ByteRange& range) {
    Aws::S3::Model::GetObjectRequest request;
    request.SetBucket(bucket.c_str());
    request.SetKey(key.c_str());
    request.SetRange(range.header().c_str());

    auto outcome = client_->GetObject(request);
    if (!outcome.IsSuccess()) {
        const auto& error = outcome.GetError();
        // range starts past the end of the object
        if (error.GetResponseCode() == Aws::Http::HttpResponseCode::REQUESTED_RANGE_NOT_SATISFIABLE) {
            return Result<std::vector<char>>::Ok({});
        }
        return Result<std::vector<char>>::Error(ErrorKind::SourceReadFailure,
                                                "GET " + range.header() + " of " + objectUrl(bucket, key) +
                                                " failed: " + describeError(error));
    }

    auto& result = outcome.GetResult();
    long long length = result.GetContentLength();
    if (length < 0 || static_cast<uint64_t>(length) > range.length()) {
        return Result<std::vector<char>>::Error(ErrorKind::SourceReadFailure,
                                                "GET " + range.header() + " returned " + std::to_string(length) +
                                                " bytes, the store ignored the range");
    }

    std::vector<char> bytes(static_cast<size_t>(length));
    auto& body = result.GetBody();
    body.read(bytes.data(), static_cast<std::streamsize>(bytes.size()));
    if (static_cast<uint64_t>(body.gcount()) != bytes.size()) {
        return Result<std::vector<char>>::Error(ErrorKind::SourceReadFailure,
                                                "GET " + range.header() + " body ended after " +
                                                std::to_string(body.gcount()) + " of " + std::to_string(length) + " bytes");
    }
    return Result<std::vector<char>>::Ok(std::move(bytes));
}

ErrorKind S3ObjectStore::classifyError(Aws::S3::S3Errors type, Aws::Http::HttpResponseCode code) {
    using Aws::S3::S3Errors;
    using Aws::Http::HttpResponseCode;

    if (type == S3Errors::NO_SUCH_KEY || type == S3Errors::NO_SUCH_BUCKET || type == S3Errors::RESOURCE_NOT_FOUND ||
        code == HttpResponseCode::NOT_FOUND) {
        return ErrorKind::NotFound;
    }
    if (type == S3Errors::ACCESS_DENIED || type == S3Errors::INVALID_ACCESS_KEY_ID ||
        type == S3Errors::SIGNATURE_DOES_NOT_MATCH || type == S3Errors::MISSING_AUTHENTICATION_TOKEN ||
        code == HttpResponseCode::FORBIDDEN || code == HttpResponseCode::UNAUTHORIZED) {
        return ErrorKind::AccessDenied;
    }
    return ErrorKind::SourceReadFailure;
}

std::string S3ObjectStore::unquoteEtag(const std::string& etag) {
    if (etag.size() >= 2 && etag.front() == '"' && etag.back() == '"') return etag.substr(1, etag.size() - 2);
    return etag;
}
