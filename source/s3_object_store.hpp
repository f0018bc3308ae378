#pragma once
#include <memory>
#include <string>
#include <aws/core/Aws.h>
#include <aws/core/http/HttpResponse.h>
#include <aws/s3/S3Client.h>
#include <aws/s3/S3Errors.h>
#include "object_store.hpp"

// Aws::InitAPI for the lifetime of the scope. Every S3ObjectStore must be
// destroyed before the scope ends.
class AwsSdkScope {
public:
    AwsSdkScope();
    ~AwsSdkScope();
    AwsSdkScope(const AwsSdkScope&) = delete;
    AwsSdkScope& operator=(const AwsSdkScope&) = delete;

private:
    Aws::SDKOptions options_;
};

struct S3Settings {
    std::string region;
    std::string endpoint;   // "http(s)://host[:port]" of an S3 compatible store, empty for AWS
};

// ObjectStore over aws-sdk-cpp. Credentials come from the SDK's default
// provider chain: environment, shared profiles, SSO, container and instance roles.
class S3ObjectStore : public ObjectStore {
public:
    // InvalidConfiguration for a malformed endpoint
    static Result<std::unique_ptr<S3ObjectStore>> create(const S3Settings& settings);

    Result<ObjectInfo> headObject(const std::string& bucket, const std::string& key) override;
    Result<std::vector<char>> rangeRead(const std::string& bucket, const std::string& key, const ByteRange& range) override;

    static ErrorKind classifyError(Aws::S3::S3Errors type, Aws::Http::HttpResponseCode code);
    static std::string unquoteEtag(const std::string& etag);

private:
    explicit S3ObjectStore(std::unique_ptr<Aws::S3::S3Client> client);

    std::unique_ptr<Aws::S3::S3Client> client_;
};
