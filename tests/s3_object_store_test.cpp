#include "source/s3_object_store.hpp"
#include <gtest/gtest.h>

using Aws::Http::HttpResponseCode;
using Aws::S3::S3Errors;

TEST(S3ObjectStoreTest, ErrorsMapOntoTheTaxonomy) {
    EXPECT_EQ(S3ObjectStore::classifyError(S3Errors::NO_SUCH_KEY, HttpResponseCode::NOT_FOUND), ErrorKind::NotFound);
    EXPECT_EQ(S3ObjectStore::classifyError(S3Errors::NO_SUCH_BUCKET, HttpResponseCode::NOT_FOUND), ErrorKind::NotFound);
    // HEAD responses carry no error body, only the status
    EXPECT_EQ(S3ObjectStore::classifyError(S3Errors::UNKNOWN, HttpResponseCode::NOT_FOUND), ErrorKind::NotFound);
    EXPECT_EQ(S3ObjectStore::classifyError(S3Errors::UNKNOWN, HttpResponseCode::FORBIDDEN), ErrorKind::AccessDenied);
    EXPECT_EQ(S3ObjectStore::classifyError(S3Errors::ACCESS_DENIED, HttpResponseCode::FORBIDDEN), ErrorKind::AccessDenied);
    EXPECT_EQ(S3ObjectStore::classifyError(S3Errors::INVALID_ACCESS_KEY_ID, HttpResponseCode::FORBIDDEN),
              ErrorKind::AccessDenied);
    EXPECT_EQ(S3ObjectStore::classifyError(S3Errors::INTERNAL_FAILURE, HttpResponseCode::SERVICE_UNAVAILABLE),
              ErrorKind::SourceReadFailure);
    EXPECT_EQ(S3ObjectStore::classifyError(S3Errors::NETWORK_CONNECTION, HttpResponseCode::REQUEST_NOT_MADE),
              ErrorKind::SourceReadFailure);
}

TEST(S3ObjectStoreTest, EtagQuotesAreStripped) {
    EXPECT_EQ(S3ObjectStore::unquoteEtag("\"9e107d9d372bb6826bd81d3542a419d6\""), "9e107d9d372bb6826bd81d3542a419d6");
    EXPECT_EQ(S3ObjectStore::unquoteEtag("\"abc-2\""), "abc-2");
    EXPECT_EQ(S3ObjectStore::unquoteEtag("plain"), "plain");
    EXPECT_EQ(S3ObjectStore::unquoteEtag("\""), "\"");
    EXPECT_EQ(S3ObjectStore::unquoteEtag(""), "");
}

TEST(S3ObjectStoreTest, MalformedEndpointIsRejected) {
    AwsSdkScope sdk;
    EXPECT_EQ(S3ObjectStore::create(S3Settings{"us-east-1", "minio.local:9000"}).kind, ErrorKind::InvalidConfiguration);
    EXPECT_EQ(S3ObjectStore::create(S3Settings{"us-east-1", "ftp://minio.local"}).kind, ErrorKind::InvalidConfiguration);
    EXPECT_EQ(S3ObjectStore::create(S3Settings{"us-east-1", "http://"}).kind, ErrorKind::InvalidConfiguration);
    EXPECT_EQ(S3ObjectStore::create(S3Settings{"us-east-1", "http://minio.local/bucket"}).kind,
              ErrorKind::InvalidConfiguration);

    Result<std::unique_ptr<S3ObjectStore>> store = S3ObjectStore::create(S3Settings{"eu-west-1", "http://127.0.0.1:9000/"});
    ASSERT_TRUE(store.success) << store.message;
    EXPECT_NE(store.data, nullptr);
}

TEST(ObjectInfoTest, OnlyPlainOrSseS3SinglePartEtagsAreContentMd5) {
    ObjectInfo info;
    info.etag = "9e107d9d372bb6826bd81d3542a419d6";
    EXPECT_TRUE(info.etagIsContentMd5());

    info.serverSideEncryption = "AES256";
    EXPECT_TRUE(info.etagIsContentMd5());

    info.serverSideEncryption = "aws:kms";
    EXPECT_FALSE(info.etagIsContentMd5());
    info.serverSideEncryption = "aws:kms:dsse";
    EXPECT_FALSE(info.etagIsContentMd5());

    info.serverSideEncryption = "";
    info.customerKey = true;
    EXPECT_FALSE(info.etagIsContentMd5());

    ObjectInfo multipart;
    multipart.etag = "9e107d9d372bb6826bd81d3542a419d6-12";
    EXPECT_FALSE(multipart.etagIsContentMd5());

    ObjectInfo notHex;
    notHex.etag = "9e107d9d372bb6826bd81d3542a419dz";
    EXPECT_FALSE(notHex.etagIsContentMd5());
}
