#include "cli/commands.hpp"
#include "common/stream_digest.hpp"
#include "fakes.hpp"
#include <gtest/gtest.h>
#include <cctype>

namespace {
    TransferCommandOptions optionsFor(uint64_t writeSize) {
        TransferCommandOptions opts;
        opts.server = "fs01";
        opts.share = "backups";
        opts.bucket = "archive";
        opts.s3Key = "2024/db.dump";
        opts.smbFilename = "db.dump";
        opts.writeSize = writeSize;
        opts.logLevel = LogLevel::Warn;
        return opts;
    }

    std::string md5Of(const std::vector<char>& data) {
        StreamDigest digest;
        digest.update(data.data(), data.size());
        digest.finish();
        return digest.md5Hex();
    }

    std::string upper(std::string s) {
        for (char& c : s) c = static_cast<char>(std::toupper(static_cast<unsigned char>(c)));
        return s;
    }

    const Credentials alice{"alice", "secret", "CORP"};
}

TEST(ExecuteTransferTest, MatchingEtagSucceeds) {
    std::vector<char> content = makeObject(300000);
    FakeObjectStore store(content);
    store.etag = upper(md5Of(content));
    RecordingShareClient share(65536);
    CancellationToken cancel;

    Result<void> outcome = executeTransfer(store, share, optionsFor(65536), alice, cancel);

    ASSERT_TRUE(outcome.success) << outcome.describe();
    EXPECT_EQ(exitCodeFor(outcome), 0);
    EXPECT_EQ(share.files[11], content);
    EXPECT_EQ(share.lastFilename, "db.dump");
}

TEST(ExecuteTransferTest, MismatchingEtagFailsAfterTheWrite) {
    FakeObjectStore store(makeObject(5000));
    store.etag = "0123456789abcdef0123456789abcdef";
    RecordingShareClient share(65536);
    CancellationToken cancel;

    Result<void> outcome = executeTransfer(store, share, optionsFor(1024), alice, cancel);

    EXPECT_EQ(outcome.kind, ErrorKind::SourceReadFailure);
    EXPECT_NE(outcome.message.find("does not match ETag"), std::string::npos);
    EXPECT_EQ(exitCodeFor(outcome), 1);
    EXPECT_EQ(share.writes.size(), 5u);
}

TEST(ExecuteTransferTest, OpaqueEtagsAreNotCompared) {
    const std::string wrongMd5 = "0123456789abcdef0123456789abcdef";
    CancellationToken cancel;

    FakeObjectStore multipart(makeObject(5000));
    multipart.etag = wrongMd5 + "-3";
    RecordingShareClient first(65536);
    EXPECT_TRUE(executeTransfer(multipart, first, optionsFor(1024), alice, cancel).success);

    FakeObjectStore kms(makeObject(5000));
    kms.etag = wrongMd5;
    kms.serverSideEncryption = "aws:kms";
    RecordingShareClient second(65536);
    EXPECT_TRUE(executeTransfer(kms, second, optionsFor(1024), alice, cancel).success);

    FakeObjectStore customerKey(makeObject(5000));
    customerKey.etag = wrongMd5;
    customerKey.serverSideEncryption = "AES256";
    customerKey.customerKey = true;
    RecordingShareClient third(65536);
    EXPECT_TRUE(executeTransfer(customerKey, third, optionsFor(1024), alice, cancel).success);
}

TEST(ExecuteTransferTest, SseS3EtagIsStillCompared) {
    FakeObjectStore store(makeObject(5000));
    store.etag = "0123456789abcdef0123456789abcdef";
    store.serverSideEncryption = "AES256";
    RecordingShareClient share(65536);
    CancellationToken cancel;

    EXPECT_EQ(executeTransfer(store, share, optionsFor(1024), alice, cancel).kind, ErrorKind::SourceReadFailure);
}

TEST(ExecuteTransferTest, SizeMismatchSkipsTheEtagCheck) {
    FakeObjectStore store(makeObject(5000));
    store.reportedSize = 8000;
    store.etag = "0123456789abcdef0123456789abcdef";
    RecordingShareClient share(65536);
    CancellationToken cancel;

    Result<void> outcome = executeTransfer(store, share, optionsFor(1024), alice, cancel);

    EXPECT_TRUE(outcome.success) << outcome.describe();
    EXPECT_EQ(share.files[11].size(), 5000u);
}

TEST(ExecuteTransferTest, SessionIsTornDownAfterTheFileCloses) {
    FakeObjectStore store(makeObject(3000));
    RecordingShareClient share(65536);
    CancellationToken cancel;

    ASSERT_TRUE(executeTransfer(store, share, optionsFor(1024), alice, cancel).success);

    std::vector<std::string> expected{"connect", "authenticate", "mount", "open", "close", "unmount", "logoff", "disconnect"};
    EXPECT_EQ(share.calls, expected);
    EXPECT_EQ(store.heads, 1);
}

TEST(ExecuteTransferTest, FailedLogonNeverTouchesTheSource) {
    FakeObjectStore store(makeObject(3000));
    RecordingShareClient share(65536);
    CancellationToken cancel;

    Result<void> outcome = executeTransfer(store, share, optionsFor(1024), Credentials{"intruder", "x", ""}, cancel);

    EXPECT_EQ(outcome.kind, ErrorKind::AccessDenied);
    EXPECT_EQ(store.heads, 0);
    EXPECT_EQ(share.opens, 0);
    EXPECT_EQ(share.disconnects, 1);
}

TEST(ExecuteTransferTest, CancellationExitsWithFailureStatus) {
    FakeObjectStore store(makeObject(100000));
    RecordingShareClient share(1000);
    CancellationToken cancel;
    share.onWrite = [&]() {
        if (share.writes.size() == 3) cancel.cancel();
    };

    Result<void> outcome = executeTransfer(store, share, optionsFor(1000), alice, cancel);

    EXPECT_EQ(outcome.kind, ErrorKind::Cancelled);
    EXPECT_EQ(exitCodeFor(outcome), 1);
    EXPECT_EQ(share.closes, 1);
    EXPECT_EQ(share.unmounts, 1);
}

TEST(ExitCodeTest, ZeroOnlyOnSuccess) {
    EXPECT_EQ(exitCodeFor(Result<void>::Ok()), 0);
    EXPECT_EQ(exitCodeFor(Result<void>::Error(ErrorKind::NotFound, "missing")), 1);
    EXPECT_EQ(exitCodeFor(Result<void>::Error(ErrorKind::Cancelled, "interrupted")), 1);
}
