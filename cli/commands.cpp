#include "commands.hpp"
#include "console.hpp"
#include "../common/logger.hpp"
#include "../common/size_utils.hpp"
#include "../destination/destination_session.hpp"
#include "../destination/local_share_client.hpp"
#include "../destination/smb2_share_client.hpp"
#include "../source/s3_object_store.hpp"
#include "../transfer/transfer_orchestrator.hpp"
#include <cctype>
#include <cstdlib>
#include <memory>

namespace {
    std::string resolveRegion(const std::string& flag) {
        if (!flag.empty()) return flag;
        for (const char* name : {"AWS_REGION", "AWS_DEFAULT_REGION"}) {
            const char* value = std::getenv(name);
            if (value && *value) return value;
        }
        return Config::DEFAULT_S3_REGION;
    }

    std::string lower(std::string s) {
        for (char& c : s) c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
        return s;
    }
}

int exitCodeFor(const Result<void>& outcome) {
    return outcome.success ? 0 : 1;
}

Result<void> executeTransfer(ObjectStore& source, ShareClient& share, const TransferCommandOptions& opts,
                             const Credentials& credentials, const CancellationToken& cancel) {
    Logger::info("Main", "Write buffer size: " + formatWithCommas(opts.writeSize) + " bytes (" +
                         std::to_string(opts.writeSize / 1024) + "KB)");

    DestinationSession session(share);
    Result<void> opened = session.open(ShareTarget{opts.server, opts.port, opts.share}, credentials);
    if (!opened.success) return opened;

    Result<ObjectInfo> info = source.headObject(opts.bucket, opts.s3Key);
    if (!info.success) return Result<void>::From(info);
    Logger::info("Main", "S3 object size: " + formatWithCommas(info.data.size) + " bytes (" +
                         std::to_string(info.data.size / 1024 / 1024) + " MB)");

    TransferRequest request{opts.bucket, opts.s3Key, info.data.size, opts.smbFilename, opts.writeSize};
    TransferOrchestrator orchestrator(source, share, opts.transfer, cancel);
    orchestrator.setProgressCallback(ProgressReporter());

    Result<TransferResult> result = orchestrator.run(request, SinkTarget{session.treeId(), session.maxWriteSize()});
    session.close();
    if (!result.success) return Result<void>::From(result);

    printSummary(result.data);

    if (result.data.sizeMismatch) {
        Logger::warn("Summary", "Size changed during the transfer, ETag not checked");
    } else if (!info.data.etagIsContentMd5()) {
        Logger::debug("Summary", "ETag '" + info.data.etag + "' is not a content MD5, not checked");
    } else if (lower(info.data.etag) != result.data.md5) {
        return Result<void>::Error(ErrorKind::SourceReadFailure,
                                   "Content MD5 " + result.data.md5 + " does not match ETag " + info.data.etag);
    } else {
        Logger::info("Summary", "MD5 matches S3 ETag");
    }
    return Result<void>::Ok();
}

Result<void> runTransferCommand(const TransferCommandOptions& opts, const Credentials& credentials,
                                const CancellationToken& cancel) {
    // declared first so the clients below are gone before ShutdownAPI
    AwsSdkScope sdk;

    Result<std::unique_ptr<S3ObjectStore>> store = S3ObjectStore::create(S3Settings{resolveRegion(opts.region), opts.s3Endpoint});
    if (!store.success) return Result<void>::From(store);

    std::unique_ptr<ShareClient> share;
    if (!opts.mountRoot.empty()) {
        share = std::make_unique<LocalShareClient>(opts.mountRoot, opts.mountMaxWrite);
    } else {
        share = std::make_unique<Smb2ShareClient>(cancel);
    }

    return executeTransfer(*store.data, *share, opts, credentials, cancel);
}
