#include "cli_options.hpp"
#include "../common/size_utils.hpp"
#include <cstdlib>
#include <limits>
#include <utility>

namespace {
    Result<std::string> takeValue(const std::vector<std::string>& args, size_t& i) {
        if (i + 1 >= args.size() || args[i + 1].rfind("--", 0) == 0) {
            return Result<std::string>::Error(ErrorKind::InvalidConfiguration, "Missing value for " + args[i]);
        }
        return Result<std::string>::Ok(args[++i]);
    }

    Result<int> parsePort(const std::string& value) {
        char* end = nullptr;
        long port = std::strtol(value.c_str(), &end, 10);
        if (value.empty() || *end != '\0' || port < 0 || port > 65535) {
            return Result<int>::Error(ErrorKind::InvalidConfiguration, "Invalid port: " + value);
        }
        return Result<int>::Ok(static_cast<int>(port));
    }

    Result<uint32_t> parseMaxWrite(const std::string& value) {
        Result<uint64_t> size = parseSize(value);
        if (!size.success) return Result<uint32_t>::From(size);
        if (size.data == 0 || size.data > Config::MAX_MOUNT_MAX_WRITE) {
            return Result<uint32_t>::Error(ErrorKind::InvalidConfiguration, "Maximum write size out of range: " + value);
        }
        return Result<uint32_t>::Ok(static_cast<uint32_t>(size.data));
    }

    Result<void> requireSet(const std::string& value, const char* flag) {
        if (value.empty()) return Result<void>::Error(ErrorKind::InvalidConfiguration, std::string("Missing required ") + flag);
        return Result<void>::Ok();
    }
}

Result<TransferCommandOptions> parseTransferOptions(const std::vector<std::string>& args) {
    using R = Result<TransferCommandOptions>;
    TransferCommandOptions opts;

    for (size_t i = 0; i < args.size(); ++i) {
        const std::string& arg = args[i];

        if (arg == "--pipeline") { opts.transfer.pipeline = true; continue; }
        if (arg == "--verbose") { opts.logLevel = LogLevel::Debug; continue; }
        if (arg == "--quiet") { opts.logLevel = LogLevel::Warn; continue; }

        Result<std::string> value = takeValue(args, i);
        if (!value.success) return R::From(value);

        if (arg == "--server") {
            opts.server = value.data;
        } else if (arg == "--port") {
            Result<int> port = parsePort(value.data);
            if (!port.success) return R::From(port);
            opts.port = port.data;
        } else if (arg == "--share") {
            opts.share = value.data;
        } else if (arg == "--bucket") {
            opts.bucket = value.data;
        } else if (arg == "--s3-key") {
            opts.s3Key = value.data;
        } else if (arg == "--smb-filename") {
            opts.smbFilename = value.data;
        } else if (arg == "--write-size") {
            Result<uint64_t> size = parseSize(value.data);
            if (!size.success) return R::Error(size.kind, "Invalid write size format: " + value.data);
            if (size.data > static_cast<uint64_t>(std::numeric_limits<int64_t>::max())) {
                return R::Error(ErrorKind::InvalidConfiguration, "Write size too large: " + value.data);
            }
            opts.writeSize = size.data;
        } else if (arg == "--fetch-policy") {
            if (value.data == "aligned") opts.transfer.policy = FetchPolicy::Aligned;
            else if (value.data == "streaming") opts.transfer.policy = FetchPolicy::Streaming;
            else return R::Error(ErrorKind::InvalidConfiguration, "Unknown fetch policy: " + value.data);
        } else if (arg == "--fetch-window") {
            Result<uint64_t> size = parseSize(value.data);
            if (!size.success) return R::Error(size.kind, "Invalid fetch window: " + value.data);
            opts.transfer.fetchWindow = size.data;
        } else if (arg == "--s3-endpoint") {
            opts.s3Endpoint = value.data;
        } else if (arg == "--region") {
            opts.region = value.data;
        } else if (arg == "--mount-root") {
            opts.mountRoot = value.data;
        } else if (arg == "--max-write") {
            Result<uint32_t> size = parseMaxWrite(value.data);
            if (!size.success) return R::From(size);
            opts.mountMaxWrite = size.data;
        } else {
            return R::Error(ErrorKind::InvalidConfiguration, "Unknown option: " + arg);
        }
    }

    for (const auto& required : {std::make_pair(&opts.server, "--server"), std::make_pair(&opts.share, "--share"),
                                 std::make_pair(&opts.bucket, "--bucket"), std::make_pair(&opts.s3Key, "--s3-key"),
                                 std::make_pair(&opts.smbFilename, "--smb-filename")}) {
        Result<void> set = requireSet(*required.first, required.second);
        if (!set.success) return R::From(set);
    }
    return R::Ok(opts);
}

std::string usageText() {
    return
        "Usage:\n"
        " s3share transfer --server HOST --share NAME --bucket BUCKET --s3-key KEY --smb-filename FILE\n"
        "                  [--port N] [--write-size SIZE] [--fetch-policy aligned|streaming]\n"
        "                  [--fetch-window SIZE] [--pipeline] [--s3-endpoint URL] [--region REGION]\n"
        "                  [--mount-root DIR [--max-write SIZE]] [--verbose|--quiet]\n"
        "\n"
        "SIZE accepts raw bytes or KB/MB/GB suffixes (16KB, 64KB, 256KB, 1MB).\n"
        "Share credentials are prompted for, never passed on the command line.\n"
        "S3 credentials come from the AWS environment, profile, SSO or instance role.\n";
}
