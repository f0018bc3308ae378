#pragma once
#include <cstdint>
#include <string>
#include <vector>
#include "../common/config.hpp"
#include "../common/logger.hpp"
#include "../common/result.hpp"
#include "../transfer/transfer_types.hpp"

struct TransferCommandOptions {
    std::string server;
    int port = Config::DEFAULT_SHARE_PORT;
    std::string share;
    std::string bucket;
    std::string s3Key;
    std::string smbFilename;
    uint64_t writeSize = Config::DEFAULT_WRITE_SIZE;
    TransferOptions transfer;
    std::string s3Endpoint;
    std::string region;         // empty -> AWS_REGION / AWS_DEFAULT_REGION / us-east-1
    std::string mountRoot;      // set -> write through a local mount instead of the network
    uint32_t mountMaxWrite = Config::DEFAULT_MOUNT_MAX_WRITE;
    LogLevel logLevel = LogLevel::Info;
};

// args exclude the program name and the sub command
Result<TransferCommandOptions> parseTransferOptions(const std::vector<std::string>& args);

std::string usageText();
