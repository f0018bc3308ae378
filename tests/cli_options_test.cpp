#include "cli/cli_options.hpp"
#include "cli/console.hpp"
#include <gtest/gtest.h>
#include <sstream>

namespace {
    std::vector<std::string> requiredTransferArgs() {
        return {"--server", "fs01", "--share", "backups", "--bucket", "archive",
                "--s3-key", "2024/db.dump", "--smb-filename", "db.dump"};
    }
}

TEST(CliOptionsTest, TransferDefaults) {
    Result<TransferCommandOptions> opts = parseTransferOptions(requiredTransferArgs());
    ASSERT_TRUE(opts.success) << opts.message;
    EXPECT_EQ(opts.data.server, "fs01");
    EXPECT_EQ(opts.data.share, "backups");
    EXPECT_EQ(opts.data.bucket, "archive");
    EXPECT_EQ(opts.data.s3Key, "2024/db.dump");
    EXPECT_EQ(opts.data.smbFilename, "db.dump");
    EXPECT_EQ(opts.data.port, 445);
    EXPECT_EQ(opts.data.writeSize, 65536u);
    EXPECT_EQ(opts.data.transfer.policy, FetchPolicy::Aligned);
    EXPECT_FALSE(opts.data.transfer.pipeline);
    EXPECT_TRUE(opts.data.mountRoot.empty());
}

TEST(CliOptionsTest, TransferOptionalFlags) {
    std::vector<std::string> args = requiredTransferArgs();
    for (const char* extra : {"--port", "1445", "--write-size", "1MB", "--fetch-policy", "streaming",
                              "--fetch-window", "16KB", "--pipeline", "--s3-endpoint", "http://127.0.0.1:9000",
                              "--region", "eu-west-1", "--mount-root", "/mnt/fs01", "--max-write", "256KB", "--verbose"}) {
        args.push_back(extra);
    }

    Result<TransferCommandOptions> opts = parseTransferOptions(args);
    ASSERT_TRUE(opts.success) << opts.message;
    EXPECT_EQ(opts.data.port, 1445);
    EXPECT_EQ(opts.data.writeSize, 1024u * 1024);
    EXPECT_EQ(opts.data.transfer.policy, FetchPolicy::Streaming);
    EXPECT_EQ(opts.data.transfer.fetchWindow, 16u * 1024);
    EXPECT_TRUE(opts.data.transfer.pipeline);
    EXPECT_EQ(opts.data.s3Endpoint, "http://127.0.0.1:9000");
    EXPECT_EQ(opts.data.region, "eu-west-1");
    EXPECT_EQ(opts.data.mountRoot, "/mnt/fs01");
    EXPECT_EQ(opts.data.mountMaxWrite, 256u * 1024);
    EXPECT_EQ(opts.data.logLevel, LogLevel::Debug);
}

TEST(CliOptionsTest, MissingRequiredFlagIsRejected) {
    std::vector<std::string> args = requiredTransferArgs();
    args.erase(args.begin() + 4, args.begin() + 6);   // --bucket archive
    Result<TransferCommandOptions> opts = parseTransferOptions(args);
    EXPECT_EQ(opts.kind, ErrorKind::InvalidConfiguration);
    EXPECT_NE(opts.message.find("--bucket"), std::string::npos);
}

TEST(CliOptionsTest, BadValuesAreRejected) {
    auto parseWith = [](std::vector<std::string> extra) {
        std::vector<std::string> args = requiredTransferArgs();
        args.insert(args.end(), extra.begin(), extra.end());
        return parseTransferOptions(args);
    };

    EXPECT_EQ(parseWith({"--write-size", "64QB"}).kind, ErrorKind::InvalidConfiguration);
    EXPECT_EQ(parseWith({"--write-size", "0"}).kind, ErrorKind::InvalidConfiguration);
    EXPECT_EQ(parseWith({"--port", "70000"}).kind, ErrorKind::InvalidConfiguration);
    EXPECT_EQ(parseWith({"--fetch-policy", "eager"}).kind, ErrorKind::InvalidConfiguration);
    EXPECT_EQ(parseWith({"--bogus", "1"}).kind, ErrorKind::InvalidConfiguration);
    EXPECT_EQ(parseWith({"--write-size"}).kind, ErrorKind::InvalidConfiguration);
    EXPECT_EQ(parseWith({"--write-size", "--pipeline"}).kind, ErrorKind::InvalidConfiguration);
}

TEST(CliOptionsTest, MountWriteSizeMustFitOneSmbWrite) {
    std::vector<std::string> args = requiredTransferArgs();
    args.insert(args.end(), {"--mount-root", "/mnt/fs01", "--max-write", "8MB"});
    EXPECT_TRUE(parseTransferOptions(args).success);

    args.back() = "1GB";
    EXPECT_EQ(parseTransferOptions(args).kind, ErrorKind::InvalidConfiguration);
    args.back() = "0";
    EXPECT_EQ(parseTransferOptions(args).kind, ErrorKind::InvalidConfiguration);
}

TEST(CliOptionsTest, UsageHasNoServerMode) {
    std::string usage = usageText();
    EXPECT_NE(usage.find("s3share transfer"), std::string::npos);
    EXPECT_EQ(usage.find("serve"), std::string::npos);
}

TEST(ConsoleTest, SplitsDomainFromUser) {
    std::string domain, username;
    splitDomainUser("CORP\\alice", domain, username);
    EXPECT_EQ(domain, "CORP");
    EXPECT_EQ(username, "alice");

    splitDomainUser("bob", domain, username);
    EXPECT_EQ(domain, "");
    EXPECT_EQ(username, "bob");
}

TEST(ConsoleTest, PromptReadsUserAndPassword) {
    std::istringstream in("  CORP\\alice \nhunter2\r\n");
    std::ostringstream out;
    Credentials creds = promptCredentials(in, out, "SMB Credentials");
    EXPECT_EQ(creds.domain, "CORP");
    EXPECT_EQ(creds.username, "alice");
    EXPECT_EQ(creds.password, "hunter2");
    EXPECT_NE(out.str().find("SMB Credentials"), std::string::npos);
    EXPECT_NE(out.str().find("Password: "), std::string::npos);
}
