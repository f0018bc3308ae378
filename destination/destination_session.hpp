#pragma once
#include <cstdint>
#include <string>
#include "share_client.hpp"

// connect -> authenticate -> mount on open(), the reverse on close() or
// destruction. Teardown steps are best effort and only logged.
class DestinationSession {
public:
    explicit DestinationSession(ShareClient& client);
    ~DestinationSession();
    DestinationSession(const DestinationSession&) = delete;
    DestinationSession& operator=(const DestinationSession&) = delete;

    Result<void> open(const ShareTarget& target, const Credentials& credentials);
    void close();

    uint32_t maxWriteSize() const { return maxWriteSize_; }
    uint32_t treeId() const { return treeId_; }
    bool isOpen() const { return mounted_; }

private:
    ShareClient& client_;
    uint32_t maxWriteSize_;
    uint64_t sessionId_;
    uint32_t treeId_;
    bool connected_;
    bool authenticated_;
    bool mounted_;
};

// Owns one open file on the share; closes it exactly once.
class FileHandleGuard {
public:
    FileHandleGuard(ShareClient& client, uint64_t fileId, std::string name);
    ~FileHandleGuard();
    FileHandleGuard(const FileHandleGuard&) = delete;
    FileHandleGuard& operator=(const FileHandleGuard&) = delete;

    uint64_t fileId() const { return fileId_; }

    // first call closes, later calls return Ok without touching the client
    Result<void> close();

private:
    ShareClient& client_;
    uint64_t fileId_;
    std::string name_;
    bool open_;
};
