#pragma once
#include <cstdint>
#include <map>
#include <mutex>
#include <string>
#include "../common/result.hpp"

// Directory backed share tree: every subdirectory of root is a share.
// Keeps the open files of one session behind LocalShareClient.
class ShareStore {
public:
    ShareStore(const std::string& root, uint32_t maxWriteSize);
    ~ShareStore();
    ShareStore(const ShareStore&) = delete;
    ShareStore& operator=(const ShareStore&) = delete;

    uint32_t maxWriteSize() const { return maxWriteSize_; }

    Result<uint32_t> connectTree(const std::string& share);
    Result<void> disconnectTree(uint32_t treeId);
    Result<uint64_t> create(uint32_t treeId, const std::string& filename, uint8_t disposition);
    Result<uint32_t> write(uint64_t fileId, uint64_t offset, const char* data, size_t len);
    Result<void> close(uint64_t fileId);

    // closes every file and tree still open
    void closeAll();

    size_t openFileCount() const;

    // rejects absolute names and any ".." component
    static bool isSafeRelativePath(const std::string& path);

private:
    struct OpenFile {
        int fd;
        uint32_t treeId;
        std::string path;
    };

    std::string root_;
    uint32_t maxWriteSize_;
    std::map<uint32_t, std::string> trees_;   // treeId -> share directory
    std::map<uint64_t, OpenFile> files_;
    uint32_t nextTreeId_;
    uint64_t nextFileId_;
    mutable std::mutex mutex_;
};
