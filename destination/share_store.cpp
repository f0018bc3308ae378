#include "share_store.hpp"
#include "share_client.hpp"
#include "../common/logger.hpp"
#include <cerrno>
#include <cstring>
#include <fcntl.h>
#include <sstream>
#include <sys/stat.h>
#include <unistd.h>

ShareStore::ShareStore(const std::string& root, uint32_t maxWriteSize)
    : root_(root), maxWriteSize_(maxWriteSize), nextTreeId_(1), nextFileId_(1) {}

ShareStore::~ShareStore() {
    closeAll();
}

bool ShareStore::isSafeRelativePath(const std::string& path) {
    if (path.empty() || path[0] == '/' || path[0] == '\\') return false;

    std::string normalized = path;
    for (char& c : normalized) {
        if (c == '\\') c = '/';
    }
    std::istringstream parts(normalized);
    std::string part;
    while (std::getline(parts, part, '/')) {
        if (part == "..") return false;
    }
    return true;
}

Result<uint32_t> ShareStore::connectTree(const std::string& share) {
    if (share.empty() || share.find('/') != std::string::npos || share.find('\\') != std::string::npos ||
        !isSafeRelativePath(share)) {
        return Result<uint32_t>::Error(ErrorKind::AccessDenied, "Invalid share name: " + share);
    }

    std::string dir = root_ + "/" + share;
    struct stat st{};
    if (stat(dir.c_str(), &st) != 0 || !S_ISDIR(st.st_mode)) {
        return Result<uint32_t>::Error(ErrorKind::NotFound, "No such share: " + share);
    }

    std::lock_guard<std::mutex> lock(mutex_);
    uint32_t treeId = nextTreeId_++;
    trees_[treeId] = dir;
    return Result<uint32_t>::Ok(treeId);
}

Result<void> ShareStore::disconnectTree(uint32_t treeId) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto tree = trees_.find(treeId);
    if (tree == trees_.end()) {
        return Result<void>::Ok();
    }
    for (auto it = files_.begin(); it != files_.end();) {
        if (it->second.treeId == treeId) {
            ::close(it->second.fd);
            it = files_.erase(it);
        } else {
            ++it;
        }
    }
    trees_.erase(tree);
    return Result<void>::Ok();
}

Result<uint64_t> ShareStore::create(uint32_t treeId, const std::string& filename, uint8_t disposition) {
    if (disposition != DISPOSITION_OVERWRITE_IF) {
        return Result<uint64_t>::Error(ErrorKind::InvalidConfiguration,
                                       "Unsupported create disposition " + std::to_string(disposition));
    }
    if (!isSafeRelativePath(filename)) {
        return Result<uint64_t>::Error(ErrorKind::AccessDenied, "Invalid file name: " + filename);
    }

    std::lock_guard<std::mutex> lock(mutex_);
    auto tree = trees_.find(treeId);
    if (tree == trees_.end()) {
        return Result<uint64_t>::Error(ErrorKind::ProtocolError, "Unknown tree id " + std::to_string(treeId));
    }

    std::string relative = filename;
    for (char& c : relative) {
        if (c == '\\') c = '/';
    }
    std::string path = tree->second + "/" + relative;

    // overwrite-if: create when missing, truncate when present
    int fd = ::open(path.c_str(), O_WRONLY | O_CREAT | O_TRUNC | O_CLOEXEC, 0644);
    if (fd < 0) {
        int err = errno;
        ErrorKind kind = (err == EACCES || err == EPERM) ? ErrorKind::AccessDenied
                       : (err == ENOENT) ? ErrorKind::NotFound : ErrorKind::SinkWriteFailure;
        return Result<uint64_t>::Error(kind, "Cannot open " + path + ": " + std::strerror(err));
    }

    uint64_t fileId = nextFileId_++;
    files_[fileId] = OpenFile{fd, treeId, path};
    return Result<uint64_t>::Ok(fileId);
}

Result<uint32_t> ShareStore::write(uint64_t fileId, uint64_t offset, const char* data, size_t len) {
    if (len > maxWriteSize_) {
        return Result<uint32_t>::Error(ErrorKind::SinkWriteFailure,
                                       "Write of " + std::to_string(len) + " bytes exceeds maximum " + std::to_string(maxWriteSize_));
    }

    int fd;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto file = files_.find(fileId);
        if (file == files_.end()) {
            return Result<uint32_t>::Error(ErrorKind::SinkWriteFailure, "Unknown file id " + std::to_string(fileId));
        }
        fd = file->second.fd;
    }

    size_t done = 0;
    while (done < len) {
        ssize_t n = ::pwrite(fd, data + done, len - done, static_cast<off_t>(offset + done));
        if (n < 0 && errno == EINTR) continue;
        if (n <= 0) {
            return Result<uint32_t>::Error(ErrorKind::SinkWriteFailure,
                                           "pwrite at offset " + std::to_string(offset + done) + ": " + std::strerror(errno));
        }
        done += static_cast<size_t>(n);
    }
    return Result<uint32_t>::Ok(static_cast<uint32_t>(done));
}

Result<void> ShareStore::close(uint64_t fileId) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto file = files_.find(fileId);
    if (file == files_.end()) {
        // already closed
        return Result<void>::Ok();
    }
    int fd = file->second.fd;
    std::string path = file->second.path;
    files_.erase(file);
    if (::close(fd) != 0) {
        return Result<void>::Error(ErrorKind::SinkWriteFailure, "close " + path + ": " + std::strerror(errno));
    }
    return Result<void>::Ok();
}

void ShareStore::closeAll() {
    std::lock_guard<std::mutex> lock(mutex_);
    for (auto& file : files_) {
        if (::close(file.second.fd) != 0) {
            Logger::warn("ShareStore", "close " + file.second.path + ": " + std::strerror(errno));
        }
    }
    files_.clear();
    trees_.clear();
}

size_t ShareStore::openFileCount() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return files_.size();
}
