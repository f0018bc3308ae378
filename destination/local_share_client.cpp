#include "local_share_client.hpp"
#include "../common/logger.hpp"
#include <sys/stat.h>

LocalShareClient::LocalShareClient(const std::string& mountRoot, uint32_t maxWriteSize)
    : mountRoot_(mountRoot), maxWriteSize_(maxWriteSize), authenticated_(false), mounted_(false) {}

Result<void> LocalShareClient::connect(const std::string& server, int) {
    struct stat st{};
    if (stat(mountRoot_.c_str(), &st) != 0 || !S_ISDIR(st.st_mode)) {
        return Result<void>::Error(ErrorKind::ConnectionFailure, "Mount root is not a directory: " + mountRoot_);
    }
    if (maxWriteSize_ == 0) {
        return Result<void>::Error(ErrorKind::InvalidConfiguration, "Maximum write size must be positive");
    }
    store_ = std::make_unique<ShareStore>(mountRoot_, maxWriteSize_);
    Logger::debug("LocalShare", "Using mount " + mountRoot_ + " for server " + server);
    return Result<void>::Ok();
}

Result<uint64_t> LocalShareClient::authenticate(const std::string& username, const std::string&,
                                                const std::string& domain) {
    if (!store_) return Result<uint64_t>::Error(ErrorKind::ConnectionFailure, "Not connected");
    authenticated_ = true;
    Logger::debug("LocalShare", "Writing as " + (domain.empty() ? username : domain + "\\" + username) +
                                " through the mount's own credentials");
    return Result<uint64_t>::Ok(1);
}

Result<uint32_t> LocalShareClient::mount(const std::string& share) {
    if (!store_ || !authenticated_) {
        return Result<uint32_t>::Error(ErrorKind::AccessDenied, "Mount before authentication");
    }
    Result<uint32_t> tree = store_->connectTree(share);
    mounted_ = tree.success;
    return tree;
}

uint32_t LocalShareClient::maxWriteSize() const {
    return mounted_ ? maxWriteSize_ : 0;
}

Result<uint64_t> LocalShareClient::openFile(uint32_t treeId, const std::string& filename, uint8_t disposition) {
    if (!store_) return Result<uint64_t>::Error(ErrorKind::ConnectionFailure, "Not connected");
    return store_->create(treeId, filename, disposition);
}

Result<uint32_t> LocalShareClient::write(uint64_t fileId, uint64_t offset, const char* data, size_t len) {
    if (!store_) return Result<uint32_t>::Error(ErrorKind::SinkWriteFailure, "Not connected");
    return store_->write(fileId, offset, data, len);
}

Result<void> LocalShareClient::close(uint64_t fileId) {
    if (!store_) return Result<void>::Ok();
    return store_->close(fileId);
}

Result<void> LocalShareClient::unmount(uint32_t treeId) {
    if (!store_) return Result<void>::Ok();
    mounted_ = false;
    return store_->disconnectTree(treeId);
}

Result<void> LocalShareClient::logoff(uint64_t) {
    authenticated_ = false;
    return Result<void>::Ok();
}

void LocalShareClient::disconnect() {
    store_.reset();
    authenticated_ = false;
    mounted_ = false;
}

std::string LocalShareClient::describe() const {
    return "mount " + mountRoot_;
}
