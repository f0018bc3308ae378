#include "destination_session.hpp"
#include "../common/logger.hpp"

DestinationSession::DestinationSession(ShareClient& client)
    : client_(client), maxWriteSize_(0), sessionId_(0), treeId_(0),
      connected_(false), authenticated_(false), mounted_(false) {}

DestinationSession::~DestinationSession() {
    close();
}

Result<void> DestinationSession::open(const ShareTarget& target, const Credentials& credentials) {
    close();

    Logger::info("Destination", "Connecting to " + target.server + ":" + std::to_string(target.port));
    Result<void> connected = client_.connect(target.server, target.port);
    if (!connected.success) return connected;
    connected_ = true;

    Result<uint64_t> session = client_.authenticate(credentials.username, credentials.password, credentials.domain);
    if (!session.success) {
        close();
        return Result<void>::From(session);
    }
    authenticated_ = true;
    sessionId_ = session.data;
    Logger::info("Destination", "Session established");

    Result<uint32_t> tree = client_.mount(target.share);
    if (!tree.success) {
        close();
        return Result<void>::From(tree);
    }
    mounted_ = true;
    treeId_ = tree.data;
    Logger::info("Destination", "Connected to share: " + target.share);

    maxWriteSize_ = client_.maxWriteSize();
    if (maxWriteSize_ == 0) {
        close();
        return Result<void>::Error(ErrorKind::ProtocolError, "Share did not report a maximum write size");
    }
    Logger::info("Destination", "Max write size: " + std::to_string(maxWriteSize_) + " bytes (" +
                                std::to_string(maxWriteSize_ / 1024) + "KB)");
    return Result<void>::Ok();
}

void DestinationSession::close() {
    if (mounted_) {
        mounted_ = false;
        Result<void> r = client_.unmount(treeId_);
        if (!r.success) Logger::warn("Destination", "Unmount failed: " + r.describe());
    }
    if (authenticated_) {
        authenticated_ = false;
        Result<void> r = client_.logoff(sessionId_);
        if (!r.success) Logger::warn("Destination", "Logoff failed: " + r.describe());
    }
    if (connected_) {
        connected_ = false;
        client_.disconnect();
        Logger::info("Destination", "Connections closed");
    }
}

FileHandleGuard::FileHandleGuard(ShareClient& client, uint64_t fileId, std::string name)
    : client_(client), fileId_(fileId), name_(std::move(name)), open_(true) {}

FileHandleGuard::~FileHandleGuard() {
    Result<void> r = close();
    if (!r.success) Logger::warn("Destination", "Closing " + name_ + " failed: " + r.describe());
}

Result<void> FileHandleGuard::close() {
    if (!open_) return Result<void>::Ok();
    open_ = false;
    Result<void> r = client_.close(fileId_);
    if (r.success) Logger::debug("Destination", "Closed " + name_);
    return r;
}
