#include "smb2_share_client.hpp"
#include "../common/config.hpp"
#include "../common/logger.hpp"
#include <cerrno>
#include <chrono>
#include <cstring>
#include <fcntl.h>
#include <poll.h>
#include <smb2/smb2.h>
#include <smb2/libsmb2.h>

Smb2ShareClient::Smb2ShareClient(const CancellationToken& cancel)
    : cancel_(cancel), smb2_(nullptr), maxWriteSize_(0), authenticated_(false), mounted_(false), nextFileId_(1) {}

Smb2ShareClient::~Smb2ShareClient() {
    dropConnection();
}

void Smb2ShareClient::onComplete(smb2_context*, int status, void* commandData, void* privateData) {
    auto* completion = static_cast<Completion*>(privateData);
    completion->done = true;
    completion->status = status;
    completion->data = commandData;
}

std::string Smb2ShareClient::lastError() const {
    if (!smb2_) return "connection closed";
    const char* error = smb2_get_error(smb2_);
    return error ? error : "";
}

Result<void> Smb2ShareClient::wait(Completion& completion, const std::string& what, bool interruptible) {
    auto deadline = std::chrono::steady_clock::now() + std::chrono::seconds(Config::SMB_TIMEOUT_SECONDS);

    while (!completion.done) {
        // destroying the context fails the outstanding request through its
        // callback, so completion must still be alive here
        if (interruptible && cancel_.cancelled()) {
            dropConnection();
            return Result<void>::Error(ErrorKind::Cancelled, what + " interrupted");
        }
        if (std::chrono::steady_clock::now() >= deadline) {
            dropConnection();
            return Result<void>::Error(ErrorKind::ConnectionFailure,
                                       what + " timed out after " + std::to_string(Config::SMB_TIMEOUT_SECONDS) + "s");
        }

        struct pollfd pfd{};
        pfd.fd = smb2_get_fd(smb2_);
        pfd.events = static_cast<short>(smb2_which_events(smb2_));
        int ready = poll(&pfd, 1, Config::CANCEL_POLL_MS);
        if (ready < 0) {
            if (errno == EINTR) continue;
            std::string reason = std::strerror(errno);
            dropConnection();
            return Result<void>::Error(ErrorKind::ConnectionFailure, what + ": poll failed: " + reason);
        }
        if (ready == 0) continue;

        if (smb2_service(smb2_, pfd.revents) < 0) {
            std::string reason = lastError();
            dropConnection();
            return Result<void>::Error(ErrorKind::ConnectionFailure, what + ": " + reason);
        }
    }
    return Result<void>::Ok();
}

void Smb2ShareClient::dropConnection() {
    files_.clear();
    mounted_ = false;
    authenticated_ = false;
    maxWriteSize_ = 0;
    if (smb2_) {
        smb2_context* smb2 = smb2_;
        smb2_ = nullptr;
        smb2_destroy_context(smb2);
    }
}

Result<void> Smb2ShareClient::connect(const std::string& server, int port) {
    dropConnection();
    if (server.empty()) {
        return Result<void>::Error(ErrorKind::InvalidConfiguration, "Server address is empty");
    }

    smb2_ = smb2_init_context();
    if (!smb2_) {
        return Result<void>::Error(ErrorKind::ConnectionFailure, "Failed to initialise SMB2 context");
    }
    smb2_set_security_mode(smb2_, SMB2_NEGOTIATE_SIGNING_ENABLED);
    smb2_set_version(smb2_, SMB2_VERSION_ANY);
    smb2_set_timeout(smb2_, Config::SMB_TIMEOUT_SECONDS);

    server_ = serverAddress(server, port);
    Logger::debug("SMB2", "Context ready for " + server_);
    return Result<void>::Ok();
}

Result<uint64_t> Smb2ShareClient::authenticate(const std::string& username, const std::string& password,
                                               const std::string& domain) {
    if (!smb2_) return Result<uint64_t>::Error(ErrorKind::ConnectionFailure, "Not connected");
    if (username.empty()) {
        return Result<uint64_t>::Error(ErrorKind::InvalidConfiguration, "Username is empty");
    }

    smb2_set_user(smb2_, username.c_str());
    smb2_set_password(smb2_, password.c_str());
    if (!domain.empty()) smb2_set_domain(smb2_, domain.c_str());
    user_ = username;
    authenticated_ = true;
    // libsmb2 keeps the session id internal; one session per context
    return Result<uint64_t>::Ok(1);
}

Result<uint32_t> Smb2ShareClient::mount(const std::string& share) {
    if (!smb2_ || !authenticated_) {
        return Result<uint32_t>::Error(ErrorKind::AccessDenied, "Mount before authentication");
    }

    std::string what = "Connect to \\\\" + server_ + "\\" + share;
    Completion completion;
    int rc = smb2_connect_share_async(smb2_, server_.c_str(), share.c_str(), user_.c_str(), onComplete, &completion);
    if (rc < 0) {
        std::string reason = lastError();
        return Result<uint32_t>::Error(classify(rc, reason, ErrorKind::ConnectionFailure), what + ": " + reason);
    }

    Result<void> done = wait(completion, what, true);
    if (!done.success) return Result<uint32_t>::From(done);
    if (completion.status < 0) {
        std::string reason = lastError();
        return Result<uint32_t>::Error(classify(completion.status, reason, ErrorKind::ConnectionFailure),
                                       what + ": " + reason);
    }

    maxWriteSize_ = smb2_get_max_write_size(smb2_);
    share_ = share;
    mounted_ = true;
    // single tree per context
    return Result<uint32_t>::Ok(1);
}

Result<uint64_t> Smb2ShareClient::openFile(uint32_t, const std::string& filename, uint8_t disposition) {
    if (!smb2_ || !mounted_) return Result<uint64_t>::Error(ErrorKind::ConnectionFailure, "Share is not mounted");
    if (disposition != DISPOSITION_OVERWRITE_IF) {
        return Result<uint64_t>::Error(ErrorKind::ProtocolError, "Unsupported create disposition " + std::to_string(disposition));
    }

    std::string path = sharePath(filename);
    if (path.empty()) return Result<uint64_t>::Error(ErrorKind::InvalidConfiguration, "Destination filename is empty");

    std::string what = "Create " + path;
    Completion completion;
    int rc = smb2_open_async(smb2_, path.c_str(), O_WRONLY | O_CREAT | O_TRUNC, onComplete, &completion);
    if (rc < 0) {
        std::string reason = lastError();
        return Result<uint64_t>::Error(classify(rc, reason, ErrorKind::SinkWriteFailure), what + ": " + reason);
    }

    Result<void> done = wait(completion, what, false);
    if (!done.success) return Result<uint64_t>::From(done);
    if (completion.status < 0 || !completion.data) {
        std::string reason = lastError();
        return Result<uint64_t>::Error(classify(completion.status, reason, ErrorKind::SinkWriteFailure),
                                       what + ": " + reason);
    }

    uint64_t fileId = nextFileId_++;
    files_[fileId] = static_cast<smb2fh*>(completion.data);
    return Result<uint64_t>::Ok(fileId);
}

Result<uint32_t> Smb2ShareClient::write(uint64_t fileId, uint64_t offset, const char* data, size_t len) {
    if (!smb2_) return Result<uint32_t>::Error(ErrorKind::SinkWriteFailure, "Connection closed");
    if (len > maxWriteSize_) {
        return Result<uint32_t>::Error(ErrorKind::SinkWriteFailure,
                                       "Write of " + std::to_string(len) + " bytes exceeds max write size " +
                                       std::to_string(maxWriteSize_));
    }
    auto it = files_.find(fileId);
    if (it == files_.end()) return Result<uint32_t>::Error(ErrorKind::SinkWriteFailure, "Unknown file handle");

    std::string what = "Write at offset " + std::to_string(offset);
    Completion completion;
    int rc = smb2_pwrite_async(smb2_, it->second, reinterpret_cast<const uint8_t*>(data), static_cast<uint32_t>(len),
                               offset, onComplete, &completion);
    if (rc < 0) return Result<uint32_t>::Error(ErrorKind::SinkWriteFailure, what + ": " + lastError());

    Result<void> done = wait(completion, what, true);
    if (!done.success) {
        if (done.kind == ErrorKind::Cancelled) return Result<uint32_t>::From(done);
        return Result<uint32_t>::Error(ErrorKind::SinkWriteFailure, done.message);
    }
    if (completion.status < 0) {
        return Result<uint32_t>::Error(ErrorKind::SinkWriteFailure, what + ": " + lastError());
    }
    if (static_cast<size_t>(completion.status) != len) {
        return Result<uint32_t>::Error(ErrorKind::SinkWriteFailure,
                                       what + ": short write of " + std::to_string(completion.status) + " of " +
                                       std::to_string(len) + " bytes");
    }
    return Result<uint32_t>::Ok(static_cast<uint32_t>(len));
}

Result<void> Smb2ShareClient::close(uint64_t fileId) {
    auto it = files_.find(fileId);
    if (!smb2_ || it == files_.end()) return Result<void>::Ok();
    smb2fh* fh = it->second;
    files_.erase(it);

    Completion completion;
    if (smb2_close_async(smb2_, fh, onComplete, &completion) < 0) {
        return Result<void>::Error(ErrorKind::SinkWriteFailure, "Close: " + lastError());
    }
    Result<void> done = wait(completion, "Close", false);
    if (!done.success) return done;
    if (completion.status < 0) return Result<void>::Error(ErrorKind::SinkWriteFailure, "Close: " + lastError());
    return Result<void>::Ok();
}

Result<void> Smb2ShareClient::unmount(uint32_t) {
    if (!smb2_ || !mounted_) return Result<void>::Ok();
    mounted_ = false;

    while (!files_.empty()) {
        Result<void> closed = close(files_.begin()->first);
        if (!closed.success) Logger::warn("SMB2", "Closing a leftover handle failed: " + closed.describe());
    }
    if (!smb2_) return Result<void>::Ok();

    // also logs the session off
    Completion completion;
    if (smb2_disconnect_share_async(smb2_, onComplete, &completion) < 0) {
        return Result<void>::Error(ErrorKind::ConnectionFailure, "Tree disconnect: " + lastError());
    }
    Result<void> done = wait(completion, "Tree disconnect", false);
    if (!done.success) return done;
    if (completion.status < 0) {
        return Result<void>::Error(ErrorKind::ConnectionFailure, "Tree disconnect: " + lastError());
    }
    return Result<void>::Ok();
}

Result<void> Smb2ShareClient::logoff(uint64_t) {
    authenticated_ = false;
    return Result<void>::Ok();
}

void Smb2ShareClient::disconnect() {
    dropConnection();
}

std::string Smb2ShareClient::describe() const {
    return "smb2://" + server_ + (share_.empty() ? "" : "/" + share_);
}

std::string Smb2ShareClient::serverAddress(const std::string& server, int port) {
    if (port <= 0 || port == Config::DEFAULT_SHARE_PORT) return server;
    if (server.find(':') != std::string::npos && server.front() != '[') {
        return "[" + server + "]:" + std::to_string(port);
    }
    return server + ":" + std::to_string(port);
}

std::string Smb2ShareClient::sharePath(const std::string& filename) {
    std::string path = filename;
    for (char& c : path) {
        if (c == '/') c = '\\';
    }
    size_t start = path.find_first_not_of('\\');
    return start == std::string::npos ? std::string() : path.substr(start);
}

ErrorKind Smb2ShareClient::classify(int status, const std::string& message, ErrorKind fallback) {
    // libsmb2 folds several NT statuses into one errno, so the text decides first
    auto mentions = [&message](const char* name) { return message.find(name) != std::string::npos; };
    if (mentions("LOGON_FAILURE") || mentions("ACCESS_DENIED") || mentions("ACCOUNT_") ||
        mentions("WRONG_PASSWORD") || mentions("PASSWORD_EXPIRED")) {
        return ErrorKind::AccessDenied;
    }
    if (mentions("BAD_NETWORK_NAME") || mentions("OBJECT_PATH_NOT_FOUND") || mentions("OBJECT_NAME_NOT_FOUND")) {
        return ErrorKind::NotFound;
    }

    switch (-status) {
        case EACCES:
        case EPERM:
            return ErrorKind::AccessDenied;
        case ENOENT:
        case ENODEV:
        case ENOTDIR:
            return ErrorKind::NotFound;
        case ECONNREFUSED:
        case ECONNRESET:
        case ETIMEDOUT:
        case EHOSTUNREACH:
        case ENETUNREACH:
        case EPIPE:
            return ErrorKind::ConnectionFailure;
        default:
            return fallback;
    }
}
