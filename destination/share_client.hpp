#pragma once
#include <cstddef>
#include <cstdint>
#include <string>
#include "../common/result.hpp"

// create disposition that creates the file or truncates an existing one
inline constexpr uint8_t DISPOSITION_OVERWRITE_IF = 5;

struct ShareTarget {
    std::string server;
    int port;
    std::string share;
};

struct Credentials {
    std::string username;
    std::string password;
    std::string domain;
};

// Write side of a transfer: a session oriented file share.
// One instance is one connection. Handles returned by authenticate/mount/openFile
// are only meaningful to the instance that issued them.
class ShareClient {
public:
    virtual ~ShareClient() = default;

    virtual Result<void> connect(const std::string& server, int port) = 0;
    virtual Result<uint64_t> authenticate(const std::string& username, const std::string& password,
                                          const std::string& domain) = 0;
    virtual Result<uint32_t> mount(const std::string& share) = 0;

    // negotiated maximum write size in bytes, 0 until mount succeeded
    virtual uint32_t maxWriteSize() const = 0;

    virtual Result<uint64_t> openFile(uint32_t treeId, const std::string& filename, uint8_t disposition) = 0;

    // SinkWriteFailure when the write fails or len exceeds the negotiated maximum,
    // Cancelled when an interrupt arrived while the write was outstanding
    virtual Result<uint32_t> write(uint64_t fileId, uint64_t offset, const char* data, size_t len) = 0;

    // teardown, idempotent; failures are for logging only
    virtual Result<void> close(uint64_t fileId) = 0;
    virtual Result<void> unmount(uint32_t treeId) = 0;
    virtual Result<void> logoff(uint64_t sessionId) = 0;
    virtual void disconnect() = 0;

    virtual std::string describe() const = 0;
};
