#pragma once
#include <cstdint>
#include <map>
#include <string>
#include "share_client.hpp"
#include "../transfer/cancellation_token.hpp"

struct smb2_context;
struct smb2fh;

// ShareClient over SMB2/3 through libsmb2.
// libsmb2 negotiates, sets up the session and connects the tree in one call,
// so connect() and authenticate() only prepare the context and mount() does
// the network work. Requests are issued asynchronously and driven by a poll
// loop that gives up on cancellation or after SMB_TIMEOUT_SECONDS.
class Smb2ShareClient : public ShareClient {
public:
    explicit Smb2ShareClient(const CancellationToken& cancel);
    ~Smb2ShareClient() override;
    Smb2ShareClient(const Smb2ShareClient&) = delete;
    Smb2ShareClient& operator=(const Smb2ShareClient&) = delete;

    Result<void> connect(const std::string& server, int port) override;
    Result<uint64_t> authenticate(const std::string& username, const std::string& password,
                                  const std::string& domain) override;
    Result<uint32_t> mount(const std::string& share) override;
    uint32_t maxWriteSize() const override { return maxWriteSize_; }
    Result<uint64_t> openFile(uint32_t treeId, const std::string& filename, uint8_t disposition) override;
    Result<uint32_t> write(uint64_t fileId, uint64_t offset, const char* data, size_t len) override;
    Result<void> close(uint64_t fileId) override;
    Result<void> unmount(uint32_t treeId) override;
    Result<void> logoff(uint64_t sessionId) override;
    void disconnect() override;
    std::string describe() const override;

    // "host" on the default port, "host:port" or "[v6]:port" otherwise
    static std::string serverAddress(const std::string& server, int port);

    // share relative path with backslash separators and no leading separator
    static std::string sharePath(const std::string& filename);

    // maps a negative libsmb2 status and its error text onto the error taxonomy
    static ErrorKind classify(int status, const std::string& message, ErrorKind fallback);

private:
    struct Completion {
        bool done = false;
        int status = 0;
        void* data = nullptr;
    };

    static void onComplete(smb2_context* smb2, int status, void* commandData, void* privateData);

    // services the connection until completion fires; interruptible waits return
    // Cancelled once the token is set
    Result<void> wait(Completion& completion, const std::string& what, bool interruptible);
    void dropConnection();
    std::string lastError() const;

    const CancellationToken& cancel_;
    smb2_context* smb2_;
    std::string server_;
    std::string user_;
    std::string share_;
    uint32_t maxWriteSize_;
    bool authenticated_;
    bool mounted_;
    uint64_t nextFileId_;
    std::map<uint64_t, smb2fh*> files_;
};
