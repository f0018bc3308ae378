#pragma once
#include <memory>
#include <string>
#include "share_client.hpp"
#include "share_store.hpp"

// Share reached through a directory where it is already mounted (cifs, smbfs ...).
// The mount carries the real credentials, so authenticate only records the identity.
class LocalShareClient : public ShareClient {
public:
    LocalShareClient(const std::string& mountRoot, uint32_t maxWriteSize);

    Result<void> connect(const std::string& server, int port) override;
    Result<uint64_t> authenticate(const std::string& username, const std::string& password,
                                  const std::string& domain) override;
    Result<uint32_t> mount(const std::string& share) override;
    uint32_t maxWriteSize() const override;
    Result<uint64_t> openFile(uint32_t treeId, const std::string& filename, uint8_t disposition) override;
    Result<uint32_t> write(uint64_t fileId, uint64_t offset, const char* data, size_t len) override;
    Result<void> close(uint64_t fileId) override;
    Result<void> unmount(uint32_t treeId) override;
    Result<void> logoff(uint64_t sessionId) override;
    void disconnect() override;
    std::string describe() const override;

private:
    std::string mountRoot_;
    uint32_t maxWriteSize_;
    std::unique_ptr<ShareStore> store_;
    bool authenticated_;
    bool mounted_;
};
