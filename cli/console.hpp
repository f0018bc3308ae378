#pragma once
#include <iosfwd>
#include "../destination/share_client.hpp"
#include "../transfer/cancellation_token.hpp"
#include "../transfer/transfer_types.hpp"

// "Username (domain\username or username):" then a password with echo off
Credentials promptCredentials(std::istream& in, std::ostream& out, const char* title);

// splits "DOMAIN\user" on the first backslash
void splitDomainUser(const std::string& input, std::string& domain, std::string& username);

// SIGINT/SIGTERM cancel the token, SIGPIPE is ignored
void installSignalHandlers(CancellationToken& token);

// redraws "Progress: ..." at most every 100 ms and on the last byte
class ProgressReporter {
public:
    void operator()(const TransferCursor& cursor, uint64_t declaredSize);
private:
    long long lastDrawMs_ = -1;
};

void printSummary(const TransferResult& result);
