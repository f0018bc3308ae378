#include "console.hpp"
#include "../common/logger.hpp"
#include "../common/size_utils.hpp"
#include <chrono>
#include <csignal>
#include <cstdio>
#include <iostream>
#include <termios.h>
#include <unistd.h>

namespace {
    CancellationToken* interruptToken = nullptr;

    void onInterrupt(int) {
        if (interruptToken) interruptToken->cancel();
    }

    std::string fixed(double value, int precision) {
        char buffer[64];
        std::snprintf(buffer, sizeof(buffer), "%.*f", precision, value);
        return buffer;
    }

    // echo stays off for the lifetime of the guard
    class EchoGuard {
    public:
        EchoGuard() : active_(false) {
            if (isatty(STDIN_FILENO) && tcgetattr(STDIN_FILENO, &saved_) == 0) {
                termios silent = saved_;
                silent.c_lflag &= ~ECHO;
                active_ = tcsetattr(STDIN_FILENO, TCSAFLUSH, &silent) == 0;
            }
        }
        ~EchoGuard() {
            if (active_) tcsetattr(STDIN_FILENO, TCSAFLUSH, &saved_);
        }
    private:
        termios saved_{};
        bool active_;
    };
}

void splitDomainUser(const std::string& input, std::string& domain, std::string& username) {
    size_t slash = input.find('\\');
    if (slash == std::string::npos) {
        domain.clear();
        username = input;
    } else {
        domain = input.substr(0, slash);
        username = input.substr(slash + 1);
    }
}

Credentials promptCredentials(std::istream& in, std::ostream& out, const char* title) {
    Credentials creds;
    out << title << "\n" << "Username (domain\\username or username): " << std::flush;
    std::string line;
    std::getline(in, line);

    size_t begin = line.find_first_not_of(" \t");
    size_t end = line.find_last_not_of(" \t\r");
    line = (begin == std::string::npos) ? "" : line.substr(begin, end - begin + 1);
    splitDomainUser(line, creds.domain, creds.username);

    out << "Password: " << std::flush;
    {
        EchoGuard noEcho;
        std::getline(in, creds.password);
    }
    if (!creds.password.empty() && creds.password.back() == '\r') creds.password.pop_back();
    out << "\n";
    return creds;
}

void installSignalHandlers(CancellationToken& token) {
    interruptToken = &token;

    struct sigaction action{};
    action.sa_handler = onInterrupt;
    sigemptyset(&action.sa_mask);
    action.sa_flags = 0;
    sigaction(SIGINT, &action, nullptr);
    sigaction(SIGTERM, &action, nullptr);

    std::signal(SIGPIPE, SIG_IGN);
}

void ProgressReporter::operator()(const TransferCursor& cursor, uint64_t declaredSize) {
    long long nowMs = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now().time_since_epoch()).count();
    bool last = cursor.bytesWritten >= declaredSize;
    if (!last && lastDrawMs_ >= 0 && nowMs - lastDrawMs_ < 100) return;
    lastDrawMs_ = nowMs;

    double percent = declaredSize > 0 ? 100.0 * static_cast<double>(cursor.bytesWritten) / static_cast<double>(declaredSize) : 100.0;
    Logger::progress("Progress: " + fixed(percent, 1) + "% (" + formatWithCommas(cursor.bytesWritten) + "/" +
                     formatWithCommas(declaredSize) + " bytes) - Operations: " + std::to_string(cursor.writeOperations));
}

void printSummary(const TransferResult& result) {
    Logger::info("Summary", "=== Transfer Complete ===");
    Logger::info("Summary", "Total time: " + fixed(result.elapsedSeconds, 2) + " seconds");
    Logger::info("Summary", "Bytes written: " + formatWithCommas(result.bytesWritten));
    Logger::info("Summary", "Write operations: " + formatWithCommas(result.writeOperations));
    Logger::info("Summary", "Write unit: " + formatWithCommas(result.effectiveWriteUnit) + " bytes");
    Logger::info("Summary", "Average write size: " + fixed(result.averageWriteSize / 1024.0, 1) + " KB");
    if (result.throughputMeasurable) {
        Logger::info("Summary", "Throughput: " + fixed(result.throughputBytesPerSec / (1024.0 * 1024.0), 2) + " MB/s");
        Logger::info("Summary", "Operations per second: " + fixed(result.operationsPerSec, 1));
    } else {
        Logger::info("Summary", "Throughput: unmeasurable");
    }
    Logger::info("Summary", "SHA-256: " + result.sha256);
}
