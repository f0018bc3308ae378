// config.hpp
#pragma once
#include <cstddef>
#include <cstdint>

namespace Config {
    inline constexpr size_t DEFAULT_WRITE_SIZE = 64 * 1024;       // 64 KB writes, same default as the original tool
    inline constexpr size_t DEFAULT_FETCH_WINDOW = 8 * 1024;      // streaming policy reads 8 KB at a time
    inline constexpr size_t PREFETCH_DEPTH = 4;                   // chunks buffered ahead of the writer

    inline constexpr int DEFAULT_SHARE_PORT = 445;
    inline constexpr int SMB_TIMEOUT_SECONDS = 60;
    inline constexpr int CANCEL_POLL_MS = 100;                    // how often a pending SMB request checks for Ctrl-C
    inline constexpr uint32_t DEFAULT_MOUNT_MAX_WRITE = 1024 * 1024;
    inline constexpr uint32_t MAX_MOUNT_MAX_WRITE = 8 * 1024 * 1024;  // largest SMB 3.x write

    inline constexpr const char* DEFAULT_S3_REGION = "us-east-1";
    inline constexpr int HTTP_TIMEOUT_SECONDS = 60;
}
