#pragma once
#include <cstdint>
#include <string>
#include "result.hpp"

// "64KB", "1mb", " 4096 " -> bytes. KB/MB/GB are binary multiples.
Result<uint64_t> parseSize(const std::string& text);

// 1000000 -> "1,000,000"
std::string formatWithCommas(uint64_t value);
