#include "evtx_core.hpp"
#include <sstream>
#include <algorithm>
#include <cctype>
#include <random>
#include <iomanip>
#include <stdexcept>

namespace evtx {

// Utils 实现
Timestamp Utils::getCurrentTime() {
    return std::chrono::system_clock::now();
}

int64_t Utils::timestampToMillis(Timestamp ts) {
    return std::chrono::duration_cast<std::chrono::milliseconds>(ts.time_since_epoch()).count();
}

Timestamp Utils::millisToTimestamp(int64_t millis) {
    return Timestamp(std::chrono::duration_cast<Timestamp::duration>(std::chrono::milliseconds(millis)));
}

std::string Utils::generateUuid() {
    // 每个线程独立的随机数引擎
    thread_local std::mt19937_64 engine{std::random_device{}()};
    uint64_t high = engine();
    uint64_t low = engine();

    // 设置版本号(4)与变体位，与随机UUID保持一致
    high = (high & 0xFFFFFFFFFFFF0FFFULL) | 0x0000000000004000ULL;
    low = (low & 0x3FFFFFFFFFFFFFFFULL) | 0x8000000000000000ULL;

    std::ostringstream ss;
    ss << std::hex << std::setfill('0')
       << std::setw(8) << (high >> 32) << '-'
       << std::setw(4) << ((high >> 16) & 0xFFFF) << '-'
       << std::setw(4) << (high & 0xFFFF) << '-'
       << std::setw(4) << (low >> 48) << '-'
       << std::setw(12) << (low & 0xFFFFFFFFFFFFULL);
    return ss.str();
}

bool Utils::isNumeric(const std::string& str) {
    if (str.empty()) {
        return false;
    }

    // 允许一个前导负号
    size_t start = 0;
    if (str[0] == '-') {
        if (str.length() == 1) {
            return false;
        }
        start = 1;
    }

    return std::all_of(str.begin() + start, str.end(),
                       [](unsigned char c) { return std::isdigit(c) != 0; });
}

int64_t Utils::stringToInt(const std::string& str) {
    if (!isNumeric(str)) {
        throw std::invalid_argument("not an integer: '" + str + "'");
    }
    return std::stoll(str);
}

std::string Utils::intToString(int64_t value) {
    return std::to_string(value);
}

std::string Utils::strategyToString(StorageStrategy strategy) {
    switch (strategy) {
        case StorageStrategy::OPTIMISTIC:
            return "optimistic";
        case StorageStrategy::PESSIMISTIC:
            return "pessimistic";
        default:
            return "unknown";
    }
}

bool Utils::stringToStrategy(const std::string& str, StorageStrategy& strategy) {
    std::string lower = str;
    std::transform(lower.begin(), lower.end(), lower.begin(), ::tolower);
    if (lower == "optimistic") {
        strategy = StorageStrategy::OPTIMISTIC;
    } else if (lower == "pessimistic") {
        strategy = StorageStrategy::PESSIMISTIC;
    } else {
        return false;
    }
    return true;
}

std::string Utils::replayPolicyToString(ReplayPolicy policy) {
    return policy == ReplayPolicy::STRICT ? "strict" : "lenient";
}

bool Utils::stringToReplayPolicy(const std::string& str, ReplayPolicy& policy) {
    std::string lower = str;
    std::transform(lower.begin(), lower.end(), lower.begin(), ::tolower);
    if (lower == "lenient") {
        policy = ReplayPolicy::LENIENT;
    } else if (lower == "strict") {
        policy = ReplayPolicy::STRICT;
    } else {
        return false;
    }
    return true;
}

bool Utils::stringToLogBackend(const std::string& str, LogBackend& backend) {
    std::string lower = str;
    std::transform(lower.begin(), lower.end(), lower.begin(), ::tolower);
    if (lower == "memory") {
        backend = LogBackend::MEMORY;
    } else if (lower == "file") {
        backend = LogBackend::FILE;
    } else {
        return false;
    }
    return true;
}

} // namespace evtx
