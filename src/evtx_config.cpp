#include "evtx_config.hpp"
#include "evtx_logger.hpp"
#include <fstream>
#include <sstream>
#include <stdexcept>

namespace evtx {

bool StorageConfig::loadFromFile(const std::string& config_file) {
    std::ifstream file(config_file);
    if (!file.is_open()) {
        EVTX_LOG_ERROR("无法打开配置文件: ", config_file);
        return false;
    }

    std::string line;
    size_t line_no = 0;
    while (std::getline(file, line)) {
        ++line_no;
        // 跳过注释和空行
        size_t first = line.find_first_not_of(" \t\r");
        if (first == std::string::npos || line[first] == '#') {
            continue;
        }

        std::istringstream iss(line);
        std::string key, value;
        if (!(iss >> key >> value)) {
            EVTX_LOG_ERROR("配置文件第", line_no, "行缺少取值: ", line);
            return false;
        }

        if (!set(key, value)) {
            EVTX_LOG_ERROR("配置文件第", line_no, "行取值无效: ", key, " ", value);
            return false;
        }
    }

    return true;
}

bool StorageConfig::set(const std::string& key, const std::string& value) {
    if (key == "strategy") {
        return Utils::stringToStrategy(value, strategy);
    } else if (key == "log_backend") {
        return Utils::stringToLogBackend(value, log_backend);
    } else if (key == "log_dir") {
        log_dir = value;
    } else if (key == "replay_policy") {
        return Utils::stringToReplayPolicy(value, replay_policy);
    } else if (key == "log_level") {
        LogLevel level;
        if (!Logger::parseLogLevel(value, level)) {
            return false;
        }
        log_level = value;
    } else if (key == "log_file") {
        log_file = value;
    } else if (key == "minimum_balance") {
        if (!Utils::isNumeric(value)) {
            return false;
        }
        try {
            minimum_balance = Utils::stringToInt(value);
        } catch (const std::out_of_range&) {
            return false;
        }
    } else {
        EVTX_LOG_WARNING("忽略未知配置项: ", key);
    }
    return true;
}

} // namespace evtx
