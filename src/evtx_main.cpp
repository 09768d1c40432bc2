#include "ledger/evtx_bank_account.hpp"
#include "evtx_config.hpp"
#include "evtx_logger.hpp"
#include <iostream>
#include <string>
#include <vector>

namespace evtx {

// 打印帮助信息
void printHelp() {
    std::cout << "evtx_ledger - 事件溯源事务账本工具 v0.1\n" << std::endl;
    std::cout << "用法: evtx_ledger [选项] <命令> [参数...]\n" << std::endl;
    std::cout << "命令:" << std::endl;
    std::cout << "  deposit <account> <amount>        存款" << std::endl;
    std::cout << "  withdraw <account> <amount>       取款" << std::endl;
    std::cout << "  transfer <from> <to> <amount>     转账" << std::endl;
    std::cout << "  balance <account>                 查询余额与交易次数" << std::endl;
    std::cout << "  dump <stream>                     打印流中的全部事件" << std::endl;
    std::cout << "  layout <type> <key> <state>       打印参与者状态对应的流名" << std::endl;
    std::cout << "\n选项:" << std::endl;
    std::cout << "  -c, --config <file>      使用指定的配置文件" << std::endl;
    std::cout << "  -s, --strategy <name>    存储策略（optimistic, pessimistic）" << std::endl;
    std::cout << "  -d, --data-dir <dir>     使用指定目录下的文件事件日志" << std::endl;
    std::cout << "  -m, --min-balance <n>    账户余额下限（默认：0）" << std::endl;
    std::cout << "  -l, --log-level <level>  设置日志等级（debug, info, warning, error, critical, 默认：info）" << std::endl;
    std::cout << "  -f, --log-file <file>    设置日志文件路径" << std::endl;
    std::cout << "  -v, --version            显示版本信息" << std::endl;
    std::cout << "  -h, --help               显示帮助信息" << std::endl;
    std::cout << "\n示例:" << std::endl;
    std::cout << "  evtx_ledger -d data deposit alice 100" << std::endl;
    std::cout << "  evtx_ledger -d data -s pessimistic transfer alice bob 30" << std::endl;
    std::cout << "  evtx_ledger -d data dump bankaccount-alice-account" << std::endl;
}

// 打印版本信息
void printVersion() {
    std::cout << "evtx_ledger v0.1.0" << std::endl;
    std::cout << "基于C++17的事件溯源事务存储" << std::endl;
}

// 命令行参数，非空的选项覆盖配置文件
struct CommandLine {
    std::string config_file;
    std::string strategy;
    std::string data_dir;
    std::string min_balance;
    std::string log_level;
    std::string log_file;
    bool show_help = false;
    bool show_version = false;
    std::vector<std::string> command;
};

bool parseArguments(int argc, char* argv[], CommandLine& cmd) {
    for (int i = 1; i < argc; i++) {
        std::string arg = argv[i];

        auto takeValue = [&](std::string& out) {
            if (i + 1 < argc) {
                out = argv[++i];
                return true;
            }
            std::cerr << "错误: " << arg << " 需要指定参数" << std::endl;
            return false;
        };

        if (arg == "-h" || arg == "--help") {
            cmd.show_help = true;
        } else if (arg == "-v" || arg == "--version") {
            cmd.show_version = true;
        } else if (arg == "-c" || arg == "--config") {
            if (!takeValue(cmd.config_file)) return false;
        } else if (arg == "-s" || arg == "--strategy") {
            if (!takeValue(cmd.strategy)) return false;
        } else if (arg == "-d" || arg == "--data-dir") {
            if (!takeValue(cmd.data_dir)) return false;
        } else if (arg == "-m" || arg == "--min-balance") {
            if (!takeValue(cmd.min_balance)) return false;
        } else if (arg == "-l" || arg == "--log-level") {
            if (!takeValue(cmd.log_level)) return false;
        } else if (arg == "-f" || arg == "--log-file") {
            if (!takeValue(cmd.log_file)) return false;
        } else if (!arg.empty() && arg[0] == '-' && cmd.command.empty()) {
            std::cerr << "未知参数: " << arg << std::endl;
            std::cerr << "使用 -h 或 --help 查看帮助信息" << std::endl;
            return false;
        } else {
            cmd.command.push_back(arg);
        }
    }
    return true;
}

// 合并配置文件与命令行选项
bool buildConfig(const CommandLine& cmd, StorageConfig& config) {
    if (!cmd.config_file.empty() && !config.loadFromFile(cmd.config_file)) {
        return false;
    }
    if (!cmd.strategy.empty() && !config.set("strategy", cmd.strategy)) {
        std::cerr << "无效的存储策略: " << cmd.strategy << std::endl;
        return false;
    }
    if (!cmd.data_dir.empty()) {
        config.log_backend = LogBackend::FILE;
        config.log_dir = cmd.data_dir;
    }
    if (!cmd.min_balance.empty() && !config.set("minimum_balance", cmd.min_balance)) {
        std::cerr << "无效的余额下限: " << cmd.min_balance << std::endl;
        return false;
    }
    if (!cmd.log_level.empty() && !config.set("log_level", cmd.log_level)) {
        std::cerr << "无效的日志等级: " << cmd.log_level << std::endl;
        return false;
    }
    if (!cmd.log_file.empty()) {
        config.log_file = cmd.log_file;
    }
    return true;
}

bool parseAmount(const std::string& text, int64_t& amount) {
    if (!Utils::isNumeric(text)) {
        std::cerr << "无效的金额: " << text << std::endl;
        return false;
    }
    amount = Utils::stringToInt(text);
    return true;
}

void printEvent(const RecordedEvent& record) {
    std::cout << record.revision << "\t" << record.event.event_type << "\t";
    try {
        RecordFields fields = RecordFields::decode(record.event.data);
        bool first = true;
        for (const auto& entry : fields.entries()) {
            std::cout << (first ? "" : " ") << entry.first << "=" << entry.second;
            first = false;
        }
    } catch (const CodecException&) {
        std::cout << "<" << record.event.data.size() << " bytes>";
    }
    if (!record.event.metadata.empty()) {
        std::cout << "\t[transactional metadata]";
    }
    std::cout << std::endl;
}

int runCommand(const std::vector<std::string>& command, const StorageConfig& config) {
    const std::string& name = command[0];

    if (name == "layout") {
        if (command.size() != 4) {
            std::cerr << "用法: layout <type> <key> <state>" << std::endl;
            return 1;
        }
        StreamLayout layout = StreamLayout::forParticipant(command[1], command[2], command[3]);
        std::cout << "main     " << layout.main << std::endl;
        std::cout << "pending  " << layout.pending << std::endl;
        std::cout << "metadata " << layout.metadata << std::endl;
        return 0;
    }

    TransactionalStorageFactory factory(config);

    if (name == "dump") {
        if (command.size() != 2) {
            std::cerr << "用法: dump <stream>" << std::endl;
            return 1;
        }
        for (const auto& record : factory.client()->readStreamForward(command[1])) {
            printEvent(record);
        }
        return 0;
    }

    LocalTransactionCoordinator coordinator;
    int64_t amount = 0;

    if (name == "deposit" || name == "withdraw") {
        if (command.size() != 3 || !parseAmount(command[2], amount)) {
            std::cerr << "用法: " << name << " <account> <amount>" << std::endl;
            return 1;
        }
        BankAccount account(command[1], coordinator, factory, config.minimum_balance);
        if (name == "deposit") {
            account.deposit(amount);
        } else {
            account.withdraw(amount);
        }
        std::cout << account.id() << " balance " << account.balance() << std::endl;
        return 0;
    }

    if (name == "transfer") {
        if (command.size() != 4 || !parseAmount(command[3], amount)) {
            std::cerr << "用法: transfer <from> <to> <amount>" << std::endl;
            return 1;
        }
        BankAccount from(command[1], coordinator, factory, config.minimum_balance);
        BankAccount to(command[2], coordinator, factory, config.minimum_balance);
        BankAccount::transfer(coordinator, from, to, amount);
        std::cout << from.id() << " balance " << from.balance() << std::endl;
        std::cout << to.id() << " balance " << to.balance() << std::endl;
        return 0;
    }

    if (name == "balance") {
        if (command.size() != 2) {
            std::cerr << "用法: balance <account>" << std::endl;
            return 1;
        }
        BankAccount account(command[1], coordinator, factory, config.minimum_balance);
        std::cout << account.id() << " balance " << account.balance()
                  << " transactions " << account.transactionCount() << std::endl;
        return 0;
    }

    std::cerr << "未知命令: " << name << std::endl;
    std::cerr << "使用 -h 或 --help 查看帮助信息" << std::endl;
    return 1;
}

} // namespace evtx

int main(int argc, char* argv[]) {
    using namespace evtx;

    auto& logger = Logger::getInstance();

    CommandLine cmd;
    if (!parseArguments(argc, argv, cmd)) {
        return 1;
    }

    if (cmd.show_help) {
        printHelp();
        return 0;
    }

    if (cmd.show_version) {
        printVersion();
        return 0;
    }

    if (cmd.command.empty()) {
        printHelp();
        return 1;
    }

    StorageConfig config;
    if (!buildConfig(cmd, config)) {
        EVTX_LOG_ERROR("加载配置失败");
        return 1;
    }

    // 配置日志系统
    logger.setLogLevel(config.log_level);
    if (!config.log_file.empty()) {
        if (!logger.setLogFile(config.log_file)) {
            std::cerr << "无法打开日志文件: " << config.log_file << std::endl;
            return 1;
        }
        EVTX_LOG_INFO("日志文件已设置为: ", config.log_file);
    }

    EVTX_LOG_DEBUG("存储策略: ", Utils::strategyToString(config.strategy),
                   ", 回放策略: ", Utils::replayPolicyToString(config.replay_policy));

    int rc = 1;
    try {
        rc = runCommand(cmd.command, config);
    } catch (const TransactionAbortedException& e) {
        std::cerr << "事务已中止: " << e.what() << std::endl;
    } catch (const StreamNotFoundException& e) {
        std::cerr << e.what() << std::endl;
    } catch (const std::exception& e) {
        EVTX_LOG_ERROR("命令执行失败: ", e.what());
        std::cerr << "错误: " << e.what() << std::endl;
    }

    logger.closeLogFile();
    return rc;
}
