#ifndef EVTX_STORAGE_FACTORY_HPP
#define EVTX_STORAGE_FACTORY_HPP

#include "evtx_optimistic_storage.hpp"
#include "evtx_pessimistic_storage.hpp"
#include "../evtx_config.hpp"
#include <memory>
#include <stdexcept>

namespace evtx {

// 按配置的策略为参与者创建存储实例，策略是静态配置，不随事务变化
class TransactionalStorageFactory {
public:
    TransactionalStorageFactory(std::shared_ptr<EventLogClient> client,
                                StorageStrategy strategy,
                                ReplayPolicy policy = ReplayPolicy::LENIENT);

    // 按配置创建日志后端
    explicit TransactionalStorageFactory(const StorageConfig& config);

    template<typename TState>
    std::unique_ptr<TransactionalStateStorage<TState>> create(const std::string& state_name,
                                                              const ParticipantContext& context) const {
        StreamLayout layout = StreamLayout::forParticipant(context, state_name);
        EVTX_LOG_DEBUG("Creating ", Utils::strategyToString(strategy_), " storage for stream ", layout.main);

        if (strategy_ == StorageStrategy::PESSIMISTIC) {
            return std::make_unique<PessimisticEventLogStorage<TState>>(client_, std::move(layout), policy_);
        }
        return std::make_unique<OptimisticEventLogStorage<TState>>(client_, std::move(layout), policy_);
    }

    StorageStrategy strategy() const { return strategy_; }
    ReplayPolicy replayPolicy() const { return policy_; }
    const std::shared_ptr<EventLogClient>& client() const { return client_; }

    // 创建配置指定的日志后端
    static std::shared_ptr<EventLogClient> createEventLog(const StorageConfig& config);

private:
    std::shared_ptr<EventLogClient> client_;
    StorageStrategy strategy_;
    ReplayPolicy policy_;
};

} // namespace evtx

#endif // EVTX_STORAGE_FACTORY_HPP
