#include "transaction/evtx_storage_factory.hpp"
#include "log/evtx_file_event_log.hpp"
#include "log/evtx_memory_event_log.hpp"

namespace evtx {

TransactionalStorageFactory::TransactionalStorageFactory(std::shared_ptr<EventLogClient> client,
                                                         StorageStrategy strategy,
                                                         ReplayPolicy policy)
    : client_(std::move(client)), strategy_(strategy), policy_(policy) {
    if (!client_) {
        throw std::invalid_argument("TransactionalStorageFactory requires an event log client");
    }
}

TransactionalStorageFactory::TransactionalStorageFactory(const StorageConfig& config)
    : TransactionalStorageFactory(createEventLog(config), config.strategy, config.replay_policy) {}

std::shared_ptr<EventLogClient> TransactionalStorageFactory::createEventLog(const StorageConfig& config) {
    if (config.log_backend == LogBackend::FILE) {
        EVTX_LOG_INFO("Using file event log in ", config.log_dir);
        return std::make_shared<FileEventLog>(config.log_dir);
    }
    EVTX_LOG_INFO("Using in-memory event log");
    return std::make_shared<MemoryEventLog>();
}

} // namespace evtx
