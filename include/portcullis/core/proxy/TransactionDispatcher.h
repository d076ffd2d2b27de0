#pragma once
#include <vector>
#include <memory>
#include <mutex>
#include <atomic>
#include "portcullis/core/proxy/Transaction.h"

namespace portcullis::core::proxy {
class TransactionDispatcher {
public:
    void add(std::shared_ptr<TransactionObserver> obs);
    void publish(const Transaction& t);
    uint64_t next_id() { return nextId.fetch_add(1, std::memory_order_relaxed); }
private:
    std::mutex guard;
    std::vector<std::weak_ptr<TransactionObserver>> observers;
    std::atomic<uint64_t> nextId{1};
};
}
