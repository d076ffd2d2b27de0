#pragma once
#include "portcullis/core/proxy/Transaction.h"
#include <chrono>
#include <condition_variable>
#include <vector>
#include <mutex>
#include <memory>
// forward declare dispatcher to avoid circular include
namespace portcullis::core::proxy { class TransactionDispatcher; }
namespace portcullis::core::proxy {
// Keeps every published transaction in memory; sessions publish from their
// own threads, so readers can block until a record shows up.
class TransactionMemoryStore : public TransactionObserver {
public:
    void on_transaction(const Transaction& t) override;
    std::vector<Transaction> snapshot() const;
    std::size_t count(Outcome outcome) const;
    // Waits until at least n records are stored; false on timeout.
    bool wait_for(std::size_t n, std::chrono::milliseconds timeout) const;
private:
    mutable std::mutex mu;
    mutable std::condition_variable cv;
    std::vector<Transaction> store;
};
std::shared_ptr<TransactionMemoryStore> make_memory_store(TransactionDispatcher& d);
}
