#include "portcullis/core/proxy/TransactionMemoryStore.h"
#include "portcullis/core/proxy/TransactionDispatcher.h"
#include <algorithm>

namespace portcullis::core::proxy {
void TransactionMemoryStore::on_transaction(const Transaction& t) {
    {
        std::lock_guard lock(mu);
        store.push_back(t);
    }
    cv.notify_all();
}

std::vector<Transaction> TransactionMemoryStore::snapshot() const {
    std::lock_guard lock(mu);
    return store;
}

std::size_t TransactionMemoryStore::count(Outcome outcome) const {
    std::lock_guard lock(mu);
    return static_cast<std::size_t>(std::count_if(store.begin(), store.end(), [&](const Transaction& t){ return t.outcome == outcome; }));
}

bool TransactionMemoryStore::wait_for(std::size_t n, std::chrono::milliseconds timeout) const {
    std::unique_lock lock(mu);
    return cv.wait_for(lock, timeout, [&]{ return store.size() >= n; });
}

std::shared_ptr<TransactionMemoryStore> make_memory_store(TransactionDispatcher& d) {
    auto ptr = std::make_shared<TransactionMemoryStore>();
    d.add(ptr);
    return ptr;
}
}
