#include "portcullis/core/proxy/TransactionDispatcher.h"
#include <algorithm>

namespace portcullis::core::proxy {
const char* to_string(Outcome outcome) {
    switch (outcome) {
        case Outcome::forwarded: return "forwarded";
        case Outcome::tunneled: return "tunneled";
        case Outcome::blocked: return "blocked";
        case Outcome::failed: return "failed";
    }
    return "?";
}

void TransactionDispatcher::add(std::shared_ptr<TransactionObserver> obs) {
    std::lock_guard lock(guard);
    observers.push_back(obs);
}

void TransactionDispatcher::publish(const Transaction& t) {
    std::vector<std::shared_ptr<TransactionObserver>> alive;
    {
        std::lock_guard lock(guard);
        // drop observers whose owners went away
        observers.erase(std::remove_if(observers.begin(), observers.end(), [](auto& w){ return w.expired(); }), observers.end());
        for (auto& w : observers) {
            if (auto s = w.lock()) alive.push_back(std::move(s));
        }
    }
    for (auto& o : alive) o->on_transaction(t);
}
}
