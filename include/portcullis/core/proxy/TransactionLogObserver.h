#pragma once
#include "portcullis/core/proxy/Transaction.h"
#include "portcullis/core/proxy/TransactionDispatcher.h"
#include "portcullis/core/util/Logger.h"
#include <memory>

namespace portcullis::core::proxy {
class TransactionLogObserver : public TransactionObserver {
public:
    void on_transaction(const Transaction& t) override;
};
std::shared_ptr<TransactionLogObserver> make_transaction_log_observer(TransactionDispatcher& d);
}
