#include "portcullis/core/proxy/TransactionLogObserver.h"
#include <fmt/format.h>

namespace portcullis::core::proxy {
using portcullis::core::util::Logger;

void TransactionLogObserver::on_transaction(const Transaction& t) {
    auto level = t.outcome == Outcome::failed ? Logger::Level::warn : Logger::Level::info;
    std::string extra;
    if (!t.error.empty()) extra = fmt::format(" error \"{}\"", t.error);
    Logger::instance().log(level, fmt::format("tx {} {} {} {} {} status {} bytes_in {} bytes_out {} {}ms{}",
        t.id, t.client, t.method, t.target, to_string(t.outcome), t.status, t.bytesIn, t.bytesOut, t.duration.count(), extra));
}

std::shared_ptr<TransactionLogObserver> make_transaction_log_observer(TransactionDispatcher& d) {
    auto o = std::make_shared<TransactionLogObserver>();
    d.add(o);
    return o;
}
}
