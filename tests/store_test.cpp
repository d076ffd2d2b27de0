#include "portcullis/core/proxy/TransactionMemoryStore.h"
#include "portcullis/core/proxy/TransactionDispatcher.h"
#include "portcullis/core/proxy/TransactionLogObserver.h"
#include <cassert>
#include <chrono>
#include <thread>
using namespace portcullis::core::proxy;
int main(){
    TransactionDispatcher d;
    auto store = make_memory_store(d);
    auto log = make_transaction_log_observer(d);

    Transaction t{}; t.id = d.next_id(); t.method = "CONNECT"; t.target = "blocked.example:443"; t.host = t.target; t.outcome = Outcome::blocked; t.status = 403;
    d.publish(t);
    Transaction u{}; u.id = d.next_id(); u.method = "GET"; u.target = "http://ok.example/"; u.outcome = Outcome::forwarded; u.status = 200; u.bytesOut = 5;
    d.publish(u);

    auto snap = store->snapshot();
    assert(snap.size() == 2);
    assert(snap[0].id == 1 && snap[1].id == 2);
    assert(snap[0].outcome == Outcome::blocked);
    assert(snap[1].bytesOut == 5);
    assert(store->count(Outcome::blocked) == 1);
    assert(store->count(Outcome::tunneled) == 0);
    assert(std::string(to_string(Outcome::forwarded)) == "forwarded");

    // publishing from another thread wakes waiters
    std::thread publisher([&]{
        std::this_thread::sleep_for(std::chrono::milliseconds(20));
        Transaction late{}; late.outcome = Outcome::tunneled;
        d.publish(late);
    });
    assert(store->wait_for(3, std::chrono::seconds(5)));
    publisher.join();
    assert(!store->wait_for(4, std::chrono::milliseconds(10)));

    // observers are held weakly
    log.reset();
    store.reset();
    d.publish(t);
    return 0;
}
