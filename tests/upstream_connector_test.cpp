#include "portcullis/core/net/UpstreamConnector.h"
#include "portcullis/core/net/Socket.h"
#include <algorithm>
#include <cassert>
#include <string>
#include <vector>
#include <fcntl.h>
#include <sys/resource.h>
#include <sys/select.h>
#include <unistd.h>

using namespace portcullis::core::net;

int main() {
    Listener listener;
    bool opened = listener.open("127.0.0.1", 0);
    assert(opened); (void)opened;

    // plain and timed connects
    {
        auto s = UpstreamConnector::connect("127.0.0.1", listener.local_port());
        assert(s && s->valid());
        auto t = UpstreamConnector::connect("127.0.0.1", listener.local_port(), 1000);
        assert(t && t->valid());
    }

    // refused and unresolvable targets report why
    {
        Listener closed_port;
        bool ok = closed_port.open("127.0.0.1", 0);
        assert(ok); (void)ok;
        uint16_t dead = closed_port.local_port();
        closed_port.close();
        std::string error;
        assert(!UpstreamConnector::connect("127.0.0.1", dead, 1000, &error));
        assert(!error.empty());
        error.clear();
        assert(!UpstreamConnector::connect("", 80, 0, &error));
        assert(error == "empty host");
    }

    // a timed connect when the new socket's descriptor is past FD_SETSIZE
    {
        rlimit lim{};
        bool raised = ::getrlimit(RLIMIT_NOFILE, &lim) == 0;
        if (raised && lim.rlim_cur < FD_SETSIZE + 64) {
            rlimit want = lim;
            want.rlim_cur = lim.rlim_max == RLIM_INFINITY ? FD_SETSIZE + 64 : std::min<rlim_t>(lim.rlim_max, FD_SETSIZE + 64);
            raised = ::setrlimit(RLIMIT_NOFILE, &want) == 0 && want.rlim_cur >= FD_SETSIZE + 64;
        }
        if (raised) {
            int base = ::open("/dev/null", O_RDONLY);
            assert(base >= 0);
            std::vector<int> filler;
            for (;;) {
                int fd = ::dup(base);
                if (fd < 0) break;
                filler.push_back(fd);
                if (fd >= FD_SETSIZE + 8) break;
            }
            if (!filler.empty() && filler.back() >= FD_SETSIZE + 8) {
                auto s = UpstreamConnector::connect("127.0.0.1", listener.local_port(), 1000);
                assert(s && s->native() >= FD_SETSIZE);
            }
            for (int fd : filler) ::close(fd);
            ::close(base);
        }
    }
    return 0;
}
