#include "hb/system.hpp"

#include <atomic>
#include <csignal>
#include <cstring>

#include <sys/resource.h>

#include "hb/logging.hpp"

namespace hb
{
namespace
{
std::atomic<Cancellation *> g_cancel{nullptr};

extern "C" void on_interrupt(int)
{
    if (Cancellation *c = g_cancel.load()) c->cancel();
}
} // namespace

void install_interrupt_handler(Cancellation *cancel)
{
    g_cancel.store(cancel);

    struct sigaction sa{};
    sa.sa_handler = cancel ? on_interrupt : SIG_DFL;
    sigemptyset(&sa.sa_mask);
    sa.sa_flags = SA_RESTART;
    for (int sig: {SIGINT, SIGTERM})
    {
        if (::sigaction(sig, &sa, nullptr) != 0)
            logger()->warn("sigaction({}) failed: {}", sig, std::strerror(errno));
    }
}

uint64_t raise_fd_limit(uint64_t wanted)
{
    rlimit rl{};
    if (::getrlimit(RLIMIT_NOFILE, &rl) != 0)
    {
        logger()->warn("getrlimit(RLIMIT_NOFILE) failed: {}", std::strerror(errno));
        return 0;
    }
    if (rl.rlim_cur == RLIM_INFINITY || rl.rlim_cur >= wanted) return rl.rlim_cur;

    rlim_t target = static_cast<rlim_t>(wanted);
    if (rl.rlim_max != RLIM_INFINITY && target > rl.rlim_max) target = rl.rlim_max;
    if (target > rl.rlim_cur)
    {
        const rlim_t before = rl.rlim_cur;
        rl.rlim_cur = target;
        if (::setrlimit(RLIMIT_NOFILE, &rl) != 0)
        {
            logger()->warn("setrlimit(RLIMIT_NOFILE, {}) failed: {}", target, std::strerror(errno));
            rl.rlim_cur = before;
        }
        else
        {
            logger()->debug("raised open file limit from {} to {}", before, target);
        }
    }
    if (rl.rlim_cur < wanted)
        logger()->warn("open file limit {} is below the {} descriptors this run may need; "
                       "expect connect failures", rl.rlim_cur, wanted);
    return rl.rlim_cur;
}
} // namespace hb
