#include "chunkgate/shutdown.h"

#include <drogon/drogon.h>

#include <pthread.h>
#include <signal.h>

#include <atomic>
#include <cstring>
#include <thread>

namespace chunkgate {

void installShutdownHandlers() {
    static std::atomic<bool> requested{false};

    sigset_t signals;
    sigemptyset(&signals);
    sigaddset(&signals, SIGINT);
    sigaddset(&signals, SIGTERM);
    if (const int rc = pthread_sigmask(SIG_BLOCK, &signals, nullptr); rc != 0) {
        LOG_ERROR << "Cannot block shutdown signals: " << std::strerror(rc);
        return;
    }

    std::thread waiter([signals]() {
        int received = 0;
        while (sigwait(&signals, &received) == 0) {
            if (requested.exchange(true)) {
                continue;
            }
            drogon::app().getLoop()->queueInLoop([received]() {
                LOG_INFO << "Received " << (received == SIGTERM ? "SIGTERM" : "SIGINT") << ", stopping.";
                drogon::app().quit();
            });
        }
    });
    waiter.detach();
}

}  // namespace chunkgate
