#include "retrykit/retrykit.hpp"
#include <atomic>
#include <csignal>
#include <iostream>
#include <stdexcept>
#include <thread>

using namespace retrykit;

// Simulated remote call: refuses the first few connections, rejects bad input outright
class FlakyService {
public:
    explicit FlakyService(int failures) : failures_(failures) {}

    void fetch(const std::string& key) {
        if (key.empty())
            throw std::invalid_argument("empty key");
        if (calls_++ < failures_)
            throw std::runtime_error("connection refused (call " + std::to_string(calls_) + ")");
        LOG_INFO("[service] fetched " + key + " after " + std::to_string(calls_) + " calls");
    }

private:
    int failures_;
    int calls_{ 0 };
};

static std::atomic<bool> g_interrupted{ false };

int main(int argc, char** argv) {
    CallArgs defaults;
    defaults.attempts = AttemptBudget::bounded(5);
    defaults.delay = std::chrono::milliseconds(50);
    defaults.backoffFactor = 2.0;
    defaults.maxDelay = std::chrono::milliseconds(400);

    CallArgs args;
    try {
        args = argc > 1 ? loadConfig(argv[1], defaults) : defaults;
    } catch (const InvalidConfiguration& e) {
        LOG_ERROR(std::string("[example] bad config: ") + e.what());
        return 2;
    }

    std::signal(SIGINT, [](int) { g_interrupted = true; });

    // Ctrl-C asks the session to stop at the next check point
    std::stop_source stopSource;
    std::jthread watcher([&stopSource](std::stop_token st) {
        while (!st.stop_requested()) {
            if (g_interrupted) { stopSource.request_stop(); return; }
            std::this_thread::sleep_for(std::chrono::milliseconds(20));
        }
    });

    FlakyService service(3);
    args.func = [&service] { service.fetch("profile:42"); };
    args.isFatalError = fatalOn<std::invalid_argument>();
    args.notifyFunc = logAttempts("fetch profile:42");
    args.stop = stopSource.get_token();

    try {
        call(args);
        std::cout << "fetch succeeded\n";
        return 0;
    } catch (const std::exception& e) {
        if (isAttemptsExceeded(e))
            std::cout << "giving up: " << e.what() << '\n';
        else if (isRetryStopped(e))
            std::cout << "interrupted: " << e.what() << '\n';
        else
            std::cout << "failed: " << e.what() << '\n';
        return 1;
    }
}
