#include "StatusTimer.hpp"

#include <condition_variable> // condition_variable_any
#include <mutex> // mutex, unique_lock
#include <stop_token> // stop_token
#include <utility> // move

void StatusTimer::start(std::chrono::milliseconds delay, std::function<void()> expired) {
    stop();
    worker = std::jthread([delay, expired = std::move(expired)](std::stop_token token) {
        std::mutex mtx;
        std::condition_variable_any cv;
        std::unique_lock lock(mtx);
        cv.wait_for(lock, token, delay, [] { return false; });
        if(token.stop_requested())
            return;
        expired();
    });
}

void StatusTimer::stop() {
    if(worker.joinable()) {
        worker.request_stop();
        worker.join();
    }
}
