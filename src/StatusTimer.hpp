#pragma once

#include <chrono> // milliseconds
#include <functional> // function
#include <thread> // jthread

// Runs a callback once after a delay, on its own thread. Starting again or
// destroying the timer cancels a pending callback and joins the thread.
class StatusTimer {
    public:
        void start(std::chrono::milliseconds delay, std::function<void()> expired);
        void stop();

    private:
        std::jthread worker;
};
