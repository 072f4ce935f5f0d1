#ifndef MAIN_QUEUE_HPP
#define MAIN_QUEUE_HPP

#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <deque>
#include <functional>
#include <mutex>

// The execution context published state lives on. post() may be called from
// any thread; tasks run in FIFO order on whichever thread drains the queue.
class Dispatcher {
public:
    using Task = std::function<void()>;

    virtual ~Dispatcher() = default;
    virtual void post(Task task) = 0;
};

class MainQueue : public Dispatcher {
public:
    MainQueue() = default;

    MainQueue(const MainQueue&) = delete;
    MainQueue& operator=(const MainQueue&) = delete;

    void post(Task task) override;

    // Runs queued tasks, including ones posted while draining.
    std::size_t runPending();

    // Drains and waits until done() holds or the timeout expires.
    bool runUntil(const std::function<bool()>& done, std::chrono::milliseconds timeout);

    // Drains until quit() is called.
    void run();
    void quit();

private:
    bool runOne(std::unique_lock<std::mutex>& lock);

    std::mutex mutex_;
    std::condition_variable cv_;
    std::deque<Task> tasks_;
    bool quit_ = false;
};

#endif
