#include "speech/main_queue.hpp"

#include <exception>
#include <iostream>
#include <utility>

// Queues a task and wakes the draining thread
void MainQueue::post(Task task) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        tasks_.push_back(std::move(task));
    }
    cv_.notify_all();
}

// Pops one task and runs it unlocked. Returns false when the queue is empty.
bool MainQueue::runOne(std::unique_lock<std::mutex>& lock) {
    if (tasks_.empty()) return false;

    Task task = std::move(tasks_.front());
    tasks_.pop_front();

    lock.unlock();
    try {
        if (task) task();
    } catch (const std::exception& e) {
        std::cerr << "[Main Queue] [ERROR] task threw: " << e.what() << std::endl;
    }
    lock.lock();
    return true;
}

std::size_t MainQueue::runPending() {
    std::unique_lock<std::mutex> lock(mutex_);
    std::size_t n = 0;
    while (runOne(lock)) ++n;
    return n;
}

bool MainQueue::runUntil(const std::function<bool()>& done, std::chrono::milliseconds timeout) {
    const auto deadline = std::chrono::steady_clock::now() + timeout;

    std::unique_lock<std::mutex> lock(mutex_);
    while (true) {
        while (runOne(lock)) {}

        lock.unlock();
        const bool finished = done();
        lock.lock();
        if (finished) return true;

        if (!cv_.wait_until(lock, deadline, [this] { return !tasks_.empty(); })) {
            lock.unlock();
            const bool last = done();
            lock.lock();
            return last;
        }
    }
}

void MainQueue::run() {
    std::unique_lock<std::mutex> lock(mutex_);
    while (true) {
        while (runOne(lock)) {
            if (quit_) return;
        }
        if (quit_) return;
        cv_.wait(lock, [this] { return quit_ || !tasks_.empty(); });
    }
}

void MainQueue::quit() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        quit_ = true;
    }
    cv_.notify_all();
}
