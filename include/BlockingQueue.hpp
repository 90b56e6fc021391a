#pragma once

#include <queue>
#include <mutex>
#include <condition_variable>
#include <optional>
#include <chrono>

// Bounded MPMC queue. Close() wakes every waiter; Pop drains what is left and
// then returns nullopt.
template <typename T>
class BlockingQueue
{
public:
    explicit BlockingQueue(size_t Capacity) : Capacity(Capacity == 0 ? 1 : Capacity)
    {
    }

    BlockingQueue(const BlockingQueue&) = delete;
    BlockingQueue& operator=(const BlockingQueue&) = delete;

    // false once the queue is closed
    bool Push(T Item)
    {
        std::unique_lock<std::mutex> Lock(QueueMutex);
        NotFull_CV.wait(Lock, [this] { return Closed || Items.size() < Capacity; });
        if (Closed)
        {
            return false;
        }
        Items.push(std::move(Item));
        Lock.unlock();
        NotEmpty_CV.notify_one();
        return true;
    }

    std::optional<T> Pop()
    {
        std::unique_lock<std::mutex> Lock(QueueMutex);
        NotEmpty_CV.wait(Lock, [this] { return Closed || !Items.empty(); });
        return TakeFront(Lock);
    }

    template <typename Rep, typename Period>
    std::optional<T> PopFor(const std::chrono::duration<Rep, Period>& Timeout)
    {
        std::unique_lock<std::mutex> Lock(QueueMutex);
        NotEmpty_CV.wait_for(Lock, Timeout, [this] { return Closed || !Items.empty(); });
        return TakeFront(Lock);
    }

    void Close()
    {
        {
            std::lock_guard<std::mutex> Lock(QueueMutex);
            Closed = true;
        }
        NotEmpty_CV.notify_all();
        NotFull_CV.notify_all();
    }

    size_t Size() const
    {
        std::lock_guard<std::mutex> Lock(QueueMutex);
        return Items.size();
    }

    bool IsClosed() const
    {
        std::lock_guard<std::mutex> Lock(QueueMutex);
        return Closed;
    }

private:
    std::optional<T> TakeFront(std::unique_lock<std::mutex>& Lock)
    {
        if (Items.empty())
        {
            return std::nullopt;
        }
        T Item = std::move(Items.front());
        Items.pop();
        Lock.unlock();
        NotFull_CV.notify_one();
        return Item;
    }

    const size_t Capacity;
    std::queue<T> Items;
    mutable std::mutex QueueMutex;
    std::condition_variable NotEmpty_CV;
    std::condition_variable NotFull_CV;
    bool Closed = false;
};
