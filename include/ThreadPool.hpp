#pragma once

#include <string>
#include <vector>
#include <thread>
#include <queue>
#include <mutex>
#include <condition_variable>
#include <functional>

// Fixed set of threads draining a job queue. The destructor finishes the
// queued jobs before joining.
class ThreadPool
{
public:
    ThreadPool(size_t ThreadCount, std::string Name);
    ~ThreadPool();

    ThreadPool(const ThreadPool&) = delete;
    ThreadPool& operator=(const ThreadPool&) = delete;

    void Submit(std::function<void()> Job);

    // Blocks until every submitted job has finished. Returns how many jobs
    // ended with an exception since the pool was created.
    size_t Join();

private:
    std::string Name;
    std::vector<std::thread> Workers;
    std::queue<std::function<void()>> Jobs;

    std::mutex PoolMutex;
    std::condition_variable Jobs_CV;
    std::condition_variable Idle_CV;
    bool Stopping = false;
    size_t Unfinished = 0;
    size_t Failed = 0;

    void WorkerThread(size_t Index);
};
