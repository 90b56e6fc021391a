#include "ThreadPool.hpp"
#include "Logger.hpp"

#include <exception>

ThreadPool::ThreadPool(size_t ThreadCount, std::string Name) : Name(std::move(Name))
{
    if (ThreadCount == 0)
    {
        ThreadCount = 1;
    }
    Workers.reserve(ThreadCount);
    for (size_t i = 0; i < ThreadCount; ++i)
    {
        Workers.emplace_back(&ThreadPool::WorkerThread, this, i);
    }
}

ThreadPool::~ThreadPool()
{
    {
        std::lock_guard<std::mutex> Lock(PoolMutex);
        Stopping = true;
    }
    Jobs_CV.notify_all();
    for (std::thread& Worker : Workers)
    {
        if (Worker.joinable())
        {
            Worker.join();
        }
    }
}

void ThreadPool::Submit(std::function<void()> Job)
{
    {
        std::lock_guard<std::mutex> Lock(PoolMutex);
        Jobs.push(std::move(Job));
        ++Unfinished;
    }
    Jobs_CV.notify_one();
}

size_t ThreadPool::Join()
{
    std::unique_lock<std::mutex> Lock(PoolMutex);
    Idle_CV.wait(Lock, [this] { return Unfinished == 0; });
    return Failed;
}

void ThreadPool::WorkerThread(size_t Index)
{
    for (;;)
    {
        std::function<void()> Job;
        {
            std::unique_lock<std::mutex> Lock(PoolMutex);
            Jobs_CV.wait(Lock, [this] { return Stopping || !Jobs.empty(); });
            if (Jobs.empty())
            {
                return;
            }
            Job = std::move(Jobs.front());
            Jobs.pop();
        }

        bool Threw = false;
        try
        {
            Job();
        }
        catch (const std::exception& e)
        {
            Threw = true;
            Log.Error("[ThreadPool:" + Name + "#" + std::to_string(Index) + "] Job threw: " + e.what());
        }

        std::lock_guard<std::mutex> Lock(PoolMutex);
        if (Threw)
        {
            ++Failed;
        }
        if (--Unfinished == 0)
        {
            Idle_CV.notify_all();
        }
    }
}
