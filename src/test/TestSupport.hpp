#pragma once

#include <iostream>
#include <fstream>
#include <sstream>
#include <string>
#include <filesystem>
#include <functional>
#include <chrono>
#include <thread>
#include <random>

// Shared helpers for the standalone test executables.
namespace TestSupport
{
    inline int Failures = 0;

    inline void Check(bool Condition, const std::string& What)
    {
        if (Condition)
        {
            std::cout << "[PASS] " << What << std::endl;
        }
        else
        {
            std::cout << "[FAIL] " << What << std::endl;
            ++Failures;
        }
    }

    inline int Finish(const std::string& Suite)
    {
        if (Failures == 0)
        {
            std::cout << "[Test] " << Suite << " completed." << std::endl;
            return 0;
        }
        std::cout << "[Test] " << Suite << " had " << Failures << " failures." << std::endl;
        return 1;
    }

    // Fresh directory under the system temp dir, removed on scope exit.
    class TempDir
    {
    public:
        explicit TempDir(const std::string& Prefix)
        {
            std::random_device Device;
            Root = std::filesystem::temp_directory_path() / (Prefix + "_" + std::to_string(Device()));
            std::filesystem::remove_all(Root);
            std::filesystem::create_directories(Root);
        }

        ~TempDir()
        {
            std::error_code ec;
            std::filesystem::remove_all(Root, ec);
        }

        TempDir(const TempDir&) = delete;
        TempDir& operator=(const TempDir&) = delete;

        const std::filesystem::path& Path() const
        {
            return Root;
        }

        std::filesystem::path operator/(const std::string& Name) const
        {
            return Root / Name;
        }

    private:
        std::filesystem::path Root;
    };

    inline void WriteFile(const std::filesystem::path& Path, const std::string& Contents)
    {
        std::filesystem::create_directories(Path.parent_path());
        std::ofstream Out(Path, std::ios::binary | std::ios::trunc);
        Out << Contents;
    }

    inline std::string ReadFile(const std::filesystem::path& Path)
    {
        std::ifstream In(Path, std::ios::binary);
        std::ostringstream Buffer;
        Buffer << In.rdbuf();
        return Buffer.str();
    }

    inline size_t CountRegularFiles(const std::filesystem::path& Root, const std::string& SkipDirName = "")
    {
        size_t Count = 0;
        std::error_code ec;
        for (auto It = std::filesystem::recursive_directory_iterator(Root, ec); It != std::filesystem::recursive_directory_iterator(); It.increment(ec))
        {
            if (!SkipDirName.empty() && It->is_directory() && It->path().filename() == SkipDirName)
            {
                It.disable_recursion_pending();
                continue;
            }
            if (It->is_regular_file())
            {
                ++Count;
            }
        }
        return Count;
    }

    // Polls Predicate until it holds or Timeout passes.
    inline bool WaitFor(const std::function<bool()>& Predicate, std::chrono::milliseconds Timeout)
    {
        auto Deadline = std::chrono::steady_clock::now() + Timeout;
        while (std::chrono::steady_clock::now() < Deadline)
        {
            if (Predicate())
            {
                return true;
            }
            std::this_thread::sleep_for(std::chrono::milliseconds(5));
        }
        return Predicate();
    }
}
