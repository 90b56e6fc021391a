#pragma once

#include <filesystem>
#include <chrono>
#include <ctime>
#include <cstdint>
#include <string>

//UNIX Time since Epoch, seconds
inline int64_t ToTimeT(std::filesystem::file_time_type FTime)
{
    using namespace std::chrono;
    auto SystemTime = file_clock::to_sys(FTime);
    return duration_cast<seconds>(SystemTime.time_since_epoch()).count();
}

// Full resolution of the filesystem clock, for change detection
inline int64_t ToNanoseconds(std::filesystem::file_time_type FTime)
{
    using namespace std::chrono;
    auto SystemTime = file_clock::to_sys(FTime);
    return duration_cast<nanoseconds>(SystemTime.time_since_epoch()).count();
}

inline int64_t NowSeconds()
{
    using namespace std::chrono;
    return duration_cast<seconds>(system_clock::now().time_since_epoch()).count();
}

// UTC, "YYYY-MM-DDTHH:MM:SSZ"
inline std::string FormatIso(int64_t Seconds)
{
    std::time_t Time = static_cast<std::time_t>(Seconds);
    std::tm Utc{};
    gmtime_r(&Time, &Utc);

    char Buffer[32];
    std::strftime(Buffer, sizeof(Buffer), "%Y-%m-%dT%H:%M:%SZ", &Utc);
    return Buffer;
}

inline int YearOf(int64_t Seconds)
{
    std::time_t Time = static_cast<std::time_t>(Seconds);
    std::tm Local{};
    localtime_r(&Time, &Local);
    return Local.tm_year + 1900;
}
