#pragma once

#include <string>
#include <map>
#include <cstdint>

#include <nlohmann/json.hpp>

enum class OrchestratorState
{
    Idle,
    Scanning,
    Processing,
    Paused,
    Stopping,
    Stopped,
    Completed,
    Error
};

std::string ToString(OrchestratorState State);
OrchestratorState ParseOrchestratorState(const std::string& Text);
bool IsTerminal(OrchestratorState State);

// Immutable copy handed to progress callbacks and written as the resume snapshot.
struct ProcessingProgress
{
    OrchestratorState State = OrchestratorState::Idle;
    int64_t SessionId = 0;

    uint64_t TotalFiles = 0;
    uint64_t FilesScanned = 0;
    uint64_t Processed = 0;
    uint64_t Skipped = 0;
    uint64_t Duplicates = 0;
    uint64_t Errors = 0;
    uint64_t AlreadyProcessed = 0;
    uint64_t BytesProcessed = 0;
    uint64_t BytesTotal = 0;

    std::string CurrentFile;
    double ElapsedSeconds = 0.0;
    double FilesPerSecond = 0.0;
    double EtaSeconds = 0.0;
    std::map<std::string, uint64_t> CategoryCounts;
    std::string LastError;

    uint64_t Finished() const
    {
        return Processed + Skipped + Duplicates + Errors;
    }

    uint64_t Pending() const
    {
        return TotalFiles > Finished() ? TotalFiles - Finished() : 0;
    }
};

void to_json(nlohmann::json& Json, const ProcessingProgress& Progress);
void from_json(const nlohmann::json& Json, ProcessingProgress& Progress);
