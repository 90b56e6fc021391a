#include "Progress.hpp"

std::string ToString(OrchestratorState State)
{
    switch (State)
    {
    case OrchestratorState::Idle:       return "idle";
    case OrchestratorState::Scanning:   return "scanning";
    case OrchestratorState::Processing: return "processing";
    case OrchestratorState::Paused:     return "paused";
    case OrchestratorState::Stopping:   return "stopping";
    case OrchestratorState::Stopped:    return "stopped";
    case OrchestratorState::Completed:  return "completed";
    case OrchestratorState::Error:      return "error";
    }
    return "unknown";
}

OrchestratorState ParseOrchestratorState(const std::string& Text)
{
    if (Text == "scanning")   return OrchestratorState::Scanning;
    if (Text == "processing") return OrchestratorState::Processing;
    if (Text == "paused")     return OrchestratorState::Paused;
    if (Text == "stopping")   return OrchestratorState::Stopping;
    if (Text == "stopped")    return OrchestratorState::Stopped;
    if (Text == "completed")  return OrchestratorState::Completed;
    if (Text == "error")      return OrchestratorState::Error;
    return OrchestratorState::Idle;
}

bool IsTerminal(OrchestratorState State)
{
    return State == OrchestratorState::Stopped || State == OrchestratorState::Completed || State == OrchestratorState::Error;
}

void to_json(nlohmann::json& Json, const ProcessingProgress& Progress)
{
    Json = nlohmann::json
    {
        {"state", ToString(Progress.State)},
        {"session_id", Progress.SessionId},
        {"total_files", Progress.TotalFiles},
        {"files_scanned", Progress.FilesScanned},
        {"processed", Progress.Processed},
        {"skipped", Progress.Skipped},
        {"duplicates", Progress.Duplicates},
        {"errors", Progress.Errors},
        {"already_processed", Progress.AlreadyProcessed},
        {"bytes_processed", Progress.BytesProcessed},
        {"bytes_total", Progress.BytesTotal},
        {"current_file", Progress.CurrentFile},
        {"elapsed_seconds", Progress.ElapsedSeconds},
        {"files_per_second", Progress.FilesPerSecond},
        {"eta_seconds", Progress.EtaSeconds},
        {"categories", Progress.CategoryCounts},
        {"last_error", Progress.LastError}
    };
}

void from_json(const nlohmann::json& Json, ProcessingProgress& Progress)
{
    Progress.State = ParseOrchestratorState(Json.value("state", std::string("idle")));
    Progress.SessionId = Json.at("session_id").get<int64_t>();
    Progress.TotalFiles = Json.value("total_files", uint64_t{0});
    Progress.FilesScanned = Json.value("files_scanned", uint64_t{0});
    Progress.Processed = Json.value("processed", uint64_t{0});
    Progress.Skipped = Json.value("skipped", uint64_t{0});
    Progress.Duplicates = Json.value("duplicates", uint64_t{0});
    Progress.Errors = Json.value("errors", uint64_t{0});
    Progress.AlreadyProcessed = Json.value("already_processed", uint64_t{0});
    Progress.BytesProcessed = Json.value("bytes_processed", uint64_t{0});
    Progress.BytesTotal = Json.value("bytes_total", uint64_t{0});
    Progress.CurrentFile = Json.value("current_file", std::string());
    Progress.ElapsedSeconds = Json.value("elapsed_seconds", 0.0);
    Progress.FilesPerSecond = Json.value("files_per_second", 0.0);
    Progress.EtaSeconds = Json.value("eta_seconds", 0.0);
    Progress.CategoryCounts = Json.value("categories", std::map<std::string, uint64_t>());
    Progress.LastError = Json.value("last_error", std::string());
}
