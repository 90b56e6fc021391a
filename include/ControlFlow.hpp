#pragma once

#include <string>
#include <vector>
#include <cstdint>
#include <functional>

#include "ConfigParser.hpp"
#include "Orchestrator.hpp"

class HashCache;
class SessionManager;

struct CommandLine
{
    std::string Command;
    std::vector<std::string> Args;
    std::string ConfigFile;
    bool ConfigGiven = false;
    bool DryRun = false;
    bool Help = false;
};

// Command line front end. Every command returns the process exit code:
// 0 completed, 1 error, 2 stopped.
class ControlFlow
{
public:
    ControlFlow() = default;

    int Run(int argc, char* argv[]);

    // Throws ConfigError on unknown options or a missing option value.
    static CommandLine ParseArguments(int argc, char* argv[]);
    static int ExitCodeFor(OrchestratorState State);

private:
    ConfigParser Parser;

    bool LoadConfig(const CommandLine& Cmd);
    int Dispatch(const CommandLine& Cmd);

    int RunStart(const std::string& Source, const std::string& Destination);
    int RunResume(const std::string& Destination, const std::vector<std::string>& Args);
    int RunStatus(const std::string& Destination, const std::vector<std::string>& Args);
    int RunUndo(const std::string& Destination, const std::string& SessionArg, bool DryRun);
    int RunDuplicates(const std::string& Directory);

    // Builds the run components for Destination and drives Body with a signal watcher attached.
    int DriveOrchestrator(const std::string& DestinationRoot, const std::function<OrchestratorState(Orchestrator&, SessionManager&)>& Body);

    static std::string DatabasePathFor(const std::string& DestinationRoot, bool MustExist);
    static void PruneHashCache(HashCache& Cache);
    static OrchestratorOptions BuildOptions();
    static std::string ConfigFingerprint();
    static int64_t ParseSessionId(const std::string& Text);
    static void PrintUsage();
    static void PrintProgress(const ProcessingProgress& Progress);
    static void PrintSummary(const ProcessingProgress& Progress);
    static void PrintSession(const Session& Row);
};
