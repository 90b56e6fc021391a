#include <iostream>
#include <vector>
#include <string>

#include "TestSupport.hpp"
#include "ConfigParser.hpp"
#include "ConfigGlobal.hpp"
#include "ControlFlow.hpp"
#include "Errors.hpp"

using namespace TestSupport;

namespace
{
    CommandLine ParseArgs(std::vector<std::string> Args)
    {
        Args.insert(Args.begin(), "DupliSort");
        std::vector<char*> Argv;
        for (auto& Arg : Args)
        {
            Argv.push_back(Arg.data());
        }
        Argv.push_back(nullptr);
        return ControlFlow::ParseArguments(static_cast<int>(Args.size()), Argv.data());
    }

    bool ArgsRejected(const std::vector<std::string>& Args)
    {
        try
        {
            ParseArgs(Args);
        }
        catch (const ConfigError&)
        {
            return true;
        }
        return false;
    }
}

int main()
{
    std::cout << "[Test] Starting config parser tests..." << std::endl;
    TempDir Dir("duplisort_config");

    {
        WriteFile(Dir / "good.txt",
            "# comment\n"
            "ThreadCount = 3\n"
            "SkipHidden = NO\n"
            "SkipFilePattern = *.tmp\n"
            "SkipFilePattern = *.tmp\n"
            "SkipFolderPattern = node_modules\n"
            "MinFreeSpaceMB = 100\n"
            "ProgressIntervalMs = 250\n"
            "DatabaseFile = /var/tmp/duplisort-test.db\n");

        ConfigParser Parser;
        Parser.Reset();
        bool Ok = Parser.Parse((Dir / "good.txt").string(), true);
        Check(Ok && Parser.GetErrors().empty(), "valid file parses without errors");
        Check(ConfigGlobal::ThreadCount == 3, "ThreadCount applied");
        Check(!ConfigGlobal::SkipHidden, "SkipHidden NO applied");
        Check(ConfigGlobal::SkipFilePatterns.size() == 1, "repeated file pattern kept once");
        Check(ConfigGlobal::SkipFolderPatterns.size() == 1 && ConfigGlobal::SkipFolderPatterns[0] == "node_modules", "folder pattern applied");
        Check(ConfigGlobal::MinFreeSpaceMB == 100, "MinFreeSpaceMB applied");
        Check(ConfigGlobal::ProgressIntervalMs == 250, "ProgressIntervalMs applied");
        Check(ConfigGlobal::ResolveDatabasePath("/dest") == std::filesystem::path("/var/tmp/duplisort-test.db"), "configured database path wins");
    }

    {
        ConfigParser Parser;
        Parser.Reset();
        Check(ConfigGlobal::ResolveDatabasePath("/dest") == std::filesystem::path("/dest/db/duplisort.db"), "default database lives under the destination");
        Check(Parser.Parse((Dir / "absent.txt").string(), false), "missing optional config falls back to defaults");
        Check(ConfigGlobal::MinFreeSpaceMB == 512 && ConfigGlobal::SkipHidden, "defaults untouched by missing file");

        Parser.Reset();
        Check(!Parser.Parse((Dir / "absent.txt").string(), true), "missing config given explicitly is an error");
    }

    {
        WriteFile(Dir / "bad.txt",
            "Colour = blue\n"
            "ThreadCount = lots\n"
            "ThreadCount = 0\n"
            "SkipHidden = maybe\n"
            "DatabaseFile = relative/db.sqlite\n"
            "no equals sign here\n");

        ConfigParser Parser;
        Parser.Reset();
        Check(!Parser.Parse((Dir / "bad.txt").string(), true), "bad file rejected");
        Check(Parser.GetErrors().size() == 6, "every bad line reported (" + std::to_string(Parser.GetErrors().size()) + ")");
    }

    {
        std::filesystem::create_directories(Dir / "src" / "inner");
        std::filesystem::create_directories(Dir / "out");

        ConfigParser Parser;
        Parser.Reset();
        Check(Parser.ValidateRunPaths((Dir / "src").string(), (Dir / "out").string()), "separate source and destination accepted");

        Parser.Reset();
        Check(Parser.ValidateRunPaths((Dir / "src").string(), (Dir / "fresh").string()), "destination that does not exist yet accepted");

        Parser.Reset();
        Check(!Parser.ValidateRunPaths((Dir / "src").string(), (Dir / "src" / "inner").string()), "destination inside source rejected");

        Parser.Reset();
        Check(!Parser.ValidateRunPaths((Dir / "src" / "inner").string(), (Dir / "src").string()), "source inside destination rejected");

        Parser.Reset();
        Check(!Parser.ValidateRunPaths((Dir / "src").string(), (Dir / "src").string() + "/"), "same directory rejected");

        Parser.Reset();
        Check(!Parser.ValidateRunPaths((Dir / "missing").string(), (Dir / "out").string()), "missing source rejected");
    }

    {
        CommandLine Cmd = ParseArgs({ "--config", "my.txt", "start", "/a", "/b" });
        Check(Cmd.Command == "start" && Cmd.Args.size() == 2 && Cmd.Args[1] == "/b", "positional arguments collected");
        Check(Cmd.ConfigGiven && Cmd.ConfigFile == "my.txt", "--config captured");

        CommandLine Undo = ParseArgs({ "undo", "/b", "7", "--dry-run" });
        Check(Undo.DryRun && Undo.Args.size() == 2, "--dry-run accepted for undo");

        Check(ArgsRejected({ "start", "/a", "/b", "--dry-run" }), "--dry-run rejected outside undo");
        Check(ArgsRejected({ "start", "--fast" }), "unknown option rejected");
        Check(ArgsRejected({ "status", "/b", "--config" }), "--config without a value rejected");

        Check(ControlFlow::ExitCodeFor(OrchestratorState::Completed) == 0, "completed exits 0");
        Check(ControlFlow::ExitCodeFor(OrchestratorState::Error) == 1, "error exits 1");
        Check(ControlFlow::ExitCodeFor(OrchestratorState::Stopped) == 2, "stopped exits 2");
    }

    return Finish("Config parser");
}
