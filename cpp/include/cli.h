#ifndef PROMPTVAULT_CLI_H
#define PROMPTVAULT_CLI_H

#include <string>
#include <vector>
#include <map>
#include <memory>
#include "config.h"
#include "prompt_library.h"

namespace promptvault {

// Parsed arguments of one command: positionals, --key value options and --flags
struct CommandArgs {
    std::string command;
    std::vector<std::string> positionals;
    std::multimap<std::string, std::string> options;
    std::vector<std::string> flags;

    bool hasFlag(const std::string& name) const;
    bool hasOption(const std::string& name) const;
    std::string option(const std::string& name) const;     // last value wins
    std::vector<std::string> optionValues(const std::string& name) const;

    // Throws ValidationError on a missing option value
    static CommandArgs parse(const std::vector<std::string>& tokens);
};

class CLI {
public:
    CLI();
    ~CLI();

    // Parse command line arguments
    bool parseArgs(int argc, char* argv[]);

    // Run the application, returns the process exit code
    int run();

    // Run one command and map errors to exit codes:
    // 0 ok, 2 validation/not found/parse, 1 storage
    int executeCommand(const std::vector<std::string>& tokens);

private:
    void openLibrary();

    // Interactive mode
    void interactiveMode();

    // Throws on failure
    void dispatch(const CommandArgs& args);

    // Command handlers
    void cmdList(const CommandArgs& args);
    void cmdTags(const CommandArgs& args);
    void cmdShow(const CommandArgs& args);
    void cmdVersions(const CommandArgs& args);
    void cmdAdd(const CommandArgs& args);
    void cmdEdit(const CommandArgs& args);
    void cmdDelete(const CommandArgs& args);
    void cmdLog(const CommandArgs& args);
    void cmdRender(const CommandArgs& args);
    void cmdRestore(const CommandArgs& args);
    void cmdUsage(const CommandArgs& args);
    void cmdExport(const CommandArgs& args);
    void cmdImport(const CommandArgs& args);

    // UI helpers
    void printHelp();
    void printConfig();
    void printPromptLine(const Prompt& p);
    void printPrompt(const Prompt& p);

    // Content from --content or --file, empty when neither was given
    std::string readContentOption(const CommandArgs& args);

    // Members
    std::unique_ptr<Config> config_;
    std::unique_ptr<PromptLibrary> library_;

    // Options from command line
    std::string data_dir_override_;
    bool verbose_;
    std::vector<std::string> command_tokens_;
};

} // namespace promptvault

#endif // PROMPTVAULT_CLI_H
