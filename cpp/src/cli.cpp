#include "cli.h"
#include "errors.h"
#include "tags.h"
#include "template_vars.h"
#include "usage_ledger.h"
#include "utils.h"
#include <iostream>
#include <iomanip>
#include <sstream>
#include <cstdlib>
#include <cerrno>
#include <algorithm>

#ifdef HAVE_READLINE
#include <readline/readline.h>
#include <readline/history.h>
#endif

namespace promptvault {

namespace {

const char* VERSION = "1.0.0";

// Options that never take a value
const char* const FLAG_NAMES[] = {"favorite", "no-favorite", "log", "json"};

bool isFlagName(const std::string& name) {
    for (const char* flag : FLAG_NAMES) {
        if (name == flag) return true;
    }
    return false;
}

int64_t parseInteger(const std::string& text, const std::string& what) {
    std::string trimmed = utils::trim(text);
    if (trimmed.empty()) {
        throw ValidationError(what + " is required");
    }
    errno = 0;
    char* end = nullptr;
    long long value = std::strtoll(trimmed.c_str(), &end, 10);
    if (errno != 0 || end == trimmed.c_str() || *end != '\0') {
        throw ValidationError(what + " must be an integer, got '" + text + "'");
    }
    return static_cast<int64_t>(value);
}

int64_t requireId(const CommandArgs& args, size_t index, const std::string& what) {
    if (index >= args.positionals.size()) {
        throw ValidationError("Missing " + what + " for '" + args.command + "'");
    }
    return parseInteger(args.positionals[index], what);
}

std::optional<int> ratingOption(const CommandArgs& args) {
    if (!args.hasOption("rating")) return std::nullopt;
    int64_t value = parseInteger(args.option("rating"), "Rating");
    if (value < MIN_RATING || value > MAX_RATING) {
        throw ValidationError("Rating must be between " + std::to_string(MIN_RATING) + " and " +
                              std::to_string(MAX_RATING) + ", got " + args.option("rating"));
    }
    return static_cast<int>(value);
}

void printJson(const json& j) {
    std::cout << j.dump(2, ' ', false, json::error_handler_t::replace) << "\n";
}

std::string formatScore(const Prompt& p) {
    if (p.score_count == 0) return "unrated";
    std::ostringstream out;
    out << std::fixed << std::setprecision(2) << p.score_avg << " (" << p.score_count << ")";
    return out.str();
}

std::string joinTags(const std::vector<std::string>& tag_list) {
    std::string joined;
    for (const auto& t : tag_list) {
        if (!joined.empty()) joined += ", ";
        joined += t;
    }
    return joined;
}

} // namespace

// ============================================================================
// CommandArgs
// ============================================================================

bool CommandArgs::hasFlag(const std::string& name) const {
    return std::find(flags.begin(), flags.end(), name) != flags.end();
}

bool CommandArgs::hasOption(const std::string& name) const {
    return options.find(name) != options.end();
}

std::string CommandArgs::option(const std::string& name) const {
    std::string value;
    auto range = options.equal_range(name);
    for (auto it = range.first; it != range.second; ++it) {
        value = it->second;
    }
    return value;
}

std::vector<std::string> CommandArgs::optionValues(const std::string& name) const {
    std::vector<std::string> values;
    auto range = options.equal_range(name);
    for (auto it = range.first; it != range.second; ++it) {
        values.push_back(it->second);
    }
    return values;
}

CommandArgs CommandArgs::parse(const std::vector<std::string>& tokens) {
    CommandArgs args;
    if (tokens.empty()) return args;

    args.command = tokens[0];
    for (size_t i = 1; i < tokens.size(); i++) {
        const std::string& token = tokens[i];
        if (utils::startsWith(token, "--") && token.size() > 2) {
            std::string name = token.substr(2);
            if (isFlagName(name)) {
                args.flags.push_back(name);
            } else if (i + 1 < tokens.size()) {
                args.options.emplace(name, tokens[++i]);
            } else {
                throw ValidationError("Option --" + name + " requires a value");
            }
        } else {
            args.positionals.push_back(token);
        }
    }
    return args;
}

// ============================================================================
// CLI
// ============================================================================

CLI::CLI()
    : verbose_(false)
{
    config_ = std::make_unique<Config>();
}

CLI::~CLI() = default;

bool CLI::parseArgs(int argc, char* argv[]) {
    for (int i = 1; i < argc; i++) {
        std::string arg = argv[i];

        if (arg == "-h" || arg == "--help") {
            printHelp();
            return false;
        } else if (arg == "-V" || arg == "--version") {
            std::cout << "promptvault version " << VERSION << std::endl;
            return false;
        } else if (arg == "-d" || arg == "--data-dir") {
            if (i + 1 < argc) {
                data_dir_override_ = argv[++i];
            } else {
                throw ValidationError("--data-dir requires a directory");
            }
        } else if (arg == "-v" || arg == "--verbose") {
            verbose_ = true;
        } else {
            // Everything from the command name on belongs to the command
            for (int j = i; j < argc; j++) {
                command_tokens_.push_back(argv[j]);
            }
            break;
        }
    }

    return true;
}

void CLI::openLibrary() {
    config_->initialize(data_dir_override_);
    utils::log::setLevel(verbose_ ? utils::log::Level::Debug : config_->getLogLevel());

    library_ = std::make_unique<PromptLibrary>(*config_);
}

void CLI::printHelp() {
    std::cout << R"(Usage: promptvault [OPTIONS] COMMAND [ARGS]

Local prompt library with version history, usage ratings and JSON snapshots

OPTIONS:
    -d, --data-dir DIR      Use DIR for the database and config.json
    -v, --verbose           Debug logging on stderr
    -V, --version           Show version
    -h, --help              Show this help

COMMANDS:
    list [--search S] [--tag T] [--sort score|created|updated] [--json]
    tags [--json]           Tags with prompt counts
    show ID [--json]        Prompt details and content
    versions ID [--json]    Version history, newest first
    add --title T (--content C | --file F) [--tags a,b] [--favorite] [--note N]
    edit ID [--title T] [--content C | --file F] [--tags a,b]
            [--favorite | --no-favorite] [--note N]
    delete ID
    log ID [--vars JSON] [--output TEXT] [--rating 1-5]
    render ID [--var name=value]... [--log] [--rating 1-5]
    restore ID VERSION_ID [--note N]
    usage ID [--json]       Usage history, newest first
    export [FILE]           Write a snapshot to FILE or stdout
    import FILE             Add every prompt from a snapshot
    config                  Show configuration
    shell                   Interactive mode (exit or quit to leave)
)";
}

void CLI::printConfig() {
    std::cout << utils::terminal::CYAN << utils::terminal::BOLD << "Current Configuration:" << utils::terminal::RESET << "\n";
    std::cout << "  Data Dir:      " << config_->getDataDir() << "\n";
    std::cout << "  Database:      " << utils::terminal::GREEN << config_->getDatabasePath() << utils::terminal::RESET << "\n";
    std::cout << "  Config File:   " << config_->getConfigPath() << "\n";
    std::cout << "  Busy Timeout:  " << config_->getBusyTimeoutMs() << " ms\n";
    std::cout << "  Journal Mode:  " << config_->getJournalMode() << "\n";
    std::cout << "  Log Level:     " << utils::log::levelName(config_->getLogLevel()) << "\n";
    std::cout << "  Export Indent: " << config_->getExportIndent() << "\n";
    std::cout << "\n";
}

void CLI::printPromptLine(const Prompt& p) {
    std::cout << "  " << std::setw(4) << p.id << " ";
    if (p.is_favorite) std::cout << utils::terminal::YELLOW << "* " << utils::terminal::RESET;
    std::cout << utils::terminal::GREEN << p.title << utils::terminal::RESET;
    if (!p.tags.empty()) {
        std::cout << " [" << joinTags(p.tags) << "]";
    }
    std::cout << "  " << formatScore(p) << "\n";
    std::cout << "       " << template_vars::summarizeContent(p.content) << "\n";
}

void CLI::printPrompt(const Prompt& p) {
    std::cout << utils::terminal::BOLD << p.title << utils::terminal::RESET;
    if (p.is_favorite) std::cout << utils::terminal::YELLOW << " *" << utils::terminal::RESET;
    std::cout << "\n";
    std::cout << "  ID:        " << p.id << "\n";
    std::cout << "  Tags:      " << (p.tags.empty() ? "-" : joinTags(p.tags)) << "\n";
    std::cout << "  Score:     " << formatScore(p) << "\n";
    std::cout << "  Created:   " << p.created_at << "\n";
    std::cout << "  Updated:   " << p.updated_at << "\n";

    auto variables = template_vars::extractVariables(p.content);
    if (!variables.empty()) {
        std::cout << "  Variables: " << joinTags(variables) << "\n";
    }

    std::cout << std::string(50, '-') << "\n";
    std::cout << p.content << "\n";
}

std::string CLI::readContentOption(const CommandArgs& args) {
    if (args.hasOption("content") && args.hasOption("file")) {
        throw ValidationError("Use either --content or --file, not both");
    }
    if (args.hasOption("file")) {
        std::string path = args.option("file");
        if (!utils::fileExists(path)) {
            throw ValidationError("File not found: " + path);
        }
        return utils::readFile(path);
    }
    return args.option("content");
}

// ============================================================================
// Command handlers
// ============================================================================

void CLI::cmdList(const CommandArgs& args) {
    std::optional<std::string> search;
    std::optional<std::string> tag;
    std::optional<std::string> sort_by;
    if (args.hasOption("search")) search = args.option("search");
    if (args.hasOption("tag")) tag = args.option("tag");
    if (args.hasOption("sort")) sort_by = args.option("sort");

    auto prompts = library_->listPrompts(search, tag, sort_by);
    if (args.hasFlag("json")) {
        json out = json::array();
        for (const auto& p : prompts) out.push_back(p.toJson());
        printJson(out);
        return;
    }
    if (prompts.empty()) {
        utils::terminal::printInfo("No prompts found.");
        return;
    }

    std::cout << utils::terminal::BOLD << "Prompts (" << prompts.size() << ")" << utils::terminal::RESET << "\n";
    for (const auto& p : prompts) {
        printPromptLine(p);
    }
}

void CLI::cmdTags(const CommandArgs& args) {
    auto tag_counts = library_->listTags();
    if (args.hasFlag("json")) {
        json out = json::array();
        for (const auto& t : tag_counts) out.push_back(t.toJson());
        printJson(out);
        return;
    }
    if (tag_counts.empty()) {
        utils::terminal::printInfo("No tags yet.");
        return;
    }
    for (const auto& t : tag_counts) {
        std::cout << "  " << std::setw(4) << t.count << "  " << t.name << "\n";
    }
}

void CLI::cmdShow(const CommandArgs& args) {
    int64_t id = requireId(args, 0, "prompt id");
    auto prompt = library_->getPrompt(id);
    if (!prompt) {
        throw NotFoundError("Prompt " + std::to_string(id) + " does not exist");
    }
    if (args.hasFlag("json")) {
        printJson(prompt->toJson());
        return;
    }
    printPrompt(*prompt);
}

void CLI::cmdVersions(const CommandArgs& args) {
    int64_t id = requireId(args, 0, "prompt id");
    auto versions = library_->listPromptVersions(id);
    if (args.hasFlag("json")) {
        json out = json::array();
        for (const auto& v : versions) out.push_back(v.toJson());
        printJson(out);
        return;
    }
    if (versions.empty()) {
        utils::terminal::printInfo("No versions for prompt " + std::to_string(id) + ".");
        return;
    }
    for (const auto& v : versions) {
        std::cout << "  " << std::setw(4) << v.id << "  " << v.created_at << "  "
                  << utils::terminal::CYAN << v.change_note << utils::terminal::RESET << "\n";
        std::cout << "        " << template_vars::summarizeContent(v.content) << "\n";
    }
}

void CLI::cmdAdd(const CommandArgs& args) {
    SavePromptInput input;
    input.title = args.option("title");
    input.content = readContentOption(args);
    input.tags = tags::parseTagInput(args.option("tags"));
    input.is_favorite = args.hasFlag("favorite");
    if (args.hasOption("note")) input.change_note = args.option("note");

    Prompt p = library_->upsertPrompt(input);
    utils::terminal::printSuccess("Prompt " + std::to_string(p.id) + " '" + p.title + "' added.");
}

void CLI::cmdEdit(const CommandArgs& args) {
    int64_t id = requireId(args, 0, "prompt id");
    auto existing = library_->getPrompt(id);
    if (!existing) {
        throw NotFoundError("Prompt " + std::to_string(id) + " does not exist");
    }

    SavePromptInput input;
    input.id = id;
    input.title = args.hasOption("title") ? args.option("title") : existing->title;
    input.content = (args.hasOption("content") || args.hasOption("file"))
                    ? readContentOption(args) : existing->content;
    input.tags = args.hasOption("tags") ? tags::parseTagInput(args.option("tags")) : existing->tags;
    input.is_favorite = existing->is_favorite;
    if (args.hasFlag("favorite")) input.is_favorite = true;
    if (args.hasFlag("no-favorite")) input.is_favorite = false;
    if (args.hasOption("note")) input.change_note = args.option("note");

    Prompt p = library_->upsertPrompt(input);
    utils::terminal::printSuccess("Prompt " + std::to_string(p.id) + " updated.");
}

void CLI::cmdDelete(const CommandArgs& args) {
    int64_t id = requireId(args, 0, "prompt id");
    library_->deletePrompt(id);
    utils::terminal::printSuccess("Prompt " + std::to_string(id) + " deleted.");
}

void CLI::cmdLog(const CommandArgs& args) {
    UsageInput input;
    input.prompt_id = requireId(args, 0, "prompt id");
    if (args.hasOption("vars")) {
        json payload = json::parse(args.option("vars"), nullptr, false);
        if (payload.is_discarded()) {
            throw ParseError("--vars is not valid JSON");
        }
        input.input_payload = payload;
    }
    input.output_text = args.option("output");
    input.rating = ratingOption(args);

    library_->logPromptUsage(input);
    utils::terminal::printSuccess("Usage logged for prompt " + std::to_string(input.prompt_id) + ".");
}

void CLI::cmdRender(const CommandArgs& args) {
    int64_t id = requireId(args, 0, "prompt id");

    std::map<std::string, std::string> values;
    for (const auto& assignment : args.optionValues("var")) {
        size_t eq = assignment.find('=');
        if (eq == std::string::npos) {
            throw ValidationError("--var expects name=value, got '" + assignment + "'");
        }
        values[utils::trim(assignment.substr(0, eq))] = assignment.substr(eq + 1);
    }

    std::string rendered = library_->renderPrompt(id, values);

    auto prompt = library_->getPrompt(id);
    if (prompt) {
        for (const auto& name : template_vars::extractVariables(prompt->content)) {
            if (values.find(name) == values.end()) {
                utils::log::warn("No value for variable '" + name + "'");
            }
        }
    }

    std::cout << rendered << "\n";

    if (args.hasFlag("log")) {
        UsageInput input;
        input.prompt_id = id;
        input.input_payload = json(values);
        input.output_text = rendered;
        input.rating = ratingOption(args);
        library_->logPromptUsage(input);
        utils::log::info("Usage logged for prompt " + std::to_string(id));
    }
}

void CLI::cmdRestore(const CommandArgs& args) {
    int64_t id = requireId(args, 0, "prompt id");
    int64_t version_id = requireId(args, 1, "version id");
    std::optional<std::string> note;
    if (args.hasOption("note")) note = args.option("note");

    Prompt p = library_->restorePromptVersion(id, version_id, note);
    utils::terminal::printSuccess("Prompt " + std::to_string(p.id) + " restored to version " +
                                  std::to_string(version_id) + ".");
}

void CLI::cmdUsage(const CommandArgs& args) {
    int64_t id = requireId(args, 0, "prompt id");
    auto entries = library_->listPromptUsage(id);
    if (args.hasFlag("json")) {
        json out = json::array();
        for (const auto& entry : entries) out.push_back(entry.toJson());
        printJson(out);
        return;
    }
    if (entries.empty()) {
        utils::terminal::printInfo("No usage recorded for prompt " + std::to_string(id) + ".");
        return;
    }
    for (const auto& entry : entries) {
        std::cout << "  " << entry.used_at << "  rating: "
                  << (entry.rating ? std::to_string(*entry.rating) : std::string("-")) << "\n";
        std::cout << "        vars: " << entry.input_payload.dump(-1, ' ', false, json::error_handler_t::replace) << "\n";
        if (!entry.output_text.empty()) {
            std::cout << "        " << template_vars::summarizeContent(entry.output_text) << "\n";
        }
    }
}

void CLI::cmdExport(const CommandArgs& args) {
    std::string snapshot = library_->exportPromptsSnapshot();
    if (args.positionals.empty()) {
        std::cout << snapshot << "\n";
        return;
    }

    const std::string& path = args.positionals[0];
    if (!utils::writeFile(path, snapshot + "\n")) {
        throw StorageError("Failed to write snapshot to " + path);
    }
    utils::terminal::printSuccess("Snapshot written to " + path);
}

void CLI::cmdImport(const CommandArgs& args) {
    if (args.positionals.empty()) {
        throw ValidationError("Missing snapshot file for 'import'");
    }
    const std::string& path = args.positionals[0];
    if (!utils::fileExists(path)) {
        throw ValidationError("File not found: " + path);
    }

    int64_t imported = library_->importPromptsSnapshot(utils::readFile(path));
    utils::terminal::printSuccess("Imported " + std::to_string(imported) + " prompts.");
}

// ============================================================================
// Dispatch
// ============================================================================

void CLI::dispatch(const CommandArgs& args) {
    const std::string& cmd = args.command;

    if (cmd == "list") {
        cmdList(args);
    } else if (cmd == "tags") {
        cmdTags(args);
    } else if (cmd == "show") {
        cmdShow(args);
    } else if (cmd == "versions") {
        cmdVersions(args);
    } else if (cmd == "add") {
        cmdAdd(args);
    } else if (cmd == "edit") {
        cmdEdit(args);
    } else if (cmd == "delete") {
        cmdDelete(args);
    } else if (cmd == "log") {
        cmdLog(args);
    } else if (cmd == "render") {
        cmdRender(args);
    } else if (cmd == "restore") {
        cmdRestore(args);
    } else if (cmd == "usage") {
        cmdUsage(args);
    } else if (cmd == "export") {
        cmdExport(args);
    } else if (cmd == "import") {
        cmdImport(args);
    } else if (cmd == "config") {
        printConfig();
    } else if (cmd == "help") {
        printHelp();
    } else {
        throw ValidationError("Unknown command: " + cmd + " (try 'help')");
    }
}

int CLI::executeCommand(const std::vector<std::string>& tokens) {
    try {
        CommandArgs args = CommandArgs::parse(tokens);
        if (args.command.empty()) return 0;
        dispatch(args);
        return 0;
    } catch (const ValidationError& e) {
        utils::terminal::printError(e.what());
        return 2;
    } catch (const NotFoundError& e) {
        utils::terminal::printError(e.what());
        return 2;
    } catch (const ParseError& e) {
        utils::terminal::printError(e.what());
        return 2;
    } catch (const StorageError& e) {
        utils::terminal::printError(std::string("Storage error: ") + e.what());
        return 1;
    }
}

void CLI::interactiveMode() {
    std::cout << utils::terminal::CYAN << utils::terminal::BOLD << "promptvault " << VERSION
              << utils::terminal::RESET << "\n";
    std::cout << utils::terminal::YELLOW << "Type 'help' for commands, 'exit' to quit" << utils::terminal::RESET << "\n\n";

    while (true) {
        std::string input;

#ifdef HAVE_READLINE
        char* line = readline("promptvault> ");
        if (!line) break;
        input = line;
        free(line);
        if (!utils::trim(input).empty()) {
            add_history(input.c_str());
        }
#else
        std::cout << utils::terminal::BOLD << utils::terminal::CYAN << "promptvault> " << utils::terminal::RESET;
        std::cout.flush();
        if (!std::getline(std::cin, input)) break;
#endif

        input = utils::trim(input);
        if (input.empty()) continue;

        if (input == "exit" || input == "quit") {
            break;
        }

        auto tokens = utils::splitArgs(input);
        if (!tokens.empty() && tokens[0] == "shell") {
            utils::terminal::printWarning("Already in the shell.");
            continue;
        }

        executeCommand(tokens);
    }
}

int CLI::run() {
    openLibrary();

    if (command_tokens_.empty()) {
        printHelp();
        return 2;
    }

    if (command_tokens_[0] == "shell") {
        interactiveMode();
        return 0;
    }

    return executeCommand(command_tokens_);
}

} // namespace promptvault
