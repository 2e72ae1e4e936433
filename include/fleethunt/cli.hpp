// ==============================================================================
// fleethunt/cli.hpp - CLI парсинг и команды
// ==============================================================================
//
// Назначение:
// - Парсинг argv
// - Генерация --help / --version
// - Диагностические ошибки CLI (exit code 2 для ошибок парсинга)
//
// ==============================================================================

#ifndef FLEETHUNT_CLI_HPP
#define FLEETHUNT_CLI_HPP

#include <filesystem>
#include <optional>
#include <string>
#include <variant>

namespace fleethunt::cli {

// ----------------------------------------------------------------------------
// Глобальные опции
// ----------------------------------------------------------------------------

struct GlobalOptions {
    bool no_banner = false;  // --no-banner
    int num_threads = 0;     // --num-threads (0 = число CPU)
    int verbose = 0;         // -v (repeatable)
    bool quiet = false;      // -q
};

// ----------------------------------------------------------------------------
// Подкоманды
// ----------------------------------------------------------------------------

/// run - прогнать hunts по набору клиентов
struct RunCommand {
    std::filesystem::path hunts;                  // --hunts (required)
    std::filesystem::path clients;                // --clients (required)
    bool json = false;                            // -j, --json
    std::optional<std::filesystem::path> output;  // -o, --output
};

/// lint - проверить файл hunts
struct LintCommand {
    std::filesystem::path path;
};

/// help - показать справку
struct HelpCommand {
    std::optional<std::string> command;
};

/// version - показать версию
struct VersionCommand {};

using Command = std::variant<RunCommand, LintCommand, HelpCommand, VersionCommand>;

// ----------------------------------------------------------------------------
// Диагностика CLI
// ----------------------------------------------------------------------------

struct CliDiagnostic {
    int exit_code = 1;
    std::string stderr_message;
};

struct ParseResult {
    bool ok = false;
    GlobalOptions global;
    Command command;
    CliDiagnostic diagnostic;
};

/// Парсить аргументы командной строки
ParseResult parse(int argc, char** argv);

/// Генерировать текст --help (для конкретной команды или общий)
std::string render_help(const std::optional<std::string>& command = std::nullopt);

/// Генерировать текст --version
std::string render_version();

constexpr const char* VERSION = "0.1.0";

constexpr const char* ABOUT = "Coordinate hunts across a fleet of clients";

}  // namespace fleethunt::cli

#endif  // FLEETHUNT_CLI_HPP
