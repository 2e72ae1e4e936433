// ==============================================================================
// cli.cpp - CLI парсинг
// ==============================================================================

#include <fleethunt/cli.hpp>
#include <fleethunt/platform.hpp>

#include <cstring>
#include <stdexcept>

namespace fleethunt::cli {

namespace {

bool str_eq(const char* a, const char* b) {
    return std::strcmp(a, b) == 0;
}

bool starts_with(const char* str, const char* prefix) {
    return std::strncmp(str, prefix, std::strlen(prefix)) == 0;
}

/// Сообщение об ошибке парсинга: error + Usage + подсказка
std::string render_usage_error(const std::string& error_msg, const std::string& usage) {
    return "error: " + error_msg + "\n\n" + "Usage: " + usage +
           "\n\nFor more information, try '--help'.\n";
}

ParseResult usage_error(ParseResult result, const std::string& error_msg,
                        const std::string& usage = "fleethunt [OPTIONS] <COMMAND>") {
    result.ok = false;
    result.diagnostic.exit_code = 2;
    result.diagnostic.stderr_message = render_usage_error(error_msg, usage);
    return result;
}

/// Разобрать --num-threads; false если значение не положительное целое
bool parse_threads(const char* text, int& out) {
    try {
        std::size_t pos = 0;
        const int value = std::stoi(text, &pos);
        if (pos != std::strlen(text) || value <= 0) {
            return false;
        }
        out = value;
        return true;
    } catch (const std::logic_error&) {
        return false;
    }
}

}  // anonymous namespace

// ----------------------------------------------------------------------------
// render_version / render_help
// ----------------------------------------------------------------------------

std::string render_version() {
    return std::string("fleethunt ") + VERSION + "\n";
}

std::string render_help(const std::optional<std::string>& command) {
    if (!command.has_value()) {
        return std::string(ABOUT) +
               "\n"
               "\n"
               "Usage: fleethunt [OPTIONS] <COMMAND>\n"
               "\n"
               "Commands:\n"
               "  run      Run hunts against a set of simulated clients\n"
               "  lint     Validate a hunts file and print its rules\n"
               "  help     Print this message or the help of the given subcommand(s)\n"
               "\n"
               "Options:\n"
               "      --no-banner                  Hide the banner\n"
               "      --num-threads <NUM_THREADS>  Limit the thread number (default: num of CPUs)\n"
               "  -v...                            Print verbose output\n"
               "  -q                               Suppress informational output\n"
               "  -h, --help                       Print help\n"
               "  -V, --version                    Print version\n"
               "\n"
               "Examples:\n"
               "\n"
               "    Run hunts and print a summary table:\n"
               "        ./fleethunt run --hunts hunts.yaml --clients clients.yaml\n"
               "\n"
               "    Run hunts and save the summary as JSON:\n"
               "        ./fleethunt run --hunts hunts.yaml --clients clients.yaml --json -o out.json\n";
    }
    if (*command == "run") {
        return "Run hunts against a set of simulated clients\n"
               "\n"
               "Usage: fleethunt run [OPTIONS] --hunts <HUNTS> --clients <CLIENTS>\n"
               "\n"
               "Options:\n"
               "      --hunts <HUNTS>      Hunts definition file (YAML)\n"
               "      --clients <CLIENTS>  Clients definition file (YAML)\n"
               "  -j, --json               Output the summary as JSON\n"
               "  -o, --output <OUTPUT>    Save output to a file\n"
               "  -h, --help               Print help\n";
    }
    if (*command == "lint") {
        return "Validate a hunts file and print its rules\n"
               "\n"
               "Usage: fleethunt lint <PATH>\n"
               "\n"
               "Arguments:\n"
               "  <PATH>  The hunts definition file\n"
               "\n"
               "Options:\n"
               "  -h, --help  Print help\n";
    }
    return "error: unrecognized subcommand '" + *command + "'\n";
}

// ----------------------------------------------------------------------------
// parse
// ----------------------------------------------------------------------------

ParseResult parse(int argc, char** argv) {
    ParseResult result;
    result.command = HelpCommand{};

    if (argc < 2) {
        result.diagnostic.exit_code = 2;
        result.diagnostic.stderr_message = render_help(std::nullopt);
        return result;
    }

    // Глобальные опции до подкоманды
    int cmd_idx = argc;
    for (int i = 1; i < argc; ++i) {
        const char* arg = argv[i];

        if (str_eq(arg, "--no-banner")) {
            result.global.no_banner = true;
        } else if (str_eq(arg, "-v")) {
            result.global.verbose++;
        } else if (str_eq(arg, "-vv")) {
            result.global.verbose += 2;
        } else if (str_eq(arg, "-q")) {
            result.global.quiet = true;
        } else if (str_eq(arg, "--num-threads")) {
            if (i + 1 >= argc) {
                return usage_error(result, "a value is required for '--num-threads <NUM_THREADS>'");
            }
            ++i;
            if (!parse_threads(argv[i], result.global.num_threads)) {
                return usage_error(result, std::string("invalid value '") + argv[i] +
                                               "' for '--num-threads <NUM_THREADS>'");
            }
        } else if (starts_with(arg, "--num-threads=")) {
            const char* value = arg + std::strlen("--num-threads=");
            if (!parse_threads(value, result.global.num_threads)) {
                return usage_error(result, std::string("invalid value '") + value +
                                               "' for '--num-threads <NUM_THREADS>'");
            }
        } else if (str_eq(arg, "-h") || str_eq(arg, "--help")) {
            result.ok = true;
            result.command = HelpCommand{};
            return result;
        } else if (str_eq(arg, "-V") || str_eq(arg, "--version")) {
            result.ok = true;
            result.command = VersionCommand{};
            return result;
        } else if (arg[0] == '-') {
            return usage_error(result, std::string("unexpected argument '") + arg + "' found");
        } else {
            cmd_idx = i;
            break;
        }
    }

    if (cmd_idx >= argc) {
        result.ok = true;
        result.command = HelpCommand{};
        return result;
    }

    const char* cmd = argv[cmd_idx];

    if (str_eq(cmd, "run")) {
        const std::string usage = "fleethunt run [OPTIONS] --hunts <HUNTS> --clients <CLIENTS>";
        RunCommand run_cmd;
        for (int i = cmd_idx + 1; i < argc; ++i) {
            const char* arg = argv[i];
            if (str_eq(arg, "-h") || str_eq(arg, "--help")) {
                result.ok = true;
                result.command = HelpCommand{"run"};
                return result;
            } else if (str_eq(arg, "--hunts") || str_eq(arg, "--clients") || str_eq(arg, "-o") ||
                       str_eq(arg, "--output")) {
                if (i + 1 >= argc) {
                    return usage_error(result,
                                       std::string("a value is required for '") + arg + "'", usage);
                }
                ++i;
                const auto value = platform::path_from_utf8(argv[i]);
                if (str_eq(arg, "--hunts")) {
                    run_cmd.hunts = value;
                } else if (str_eq(arg, "--clients")) {
                    run_cmd.clients = value;
                } else {
                    run_cmd.output = value;
                }
            } else if (str_eq(arg, "-j") || str_eq(arg, "--json")) {
                run_cmd.json = true;
            } else if (str_eq(arg, "-q")) {
                result.global.quiet = true;
            } else if (str_eq(arg, "-v")) {
                result.global.verbose++;
            } else {
                return usage_error(result, std::string("unexpected argument '") + arg + "' found",
                                   usage);
            }
        }

        if (run_cmd.hunts.empty() || run_cmd.clients.empty()) {
            std::string missing;
            if (run_cmd.hunts.empty()) {
                missing += "  --hunts <HUNTS>\n";
            }
            if (run_cmd.clients.empty()) {
                missing += "  --clients <CLIENTS>\n";
            }
            result.diagnostic.exit_code = 2;
            result.diagnostic.stderr_message =
                "error: the following required arguments were not provided:\n" + missing +
                "\nUsage: " + usage + "\n\nFor more information, try '--help'.\n";
            return result;
        }

        result.ok = true;
        result.command = run_cmd;
    } else if (str_eq(cmd, "lint")) {
        const std::string usage = "fleethunt lint <PATH>";
        LintCommand lint_cmd;
        for (int i = cmd_idx + 1; i < argc; ++i) {
            const char* arg = argv[i];
            if (str_eq(arg, "-h") || str_eq(arg, "--help")) {
                result.ok = true;
                result.command = HelpCommand{"lint"};
                return result;
            } else if (arg[0] == '-' || !lint_cmd.path.empty()) {
                return usage_error(result, std::string("unexpected argument '") + arg + "' found",
                                   usage);
            } else {
                lint_cmd.path = platform::path_from_utf8(arg);
            }
        }

        if (lint_cmd.path.empty()) {
            result.diagnostic.exit_code = 2;
            result.diagnostic.stderr_message =
                "error: the following required arguments were not provided:\n"
                "  <PATH>\n\n"
                "Usage: " +
                usage + "\n\nFor more information, try '--help'.\n";
            return result;
        }

        result.ok = true;
        result.command = lint_cmd;
    } else if (str_eq(cmd, "help")) {
        HelpCommand help_cmd;
        if (cmd_idx + 1 < argc) {
            help_cmd.command = argv[cmd_idx + 1];
        }
        result.ok = true;
        result.command = help_cmd;
    } else {
        return usage_error(result, std::string("unrecognized subcommand '") + cmd + "'");
    }

    return result;
}

}  // namespace fleethunt::cli
