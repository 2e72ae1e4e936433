// ==============================================================================
// main.cpp - Точка входа приложения
// ==============================================================================
//
// Точка входа:
// 1. Парсинг argv (cli)
// 2. Создание Writer (output)
// 3. Dispatch команды
// 4. Возврат exit code
//
// run: hunts из YAML публикуются в Foreman, клиенты из YAML проходят
// check-in в пуле потоков, затем имитируемые результаты возвращаются
// через Foreman::post_result. Клиенты с result: hang результата не шлют.
//
// ==============================================================================

#include <fleethunt/assignment.hpp>
#include <fleethunt/cli.hpp>
#include <fleethunt/config.hpp>
#include <fleethunt/foreman.hpp>
#include <fleethunt/hunt.hpp>
#include <fleethunt/notification.hpp>
#include <fleethunt/output.hpp>
#include <fleethunt/platform.hpp>
#include <fleethunt/rule.hpp>
#include <fleethunt/rule_store.hpp>
#include <fleethunt/store.hpp>

#include <algorithm>
#include <atomic>
#include <exception>
#include <iostream>
#include <memory>
#include <optional>
#include <rapidjson/document.h>
#include <set>
#include <stdexcept>
#include <string>
#include <thread>
#include <type_traits>
#include <unordered_map>
#include <variant>
#include <vector>

namespace {

// ----------------------------------------------------------------------------
// ASCII Banner
// ----------------------------------------------------------------------------

constexpr const char* BANNER = R"(
    ███████╗██╗     ███████╗███████╗████████╗██╗  ██╗██╗   ██╗███╗   ██╗████████╗
    ██╔════╝██║     ██╔════╝██╔════╝╚══██╔══╝██║  ██║██║   ██║████╗  ██║╚══██╔══╝
    █████╗  ██║     █████╗  █████╗     ██║   ███████║██║   ██║██╔██╗ ██║   ██║
    ██╔══╝  ██║     ██╔══╝  ██╔══╝     ██║   ██╔══██║██║   ██║██║╚██╗██║   ██║
    ██║     ███████╗███████╗███████╗   ██║   ██║  ██║╚██████╔╝██║ ╚████║   ██║
    ╚═╝     ╚══════╝╚══════╝╚══════╝   ╚═╝   ╚═╝  ╚═╝ ╚═════╝ ╚═╝  ╚═══╝   ╚═╝
)";

void print_banner(fleethunt::output::Writer& writer, bool no_banner, bool quiet) {
    if (no_banner || quiet) {
        return;
    }
    writer.write(fleethunt::output::Stream::Stderr, BANNER);
    writer.write_line(fleethunt::output::Stream::Stderr, "");
}

// ----------------------------------------------------------------------------
// run
// ----------------------------------------------------------------------------

struct ActiveHunt {
    std::shared_ptr<fleethunt::hunt::Hunt> hunt;
    std::shared_ptr<fleethunt::hunt::QueueDispatcher> dispatcher;
};

unsigned thread_count(const fleethunt::cli::GlobalOptions& global, std::size_t work) {
    unsigned threads = global.num_threads > 0 ? static_cast<unsigned>(global.num_threads)
                                              : std::thread::hardware_concurrency();
    if (threads == 0) {
        threads = 1;
    }
    return static_cast<unsigned>(std::min<std::size_t>(threads, std::max<std::size_t>(work, 1)));
}

/// Check-in всех клиентов в пуле потоков; первое исключение потока
/// пробрасывается после join
std::size_t check_in_all(fleethunt::foreman::Foreman& foreman,
                         const std::vector<fleethunt::config::ClientDefinition>& clients,
                         unsigned threads) {
    std::atomic<std::size_t> next{0};
    std::atomic<std::size_t> dispatched{0};
    std::vector<std::exception_ptr> failures(threads);
    std::vector<std::thread> workers;
    workers.reserve(threads);

    for (unsigned t = 0; t < threads; ++t) {
        workers.emplace_back([&, t] {
            try {
                for (std::size_t i = next.fetch_add(1); i < clients.size();
                     i = next.fetch_add(1)) {
                    dispatched += foreman.on_check_in(clients[i].record);
                }
            } catch (...) {
                failures[t] = std::current_exception();
            }
        });
    }
    for (auto& worker : workers) {
        worker.join();
    }
    for (const auto& failure : failures) {
        if (failure) {
            std::rethrow_exception(failure);
        }
    }
    return dispatched.load();
}

/// Имитируемый результат задачи клиента
std::optional<fleethunt::hunt::TaskResult>
simulate_result(const fleethunt::hunt::TaskRequest& request,
                const fleethunt::config::ClientDefinition& client, std::size_t sequence) {
    using namespace fleethunt;

    hunt::TaskResult result;
    result.hunt_id = request.hunt_id;
    result.client_id = request.client_id;
    result.task_id = request.hunt_id + "/" + std::to_string(sequence);

    switch (client.result) {
    case config::SimulatedResult::Hang:
        return std::nullopt;
    case config::SimulatedResult::Success:
        result.outcome = hunt::Success{};
        break;
    case config::SimulatedResult::Bad:
        result.outcome = hunt::Badness{};
        break;
    case config::SimulatedResult::Error:
        result.outcome = hunt::TaskError{client.message.empty() ? "client error" : client.message,
                                         std::string()};
        break;
    }

    stats::ResourceSample sample;
    sample.user_cpu_time = client.user_cpu;
    sample.system_cpu_time = client.system_cpu;
    sample.network_bytes_sent = client.network_bytes;
    result.usage = sample;
    return result;
}

void print_summary_table(const std::vector<ActiveHunt>& hunts, fleethunt::output::Writer& out) {
    using namespace fleethunt;

    output::Table table;
    table.set_headers({"hunt", "name", "state", "started", "finished", "errors", "bad",
                       "outstanding", "cpu mean"});
    for (const auto& active : hunts) {
        const hunt::HuntSummary s = active.hunt->summary();
        const double cpu_mean = s.usage.user_cpu.mean + s.usage.system_cpu.mean;
        table.add_row({s.id, s.name, hunt::to_string(s.state), std::to_string(s.started),
                       std::to_string(s.finished), std::to_string(s.errored),
                       std::to_string(s.badness), std::to_string(s.outstanding),
                       output::format_number(cpu_mean, 3)});
    }
    table.print(out);
}

void print_summary_json(const std::vector<ActiveHunt>& hunts, fleethunt::output::Writer& out) {
    std::string text = "[";
    for (std::size_t i = 0; i < hunts.size(); ++i) {
        if (i > 0) {
            text += ',';
        }
        text += hunts[i].hunt->summary().to_json();
    }
    text += ']';

    rapidjson::Document doc;
    doc.Parse(text.c_str(), text.size());
    if (doc.HasParseError()) {
        throw std::runtime_error("failed to build summary JSON");
    }
    out.write_json_pretty(doc);
}

int run_hunts(const fleethunt::cli::RunCommand& cmd, const fleethunt::cli::GlobalOptions& global,
              fleethunt::output::Writer& writer) {
    using namespace fleethunt;

    const auto& schema = client::AttributeSchema::defaults();

    auto hunts_file = config::load_hunts(cmd.hunts, schema);
    if (!hunts_file) {
        writer.error(hunts_file.error.format());
        return 1;
    }
    auto clients_file = config::load_clients(cmd.clients, schema);
    if (!clients_file) {
        writer.error(clients_file.error.format());
        return 1;
    }

    writer.info("Loaded " + std::to_string(hunts_file.hunts.size()) + " hunt(s) and " +
                std::to_string(clients_file.clients.size()) + " client(s)");

    // Если указан output file, stdout уходит в отдельный Writer
    std::unique_ptr<output::Writer> file_writer;
    output::Writer* out = &writer;
    if (cmd.output.has_value()) {
        output::OutputConfig out_cfg = writer.config();
        out_cfg.output_path = cmd.output;
        file_writer = std::make_unique<output::Writer>(out_cfg);
        if (!file_writer->has_output_file()) {
            writer.error("cannot open output file " + platform::path_to_utf8(*cmd.output));
            return 1;
        }
        out = file_writer.get();
    }

    store::MemoryStore store;
    foreman::RuleStore rules(&writer);
    foreman::AssignmentStore assignments;
    hunt::HuntRegistry registry;
    foreman::Foreman foreman(rules, assignments, registry, &writer);
    hunt::EventBus bus(&writer);

    std::set<std::string> events;
    std::atomic<std::size_t> notified{0};

    std::vector<ActiveHunt> active;
    for (auto& def : hunts_file.hunts) {
        auto dispatcher = std::make_shared<hunt::QueueDispatcher>();

        hunt::HuntServices services;
        services.store = &store;
        services.notifications = &bus;
        services.schema = &schema;

        const std::string& event = def.config.notification_event;
        if (!event.empty() && events.insert(event).second) {
            bus.subscribe(event, [&writer, &notified](const hunt::HuntEvent& e) {
                ++notified;
                writer.debug("event: " + e.to_json());
            });
        }

        auto created = foreman.create_hunt(def.config, dispatcher, services);
        for (auto& group : def.rules) {
            created->add_rule(std::move(group));
        }
        created->run();
        writer.debug("hunt " + created->id() + " (" + created->name() + ") running");
        active.push_back({created, dispatcher});
    }

    const unsigned threads = thread_count(global, clients_file.clients.size());
    const std::size_t dispatched = check_in_all(foreman, clients_file.clients, threads);
    writer.info("Dispatched " + std::to_string(dispatched) + " task(s) using " +
                std::to_string(threads) + " thread(s)");

    std::unordered_map<std::string, const config::ClientDefinition*> by_id;
    for (const auto& c : clients_file.clients) {
        by_id.emplace(c.record.id, &c);
    }

    std::size_t sequence = 0;
    std::size_t hanging = 0;
    for (const auto& a : active) {
        for (const auto& request : a.dispatcher->drain()) {
            auto it = by_id.find(request.client_id);
            if (it == by_id.end()) {
                continue;
            }
            auto result = simulate_result(request, *it->second, ++sequence);
            if (!result) {
                ++hanging;
                continue;
            }
            foreman.post_result(*result);
        }
    }
    if (hanging > 0) {
        writer.warn(std::to_string(hanging) + " task(s) did not report a result");
    }
    if (notified.load() > 0) {
        writer.debug(std::to_string(notified.load()) + " notification(s) delivered");
    }

    if (cmd.json) {
        print_summary_json(active, *out);
    } else {
        print_summary_table(active, *out);
    }

    for (const auto& a : active) {
        a.hunt->stop();
    }
    writer.info("Done");
    return 0;
}

// ----------------------------------------------------------------------------
// lint
// ----------------------------------------------------------------------------

int run_lint(const fleethunt::cli::LintCommand& cmd, fleethunt::output::Writer& writer) {
    using namespace fleethunt;

    auto loaded = config::load_hunts(cmd.path);
    if (!loaded) {
        writer.error(loaded.error.format());
        return 1;
    }

    for (const auto& def : loaded.hunts) {
        writer.write_line(output::Stream::Stdout,
                          def.config.name + " (limit " + std::to_string(def.config.client_limit) +
                              ", " + std::to_string(def.rules.size()) + " rule group(s))");
        for (const auto& group : def.rules) {
            writer.write_line(output::Stream::Stdout, "  " + rule::describe(group));
        }
    }
    writer.info("Validated " + std::to_string(loaded.hunts.size()) + " hunt(s)");
    return 0;
}

// ----------------------------------------------------------------------------
// Главная функция выполнения
// ----------------------------------------------------------------------------

int run(int argc, char** argv) {
    using namespace fleethunt;

    cli::ParseResult parse_result = cli::parse(argc, argv);

    output::OutputConfig out_cfg;
    out_cfg.quiet = parse_result.global.quiet;
    out_cfg.verbose = parse_result.global.verbose;
    out_cfg.no_banner = parse_result.global.no_banner;
    output::Writer writer(out_cfg);

    // Сообщение об ошибке парсинга выводится без [x]
    if (!parse_result.ok) {
        writer.write(output::Stream::Stderr, parse_result.diagnostic.stderr_message);
        return parse_result.diagnostic.exit_code;
    }

    return std::visit(
        [&](auto&& cmd) -> int {
            using T = std::decay_t<decltype(cmd)>;

            if constexpr (std::is_same_v<T, cli::HelpCommand>) {
                writer.write(output::Stream::Stdout, cli::render_help(cmd.command));
                return 0;
            } else if constexpr (std::is_same_v<T, cli::VersionCommand>) {
                writer.write(output::Stream::Stdout, cli::render_version());
                return 0;
            } else if constexpr (std::is_same_v<T, cli::RunCommand>) {
                print_banner(writer, out_cfg.no_banner, out_cfg.quiet);
                return run_hunts(cmd, parse_result.global, writer);
            } else {
                print_banner(writer, out_cfg.no_banner, out_cfg.quiet);
                return run_lint(cmd, writer);
            }
        },
        parse_result.command);
}

}  // anonymous namespace

// ----------------------------------------------------------------------------
// main
// ----------------------------------------------------------------------------

int main(int argc, char** argv) {
    try {
        return run(argc, argv);
    } catch (const std::exception& e) {
        // Формат ошибки "[x] <err>"
        std::cerr << "[x] " << e.what() << "\n";
        return 1;
    }
}
