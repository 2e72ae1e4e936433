// ==============================================================================
// fleethunt/config.hpp - Загрузка YAML конфигурации (hunts, clients)
// ==============================================================================
//
// Назначение:
// - Файл hunts: определения hunt с группами правил
// - Файл clients: записи клиентов и имитируемый результат задачи
// - Загрузчики не бросают исключений: ошибка возвращается в *Result
//
// Формат hunts:
//   hunts:
//     - name: SampleHunt
//       client_limit: 5          # 0..1000, по умолчанию 0
//       expiry: 31d              # <N>s|m|h|d
//       notification_event: TestHuntDone
//       rules:                   # каждая группа - OR-ветвь
//         - regex:
//             - {attribute: "Client Name", pattern: "GRR.*"}
//           integer:
//             - {attribute: Clock, operator: GREATER_THAN, value: 1336650631137737}
//
// Формат clients:
//   clients:
//     - id: C.1000000000000000
//       attributes: {"Client Name": "GRR Monitor", Clock: 1336650631137738}
//       result: success          # success | bad | error | hang
//       message: "..."           # для error
//       user_cpu: 1.5
//       system_cpu: 0.5
//       network_bytes: 1024
//
// ==============================================================================

#ifndef FLEETHUNT_CONFIG_HPP
#define FLEETHUNT_CONFIG_HPP

#include <cstdint>
#include <filesystem>
#include <fleethunt/client.hpp>
#include <fleethunt/error.hpp>
#include <fleethunt/hunt.hpp>
#include <fleethunt/rule.hpp>
#include <string>
#include <string_view>
#include <vector>

namespace fleethunt::config {

// ----------------------------------------------------------------------------
// Hunts
// ----------------------------------------------------------------------------

struct HuntDefinition {
    hunt::HuntConfig config;
    std::vector<rule::RuleGroup> rules;
};

struct HuntsResult {
    bool ok = false;
    std::vector<HuntDefinition> hunts;
    Error error;

    explicit operator bool() const { return ok; }
};

/// Загрузить определения hunt из файла
HuntsResult load_hunts(const std::filesystem::path& path,
                       const client::AttributeSchema& schema = client::AttributeSchema::defaults());

/// Разобрать определения hunt из YAML текста
/// @param source имя источника для сообщений об ошибке
HuntsResult parse_hunts(std::string_view yaml, const std::string& source,
                        const client::AttributeSchema& schema = client::AttributeSchema::defaults());

// ----------------------------------------------------------------------------
// Clients
// ----------------------------------------------------------------------------

/// Имитируемый исход задачи клиента
enum class SimulatedResult { Success, Bad, Error, Hang };

/// "success" | "bad" | "error" | "hang"
/// @throw ValidationError если строка не распознана
SimulatedResult parse_simulated_result(std::string_view s);

const char* to_string(SimulatedResult result);

struct ClientDefinition {
    client::ClientRecord record;
    SimulatedResult result = SimulatedResult::Success;
    std::string message;
    double user_cpu = 0.0;
    double system_cpu = 0.0;
    std::uint64_t network_bytes = 0;
};

struct ClientsResult {
    bool ok = false;
    std::vector<ClientDefinition> clients;
    Error error;

    explicit operator bool() const { return ok; }
};

ClientsResult load_clients(const std::filesystem::path& path,
                           const client::AttributeSchema& schema = client::AttributeSchema::defaults());

ClientsResult parse_clients(std::string_view yaml, const std::string& source,
                            const client::AttributeSchema& schema = client::AttributeSchema::defaults());

}  // namespace fleethunt::config

#endif  // FLEETHUNT_CONFIG_HPP
