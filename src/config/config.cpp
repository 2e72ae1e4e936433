// ==============================================================================
// config.cpp - Загрузка YAML конфигурации (hunts, clients)
// ==============================================================================

#include <fleethunt/config.hpp>
#include <fleethunt/platform.hpp>

#include <fstream>
#include <sstream>
#include <stdexcept>
#include <unordered_set>
#include <yaml-cpp/yaml.h>

namespace fleethunt::config {

namespace {

// ----------------------------------------------------------------------------
// Вспомогательные функции
// ----------------------------------------------------------------------------

/// Прочитать файл целиком
bool read_file(const std::filesystem::path& path, std::string& out) {
    std::ifstream file(path, std::ios::binary);
    if (!file.is_open()) {
        return false;
    }
    std::ostringstream ss;
    ss << file.rdbuf();
    out = ss.str();
    return true;
}

/// Обязательное строковое поле
std::string required_string(const YAML::Node& node, const char* key, const std::string& where) {
    const YAML::Node value = node[key];
    if (!value || !value.IsScalar()) {
        throw ValidationError(where + ": missing '" + key + "'");
    }
    return value.as<std::string>();
}

rule::RuleGroup parse_group(const YAML::Node& node, const std::string& where,
                            const client::AttributeSchema& schema) {
    if (!node.IsMap()) {
        throw ValidationError(where + ": rule group must be a mapping");
    }

    std::vector<rule::Predicate> predicates;

    if (const YAML::Node regex = node["regex"]) {
        if (!regex.IsSequence()) {
            throw ValidationError(where + ": 'regex' must be a list");
        }
        for (const auto& item : regex) {
            predicates.emplace_back(rule::make_regex_rule(required_string(item, "attribute", where),
                                                          required_string(item, "pattern", where),
                                                          schema));
        }
    }

    if (const YAML::Node integer = node["integer"]) {
        if (!integer.IsSequence()) {
            throw ValidationError(where + ": 'integer' must be a list");
        }
        for (const auto& item : integer) {
            const YAML::Node value = item["value"];
            if (!value || !value.IsScalar()) {
                throw ValidationError(where + ": missing 'value'");
            }
            predicates.emplace_back(rule::make_integer_rule(
                required_string(item, "attribute", where),
                rule::parse_operator(required_string(item, "operator", where)),
                value.as<std::int64_t>(), schema));
        }
    }

    rule::RuleGroup group = rule::make_group(std::move(predicates));
    rule::validate(group, schema);
    return group;
}

HuntDefinition parse_hunt(const YAML::Node& node, std::size_t index,
                          const client::AttributeSchema& schema) {
    const std::string where = "hunt #" + std::to_string(index + 1);
    if (!node.IsMap()) {
        throw ValidationError(where + ": must be a mapping");
    }

    HuntDefinition def;
    def.config.name = required_string(node, "name", where);

    if (const YAML::Node id = node["id"]) {
        def.config.id = id.as<std::string>();
    }
    if (const YAML::Node description = node["description"]) {
        def.config.description = description.as<std::string>();
    }
    if (const YAML::Node limit = node["client_limit"]) {
        const auto value = limit.as<std::int64_t>();
        if (value < 0 || value > static_cast<std::int64_t>(hunt::MAX_CLIENT_LIMIT)) {
            throw ValidationError(where + ": client_limit " + std::to_string(value) +
                                  " is outside 0.." + std::to_string(hunt::MAX_CLIENT_LIMIT));
        }
        def.config.client_limit = static_cast<std::uint32_t>(value);
    }
    if (const YAML::Node expiry = node["expiry"]) {
        try {
            def.config.expiry = platform::parse_duration(expiry.as<std::string>());
        } catch (const std::invalid_argument& e) {
            throw ValidationError(where + ": " + e.what());
        }
    }
    if (const YAML::Node event = node["notification_event"]) {
        def.config.notification_event = event.as<std::string>();
    }

    if (const YAML::Node rules = node["rules"]) {
        if (!rules.IsSequence()) {
            throw ValidationError(where + ": 'rules' must be a list");
        }
        for (const auto& group : rules) {
            def.rules.push_back(parse_group(group, where, schema));
        }
    }
    return def;
}

ClientDefinition parse_client(const YAML::Node& node, std::size_t index,
                              const client::AttributeSchema& schema) {
    const std::string where = "client #" + std::to_string(index + 1);
    if (!node.IsMap()) {
        throw ValidationError(where + ": must be a mapping");
    }

    ClientDefinition def;
    def.record.id = required_string(node, "id", where);

    if (const YAML::Node attributes = node["attributes"]) {
        if (!attributes.IsMap()) {
            throw ValidationError(where + ": 'attributes' must be a mapping");
        }
        for (const auto& kv : attributes) {
            const auto name = kv.first.as<std::string>();
            const auto type = schema.find(name);
            if (!type) {
                throw ValidationError(where + ": unknown attribute '" + name + "'");
            }
            if (*type == Value::Type::Int) {
                def.record.set(name, Value(kv.second.as<std::int64_t>()));
            } else {
                def.record.set(name, Value(kv.second.as<std::string>()));
            }
        }
    }

    if (const YAML::Node result = node["result"]) {
        def.result = parse_simulated_result(result.as<std::string>());
    }
    if (const YAML::Node message = node["message"]) {
        def.message = message.as<std::string>();
    }
    if (const YAML::Node user = node["user_cpu"]) {
        def.user_cpu = user.as<double>();
    }
    if (const YAML::Node system = node["system_cpu"]) {
        def.system_cpu = system.as<double>();
    }
    if (const YAML::Node bytes = node["network_bytes"]) {
        def.network_bytes = bytes.as<std::uint64_t>();
    }
    return def;
}

}  // namespace

// ============================================================================
// Hunts
// ============================================================================

HuntsResult parse_hunts(std::string_view yaml, const std::string& source,
                        const client::AttributeSchema& schema) {
    HuntsResult result;
    result.error.path = source;

    try {
        YAML::Node root = YAML::Load(std::string(yaml));
        const YAML::Node hunts = root["hunts"];
        if (!hunts || !hunts.IsSequence()) {
            result.error.message = "hunts file missing 'hunts' list";
            return result;
        }

        std::unordered_set<std::string> ids;
        for (std::size_t i = 0; i < hunts.size(); ++i) {
            HuntDefinition def = parse_hunt(hunts[i], i, schema);
            if (!def.config.id.empty() && !ids.insert(def.config.id).second) {
                result.error.message = "duplicate hunt id '" + def.config.id + "'";
                return result;
            }
            result.hunts.push_back(std::move(def));
        }

        result.ok = true;
        result.error.path.clear();
        return result;

    } catch (const YAML::Exception& e) {
        result.error.message = std::string("YAML parse error: ") + e.what();
        return result;
    } catch (const ValidationError& e) {
        result.error.message = e.what();
        return result;
    }
}

HuntsResult load_hunts(const std::filesystem::path& path, const client::AttributeSchema& schema) {
    std::string text;
    if (!read_file(path, text)) {
        HuntsResult result;
        result.error = Error{"cannot open hunts file", platform::path_to_utf8(path)};
        return result;
    }
    return parse_hunts(text, platform::path_to_utf8(path), schema);
}

// ============================================================================
// Clients
// ============================================================================

SimulatedResult parse_simulated_result(std::string_view s) {
    if (s == "success") {
        return SimulatedResult::Success;
    }
    if (s == "bad") {
        return SimulatedResult::Bad;
    }
    if (s == "error") {
        return SimulatedResult::Error;
    }
    if (s == "hang") {
        return SimulatedResult::Hang;
    }
    throw ValidationError("unknown client result '" + std::string(s) + "'");
}

const char* to_string(SimulatedResult result) {
    switch (result) {
    case SimulatedResult::Success:
        return "success";
    case SimulatedResult::Bad:
        return "bad";
    case SimulatedResult::Error:
        return "error";
    case SimulatedResult::Hang:
        return "hang";
    }
    return "success";
}

ClientsResult parse_clients(std::string_view yaml, const std::string& source,
                            const client::AttributeSchema& schema) {
    ClientsResult result;
    result.error.path = source;

    try {
        YAML::Node root = YAML::Load(std::string(yaml));
        const YAML::Node clients = root["clients"];
        if (!clients || !clients.IsSequence()) {
            result.error.message = "clients file missing 'clients' list";
            return result;
        }

        std::unordered_set<std::string> ids;
        for (std::size_t i = 0; i < clients.size(); ++i) {
            ClientDefinition def = parse_client(clients[i], i, schema);
            if (!ids.insert(def.record.id).second) {
                result.error.message = "duplicate client id '" + def.record.id + "'";
                return result;
            }
            result.clients.push_back(std::move(def));
        }

        result.ok = true;
        result.error.path.clear();
        return result;

    } catch (const YAML::Exception& e) {
        result.error.message = std::string("YAML parse error: ") + e.what();
        return result;
    } catch (const ValidationError& e) {
        result.error.message = e.what();
        return result;
    }
}

ClientsResult load_clients(const std::filesystem::path& path,
                           const client::AttributeSchema& schema) {
    std::string text;
    if (!read_file(path, text)) {
        ClientsResult result;
        result.error = Error{"cannot open clients file", platform::path_to_utf8(path)};
        return result;
    }
    return parse_clients(text, platform::path_to_utf8(path), schema);
}

}  // namespace fleethunt::config
