// ==============================================================================
// fleethunt/platform.hpp - Платформенные абстракции
// ==============================================================================
//
// Назначение:
// - Преобразования path <-> UTF-8 для путей из argv
// - Определение TTY для цветного вывода
// - Источник времени (микросекунды с эпохи) для rule created/expires
//
// Вся платформенная специфика изолирована в src/platform/platform.cpp.
//
// ==============================================================================

#ifndef FLEETHUNT_PLATFORM_HPP
#define FLEETHUNT_PLATFORM_HPP

#include <cstdint>
#include <filesystem>
#include <functional>
#include <string>
#include <string_view>

namespace fleethunt::platform {

// ----------------------------------------------------------------------------
// Пути
// ----------------------------------------------------------------------------

/// Построить native path из UTF-8 строки
std::filesystem::path path_from_utf8(std::string_view u8str);

/// Преобразовать path в UTF-8 строку
std::string path_to_utf8(const std::filesystem::path& p);

// ----------------------------------------------------------------------------
// TTY
// ----------------------------------------------------------------------------

bool is_tty_stdout();
bool is_tty_stderr();

// ----------------------------------------------------------------------------
// Время
// ----------------------------------------------------------------------------

/// Временная метка: микросекунды с Unix epoch (UTC)
using Timestamp = std::int64_t;

/// Источник времени; подменяется в тестах
using Clock = std::function<Timestamp()>;

constexpr Timestamp MICROS_PER_SECOND = 1000000;

/// Текущее время по system_clock
Timestamp now_micros();

/// Clock по умолчанию (now_micros)
Clock system_clock();

/// Разобрать длительность вида "90s", "5m", "12h", "31d" в микросекунды
/// @throw std::invalid_argument если формат не распознан
Timestamp parse_duration(std::string_view text);

}  // namespace fleethunt::platform

#endif  // FLEETHUNT_PLATFORM_HPP
