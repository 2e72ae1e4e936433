// ==============================================================================
// fleethunt/output.hpp - Пользовательский вывод и журналирование
// ==============================================================================
//
// Назначение:
// - Единственная точка записи в stdout/stderr
// - Сообщения с префиксами: [+] info, [!] warn, [x] error, [*] debug, [~] trace
// - Цветной вывод (ANSI escape codes) только для TTY
// - JSON вывод (RapidJSON), таблицы (Unicode box-drawing)
// - Вывод в файл (--output)
//
// Writer потокобезопасен: каждое сообщение пишется одним fwrite под mutex,
// поэтому строки от параллельных check-in не перемешиваются.
//
// ==============================================================================

#ifndef FLEETHUNT_OUTPUT_HPP
#define FLEETHUNT_OUTPUT_HPP

#include <cstdio>
#include <filesystem>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

// Forward declarations для JSON
namespace rapidjson {
class CrtAllocator;
template <typename BaseAllocator>
class MemoryPoolAllocator;
template <typename Encoding, typename Allocator>
class GenericValue;
template <typename CharType>
struct UTF8;
using Value = GenericValue<UTF8<char>, MemoryPoolAllocator<CrtAllocator>>;
}  // namespace rapidjson

namespace fleethunt::output {

// ----------------------------------------------------------------------------
// Потоки вывода
// ----------------------------------------------------------------------------

enum class Stream { Stdout, Stderr };

// ----------------------------------------------------------------------------
// ANSI цвета для терминала
// ----------------------------------------------------------------------------

enum class Color {
    Default,
    Green,   // Успех, информация
    Yellow,  // Предупреждения
    Red,     // Ошибки
    Cyan,    // Отладка
    Magenta  // Трассировка
};

// ----------------------------------------------------------------------------
// Конфигурация вывода
// ----------------------------------------------------------------------------

struct OutputConfig {
    bool quiet = false;      // -q: подавить info/warn
    int verbose = 0;         // -v: уровень подробности (0..2+)
    bool no_banner = false;  // --no-banner: скрыть баннер

    // Путь для вывода stdout (--output)
    std::optional<std::filesystem::path> output_path;
};

// ----------------------------------------------------------------------------
// Writer - единый слой вывода
// ----------------------------------------------------------------------------

class Writer {
public:
    explicit Writer(const OutputConfig& cfg);
    ~Writer();

    Writer(const Writer&) = delete;
    Writer& operator=(const Writer&) = delete;

    // Базовый вывод
    // -------------------------------------------------------------------------

    /// Записать байты в поток
    void write(Stream s, std::string_view bytes);

    /// Записать строку с переводом строки
    void write_line(Stream s, std::string_view bytes);

    // Сообщения с префиксами
    // -------------------------------------------------------------------------

    /// "[+] <message>" в stderr (если не quiet)
    void info(std::string_view message);

    /// "[!] <message>" в stderr (если не quiet)
    void warn(std::string_view message);

    /// "[x] <message>" в stderr (всегда)
    void error(std::string_view message);

    /// "[*] <message>" в stderr (только при verbose > 0)
    void debug(std::string_view message);

    /// "[~] <message>" в stderr (только при verbose > 1)
    void trace(std::string_view message);

    // JSON вывод
    // -------------------------------------------------------------------------

    /// Записать pretty JSON (с отступами) + newline
    void write_json_pretty(const rapidjson::Value& value);

    // Управление
    // -------------------------------------------------------------------------

    const OutputConfig& config() const { return config_; }

    /// Открыть файл для вывода (если output_path задан)
    bool open_output_file();

    void close_output_file();

    bool has_output_file() const { return output_file_ != nullptr; }

private:
    void flush();

    /// Записать префиксное сообщение одним вызовом
    void write_prefixed(std::string_view prefix, Color color, std::string_view message);

    /// Записать без захвата mutex
    void write_unlocked(Stream s, std::string_view bytes);

    FILE* get_file(Stream s) const;

    OutputConfig config_;
    FILE* output_file_ = nullptr;
    std::mutex mutex_;
};

// ----------------------------------------------------------------------------
// Table - форматирование таблиц
// ----------------------------------------------------------------------------

class Table {
public:
    Table() = default;

    void set_headers(const std::vector<std::string>& headers);

    void add_row(const std::vector<std::string>& cells);

    /// Вывести таблицу в stdout через Writer
    void print(Writer& w) const;

    /// Таблица в строку (Unicode box-drawing)
    std::string to_string() const;

    size_t row_count() const { return rows_.size(); }

private:
    std::string format_line(char position, const std::vector<size_t>& widths) const;

    std::string format_row(const std::vector<std::string>& cells,
                           const std::vector<size_t>& widths) const;

    std::vector<size_t> column_widths() const;

    std::vector<std::string> headers_;
    std::vector<std::vector<std::string>> rows_;
};

// ----------------------------------------------------------------------------
// Вспомогательные функции
// ----------------------------------------------------------------------------

/// Число с плавающей точкой без лишних нулей ("1.5", "2", "0.125")
std::string format_number(double value, int precision = 6);

std::string ansi_color_code(Color color);

/// Поддерживает ли поток цвета (TTY check)
bool supports_color(Stream s);

}  // namespace fleethunt::output

#endif  // FLEETHUNT_OUTPUT_HPP
