// ==============================================================================
// platform.cpp - Платформенные абстракции
// ==============================================================================
//
// Платформенная специфика (Windows/POSIX) изолирована здесь.
//
// ==============================================================================

#include "fleethunt/platform.hpp"

#include <cctype>
#include <chrono>
#include <cstdio>
#include <limits>
#include <stdexcept>

#ifdef _WIN32
#include <io.h>
#define NOMINMAX
#include <windows.h>
#else
#include <unistd.h>
#endif

namespace fleethunt::platform {

// ----------------------------------------------------------------------------
// Преобразования путей
// ----------------------------------------------------------------------------

std::filesystem::path path_from_utf8(std::string_view u8str) {
#ifdef _WIN32
    if (u8str.empty()) {
        return {};
    }
    int len =
        MultiByteToWideChar(CP_UTF8, 0, u8str.data(), static_cast<int>(u8str.size()), nullptr, 0);
    if (len <= 0) {
        return std::filesystem::path(u8str);
    }
    std::wstring wstr(static_cast<size_t>(len), L'\0');
    MultiByteToWideChar(CP_UTF8, 0, u8str.data(), static_cast<int>(u8str.size()), wstr.data(), len);
    return std::filesystem::path(wstr);
#else
    // Unix: пути уже в UTF-8
    return std::filesystem::path(u8str);
#endif
}

std::string path_to_utf8(const std::filesystem::path& p) {
#ifdef _WIN32
    const std::wstring& wstr = p.native();
    if (wstr.empty()) {
        return {};
    }
    int len = WideCharToMultiByte(CP_UTF8, 0, wstr.data(), static_cast<int>(wstr.size()), nullptr,
                                  0, nullptr, nullptr);
    if (len <= 0) {
        return p.string();
    }
    std::string result(static_cast<size_t>(len), '\0');
    WideCharToMultiByte(CP_UTF8, 0, wstr.data(), static_cast<int>(wstr.size()), result.data(), len,
                        nullptr, nullptr);
    return result;
#else
    return p.string();
#endif
}

// ----------------------------------------------------------------------------
// TTY detection
// ----------------------------------------------------------------------------

bool is_tty_stdout() {
#ifdef _WIN32
    return _isatty(_fileno(stdout)) != 0;
#else
    return isatty(fileno(stdout)) != 0;
#endif
}

bool is_tty_stderr() {
#ifdef _WIN32
    return _isatty(_fileno(stderr)) != 0;
#else
    return isatty(fileno(stderr)) != 0;
#endif
}

// ----------------------------------------------------------------------------
// Время
// ----------------------------------------------------------------------------

Timestamp now_micros() {
    auto since_epoch = std::chrono::system_clock::now().time_since_epoch();
    return std::chrono::duration_cast<std::chrono::microseconds>(since_epoch).count();
}

Clock system_clock() {
    return &now_micros;
}

Timestamp parse_duration(std::string_view text) {
    if (text.size() < 2) {
        throw std::invalid_argument("invalid duration '" + std::string(text) + "'");
    }

    Timestamp unit = 0;
    switch (text.back()) {
    case 's':
        unit = MICROS_PER_SECOND;
        break;
    case 'm':
        unit = 60 * MICROS_PER_SECOND;
        break;
    case 'h':
        unit = 3600 * MICROS_PER_SECOND;
        break;
    case 'd':
        unit = 86400 * MICROS_PER_SECOND;
        break;
    default:
        throw std::invalid_argument("invalid duration unit in '" + std::string(text) + "'");
    }

    Timestamp amount = 0;
    for (std::size_t i = 0; i + 1 < text.size(); ++i) {
        char c = text[i];
        if (!std::isdigit(static_cast<unsigned char>(c))) {
            throw std::invalid_argument("invalid duration '" + std::string(text) + "'");
        }
        amount = amount * 10 + (c - '0');
        if (amount > std::numeric_limits<Timestamp>::max() / unit) {
            throw std::invalid_argument("duration overflow '" + std::string(text) + "'");
        }
    }

    return amount * unit;
}

}  // namespace fleethunt::platform
