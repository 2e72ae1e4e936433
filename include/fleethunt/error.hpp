// ==============================================================================
// fleethunt/error.hpp - Таксономия ошибок
// ==============================================================================
//
// Назначение:
// - ValidationError: некорректный ввод (правило, approval, лимит клиентов)
// - AuthorizationError: защищённое действие без GRANTED approval
// - Error: ошибка загрузки файла (возвращается в *Result структурах)
//
// Ошибки задач отдельных клиентов НЕ являются исключениями: см. hunt::Outcome.
//
// ==============================================================================

#ifndef FLEETHUNT_ERROR_HPP
#define FLEETHUNT_ERROR_HPP

#include <stdexcept>
#include <string>

namespace fleethunt {

/// Некорректный ввод; бросается синхронно API, получившим этот ввод
class ValidationError : public std::runtime_error {
public:
    explicit ValidationError(const std::string& message) : std::runtime_error(message) {}
};

/// Действие требует approval; не повторяется автоматически
class AuthorizationError : public std::runtime_error {
public:
    explicit AuthorizationError(const std::string& message)
        : std::runtime_error("approval required: " + message) {}
};

/// Ошибка загрузки/парсинга файла
struct Error {
    std::string message;
    std::string path;

    std::string format() const {
        if (path.empty()) {
            return message;
        }
        return message + " (" + path + ")";
    }
};

}  // namespace fleethunt

#endif  // FLEETHUNT_ERROR_HPP
