#pragma once

#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

namespace crius {
namespace core {
namespace errors {

/**
 * @brief Базовое исключение библиотеки.
 */
class CriusError : public std::runtime_error {
public:
    explicit CriusError(const std::string& message) : std::runtime_error(message) {}
};

/**
 * @brief Некорректная конфигурация (размер кэша, точность, поля даты/координат).
 * @note Фатальная ошибка, повторять операцию бессмысленно.
 */
class ConfigurationError : public CriusError {
public:
    explicit ConfigurationError(const std::string& message) : CriusError(message) {}
};

/**
 * @brief Не найдены файлы данных Swiss Ephemeris (.se1).
 */
class EphemerisFileNotFoundError : public CriusError {
public:
    explicit EphemerisFileNotFoundError(const std::string& path);
    EphemerisFileNotFoundError(const std::string& path, const std::string& message);

    const std::string& path() const { return path_; }

private:
    std::string path_;
};

/**
 * @brief Ошибка расчёта эфемерид.
 * @details К сообщению добавляются "(planet: ...)" и "(datetime: ...)", если они заданы.
 */
class EphemerisCalculationError : public CriusError {
public:
    explicit EphemerisCalculationError(const std::string& message,
                                       std::optional<std::string> planetId = std::nullopt,
                                       std::optional<std::string> datetime = std::nullopt);

    const std::optional<std::string>& planetId() const { return planetId_; }
    const std::optional<std::string>& datetime() const { return datetime_; }

private:
    std::optional<std::string> planetId_;
    std::optional<std::string> datetime_;
};

class InvalidHouseSystemError : public CriusError {
public:
    explicit InvalidHouseSystemError(const std::string& houseSystem,
                                     std::vector<std::string> validSystems = {});

    const std::string& houseSystem() const { return houseSystem_; }
    const std::vector<std::string>& validSystems() const { return validSystems_; }

private:
    std::string houseSystem_;
    std::vector<std::string> validSystems_;
};

class InvalidAyanamsaError : public CriusError {
public:
    explicit InvalidAyanamsaError(const std::string& ayanamsa,
                                  std::vector<std::string> validAyanamsas = {});

    const std::string& ayanamsa() const { return ayanamsa_; }
    const std::vector<std::string>& validAyanamsas() const { return validAyanamsas_; }

private:
    std::string ayanamsa_;
    std::vector<std::string> validAyanamsas_;
};

} // namespace errors
} // namespace core
} // namespace crius
