#include "core/errors/Exceptions.hpp"
#include <sstream>
#include <utility>

namespace crius {
namespace core {
namespace errors {

namespace {

std::string joinNames(const std::vector<std::string>& names) {
    std::ostringstream out;
    for (size_t i = 0; i < names.size(); ++i) {
        if (i > 0) out << ", ";
        out << names[i];
    }
    return out.str();
}

std::string fileNotFoundMessage(const std::string& path) {
    std::ostringstream out;
    out << "Файлы данных Swiss Ephemeris не найдены: " << path << "\n"
        << "Убедитесь, что файлы данных (.se1) установлены. Варианты:\n"
        << "  1. Задайте переменную окружения SWISS_EPHEMERIS_PATH\n"
        << "  2. Установите файлы в " << path << "\n"
        << "  3. Передайте путь явно через EphemerisConfig\n"
        << "\n"
        << "Лицензия и загрузка: https://www.astro.com/swisseph/swephinfo_e.htm";
    return out.str();
}

std::string calculationMessage(const std::string& message,
                               const std::optional<std::string>& planetId,
                               const std::optional<std::string>& datetime) {
    std::string full = message;
    if (planetId && !planetId->empty()) {
        full += " (planet: " + *planetId + ")";
    }
    if (datetime && !datetime->empty()) {
        full += " (datetime: " + *datetime + ")";
    }
    return full;
}

std::string invalidNameMessage(const std::string& what, const std::string& name,
                               const std::vector<std::string>& valid) {
    std::string message = what + ": " + name;
    if (!valid.empty()) {
        message += "\nДопустимые значения: " + joinNames(valid);
    }
    return message;
}

} // namespace

EphemerisFileNotFoundError::EphemerisFileNotFoundError(const std::string& path)
    : CriusError(fileNotFoundMessage(path)), path_(path) {}

EphemerisFileNotFoundError::EphemerisFileNotFoundError(const std::string& path, const std::string& message)
    : CriusError(message), path_(path) {}

EphemerisCalculationError::EphemerisCalculationError(const std::string& message,
                                                     std::optional<std::string> planetId,
                                                     std::optional<std::string> datetime)
    : CriusError(calculationMessage(message, planetId, datetime))
    , planetId_(std::move(planetId))
    , datetime_(std::move(datetime)) {}

InvalidHouseSystemError::InvalidHouseSystemError(const std::string& houseSystem,
                                                 std::vector<std::string> validSystems)
    : CriusError(invalidNameMessage("Некорректная система домов", houseSystem, validSystems))
    , houseSystem_(houseSystem)
    , validSystems_(std::move(validSystems)) {}

InvalidAyanamsaError::InvalidAyanamsaError(const std::string& ayanamsa,
                                           std::vector<std::string> validAyanamsas)
    : CriusError(invalidNameMessage("Некорректная айанамша", ayanamsa, validAyanamsas))
    , ayanamsa_(ayanamsa)
    , validAyanamsas_(std::move(validAyanamsas)) {}

} // namespace errors
} // namespace core
} // namespace crius
