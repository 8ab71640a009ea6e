#pragma once

#include "domain/DeviceAttributes.hpp"
#include "domain/ValidationResult.hpp"
#include <string>

namespace gateway::ports::input {

/**
 * @brief Проверка сессии для входящего запроса
 *
 * NoSession -> LookedUp -> {Valid, Expired, FingerprintMismatch, NotFound, StoreError}
 *
 * Никогда не выбрасывает исключений: любая ошибка инфраструктуры
 * превращается в StoreError (fail closed). Повторов внутри одного
 * запроса нет.
 */
class ISessionValidator {
public:
    virtual ~ISessionValidator() = default;

    /**
     * @param sessionToken Значение cookie (пустое - токена нет)
     * @param attrs Атрибуты устройства текущего запроса
     */
    virtual domain::ValidationResult validate(
        const std::string& sessionToken,
        const domain::DeviceAttributes& attrs) = 0;
};

} // namespace gateway::ports::input
