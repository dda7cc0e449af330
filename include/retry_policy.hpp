#ifndef IMGROOT_RETRY_POLICY_HPP
#define IMGROOT_RETRY_POLICY_HPP

#include <chrono>
#include <functional>

namespace imgroot {

/// Пауза между попытками; в тестах подменяется фиктивными часами
using Sleeper = std::function<void(std::chrono::milliseconds)>;

/**
 * @brief Ограниченная политика повторов
 *
 * Используется для umount (ядро может ещё держать точку монтирования)
 * и для ожидания узлов разделов после подключения loop-устройства.
 */
struct RetryPolicy {
    /// Число попыток по умолчанию
    static constexpr unsigned DEFAULT_ATTEMPTS = 5;

    /// Пауза между попытками по умолчанию (мс)
    static constexpr long DEFAULT_BACKOFF_MS = 500;

    unsigned attempts = DEFAULT_ATTEMPTS;
    std::chrono::milliseconds backoff{DEFAULT_BACKOFF_MS};
    Sleeper sleep;  ///< Пустой - std::this_thread::sleep_for

    /**
     * @brief Пауза перед следующей попыткой
     */
    void wait() const;
};

} // namespace imgroot

#endif // IMGROOT_RETRY_POLICY_HPP
