#pragma once

#include <cstdlib>
#include <string>

namespace ledger::settings {

/**
 * @brief Настройки кэша плана счетов
 *
 * Читает из ENV:
 * - CACHE_ACCOUNT_SIZE (default: 1000)
 * - CACHE_ACCOUNT_TTL_SECONDS (default: 5)
 *
 * TTL короткий: адаптеры не должны долго видеть деактивированный счёт.
 */
class CacheSettings {
public:
    CacheSettings() {
        if (const char* val = std::getenv("CACHE_ACCOUNT_SIZE")) {
            accountCacheSize_ = static_cast<size_t>(std::stoi(val));
        }
        if (const char* val = std::getenv("CACHE_ACCOUNT_TTL_SECONDS")) {
            accountTtlSeconds_ = std::stoi(val);
        }
    }

    size_t getAccountCacheSize() const { return accountCacheSize_; }
    int getAccountTtlSeconds() const { return accountTtlSeconds_; }

    void setAccountCacheSize(size_t size) { accountCacheSize_ = size; }
    void setAccountTtlSeconds(int seconds) { accountTtlSeconds_ = seconds; }

private:
    size_t accountCacheSize_ = 1000;
    int accountTtlSeconds_ = 5;
};

} // namespace ledger::settings
