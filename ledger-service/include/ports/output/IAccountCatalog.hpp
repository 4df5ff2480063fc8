#pragma once

#include "domain/Account.hpp"
#include <vector>
#include <optional>
#include <string>
#include <cstdint>

namespace ledger::ports::output {

/**
 * @brief План счетов вне транзакций проводки (только чтение)
 *
 * Используется адаптерами для поиска счетов по коду. Проверка
 * активности при проводке идёт через ILedgerSession, а не через каталог.
 */
class IAccountCatalog {
public:
    virtual ~IAccountCatalog() = default;

    virtual std::optional<domain::Account> findById(int64_t id) = 0;
    virtual std::optional<domain::Account> findByCode(const std::string& code) = 0;
    virtual std::vector<domain::Account> findAll() = 0;

    /**
     * @brief Сбросить закэшированные счета после записи
     */
    virtual void invalidate(const std::vector<int64_t>& accountIds) = 0;
};

} // namespace ledger::ports::output
