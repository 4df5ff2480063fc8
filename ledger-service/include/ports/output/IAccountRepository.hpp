#pragma once

#include "domain/Account.hpp"
#include "domain/Money.hpp"
#include <vector>
#include <optional>
#include <string>
#include <cstdint>

namespace ledger::ports::output {

/**
 * @brief Счета внутри транзакции (ILedgerSession)
 */
class IAccountRepository {
public:
    virtual ~IAccountRepository() = default;

    virtual std::optional<domain::Account> findById(int64_t id) = 0;

    /**
     * @brief Найти счета по списку id; отсутствующие просто не попадают в результат
     */
    virtual std::vector<domain::Account> findByIds(const std::vector<int64_t>& ids) = 0;

    virtual std::optional<domain::Account> findByCode(const std::string& code) = 0;

    virtual std::vector<domain::Account> findAll() = 0;

    /**
     * @brief Атомарно прибавить delta к currentBalance под блокировкой строки
     * @return новый остаток
     * @throws domain::IntegrityException если счёта нет
     * @throws domain::ConcurrencyException при таймауте блокировки / deadlock
     */
    virtual domain::Money applyBalanceDelta(int64_t id, domain::Money delta) = 0;

    /**
     * @brief Перезаписать остаток (только для пересчёта)
     */
    virtual void setBalance(int64_t id, domain::Money balance) = 0;
};

} // namespace ledger::ports::output
