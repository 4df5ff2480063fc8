#pragma once

#include "IAccountRepository.hpp"
#include "IJournalEntryRepository.hpp"
#include "ISequenceRepository.hpp"
#include <memory>

namespace ledger::ports::output {

/**
 * @brief Одна транзакция хранилища
 *
 * Все репозитории сессии работают в одной транзакции.
 * Сессия, уничтоженная без commit(), откатывается.
 */
class ILedgerSession {
public:
    virtual ~ILedgerSession() = default;

    virtual IAccountRepository& accounts() = 0;
    virtual IJournalEntryRepository& entries() = 0;
    virtual ISequenceRepository& sequences() = 0;

    virtual void commit() = 0;
    virtual void rollback() = 0;
};

/**
 * @brief Фабрика транзакций
 */
class ILedgerUnitOfWork {
public:
    virtual ~ILedgerUnitOfWork() = default;

    /**
     * @throws domain::ConcurrencyException(LOCK_TIMEOUT) если транзакцию не удалось начать вовремя
     */
    virtual std::unique_ptr<ILedgerSession> begin() = 0;
};

} // namespace ledger::ports::output
