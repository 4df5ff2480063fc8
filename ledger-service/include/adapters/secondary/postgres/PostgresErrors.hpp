#pragma once

#include "domain/LedgerErrors.hpp"
#include <pqxx/pqxx>
#include <iostream>
#include <string>

namespace ledger::adapters::secondary {

/**
 * @brief Перевод SQLSTATE в таксономию ошибок журнала
 *
 * 55P03 lock_not_available   -> lockCode (SEQUENCE_CONTENTION / LOCK_TIMEOUT / BALANCE_CONTENTION)
 * 40P01 deadlock_detected    -> BALANCE_CONTENTION
 * 40001 serialization_failure -> BALANCE_CONTENTION
 * 23505 unique_violation     -> DUPLICATE_SOURCE
 * остальное пробрасывается как есть
 */
template <typename Fn>
auto withSqlErrors(const char* component, const char* operation,
                   domain::ConcurrencyException::Code lockCode, Fn&& fn) -> decltype(fn()) {
    try {
        return fn();
    } catch (const pqxx::sql_error& e) {
        const std::string state = e.sqlstate();
        std::cerr << "[" << component << "] " << operation << " error (" << state << "): "
                  << e.what() << std::endl;

        if (state == "55P03") {
            throw domain::ConcurrencyException(lockCode, std::string(operation) + ": lock timeout");
        }
        if (state == "40P01" || state == "40001") {
            throw domain::ConcurrencyException(domain::ConcurrencyException::Code::BALANCE_CONTENTION,
                                               std::string(operation) + ": " + e.what());
        }
        if (state == "23505") {
            throw domain::ConcurrencyException(domain::ConcurrencyException::Code::DUPLICATE_SOURCE,
                                               std::string(operation) + ": " + e.what());
        }
        throw;
    }
}

} // namespace ledger::adapters::secondary
