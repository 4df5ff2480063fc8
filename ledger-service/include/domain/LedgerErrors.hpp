#pragma once

#include <stdexcept>
#include <string>
#include <vector>
#include <cstdint>

namespace ledger::domain {

/**
 * @brief Базовое исключение журнала
 *
 * Любая ошибка внутри операции откатывает всю транзакцию целиком.
 */
class LedgerException : public std::runtime_error {
public:
    explicit LedgerException(const std::string& message)
        : std::runtime_error(message) {}

    /**
     * @brief Имеет ли смысл повторить операцию
     */
    virtual bool isRetryable() const { return false; }
};

/**
 * @brief Проводка отклонена до записи: несбалансирована, нет строк,
 * неизвестный / неактивный счёт, отрицательная сумма
 */
class ValidationException : public LedgerException {
public:
    explicit ValidationException(std::vector<std::string> violations)
        : LedgerException(join(violations))
        , violations_(std::move(violations)) {}

    explicit ValidationException(const std::string& violation)
        : ValidationException(std::vector<std::string>{violation}) {}

    const std::vector<std::string>& violations() const { return violations_; }

private:
    std::vector<std::string> violations_;

    static std::string join(const std::vector<std::string>& items) {
        std::string result = "Validation failed";
        for (size_t i = 0; i < items.size(); ++i) {
            result += (i == 0 ? ": " : "; ") + items[i];
        }
        return result;
    }
};

/**
 * @brief Временная ошибка конкурентного доступа, повторить с backoff
 */
class ConcurrencyException : public LedgerException {
public:
    enum class Code {
        SEQUENCE_CONTENTION,
        BALANCE_CONTENTION,
        LOCK_TIMEOUT,
        DUPLICATE_SOURCE   ///< параллельная вставка того же источника; повтор вернёт существующую проводку
    };

    ConcurrencyException(Code code, const std::string& message)
        : LedgerException(message), code_(code) {}

    Code code() const { return code_; }

    bool isRetryable() const override { return true; }

private:
    Code code_;
};

/**
 * @brief Недопустимый переход состояния проводки
 */
class StateException : public LedgerException {
public:
    enum class Code {
        ALREADY_POSTED,
        ALREADY_REVERSED,
        NOT_POSTED
    };

    StateException(Code code, const std::string& message)
        : LedgerException(message), code_(code) {}

    Code code() const { return code_; }

private:
    Code code_;
};

/**
 * @brief В плане счетов нет обязательного счёта
 */
class IntegrityException : public LedgerException {
public:
    explicit IntegrityException(const std::string& message)
        : LedgerException(message) {}
};

class EntryNotFoundException : public LedgerException {
public:
    explicit EntryNotFoundException(int64_t id)
        : LedgerException("Journal entry not found: " + std::to_string(id))
        , id_(id) {}

    int64_t id() const { return id_; }

private:
    int64_t id_;
};

inline std::string toString(ConcurrencyException::Code code) {
    switch (code) {
        case ConcurrencyException::Code::SEQUENCE_CONTENTION: return "SEQUENCE_CONTENTION";
        case ConcurrencyException::Code::BALANCE_CONTENTION:  return "BALANCE_CONTENTION";
        case ConcurrencyException::Code::LOCK_TIMEOUT:        return "LOCK_TIMEOUT";
        case ConcurrencyException::Code::DUPLICATE_SOURCE:    return "DUPLICATE_SOURCE";
    }
    return "UNKNOWN";
}

inline std::string toString(StateException::Code code) {
    switch (code) {
        case StateException::Code::ALREADY_POSTED:   return "ALREADY_POSTED";
        case StateException::Code::ALREADY_REVERSED: return "ALREADY_REVERSED";
        case StateException::Code::NOT_POSTED:       return "NOT_POSTED";
    }
    return "UNKNOWN";
}

} // namespace ledger::domain
