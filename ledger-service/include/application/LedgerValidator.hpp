#pragma once

#include "domain/Account.hpp"
#include "domain/JournalEntry.hpp"
#include "domain/ValidationResult.hpp"
#include "domain/LedgerErrors.hpp"
#include "settings/LedgerSettings.hpp"
#include <map>
#include <memory>
#include <string>

namespace ledger::application {

/**
 * @brief Проверка проводки перед записью
 *
 * Чистая функция от строк и счетов: ничего не читает и не пишет сама.
 * Счета передаёт вызывающий, прочитав их в той же транзакции.
 *
 * Отклоняет:
 * - пустое описание, меньше двух строк;
 * - неизвестный, неактивный или групповой (isHeader) счёт;
 * - отрицательную сумму;
 * - в строгом режиме строку, где заполнены обе стороны или ни одной;
 * - разницу дебета и кредита больше допуска.
 */
class LedgerValidator {
public:
    explicit LedgerValidator(std::shared_ptr<settings::LedgerSettings> settings)
        : settings_(std::move(settings)) {}

    /**
     * @param allowInactiveAccounts для сторно: историю должно быть можно отменить
     *        даже по закрытому счёту
     */
    domain::ValidationResult validate(const domain::JournalEntry& entry,
                                      const std::map<int64_t, domain::Account>& accounts,
                                      bool allowInactiveAccounts = false) const {
        domain::ValidationResult result;

        if (entry.description.empty()) {
            result.add("description is required");
        }

        if (entry.lines.empty()) {
            result.add("entry has no lines");
            return result;
        }
        if (entry.lines.size() < 2) {
            result.add("entry needs at least two lines");
        }

        for (size_t i = 0; i < entry.lines.size(); ++i) {
            const auto& line = entry.lines[i];
            std::string where = "line " + std::to_string(i + 1);

            auto it = accounts.find(line.accountId);
            if (it == accounts.end()) {
                result.add(where + ": unknown account " + std::to_string(line.accountId));
            } else {
                const auto& account = it->second;
                if (!account.isActive && !allowInactiveAccounts) {
                    result.add(where + ": account " + account.code + " is inactive");
                }
                if (account.isHeader) {
                    result.add(where + ": account " + account.code + " is a header account");
                }
            }

            if (line.debitAmount.isNegative() || line.creditAmount.isNegative()) {
                result.add(where + ": negative amount");
                continue;
            }

            bool hasDebit = line.debitAmount.isPositive();
            bool hasCredit = line.creditAmount.isPositive();
            if (settings_->isStrictLineSides()) {
                if (hasDebit && hasCredit) {
                    result.add(where + ": both debit and credit are set");
                } else if (!hasDebit && !hasCredit) {
                    result.add(where + ": zero amount");
                }
            } else if (!hasDebit && !hasCredit) {
                result.add(where + ": zero amount");
            }

            result.totalDebit += line.debitAmount;
            result.totalCredit += line.creditAmount;
        }

        if ((result.totalDebit - result.totalCredit).abs() > settings_->getTolerance()) {
            result.add("unbalanced: debit " + result.totalDebit.toString() +
                       " != credit " + result.totalCredit.toString());
        }

        return result;
    }

    /**
     * @throws domain::ValidationException со всеми найденными нарушениями
     */
    void validateOrThrow(const domain::JournalEntry& entry,
                         const std::map<int64_t, domain::Account>& accounts,
                         bool allowInactiveAccounts = false) const {
        auto result = validate(entry, accounts, allowInactiveAccounts);
        if (!result.ok()) {
            throw domain::ValidationException(result.violations);
        }
    }

private:
    std::shared_ptr<settings::LedgerSettings> settings_;
};

} // namespace ledger::application
