#pragma once

#include "Money.hpp"
#include <string>
#include <vector>

namespace ledger::domain {

/**
 * @brief Результат проверки набора строк
 *
 * Собирает все нарушения, а не только первое.
 */
struct ValidationResult {
    std::vector<std::string> violations;
    Money totalDebit;
    Money totalCredit;

    bool ok() const { return violations.empty(); }

    void add(const std::string& violation) {
        violations.push_back(violation);
    }
};

} // namespace ledger::domain
