#pragma once

#include "Money.hpp"
#include "Timestamp.hpp"
#include "enums/AccountType.hpp"
#include <string>
#include <optional>
#include <cstdint>

namespace ledger::domain {

/**
 * @brief Счёт плана счетов с материализованным остатком
 *
 * currentBalance пишет только BalanceMaterializer, все остальные читают.
 */
class Account {
public:
    int64_t id = 0;
    std::string code;
    std::string name;
    AccountType type = AccountType::ASSET;
    std::optional<int64_t> parentId;
    bool isHeader = false;
    bool isActive = true;
    Money currentBalance;
    Timestamp balanceUpdatedAt;

    Account() = default;

    Account(int64_t id_, const std::string& code_, const std::string& name_, AccountType type_)
        : id(id_)
        , code(code_)
        , name(name_)
        , type(type_)
        , balanceUpdatedAt(Timestamp::now())
    {}

    NormalBalance normalBalance() const {
        return normalBalanceOf(type);
    }
};

} // namespace ledger::domain
