#pragma once

#include "ports/output/IEventConsumer.hpp"
#include "application/JournalPostingQueue.hpp"
#include "application/sources/SalesJournalAdapter.hpp"
#include "application/sources/PurchaseJournalAdapter.hpp"
#include "application/sources/PaymentJournalAdapter.hpp"
#include "domain/LedgerErrors.hpp"
#include <nlohmann/json.hpp>
#include <atomic>
#include <memory>
#include <iostream>

namespace ledger::adapters::primary {

/**
 * @brief Слушатель событий документов-источников
 *
 * Слушает (ledger.events):
 * - sales.invoiced     -> SalesJournalAdapter
 * - purchase.approved  -> PurchaseJournalAdapter
 * - payment.recorded   -> PaymentJournalAdapter
 *
 * Каждое событие становится JournalTask в JournalPostingQueue: документ уже
 * сохранён в своей транзакции, проводка делается отдельно, с повторами.
 * Разбор JSON выполняется внутри задачи, поэтому битое событие попадает
 * в dead-letter вместе с исходным payload.
 *
 * Суммы: целое число - минорные единицы (копейки), строка - десятичная запись ("1250.50").
 */
class SourceEventListener {
public:
    SourceEventListener(
        std::shared_ptr<ports::output::IEventConsumer> eventConsumer,
        std::shared_ptr<application::JournalPostingQueue> postingQueue,
        std::shared_ptr<application::sources::SalesJournalAdapter> salesAdapter,
        std::shared_ptr<application::sources::PurchaseJournalAdapter> purchaseAdapter,
        std::shared_ptr<application::sources::PaymentJournalAdapter> paymentAdapter
    ) : eventConsumer_(std::move(eventConsumer))
      , postingQueue_(std::move(postingQueue))
      , salesAdapter_(std::move(salesAdapter))
      , purchaseAdapter_(std::move(purchaseAdapter))
      , paymentAdapter_(std::move(paymentAdapter))
      , received_(0)
    {
        std::cout << "[SourceEventListener] Created" << std::endl;
        subscribe();
    }

    uint64_t receivedCount() const { return received_; }

    /**
     * @brief Поставить событие в очередь проводок
     * @return false, если ключ не обслуживается или очередь остановлена
     */
    bool handleEvent(const std::string& routingKey, const std::string& message) {
        ++received_;

        if (routingKey == "sales.invoiced") {
            return postingQueue_->submit(routingKey, message, [this, message]() {
                salesAdapter_->postSale(parseSale(parsePayload(message)));
            });
        }
        if (routingKey == "purchase.approved") {
            return postingQueue_->submit(routingKey, message, [this, message]() {
                purchaseAdapter_->postPurchase(parsePurchase(parsePayload(message)));
            });
        }
        if (routingKey == "payment.recorded") {
            return postingQueue_->submit(routingKey, message, [this, message]() {
                paymentAdapter_->postPayment(parsePayment(parsePayload(message)));
            });
        }

        std::cerr << "[SourceEventListener] Unexpected routing key: " << routingKey << std::endl;
        return false;
    }

    // =========================================================================
    // Разбор событий
    // =========================================================================

    /**
     * @throws domain::ValidationException если JSON или поля некорректны
     */
    static domain::Sale parseSale(const nlohmann::json& json) {
        return guarded("sales.invoiced", [&json]() {
            domain::Sale sale;
            sale.id = requireId(json);
            sale.invoiceNumber = json.value("invoice_number", "");
            sale.customerName = json.value("customer_name", "");
            sale.date = parseDate(json);
            sale.status = domain::saleStatusFromString(json.value("status", "INVOICED"));
            sale.paymentMethod = domain::paymentMethodFromString(json.value("payment_method", "CREDIT"));
            sale.cashBankAccountId = optionalId(json, "cash_bank_account_id");
            sale.subtotal = parseMoney(json, "subtotal");
            sale.vat = parseMoney(json, "vat");
            sale.withheldTax = parseMoney(json, "withheld_tax");
            sale.total = parseMoney(json, "total");
            sale.costOfGoodsSold = parseMoney(json, "cost_of_goods_sold");
            sale.createdBy = json.value("created_by", "");
            return sale;
        });
    }

    static domain::Purchase parsePurchase(const nlohmann::json& json) {
        return guarded("purchase.approved", [&json]() {
            domain::Purchase purchase;
            purchase.id = requireId(json);
            purchase.code = json.value("code", "");
            purchase.vendorName = json.value("vendor_name", "");
            purchase.date = parseDate(json);
            purchase.paymentMethod = domain::paymentMethodFromString(json.value("payment_method", "CREDIT"));
            purchase.cashBankAccountId = optionalId(json, "cash_bank_account_id");
            if (json.contains("items") && json["items"].is_array()) {
                for (const auto& itemJson : json["items"]) {
                    domain::PurchaseItem item;
                    item.description = itemJson.value("description", "");
                    item.amount = parseMoney(itemJson, "amount");
                    item.expenseAccountId = optionalId(itemJson, "expense_account_id");
                    purchase.items.push_back(item);
                }
            }
            purchase.vat = parseMoney(json, "vat");
            purchase.pph21 = parseMoney(json, "pph21");
            purchase.pph23 = parseMoney(json, "pph23");
            purchase.total = parseMoney(json, "total");
            purchase.createdBy = json.value("created_by", "");
            return purchase;
        });
    }

    static domain::Payment parsePayment(const nlohmann::json& json) {
        return guarded("payment.recorded", [&json]() {
            domain::Payment payment;
            payment.id = requireId(json);
            payment.code = json.value("code", "");
            payment.kind = domain::paymentKindFromString(json.value("kind", "CUSTOMER"));
            payment.contactName = json.value("contact_name", "");
            payment.date = parseDate(json);
            payment.amount = parseMoney(json, "amount");
            payment.method = domain::paymentMethodFromString(json.value("method", "BANK"));
            payment.cashBankAccountId = optionalId(json, "cash_bank_account_id");
            payment.reference = json.value("reference", "");
            payment.notes = json.value("notes", "");
            payment.createdBy = json.value("created_by", "");
            return payment;
        });
    }

    static domain::Money parseMoney(const nlohmann::json& json, const std::string& key) {
        if (!json.contains(key) || json[key].is_null()) return domain::Money();

        const auto& val = json[key];
        if (val.is_number_unsigned() &&
            val.get<uint64_t>() > static_cast<uint64_t>(domain::Money::MAX_MINOR)) {
            throw std::invalid_argument("field '" + key + "' is out of range");
        }
        if (val.is_number_integer()) {
            return domain::Money::fromMinor(val.get<int64_t>());
        }
        if (val.is_number_float()) {
            return domain::Money::fromDouble(val.get<double>());
        }
        if (val.is_string()) {
            return domain::Money::fromString(val.get<std::string>());
        }
        throw std::invalid_argument("field '" + key + "' is not an amount");
    }

private:
    std::shared_ptr<ports::output::IEventConsumer> eventConsumer_;
    std::shared_ptr<application::JournalPostingQueue> postingQueue_;
    std::shared_ptr<application::sources::SalesJournalAdapter> salesAdapter_;
    std::shared_ptr<application::sources::PurchaseJournalAdapter> purchaseAdapter_;
    std::shared_ptr<application::sources::PaymentJournalAdapter> paymentAdapter_;
    std::atomic<uint64_t> received_;

    void subscribe() {
        eventConsumer_->subscribe(
            {"sales.invoiced", "purchase.approved", "payment.recorded"},
            [this](const std::string& key, const std::string& msg) { handleEvent(key, msg); }
        );
        std::cout << "[SourceEventListener] Subscribed to 3 event types" << std::endl;
    }

    static nlohmann::json parsePayload(const std::string& message) {
        try {
            return nlohmann::json::parse(message);
        } catch (const nlohmann::json::exception& e) {
            throw domain::ValidationException(std::string("malformed event JSON: ") + e.what());
        }
    }

    // Ошибки разбора - постоянные, повтор не поможет
    template <typename Fn>
    static auto guarded(const char* event, Fn&& fn) -> decltype(fn()) {
        try {
            return fn();
        } catch (const nlohmann::json::exception& e) {
            throw domain::ValidationException(std::string(event) + ": " + e.what());
        } catch (const std::invalid_argument& e) {
            throw domain::ValidationException(std::string(event) + ": " + e.what());
        }
    }

    static int64_t requireId(const nlohmann::json& json) {
        if (!json.contains("id") || !json["id"].is_number_integer()) {
            throw std::invalid_argument("field 'id' is required");
        }
        return json["id"].get<int64_t>();
    }

    static std::optional<int64_t> optionalId(const nlohmann::json& json, const std::string& key) {
        if (!json.contains(key) || json[key].is_null()) return std::nullopt;
        return json[key].get<int64_t>();
    }

    static domain::Timestamp parseDate(const nlohmann::json& json) {
        if (!json.contains("date") || !json["date"].is_string()) {
            return domain::Timestamp::now().startOfDay();
        }
        return domain::Timestamp::fromString(json["date"].get<std::string>());
    }
};

} // namespace ledger::adapters::primary
