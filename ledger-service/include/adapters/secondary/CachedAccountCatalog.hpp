#pragma once

#include "ports/output/IAccountCatalog.hpp"
#include "settings/CacheSettings.hpp"
#include <cache/ICache.hpp>
#include <cache/Cache.hpp>
#include <cache/eviction/LRUPolicy.hpp>
#include <cache/expiration/GlobalTTL.hpp>
#include <cache/concurrency/ThreadSafeCache.hpp>
#include <map>
#include <memory>
#include <mutex>
#include <iostream>

namespace ledger::adapters::secondary {

/**
 * @brief Декоратор IAccountCatalog с LRU + TTL кэшем
 *
 * Два кэша:
 * - byIdCache_: id -> Account
 * - byCodeCache_: code -> Account
 *
 * findAll() не кэшируется (всегда делегирует, но прогревает кэш).
 * invalidate() вызывается движком после каждой проводки, поэтому
 * остатки и признак активности не устаревают дольше, чем на TTL.
 */
class CachedAccountCatalog : public ports::output::IAccountCatalog {
public:
    CachedAccountCatalog(
        std::shared_ptr<ports::output::IAccountCatalog> delegate,
        std::shared_ptr<settings::CacheSettings> cacheSettings
    ) : delegate_(std::move(delegate))
      , cacheSettings_(std::move(cacheSettings))
    {
        initCaches();
    }

    std::optional<domain::Account> findById(int64_t id) override {
        auto cached = byIdCache_->get(id);
        if (cached) {
            return *cached;
        }

        auto account = delegate_->findById(id);
        if (account) {
            remember(*account);
        }
        return account;
    }

    std::optional<domain::Account> findByCode(const std::string& code) override {
        auto cached = byCodeCache_->get(code);
        if (cached) {
            return *cached;
        }

        auto account = delegate_->findByCode(code);
        if (account) {
            remember(*account);
        }
        return account;
    }

    std::vector<domain::Account> findAll() override {
        auto accounts = delegate_->findAll();
        for (const auto& account : accounts) {
            remember(account);
        }
        return accounts;
    }

    void invalidate(const std::vector<int64_t>& accountIds) override {
        std::lock_guard<std::mutex> lock(codesMutex_);
        for (auto id : accountIds) {
            byIdCache_->remove(id);
            auto it = codeOf_.find(id);
            if (it != codeOf_.end()) {
                byCodeCache_->remove(it->second);
                codeOf_.erase(it);
            }
        }
        delegate_->invalidate(accountIds);
    }

    void clear() {
        std::lock_guard<std::mutex> lock(codesMutex_);
        byIdCache_->clear();
        byCodeCache_->clear();
        codeOf_.clear();
    }

    size_t getCacheSize() const {
        return byIdCache_->size();
    }

private:
    std::shared_ptr<ports::output::IAccountCatalog> delegate_;
    std::shared_ptr<settings::CacheSettings> cacheSettings_;
    std::unique_ptr<ThreadSafeCache<int64_t, domain::Account>> byIdCache_;
    std::unique_ptr<ThreadSafeCache<std::string, domain::Account>> byCodeCache_;
    std::mutex codesMutex_;
    std::map<int64_t, std::string> codeOf_;

    void remember(const domain::Account& account) {
        std::lock_guard<std::mutex> lock(codesMutex_);
        byIdCache_->put(account.id, account);
        byCodeCache_->put(account.code, account);
        codeOf_[account.id] = account.code;
    }

    void initCaches() {
        size_t size = cacheSettings_->getAccountCacheSize();
        int ttlSeconds = cacheSettings_->getAccountTtlSeconds();

        auto byIdBase = std::make_unique<Cache<int64_t, domain::Account>>(
            size,
            std::make_unique<LRUPolicy<int64_t>>(),
            std::make_unique<GlobalTTL<int64_t>>(std::chrono::seconds(ttlSeconds))
        );
        byIdCache_ = std::make_unique<ThreadSafeCache<int64_t, domain::Account>>(std::move(byIdBase));

        auto byCodeBase = std::make_unique<Cache<std::string, domain::Account>>(
            size,
            std::make_unique<LRUPolicy<std::string>>(),
            std::make_unique<GlobalTTL<std::string>>(std::chrono::seconds(ttlSeconds))
        );
        byCodeCache_ = std::make_unique<ThreadSafeCache<std::string, domain::Account>>(std::move(byCodeBase));

        std::cout << "[CachedAccountCatalog] Created with accountCache="
                  << size << "/" << ttlSeconds << "s" << std::endl;
    }
};

} // namespace ledger::adapters::secondary
