#pragma once

#include <chrono>
#include <cstdlib>
#include <memory>
#include <string>
#include <loguru.hpp>
#include "domain/IPendingRecoveryStore.hpp"
#include "infrastructure/storage/PgClient.hpp"
#include "infrastructure/storage/PgConnectionPool.hpp"
#include "utils/InvoiceUtils.hpp"

namespace invoice::infrastructure::storage
{
    using invoice::domain::IPendingRecoveryStore;
    using invoice::domain::PendingRecoveryEntry;

    /**
     * @brief pending_recovery 寫入
     * @details 每次新增都是獨立交易，與發票交易是否回滾無關
     */
    class PgPendingRecoveryStore : public IPendingRecoveryStore
    {
    public:
        PgPendingRecoveryStore(std::shared_ptr<PgConnectionPool> pool, int transaction_timeout_ms)
            : pool_(std::move(pool)), transaction_timeout_ms_(transaction_timeout_ms) {}

        Result<int64_t, ErrorResult> insert(const PendingRecoveryEntry &entry) override
        {
            using R = Result<int64_t, ErrorResult>;
            auto fail = [](const ErrorResult &cause)
            {
                return R::Err(ErrorResult{ErrorCode::RecoveryWriteFailed,
                                          std::string(domain::errorCodeName(cause.code)) + ": " + cause.message});
            };

            auto lease = pool_->acquire(std::chrono::milliseconds(transaction_timeout_ms_));
            if (lease.is_err())
                return fail(lease.unwrap_err());

            PgTransaction tx(lease.unwrap().get());
            auto begun = tx.begin(transaction_timeout_ms_);
            if (begun.is_err())
                return fail(begun.unwrap_err());

            auto res = tx.exec("INSERT INTO pending_recovery (url, chat_id, reception_date, type_document, user_id, "
                               "error_message, origin, ws_id) "
                               "VALUES ($1, $2, $3, $4, $5, $6, $7, $8) RETURNING id",
                               {entry.url,
                                entry.chat_id,
                                utils::InvoiceUtils::formatTimestamp(entry.reception_date),
                                entry.type_document,
                                entry.user_id,
                                entry.error_message,
                                entry.origin,
                                entry.ws_id});
            if (res.is_err())
                return fail(res.unwrap_err());

            PGresult *rows = res.unwrap().get();
            if (PQntuples(rows) != 1)
                return fail(ErrorResult{ErrorCode::PersistenceFailed, "INSERT ... RETURNING id returned no row"});
            const int64_t id = std::strtoll(PQgetvalue(rows, 0, 0), nullptr, 10);

            auto committed = tx.commit();
            if (committed.is_err())
                return fail(committed.unwrap_err());

            LOG_F(INFO, "PgPendingRecoveryStore: pending_recovery id=%lld url=%s",
                  static_cast<long long>(id), entry.url.c_str());
            return R::Ok(id);
        }

    private:
        std::shared_ptr<PgConnectionPool> pool_;
        int transaction_timeout_ms_;
    };

} // namespace invoice::infrastructure::storage
