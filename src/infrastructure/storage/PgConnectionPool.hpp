#pragma once

#include <chrono>
#include <condition_variable>
#include <mutex>
#include <string>
#include <vector>
#include <loguru.hpp>
#include "infrastructure/storage/PgClient.hpp"

namespace invoice::infrastructure::storage
{
    /**
     * @brief 固定大小的 PostgreSQL 連線池
     * @details PGconn 不可跨執行緒共用，每個工作執行緒以 Lease 借出一條連線，Lease 解構時歸還
     */
    class PgConnectionPool
    {
    public:
        class Lease
        {
        public:
            Lease() = default;
            Lease(PgConnectionPool *pool, PgConnPtr conn) : pool_(pool), conn_(std::move(conn)) {}

            ~Lease()
            {
                release();
            }

            Lease(Lease &&other) noexcept : pool_(other.pool_), conn_(std::move(other.conn_))
            {
                other.pool_ = nullptr;
            }

            Lease &operator=(Lease &&other) noexcept
            {
                if (this != &other)
                {
                    release();
                    pool_ = other.pool_;
                    conn_ = std::move(other.conn_);
                    other.pool_ = nullptr;
                }
                return *this;
            }

            Lease(const Lease &) = delete;
            Lease &operator=(const Lease &) = delete;

            PGconn *get() const noexcept { return conn_.get(); }

        private:
            void release()
            {
                if (pool_ && conn_)
                    pool_->giveBack(std::move(conn_));
                pool_ = nullptr;
            }

            PgConnectionPool *pool_ = nullptr;
            PgConnPtr conn_;
        };

        PgConnectionPool(std::string conninfo, size_t size)
            : conninfo_(std::move(conninfo)), size_(size == 0 ? 1 : size) {}

        PgConnectionPool(const PgConnectionPool &) = delete;
        PgConnectionPool &operator=(const PgConnectionPool &) = delete;

        Result<void, ErrorResult> init()
        {
            std::lock_guard<std::mutex> lock(mutex_);
            if (!idle_.empty())
                return Result<void, ErrorResult>::Ok();

            for (size_t i = 0; i < size_; ++i)
            {
                auto conn = connect_pg(conninfo_);
                if (conn.is_err())
                {
                    idle_.clear();
                    return Result<void, ErrorResult>::Err(conn.unwrap_err());
                }
                idle_.push_back(std::move(conn.unwrap()));
            }
            LOG_F(INFO, "PgConnectionPool: opened %zu connections", size_);
            return Result<void, ErrorResult>::Ok();
        }

        /**
         * @brief 借出連線；逾時回傳 DatabaseConnectionFailed
         * @details 連線已斷時先嘗試 PQreset
         */
        Result<Lease, ErrorResult> acquire(std::chrono::milliseconds timeout)
        {
            std::unique_lock<std::mutex> lock(mutex_);
            if (!cv_.wait_for(lock, timeout, [this]
                              { return !idle_.empty(); }))
            {
                return Result<Lease, ErrorResult>::Err(
                    ErrorResult{ErrorCode::DatabaseConnectionFailed, "no database connection available within " +
                                                                         std::to_string(timeout.count()) + " ms"});
            }

            PgConnPtr conn = std::move(idle_.back());
            idle_.pop_back();
            lock.unlock();

            if (PQstatus(conn.get()) != CONNECTION_OK)
            {
                LOG_F(WARNING, "PgConnectionPool: connection lost, resetting");
                PQreset(conn.get());
                if (PQstatus(conn.get()) != CONNECTION_OK)
                {
                    ErrorResult error{ErrorCode::DatabaseConnectionFailed, "PostgreSQL reconnect failed: " + pg_error_message(conn.get())};
                    giveBack(std::move(conn));
                    return Result<Lease, ErrorResult>::Err(error);
                }
            }
            return Result<Lease, ErrorResult>::Ok(Lease(this, std::move(conn)));
        }

        size_t size() const noexcept { return size_; }

    private:
        void giveBack(PgConnPtr conn)
        {
            {
                std::lock_guard<std::mutex> lock(mutex_);
                idle_.push_back(std::move(conn));
            }
            cv_.notify_one();
        }

        std::string conninfo_;
        size_t size_;
        std::vector<PgConnPtr> idle_;
        std::mutex mutex_;
        std::condition_variable cv_;
    };

} // namespace invoice::infrastructure::storage
