#pragma once

#include <libpq-fe.h>
#include <poll.h>
#include <chrono>
#include <memory>
#include <optional>
#include <string>
#include <vector>
#include <boost/algorithm/string.hpp>
#include <loguru.hpp>
#include "domain/Result.hpp"

namespace invoice::infrastructure::storage
{
    using invoice::domain::ErrorCode;
    using invoice::domain::ErrorResult;
    using invoice::domain::Result;

    struct PgConnDeleter
    {
        void operator()(PGconn *conn) const
        {
            if (conn)
                PQfinish(conn);
        }
    };

    struct PgResultDeleter
    {
        void operator()(PGresult *res) const
        {
            if (res)
                PQclear(res);
        }
    };

    using PgConnPtr = std::unique_ptr<PGconn, PgConnDeleter>;
    using PgResultPtr = std::unique_ptr<PGresult, PgResultDeleter>;

    // 參數一律以文字格式傳遞，std::nullopt 代表 SQL NULL
    using PgParams = std::vector<std::optional<std::string>>;

    using PgDeadline = std::chrono::steady_clock::time_point;

    // SQLSTATE
    constexpr const char *kUniqueViolation = "23505";
    constexpr const char *kQueryCanceled = "57014";

    // 送出 cancel 後等待伺服器回應的時間，逾時則重設連線
    constexpr std::chrono::milliseconds kCancelGrace(2000);

    inline std::string pg_error_message(const PGconn *conn)
    {
        std::string message = conn ? PQerrorMessage(conn) : "no connection";
        boost::algorithm::trim(message);
        return message;
    }

    inline Result<PgConnPtr, ErrorResult> connect_pg(const std::string &conninfo)
    {
        PgConnPtr conn(PQconnectdb(conninfo.c_str()));
        if (!conn)
            return Result<PgConnPtr, ErrorResult>::Err(ErrorResult{ErrorCode::DatabaseConnectionFailed, "Unable to allocate PGconn"});
        if (PQstatus(conn.get()) != CONNECTION_OK)
        {
            return Result<PgConnPtr, ErrorResult>::Err(
                ErrorResult{ErrorCode::DatabaseConnectionFailed, "PostgreSQL connection failed: " + pg_error_message(conn.get())});
        }
        return Result<PgConnPtr, ErrorResult>::Ok(std::move(conn));
    }

    /**
     * @brief 依 SQLSTATE 對應錯誤碼: 23505 -> DuplicateInvoice，57014 -> PersistenceTimeout，
     *        連線中斷 -> DatabaseConnectionFailed，其餘 -> PersistenceFailed
     */
    inline Result<PgResultPtr, ErrorResult> pg_check_result(PGconn *conn, PgResultPtr res)
    {
        const ExecStatusType status = PQresultStatus(res.get());
        if (status == PGRES_COMMAND_OK || status == PGRES_TUPLES_OK)
            return Result<PgResultPtr, ErrorResult>::Ok(std::move(res));

        const char *sqlstate_raw = PQresultErrorField(res.get(), PG_DIAG_SQLSTATE);
        const std::string sqlstate = sqlstate_raw ? sqlstate_raw : "";
        std::string detail = PQresultErrorMessage(res.get());
        boost::algorithm::trim(detail);

        ErrorCode code = ErrorCode::PersistenceFailed;
        if (sqlstate == kUniqueViolation)
            code = ErrorCode::DuplicateInvoice;
        else if (sqlstate == kQueryCanceled)
            code = ErrorCode::PersistenceTimeout;
        else if (PQstatus(conn) != CONNECTION_OK)
            code = ErrorCode::DatabaseConnectionFailed;

        return Result<PgResultPtr, ErrorResult>::Err(
            ErrorResult{code, "SQL error [" + sqlstate + "]: " + detail});
    }

    // 等到 libpq 有完整結果可取，或 deadline 到期 (回傳 false)
    inline bool pg_wait_result(PGconn *conn, PgDeadline deadline)
    {
        for (;;)
        {
            if (!PQconsumeInput(conn) || !PQisBusy(conn))
                return true; // 連線錯誤交給 PQgetResult 回報

            const auto remaining = std::chrono::duration_cast<std::chrono::milliseconds>(
                deadline - std::chrono::steady_clock::now());
            if (remaining.count() <= 0)
                return false;

            pollfd pfd{};
            pfd.fd = PQsocket(conn);
            pfd.events = POLLIN;
            ::poll(&pfd, 1, static_cast<int>(remaining.count()));
        }
    }

    inline void pg_cancel(PGconn *conn)
    {
        PGcancel *cancel = PQgetCancel(conn);
        if (!cancel)
            return;
        char errbuf[256];
        if (!PQcancel(cancel, errbuf, sizeof(errbuf)))
            LOG_F(WARNING, "pg_cancel: %s", errbuf);
        PQfreeCancel(cancel);
    }

    /**
     * @brief 執行參數化 SQL，等待結果不超過 deadline
     * @details 到期時送出 cancel (伺服器以 57014 結束語句)；cancel 後仍無回應則重設連線，
     *          未完成的交易隨舊連線一起消失
     */
    inline Result<PgResultPtr, ErrorResult> pg_exec_until(PGconn *conn, const std::string &sql, const PgParams &params,
                                                          PgDeadline deadline)
    {
        using R = Result<PgResultPtr, ErrorResult>;
        if (!conn)
            return R::Err(ErrorResult{ErrorCode::DatabaseConnectionFailed, "pg_exec: null connection"});
        if (std::chrono::steady_clock::now() >= deadline)
            return R::Err(ErrorResult{ErrorCode::PersistenceTimeout, "deadline exceeded before: " + sql.substr(0, 40)});

        std::vector<const char *> values;
        values.reserve(params.size());
        for (const auto &p : params)
        {
            values.push_back(p ? p->c_str() : nullptr);
        }

        if (!PQsendQueryParams(conn, sql.c_str(), static_cast<int>(values.size()), nullptr,
                               values.empty() ? nullptr : values.data(), nullptr, nullptr, 0))
        {
            return R::Err(ErrorResult{ErrorCode::DatabaseConnectionFailed, "PQsendQueryParams failed: " + pg_error_message(conn)});
        }

        PgResultPtr first;
        PgDeadline wait_until = deadline;
        bool cancelled = false;
        for (;;)
        {
            if (!pg_wait_result(conn, wait_until))
            {
                if (cancelled)
                {
                    LOG_F(ERROR, "pg_exec: no reply after cancel, resetting connection");
                    PQreset(conn);
                    return R::Err(ErrorResult{ErrorCode::PersistenceTimeout, "statement did not finish before deadline; connection reset"});
                }
                LOG_F(WARNING, "pg_exec: deadline reached, cancelling statement");
                pg_cancel(conn);
                cancelled = true;
                wait_until = std::chrono::steady_clock::now() + kCancelGrace;
                continue;
            }

            PgResultPtr res(PQgetResult(conn));
            if (!res)
                break;
            if (!first)
                first = std::move(res);
        }

        if (!first)
            return R::Err(ErrorResult{ErrorCode::DatabaseConnectionFailed, "no result: " + pg_error_message(conn)});
        return pg_check_result(conn, std::move(first));
    }

    /**
     * @brief 執行參數化 SQL (阻塞至伺服器回應)
     */
    inline Result<PgResultPtr, ErrorResult> pg_exec(PGconn *conn, const std::string &sql, const PgParams &params = {})
    {
        if (!conn)
            return Result<PgResultPtr, ErrorResult>::Err(ErrorResult{ErrorCode::DatabaseConnectionFailed, "pg_exec: null connection"});

        std::vector<const char *> values;
        values.reserve(params.size());
        for (const auto &p : params)
        {
            values.push_back(p ? p->c_str() : nullptr);
        }

        PgResultPtr res(PQexecParams(conn, sql.c_str(), static_cast<int>(values.size()), nullptr,
                                     values.empty() ? nullptr : values.data(), nullptr, nullptr, 0));
        if (!res)
        {
            return Result<PgResultPtr, ErrorResult>::Err(
                ErrorResult{ErrorCode::DatabaseConnectionFailed, "PQexecParams failed: " + pg_error_message(conn)});
        }
        return pg_check_result(conn, std::move(res));
    }

    inline Result<void, ErrorResult> pg_command(PGconn *conn, const std::string &sql, const PgParams &params = {})
    {
        auto res = pg_exec(conn, sql, params);
        if (res.is_err())
            return Result<void, ErrorResult>::Err(res.unwrap_err());
        return Result<void, ErrorResult>::Ok();
    }

    /**
     * @brief 交易 RAII: begin() 設定整筆交易的期限，未 commit 即解構時 ROLLBACK
     * @details 每個語句都只等到同一個期限；伺服器端另以 statement_timeout 限制單一語句
     */
    class PgTransaction
    {
    public:
        explicit PgTransaction(PGconn *conn) : conn_(conn) {}

        ~PgTransaction()
        {
            if (open_)
            {
                auto rollback = pg_exec_until(conn_, "ROLLBACK", {}, std::chrono::steady_clock::now() + kCancelGrace);
                if (rollback.is_err())
                    LOG_F(ERROR, "PgTransaction: rollback failed: %s", rollback.unwrap_err().message.c_str());
            }
        }

        PgTransaction(const PgTransaction &) = delete;
        PgTransaction &operator=(const PgTransaction &) = delete;

        Result<void, ErrorResult> begin(int timeout_ms)
        {
            deadline_ = std::chrono::steady_clock::now() + std::chrono::milliseconds(timeout_ms);
            auto begun = exec("BEGIN");
            if (begun.is_err())
                return Result<void, ErrorResult>::Err(begun.unwrap_err());
            open_ = true;
            // SET LOCAL 只在本交易內有效；逾時會讓語句以 57014 失敗，整筆交易回滾
            auto limited = exec("SET LOCAL statement_timeout = " + std::to_string(timeout_ms));
            if (limited.is_err())
                return Result<void, ErrorResult>::Err(limited.unwrap_err());
            return Result<void, ErrorResult>::Ok();
        }

        Result<void, ErrorResult> commit()
        {
            auto committed = exec("COMMIT");
            if (committed.is_err())
                return Result<void, ErrorResult>::Err(committed.unwrap_err());
            open_ = false;
            return Result<void, ErrorResult>::Ok();
        }

        Result<PgResultPtr, ErrorResult> exec(const std::string &sql, const PgParams &params = {})
        {
            return pg_exec_until(conn_, sql, params, deadline_);
        }

    private:
        PGconn *conn_;
        bool open_ = false;
        PgDeadline deadline_ = std::chrono::steady_clock::now();
    };

} // namespace invoice::infrastructure::storage
