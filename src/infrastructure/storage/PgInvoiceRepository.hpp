#pragma once

#include <chrono>
#include <memory>
#include <optional>
#include <string>
#include <loguru.hpp>
#include "domain/IInvoiceRepository.hpp"
#include "domain/InvoiceDataStructure.hpp"
#include "infrastructure/storage/PgClient.hpp"
#include "infrastructure/storage/PgConnectionPool.hpp"
#include "infrastructure/storage/InvoiceSchema.hpp"
#include "utils/InvoiceUtils.hpp"

namespace invoice::infrastructure::storage
{
    using invoice::domain::Decimal;
    using invoice::domain::ExistingInvoice;
    using invoice::domain::IInvoiceRepository;
    using invoice::domain::InvoiceRecord;
    using invoice::utils::InvoiceUtils;

    inline std::optional<std::string> decimalParam(const std::optional<Decimal> &value)
    {
        if (!value)
            return std::nullopt;
        return value->toString();
    }

    /**
     * @brief PostgreSQL 發票儲存庫
     * @details 表頭、明細、付款在同一個交易內寫入；cufe 主鍵衝突回傳 DuplicateInvoice
     */
    class PgInvoiceRepository : public IInvoiceRepository<InvoiceRecord, ErrorResult>
    {
    public:
        PgInvoiceRepository(std::shared_ptr<PgConnectionPool> pool, int transaction_timeout_ms)
            : pool_(std::move(pool)), transaction_timeout_ms_(transaction_timeout_ms) {}

        Result<void, ErrorResult> init() override
        {
            return pool_->init();
        }

        // 建立資料表 (可重複執行)
        Result<void, ErrorResult> ensureSchema()
        {
            auto lease = pool_->acquire(acquireTimeout());
            if (lease.is_err())
                return Result<void, ErrorResult>::Err(lease.unwrap_err());

            // 多個語句時不能帶參數，改用 PQexec
            PgResultPtr res(PQexec(lease.unwrap().get(), kInvoiceSchemaDdl));
            if (!res || PQresultStatus(res.get()) != PGRES_COMMAND_OK)
            {
                return Result<void, ErrorResult>::Err(
                    ErrorResult{ErrorCode::PersistenceFailed, "schema creation failed: " + pg_error_message(lease.unwrap().get())});
            }
            LOG_F(INFO, "PgInvoiceRepository: schema ready");
            return Result<void, ErrorResult>::Ok();
        }

        Result<std::optional<ExistingInvoice>, ErrorResult> findByCufe(const std::string &cufe) override
        {
            using R = Result<std::optional<ExistingInvoice>, ErrorResult>;

            auto lease = pool_->acquire(acquireTimeout());
            if (lease.is_err())
                return R::Err(lease.unwrap_err());

            auto res = pg_exec_until(lease.unwrap().get(),
                                     "SELECT cufe, COALESCE(user_id, ''), process_date::text FROM invoice_header WHERE cufe = $1",
                                     {cufe}, std::chrono::steady_clock::now() + acquireTimeout());
            if (res.is_err())
                return R::Err(res.unwrap_err());

            PGresult *rows = res.unwrap().get();
            if (PQntuples(rows) == 0)
                return R::Ok(std::optional<ExistingInvoice>());

            ExistingInvoice existing;
            existing.cufe = PQgetvalue(rows, 0, 0);
            existing.user_id = PQgetvalue(rows, 0, 1);
            existing.process_date = PQgetvalue(rows, 0, 2);
            return R::Ok(std::optional<ExistingInvoice>(std::move(existing)));
        }

        Result<void, ErrorResult> persist(const InvoiceRecord &record) override
        {
            auto lease = pool_->acquire(acquireTimeout());
            if (lease.is_err())
                return Result<void, ErrorResult>::Err(lease.unwrap_err());

            PgTransaction tx(lease.unwrap().get());
            auto begun = tx.begin(transaction_timeout_ms_);
            if (begun.is_err())
                return begun;

            auto header = insertHeader(tx, record);
            if (header.is_err())
                return header;

            // 只有表頭 cufe 衝突代表重複發票，明細 partkey 衝突屬於資料錯誤
            for (const auto &detail : record.details)
            {
                auto inserted = insertDetail(tx, detail).map_err(notDuplicate);
                if (inserted.is_err())
                    return inserted;
            }

            for (const auto &payment : record.payments)
            {
                auto inserted = insertPayment(tx, payment).map_err(notDuplicate);
                if (inserted.is_err())
                    return inserted;
            }

            auto committed = tx.commit();
            if (committed.is_ok())
            {
                LOG_F(1, "PgInvoiceRepository: committed %s (%zu details, %zu payments)",
                      record.header.cufe.c_str(), record.details.size(), record.payments.size());
            }
            return committed;
        }

    private:
        std::chrono::milliseconds acquireTimeout() const
        {
            return std::chrono::milliseconds(transaction_timeout_ms_);
        }

        static ErrorResult notDuplicate(const ErrorResult &error)
        {
            if (error.code == ErrorCode::DuplicateInvoice)
                return ErrorResult{ErrorCode::PersistenceFailed, error.message};
            return error;
        }

        static Result<void, ErrorResult> command(PgTransaction &tx, const std::string &sql, const PgParams &params)
        {
            auto res = tx.exec(sql, params);
            if (res.is_err())
                return Result<void, ErrorResult>::Err(res.unwrap_err());
            return Result<void, ErrorResult>::Ok();
        }

        static Result<void, ErrorResult> insertHeader(PgTransaction &tx, const InvoiceRecord &record)
        {
            const auto &h = record.header;
            return command(tx,
                           "INSERT INTO invoice_header (cufe, no, date, issuer_name, issuer_ruc, issuer_dv, issuer_address, "
                           "issuer_phone, receptor_name, receptor_ruc, tot_amount, tot_itbms, user_id, origin, url, type, "
                           "process_date, reception_date) "
                           "VALUES ($1, $2, $3, $4, $5, $6, $7, $8, $9, $10, $11, $12, $13, $14, $15, $16, $17, $18)",
                           {h.cufe,
                            h.no,
                            InvoiceUtils::formatInvoiceDate(h.date),
                            h.issuer_name,
                            h.issuer_ruc,
                            h.issuer_dv,
                            h.issuer_address,
                            h.issuer_phone,
                            h.receptor_name,
                            h.receptor_ruc,
                            h.tot_amount.toString(),
                            h.tot_itbms.toString(),
                            h.user_id,
                            h.origin,
                            h.url,
                            std::string(domain::invoiceTypeName(h.type)),
                            InvoiceUtils::formatTimestamp(h.process_date),
                            InvoiceUtils::formatTimestamp(h.reception_date)});
        }

        static Result<void, ErrorResult> insertDetail(PgTransaction &tx, const domain::InvoiceDetail &d)
        {
            return command(tx,
                           "INSERT INTO invoice_detail (partkey, cufe, linea, code, description, information_of_interest, "
                           "quantity, unit_price, unit_discount, amount, itbms, total, date) "
                           "VALUES ($1, $2, $3, $4, $5, $6, $7, $8, $9, $10, $11, $12, $13)",
                           {d.partkey,
                            d.cufe,
                            d.linea,
                            d.code,
                            d.description,
                            d.information_of_interest,
                            decimalParam(d.quantity),
                            decimalParam(d.unit_price),
                            decimalParam(d.unit_discount),
                            decimalParam(d.amount),
                            decimalParam(d.itbms),
                            decimalParam(d.total),
                            InvoiceUtils::formatInvoiceDate(d.date)});
        }

        static Result<void, ErrorResult> insertPayment(PgTransaction &tx, const domain::InvoicePayment &p)
        {
            return command(tx,
                           "INSERT INTO invoice_payment (cufe, forma_de_pago, valor_pago, vuelto, total_pagado) "
                           "VALUES ($1, $2, $3, $4, $5)",
                           {p.cufe,
                            p.forma_de_pago,
                            decimalParam(p.valor_pago),
                            decimalParam(p.vuelto),
                            decimalParam(p.total_pagado)});
        }

        std::shared_ptr<PgConnectionPool> pool_;
        int transaction_timeout_ms_;
    };

} // namespace invoice::infrastructure::storage
