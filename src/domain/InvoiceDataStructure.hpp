#pragma once

#include <chrono>
#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <vector>
#include "Decimal.hpp"

namespace invoice::domain
{
    using Clock = std::chrono::system_clock;
    using FieldMap = std::map<std::string, std::string>;

    /*  @ Struct Name: ExtractedData
    @ Description:
        * HTML 擷取後的原始欄位，尚未轉型
        - header   : 表頭欄位 (cufe, no, date, emisor_*, receptor_*, tot_amount ...)
        - details  : 每一行商品明細一個 FieldMap
        - payments : 每一種付款方式一個 FieldMap (forma_de_pago, valor_pago)
        - 找不到的欄位不放入 map，不以空字串代替
    */
    struct ExtractedData
    {
        FieldMap header;
        std::vector<FieldMap> details;
        std::vector<FieldMap> payments;

        std::optional<std::string> field(const std::string &name) const
        {
            auto it = header.find(name);
            if (it == header.end())
                return std::nullopt;
            return it->second;
        }
    };

    /*  @ Struct Name: InvoiceDateTime
    @ Description:
        * 發票開立時間 (當地時間，精確到秒)
    */
    struct InvoiceDateTime
    {
        int year = 0;
        int month = 0;
        int day = 0;
        int hour = 0;
        int minute = 0;
        int second = 0;

        bool operator==(const InvoiceDateTime &other) const
        {
            return year == other.year && month == other.month && day == other.day &&
                   hour == other.hour && minute == other.minute && second == other.second;
        }
    };

    // 發票類型，無法判斷時歸類為 GENERIC
    enum class InvoiceType
    {
        QR,
        CUFE,
        GENERIC
    };

    inline const char *invoiceTypeName(InvoiceType type) noexcept
    {
        switch (type)
        {
        case InvoiceType::QR:
            return "QR";
        case InvoiceType::CUFE:
            return "CUFE";
        case InvoiceType::GENERIC:
            return "GENERIC";
        }
        return "GENERIC";
    }

    /*  @ Struct Name: InvoiceHeader
    @ Description:
        * invoice_header 一筆資料，cufe 為自然主鍵
    */
    struct InvoiceHeader
    {
        std::string cufe;
        std::string no;
        InvoiceDateTime date;
        std::string issuer_name;
        std::optional<std::string> issuer_ruc;
        std::optional<std::string> issuer_dv;
        std::optional<std::string> issuer_address;
        std::optional<std::string> issuer_phone;
        std::optional<std::string> receptor_name;
        std::optional<std::string> receptor_ruc;
        Decimal tot_amount;
        Decimal tot_itbms;
        std::string user_id;
        std::string origin;
        std::string url;
        InvoiceType type = InvoiceType::GENERIC;
        Clock::time_point process_date;
        Clock::time_point reception_date;
    };

    /*  @ Struct Name: InvoiceDetail
    @ Description:
        * invoice_detail 一行商品，partkey = cufe + "_" + linea
    */
    struct InvoiceDetail
    {
        std::string partkey;
        std::string cufe;
        std::string linea;
        InvoiceDateTime date;
        std::optional<std::string> code;
        std::optional<std::string> description;
        std::optional<std::string> information_of_interest;
        std::optional<Decimal> quantity;
        std::optional<Decimal> unit_price;
        std::optional<Decimal> unit_discount;
        std::optional<Decimal> amount;
        std::optional<Decimal> itbms;
        std::optional<Decimal> total;
    };

    struct InvoicePayment
    {
        std::string cufe;
        std::optional<std::string> forma_de_pago;
        std::optional<Decimal> valor_pago;
        std::optional<Decimal> vuelto;
        std::optional<Decimal> total_pagado;
    };

    /*  @ Struct Name: InvoiceRecord
    @ Description:
        * 正規化完成的一張發票: 表頭 + 明細 + 付款
        - anomalies 記錄可寫入但需要人工留意的狀況 (例如沒有任何明細)
    */
    struct InvoiceRecord
    {
        InvoiceHeader header;
        std::vector<InvoiceDetail> details;
        std::vector<InvoicePayment> payments;
        std::vector<std::string> anomalies;

        // 寫入失敗時附在 error_message 內，方便人工補登
        std::string describe() const
        {
            std::string text = "cufe=" + header.cufe +
                               ", no=" + header.no +
                               ", issuer=" + header.issuer_name +
                               ", tot_amount=" + header.tot_amount.toString() +
                               ", tot_itbms=" + header.tot_itbms.toString() +
                               ", details=" + std::to_string(details.size()) +
                               ", payments=" + std::to_string(payments.size());
            return text;
        }
    };

    /*  @ Struct Name: SubmissionRequest
    @ Description:
        * 一次提交的輸入: URL 與使用者/頻道識別
    */
    struct SubmissionRequest
    {
        std::string url;
        std::string user_id;
        std::string chat_id;
        std::string ws_id;
        std::string origin;
        Clock::time_point reception_date = Clock::now();
    };

    struct FetchedDocument
    {
        std::string body;
        std::string final_url;
        bool redirected = false;
    };

    // pending_recovery 一筆資料，只新增不修改
    struct PendingRecoveryEntry
    {
        std::string url;
        std::string chat_id;
        Clock::time_point reception_date;
        std::string type_document = "QR_INVOICE";
        std::optional<std::string> user_id;
        std::string error_message;
        std::string origin;
        std::string ws_id;
    };

    // 已存在的發票 (重複提交時回報給呼叫端)
    struct ExistingInvoice
    {
        std::string cufe;
        std::string user_id;
        std::string process_date;
    };

    enum class OutcomeKind
    {
        Committed,
        Duplicate,
        FallbackPending
    };

    inline const char *outcomeKindName(OutcomeKind kind) noexcept
    {
        switch (kind)
        {
        case OutcomeKind::Committed:
            return "Committed";
        case OutcomeKind::Duplicate:
            return "Duplicate";
        case OutcomeKind::FallbackPending:
            return "FallbackPending";
        }
        return "FallbackPending";
    }

    struct InvoiceSummary
    {
        std::string cufe;
        std::string no;
        std::string issuer_name;
        Decimal tot_amount;
        Decimal tot_itbms;
        size_t detail_count = 0;
    };

    /*  @ Struct Name: ProcessingOutcome
    @ Description:
        * 每次提交必定回傳三種結果之一，呼叫端依此組出使用者訊息
        - Committed       : summary 有值
        - Duplicate       : cufe 有值，existing 為已登錄資料 (查得到時)
        - FallbackPending : reason 為帶前綴的錯誤描述，pending_id 為 pending_recovery.id
    */
    struct ProcessingOutcome
    {
        OutcomeKind kind = OutcomeKind::FallbackPending;
        std::string cufe;
        std::optional<InvoiceSummary> summary;
        std::optional<ExistingInvoice> existing;
        std::string reason;
        std::optional<int64_t> pending_id;
        std::vector<std::string> anomalies;
    };

} // namespace invoice::domain
