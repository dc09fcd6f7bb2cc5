#pragma once

#include <optional>
#include <set>
#include <string>
#include <boost/algorithm/string.hpp>
#include <loguru.hpp>
#include "domain/Decimal.hpp"
#include "domain/InvoiceDataStructure.hpp"
#include "domain/Result.hpp"
#include "utils/InvoiceUtils.hpp"

namespace invoice::application
{
    using invoice::domain::Clock;
    using invoice::domain::Decimal;
    using invoice::domain::ErrorCode;
    using invoice::domain::ErrorResult;
    using invoice::domain::ExtractedData;
    using invoice::domain::FieldMap;
    using invoice::domain::InvoiceDetail;
    using invoice::domain::InvoicePayment;
    using invoice::domain::InvoiceRecord;
    using invoice::domain::InvoiceType;
    using invoice::domain::Result;
    using invoice::domain::SubmissionRequest;
    using invoice::utils::InvoiceUtils;

    /**
     * @brief 將 ExtractedData 轉為 InvoiceRecord
     * @details 必填: cufe、emisor_name、no、date、tot_amount；任一缺少即失敗，不做部分寫入。
     *          其餘欄位解析失敗只記 warning 並略過該欄位。
     */
    class InvoiceNormalizer
    {
    public:
        Result<InvoiceRecord, ErrorResult> normalize(const ExtractedData &data,
                                                     const SubmissionRequest &request,
                                                     const std::string &final_url) const
        {
            REQUIRE_FIELD(data, "cufe", "CUFE", cufe);
            REQUIRE_FIELD(data, "emisor_name", "issuer name", issuer_name);
            REQUIRE_FIELD(data, "no", "invoice number", number);
            REQUIRE_FIELD(data, "date", "date", date_text);
            REQUIRE_FIELD(data, "tot_amount", "total", total_text);

            auto date = InvoiceUtils::parseInvoiceDate(date_text);
            if (date.is_err())
            {
                return Result<InvoiceRecord, ErrorResult>::Err(
                    ErrorResult{ErrorCode::NormalizationFailed, "invalid field date: " + date.unwrap_err().message});
            }

            auto total = InvoiceUtils::parseAmount(total_text);
            if (total.is_err())
            {
                return Result<InvoiceRecord, ErrorResult>::Err(
                    ErrorResult{ErrorCode::NormalizationFailed, "invalid field total (tot_amount): " + total.unwrap_err().message});
            }

            InvoiceRecord record;
            auto &header = record.header;
            header.cufe = cufe;
            header.no = number;
            header.date = date.unwrap();
            header.issuer_name = issuer_name;
            header.issuer_ruc = data.field("emisor_ruc");
            header.issuer_dv = data.field("emisor_dv");
            header.issuer_address = data.field("emisor_address");
            header.issuer_phone = data.field("emisor_phone");
            header.receptor_name = data.field("receptor_name");
            header.receptor_ruc = data.field("receptor_ruc");
            header.tot_amount = total.unwrap();
            header.tot_itbms = optionalAmount(data.header, "tot_itbms", "header").value_or(Decimal(0, 2));
            header.user_id = request.user_id;
            header.origin = request.origin;
            header.url = final_url;
            header.type = classify(data, final_url);
            header.process_date = Clock::now();
            header.reception_date = request.reception_date;

            normalizeDetails(data, record);
            normalizePayments(data, record);

            if (record.details.empty())
            {
                record.anomalies.push_back("no detail lines extracted");
                LOG_F(WARNING, "InvoiceNormalizer: invoice %s has no detail lines", cufe.c_str());
            }
            else
            {
                checkDetailTotals(record);
            }

            return Result<InvoiceRecord, ErrorResult>::Ok(std::move(record));
        }

        /**
         * @brief 發票類型: URL 含 FacturasPorQR 為 QR；帶 CUFE 查詢或頁面有 CUFE 區塊為 CUFE；其餘 GENERIC
         */
        static InvoiceType classify(const ExtractedData &data, const std::string &final_url)
        {
            if (boost::algorithm::icontains(final_url, "FacturasPorQR"))
                return InvoiceType::QR;
            if (boost::algorithm::icontains(final_url, "FacturasPorCUFE") ||
                InvoiceUtils::queryParameter(final_url, "chFE") ||
                data.field("cufe_source") == std::optional<std::string>("document"))
                return InvoiceType::CUFE;
            return InvoiceType::GENERIC;
        }

    private:
        // 選填金額欄位；格式錯誤時記 warning 並視為缺少
        static std::optional<Decimal> optionalAmount(const FieldMap &fields, const std::string &name, const char *scope)
        {
            auto it = fields.find(name);
            if (it == fields.end() || boost::algorithm::trim_copy(it->second).empty())
                return std::nullopt;

            auto parsed = InvoiceUtils::parseAmount(it->second);
            if (parsed.is_err())
            {
                LOG_F(WARNING, "InvoiceNormalizer: ignoring %s field %s='%s': %s",
                      scope, name.c_str(), it->second.c_str(), parsed.unwrap_err().message.c_str());
                return std::nullopt;
            }
            return parsed.unwrap();
        }

        static std::optional<std::string> optionalText(const FieldMap &fields, const std::string &name)
        {
            auto it = fields.find(name);
            if (it == fields.end())
                return std::nullopt;
            std::string value = boost::algorithm::trim_copy(it->second);
            if (value.empty())
                return std::nullopt;
            return value;
        }

        static void normalizeDetails(const ExtractedData &data, InvoiceRecord &record)
        {
            const auto &header = record.header;
            std::set<std::string> used_lineas;

            for (size_t index = 0; index < data.details.size(); ++index)
            {
                const FieldMap &fields = data.details[index];

                InvoiceDetail detail;
                detail.cufe = header.cufe;
                detail.date = header.date;
                detail.code = optionalText(fields, "code");
                detail.description = optionalText(fields, "description");
                detail.information_of_interest = optionalText(fields, "information_of_interest");
                detail.quantity = optionalAmount(fields, "quantity", "detail");
                detail.unit_price = optionalAmount(fields, "unit_price", "detail");
                detail.unit_discount = optionalAmount(fields, "unit_discount", "detail");
                detail.amount = optionalAmount(fields, "amount", "detail");
                detail.itbms = optionalAmount(fields, "itbms", "detail");
                detail.total = optionalAmount(fields, "total", "detail");

                if (!detail.description && !detail.amount && !detail.total && !detail.unit_price)
                {
                    LOG_F(WARNING, "InvoiceNormalizer: dropping blank detail line %zu of %s", index + 1, header.cufe.c_str());
                    continue;
                }

                // linea 缺少或重複時改用行序；行序也被佔用時加上 #k，partkey 必須唯一
                std::string linea = optionalText(fields, "linea").value_or(std::to_string(index + 1));
                if (used_lineas.count(linea) != 0)
                    linea = std::to_string(index + 1);
                const std::string base = linea;
                for (int suffix = 2; used_lineas.count(linea) != 0; ++suffix)
                    linea = base + "#" + std::to_string(suffix);
                used_lineas.insert(linea);
                detail.linea = linea;
                detail.partkey = header.cufe + "_" + linea;

                record.details.push_back(std::move(detail));
            }
        }

        // 每行都有 total 時，加總應等於表頭 tot_amount；不符只記 anomaly
        static void checkDetailTotals(InvoiceRecord &record)
        {
            Decimal sum(0, 0);
            for (const auto &detail : record.details)
            {
                if (!detail.total)
                    return;
                auto added = sum.add(*detail.total);
                if (added.is_err())
                    return;
                sum = added.unwrap();
            }

            if (sum != record.header.tot_amount)
            {
                const std::string note = "detail totals " + sum.toString() + " do not match invoice total " +
                                         record.header.tot_amount.toString();
                LOG_F(WARNING, "InvoiceNormalizer: %s: %s", record.header.cufe.c_str(), note.c_str());
                record.anomalies.push_back(note);
            }
        }

        /**
         * @brief 每種付款方式一行，並帶上 vuelto / total_pagado；沒有付款方式但有 vuelto 或 total_pagado 時產生一行
         */
        static void normalizePayments(const ExtractedData &data, InvoiceRecord &record)
        {
            const auto vuelto = optionalAmount(data.header, "vuelto", "payment");
            const auto total_pagado = optionalAmount(data.header, "total_pagado", "payment");

            for (const FieldMap &fields : data.payments)
            {
                InvoicePayment payment;
                payment.cufe = record.header.cufe;
                payment.forma_de_pago = optionalText(fields, "forma_de_pago");
                payment.valor_pago = optionalAmount(fields, "valor_pago", "payment");
                payment.vuelto = vuelto;
                payment.total_pagado = total_pagado;
                record.payments.push_back(std::move(payment));
            }

            if (record.payments.empty() && (vuelto || total_pagado))
            {
                InvoicePayment payment;
                payment.cufe = record.header.cufe;
                payment.vuelto = vuelto;
                payment.total_pagado = total_pagado;
                record.payments.push_back(std::move(payment));
            }
        }
    };

} // namespace invoice::application
