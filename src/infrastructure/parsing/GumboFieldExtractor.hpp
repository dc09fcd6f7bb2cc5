#pragma once

#include <set>
#include <string>
#include <vector>
#include <boost/algorithm/string.hpp>
#include <loguru.hpp>
#include "domain/IFieldExtractor.hpp"
#include "domain/InvoiceDataStructure.hpp"
#include "domain/Result.hpp"
#include "infrastructure/parsing/HtmlDocument.hpp"
#include "utils/InvoiceUtils.hpp"

namespace invoice::infrastructure::parsing
{
    using invoice::domain::ExtractedData;
    using invoice::domain::FieldMap;
    using invoice::utils::InvoiceUtils;

    /**
     * @brief 從 DGI 發票確認頁擷取欄位
     * @details 以結構錨點定位 (標題文字、class、data-title)，只輸出字串欄位。
     *          除了頁面是錯誤頁或找不到 FACTURA 標題之外，缺少的欄位都不視為失敗，
     *          必填與否由 InvoiceNormalizer 決定。
     */
    class GumboFieldExtractor : public invoice::domain::IFieldExtractor
    {
    public:
        GumboFieldExtractor() = default;
        ~GumboFieldExtractor() override = default;

        Result<ExtractedData, ErrorResult> extract(const std::string &html, const std::string &final_url) override
        {
            using R = Result<ExtractedData, ErrorResult>;
            try
            {
                auto parsed = HtmlDocument::parse(html);
                if (parsed.is_err())
                    return R::Err(parsed.unwrap_err());
                const HtmlDocument &document = parsed.unwrap();
                const GumboNode *root = document.root();

                if (auto portal_error = detectPortalError(root))
                {
                    return R::Err(ErrorResult{ErrorCode::ExtractionFailed, "portal error page: " + *portal_error});
                }

                const GumboNode *anchor = findInvoiceAnchor(root);
                if (!anchor)
                {
                    return R::Err(ErrorResult{ErrorCode::ExtractionFailed,
                                              "document does not match invoice template: no FACTURA heading"});
                }

                ExtractedData data;
                extractNumberAndDate(anchor, data.header);
                extractCufe(root, final_url, data.header);
                extractPanel(root, "EMISOR", "emisor", data.header);
                extractPanel(root, "RECEPTOR", "receptor", data.header);
                extractTotals(root, data.header);
                extractPayments(root, data);
                extractLineItems(root, data.details);

                LOG_F(INFO, "GumboFieldExtractor: %zu header fields, %zu detail lines, %zu payment lines",
                      data.header.size(), data.details.size(), data.payments.size());
                if (data.details.empty())
                    LOG_F(WARNING, "GumboFieldExtractor: no detail rows found for %s", final_url.c_str());

                return R::Ok(std::move(data));
            }
            catch (const std::exception &e)
            {
                return R::Err(ErrorResult{ErrorCode::ExtractionFailed, std::string("extraction crashed: ") + e.what()});
            }
        }

    private:
        /**
         * @brief 判斷是否為 MEF 入口網站的錯誤頁
         * @return 錯誤訊息；正常頁面回傳 std::nullopt
         */
        static std::optional<std::string> detectPortalError(const GumboNode *root)
        {
            static const char *kAlertClasses[] = {"alert-danger", "alert-warning", "alert-error",
                                                  "error-message", "validation-summary-errors"};
            static const char *kMessageIds[] = {"validacionMensajeCriterioResultado", "cuerpoVentanaMensajes"};
            static const char *kErrorPhrases[] = {
                "factura no encontrada", "cufe no encontrado", "documento no existe", "no se pudo procesar",
                "acceso denegado", "access denied", "error interno", "internal server error",
                "servicio no disponible", "service unavailable", "sesion expirada", "session expired",
                "servidor no disponible", "error de conexion", "request timeout"};

            for (const char *cls : kAlertClasses)
            {
                for (const GumboNode *node : HtmlDocument::findAll(root, [cls](const GumboNode *n)
                                                                   { return HtmlDocument::hasClass(n, cls); }))
                {
                    std::string message = HtmlDocument::text(node);
                    if (!message.empty())
                        return message;
                }
            }

            for (const char *id : kMessageIds)
            {
                const GumboNode *node = HtmlDocument::findFirst(root, [id](const GumboNode *n)
                                                                { return HtmlDocument::attribute(n, "id") == std::optional<std::string>(id); });
                if (node)
                {
                    std::string message = HtmlDocument::text(node);
                    if (!message.empty())
                        return message;
                }
            }

            const std::string all_text = boost::algorithm::to_lower_copy(InvoiceUtils::foldLabel(HtmlDocument::text(root)));
            for (const char *phrase : kErrorPhrases)
            {
                if (all_text.find(phrase) != std::string::npos)
                    return std::string("detected error phrase: ") + phrase;
            }

            if (all_text.size() < 500 && all_text.find("factura") == std::string::npos)
                return std::string("document too short or missing invoice content");

            return std::nullopt;
        }

        static const GumboNode *findInvoiceAnchor(const GumboNode *root)
        {
            return HtmlDocument::findFirst(root, [](const GumboNode *n)
                                           { return HtmlDocument::isTag(n, GUMBO_TAG_H4) &&
                                                    boost::algorithm::contains(InvoiceUtils::foldLabel(HtmlDocument::text(n)), "FACTURA"); });
        }

        // 新增欄位；空值不寫入，已存在的欄位不覆蓋
        static void put(FieldMap &fields, const std::string &key, const std::string &value)
        {
            if (!value.empty())
                fields.emplace(key, value);
        }

        /**
         * @brief FACTURA 標題往上最多 3 層找 class 含 "row" 的容器，在其 h5 中取發票號碼與日期
         */
        static void extractNumberAndDate(const GumboNode *anchor, FieldMap &header)
        {
            const GumboNode *row = nullptr;
            const GumboNode *current = HtmlDocument::parent(anchor);
            for (int level = 0; level < 3 && current; ++level)
            {
                if (HtmlDocument::isElement(current) && HtmlDocument::classContains(current, "row"))
                {
                    row = current;
                    break;
                }
                current = HtmlDocument::parent(current);
            }
            if (!row)
            {
                LOG_F(WARNING, "GumboFieldExtractor: FACTURA heading has no row container");
                return;
            }

            for (const GumboNode *h5 : HtmlDocument::findAllTags(row, GUMBO_TAG_H5))
            {
                const std::string text = HtmlDocument::text(h5);
                if (header.count("no") == 0)
                {
                    if (auto number = invoiceNumber(text))
                        put(header, "no", *number);
                }
                if (header.count("date") == 0)
                {
                    if (auto date = invoiceDate(text))
                        put(header, "date", *date);
                }
            }
        }

        // "No. 0031157014" 或單獨的 10 位數字
        static std::optional<std::string> invoiceNumber(const std::string &text)
        {
            const std::string upper = boost::algorithm::to_upper_copy(text);
            const auto pos = upper.find("NO.");
            if (pos != std::string::npos)
            {
                std::string digits = boost::algorithm::trim_copy(text.substr(pos + 3));
                boost::algorithm::erase_all(digits, " ");
                if (InvoiceUtils::isAllDigits(digits))
                    return digits;
                return std::nullopt;
            }
            if (text.size() == 10 && InvoiceUtils::isAllDigits(text))
                return text;
            return std::nullopt;
        }

        // DD/MM/YYYY [HH:MM:SS]，只有日期時補上 00:00:00
        static std::optional<std::string> invoiceDate(const std::string &text)
        {
            std::vector<std::string> parts;
            boost::algorithm::split(parts, text, boost::algorithm::is_space(), boost::algorithm::token_compress_on);
            if (parts.empty() || parts.size() > 2)
                return std::nullopt;

            std::vector<std::string> date_segments;
            boost::algorithm::split(date_segments, parts[0], boost::algorithm::is_any_of("/"));
            if (date_segments.size() != 3 || date_segments[0].size() != 2 || date_segments[1].size() != 2 ||
                date_segments[2].size() != 4)
                return std::nullopt;
            for (const auto &segment : date_segments)
            {
                if (!InvoiceUtils::isAllDigits(segment))
                    return std::nullopt;
            }

            if (parts.size() == 1)
                return parts[0] + " 00:00:00";

            std::vector<std::string> time_segments;
            boost::algorithm::split(time_segments, parts[1], boost::algorithm::is_any_of(":"));
            if (time_segments.size() != 3)
                return std::nullopt;
            for (const auto &segment : time_segments)
            {
                if (segment.size() != 2 || !InvoiceUtils::isAllDigits(segment))
                    return std::nullopt;
            }
            return parts[0] + " " + parts[1];
        }

        /**
         * @brief CUFE: dt 含 "CUFE" 之後的 dd，值以 FE 開頭且長度超過 50；頁面沒有時改用最終 URL 的 chFE 參數
         */
        static void extractCufe(const GumboNode *root, const std::string &final_url, FieldMap &header)
        {
            for (const GumboNode *dt : HtmlDocument::findAllTags(root, GUMBO_TAG_DT))
            {
                if (!boost::algorithm::contains(InvoiceUtils::foldLabel(HtmlDocument::text(dt)), "CUFE"))
                    continue;
                for (const GumboNode *sibling : HtmlDocument::followingSiblings(dt))
                {
                    if (!HtmlDocument::isTag(sibling, GUMBO_TAG_DD))
                        continue;
                    std::string value = HtmlDocument::text(sibling);
                    boost::algorithm::erase_all(value, " ");
                    if (boost::algorithm::starts_with(value, "FE") && value.size() > 50)
                    {
                        put(header, "cufe", value);
                        header.emplace("cufe_source", "document");
                        return;
                    }
                }
            }

            if (auto from_url = InvoiceUtils::queryParameter(final_url, "chFE"))
            {
                LOG_F(INFO, "GumboFieldExtractor: CUFE taken from URL parameter chFE");
                put(header, "cufe", boost::algorithm::trim_copy(*from_url));
                header.emplace("cufe_source", "url");
            }
        }

        // 面板標籤 -> 欄位後綴
        static std::string panelFieldName(const std::string &label)
        {
            std::string key = InvoiceUtils::foldLabel(label);
            boost::algorithm::trim_right_if(key, boost::algorithm::is_any_of(":"));
            boost::algorithm::trim(key);

            if (key == "NOMBRE" || key == "RAZON SOCIAL")
                return "name";
            if (key == "RUC" || key == "CEDULA DE IDENTIDAD" || key == "CEDULA")
                return "ruc";
            if (key == "DV")
                return "dv";
            if (key == "DIRECCION")
                return "address";
            if (key == "TELEFONO")
                return "phone";

            boost::algorithm::to_lower(key);
            boost::algorithm::replace_all(key, " ", "_");
            return key;
        }

        /**
         * @brief EMISOR / RECEPTOR 面板: panel-heading 之後的 panel-body 內 dt/dd 成對
         * @param title 面板標題關鍵字 (大寫)
         * @param role 欄位前綴 (emisor / receptor)
         */
        static void extractPanel(const GumboNode *root, const std::string &title, const std::string &role, FieldMap &header)
        {
            for (const GumboNode *heading : HtmlDocument::findAll(root, [](const GumboNode *n)
                                                                  { return HtmlDocument::isTag(n, GUMBO_TAG_DIV) && HtmlDocument::classContains(n, "panel-heading"); }))
            {
                if (!boost::algorithm::contains(InvoiceUtils::foldLabel(HtmlDocument::text(heading)), title))
                    continue;

                for (const GumboNode *sibling : HtmlDocument::followingSiblings(heading))
                {
                    if (!HtmlDocument::classContains(sibling, "panel-body"))
                        continue;

                    for (const GumboNode *dt : HtmlDocument::findAllTags(sibling, GUMBO_TAG_DT))
                    {
                        const GumboNode *dd = HtmlDocument::nextElementSibling(dt);
                        if (!HtmlDocument::isTag(dd, GUMBO_TAG_DD))
                            continue;
                        const std::string suffix = panelFieldName(HtmlDocument::text(dt));
                        if (suffix.empty())
                            continue;
                        put(header, role + "_" + suffix, HtmlDocument::text(dd));
                    }
                    break;
                }
            }
        }

        /**
         * @brief 合計區: td.text-right 內文字含標籤，值為第一個 div
         */
        static void extractTotals(const GumboNode *root, FieldMap &header)
        {
            for (const GumboNode *td : HtmlDocument::findAll(root, [](const GumboNode *n)
                                                             { return HtmlDocument::isTag(n, GUMBO_TAG_TD) && HtmlDocument::hasClass(n, "text-right"); }))
            {
                const GumboNode *div = HtmlDocument::findFirst(td, [](const GumboNode *n)
                                                               { return HtmlDocument::isTag(n, GUMBO_TAG_DIV); });
                if (!div)
                    continue;

                const std::string label = InvoiceUtils::foldLabel(HtmlDocument::text(td));
                const std::string value = HtmlDocument::text(div);
                if (boost::algorithm::contains(label, "VALOR TOTAL:"))
                    put(header, "tot_amount", value);
                else if (boost::algorithm::contains(label, "ITBMS TOTAL:"))
                    put(header, "tot_itbms", value);
                else if (boost::algorithm::contains(label, "VUELTO:"))
                    put(header, "vuelto", value);
                else if (boost::algorithm::contains(label, "TOTAL PAGADO:"))
                    put(header, "total_pagado", value);
            }
        }

        // 付款方式標籤 -> forma_de_pago，無法辨識時回傳空字串
        static std::string paymentMethod(const std::string &label)
        {
            using boost::algorithm::contains;
            if (contains(label, "EFECTIVO:"))
                return "Efectivo";
            if (contains(label, "TARJETA CLAVE"))
                return "Tarjeta Clave";
            if (contains(label, "TARJETA") && contains(label, "CREDITO"))
                return "Tarjeta Cr\xC3\xA9" "dito";
            if (contains(label, "TARJETA") && contains(label, "DEBITO"))
                return "Tarjeta D\xC3\xA9" "bito";
            if (contains(label, "CHEQUE:"))
                return "Cheque";
            if (contains(label, "TRANSFERENCIA:"))
                return "Transferencia";
            if (contains(label, "ACH:"))
                return "ACH";
            if (contains(label, "OTRO:"))
                return "Otro";
            return "";
        }

        /**
         * @brief tfoot 每一列的第一個 td 為付款方式，一種方式產生一行 payment
         */
        static void extractPayments(const GumboNode *root, ExtractedData &data)
        {
            for (const GumboNode *tfoot : HtmlDocument::findAllTags(root, GUMBO_TAG_TFOOT))
            {
                for (const GumboNode *tr : HtmlDocument::findAllTags(tfoot, GUMBO_TAG_TR))
                {
                    const GumboNode *td = HtmlDocument::findFirst(tr, [](const GumboNode *n)
                                                                  { return HtmlDocument::isTag(n, GUMBO_TAG_TD); });
                    const GumboNode *div = td ? HtmlDocument::findFirst(td, [](const GumboNode *n)
                                                                        { return HtmlDocument::isTag(n, GUMBO_TAG_DIV); })
                                              : nullptr;
                    if (!div)
                        continue;

                    const std::string value = HtmlDocument::text(div);
                    if (value.empty())
                        continue;

                    const std::string label = InvoiceUtils::foldLabel(HtmlDocument::text(td));
                    const std::string method = paymentMethod(label);
                    if (!method.empty())
                    {
                        data.payments.push_back(FieldMap{{"forma_de_pago", method}, {"valor_pago", value}});
                    }
                    else if (boost::algorithm::contains(label, "TOTAL PAGADO:"))
                    {
                        put(data.header, "total_pagado", value);
                    }
                    else if (boost::algorithm::contains(label, "VUELTO:"))
                    {
                        put(data.header, "vuelto", value);
                    }
                }
            }
        }

        // data-title -> detail 欄位名稱
        static std::string detailFieldName(const std::string &title)
        {
            const std::string key = InvoiceUtils::foldLabel(title);
            if (key == "CANTIDAD")
                return "quantity";
            if (key == "CODIGO")
                return "code";
            if (key == "DESCRIPCION")
                return "description";
            if (key == "DESCUENTO")
                return "unit_discount";
            if (key == "PRECIO")
                return "unit_price";
            if (key == "IMPUESTO")
                return "itbms";
            if (key == "INFORMACION DE INTERES")
                return "information_of_interest";
            if (key == "MONTO")
                return "amount";
            if (key == "TOTAL")
                return "total";
            if (key == "LINEA")
                return "linea";
            return title;
        }

        /**
         * @brief 明細表: div.panel-body.collapse.in 之下 tbody tr，每個 td[data-title] 一個欄位
         */
        static void extractLineItems(const GumboNode *root, std::vector<FieldMap> &details)
        {
            std::set<const GumboNode *> visited;
            auto containers = HtmlDocument::findAll(root, [](const GumboNode *n)
                                                    { return HtmlDocument::isTag(n, GUMBO_TAG_DIV) &&
                                                             HtmlDocument::hasClass(n, "panel-body") &&
                                                             HtmlDocument::hasClass(n, "collapse") &&
                                                             HtmlDocument::hasClass(n, "in"); });

            for (const GumboNode *container : containers)
            {
                for (const GumboNode *tbody : HtmlDocument::findAllTags(container, GUMBO_TAG_TBODY))
                {
                    for (const GumboNode *tr : HtmlDocument::findAllTags(tbody, GUMBO_TAG_TR))
                    {
                        if (!visited.insert(tr).second)
                            continue;

                        FieldMap item;
                        for (const GumboNode *td : HtmlDocument::findAllTags(tr, GUMBO_TAG_TD))
                        {
                            auto title = HtmlDocument::attribute(td, "data-title");
                            if (!title)
                                continue;
                            put(item, detailFieldName(*title), HtmlDocument::text(td));
                        }
                        if (!item.empty())
                            details.push_back(std::move(item));
                    }
                }
            }
        }
    };

} // namespace invoice::infrastructure::parsing
