#pragma once

#include <algorithm>
#include <cctype>
#include <chrono>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <boost/algorithm/string.hpp>
#include <Poco/DateTime.h>
#include <Poco/DateTimeFormat.h>
#include <Poco/DateTimeFormatter.h>
#include <Poco/DateTimeParser.h>
#include <Poco/Exception.h>
#include <Poco/Timestamp.h>
#include <Poco/URI.h>
#include "domain/Decimal.hpp"
#include "domain/InvoiceDataStructure.hpp"
#include "domain/Result.hpp"

// 從 ExtractedData 取必填欄位，缺少或空白時直接回傳 NormalizationFailed
#define REQUIRE_FIELD(DATA, FIELD_NAME, LABEL, VAR_NAME)                                                      \
    auto OPT_##VAR_NAME = (DATA).field(FIELD_NAME);                                                           \
    if (!OPT_##VAR_NAME || boost::algorithm::trim_copy(*OPT_##VAR_NAME).empty())                              \
    {                                                                                                         \
        return Result<InvoiceRecord, ErrorResult>::Err(                                                       \
            ErrorResult{ErrorCode::NormalizationFailed, "missing mandatory field " LABEL " (" FIELD_NAME ")"}); \
    }                                                                                                         \
    const std::string VAR_NAME = boost::algorithm::trim_copy(*OPT_##VAR_NAME);

namespace invoice::utils
{
    // 發票工具函數
    class InvoiceUtils
    {
    public:
        static constexpr const char *kInvoiceDateFormat = "%d/%m/%Y %H:%M:%S";

        /**
         * @brief 解析頁面上的金額字串為 Decimal
         * @details 先移除 "B/."、"$"、千分位逗號與空白 (含 &nbsp;)，再以定點方式解析
         * @param raw 原始字串，例如 "B/. 1,107.00"
         */
        static inline domain::Result<domain::Decimal, domain::ErrorResult> parseAmount(std::string_view raw)
        {
            std::string cleaned(raw);
            boost::algorithm::erase_all(cleaned, "B/.");
            boost::algorithm::erase_all(cleaned, "\xC2\xA0");
            cleaned.erase(std::remove_if(cleaned.begin(), cleaned.end(), [](unsigned char c)
                                         { return c == '$' || c == ',' || std::isspace(c); }),
                          cleaned.end());

            if (cleaned.empty())
            {
                return domain::Result<domain::Decimal, domain::ErrorResult>::Err(
                    domain::ErrorResult{domain::ErrorCode::NormalizationFailed, "amount is empty: '" + std::string(raw) + "'"});
            }
            return domain::Decimal::parse(cleaned);
        }

        /**
         * @brief 以固定格式 DD/MM/YYYY HH:MM:SS 解析日期
         * @details 每一段的位數都必須正確，不嘗試猜測日/月順序；日曆上不存在的日期視為錯誤
         */
        static inline domain::Result<domain::InvoiceDateTime, domain::ErrorResult> parseInvoiceDate(const std::string &raw)
        {
            using R = domain::Result<domain::InvoiceDateTime, domain::ErrorResult>;
            const std::string text = boost::algorithm::trim_copy(raw);

            // 位置固定: 01/34/6789 12:45:78
            static constexpr std::string_view kShape = "dd/dd/dddd dd:dd:dd";
            bool shape_ok = text.size() == kShape.size();
            for (size_t i = 0; shape_ok && i < kShape.size(); ++i)
            {
                const unsigned char c = static_cast<unsigned char>(text[i]);
                shape_ok = kShape[i] == 'd' ? std::isdigit(c) != 0 : text[i] == kShape[i];
            }
            if (!shape_ok)
            {
                return R::Err(domain::ErrorResult{domain::ErrorCode::NormalizationFailed,
                                                  "date '" + text + "' does not match DD/MM/YYYY HH:MM:SS"});
            }

            auto number = [&text](size_t pos, size_t len)
            { return std::stoi(text.substr(pos, len)); };

            const int day = number(0, 2);
            const int month = number(3, 2);
            const int year = number(6, 4);
            const int hour = number(11, 2);
            const int minute = number(14, 2);
            const int second = number(17, 2);

            if (!Poco::DateTime::isValid(year, month, day, hour, minute, second))
            {
                return R::Err(domain::ErrorResult{domain::ErrorCode::NormalizationFailed,
                                                  "date '" + text + "' is not a valid calendar date"});
            }

            try
            {
                int tzd = 0;
                Poco::DateTime parsed = Poco::DateTimeParser::parse(kInvoiceDateFormat, text, tzd);
                domain::InvoiceDateTime value;
                value.year = parsed.year();
                value.month = parsed.month();
                value.day = parsed.day();
                value.hour = parsed.hour();
                value.minute = parsed.minute();
                value.second = parsed.second();
                return R::Ok(value);
            }
            catch (const Poco::Exception &e)
            {
                return R::Err(domain::ErrorResult{domain::ErrorCode::NormalizationFailed,
                                                  "date '" + text + "' parse error: " + e.displayText()});
            }
        }

        // InvoiceDateTime -> "YYYY-MM-DD HH:MM:SS" (PostgreSQL timestamp 文字格式)
        static inline std::string formatInvoiceDate(const domain::InvoiceDateTime &value)
        {
            Poco::DateTime dt(value.year, value.month, value.day, value.hour, value.minute, value.second);
            return Poco::DateTimeFormatter::format(dt, "%Y-%m-%d %H:%M:%S");
        }

        // system_clock 時間 -> ISO8601 (UTC, 微秒)
        static inline std::string formatTimestamp(domain::Clock::time_point tp)
        {
            const auto micros = std::chrono::duration_cast<std::chrono::microseconds>(tp.time_since_epoch()).count();
            Poco::Timestamp ts(static_cast<Poco::Timestamp::TimeVal>(micros));
            return Poco::DateTimeFormatter::format(ts, Poco::DateTimeFormat::ISO8601_FRAC_FORMAT);
        }

        /**
         * @brief 取得 URL query 參數值 (已解碼)
         * @return 參數不存在或 URL 無法解析時回傳 std::nullopt
         */
        static inline std::optional<std::string> queryParameter(const std::string &url, const std::string &name)
        {
            try
            {
                Poco::URI uri(url);
                for (const auto &param : uri.getQueryParameters())
                {
                    if (param.first == name && !param.second.empty())
                        return param.second;
                }
            }
            catch (const Poco::SyntaxException &)
            {
                return std::nullopt;
            }
            return std::nullopt;
        }

        // 將連續空白 (含換行、&nbsp;) 壓成單一空白並去頭尾
        static inline std::string collapseWhitespace(const std::string &text)
        {
            std::string normalized = boost::algorithm::replace_all_copy(text, "\xC2\xA0", " ");
            std::string result;
            result.reserve(normalized.size());
            bool pending_space = false;
            for (char c : normalized)
            {
                if (std::isspace(static_cast<unsigned char>(c)))
                {
                    pending_space = !result.empty();
                    continue;
                }
                if (pending_space)
                {
                    result.push_back(' ');
                    pending_space = false;
                }
                result.push_back(c);
            }
            return result;
        }

        /**
         * @brief 標籤比對用: 去除西文重音後轉大寫 ("Teléfono" -> "TELEFONO", "CÓDIGO ÚNICO" -> "CODIGO UNICO")
         */
        static inline std::string foldLabel(const std::string &text)
        {
            static const std::pair<const char *, const char *> kAccents[] = {
                {"\xC3\x81", "A"}, {"\xC3\x89", "E"}, {"\xC3\x8D", "I"}, {"\xC3\x93", "O"}, {"\xC3\x9A", "U"}, {"\xC3\x9C", "U"}, {"\xC3\x91", "N"},
                {"\xC3\xA1", "a"}, {"\xC3\xA9", "e"}, {"\xC3\xAD", "i"}, {"\xC3\xB3", "o"}, {"\xC3\xBA", "u"}, {"\xC3\xBC", "u"}, {"\xC3\xB1", "n"}};

            std::string folded = collapseWhitespace(text);
            for (const auto &accent : kAccents)
            {
                boost::algorithm::replace_all(folded, accent.first, accent.second);
            }
            boost::algorithm::to_upper(folded);
            return folded;
        }

        static inline bool isAllDigits(std::string_view text) noexcept
        {
            if (text.empty())
                return false;
            for (char c : text)
            {
                if (!std::isdigit(static_cast<unsigned char>(c)))
                    return false;
            }
            return true;
        }
    };
} // namespace invoice::utils
