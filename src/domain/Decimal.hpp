#pragma once

#include <cstdint>
#include <limits>
#include <string>
#include <string_view>
#include "Result.hpp"

namespace invoice::domain
{
    /*  @ Class Name: Decimal
    @ Description:
        * 定點小數，數值 = units / 10^scale
        - 金額一律以字串解析成 Decimal，不經過 double，避免分位誤差
        - 相等比較依數值而非字面 ("2.680" == "2.68")
    */
    class Decimal
    {
    public:
        static constexpr int kMaxScale = 8;
        static constexpr int kMaxDigits = 18;

        Decimal() = default;
        Decimal(int64_t units, int scale) : units_(units), scale_(scale) {}

        /**
         * @brief 解析十進位字串，格式: [+-]digits[.digits]
         * @details 不接受指數、千分位或貨幣符號；整數與小數位數合計不得超過 18 位
         */
        static Result<Decimal, ErrorResult> parse(std::string_view text)
        {
            using R = Result<Decimal, ErrorResult>;
            if (text.empty())
                return R::Err(ErrorResult{ErrorCode::NormalizationFailed, "decimal: empty input"});

            size_t pos = 0;
            bool negative = false;
            if (text[0] == '-' || text[0] == '+')
            {
                negative = text[0] == '-';
                ++pos;
            }

            int64_t units = 0;
            int digits = 0;
            int scale = 0;
            bool seen_point = false;
            bool seen_digit = false;

            for (; pos < text.size(); ++pos)
            {
                const char c = text[pos];
                if (c == '.')
                {
                    if (seen_point)
                        return R::Err(ErrorResult{ErrorCode::NormalizationFailed,
                                                  "decimal: more than one decimal point in '" + std::string(text) + "'"});
                    seen_point = true;
                    continue;
                }
                if (c < '0' || c > '9')
                    return R::Err(ErrorResult{ErrorCode::NormalizationFailed,
                                              "decimal: invalid character in '" + std::string(text) + "'"});

                seen_digit = true;
                // 前導零不計入有效位數
                if (units != 0 || c != '0')
                    ++digits;
                if (digits > kMaxDigits)
                    return R::Err(ErrorResult{ErrorCode::NormalizationFailed,
                                              "decimal: too many digits in '" + std::string(text) + "'"});
                units = units * 10 + (c - '0');
                if (seen_point)
                    ++scale;
            }

            if (!seen_digit)
                return R::Err(ErrorResult{ErrorCode::NormalizationFailed,
                                          "decimal: no digits in '" + std::string(text) + "'"});
            if (scale > kMaxScale)
                return R::Err(ErrorResult{ErrorCode::NormalizationFailed,
                                          "decimal: too many fractional digits in '" + std::string(text) + "'"});

            return R::Ok(Decimal(negative ? -units : units, scale));
        }

        int64_t units() const noexcept { return units_; }
        int scale() const noexcept { return scale_; }
        bool isZero() const noexcept { return units_ == 0; }

        /**
         * @brief 轉為字串，保留原始小數位數 ("2.68" -> "2.68", "100.00" -> "100.00")
         */
        std::string toString() const
        {
            // uint64_t 避免 INT64_MIN 取負值溢位
            uint64_t magnitude = units_ < 0 ? 0 - static_cast<uint64_t>(units_) : static_cast<uint64_t>(units_);
            std::string digits = std::to_string(magnitude);
            if (scale_ > 0)
            {
                if (digits.size() <= static_cast<size_t>(scale_))
                    digits.insert(0, static_cast<size_t>(scale_) - digits.size() + 1, '0');
                digits.insert(digits.size() - static_cast<size_t>(scale_), 1, '.');
            }
            if (units_ < 0)
                digits.insert(0, 1, '-');
            return digits;
        }

        /**
         * @brief 放大到指定小數位數，溢位時回傳錯誤；不做四捨五入，不允許縮小
         */
        Result<Decimal, ErrorResult> withScale(int scale) const
        {
            using R = Result<Decimal, ErrorResult>;
            if (scale < scale_ || scale > kMaxScale)
                return R::Err(ErrorResult{ErrorCode::InternalError, "decimal: cannot rescale " + toString()});

            int64_t units = units_;
            for (int i = scale_; i < scale; ++i)
            {
                if (units > std::numeric_limits<int64_t>::max() / 10 ||
                    units < std::numeric_limits<int64_t>::min() / 10)
                    return R::Err(ErrorResult{ErrorCode::InternalError, "decimal: overflow rescaling " + toString()});
                units *= 10;
            }
            return R::Ok(Decimal(units, scale));
        }

        /**
         * @brief 加法，結果取兩者較大的小數位數
         */
        Result<Decimal, ErrorResult> add(const Decimal &other) const
        {
            using R = Result<Decimal, ErrorResult>;
            const int scale = scale_ > other.scale_ ? scale_ : other.scale_;
            auto lhs = withScale(scale);
            auto rhs = other.withScale(scale);
            if (lhs.is_err())
                return lhs;
            if (rhs.is_err())
                return rhs;

            const int64_t a = lhs.unwrap().units_;
            const int64_t b = rhs.unwrap().units_;
            if ((b > 0 && a > std::numeric_limits<int64_t>::max() - b) ||
                (b < 0 && a < std::numeric_limits<int64_t>::min() - b))
                return R::Err(ErrorResult{ErrorCode::InternalError, "decimal: overflow adding " + toString() + " and " + other.toString()});
            return R::Ok(Decimal(a + b, scale));
        }

        /**
         * @brief 數值比較，回傳 -1 / 0 / 1
         */
        int compare(const Decimal &other) const
        {
            const int scale = scale_ > other.scale_ ? scale_ : other.scale_;
            auto lhs = withScale(scale);
            auto rhs = other.withScale(scale);
            if (lhs.is_ok() && rhs.is_ok())
            {
                const int64_t a = lhs.unwrap().units_;
                const int64_t b = rhs.unwrap().units_;
                return a < b ? -1 : (a > b ? 1 : 0);
            }
            // 放大溢位代表兩者量級差距極大，直接比較整數部分
            const int64_t int_a = units_ / pow10(scale_);
            const int64_t int_b = other.units_ / pow10(other.scale_);
            return int_a < int_b ? -1 : (int_a > int_b ? 1 : 0);
        }

        bool operator==(const Decimal &other) const { return compare(other) == 0; }
        bool operator!=(const Decimal &other) const { return compare(other) != 0; }
        bool operator<(const Decimal &other) const { return compare(other) < 0; }

    private:
        static int64_t pow10(int n) noexcept
        {
            int64_t value = 1;
            for (int i = 0; i < n; ++i)
                value *= 10;
            return value;
        }

        int64_t units_ = 0;
        int scale_ = 0;
    };

} // namespace invoice::domain
