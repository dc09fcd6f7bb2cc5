#pragma once

#include <variant>
#include <functional>
#include <stdexcept>
#include <string>
#include <type_traits>
#include <utility>
#include <optional>

namespace invoice::domain
{
    /**
     * @brief 全域錯誤碼定義
     */
    enum class ErrorCode
    {
        Ok = 0,                   // 成功
        InvalidUrl,               // URL 格式或主機不合法
        FetchFailed,              // 下載發票頁面失敗 (網路/逾時/狀態碼/非文字內容)
        ExtractionFailed,         // HTML 與發票樣板不符
        NormalizationFailed,      // 必填欄位缺失或無法解析
        DuplicateInvoice,         // CUFE 已存在 (非錯誤，終止狀態)
        PersistenceFailed,        // 交易寫入失敗
        PersistenceTimeout,       // 交易逾時，已回滾
        DatabaseConnectionFailed, // 資料庫連線失敗
        RecoveryWriteFailed,      // pending_recovery 寫入失敗

        ConfigLoadFailed, // 設定檔載入失敗
        JsonParseError,   // JSON 解析錯誤
        InternalError,    // 內部錯誤
        UnexpectedError   // 未知錯誤
    };

    /**
     * @brief 錯誤碼轉成固定字串，寫入 pending_recovery.error_message 時使用
     */
    inline const char *errorCodeName(ErrorCode code) noexcept
    {
        switch (code)
        {
        case ErrorCode::Ok:
            return "Ok";
        case ErrorCode::InvalidUrl:
            return "InvalidUrl";
        case ErrorCode::FetchFailed:
            return "FetchFailed";
        case ErrorCode::ExtractionFailed:
            return "ExtractionFailed";
        case ErrorCode::NormalizationFailed:
            return "NormalizationFailed";
        case ErrorCode::DuplicateInvoice:
            return "DuplicateInvoice";
        case ErrorCode::PersistenceFailed:
            return "PersistenceFailed";
        case ErrorCode::PersistenceTimeout:
            return "PersistenceTimeout";
        case ErrorCode::DatabaseConnectionFailed:
            return "DatabaseConnectionFailed";
        case ErrorCode::RecoveryWriteFailed:
            return "RecoveryWriteFailed";
        case ErrorCode::ConfigLoadFailed:
            return "ConfigLoadFailed";
        case ErrorCode::JsonParseError:
            return "JsonParseError";
        case ErrorCode::InternalError:
            return "InternalError";
        case ErrorCode::UnexpectedError:
            return "UnexpectedError";
        }
        return "UnexpectedError";
    }

    /**
     * @brief 全域錯誤對象，包含錯誤碼與描述
     */
    struct ErrorResult
    {
        ErrorCode code;      // 錯誤碼
        std::string message; // 錯誤描述

        ErrorResult(ErrorCode c, std::string msg)
            : code(c), message(std::move(msg)) {}
    };

    //
    // T != void 的 Result 類
    // Ok / Err 以 variant 的 index 區分，T 與 E 型別相同時也不會混淆
    //
    template <typename T, typename E = ErrorResult>
    class Result
    {
    public:
        using OkType = T;
        using ErrType = E;

    private:
        static constexpr std::size_t kOkIndex = 0;
        static constexpr std::size_t kErrIndex = 1;

        std::variant<T, E> value_;

        template <std::size_t I, typename U>
        constexpr Result(std::in_place_index_t<I> tag, U &&val)
            : value_(tag, std::forward<U>(val)) {}

    public:
        /**
         * @brief 生成成功結果，參數直接用於建構 T
         */
        template <typename U>
        static constexpr Result<T, E> Ok(U &&val)
        {
            return Result<T, E>(std::in_place_index<kOkIndex>, std::forward<U>(val));
        }

        /**
         * @brief 生成失敗結果，參數直接用於建構 E
         */
        template <typename U>
        static constexpr Result<T, E> Err(U &&err)
        {
            return Result<T, E>(std::in_place_index<kErrIndex>, std::forward<U>(err));
        }

        constexpr bool is_ok() const noexcept { return value_.index() == kOkIndex; }
        constexpr bool is_err() const noexcept { return value_.index() == kErrIndex; }

        /**
         * @brief 取得成功值，錯誤狀態下拋出 std::logic_error
         */
        T &unwrap()
        {
            if (!is_ok())
                throw std::logic_error("unwrap() called on Err");
            return std::get<kOkIndex>(value_);
        }

        const T &unwrap() const
        {
            if (!is_ok())
                throw std::logic_error("unwrap() called on Err");
            return std::get<kOkIndex>(value_);
        }

        /**
         * @brief 取得錯誤值，成功狀態下拋出 std::logic_error
         */
        E &unwrap_err()
        {
            if (is_ok())
                throw std::logic_error("unwrap_err() called on Ok");
            return std::get<kErrIndex>(value_);
        }

        const E &unwrap_err() const
        {
            if (is_ok())
                throw std::logic_error("unwrap_err() called on Ok");
            return std::get<kErrIndex>(value_);
        }

        /**
         * @brief 成功時回傳成功值，失敗時回傳預設值
         */
        T unwrap_or(T def) const
        {
            return is_ok() ? std::get<kOkIndex>(value_) : std::move(def);
        }

        /**
         * @brief 對成功值套用映射函數，錯誤原樣傳遞
         */
        template <typename Func>
        auto map(Func &&f) const -> Result<std::invoke_result_t<Func, const T &>, E>
        {
            using U = std::invoke_result_t<Func, const T &>;
            if (is_ok())
                return Result<U, E>::Ok(f(std::get<kOkIndex>(value_)));
            return Result<U, E>::Err(std::get<kErrIndex>(value_));
        }

        /**
         * @brief 對錯誤值套用映射函數，常用於補上前綴描述
         */
        template <typename Func>
        auto map_err(Func &&f) const
            -> Result<T, std::invoke_result_t<Func, const E &>>
        {
            using NewErr = std::invoke_result_t<Func, const E &>;
            if (is_ok())
                return Result<T, NewErr>::Ok(std::get<kOkIndex>(value_));
            return Result<T, NewErr>::Err(std::forward<Func>(f)(std::get<kErrIndex>(value_)));
        }

        /**
         * @brief 僅在成功時呼叫下一步，f 必須回傳 Result<U, E>
         */
        template <typename Func>
        auto and_then(Func &&f) const -> std::invoke_result_t<Func, const T &>
        {
            using ResultType = std::invoke_result_t<Func, const T &>;
            if (is_ok())
                return f(std::get<kOkIndex>(value_));
            return ResultType::Err(std::get<kErrIndex>(value_));
        }

        // 失敗時改走 f 的結果，f 必須回傳 Result<T, E>
        template <typename Func>
        Result or_else(Func &&f) const
        {
            if (is_ok())
                return Result::Ok(std::get<kOkIndex>(value_));
            return f(std::get<kErrIndex>(value_));
        }

        /**
         * @brief 匹配成功和錯誤兩種情形
         */
        template <typename OkFn, typename ErrFn>
        constexpr auto match(OkFn ok_fn, ErrFn err_fn) const -> std::invoke_result_t<OkFn, const T &>
        {
            return is_ok() ? ok_fn(std::get<kOkIndex>(value_)) : err_fn(std::get<kErrIndex>(value_));
        }
    };

    //
    // 特化版本：T = void
    //
    template <typename E>
    class Result<void, E>
    {
        std::optional<E> error_;

    public:
        constexpr Result() = default;
        explicit constexpr Result(E err) : error_(std::move(err)) {}

        static constexpr Result Ok() noexcept { return Result(); }
        static constexpr Result Err(E err) { return Result(std::move(err)); }

        constexpr bool is_ok() const noexcept { return !error_.has_value(); }
        constexpr bool is_err() const noexcept { return error_.has_value(); }

        void unwrap() const
        {
            if (error_.has_value())
                throw std::logic_error("unwrap() called on Err");
        }

        E &unwrap_err()
        {
            if (!error_.has_value())
                throw std::logic_error("unwrap_err() called on Ok");
            return *error_;
        }

        const E &unwrap_err() const
        {
            if (!error_.has_value())
                throw std::logic_error("unwrap_err() called on Ok");
            return *error_;
        }

        template <typename Func>
        auto map_err(Func &&f) const
            -> Result<void, std::invoke_result_t<Func, const E &>>
        {
            using NewErr = std::invoke_result_t<Func, const E &>;
            if (is_ok())
                return Result<void, NewErr>::Ok();
            return Result<void, NewErr>::Err(std::forward<Func>(f)(*error_));
        }

        /**
         * @brief 連續操作，僅在成功時執行下一步
         */
        template <typename Func>
        auto and_then(Func &&f) const -> decltype(f())
        {
            if (is_ok())
                return f();

            using ResultType = decltype(f());
            return ResultType::Err(*error_);
        }

        template <typename OkFn, typename ErrFn>
        constexpr auto match(OkFn ok_fn, ErrFn err_fn) const -> decltype(ok_fn())
        {
            return is_ok() ? ok_fn() : err_fn(*error_);
        }
    };

} // namespace invoice::domain
