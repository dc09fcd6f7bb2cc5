#pragma once

#include <string>
#include <vector>
#include <fstream>
#include <mutex>
#include <stdexcept>
#include <nlohmann/json.hpp>
#include <loguru.hpp>
#include "domain/Result.hpp"

namespace invoice::infrastructure::config
{
    using invoice::domain::ErrorCode;
    using invoice::domain::ErrorResult;
    using invoice::domain::Result;

    /*  @ Struct Name: PipelineSettings
    @ Description:
        * pipeline.json 的內容，除 database_url 外皆有預設值
    */
    struct PipelineSettings
    {
        std::string database_url;                                   // libpq conninfo 或 postgresql:// URI
        int fetch_timeout_ms = 30000;                               // 下載頁面逾時
        int transaction_timeout_ms = 10000;                         // 交易 statement_timeout
        int max_redirects = 10;                                     // 最多跟隨幾次轉址
        int worker_threads = 4;                                     // 提交處理執行緒數
        int db_pool_size = 4;                                       // 資料庫連線數
        std::string origin = "WHATSAPP";                            // 預設提交來源
        std::string log_file = "invoice_pipeline.log";              // loguru 輸出檔
        std::vector<std::string> allowed_hosts{"dgi-fep.mef.gob.pa"}; // 空陣列代表不限制
        std::string user_agent = "Mozilla/5.0 (X11; Linux x86_64) invoice-pipeline/1.0";
    };

    class PipelineConfigProvider
    {
    public:
        /**
         * @brief 由 JSON 物件建立設定，檢查必填欄位、型別與數值範圍
         */
        static Result<PipelineSettings, ErrorResult> parse(const nlohmann::json &json)
        {
            using R = Result<PipelineSettings, ErrorResult>;
            if (!json.is_object())
                return R::Err(ErrorResult{ErrorCode::ConfigLoadFailed, "Invalid config format: not a JSON object"});
            if (!json.contains("database_url"))
                return R::Err(ErrorResult{ErrorCode::ConfigLoadFailed, "Missing required config field: database_url"});

            try
            {
                PipelineSettings settings;
                settings.database_url = json.at("database_url").get<std::string>();
                settings.fetch_timeout_ms = json.value("fetch_timeout_ms", settings.fetch_timeout_ms);
                settings.transaction_timeout_ms = json.value("transaction_timeout_ms", settings.transaction_timeout_ms);
                settings.max_redirects = json.value("max_redirects", settings.max_redirects);
                settings.worker_threads = json.value("worker_threads", settings.worker_threads);
                settings.db_pool_size = json.value("db_pool_size", settings.db_pool_size);
                settings.origin = json.value("origin", settings.origin);
                settings.log_file = json.value("log_file", settings.log_file);
                settings.user_agent = json.value("user_agent", settings.user_agent);
                if (json.contains("allowed_hosts"))
                    settings.allowed_hosts = json.at("allowed_hosts").get<std::vector<std::string>>();

                if (settings.database_url.empty())
                    return R::Err(ErrorResult{ErrorCode::ConfigLoadFailed, "database_url must not be empty"});
                if (settings.fetch_timeout_ms <= 0 || settings.transaction_timeout_ms <= 0)
                    return R::Err(ErrorResult{ErrorCode::ConfigLoadFailed, "timeouts must be positive"});
                if (settings.max_redirects < 0)
                    return R::Err(ErrorResult{ErrorCode::ConfigLoadFailed, "max_redirects must not be negative"});
                if (settings.worker_threads <= 0 || settings.db_pool_size <= 0)
                    return R::Err(ErrorResult{ErrorCode::ConfigLoadFailed, "worker_threads and db_pool_size must be positive"});

                return R::Ok(std::move(settings));
            }
            catch (const nlohmann::json::exception &e)
            {
                // 型別錯誤 (type_error) 也走這裡
                return R::Err(ErrorResult{ErrorCode::JsonParseError, std::string("Invalid config value: ") + e.what()});
            }
        }

        // 單次從 JSON 檔載入設定；失敗時不設定 once_flag，可再次呼叫
        inline static bool loadFromFile(const std::string &filePath)
        {
            try
            {
                std::call_once(initFlag_, [&]()
                               {
                                   std::ifstream ifs(filePath);
                                   if (!ifs)
                                   {
                                       throw std::runtime_error("Cannot open config file: " + filePath);
                                   }
                                   auto parsed = parse(nlohmann::json::parse(ifs));
                                   if (parsed.is_err())
                                   {
                                       throw std::runtime_error(parsed.unwrap_err().message);
                                   }
                                   settings_ = parsed.unwrap(); });
                return true;
            }
            catch (const std::exception &e)
            {
                LOG_F(ERROR, "PipelineConfigProvider load failed: %s", e.what());
                return false;
            }
        }

        // 純讀：需先呼叫 loadFromFile()
        inline static const PipelineSettings &settings() noexcept
        {
            return settings_;
        }

    private:
        inline static std::once_flag initFlag_{};
        inline static PipelineSettings settings_{};
    };

} // namespace invoice::infrastructure::config
