#include "application/InvoiceNormalizer.hpp"
#include "application/InvoiceService.hpp"
#include "infrastructure/config/PipelineConfigProvider.hpp"
#include "infrastructure/network/PocoHttpFetcher.hpp"
#include "infrastructure/parsing/GumboFieldExtractor.hpp"
#include "infrastructure/storage/PgConnectionPool.hpp"
#include "infrastructure/storage/PgInvoiceRepository.hpp"
#include "infrastructure/storage/PgPendingRecoveryStore.hpp"
#include "infrastructure/tasks/SubmissionWorker.hpp"
#include "domain/Result.hpp"
#include <Poco/Net/SSLManager.h>
#include <future>
#include <iostream>
#include <memory>
#include <string>
#include <vector>
#include <loguru.hpp>

using namespace invoice;

namespace
{
    void printUsage(const char *program)
    {
        std::cerr << "usage: " << program
                  << " [--config FILE] [--init] [--user ID] [--chat ID] [--ws ID] [--origin TAG] URL...\n";
    }

    // 每個 URL 一行結果，供呼叫端組成使用者訊息
    void printOutcome(const std::string &url, const domain::ProcessingOutcome &outcome)
    {
        std::cout << domain::outcomeKindName(outcome.kind) << "\t" << url;
        switch (outcome.kind)
        {
        case domain::OutcomeKind::Committed:
            std::cout << "\tcufe=" << outcome.summary->cufe
                      << "\tissuer=" << outcome.summary->issuer_name
                      << "\ttotal=" << outcome.summary->tot_amount.toString()
                      << "\titbms=" << outcome.summary->tot_itbms.toString();
            for (const auto &anomaly : outcome.anomalies)
                std::cout << "\tanomaly=" << anomaly;
            break;
        case domain::OutcomeKind::Duplicate:
            std::cout << "\tcufe=" << outcome.cufe;
            if (outcome.existing)
                std::cout << "\tregistered_at=" << outcome.existing->process_date;
            break;
        case domain::OutcomeKind::FallbackPending:
            std::cout << "\tpending_id=" << (outcome.pending_id ? std::to_string(*outcome.pending_id) : "-")
                      << "\treason=" << outcome.reason;
            break;
        }
        std::cout << "\n";
    }

    // SSL 初始化/釋放
    struct SslScope
    {
        SslScope() { Poco::Net::initializeSSL(); }
        ~SslScope() { Poco::Net::uninitializeSSL(); }
    };
}

int main(int argc, char *argv[])
{
    // Initialize logging
    loguru::init(argc, argv);

    std::string config_path = "pipeline.json";
    bool init_schema = false;
    std::string user_id;
    std::string chat_id;
    std::string ws_id;
    std::string origin;
    std::vector<std::string> urls;

    // 解析命令列參數
    for (int i = 1; i < argc; ++i)
    {
        const std::string arg(argv[i]);
        auto needValue = [&](std::string &target) -> bool
        {
            if (i + 1 >= argc)
            {
                LOG_F(ERROR, "參數 %s 缺少值", arg.c_str());
                return false;
            }
            target = argv[++i];
            return true;
        };

        if (arg == "--init")
        {
            init_schema = true;
            LOG_F(INFO, "偵測到 --init 參數，將建立資料表。");
        }
        else if (arg == "--config" || arg == "--user" || arg == "--chat" || arg == "--ws" || arg == "--origin")
        {
            std::string &target = arg == "--config" ? config_path : arg == "--user" ? user_id
                                                                : arg == "--chat"   ? chat_id
                                                                : arg == "--ws"     ? ws_id
                                                                                    : origin;
            if (!needValue(target))
            {
                printUsage(argv[0]);
                return 1;
            }
        }
        else if (arg.rfind("--", 0) == 0)
        {
            LOG_F(ERROR, "偵測到輸入參數: %s 錯誤", arg.c_str());
            printUsage(argv[0]);
            return 1;
        }
        else
        {
            urls.push_back(arg);
        }
    }

    if (urls.empty() && !init_schema)
    {
        printUsage(argv[0]);
        return 1;
    }

    try
    {
        LOG_F(INFO, "Loading configuration from %s...", config_path.c_str());
        if (!infrastructure::config::PipelineConfigProvider::loadFromFile(config_path))
        {
            LOG_F(ERROR, "Failed to load pipeline configuration");
            std::cerr << "ERROR: Failed to load pipeline configuration from " << config_path << "\n";
            return 1;
        }
        const auto &settings = infrastructure::config::PipelineConfigProvider::settings();
        loguru::add_file(settings.log_file.c_str(), loguru::Append, loguru::Verbosity_MAX);
        LOG_F(INFO, "Configuration loaded: workers=%d db_pool=%d fetch_timeout=%dms tx_timeout=%dms",
              settings.worker_threads, settings.db_pool_size, settings.fetch_timeout_ms, settings.transaction_timeout_ms);

        SslScope ssl;

        auto pool = std::make_shared<infrastructure::storage::PgConnectionPool>(
            settings.database_url, static_cast<size_t>(settings.db_pool_size));
        auto repository = std::make_shared<infrastructure::storage::PgInvoiceRepository>(pool, settings.transaction_timeout_ms);
        auto recovery = std::make_shared<infrastructure::storage::PgPendingRecoveryStore>(pool, settings.transaction_timeout_ms);

        infrastructure::network::PocoHttpFetcher::Options fetch_options;
        fetch_options.timeout_ms = settings.fetch_timeout_ms;
        fetch_options.max_redirects = settings.max_redirects;
        fetch_options.user_agent = settings.user_agent;
        fetch_options.allowed_hosts = settings.allowed_hosts;

        auto service = std::make_shared<application::InvoiceService>(
            std::make_shared<infrastructure::network::PocoHttpFetcher>(fetch_options),
            std::make_shared<infrastructure::parsing::GumboFieldExtractor>(),
            std::make_shared<application::InvoiceNormalizer>(),
            repository,
            recovery);

        auto initResult = service->initialize();
        if (initResult.is_err())
        {
            LOG_F(ERROR, "Failed to initialize Invoice Service: %s", initResult.unwrap_err().message.c_str());
            std::cerr << "ERROR: " << initResult.unwrap_err().message << "\n";
            return 1;
        }

        if (init_schema)
        {
            auto schema = repository->ensureSchema();
            if (schema.is_err())
            {
                LOG_F(ERROR, "Schema creation failed: %s", schema.unwrap_err().message.c_str());
                std::cerr << "ERROR: " << schema.unwrap_err().message << "\n";
                return 1;
            }
        }

        infrastructure::tasks::SubmissionWorker worker(
            [service](const domain::SubmissionRequest &request)
            { return service->process(request); },
            static_cast<size_t>(settings.worker_threads));
        worker.start();

        std::vector<std::future<domain::ProcessingOutcome>> pending;
        for (const auto &url : urls)
        {
            domain::SubmissionRequest request;
            request.url = url;
            request.user_id = user_id;
            request.chat_id = chat_id;
            request.ws_id = ws_id;
            request.origin = origin.empty() ? settings.origin : origin;
            pending.push_back(worker.submit(std::move(request)));
        }

        int fallback_count = 0;
        for (size_t i = 0; i < pending.size(); ++i)
        {
            auto outcome = pending[i].get();
            if (outcome.kind == domain::OutcomeKind::FallbackPending)
                ++fallback_count;
            printOutcome(urls[i], outcome);
        }
        worker.stop();

        LOG_F(INFO, "Processed %zu submissions, %d routed to pending_recovery", urls.size(), fallback_count);
        return fallback_count == 0 ? 0 : 2;
    }
    catch (const std::exception &e)
    {
        LOG_F(ERROR, "Unhandled exception: %s", e.what());
        std::cerr << "FATAL ERROR: " << e.what() << "\n";
        return 1;
    }
}
