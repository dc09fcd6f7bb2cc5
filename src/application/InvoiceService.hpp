#pragma once

#include <exception>
#include <memory>
#include <optional>
#include <string>
#include <loguru.hpp>

#include "application/InvoiceNormalizer.hpp"
#include "domain/IDocumentFetcher.hpp"
#include "domain/IFieldExtractor.hpp"
#include "domain/IInvoiceRepository.hpp"
#include "domain/IPendingRecoveryStore.hpp"
#include "domain/InvoiceDataStructure.hpp"
#include "domain/Result.hpp"
#include "utils/LogHelper.hpp"

namespace invoice::application
{
    using invoice::domain::ExistingInvoice;
    using invoice::domain::FetchedDocument;
    using invoice::domain::IDocumentFetcher;
    using invoice::domain::IFieldExtractor;
    using invoice::domain::IInvoiceRepository;
    using invoice::domain::InvoiceSummary;
    using invoice::domain::IPendingRecoveryStore;
    using invoice::domain::OutcomeKind;
    using invoice::domain::PendingRecoveryEntry;
    using invoice::domain::ProcessingOutcome;

    using InvoiceRepository = IInvoiceRepository<InvoiceRecord, ErrorResult>;

    // pending_recovery.error_message 前綴，補登作業依此分流
    constexpr const char *kScrapingErrorPrefix = "Scraping error: ";
    constexpr const char *kSaveErrorPrefix = "Save error: ";

    /**
     * @brief 單次提交的處理流程
     * @details Fetching -> Extracting -> Normalizing -> DeduplicationCheck -> Persisting。
     *          每次呼叫必定回傳 Committed / Duplicate / FallbackPending 其中之一，不向外拋出例外。
     *          本身不持有可變狀態，可由多個工作執行緒同時呼叫。
     */
    class InvoiceService
    {
    public:
        InvoiceService(std::shared_ptr<IDocumentFetcher> fetcher,
                       std::shared_ptr<IFieldExtractor> extractor,
                       std::shared_ptr<InvoiceNormalizer> normalizer,
                       std::shared_ptr<InvoiceRepository> repository,
                       std::shared_ptr<IPendingRecoveryStore> recovery)
            : fetcher_(std::move(fetcher)),
              extractor_(std::move(extractor)),
              normalizer_(std::move(normalizer)),
              repository_(std::move(repository)),
              recovery_(std::move(recovery)) {}

        // 建立資料庫連線
        Result<void, ErrorResult> initialize()
        {
            if (!fetcher_ || !extractor_ || !normalizer_ || !repository_ || !recovery_)
            {
                LOG_F(ERROR, "InvoiceService::initialize: missing collaborator");
                return Result<void, ErrorResult>::Err(
                    ErrorResult{ErrorCode::InternalError, "InvoiceService constructed with a null collaborator"});
            }

            LOG_F(INFO, "InvoiceService::initialize: Initializing repository...");
            auto init = repository_->init();
            if (init.is_err())
            {
                LOG_F(ERROR, "InvoiceService::initialize: Repository initialization failed: %s", init.unwrap_err().message.c_str());
                return init;
            }
            LOG_F(INFO, "InvoiceService::initialize: Repository initialized successfully.");
            return Result<void, ErrorResult>::Ok();
        }

        ProcessingOutcome process(const SubmissionRequest &request) const
        {
            try
            {
                return run(request);
            }
            catch (const std::exception &e)
            {
                LOG_SUB(request, ERROR, "unexpected exception: %s", e.what());
                return fallback(request, std::string(kScrapingErrorPrefix) +
                                             domain::errorCodeName(ErrorCode::UnexpectedError) + ": " + e.what());
            }
        }

    private:
        ProcessingOutcome run(const SubmissionRequest &request) const
        {
            // === Fetching ===
            LOG_SUB(request, 1, "state=Fetching");
            auto fetched = fetcher_->fetch(request.url);
            if (fetched.is_err())
                return scrapingFailure(request, "fetch", fetched.unwrap_err());
            const FetchedDocument &document = fetched.unwrap();

            // === Extracting ===
            LOG_SUB(request, 1, "state=Extracting final_url=%s", document.final_url.c_str());
            auto extracted = extractor_->extract(document.body, document.final_url);
            if (extracted.is_err())
                return scrapingFailure(request, "extract", extracted.unwrap_err());

            // === Normalizing ===
            LOG_SUB(request, 1, "state=Normalizing");
            auto normalized = normalizer_->normalize(extracted.unwrap(), request, document.final_url);
            if (normalized.is_err())
                return scrapingFailure(request, "normalize", normalized.unwrap_err());
            const InvoiceRecord &record = normalized.unwrap();

            // === DeduplicationCheck ===
            LOG_SUB(request, 1, "state=DeduplicationCheck cufe=%s", record.header.cufe.c_str());
            auto existing = repository_->findByCufe(record.header.cufe);
            if (existing.is_err())
                return saveFailure(request, record, existing.unwrap_err());
            if (existing.unwrap())
                return duplicate(request, record, existing.unwrap());

            // === Persisting ===
            LOG_SUB(request, 1, "state=Persisting cufe=%s", record.header.cufe.c_str());
            auto persisted = repository_->persist(record);
            if (persisted.is_err())
            {
                const ErrorResult &error = persisted.unwrap_err();
                // 並行提交同一張發票時，唯一鍵衝突與事先查到重複視為相同結果
                if (error.code == ErrorCode::DuplicateInvoice)
                {
                    LOG_SUB(request, INFO, "unique constraint hit for cufe=%s, treating as duplicate", record.header.cufe.c_str());
                    return duplicate(request, record, lookupExisting(record.header.cufe));
                }
                return saveFailure(request, record, error);
            }

            return committed(request, record);
        }

        ProcessingOutcome committed(const SubmissionRequest &request, const InvoiceRecord &record) const
        {
            ProcessingOutcome outcome;
            outcome.kind = OutcomeKind::Committed;
            outcome.cufe = record.header.cufe;
            outcome.anomalies = record.anomalies;

            InvoiceSummary summary;
            summary.cufe = record.header.cufe;
            summary.no = record.header.no;
            summary.issuer_name = record.header.issuer_name;
            summary.tot_amount = record.header.tot_amount;
            summary.tot_itbms = record.header.tot_itbms;
            summary.detail_count = record.details.size();
            outcome.summary = summary;

            LOG_SUB(request, INFO, "outcome=Committed cufe=%s issuer=%s total=%s details=%zu",
                    summary.cufe.c_str(), summary.issuer_name.c_str(), summary.tot_amount.toString().c_str(), summary.detail_count);
            for (const auto &anomaly : record.anomalies)
            {
                LOG_SUB(request, WARNING, "committed with anomaly: %s", anomaly.c_str());
            }
            return outcome;
        }

        ProcessingOutcome duplicate(const SubmissionRequest &request, const InvoiceRecord &record,
                                    const std::optional<ExistingInvoice> &existing) const
        {
            ProcessingOutcome outcome;
            outcome.kind = OutcomeKind::Duplicate;
            outcome.cufe = record.header.cufe;
            outcome.existing = existing;
            outcome.reason = "invoice already registered";

            LOG_SUB(request, INFO, "outcome=Duplicate cufe=%s registered_by=%s at %s",
                    record.header.cufe.c_str(),
                    existing ? existing->user_id.c_str() : "?",
                    existing ? existing->process_date.c_str() : "?");
            return outcome;
        }

        // 唯一鍵衝突後補查既有資料，查不到時只回報 cufe
        std::optional<ExistingInvoice> lookupExisting(const std::string &cufe) const
        {
            auto existing = repository_->findByCufe(cufe);
            if (existing.is_err())
            {
                LOG_F(WARNING, "InvoiceService: lookup after unique violation failed for %s: %s",
                      cufe.c_str(), existing.unwrap_err().message.c_str());
                return std::nullopt;
            }
            return existing.unwrap();
        }

        ProcessingOutcome scrapingFailure(const SubmissionRequest &request, const char *stage, const ErrorResult &error) const
        {
            LOG_SUB(request, WARNING, "%s failed: %s: %s", stage, domain::errorCodeName(error.code), error.message.c_str());
            return fallback(request, std::string(kScrapingErrorPrefix) + domain::errorCodeName(error.code) + ": " + error.message);
        }

        ProcessingOutcome saveFailure(const SubmissionRequest &request, const InvoiceRecord &record, const ErrorResult &error) const
        {
            LOG_SUB(request, ERROR, "save failed for cufe=%s: %s: %s",
                    record.header.cufe.c_str(), domain::errorCodeName(error.code), error.message.c_str());
            ProcessingOutcome outcome = fallback(request, std::string(kSaveErrorPrefix) + domain::errorCodeName(error.code) + ": " +
                                                              error.message + " | invoice: " + record.describe());
            outcome.cufe = record.header.cufe;
            outcome.anomalies = record.anomalies;
            return outcome;
        }

        /**
         * @brief 寫入 pending_recovery 並回傳 FallbackPending
         * @details 補登寫入本身失敗時仍回傳 FallbackPending，pending_id 為空並記 ERROR
         */
        ProcessingOutcome fallback(const SubmissionRequest &request, const std::string &reason) const
        {
            PendingRecoveryEntry entry;
            entry.url = request.url;
            entry.chat_id = request.chat_id;
            entry.reception_date = request.reception_date;
            if (!request.user_id.empty())
                entry.user_id = request.user_id;
            entry.error_message = reason;
            entry.origin = request.origin;
            entry.ws_id = request.ws_id;

            ProcessingOutcome outcome;
            outcome.kind = OutcomeKind::FallbackPending;
            outcome.reason = reason;

            auto inserted = recovery_->insert(entry);
            if (inserted.is_err())
            {
                LOG_SUB(request, ERROR, "pending_recovery write failed: %s (lost reason: %s)",
                        inserted.unwrap_err().message.c_str(), reason.c_str());
            }
            else
            {
                outcome.pending_id = inserted.unwrap();
            }

            LOG_SUB(request, WARNING, "outcome=FallbackPending pending_id=%lld reason=%s",
                    outcome.pending_id ? static_cast<long long>(*outcome.pending_id) : -1LL, reason.c_str());
            return outcome;
        }

        std::shared_ptr<IDocumentFetcher> fetcher_;
        std::shared_ptr<IFieldExtractor> extractor_;
        std::shared_ptr<InvoiceNormalizer> normalizer_;
        std::shared_ptr<InvoiceRepository> repository_;
        std::shared_ptr<IPendingRecoveryStore> recovery_;
    };

} // namespace invoice::application
