#pragma once

#include <memory>
#include <string>
#include <vector>
#include <istream>
#include <boost/algorithm/string.hpp>
#include <loguru.hpp>
#include <Poco/Exception.h>
#include <Poco/Timespan.h>
#include <Poco/Timestamp.h>
#include <Poco/URI.h>
#include <Poco/Net/Context.h>
#include <Poco/Net/HTTPClientSession.h>
#include <Poco/Net/HTTPRequest.h>
#include <Poco/Net/HTTPResponse.h>
#include <Poco/Net/HTTPSClientSession.h>
#include <Poco/Net/NetException.h>
#include "domain/IDocumentFetcher.hpp"
#include "domain/Result.hpp"

namespace invoice::infrastructure::network
{
    using invoice::domain::ErrorCode;
    using invoice::domain::ErrorResult;
    using invoice::domain::FetchedDocument;
    using invoice::domain::Result;

    /**
     * @brief 以 Poco HTTP(S)ClientSession 下載發票頁面
     * @details 每次 fetch 各自建立 session，不共用可變狀態，可同時被多個 worker 呼叫。
     *          轉址手動處理，以便取得最終 URL (CUFE 有時只出現在轉址後的 query)。
     */
    class PocoHttpFetcher : public invoice::domain::IDocumentFetcher
    {
    public:
        struct Options
        {
            int timeout_ms = 30000;
            int max_redirects = 10;
            std::string user_agent;
            std::vector<std::string> allowed_hosts; // 空陣列代表不限制
        };

        explicit PocoHttpFetcher(Options options)
            : options_(std::move(options)),
              tls_context_(new Poco::Net::Context(Poco::Net::Context::TLS_CLIENT_USE, "",
                                                  Poco::Net::Context::VERIFY_RELAXED, 9, true)) {}

        ~PocoHttpFetcher() override = default;

        /**
         * @brief 檢查 URL: 必須是 http/https 且有主機；設定了 allowed_hosts 時主機必須在清單內
         */
        static Result<Poco::URI, ErrorResult> validateUrl(const std::string &url, const std::vector<std::string> &allowed_hosts)
        {
            using R = Result<Poco::URI, ErrorResult>;
            try
            {
                Poco::URI uri(boost::algorithm::trim_copy(url));
                const std::string scheme = boost::algorithm::to_lower_copy(uri.getScheme());
                if (scheme != "http" && scheme != "https")
                    return R::Err(ErrorResult{ErrorCode::InvalidUrl, "unsupported scheme '" + uri.getScheme() + "' in " + url});
                if (uri.getHost().empty())
                    return R::Err(ErrorResult{ErrorCode::InvalidUrl, "missing host in " + url});

                if (!allowed_hosts.empty())
                {
                    bool allowed = false;
                    for (const auto &host : allowed_hosts)
                    {
                        if (boost::algorithm::iequals(host, uri.getHost()))
                        {
                            allowed = true;
                            break;
                        }
                    }
                    if (!allowed)
                        return R::Err(ErrorResult{ErrorCode::InvalidUrl, "host '" + uri.getHost() + "' is not an invoice portal: " + url});
                }
                return R::Ok(uri);
            }
            catch (const Poco::SyntaxException &e)
            {
                return R::Err(ErrorResult{ErrorCode::InvalidUrl, "malformed URL " + url + ": " + e.displayText()});
            }
        }

        Result<FetchedDocument, ErrorResult> fetch(const std::string &url) override
        {
            using R = Result<FetchedDocument, ErrorResult>;

            auto validated = validateUrl(url, options_.allowed_hosts);
            if (validated.is_err())
                return R::Err(validated.unwrap_err());

            Poco::URI current = validated.unwrap();
            const Poco::Timestamp started;
            const Poco::Timespan budget(static_cast<Poco::Timespan::TimeDiff>(options_.timeout_ms) * 1000);
            // 整個 fetch (所有轉址、連線、讀取) 共用同一個期限
            const Poco::Timestamp deadline = started + budget.totalMicroseconds();

            try
            {
                for (int hop = 0;; ++hop)
                {
                    auto session = openSession(current);
                    applyDeadline(*session, deadline);

                    std::string target = current.getPathAndQuery();
                    if (target.empty())
                        target = "/";

                    Poco::Net::HTTPRequest request(Poco::Net::HTTPRequest::HTTP_GET, target, Poco::Net::HTTPMessage::HTTP_1_1);
                    request.set("User-Agent", options_.user_agent);
                    request.set("Accept", "text/html,application/xhtml+xml");
                    session->sendRequest(request);

                    Poco::Net::HTTPResponse response;
                    applyDeadline(*session, deadline);
                    std::istream &body_stream = session->receiveResponse(response);
                    const int status = static_cast<int>(response.getStatus());

                    if (isRedirect(status))
                    {
                        const std::string location = response.get("Location", "");
                        if (location.empty())
                            return R::Err(fetchError(url, "redirect " + std::to_string(status) + " without Location header"));
                        if (hop >= options_.max_redirects)
                            return R::Err(fetchError(url, "too many redirects (" + std::to_string(hop) + ")"));

                        Poco::URI next(current);
                        next.resolve(location);
                        auto allowed = validateUrl(next.toString(), options_.allowed_hosts);
                        if (allowed.is_err())
                            return R::Err(fetchError(url, "redirect rejected: " + allowed.unwrap_err().message));
                        LOG_F(INFO, "PocoHttpFetcher: %s -> %s (%d)", current.toString().c_str(), next.toString().c_str(), status);
                        current = next;
                        continue;
                    }

                    if (status < 200 || status >= 300)
                        return R::Err(fetchError(url, "HTTP status " + std::to_string(status) + " " + response.getReason()));

                    const std::string content_type = boost::algorithm::to_lower_copy(response.getContentType());
                    if (!isTextContent(content_type))
                        return R::Err(fetchError(url, "non-text body (" + content_type + ")"));

                    FetchedDocument document;
                    readBody(*session, body_stream, deadline, document.body);
                    document.final_url = current.toString();
                    document.redirected = hop > 0;

                    if (document.redirected)
                        LOG_F(INFO, "PocoHttpFetcher: final URL %s", document.final_url.c_str());
                    else
                        LOG_F(1, "PocoHttpFetcher: no redirection for %s", url.c_str());

                    return R::Ok(std::move(document));
                }
            }
            catch (const Poco::TimeoutException &e)
            {
                return R::Err(fetchError(url, "timeout after " + std::to_string(options_.timeout_ms) + " ms: " + e.displayText()));
            }
            catch (const Poco::Exception &e)
            {
                return R::Err(fetchError(url, e.displayText()));
            }
            catch (const std::exception &e)
            {
                return R::Err(fetchError(url, e.what()));
            }
        }

    private:
        static constexpr Poco::Timestamp::TimeDiff kDeadlineSlackUs = 50000;

        /**
         * @brief 以剩餘時間設定 socket 逾時；期限已過時丟出 TimeoutException
         */
        static void applyDeadline(Poco::Net::HTTPClientSession &session, const Poco::Timestamp &deadline)
        {
            const Poco::Timestamp::TimeDiff remaining = deadline - Poco::Timestamp();
            if (remaining <= 0)
                throw Poco::TimeoutException("fetch deadline exceeded");

            const Poco::Timespan timeout(remaining);
            session.setTimeout(timeout);
            // 已連線的 socket 不會再套用 session 的設定
            if (session.connected())
            {
                session.socket().setReceiveTimeout(timeout);
                session.socket().setSendTimeout(timeout);
            }
        }

        /**
         * @brief 分段讀取 body，每段之前重新計算剩餘時間
         * @details get() 最多觸發一次底層讀取，readsome() 只取已緩衝的資料，
         *          因此慢速逐位元組送出的伺服器也無法超過期限
         */
        static void readBody(Poco::Net::HTTPClientSession &session, std::istream &in,
                             const Poco::Timestamp &deadline, std::string &body)
        {
            char buffer[4096];
            for (;;)
            {
                applyDeadline(session, deadline);
                const int first = in.get();
                if (first == std::char_traits<char>::eof())
                    break;
                body.push_back(static_cast<char>(first));

                std::streamsize got;
                while ((got = in.readsome(buffer, sizeof(buffer))) > 0)
                    body.append(buffer, static_cast<size_t>(got));
            }

            // istream 會吞掉底層例外只留下 badbit
            if (in.bad())
            {
                // socket 逾時可能比期限早幾毫秒觸發
                if (deadline - Poco::Timestamp() < kDeadlineSlackUs)
                    throw Poco::TimeoutException("fetch deadline exceeded while reading body");
                throw Poco::IOException("response body read failed after " + std::to_string(body.size()) + " bytes");
            }
        }

        static bool isRedirect(int status) noexcept
        {
            return status == 301 || status == 302 || status == 303 || status == 307 || status == 308;
        }

        // 未帶 Content-Type 時視為文字
        static bool isTextContent(const std::string &content_type)
        {
            return content_type.empty() ||
                   boost::algorithm::starts_with(content_type, "text/") ||
                   boost::algorithm::contains(content_type, "html") ||
                   boost::algorithm::contains(content_type, "xml");
        }

        static ErrorResult fetchError(const std::string &url, const std::string &cause)
        {
            return ErrorResult{ErrorCode::FetchFailed, "GET " + url + " failed: " + cause};
        }

        std::unique_ptr<Poco::Net::HTTPClientSession> openSession(const Poco::URI &uri) const
        {
            if (boost::algorithm::iequals(uri.getScheme(), "https"))
                return std::make_unique<Poco::Net::HTTPSClientSession>(uri.getHost(), uri.getPort(), tls_context_);
            return std::make_unique<Poco::Net::HTTPClientSession>(uri.getHost(), uri.getPort());
        }

        Options options_;
        Poco::Net::Context::Ptr tls_context_;
    };

} // namespace invoice::infrastructure::network
