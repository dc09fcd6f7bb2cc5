#pragma once

#include <string>
#include "InvoiceDataStructure.hpp"
#include "Result.hpp"

namespace invoice::domain
{
    // 下載發票頁面，跟隨轉址並回傳最終 URL
    class IDocumentFetcher
    {
    public:
        virtual ~IDocumentFetcher() = default;
        virtual Result<FetchedDocument, ErrorResult> fetch(const std::string &url) = 0;
    };

} // namespace invoice::domain
