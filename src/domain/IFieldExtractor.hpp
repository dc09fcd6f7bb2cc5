#pragma once

#include <string>
#include "InvoiceDataStructure.hpp"
#include "Result.hpp"

namespace invoice::domain
{
    // HTML 欄位擷取介面，只負責取出字串，不做型別轉換
    class IFieldExtractor
    {
    public:
        virtual ~IFieldExtractor() = default;
        virtual Result<ExtractedData, ErrorResult> extract(const std::string &html, const std::string &final_url) = 0;
    };

} // namespace invoice::domain
