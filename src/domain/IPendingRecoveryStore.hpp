#pragma once

#include <cstdint>
#include "InvoiceDataStructure.hpp"
#include "Result.hpp"

namespace invoice::domain
{
    // 失敗提交的補登佇列，只提供新增
    class IPendingRecoveryStore
    {
    public:
        virtual ~IPendingRecoveryStore() = default;

        /**
         * @brief 以獨立交易新增一筆 pending_recovery
         * @return 新資料的 id
         */
        virtual Result<int64_t, ErrorResult> insert(const PendingRecoveryEntry &entry) = 0;
    };

} // namespace invoice::domain
