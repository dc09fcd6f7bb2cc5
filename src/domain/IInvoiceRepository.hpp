#pragma once

#include <optional>
#include <string>
#include "InvoiceDataStructure.hpp"
#include "Result.hpp"

namespace invoice::domain
{
    // 發票儲存庫介面
    // 負責查詢 CUFE 是否已登錄，以及以單一交易寫入表頭/明細/付款
    template <typename T, typename E>
    class IInvoiceRepository
    {
    public:
        virtual ~IInvoiceRepository() = default;

        /**
         * @brief 初始化儲存庫 (建立連線)
         * @return 初始化結果
         */
        virtual Result<void, E> init() = 0;

        /**
         * @brief 依 CUFE 查詢已登錄的發票
         * @param cufe 發票唯一碼
         * @return 找到時為 ExistingInvoice，找不到為 std::nullopt
         */
        virtual Result<std::optional<ExistingInvoice>, E> findByCufe(const std::string &cufe) = 0;

        /**
         * @brief 在同一個交易內寫入整張發票，任何一步失敗即全部回滾
         * @details CUFE 唯一性衝突必須回傳 ErrorCode::DuplicateInvoice
         * @param record 正規化完成的發票
         * @return 寫入結果
         */
        virtual Result<void, E> persist(const T &record) = 0;
    };

} // namespace invoice::domain
