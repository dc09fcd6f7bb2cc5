#include <gtest/gtest.h>
#include "utils/InvoiceUtils.hpp"
#include <string>

using namespace invoice::utils;
using invoice::domain::ErrorCode;

// ============================================================================
// InvoiceUtils::parseInvoiceDate
// ============================================================================

TEST(ParseInvoiceDateTest, DayComesBeforeMonth)
{
    auto parsed = InvoiceUtils::parseInvoiceDate("15/05/2025 09:50:04");
    ASSERT_TRUE(parsed.is_ok());

    const auto &date = parsed.unwrap();
    EXPECT_EQ(date.year, 2025);
    EXPECT_EQ(date.month, 5);
    EXPECT_EQ(date.day, 15);
    EXPECT_EQ(date.hour, 9);
    EXPECT_EQ(date.minute, 50);
    EXPECT_EQ(date.second, 4);
}

TEST(ParseInvoiceDateTest, TrimsSurroundingWhitespace)
{
    auto parsed = InvoiceUtils::parseInvoiceDate("  01/12/2024 23:59:59 \n");
    ASSERT_TRUE(parsed.is_ok());
    EXPECT_EQ(parsed.unwrap().month, 12);
    EXPECT_EQ(parsed.unwrap().day, 1);
}

TEST(ParseInvoiceDateTest, RejectsImpossibleCalendarDates)
{
    // 05/15 當作 DD/MM 時月份為 15
    EXPECT_TRUE(InvoiceUtils::parseInvoiceDate("05/15/2025 09:50:04").is_err());
    EXPECT_TRUE(InvoiceUtils::parseInvoiceDate("31/02/2025 10:00:00").is_err());
    EXPECT_TRUE(InvoiceUtils::parseInvoiceDate("15/05/2025 24:00:00").is_err());
}

TEST(ParseInvoiceDateTest, RejectsOtherShapes)
{
    EXPECT_TRUE(InvoiceUtils::parseInvoiceDate("").is_err());
    EXPECT_TRUE(InvoiceUtils::parseInvoiceDate("2025-05-15 09:50:04").is_err());
    EXPECT_TRUE(InvoiceUtils::parseInvoiceDate("15/05/2025").is_err());
    EXPECT_TRUE(InvoiceUtils::parseInvoiceDate("5/5/2025 09:50:04").is_err());

    auto err = InvoiceUtils::parseInvoiceDate("15-05-2025 09:50:04");
    ASSERT_TRUE(err.is_err());
    EXPECT_EQ(err.unwrap_err().code, ErrorCode::NormalizationFailed);
}

TEST(FormatInvoiceDateTest, ProducesSqlTimestamp)
{
    auto parsed = InvoiceUtils::parseInvoiceDate("15/05/2025 09:50:04");
    ASSERT_TRUE(parsed.is_ok());
    EXPECT_EQ(InvoiceUtils::formatInvoiceDate(parsed.unwrap()), "2025-05-15 09:50:04");
}

// ============================================================================
// InvoiceUtils::parseAmount
// ============================================================================

TEST(ParseAmountTest, StripsCurrencyAndSeparators)
{
    EXPECT_EQ(InvoiceUtils::parseAmount("B/. 107.00").unwrap().toString(), "107.00");
    EXPECT_EQ(InvoiceUtils::parseAmount("B/.1,107.00").unwrap().toString(), "1107.00");
    EXPECT_EQ(InvoiceUtils::parseAmount("$ 2.68").unwrap().toString(), "2.68");
    EXPECT_EQ(InvoiceUtils::parseAmount("\xC2\xA0" "0.18\n").unwrap().toString(), "0.18");
}

TEST(ParseAmountTest, EmptyOrGarbageIsError)
{
    EXPECT_TRUE(InvoiceUtils::parseAmount("").is_err());
    EXPECT_TRUE(InvoiceUtils::parseAmount("B/.").is_err());
    EXPECT_TRUE(InvoiceUtils::parseAmount("N/A").is_err());
}

// ============================================================================
// 其他
// ============================================================================

TEST(QueryParameterTest, ReadsDecodedValue)
{
    const std::string url = "https://dgi-fep.mef.gob.pa/Consultas/FacturasPorQR?chFE=FE0120000&iAmb=1&digestValue=ab%2Bcd";
    EXPECT_EQ(InvoiceUtils::queryParameter(url, "chFE"), std::optional<std::string>("FE0120000"));
    EXPECT_EQ(InvoiceUtils::queryParameter(url, "digestValue"), std::optional<std::string>("ab+cd"));
    EXPECT_FALSE(InvoiceUtils::queryParameter(url, "missing").has_value());
}

TEST(CollapseWhitespaceTest, CollapsesRunsAndTrims)
{
    EXPECT_EQ(InvoiceUtils::collapseWhitespace("  Lum \n\t Corporation  "), "Lum Corporation");
    EXPECT_EQ(InvoiceUtils::collapseWhitespace("a\xC2\xA0\xC2\xA0" "b"), "a b");
    EXPECT_EQ(InvoiceUtils::collapseWhitespace("   "), "");
}

TEST(FoldLabelTest, RemovesAccentsAndUppercases)
{
    EXPECT_EQ(InvoiceUtils::foldLabel("Tel\xC3\xA9" "fono"), "TELEFONO");
    EXPECT_EQ(InvoiceUtils::foldLabel("C\xC3\x93" "DIGO  \xC3\x9A" "NICO"), "CODIGO UNICO");
    EXPECT_EQ(InvoiceUtils::foldLabel("Descripci\xC3\xB3" "n"), "DESCRIPCION");
}

TEST(IsAllDigitsTest, Basic)
{
    EXPECT_TRUE(InvoiceUtils::isAllDigits("0123"));
    EXPECT_FALSE(InvoiceUtils::isAllDigits(""));
    EXPECT_FALSE(InvoiceUtils::isAllDigits("12a"));
}
