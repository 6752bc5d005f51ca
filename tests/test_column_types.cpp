// Built without fake_session.hpp so only the headers the normalizer itself
// includes declare the ODBC type codes used here
#include <gtest/gtest.h>
#include "query/result_normalizer.hpp"

using namespace sqlbridge;
using query::ResultNormalizer;

namespace {

core::ColumnDescription typed(SQLSMALLINT type) {
    core::ColumnDescription c;
    c.name = "c";
    c.sql_type = type;
    return c;
}

} // anonymous namespace

TEST(ColumnTypesTest, ExtendedIntegerTypes) {
    EXPECT_EQ(ResultNormalizer::convert_cell(typed(SQL_BIGINT), std::string("9000000000")),
              core::Value(9000000000LL));
    EXPECT_EQ(ResultNormalizer::convert_cell(typed(SQL_TINYINT), std::string("7")), core::Value(7));
    EXPECT_EQ(ResultNormalizer::convert_cell(typed(SQL_BIT), std::string("0")), core::Value(false));
}

TEST(ColumnTypesTest, BinaryTypesDecodeUtf8) {
    for (SQLSMALLINT type : {SQL_BINARY, SQL_VARBINARY, SQL_LONGVARBINARY}) {
        EXPECT_EQ(ResultNormalizer::convert_cell(typed(type), std::string("abc")), core::Value("abc"));
        EXPECT_EQ(ResultNormalizer::convert_cell(typed(type), std::string("\xFF\xFE")),
                  core::Value(query::UNDECODABLE_BINARY));
    }
}
