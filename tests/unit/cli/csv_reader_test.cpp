/// @file csv_reader_test.cpp
/// @brief Tests for CSV input

#include <cstdio>
#include <fstream>
#include <sstream>

#include <gtest/gtest.h>

#include "cli/csv_reader.h"
#include "common/error.h"

namespace invsense::cli {
namespace {

std::string WriteTempFile(const std::string& name, const std::string& content) {
    const std::string path = ::testing::TempDir() + name;
    std::ofstream out(path, std::ios::binary);
    out << content;
    return path;
}

TEST(CsvRecordTest, SplitsAndTrims) {
    std::istringstream in("a, b ,c\n1,2,3\n");
    bool malformed = false;

    auto header = ParseCsvRecord(in, ',', &malformed);
    EXPECT_FALSE(malformed);
    EXPECT_EQ(header, (std::vector<std::string>{"a", "b", "c"}));

    auto row = ParseCsvRecord(in, ',', &malformed);
    EXPECT_EQ(row, (std::vector<std::string>{"1", "2", "3"}));

    EXPECT_TRUE(ParseCsvRecord(in, ',', &malformed).empty());
}

TEST(CsvRecordTest, QuotedFields) {
    std::istringstream in("\"Texas, US\",\"say \"\"hi\"\"\",\"two\nlines\"\r\nnext");
    auto row = ParseCsvRecord(in, ',', nullptr);
    ASSERT_EQ(row.size(), 3);
    EXPECT_EQ(row[0], "Texas, US");
    EXPECT_EQ(row[1], "say \"hi\"");
    EXPECT_EQ(row[2], "two\nlines");

    auto next = ParseCsvRecord(in, ',', nullptr);
    EXPECT_EQ(next, (std::vector<std::string>{"next"}));
}

TEST(CsvRecordTest, UnterminatedQuote) {
    std::istringstream in("\"open,field");
    bool malformed = false;
    ParseCsvRecord(in, ',', &malformed);
    EXPECT_TRUE(malformed);
}

TEST(CsvRecordTest, AlternateDelimiter) {
    std::istringstream in("a;b;c");
    EXPECT_EQ(ParseCsvRecord(in, ';', nullptr), (std::vector<std::string>{"a", "b", "c"}));
}

TEST(InferColumnTypeTest, Types) {
    EXPECT_EQ(InferColumnType({"1", "2", ""}), data::ColumnType::kInteger);
    EXPECT_EQ(InferColumnType({"1", "2.5"}), data::ColumnType::kFloat);
    EXPECT_EQ(InferColumnType({"1", "Jan-22"}), data::ColumnType::kString);
    EXPECT_EQ(InferColumnType({"", ""}), data::ColumnType::kFloat);
    EXPECT_EQ(InferColumnType({}), data::ColumnType::kFloat);
}

TEST(ReadCsvTest, TypedTable) {
    std::istringstream in(
        "Distributor ID,US States,Months,Waste_Quantity_Sum\n"
        "101,Texas,Jan-22,120.5\n"
        "\n"
        "202,Ohio,Feb-22,\n");

    auto table = ReadCsv(in);
    ASSERT_TRUE(table.ok()) << table.status().message();
    EXPECT_EQ(table->num_rows(), 2);
    ASSERT_EQ(table->num_columns(), 4);

    EXPECT_EQ(table->columns()[0].type, data::ColumnType::kInteger);
    EXPECT_EQ(table->columns()[1].type, data::ColumnType::kString);
    EXPECT_EQ(table->columns()[2].type, data::ColumnType::kString);
    EXPECT_EQ(table->columns()[3].type, data::ColumnType::kFloat);

    EXPECT_EQ(table->IntegerAt(0, 0), 101);
    EXPECT_EQ(table->StringAt(1, 1), "Ohio");
    EXPECT_EQ(table->NumericAt(0, 3), 120.5);
    EXPECT_FALSE(table->NumericAt(1, 3).has_value());
}

TEST(ReadCsvTest, ShortRowsArePadded) {
    std::istringstream in("a,b,c\n1,2\n");
    auto table = ReadCsv(in);
    ASSERT_TRUE(table.ok());
    ASSERT_EQ(table->num_rows(), 1);
    EXPECT_FALSE(table->NumericAt(0, 2).has_value());
}

TEST(ReadCsvTest, ExtraFieldsAreParseError) {
    std::istringstream in("a,b\n1,2,3\n");
    auto table = ReadCsv(in);
    ASSERT_FALSE(table.ok());
    EXPECT_TRUE(HasErrorCode(table.status(), ErrorCode::kParseError));
}

TEST(ReadCsvTest, EmptyInputIsParseError) {
    std::istringstream in("");
    auto table = ReadCsv(in);
    ASSERT_FALSE(table.ok());
    EXPECT_TRUE(HasErrorCode(table.status(), ErrorCode::kParseError));
}

TEST(ReadCsvFileTest, MissingFile) {
    auto table = ReadCsvFile("/nonexistent/invsense/data.csv");
    ASSERT_FALSE(table.ok());
    EXPECT_EQ(table.status().code(), absl::StatusCode::kNotFound);
}

TEST(ReadCsvFileTest, ReadsFromDisk) {
    const std::string path = WriteTempFile("invsense_read.csv", "x,y\n1,2\n3,4\n");
    auto table = ReadCsvFile(path);
    std::remove(path.c_str());

    ASSERT_TRUE(table.ok()) << table.status().message();
    EXPECT_EQ(table->num_rows(), 2);
}

TEST(FeatureImportanceTest, ReadsPairs) {
    const std::string path = WriteTempFile(
        "invsense_importances.csv", "feature,importance\nReturns_Quantity,0.6\nDeliveries,0.4\n");
    auto importances = ReadFeatureImportances(path);
    std::remove(path.c_str());

    ASSERT_TRUE(importances.ok()) << importances.status().message();
    ASSERT_EQ(importances->size(), 2);
    EXPECT_EQ((*importances)[0].feature, "Returns_Quantity");
    EXPECT_DOUBLE_EQ((*importances)[0].importance, 0.6);
}

TEST(FeatureImportanceTest, MissingColumnIsSchemaError) {
    const std::string path = WriteTempFile("invsense_bad_importances.csv", "name,weight\na,1\n");
    auto importances = ReadFeatureImportances(path);
    std::remove(path.c_str());

    ASSERT_FALSE(importances.ok());
    EXPECT_TRUE(HasErrorCode(importances.status(), ErrorCode::kSchemaError));
}

TEST(FeatureImportanceTest, BadImportanceIsParseError) {
    const std::string path = WriteTempFile("invsense_nan_importances.csv",
                                           "feature,importance\na,1\nb,\n");
    auto importances = ReadFeatureImportances(path);
    std::remove(path.c_str());

    ASSERT_FALSE(importances.ok());
    EXPECT_TRUE(HasErrorCode(importances.status(), ErrorCode::kParseError));
}

}  // namespace
}  // namespace invsense::cli
