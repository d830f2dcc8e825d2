#include "IrtErrors.hh"
#include "IrtTypes.hh"
#include "ResponseData.hh"

#include <sstream>
#include <gtest/gtest.h>

namespace {

RawTable ParseText(const std::string & text, bool drop = true)
{
    std::istringstream in(text);
    return ParseResponseCsv(in, drop);
}

// nrow rows of three items with mixed answers
RawTable MixedTable(int nrow)
{
    RawTable table;
    table.header = {"item1", "item2", "item3"};
    for (int i = 0; i < nrow; i++) {
        if (i % 2 == 0) table.rows.push_back({"1", "0", "1"});
        else table.rows.push_back({"0", "1", "0"});
    }
    return table;
}

} // namespace

TEST(ResponseCsv, DropsRespondentIdColumn)
{
    RawTable table = ParseText("student_id,q1,q2\nS1,1,0\nS2,0,1\n");
    ASSERT_EQ(table.GetNCols(), 2);
    EXPECT_EQ(table.header[0], "q1");
    ASSERT_EQ(table.GetNRows(), 2);
    EXPECT_EQ(table.rows[1][0], "0");
}

TEST(ResponseCsv, KeepsFirstColumnWhenNotAnId)
{
    RawTable table = ParseText("q1,q2\n1,0\n");
    EXPECT_EQ(table.GetNCols(), 2);

    RawTable kept = ParseText("id,q1\n7,1\n", false);
    EXPECT_EQ(kept.GetNCols(), 2);
}

TEST(ResponseCsv, HandlesCarriageReturnsQuotesAndBlankLines)
{
    RawTable table = ParseText("\"q1\",\"q2\"\r\n\r\n1, 0\r\n\n\"0\",\n");
    ASSERT_EQ(table.GetNRows(), 2);
    EXPECT_EQ(table.header[0], "q1");
    EXPECT_EQ(table.rows[0][1], "0");
    ASSERT_EQ(table.rows[1].size(), 2u);
    EXPECT_EQ(table.rows[1][0], "0");
    EXPECT_EQ(table.rows[1][1], "");
}

TEST(ResponseCsv, EmptyInputIsASchemaError)
{
    EXPECT_THROW(ParseText("\n\n"), SchemaError);
}

TEST(ResponseCsv, MissingFileIsARequestError)
{
    EXPECT_THROW(ReadResponseCsv("/nonexistent/responses.csv"), RequestError);
}

TEST(DataValidator, ParseCell)
{
    double x;
    EXPECT_TRUE(DataValidator::ParseCell("1", x));
    EXPECT_EQ(x, 1.0);
    EXPECT_TRUE(DataValidator::ParseCell(" 0 ", x));
    EXPECT_EQ(x, 0.0);
    EXPECT_TRUE(DataValidator::ParseCell("1.0", x));
    EXPECT_EQ(x, 1.0);
    EXPECT_TRUE(DataValidator::ParseCell("NA", x));
    EXPECT_TRUE(IsMissing(x));
    EXPECT_TRUE(DataValidator::ParseCell("", x));
    EXPECT_TRUE(IsMissing(x));

    EXPECT_FALSE(DataValidator::ParseCell("2", x));
    EXPECT_FALSE(DataValidator::ParseCell("0.5", x));
    EXPECT_FALSE(DataValidator::ParseCell("yes", x));
    EXPECT_FALSE(DataValidator::ParseCell("1x", x));
}

TEST(DataValidator, DropsAllCorrectAndAllIncorrectRows)
{
    RawTable table = MixedTable(10);
    table.rows.push_back({"1", "1", "1"});
    table.rows.push_back({"0", "0", "0"});

    DataValidator validator;
    ValidatedData data = validator.Validate(table);
    EXPECT_EQ(data.original_rows, 12);
    EXPECT_EQ(data.original_cols, 3);
    EXPECT_EQ(data.GetNRespondents(), 10);
    EXPECT_EQ(data.GetNItems(), 3);
    EXPECT_EQ(data.kept_rows.back(), 9);
    EXPECT_EQ(data.responses(0, 0), 1.0);
    EXPECT_EQ(data.responses(1, 1), 1.0);
}

TEST(DataValidator, MissingCellsDoNotCountTowardsTheRowSum)
{
    RawTable table = MixedTable(10);
    // one correct answer and two missing: 0 < 1 < 3, kept
    table.rows.push_back({"1", "NA", ""});
    // only missing and incorrect: sum 0, dropped
    table.rows.push_back({"0", "NA", "NA"});

    DataValidator validator;
    ValidatedData data = validator.Validate(table);
    EXPECT_EQ(data.GetNRespondents(), 11);
    EXPECT_TRUE(IsMissing(data.responses(10, 1)));
    EXPECT_TRUE(IsMissing(data.responses(10, 2)));
}

TEST(DataValidator, NonBinaryValuesAreReported)
{
    RawTable table = MixedTable(10);
    table.rows[3][1] = "2";
    table.rows[5][2] = "3";

    DataValidator validator;
    try {
        validator.Validate(table);
        FAIL() << "expected SchemaError";
    }
    catch (const SchemaError & e) {
        EXPECT_STREQ(e.what(), "Responses must be 0/1. Found: 0, 1, 2, 3");
        EXPECT_EQ(e.GetKind(), ErrorKind::SCHEMA);
    }
}

TEST(DataValidator, ReportedValuesAreSortedNumerically)
{
    RawTable table = MixedTable(10);
    table.rows[0][0] = "10";
    table.rows[1][1] = "1.0";
    table.rows[2][2] = "2";
    table.rows[3][0] = "yes";
    table.rows[4][1] = "-1";

    DataValidator validator;
    try {
        validator.Validate(table);
        FAIL() << "expected SchemaError";
    }
    catch (const SchemaError & e) {
        EXPECT_STREQ(e.what(), "Responses must be 0/1. Found: -1, 0, 1, 2, 10, yes");
    }
}

TEST(DataValidator, RaggedRowIsASchemaError)
{
    RawTable table = MixedTable(10);
    table.rows[2].pop_back();

    DataValidator validator;
    EXPECT_THROW(validator.Validate(table), SchemaError);
}

TEST(DataValidator, TooFewInformativeRows)
{
    RawTable table = MixedTable(9);
    table.rows.push_back({"1", "1", "1"});

    DataValidator validator;
    EXPECT_THROW(validator.Validate(table), InsufficientDataError);

    validator.SetMinRows(9);
    EXPECT_EQ(validator.Validate(table).GetNRespondents(), 9);
}

TEST(DataValidator, ExactlyTenRowsIsEnough)
{
    DataValidator validator;
    EXPECT_EQ(validator.GetMinRows(), 10);
    EXPECT_NO_THROW(validator.Validate(MixedTable(10)));
}
