#include "TransactionReader.h"
#include <gtest/gtest.h>

#include <sstream>
#include <vector>

namespace {

std::vector<txl::Transaction> readAll(txl::TransactionReader &reader) {
    std::vector<txl::Transaction> out;
    while (auto transaction = reader.next()) {
        out.push_back(*transaction);
    }
    return out;
}

txl::Decimal dec(const std::string &text) { return txl::Decimal::parse(text).value(); }

} // namespace

TEST(TransactionReaderTest, ReadsAllTransactionTypes) {
    std::istringstream input("type,client,tx,amount\n"
                             "deposit,1,1,1.0\n"
                             "withdrawal,1,2,0.5\n"
                             "dispute,1,1,\n"
                             "resolve,1,1,\n"
                             "chargeback,1,1,\n");
    txl::TransactionReader reader(input);
    auto transactions = readAll(reader);

    ASSERT_EQ(transactions.size(), 5u);
    ASSERT_TRUE(std::holds_alternative<txl::Deposit>(transactions[0]));
    EXPECT_EQ(std::get<txl::Deposit>(transactions[0]).amount.value(), dec("1"));
    ASSERT_TRUE(std::holds_alternative<txl::Withdrawal>(transactions[1]));
    EXPECT_EQ(std::get<txl::Withdrawal>(transactions[1]).tx, txl::TransactionId(2));
    EXPECT_TRUE(std::holds_alternative<txl::Dispute>(transactions[2]));
    EXPECT_TRUE(std::holds_alternative<txl::Resolve>(transactions[3]));
    EXPECT_TRUE(std::holds_alternative<txl::Chargeback>(transactions[4]));
    EXPECT_EQ(reader.getStats().rowsRead, 5u);
    EXPECT_EQ(reader.getStats().rowsSkipped, 0u);
}

TEST(TransactionReaderTest, TrimsWhitespaceAndSkipsBlankLines) {
    std::istringstream input(" type , client , tx , amount \r\n"
                             "\n"
                             "  deposit ,  2 , 7 ,  3.25 \r\n"
                             "   \n"
                             "dispute, 2, 7\n");
    txl::TransactionReader reader(input);
    auto transactions = readAll(reader);

    ASSERT_EQ(transactions.size(), 2u);
    const auto &deposit = std::get<txl::Deposit>(transactions[0]);
    EXPECT_EQ(deposit.client, txl::ClientId(2));
    EXPECT_EQ(deposit.tx, txl::TransactionId(7));
    EXPECT_EQ(deposit.amount.value(), dec("3.25"));
    EXPECT_TRUE(std::holds_alternative<txl::Dispute>(transactions[1]));
}

TEST(TransactionReaderTest, ColumnOrderComesFromHeader) {
    std::istringstream input("tx,amount,client,type\n"
                             "9,2.5,4,deposit\n");
    txl::TransactionReader reader(input);
    auto transactions = readAll(reader);

    ASSERT_EQ(transactions.size(), 1u);
    const auto &deposit = std::get<txl::Deposit>(transactions[0]);
    EXPECT_EQ(deposit.client, txl::ClientId(4));
    EXPECT_EQ(deposit.tx, txl::TransactionId(9));
}

TEST(TransactionReaderTest, InvalidRowsAreSkipped) {
    std::istringstream input("type,client,tx,amount\n"
                             "deposit,1,1,\n"          // missing amount
                             "deposit,1,2,0\n"         // zero amount
                             "withdrawal,1,3,-1\n"     // negative amount
                             "deposit,1,4,1.23456\n"   // too precise
                             "transfer,1,5,1\n"        // unknown type
                             "deposit,70000,6,1\n"     // client out of range
                             "deposit,1,x,1\n"         // bad tx
                             "deposit,1,8,1,extra\n"   // too many fields
                             "deposit,1,9,2\n");
    txl::TransactionReader reader(input);
    auto transactions = readAll(reader);

    ASSERT_EQ(transactions.size(), 1u);
    EXPECT_EQ(txl::txOf(transactions[0]), txl::TransactionId(9));
    EXPECT_EQ(reader.getStats().rowsRead, 9u);
    EXPECT_EQ(reader.getStats().rowsSkipped, 8u);
}

TEST(TransactionReaderTest, MissingHeaderColumnIsError) {
    std::istringstream input("type,client,amount\ndeposit,1,1\n");
    txl::TransactionReader reader(input);
    auto header = reader.readHeader();
    ASSERT_TRUE(header.isError());
    EXPECT_EQ(header.error().code, txl::TransactionReader::E_HEADER);
    EXPECT_FALSE(reader.next().has_value());
}

TEST(TransactionReaderTest, EmptyInputHasNoHeader) {
    std::istringstream input("");
    txl::TransactionReader reader(input);
    EXPECT_TRUE(reader.readHeader().isError());
    EXPECT_FALSE(reader.next().has_value());
}

TEST(TransactionReaderTest, ParseRowTypeMustBeLowercase) {
    auto columns = txl::TransactionReader::parseHeader("type,client,tx,amount");
    ASSERT_TRUE(columns.isOk());

    auto row = txl::TransactionReader::parseRow({ "deposit", "1", "2", "5" }, columns.value());
    ASSERT_TRUE(row.isOk()) << row.error().message;
    EXPECT_TRUE(std::holds_alternative<txl::Deposit>(row.value()));

    for (const char *type : { "Deposit", "DISPUTE", "chargeBack" }) {
        auto rejected = txl::TransactionReader::parseRow({ type, "1", "2", "5" }, columns.value());
        ASSERT_TRUE(rejected.isError()) << "accepted type '" << type << "'";
        EXPECT_EQ(rejected.error().code, txl::TransactionReader::E_TYPE);
    }
}

TEST(TransactionReaderTest, ParseRowIgnoresAmountOnDisputes) {
    auto columns = txl::TransactionReader::parseHeader("type,client,tx,amount");
    ASSERT_TRUE(columns.isOk());

    auto row = txl::TransactionReader::parseRow({ "chargeback", "3", "4", "garbage" }, columns.value());
    ASSERT_TRUE(row.isOk()) << row.error().message;
    EXPECT_TRUE(std::holds_alternative<txl::Chargeback>(row.value()));
}

TEST(TransactionReaderTest, ParseRowReportsErrorCodes) {
    auto columns = txl::TransactionReader::parseHeader("type,client,tx,amount").value();

    EXPECT_EQ(txl::TransactionReader::parseRow({ "refund", "1", "1", "1" }, columns).error().code,
              txl::TransactionReader::E_TYPE);
    EXPECT_EQ(txl::TransactionReader::parseRow({ "deposit", "-1", "1", "1" }, columns).error().code,
              txl::TransactionReader::E_CLIENT);
    EXPECT_EQ(txl::TransactionReader::parseRow({ "deposit", "1", "", "1" }, columns).error().code,
              txl::TransactionReader::E_TX);
    EXPECT_EQ(txl::TransactionReader::parseRow({ "deposit", "1", "1", "0" }, columns).error().code,
              txl::TransactionReader::E_AMOUNT);
    EXPECT_EQ(
        txl::TransactionReader::parseRow({ "deposit", "1", "1", "1", "1" }, columns).error().code,
        txl::TransactionReader::E_FIELD_COUNT);
}
