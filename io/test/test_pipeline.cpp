#include "AccountEngine.h"
#include "SummaryWriter.h"
#include "TransactionReader.h"
#include <gtest/gtest.h>

#include <sstream>
#include <vector>

namespace {

std::string process(const std::string &csv, txl::AccountEngine &engine,
                    std::vector<std::string> &failures) {
    std::istringstream input(csv);
    txl::TransactionReader reader(input);
    while (auto transaction = reader.next()) {
        auto result = engine.apply(*transaction);
        if (!result) {
            failures.push_back(txl::toString(*transaction) + ": " + result.error().message);
        }
    }
    std::ostringstream out;
    txl::writeSummary(out, engine.summaries(), txl::OutputFormat::CSV);
    return out.str();
}

} // namespace

TEST(PipelineTest, ChargebackScenarioProducesLockedAccount) {
    txl::AccountEngine engine;
    std::vector<std::string> failures;
    auto output = process("type, client, tx, amount\n"
                          "deposit, 1, 1, 10.0\n"
                          "deposit, 1, 2, 5.0\n"
                          "withdrawal, 1, 3, 3.0\n"
                          "dispute, 1, 2,\n"
                          "chargeback, 1, 2,\n"
                          "deposit, 1, 4, 100.0\n",
                          engine, failures);

    EXPECT_EQ(output, "client,available,held,total,locked\n"
                      "1,7.0000,0.0000,7.0000,true\n");
    EXPECT_EQ(engine.getStats().applied, 5u);
    ASSERT_EQ(failures.size(), 1u);
    EXPECT_EQ(failures[0], "deposit{client=1, tx=4, amount=100.0000}: Account is locked");
}

TEST(PipelineTest, MultipleClientsSortedWithRejectionsAndIgnores) {
    txl::AccountEngine engine;
    std::vector<std::string> failures;
    auto output = process("type,client,tx,amount\n"
                          "deposit,2,1,1.0\n"
                          "deposit,1,2,2.0\n"
                          "deposit,1,3,2.0\n"
                          "withdrawal,1,4,1.5\n"
                          "withdrawal,2,5,3.0\n"
                          "dispute,2,2,\n"
                          "dispute,1,3,\n"
                          "resolve,1,3,\n"
                          "dispute,1,2,\n",
                          engine, failures);

    EXPECT_EQ(output, "client,available,held,total,locked\n"
                      "1,0.5000,2.0000,2.5000,false\n"
                      "2,1.0000,0.0000,1.0000,false\n");
    EXPECT_EQ(failures.size(), 1u);
    EXPECT_EQ(engine.getStats().rejected, 1u);
    EXPECT_EQ(engine.getStats().ignored, 1u);
}
