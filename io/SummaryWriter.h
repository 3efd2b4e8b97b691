#ifndef TXLEDGER_SUMMARY_WRITER_H
#define TXLEDGER_SUMMARY_WRITER_H

#include "ClientAccount.h"

#include <ostream>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>

namespace txl {

enum class OutputFormat { CSV, JSON };

bool parseOutputFormat(const std::string &name, OutputFormat &format);
std::string outputFormatToString(OutputFormat format);

// Header "client,available,held,total,locked", one line per row
void writeSummaryCsv(std::ostream &out, const std::vector<AccountSummary> &rows);

// Decimals are rendered as strings to keep their exact value
nlohmann::json summaryToJson(const AccountSummary &row);
nlohmann::json summariesToJson(const std::vector<AccountSummary> &rows);

void writeSummary(std::ostream &out, const std::vector<AccountSummary> &rows,
                  OutputFormat format);

} // namespace txl

#endif // TXLEDGER_SUMMARY_WRITER_H
