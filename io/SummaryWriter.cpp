#include "SummaryWriter.h"
#include "Utilities.h"

namespace txl {

bool parseOutputFormat(const std::string &name, OutputFormat &format) {
  std::string lower = utl::toLower(utl::trim(name));
  if (lower == "csv") {
    format = OutputFormat::CSV;
  } else if (lower == "json") {
    format = OutputFormat::JSON;
  } else {
    return false;
  }
  return true;
}

std::string outputFormatToString(OutputFormat format) {
  return format == OutputFormat::JSON ? "json" : "csv";
}

void writeSummaryCsv(std::ostream &out, const std::vector<AccountSummary> &rows) {
  out << "client,available,held,total,locked\n";
  for (const auto &row : rows) {
    out << row.client << ',' << row.available << ',' << row.held << ',' << row.total << ','
        << (row.locked ? "true" : "false") << '\n';
  }
}

nlohmann::json summaryToJson(const AccountSummary &row) {
  nlohmann::json j;
  j["client"] = row.client.value();
  j["available"] = row.available.toString();
  j["held"] = row.held.toString();
  j["total"] = row.total.toString();
  j["locked"] = row.locked;
  return j;
}

nlohmann::json summariesToJson(const std::vector<AccountSummary> &rows) {
  nlohmann::json j = nlohmann::json::array();
  for (const auto &row : rows) {
    j.push_back(summaryToJson(row));
  }
  return j;
}

void writeSummary(std::ostream &out, const std::vector<AccountSummary> &rows,
                  OutputFormat format) {
  if (format == OutputFormat::JSON) {
    out << summariesToJson(rows).dump(2) << "\n";
  } else {
    writeSummaryCsv(out, rows);
  }
}

} // namespace txl
