#include "TransactionReader.h"
#include "Utilities.h"

namespace txl {

TransactionReader::TransactionReader(std::istream &input)
    : Module("txledger.reader"), input_(input) {}

bool TransactionReader::readLine(std::string &line) {
  while (std::getline(input_, line)) {
    ++lineNumber_;
    if (!utl::trim(line).empty()) {
      return true;
    }
  }
  return false;
}

TransactionReader::Roe<void> TransactionReader::readHeader() {
  if (headerRead_) {
    if (!headerValid_) {
      return Error(E_HEADER, "Invalid header");
    }
    return {};
  }
  headerRead_ = true;

  std::string line;
  if (!readLine(line)) {
    return Error(E_HEADER, "Input is empty, expected a header line");
  }

  auto columns = parseHeader(line);
  if (!columns) {
    return Error(columns.error().code, columns.error().message);
  }

  columns_ = columns.value();
  headerValid_ = true;
  log().debug << "Header parsed: " << columns_.count << " columns";
  return {};
}

std::optional<Transaction> TransactionReader::next() {
  if (!headerRead_) {
    auto header = readHeader();
    if (!header) {
      log().error << "Cannot read transactions: " << header.error().message;
      return std::nullopt;
    }
  }
  if (!headerValid_) {
    return std::nullopt;
  }

  std::string line;
  while (readLine(line)) {
    ++stats_.rowsRead;
    auto fields = utl::split(line, ',');
    auto transaction = parseRow(fields, columns_);
    if (transaction) {
      return transaction.value();
    }
    ++stats_.rowsSkipped;
    log().warning << "Skipping invalid transaction on line " << lineNumber_ << ": "
                  << transaction.error().message;
  }
  return std::nullopt;
}

TransactionReader::Roe<TransactionReader::Columns>
TransactionReader::parseHeader(const std::string &line) {
  auto names = utl::split(line, ',');

  std::optional<size_t> type;
  std::optional<size_t> client;
  std::optional<size_t> tx;
  Columns columns;
  columns.count = names.size();

  for (size_t i = 0; i < names.size(); ++i) {
    std::string name = utl::toLower(utl::trim(names[i]));
    if (name == "type") {
      type = i;
    } else if (name == "client") {
      client = i;
    } else if (name == "tx") {
      tx = i;
    } else if (name == "amount") {
      columns.amount = i;
    }
  }

  if (!type || !client || !tx) {
    return Error(E_HEADER, "Header must name the columns type, client and tx: '" +
                               utl::trim(line) + "'");
  }

  columns.type = *type;
  columns.client = *client;
  columns.tx = *tx;
  return columns;
}

TransactionReader::Roe<Transaction>
TransactionReader::parseRow(const std::vector<std::string> &fields, const Columns &columns) {
  if (fields.size() > columns.count) {
    return Error(E_FIELD_COUNT, "Expected at most " + std::to_string(columns.count) +
                                    " fields, got " + std::to_string(fields.size()));
  }

  // Trailing columns may be left out entirely, e.g. "dispute,1,4"
  auto field = [&fields](size_t index) {
    return index < fields.size() ? utl::trim(fields[index]) : std::string();
  };

  std::string type = field(columns.type);

  uint16_t clientValue = 0;
  if (!utl::parseUInt16(field(columns.client), clientValue)) {
    return Error(E_CLIENT, "Invalid client id: '" + field(columns.client) + "'");
  }
  ClientId client(clientValue);

  uint32_t txValue = 0;
  if (!utl::parseUInt32(field(columns.tx), txValue)) {
    return Error(E_TX, "Invalid transaction id: '" + field(columns.tx) + "'");
  }
  TransactionId tx(txValue);

  if (type == "dispute") {
    return Transaction(Dispute{ client, tx });
  }
  if (type == "resolve") {
    return Transaction(Resolve{ client, tx });
  }
  if (type == "chargeback") {
    return Transaction(Chargeback{ client, tx });
  }
  if (type != "deposit" && type != "withdrawal") {
    return Error(E_TYPE, "Unknown transaction type: '" + type + "'");
  }

  std::string amountText = columns.amount ? field(*columns.amount) : std::string();
  if (amountText.empty()) {
    return Error(E_AMOUNT, "Missing amount for transaction type: '" + type + "'");
  }
  auto amount = PositiveAmount::parse(amountText);
  if (!amount) {
    return Error(E_AMOUNT, amount.error().message);
  }

  if (type == "deposit") {
    return Transaction(Deposit{ client, tx, amount.value() });
  }
  return Transaction(Withdrawal{ client, tx, amount.value() });
}

} // namespace txl
