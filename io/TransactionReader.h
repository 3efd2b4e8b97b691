#ifndef TXLEDGER_TRANSACTION_READER_H
#define TXLEDGER_TRANSACTION_READER_H

#include "Module.h"
#include "ResultOrError.hpp"
#include "Transaction.h"

#include <cstdint>
#include <istream>
#include <optional>
#include <string>
#include <vector>

namespace txl {

/**
 * TransactionReader - reads transaction records from CSV text.
 *
 * The first non-blank line is a header naming the columns `type`, `client`,
 * `tx` and `amount` in any order; whitespace around names and values is
 * ignored. Rows that cannot be turned into a valid Transaction are logged
 * and skipped, so next() only ever yields well-formed transactions.
 */
class TransactionReader : public Module {
public:
  struct Error : RoeErrorBase {
    using RoeErrorBase::RoeErrorBase;
  };
  template <typename T> using Roe = ResultOrError<T, Error>;

  constexpr static int32_t E_HEADER = 1;
  constexpr static int32_t E_FIELD_COUNT = 2;
  constexpr static int32_t E_TYPE = 3;
  constexpr static int32_t E_CLIENT = 4;
  constexpr static int32_t E_TX = 5;
  constexpr static int32_t E_AMOUNT = 6;

  // Column positions resolved from the header
  struct Columns {
    size_t type{ 0 };
    size_t client{ 1 };
    size_t tx{ 2 };
    std::optional<size_t> amount;
    size_t count{ 4 };
  };

  struct Stats {
    uint64_t rowsRead{ 0 };
    uint64_t rowsSkipped{ 0 };
  };

  explicit TransactionReader(std::istream &input);
  ~TransactionReader() override = default;

  /**
   * Read and validate the header line. Called by next() on first use;
   * calling it explicitly lets the caller report a bad header.
   */
  Roe<void> readHeader();

  /**
   * @return the next valid transaction, or std::nullopt at end of input
   * (or when the header is unusable)
   */
  std::optional<Transaction> next();

  const Stats &getStats() const { return stats_; }

  static Roe<Columns> parseHeader(const std::string &line);
  static Roe<Transaction> parseRow(const std::vector<std::string> &fields,
                                   const Columns &columns);

private:
  bool readLine(std::string &line);

  std::istream &input_;
  uint64_t lineNumber_{ 0 };
  bool headerRead_{ false };
  bool headerValid_{ false };
  Columns columns_;
  Stats stats_;
};

} // namespace txl

#endif // TXLEDGER_TRANSACTION_READER_H
