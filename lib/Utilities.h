#ifndef TXLEDGER_UTILITIES_H
#define TXLEDGER_UTILITIES_H

#include "ResultOrError.hpp"

#include <cstdint>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>

namespace txl {

// Error type for utility functions
struct Error : public RoeErrorBase {
  Error() : RoeErrorBase() {}
  Error(int32_t c, const std::string &msg) : RoeErrorBase(c, msg) {}
  Error(int32_t c, std::string &&msg) : RoeErrorBase(c, std::move(msg)) {}
  explicit Error(const std::string &msg) : RoeErrorBase(msg) {}
  explicit Error(std::string &&msg) : RoeErrorBase(std::move(msg)) {}
};

template <typename T> using Roe = ResultOrError<T, Error>;

namespace utl {

/**
 * Parse a 64-bit unsigned integer from a string
 * @param str String to parse
 * @param value Output parameter for the parsed value
 * @return true if parsing succeeded, false otherwise
 */
bool parseUInt64(const std::string &str, uint64_t &value);

/**
 * Parse a 32-bit unsigned integer from a string (rejects out of range values)
 */
bool parseUInt32(const std::string &str, uint32_t &value);

/**
 * Parse a 16-bit unsigned integer from a string (rejects out of range values)
 */
bool parseUInt16(const std::string &str, uint16_t &value);

/**
 * Strip leading and trailing whitespace (spaces, tabs, CR, LF)
 */
std::string trim(const std::string &str);

/**
 * ASCII lower-case copy of a string
 */
std::string toLower(const std::string &str);

/**
 * Split a string on a single-character delimiter. Empty fields are kept,
 * so "a,,b" yields {"a", "", "b"} and "" yields {""}.
 */
std::vector<std::string> split(const std::string &str, char delimiter);

/**
 * Load and parse a JSON configuration file
 * @param configPath Path to the JSON configuration file
 * @return Parsed JSON document or error
 */
Roe<nlohmann::json> loadJsonFile(const std::string &configPath);

} // namespace utl
} // namespace txl

#endif // TXLEDGER_UTILITIES_H
