#ifndef TRANSACTION_ID_HPP_
#define TRANSACTION_ID_HPP_

#include <chrono>
#include <string>

namespace settlement {
namespace hedera {

/**
 * Canonicalize a transaction id to the dash form used for storage.
 *
 *   0.0.123@1700000000.5      -> 0.0.123-1700000000-000000005
 *   0.0.123-1700000000-000000005 is returned as is
 *
 * Ids matching neither form are returned unchanged and a warning is logged.
 * Every id must pass through here before it is stored or looked up.
 */
std::string normalize(const std::string& transaction_id);

/**
 * True when the id is already in account-seconds-nanos form.
 */
bool isNormalizedFormat(const std::string& transaction_id);

/**
 * Convert a dash-form id back to account@seconds.nanos. Other input is
 * returned unchanged.
 */
std::string toAtFormat(const std::string& transaction_id);

/**
 * Deterministic correlation id for a settlement: "{prefix}_{normalized id}".
 */
std::string correlationId(const std::string& network_prefix,
                          const std::string& normalized_transaction_id);

/**
 * Client-generated id account@seconds.nanos for a transaction that is built
 * without a network client.
 */
std::string generateTransactionId(const std::string& account_id,
                                  std::chrono::system_clock::time_point valid_start);

}  // namespace hedera
}  // namespace settlement

#endif  // TRANSACTION_ID_HPP_
