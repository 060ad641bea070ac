#ifndef TOKEN_CONFIG_HPP_
#define TOKEN_CONFIG_HPP_

#include <optional>
#include <string>
#include <vector>

namespace settlement {
namespace hedera {

/**
 * Assets accepted for invoice settlement.
 */
enum class TokenType {
  HBAR,
  USDC,
  USDT,
  AUDD
};

/**
 * Settlement networks with a public mirror node.
 */
enum class Network {
  MAINNET,
  TESTNET,
  PREVIEWNET
};

/**
 * Static per-asset settings.
 */
struct TokenInfo {
  TokenType type;
  std::string symbol;
  int decimals;
  bool is_native;    // HBAR moves through crypto transfers, not token transfers
  bool is_stable;
  double tolerance;  // fraction, e.g. 0.005 for 0.5%
  std::string clearing_account_code;
};

const TokenInfo& tokenInfo(TokenType token);
const std::vector<TokenType>& allTokens();

std::string tokenSymbol(TokenType token);
std::optional<TokenType> parseTokenType(const std::string& symbol);

/**
 * Token entity id on the given network. HBAR has none, and tokens not
 * deployed on a network return nullopt as well.
 */
std::optional<std::string> tokenId(TokenType token, Network network);

std::string networkName(Network network);
std::optional<Network> parseNetwork(const std::string& name);

/**
 * Base URL of the public mirror node for a network (no /api/v1 suffix).
 */
std::string mirrorNodeUrl(Network network);

}  // namespace hedera
}  // namespace settlement

#endif  // TOKEN_CONFIG_HPP_
