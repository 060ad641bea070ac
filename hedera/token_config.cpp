#include "token_config.hpp"

#include <algorithm>
#include <cctype>
#include <stdexcept>

namespace settlement {
namespace hedera {

namespace {

const TokenInfo kTokens[] = {
  {TokenType::HBAR, "HBAR", 8, true, false, 0.005, "1051"},
  {TokenType::USDC, "USDC", 6, false, true, 0.001, "1052"},
  {TokenType::USDT, "USDT", 6, false, true, 0.001, "1053"},
  {TokenType::AUDD, "AUDD", 6, false, true, 0.001, "1054"},
};

std::string toUpper(std::string value) {
  std::transform(value.begin(), value.end(), value.begin(),
                 [](unsigned char c) { return static_cast<char>(std::toupper(c)); });
  return value;
}

}  // namespace

const TokenInfo& tokenInfo(TokenType token) {
  for (const auto& info : kTokens) {
    if (info.type == token) return info;
  }
  throw std::invalid_argument("Unknown token type");
}

const std::vector<TokenType>& allTokens() {
  static const std::vector<TokenType> tokens = {
    TokenType::HBAR, TokenType::USDC, TokenType::USDT, TokenType::AUDD
  };
  return tokens;
}

std::string tokenSymbol(TokenType token) {
  return tokenInfo(token).symbol;
}

std::optional<TokenType> parseTokenType(const std::string& symbol) {
  const std::string upper = toUpper(symbol);
  for (const auto& info : kTokens) {
    if (info.symbol == upper) return info.type;
  }
  return std::nullopt;
}

std::optional<std::string> tokenId(TokenType token, Network network) {
  if (token == TokenType::HBAR) return std::nullopt;

  switch (network) {
    case Network::MAINNET:
      switch (token) {
        case TokenType::USDC: return std::string("0.0.456858");
        case TokenType::USDT: return std::string("0.0.8322281");
        case TokenType::AUDD: return std::string("0.0.1394325");
        default: return std::nullopt;
      }
    case Network::TESTNET:
      switch (token) {
        case TokenType::USDC: return std::string("0.0.429274");
        case TokenType::USDT: return std::string("0.0.429275");
        case TokenType::AUDD: return std::string("0.0.4918852");
        default: return std::nullopt;
      }
    case Network::PREVIEWNET:
    default:
      return std::nullopt;
  }
}

std::string networkName(Network network) {
  switch (network) {
    case Network::MAINNET: return "mainnet";
    case Network::TESTNET: return "testnet";
    case Network::PREVIEWNET: return "previewnet";
    default: return "unknown";
  }
}

std::optional<Network> parseNetwork(const std::string& name) {
  const std::string upper = toUpper(name);
  if (upper == "MAINNET") return Network::MAINNET;
  if (upper == "TESTNET") return Network::TESTNET;
  if (upper == "PREVIEWNET") return Network::PREVIEWNET;
  return std::nullopt;
}

std::string mirrorNodeUrl(Network network) {
  switch (network) {
    case Network::MAINNET: return "https://mainnet-public.mirrornode.hedera.com";
    case Network::PREVIEWNET: return "https://previewnet.mirrornode.hedera.com";
    case Network::TESTNET:
    default:
      return "https://testnet.mirrornode.hedera.com";
  }
}

}  // namespace hedera
}  // namespace settlement
