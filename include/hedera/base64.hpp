#ifndef BASE64_HPP_
#define BASE64_HPP_

#include <optional>
#include <string>

namespace settlement {
namespace hedera {

// Standard alphabet with '=' padding, as used for mirror node memo_base64
std::string encodeBase64(const std::string& data);

// Returns nullopt on characters outside the alphabet or bad padding
std::optional<std::string> decodeBase64(const std::string& encoded);

}  // namespace hedera
}  // namespace settlement

#endif  // BASE64_HPP_
