#include "utils/string_utils.h"
#include <openssl/evp.h>

namespace StringUtils {

std::string base64Encode(std::string_view data) {
  if (data.empty())
    return "";
  std::string encoded(4 * ((data.size() + 2) / 3), '\0');
  int written = EVP_EncodeBlock(
      reinterpret_cast<unsigned char *>(&encoded[0]),
      reinterpret_cast<const unsigned char *>(data.data()),
      static_cast<int>(data.size()));
  encoded.resize(static_cast<size_t>(written));
  return encoded;
}

// EVP_DecodeBlock ignores surrounding whitespace but not embedded newlines,
// and counts '=' padding as zero bytes, so both are handled here.
std::string base64Decode(std::string_view encoded) {
  std::string compact;
  compact.reserve(encoded.size());
  for (char c : encoded) {
    if (!std::isspace(static_cast<unsigned char>(c)))
      compact += c;
  }
  if (compact.empty())
    return "";
  if (compact.size() % 4 != 0)
    throw std::invalid_argument("base64 input length is not a multiple of 4");

  std::string decoded(3 * compact.size() / 4, '\0');
  int written = EVP_DecodeBlock(
      reinterpret_cast<unsigned char *>(&decoded[0]),
      reinterpret_cast<const unsigned char *>(compact.data()),
      static_cast<int>(compact.size()));
  if (written < 0)
    throw std::invalid_argument("invalid base64 input");

  size_t padding = 0;
  if (compact.back() == '=')
    padding++;
  if (compact.size() >= 2 && compact[compact.size() - 2] == '=')
    padding++;
  decoded.resize(static_cast<size_t>(written) - padding);
  return decoded;
}

} // namespace StringUtils
