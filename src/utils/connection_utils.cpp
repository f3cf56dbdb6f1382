#include "utils/connection_utils.h"
#include "utils/string_utils.h"

std::optional<ConnectionParams>
ConnectionStringParser::parse(std::string_view connStr) {
  if (connStr.empty()) {
    return std::nullopt;
  }

  ConnectionParams params;
  std::string connString{connStr};
  size_t pos = 0;

  while (pos < connString.length()) {
    size_t semicolonPos = connString.find(';', pos);
    std::string token;
    if (semicolonPos == std::string::npos) {
      token = connString.substr(pos);
      pos = connString.length();
    } else {
      token = connString.substr(pos, semicolonPos - pos);
      pos = semicolonPos + 1;
    }

    size_t equalsPos = token.find('=');
    if (equalsPos == std::string::npos)
      continue;

    std::string key = StringUtils::toLower(StringUtils::trim(
        std::string_view(token).substr(0, equalsPos)));
    std::string value =
        StringUtils::trim(std::string_view(token).substr(equalsPos + 1));

    if (key.empty())
      continue;

    if (key == "host" || key == "server")
      params.host = value;
    else if (key == "user")
      params.user = value;
    else if (key == "password")
      params.password = value;
    else if (key == "db" || key == "database")
      params.db = value;
    else if (key == "scheme")
      params.scheme = StringUtils::toLower(value);
    else if (key == "port") {
      if (!StringUtils::isUnsignedInteger(value) || value.size() > 5)
        return std::nullopt;
      unsigned long portNum = std::stoul(value);
      if (portNum == 0 || portNum > 65535)
        return std::nullopt;
      params.port = value;
    }
  }

  if (params.host.empty())
    return std::nullopt;

  return params;
}
