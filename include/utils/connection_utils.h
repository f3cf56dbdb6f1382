#ifndef CONNECTION_UTILS_H
#define CONNECTION_UTILS_H

#include <optional>
#include <string>
#include <string_view>

struct ConnectionParams {
  std::string host;
  std::string user;
  std::string password;
  std::string db;
  std::string port;
  std::string scheme;

  std::string toSafeString() const {
    return "host=" + host + ";user=" + user + ";password=***;db=" + db +
           ";port=" + port;
  }
};

class ConnectionStringParser {
public:
  // Parses "host=h;user=u;password=p;db=d;port=3306[;scheme=https]". Keys are
  // case-insensitive; SERVER and DATABASE are accepted as aliases. Returns
  // std::nullopt when host is missing or the port is not in 1..65535.
  static std::optional<ConnectionParams> parse(std::string_view connStr);
};

#endif
