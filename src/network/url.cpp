/// @file url.cpp
/// @brief URL parsing.

#include "network/url.hpp"

#include <algorithm>
#include <cctype>

namespace surge {

auto parse_url(std::string_view text) -> std::expected<Url, Error> {
  const auto sep = text.find("://");
  if (sep == std::string_view::npos) {
    return std::unexpected(
        configuration_error("URL '" + std::string{text} + "' has no scheme"));
  }

  Url url;
  url.scheme = std::string{text.substr(0, sep)};
  std::ranges::transform(url.scheme, url.scheme.begin(), [](unsigned char c) {
    return static_cast<char>(std::tolower(c));
  });
  if (url.scheme != "http" && url.scheme != "ws") {
    return std::unexpected(configuration_error(
        "unsupported URL scheme '" + url.scheme + "' (expected http or ws)"));
  }

  auto rest = text.substr(sep + 3);
  const auto slash = rest.find_first_of("/?");
  auto authority = rest.substr(0, slash);
  url.target = slash == std::string_view::npos
                   ? std::string{"/"}
                   : std::string{rest.substr(slash)};
  if (url.target.front() == '?') {
    url.target.insert(url.target.begin(), '/');
  }

  if (authority.empty()) {
    return std::unexpected(
        configuration_error("URL '" + std::string{text} + "' has no host"));
  }

  if (const auto colon = authority.rfind(':');
      colon != std::string_view::npos) {
    url.host = std::string{authority.substr(0, colon)};
    url.port = std::string{authority.substr(colon + 1)};
    const bool numeric =
        !url.port.empty() && std::ranges::all_of(url.port, [](unsigned char c) {
          return std::isdigit(c) != 0;
        });
    if (!numeric || url.host.empty()) {
      return std::unexpected(configuration_error(
          "URL '" + std::string{text} + "' has an invalid port"));
    }
  } else {
    url.host = std::string{authority};
    url.port = "80";
  }
  return url;
}

} // namespace surge
