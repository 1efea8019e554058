// ============================================================================
// endpoint.cpp -- implementation of collection link parsing
// ============================================================================
#include "solrdump/endpoint.hpp"

#include <cctype>

namespace solrdump {

namespace {

bool is_host_char(char c) {
  return std::isalnum(static_cast<unsigned char>(c)) || c == '-' || c == '.';
}

bool is_collection_char(char c) {
  return std::isalnum(static_cast<unsigned char>(c)) || c == '-' || c == '.' ||
         c == '_';
}

std::string lower(std::string_view s) {
  std::string out(s);
  for (auto& c : out) c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
  return out;
}

} // namespace

EndpointError::EndpointError(Kind kind, const std::string& link)
  : std::runtime_error(std::string("wrong http link to a solr collection \"") +
                       link + "\": " + to_string(kind)),
    kind_(kind) {}

const char* to_string(EndpointError::Kind kind) noexcept {
  switch (kind) {
    case EndpointError::Kind::MissingScheme:     return "missing scheme";
    case EndpointError::Kind::UnsupportedScheme: return "scheme must be http or https";
    case EndpointError::Kind::MissingHost:       return "missing host";
    case EndpointError::Kind::InvalidHost:       return "invalid host";
    case EndpointError::Kind::InvalidPort:       return "invalid port";
    case EndpointError::Kind::MissingSolrPath:   return "path must start with /solr/";
    case EndpointError::Kind::MissingCollection: return "missing collection";
    case EndpointError::Kind::InvalidCollection: return "invalid collection";
  }
  return "unknown";
}

std::string Endpoint::base_url() const {
  std::string url = scheme + "://" + host;
  if (port != 0) url += ":" + std::to_string(port);
  url += "/solr/" + collection;
  return url;
}

Endpoint parse_endpoint(std::string_view link) {
  using Kind = EndpointError::Kind;
  const std::string raw(link);

  // scheme
  const auto sep = link.find("://");
  if (sep == std::string_view::npos || sep == 0) {
    throw EndpointError(Kind::MissingScheme, raw);
  }
  Endpoint ep;
  ep.scheme = lower(link.substr(0, sep));
  if (ep.scheme != "http" && ep.scheme != "https") {
    throw EndpointError(Kind::UnsupportedScheme, raw);
  }
  std::string_view rest = link.substr(sep + 3);

  // authority: host[:port]
  const auto slash = rest.find('/');
  std::string_view authority = rest.substr(0, slash);
  std::string_view path = (slash == std::string_view::npos)
                            ? std::string_view{} : rest.substr(slash + 1);

  std::string_view host = authority;
  const auto colon = authority.find(':');
  if (colon != std::string_view::npos) {
    host = authority.substr(0, colon);
    std::string_view port = authority.substr(colon + 1);
    if (port.empty() || port.size() > 5) {
      throw EndpointError(Kind::InvalidPort, raw);
    }
    unsigned long v = 0;
    for (char c : port) {
      if (!std::isdigit(static_cast<unsigned char>(c))) {
        throw EndpointError(Kind::InvalidPort, raw);
      }
      v = v * 10 + static_cast<unsigned long>(c - '0');
    }
    if (v == 0 || v > 65535) {
      throw EndpointError(Kind::InvalidPort, raw);
    }
    ep.port = static_cast<uint16_t>(v);
  }
  if (host.empty()) {
    throw EndpointError(Kind::MissingHost, raw);
  }
  for (char c : host) {
    if (!is_host_char(c)) throw EndpointError(Kind::InvalidHost, raw);
  }
  ep.host = std::string(host);

  // path: solr/<collection>[/]
  constexpr std::string_view solr = "solr";
  if (path.substr(0, solr.size()) != solr ||
      (path.size() > solr.size() && path[solr.size()] != '/')) {
    throw EndpointError(Kind::MissingSolrPath, raw);
  }
  std::string_view coll = path.size() > solr.size()
                            ? path.substr(solr.size() + 1) : std::string_view{};
  if (!coll.empty() && coll.back() == '/') {
    coll.remove_suffix(1);
  }
  if (coll.empty()) {
    throw EndpointError(Kind::MissingCollection, raw);
  }
  for (char c : coll) {
    if (!is_collection_char(c)) throw EndpointError(Kind::InvalidCollection, raw);
  }
  ep.collection = std::string(coll);
  return ep;
}

std::string name_pattern(const Endpoint& ep) {
  std::string p = ep.host;
  if (ep.port != 0) {
    p += "." + std::to_string(ep.port);
  }
  p += "." + ep.collection + ".";
  return p;
}

} // namespace solrdump
