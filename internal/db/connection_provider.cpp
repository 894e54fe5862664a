#include "internal/db/connection_provider.hpp"

#include <cstdio>

#include "internal/db/sqlite/sqlite_db.hpp"
#include "internal/util/errors.hpp"

namespace dbtarget::db {

namespace {

constexpr const char* kIsolatedTarget = ":memory:";
constexpr const char* kDefaultShared  = "dbtarget-shared";

// Percent-encode the characters that would end the path part of a URI.
std::string EscapeUriPath(const std::string& raw) {
  std::string out;
  out.reserve(raw.size());
  for (unsigned char c : raw) {
    if (c == '?' || c == '#' || c == '%' || c == '&' || c < 0x20) {
      char buf[4];
      std::snprintf(buf, sizeof(buf), "%%%02X", c);
      out += buf;
    } else {
      out.push_back(static_cast<char>(c));
    }
  }
  return out;
}

} // namespace

std::string ConnectionProvider::SharedUri(const std::string& identifier) {
  const std::string name = identifier.empty() ? kDefaultShared : identifier;
  return "file:" + EscapeUriPath(name) + "?mode=memory&cache=shared";
}

ConnectionPtr ConnectionProvider::Open(ConnectionMode mode, const std::string& identifier) const {
  sqlite::OpenOptions open;
  open.busy_timeout_ms = options_.busy_timeout_ms;

  switch (mode) {
    case ConnectionMode::kIsolated:
      return std::make_shared<sqlite::SqliteDB>(kIsolatedTarget, open);

    case ConnectionMode::kShared:
      open.uri = true;
      return std::make_shared<sqlite::SqliteDB>(SharedUri(identifier), open);

    case ConnectionMode::kFile:
      if (identifier.empty()) {
        throw util::ConnectionError("file mode requires a database path");
      }
      open.wal = options_.wal;
      return std::make_shared<sqlite::SqliteDB>(identifier, open);
  }

  throw util::ConnectionError("unknown connection mode");
}

ConnectionFactory ConnectionProvider::Factory(ConnectionMode mode, std::string identifier) const {
  return [provider = *this, mode, identifier = std::move(identifier)]() { return provider.Open(mode, identifier); };
}

ConnectionPtr ConnectionProvider::WrapNonClosing(ConnectionPtr inner) {
  if (!inner) {
    throw util::ConnectionError("cannot wrap a null connection");
  }
  return std::make_shared<NonClosingConnection>(std::move(inner));
}

ConnectionFactory ConnectionProvider::Pinned(ConnectionPtr inner) {
  auto wrapped = WrapNonClosing(std::move(inner));
  return [wrapped]() { return wrapped; };
}

} // namespace dbtarget::db
