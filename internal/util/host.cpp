#include "host.hpp"

#include <unistd.h>

#include <array>

namespace dbtarget::util {

namespace {

std::string ResolveHostName() {
  std::array<char, 256> buffer{};
  if (::gethostname(buffer.data(), buffer.size() - 1) != 0) {
    return "localhost";
  }
  return std::string(buffer.data());
}

} // namespace

const std::string& LocalHostName() {
  static const std::string host = ResolveHostName();
  return host;
}

} // namespace dbtarget::util
