#pragma once

#include <string>

namespace dbtarget::util {

// Host name of this machine, resolved once per process.
const std::string& LocalHostName();

} // namespace dbtarget::util
