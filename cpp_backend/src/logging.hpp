#pragma once

#include <string>

namespace soulwar::logging {

// Installs the default spdlog logger: colored stdout, plus a rotating file
// when `file` is non-empty. Unknown level names fall back to info.
void init(const std::string& level, const std::string& file = {});

}  // namespace soulwar::logging
