#pragma once

#include <string>

namespace fcast {

// Random version-4 UUID, used for market, outcome, position and ledger ids
std::string generate_uuid();

} // namespace fcast
