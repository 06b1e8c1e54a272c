#pragma once
#include <string>
#include "types.h"

namespace txguard {

// Parses ISO-8601 date-times of the form
//   YYYY-MM-DDTHH:MM[:SS[.fff]][Z|+HH:MM|-HH:MM]
// A space is accepted in place of 'T'. Without an offset the time is taken
// as UTC. Throws InvalidTransaction on anything else.
Timestamp parse_timestamp(const std::string& text);

} // namespace txguard
