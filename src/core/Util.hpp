//
// Util.hpp — human-readable renderings for logs, audit files and Err payloads
//

#ifndef CARDCLASH_UTIL_HPP
#define CARDCLASH_UTIL_HPP

#include <string>

#include "Messages.hpp"
#include "Player.hpp"
#include "State.hpp"
#include "Types.hpp"

namespace clash::core::util
{
    auto describe(Hand const& h) -> std::string;
    auto describe(EndState const& end) -> std::string;
    auto describe(PlayerMatchState const& s) -> std::string;
    auto describe(RoundResult const& r) -> std::string;
}

#endif //CARDCLASH_UTIL_HPP
