//
// Session.hpp — the store's handle on a connection
//

#ifndef CARDCLASH_SESSION_HPP
#define CARDCLASH_SESSION_HPP

#include "Messages.hpp"

namespace clash::core
{
    class Session
    {
    public:
        virtual ~Session() = default;

        // Called from the store actor's thread. Must not block; the session
        // encodes and writes to its transport on its own time.
        virtual auto Publish(OutboundMessage msg) -> void = 0;
    };
}
#endif //CARDCLASH_SESSION_HPP
