//
// Codec.hpp — wire encoding seam; the store never sees the wire format
//

#ifndef CARDCLASH_CODEC_HPP
#define CARDCLASH_CODEC_HPP

#include <cstdint>
#include <expected>
#include <string>
#include <string_view>

#include "Messages.hpp"

namespace clash::core
{
    struct ParseError
    {
        std::string message;
    };

    class Codec
    {
    public:
        virtual ~Codec() = default;

        virtual auto Decode(std::string_view payload) const -> std::expected<InboundMessage, ParseError> = 0;
        virtual auto Encode(OutboundMessage const& msg, std::uint64_t msg_id) const -> std::string = 0;
    };
}

#endif //CARDCLASH_CODEC_HPP
