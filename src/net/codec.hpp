//
// codec.hpp — FlatBuffers encoding of the clash message vocabulary
//

#ifndef CARDCLASH_CODEC_NET_HPP
#define CARDCLASH_CODEC_NET_HPP

#include <cstddef>   // std::byte
#include <cstdint>
#include <expected>
#include <optional>
#include <span>
#include <string>
#include <string_view>

#include <flatbuffers/flatbuffers.h>

#include "core/Codec.hpp"
#include "core/Messages.hpp"
#include "core/Types.hpp"

#include "generated/flatbuffers/clash_net_generated.h"

namespace clash::net
{
    using core::ParseError;

    auto ToFbCard(core::Card c) noexcept -> gen::net::Card;
    // nullopt for values outside the enum (the wire does not check enums)
    auto FromFbCard(gen::net::Card c) noexcept -> std::optional<core::Card>;

    // ----- client -> server builders (clients, bots, tests) -----
    auto BuildChat(core::PlayerId to, std::string_view text, std::uint64_t msg_id) -> flatbuffers::DetachedBuffer;
    auto BuildChallengeRequest(core::PlayerId target, std::uint64_t msg_id) -> flatbuffers::DetachedBuffer;
    auto BuildChallengeResponse(core::PlayerId challenger, bool accepted, std::uint64_t msg_id)
        -> flatbuffers::DetachedBuffer;
    auto BuildPlayCard(core::Card card, std::uint64_t msg_id) -> flatbuffers::DetachedBuffer;
    auto BuildPickCard(core::Card card, std::uint64_t msg_id) -> flatbuffers::DetachedBuffer;
    auto EncodeInbound(core::InboundMessage const& msg, std::uint64_t msg_id) -> flatbuffers::DetachedBuffer;

    // ----- server -> client -----
    auto EncodeOutbound(core::OutboundMessage const& msg, std::uint64_t msg_id) -> flatbuffers::DetachedBuffer;

    // ----- decode (verified) -----
    auto DecodeInbound(std::span<std::byte const> bytes) -> std::expected<core::InboundMessage, ParseError>;
    auto DecodeOutbound(std::span<std::byte const> bytes) -> std::expected<core::OutboundMessage, ParseError>;

    auto AsBytes(flatbuffers::DetachedBuffer const& buf) -> std::span<std::byte const>;
    auto AsBytes(std::string_view payload) -> std::span<std::byte const>;
    auto ToPayload(flatbuffers::DetachedBuffer const& buf) -> std::string;

    // The codec the store and sessions use.
    class FbCodec final : public core::Codec
    {
    public:
        auto Decode(std::string_view payload) const -> std::expected<core::InboundMessage, ParseError> override;
        auto Encode(core::OutboundMessage const& msg, std::uint64_t msg_id) const -> std::string override;
    };
} // namespace clash::net

#endif //CARDCLASH_CODEC_NET_HPP
