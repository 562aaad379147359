//
// Resolution.cpp
//

#include "Resolution.hpp"

#include <array>
#include <utility>

namespace clash::core
{
    namespace
    {
        constexpr auto Idx(Card const c) noexcept -> std::size_t
        {
            return static_cast<std::size_t>(std::to_underlying(c));
        }

        // [own][opponent] -> own health delta
        constexpr std::array<std::array<std::int8_t, 3>, 3> HealthTable{{
            //          Attack  Counter  Rest
            /*Attack*/  {{-1,     -1,      0}},
            /*Counter*/ {{ 0,      0,      0}},
            /*Rest*/    {{-1,      0,      0}},
        }};

        constexpr CardChoice AttackOrCounter{Card::Attack, Card::Counter};
    }

    auto Resolve(Card const own, Card const opponent) -> Resolution
    {
        Resolution out{};
        out.health_delta = HealthTable[Idx(own)][Idx(opponent)];

        switch (own)
        {
        case Card::Attack:
            break;
        case Card::Counter:
            if (opponent == Card::Attack)
            {
                out.rewards.emplace_back(Card::Counter);
            }
            break;
        case Card::Rest:
            switch (opponent)
            {
            case Card::Attack:
                out.rewards.emplace_back(Card::Attack);
                out.rewards.emplace_back(Card::Rest);
                break;
            case Card::Counter:
            case Card::Rest:
                out.rewards.emplace_back(AttackOrCounter);
                out.rewards.emplace_back(Card::Rest);
                break;
            }
            break;
        }
        return out;
    }
}
