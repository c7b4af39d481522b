#pragma once

#include "core/types.hpp"

namespace dnmm {

struct ReserveState {
    Amount base_reserve  = 0;
    Amount quote_reserve = 0;
    Amount target_base   = 0;   // governance/recenter target split

    // Reserve that pays out for a trade in the given direction.
    Amount paying_reserve(bool is_base_in) const {
        return is_base_in ? quote_reserve : base_reserve;
    }
};

} // namespace dnmm
