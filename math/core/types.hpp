#pragma once

namespace math::core {

    using Real = double;

    constexpr Real kMonthsPerYear = 12.0;
    constexpr Real kPercent = 100.0;

}
