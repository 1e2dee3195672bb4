#include "palette.hpp"

namespace quotadash {

const Palette& default_palette() {
    static const Palette palette{};
    return palette;
}

Rgb quota_color(const Palette& palette, double percent, bool rate_limited) {
    if (rate_limited) return palette.error;
    if (percent > 50.0) return palette.success;
    if (percent > 20.0) return palette.warning;
    return palette.error;
}

Rgb tier_color(const Palette& palette, std::string_view tier) {
    if (tier == "PRO") return palette.success;
    if (tier == "FREE") return palette.warning;
    return palette.subtle;
}

} // namespace quotadash
