// =============================================================================
// Quota Info Unit Tests
// Display percentages, family summaries and metric keys
// =============================================================================

#include <gtest/gtest.h>
#include "../src/quota_info.hpp"

using namespace quotadash;
using namespace std::chrono_literals;

namespace {

QuotaSnapshot quota(ModelFamily family, int64_t remaining, int64_t limit, bool limited = false) {
    QuotaSnapshot snapshot;
    snapshot.model_family = family;
    snapshot.remaining = remaining;
    snapshot.limit = limit;
    snapshot.is_rate_limited = limited;
    return snapshot;
}

} // namespace

// -----------------------------------------------------------------------------
// Display percent
// -----------------------------------------------------------------------------
TEST(QuotaInfoTest, DisplayPercent_Ratio) {
    EXPECT_DOUBLE_EQ(display_percent(quota(ModelFamily::Claude, 250, 1000)), 25.0);
    EXPECT_DOUBLE_EQ(display_percent(quota(ModelFamily::Claude, 1000, 1000)), 100.0);
}

TEST(QuotaInfoTest, DisplayPercent_ZeroWhenNoLimitOrRateLimited) {
    EXPECT_DOUBLE_EQ(display_percent(quota(ModelFamily::Claude, 10, 0)), 0.0);
    EXPECT_DOUBLE_EQ(display_percent(quota(ModelFamily::Claude, 900, 1000, true)), 0.0);
}

TEST(QuotaInfoTest, DisplayPercent_Clamped) {
    EXPECT_DOUBLE_EQ(display_percent(quota(ModelFamily::Gemini, 1500, 1000)), 100.0);
    EXPECT_DOUBLE_EQ(display_percent(quota(ModelFamily::Gemini, -5, 1000)), 0.0);
}

// -----------------------------------------------------------------------------
// Family summary
// -----------------------------------------------------------------------------
TEST(QuotaInfoTest, Summarize_PicksLowestReadingOfTheFamily) {
    const auto now = std::chrono::system_clock::now();
    auto high = quota(ModelFamily::Gemini, 800, 1000);
    high.reset_time = now + 1h;
    auto low = quota(ModelFamily::Gemini, 300, 1000);
    low.reset_time = now + 2h;
    const std::vector<QuotaSnapshot> quotas{quota(ModelFamily::Claude, 100, 1000), high, low};

    const auto summary = summarize_family(quotas, ModelFamily::Gemini, now);
    ASSERT_TRUE(summary.has_value());
    EXPECT_DOUBLE_EQ(summary->percent, 30.0);
    EXPECT_EQ(summary->reset_seconds, 7200);
    EXPECT_FALSE(summary->is_rate_limited);
}

TEST(QuotaInfoTest, Summarize_MissingFamily) {
    const std::vector<QuotaSnapshot> quotas{quota(ModelFamily::Claude, 100, 1000)};
    EXPECT_FALSE(summarize_family(quotas, ModelFamily::Gemini, std::chrono::system_clock::now()).has_value());
}

TEST(QuotaInfoTest, Summarize_PastResetCountsAsZero) {
    const auto now = std::chrono::system_clock::now();
    auto stale = quota(ModelFamily::Claude, 0, 1000, true);
    stale.reset_time = now - 5min;

    const auto summary = summarize_family({stale}, ModelFamily::Claude, now);
    ASSERT_TRUE(summary.has_value());
    EXPECT_EQ(summary->reset_seconds, 0);
    EXPECT_TRUE(summary->is_rate_limited);
}

// -----------------------------------------------------------------------------
// Names
// -----------------------------------------------------------------------------
TEST(QuotaInfoTest, ModelFamilyNames) {
    EXPECT_EQ(to_string(ModelFamily::Claude), "claude");
    EXPECT_EQ(parse_model_family("gemini"), ModelFamily::Gemini);
    EXPECT_FALSE(parse_model_family("GPT").has_value());
}

TEST(QuotaInfoTest, MetricKey) {
    EXPECT_EQ(metric_key("alice@example.com", ModelFamily::Claude), "alice@example.com:claude");
    EXPECT_EQ(to_string(ProjectionStatus::Critical), "CRITICAL");
}
