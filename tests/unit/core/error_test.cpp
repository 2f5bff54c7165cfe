#include <inspecta/core/error.hpp>
#include <gtest/gtest.h>
#include <array>

namespace ic = inspecta::core;

TEST(ErrorTaxonomy, InputErrorsMapToInputCategory) {
  EXPECT_EQ(ic::to_failure_kind(ic::InputError::InvalidUrl), ic::FailureKind::InvalidUrl);
  EXPECT_EQ(ic::to_failure_kind(ic::InputError::NetworkError), ic::FailureKind::FetchFailed);
  EXPECT_EQ(ic::to_failure_kind(ic::InputError::NotAnImage), ic::FailureKind::NotAnImage);
  EXPECT_EQ(ic::category_of(ic::FailureKind::FetchFailed), ic::FailureCategory::Input);
}

TEST(ErrorTaxonomy, TransportErrorsMapToTransportCategory) {
  EXPECT_EQ(ic::to_failure_kind(ic::TransportError::Auth), ic::FailureKind::AuthFailed);
  EXPECT_EQ(ic::to_failure_kind(ic::TransportError::Throttle), ic::FailureKind::Throttled);
  EXPECT_EQ(ic::to_failure_kind(ic::TransportError::MalformedResponse),
            ic::FailureKind::MalformedResponse);
  EXPECT_EQ(ic::to_failure_kind(ic::TransportError::Network), ic::FailureKind::NetworkFailed);
  EXPECT_EQ(ic::to_failure_kind(ic::TransportError::Timeout), ic::FailureKind::TimedOut);
  EXPECT_EQ(ic::category_of(ic::FailureKind::TimedOut), ic::FailureCategory::Transport);
}

TEST(ErrorTaxonomy, FailureKindNamesParseBack) {
  constexpr std::array kinds = {
      ic::FailureKind::InvalidUrl,      ic::FailureKind::FetchFailed,
      ic::FailureKind::NotAnImage,      ic::FailureKind::AuthFailed,
      ic::FailureKind::Throttled,       ic::FailureKind::MalformedResponse,
      ic::FailureKind::NetworkFailed,   ic::FailureKind::TimedOut,
  };
  for (const auto k : kinds) {
    ic::FailureKind parsed{};
    ASSERT_TRUE(ic::parse_failure_kind(ic::to_string(k), parsed)) << ic::to_string(k);
    EXPECT_EQ(parsed, k);
  }
  ic::FailureKind ignored{};
  EXPECT_FALSE(ic::parse_failure_kind("exploded", ignored));
}

TEST(ErrorTaxonomy, TransportErrorNames) {
  EXPECT_EQ(ic::to_string(ic::TransportError::Auth), "AuthError");
  EXPECT_EQ(ic::to_string(ic::TransportError::Timeout), "TimeoutError");
}
