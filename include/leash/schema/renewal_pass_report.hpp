#pragma once

#include <cstdint>

namespace leash::schema {

template <uint16_t Version>
struct renewal_pass_report;

template <>
struct renewal_pass_report<1> final {
  uint16_t version{1};
  uint64_t scanned{};
  uint64_t renewals_started{};
  uint64_t sessions_expired{};
  uint64_t challenges_expired{};
};

using renewal_pass_report_t = renewal_pass_report<1>;

}  // namespace leash::schema
