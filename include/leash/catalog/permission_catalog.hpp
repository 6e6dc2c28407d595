#pragma once

#include <leash/schema/agent_profile.hpp>

#include <map>
#include <string>
#include <string_view>
#include <vector>

namespace leash::catalog {

/// Seven days, the default lifetime of every built-in profile.
inline constexpr leash::schema::duration_seconds_t kDefaultSessionDuration =
    7 * leash::schema::kSecondsPerDay;
inline constexpr uint32_t kDefaultMaxRenewals = 10;

/// Read-only table of per-agent-type defaults.
///
/// Lookups never fail: an unrecognized agent type resolves to an
/// empty-capability profile (`known == false`) so a caller that ignores the
/// flag still grants nothing.
class permission_catalog final {
 public:
  /// Built-in profiles only.
  permission_catalog();

  /// Built-in profiles plus `extra`; an extra profile replaces a built-in one
  /// with the same agent type.
  explicit permission_catalog(
      const std::vector<leash::schema::agent_profile_t>& extra);

  leash::schema::agent_profile_t defaults_for(
      std::string_view agent_type) const;

  bool contains(std::string_view agent_type) const;

  std::vector<leash::schema::agent_profile_t> profiles() const;

 private:
  std::map<std::string, leash::schema::agent_profile_t, std::less<>>
      profiles_;
};

/// The catalog shipped with the server.
std::vector<leash::schema::agent_profile_t> builtin_profiles();

}  // namespace leash::catalog
