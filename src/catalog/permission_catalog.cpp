#include <leash/catalog/permission_catalog.hpp>

#include <spdlog/spdlog.h>

namespace leash::catalog {

namespace {

using enum leash::schema::wallet_action_t;

// Amounts are in the smallest unit of a 6-decimal stablecoin.
constexpr uint64_t kUnitsPerCoin = 1'000'000;

leash::schema::amount_t coins(uint64_t value) {
  return leash::schema::amount_t{value} * kUnitsPerCoin;
}

leash::schema::agent_profile_t make_profile(
    std::string agent_type,
    std::string display_name,
    std::string description,
    std::vector<leash::schema::wallet_action_t> actions,
    leash::schema::amount_t spending_limit) {
  return leash::schema::agent_profile_t{
      .agent_type = std::move(agent_type),
      .known = true,
      .display_name = std::move(display_name),
      .description = std::move(description),
      .allowed_actions = std::move(actions),
      .spending_limit = spending_limit,
      .duration_seconds = kDefaultSessionDuration,
      .max_renewals = kDefaultMaxRenewals};
}

}  // namespace

std::vector<leash::schema::agent_profile_t> builtin_profiles() {
  auto profiles = std::vector<leash::schema::agent_profile_t>{};

  profiles.push_back(make_profile(
      "inera", "Assistant",
      "Manages finances, sends money, moves funds across networks",
      {transfer, approve, swap, bridge, cctp, gateway}, coins(100'000)));

  auto payments = make_profile(
      "payments", "Payments Agent",
      "Sends payments, processes subscriptions, handles payment links",
      {transfer}, coins(10'000));
  payments.max_amount_per_transaction = coins(1'000);
  profiles.push_back(std::move(payments));

  profiles.push_back(make_profile(
      "invoice", "Invoice Agent",
      "Creates invoices, generates payment links, tracks payments", {transfer},
      coins(5'000)));

  auto remittance = make_profile(
      "remittance", "Remittance Agent",
      "Sends cross-border payments, converts currency",
      {transfer, bridge, cctp, gateway}, coins(50'000));
  remittance.allowed_chains = {"ARC-TESTNET",      "ETHEREUM-SEPOLIA",
                               "BASE-SEPOLIA",     "ARBITRUM-SEPOLIA",
                               "POLYGON-AMOY",     "AVALANCHE-FUJI"};
  profiles.push_back(std::move(remittance));

  profiles.push_back(make_profile("defi", "DeFi Agent",
                                  "Makes trades, manages yield, handles swaps",
                                  {transfer, approve, swap}, coins(20'000)));
  profiles.push_back(make_profile("fx", "FX Agent",
                                  "Converts currency, manages exchange rates",
                                  {transfer, swap, convert}, coins(10'000)));
  profiles.push_back(make_profile(
      "commerce", "Commerce Agent",
      "Places orders, tracks deliveries, manages marketplace",
      {transfer, approve}, coins(5'000)));
  profiles.push_back(make_profile(
      "insights", "Insights Agent",
      "Provides spending reports and analytics (read-only)", {}, coins(0)));
  profiles.push_back(make_profile("merchant", "Merchant Agent",
                                  "Processes payments, handles settlements",
                                  {transfer}, coins(20'000)));
  profiles.push_back(make_profile(
      "compliance", "Compliance Agent",
      "Monitors transactions for security (read-only)", {}, coins(0)));

  return profiles;
}

permission_catalog::permission_catalog()
    : permission_catalog(std::vector<leash::schema::agent_profile_t>{}) {}

permission_catalog::permission_catalog(
    const std::vector<leash::schema::agent_profile_t>& extra) {
  for (auto& profile : builtin_profiles()) {
    auto agent_type = profile.agent_type;
    profiles_.insert_or_assign(std::move(agent_type), std::move(profile));
  }
  for (const auto& profile : extra) {
    auto registered = profile;
    registered.known = true;
    spdlog::debug("registering agent profile '{}'", registered.agent_type);
    profiles_.insert_or_assign(registered.agent_type, std::move(registered));
  }
}

leash::schema::agent_profile_t permission_catalog::defaults_for(
    std::string_view agent_type) const {
  auto it = profiles_.find(agent_type);
  if (it == std::end(profiles_)) {
    return leash::schema::agent_profile_t{.agent_type =
                                              std::string{agent_type},
                                          .known = false};
  }
  return it->second;
}

bool permission_catalog::contains(std::string_view agent_type) const {
  return profiles_.find(agent_type) != std::end(profiles_);
}

std::vector<leash::schema::agent_profile_t> permission_catalog::profiles()
    const {
  auto result = std::vector<leash::schema::agent_profile_t>{};
  result.reserve(profiles_.size());
  for (const auto& [_, profile] : profiles_) {
    result.push_back(profile);
  }
  return result;
}

}  // namespace leash::catalog
