#ifndef PODIUM_PODIUM_HPP
#define PODIUM_PODIUM_HPP

// =============================================================================
// Podium - pass trading, outposts and subscriptions
//
//   BondingCurve     unit and batch pass pricing
//   FeeSplitter      protocol / subject / referral shares
//   RedemptionVault  pooled curve prices backing sells
//   PassLedger       per-target supply and last price
//   OutpostRegistry  venues, owners, pause flags
//   SubscriptionBook per-outpost tiers and subscribers
//   Protocol         the context every call runs against
// =============================================================================

#include "types.hpp"
#include "error.hpp"
#include "math.hpp"
#include "config.hpp"
#include "logging.hpp"
#include "curve.hpp"
#include "fees.hpp"
#include "vault.hpp"
#include "ledger.hpp"
#include "ports.hpp"
#include "pass_registry.hpp"
#include "events.hpp"
#include "transaction.hpp"
#include "subscription.hpp"
#include "outpost.hpp"
#include "protocol.hpp"
#include "memory.hpp"

#endif // PODIUM_PODIUM_HPP
