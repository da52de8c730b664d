#pragma once

#include <estate/schema/primitives.hpp>

// Schema type: transfer request.
// Settlement workflow: outbound instruction to the external token ledger. The
// ledger answers with (continuation_id, success|failure).
namespace estate::schema {

/// Minimum resource budget attached to a transfer call.
inline constexpr auto kTransferCallBudget = uint64_t{30};
/// Minimum resource budget reserved for the matching callback.
inline constexpr auto kTransferCallbackBudget = uint64_t{20};

template <uint16_t Version>
struct transfer_request;

template <>
struct transfer_request<1> final {
  uint16_t version{1};
  entity_id_t continuation_id{};
  account_id_t recipient;
  account_id_t token_account;
  amount_t amount{};
  uint64_t transfer_budget{kTransferCallBudget};
  uint64_t callback_budget{kTransferCallbackBudget};
};

using transfer_request_t = transfer_request<1>;

}  // namespace estate::schema
