#pragma once

#include <estate/schema/oracle_request.hpp>
#include <estate/schema/transfer_request.hpp>
#include <functional>

namespace estate::execution {

/// Hands a transfer request to the external token ledger. The ledger answers
/// later through `engine::on_transfer_result`; answering from inside the call
/// is allowed.
using transfer_dispatcher_t =
    std::function<void(const estate::schema::transfer_request_t& request)>;

/// Hands a dispute to the oracle account.
using oracle_dispatcher_t =
    std::function<void(const estate::schema::oracle_request_t& request)>;

}  // namespace estate::execution
