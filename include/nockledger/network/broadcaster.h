// NOCKLEDGER - Transaction Broadcaster Interface
// Copyright (c) 2024 NOCKLEDGER Developers
// MIT License
//
// Outbound side of the peer service. Confirmations flow back in through
// Wallet::OnTransactionConfirmed().

#ifndef NOCKLEDGER_NETWORK_BROADCASTER_H
#define NOCKLEDGER_NETWORK_BROADCASTER_H

#include "nockledger/core/status.h"
#include "nockledger/core/types.h"

#include <vector>

namespace nockledger {
namespace network {

class Broadcaster {
public:
    virtual ~Broadcaster() = default;

    /// Relay the wire encoding of a signed transaction. Failures are
    /// Network errors.
    virtual Status Broadcast(const std::vector<Byte>& txBytes) = 0;
};

} // namespace network
} // namespace nockledger

#endif // NOCKLEDGER_NETWORK_BROADCASTER_H
