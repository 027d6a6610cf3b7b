// NOCKLEDGER - Serialization Implementation
// Copyright (c) 2024 NOCKLEDGER Developers
// MIT License

#include "nockledger/core/serialize.h"
#include "nockledger/core/hex.h"

namespace nockledger {

std::string DataStream::ToHex() const {
    return BytesToHex(data_.data() + readPos_, data_.size() - readPos_);
}

} // namespace nockledger
