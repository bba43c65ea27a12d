// DADBS - Serialization Implementation
// Copyright (c) 2024 DADBS Developers
// MIT License

#include <dadbs/core/serialize.h>
#include <dadbs/core/hex.h>

namespace dadbs {

std::string DataStream::ToHex() const {
    return BytesToHex(data_.data() + readPos_, data_.size() - readPos_);
}

} // namespace dadbs
