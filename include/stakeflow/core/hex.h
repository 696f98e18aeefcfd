// STAKEFLOW - Hex Encoding/Decoding Utilities
// Copyright (c) 2024 STAKEFLOW Developers
// MIT License

#ifndef STAKEFLOW_CORE_HEX_H
#define STAKEFLOW_CORE_HEX_H

#include <cstddef>
#include <cstdint>
#include <stdexcept>
#include <string>
#include <vector>

namespace stakeflow {

/// Convert bytes to lowercase hex string
std::string BytesToHex(const uint8_t* data, size_t len);
std::string BytesToHex(const std::vector<uint8_t>& data);

/// Convert hex string to bytes; throws std::invalid_argument on bad input
std::vector<uint8_t> HexToBytes(const std::string& hex);

/// Check if string is valid hex (non-empty, even length)
bool IsValidHex(const std::string& str);

/// Strip a leading "0x" / "0X" if present
std::string StripHexPrefix(const std::string& str);

} // namespace stakeflow

#endif // STAKEFLOW_CORE_HEX_H
