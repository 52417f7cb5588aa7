#pragma once

#include <cstdint>
#include <string>
#include <string_view>

namespace roipack::archive::format {

inline constexpr std::uint32_t kLocalHeaderSignature   = 0x04034b50;
inline constexpr std::uint32_t kCentralHeaderSignature = 0x02014b50;
inline constexpr std::uint32_t kEndOfCentralSignature  = 0x06054b50;

inline constexpr std::size_t kLocalHeaderSize   = 30;
inline constexpr std::size_t kCentralHeaderSize = 46;
inline constexpr std::size_t kEndOfCentralSize  = 22;

inline constexpr std::uint16_t kVersionNeeded  = 20;
inline constexpr std::uint16_t kMethodStored   = 0;
inline constexpr std::uint16_t kMethodDeflated = 8;

inline void PutU16(std::string& out, std::uint16_t v) {
  out.push_back(static_cast<char>(v & 0xFF));
  out.push_back(static_cast<char>((v >> 8) & 0xFF));
}

inline void PutU32(std::string& out, std::uint32_t v) {
  PutU16(out, static_cast<std::uint16_t>(v & 0xFFFF));
  PutU16(out, static_cast<std::uint16_t>(v >> 16));
}

// Callers bounds-check before reading.
inline std::uint16_t GetU16(std::string_view in, std::size_t at) {
  return static_cast<std::uint16_t>(static_cast<unsigned char>(in[at]) | (static_cast<unsigned char>(in[at + 1]) << 8));
}

inline std::uint32_t GetU32(std::string_view in, std::size_t at) {
  return static_cast<std::uint32_t>(GetU16(in, at)) | (static_cast<std::uint32_t>(GetU16(in, at + 2)) << 16);
}

} // namespace roipack::archive::format
