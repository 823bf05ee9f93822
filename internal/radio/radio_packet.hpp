#pragma once

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

#include "internal/model/radio.hpp"
#include "internal/util/time.hpp"

namespace awacs::radio {

/*
  Wire format, all integers big-endian:

    0   4  magic "AWRP"
    4   1  version (1)
    5   1  type
    6   8  frequency (Hz)
    14  4  sequence
    18  1  pilot id length N
    19  N  pilot id (UTF-8)
    ..  2  payload length M
    ..  M  payload (one Opus frame for kAudio; u64 frequencies for kHello)
*/
enum class PacketType : std::uint8_t {
  kKeyDown    = 1,
  kAudio      = 2,
  kKeyUp      = 3,
  kDisconnect = 4,
  kHello      = 5,
};

inline constexpr std::uint8_t kPacketVersion   = 1;
inline constexpr std::size_t  kPacketHeaderLen = 19;
inline constexpr std::size_t  kMaxPayloadLen   = 0xFFFF;

// Largest datagram either side sends or reads.
inline constexpr std::size_t kMaxDatagramLen = 2048;

struct RadioPacket {
  PacketType                type{PacketType::kAudio};
  awacs::model::Frequency   frequency{0};
  std::uint32_t             sequence{0};
  std::string               pilot;
  std::vector<std::uint8_t> payload;
};

// Throws util::MalformedRecord when the pilot id or payload exceeds the field sizes.
std::vector<std::uint8_t> EncodePacket(const RadioPacket& packet);

// Largest payload that fits one datagram beside `pilot`; 0 when none does.
std::size_t MaxPayloadFor(const std::string& pilot);

// Throws util::MalformedRecord.
RadioPacket DecodePacket(const std::uint8_t* data, std::size_t size);

// Hello packets carry no radio event.
std::optional<awacs::model::RadioEvent> ToEvent(RadioPacket packet, util::SteadyTime received);

RadioPacket MakeHello(const std::string& unit_name, const std::vector<awacs::model::Frequency>& frequencies);

} // namespace awacs::radio
