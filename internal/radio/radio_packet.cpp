#include "internal/radio/radio_packet.hpp"

#include <cstring>

#include "internal/util/errors.hpp"

namespace awacs::radio {

using awacs::util::MalformedRecord;

namespace {

constexpr char kMagic[4] = {'A', 'W', 'R', 'P'};

void PutU16(std::vector<std::uint8_t>& out, std::uint16_t v) {
  out.push_back(static_cast<std::uint8_t>(v >> 8));
  out.push_back(static_cast<std::uint8_t>(v));
}

void PutU32(std::vector<std::uint8_t>& out, std::uint32_t v) {
  for (int shift = 24; shift >= 0; shift -= 8) {
    out.push_back(static_cast<std::uint8_t>(v >> shift));
  }
}

void PutU64(std::vector<std::uint8_t>& out, std::uint64_t v) {
  for (int shift = 56; shift >= 0; shift -= 8) {
    out.push_back(static_cast<std::uint8_t>(v >> shift));
  }
}

std::uint64_t GetBE(const std::uint8_t* p, std::size_t bytes) {
  std::uint64_t v = 0;
  for (std::size_t i = 0; i < bytes; ++i) {
    v = (v << 8) | p[i];
  }
  return v;
}

} // namespace

std::size_t MaxPayloadFor(const std::string& pilot) {
  const std::size_t overhead = kPacketHeaderLen + pilot.size() + 2;
  return overhead >= kMaxDatagramLen ? 0 : kMaxDatagramLen - overhead;
}

std::vector<std::uint8_t> EncodePacket(const RadioPacket& packet) {
  if (packet.pilot.size() > 0xFF) {
    throw MalformedRecord("pilot id longer than 255 bytes");
  }
  if (packet.payload.size() > kMaxPayloadLen) {
    throw MalformedRecord("payload longer than 65535 bytes");
  }

  std::vector<std::uint8_t> out;
  out.reserve(kPacketHeaderLen + packet.pilot.size() + 2 + packet.payload.size());
  out.insert(out.end(), std::begin(kMagic), std::end(kMagic));
  out.push_back(kPacketVersion);
  out.push_back(static_cast<std::uint8_t>(packet.type));
  PutU64(out, packet.frequency);
  PutU32(out, packet.sequence);
  out.push_back(static_cast<std::uint8_t>(packet.pilot.size()));
  out.insert(out.end(), packet.pilot.begin(), packet.pilot.end());
  PutU16(out, static_cast<std::uint16_t>(packet.payload.size()));
  out.insert(out.end(), packet.payload.begin(), packet.payload.end());
  return out;
}

RadioPacket DecodePacket(const std::uint8_t* data, std::size_t size) {
  if (size < kPacketHeaderLen + 2) {
    throw MalformedRecord("radio packet too short: " + std::to_string(size) + " bytes");
  }
  if (std::memcmp(data, kMagic, sizeof(kMagic)) != 0) {
    throw MalformedRecord("radio packet has bad magic");
  }
  if (data[4] != kPacketVersion) {
    throw MalformedRecord("unsupported radio packet version " + std::to_string(data[4]));
  }

  const auto type = data[5];
  if (type < static_cast<std::uint8_t>(PacketType::kKeyDown) || type > static_cast<std::uint8_t>(PacketType::kHello)) {
    throw MalformedRecord("unknown radio packet type " + std::to_string(type));
  }

  RadioPacket packet;
  packet.type      = static_cast<PacketType>(type);
  packet.frequency = GetBE(data + 6, 8);
  packet.sequence  = static_cast<std::uint32_t>(GetBE(data + 14, 4));

  const std::size_t pilot_len = data[18];
  std::size_t       offset    = kPacketHeaderLen;
  if (offset + pilot_len + 2 > size) {
    throw MalformedRecord("radio packet pilot id truncated");
  }
  packet.pilot.assign(reinterpret_cast<const char*>(data + offset), pilot_len);
  offset += pilot_len;

  const std::size_t payload_len = static_cast<std::size_t>(GetBE(data + offset, 2));
  offset += 2;
  if (offset + payload_len != size) {
    throw MalformedRecord("radio packet payload length mismatch");
  }
  packet.payload.assign(data + offset, data + offset + payload_len);

  if (packet.type != PacketType::kHello && (packet.pilot.empty() || packet.frequency == 0)) {
    throw MalformedRecord("radio packet without pilot or frequency");
  }
  return packet;
}

std::optional<awacs::model::RadioEvent> ToEvent(RadioPacket packet, util::SteadyTime received) {
  switch (packet.type) {
    case PacketType::kKeyDown:
      return awacs::model::TransmissionStarted{std::move(packet.pilot), packet.frequency, received};
    case PacketType::kAudio:
      return awacs::model::AudioReceived{std::move(packet.pilot), packet.frequency, std::move(packet.payload), received};
    case PacketType::kKeyUp:
      return awacs::model::TransmissionEnded{std::move(packet.pilot), packet.frequency, received};
    case PacketType::kDisconnect:
      return awacs::model::PilotDisconnected{std::move(packet.pilot), packet.frequency, received};
    case PacketType::kHello:
      return std::nullopt;
  }
  return std::nullopt;
}

RadioPacket MakeHello(const std::string& unit_name, const std::vector<awacs::model::Frequency>& frequencies) {
  RadioPacket packet;
  packet.type  = PacketType::kHello;
  packet.pilot = unit_name;
  for (auto frequency : frequencies) {
    PutU64(packet.payload, frequency);
  }
  return packet;
}

} // namespace awacs::radio
