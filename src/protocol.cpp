#include "reverso/protocol.hpp"
#include "reverso/util.hpp"

#include <utility>

namespace reverso {

// ------------------------------ Byte order ------------------------------

static void append_u16(Bytes& out, std::uint16_t v) {
  out.push_back((std::uint8_t)((v >> 8) & 0xFF));
  out.push_back((std::uint8_t)(v & 0xFF));
}
static void append_u32(Bytes& out, std::uint32_t v) {
  out.push_back((std::uint8_t)((v >> 24) & 0xFF));
  out.push_back((std::uint8_t)((v >> 16) & 0xFF));
  out.push_back((std::uint8_t)((v >> 8) & 0xFF));
  out.push_back((std::uint8_t)(v & 0xFF));
}

static std::uint16_t load_u16(const std::uint8_t* p) {
  return (std::uint16_t)((std::uint16_t(p[0]) << 8) | std::uint16_t(p[1]));
}
static std::uint32_t load_u32(const std::uint8_t* p) {
  return (std::uint32_t(p[0]) << 24) |
         (std::uint32_t(p[1]) << 16) |
         (std::uint32_t(p[2]) << 8) |
         (std::uint32_t(p[3]));
}

// ------------------------------ Message ------------------------------

Message Message::init(std::uint32_t block_count) {
  Message m;
  m.type = MsgType::Init;
  m.block_count = block_count;
  return m;
}

Message Message::agree() {
  Message m;
  m.type = MsgType::Agree;
  return m;
}

Message Message::request(Bytes payload) {
  Message m;
  m.type = MsgType::Request;
  m.payload = std::move(payload);
  return m;
}

Message Message::answer(Bytes payload) {
  Message m;
  m.type = MsgType::Answer;
  m.payload = std::move(payload);
  return m;
}

bool Message::operator==(const Message& o) const {
  return type == o.type && block_count == o.block_count && payload == o.payload;
}

bool is_known_type(std::uint16_t tag) {
  return tag >= (std::uint16_t)MsgType::Init && tag <= (std::uint16_t)MsgType::Answer;
}

bool has_length_field(MsgType t) {
  return t != MsgType::Agree;
}

const char* to_string(MsgType t) {
  switch (t) {
    case MsgType::Init:    return "Init";
    case MsgType::Agree:   return "Agree";
    case MsgType::Request: return "Request";
    case MsgType::Answer:  return "Answer";
  }
  return "Unknown";
}

// ------------------------------ Codec ------------------------------

Bytes encode(const Message& m) {
  ensure(is_known_type((std::uint16_t)m.type), "encode: unsupported message type");

  Bytes out;
  switch (m.type) {
    case MsgType::Init:
      append_u16(out, (std::uint16_t)m.type);
      append_u32(out, m.block_count);
      break;
    case MsgType::Agree:
      append_u16(out, (std::uint16_t)m.type);
      break;
    case MsgType::Request:
    case MsgType::Answer:
      ensure(m.payload.size() <= kMaxPayload, "encode: payload too large");
      out.reserve(kHeaderLen + m.payload.size());
      append_u16(out, (std::uint16_t)m.type);
      append_u32(out, (std::uint32_t)m.payload.size());
      out.insert(out.end(), m.payload.begin(), m.payload.end());
      break;
  }
  return out;
}

std::size_t header_len(MsgType t) {
  return has_length_field(t) ? kHeaderLen : kTagLen;
}

Bytes encode_header(const FrameHeader& h) {
  ensure(is_known_type((std::uint16_t)h.type), "encode_header: unsupported message type");
  Bytes out;
  append_u16(out, (std::uint16_t)h.type);
  if (has_length_field(h.type)) append_u32(out, h.length);
  return out;
}

DecodeStatus decode_header(const std::uint8_t* data, std::size_t n, FrameHeader& out) {
  if (n < kTagLen) return DecodeStatus::NeedMoreData;

  const std::uint16_t tag = load_u16(data);
  if (!is_known_type(tag)) return DecodeStatus::Invalid;
  const MsgType type = (MsgType)tag;

  std::uint32_t len = 0;
  if (has_length_field(type)) {
    if (n < kHeaderLen) return DecodeStatus::NeedMoreData;
    len = load_u32(data + kTagLen);
    // Init carries a count, not a size, so it is not capped.
    if (type != MsgType::Init && len > kMaxPayload) return DecodeStatus::Invalid;
  }

  out.type = type;
  out.length = len;
  return DecodeStatus::Ok;
}

DecodeResult decode(const std::uint8_t* data, std::size_t n) {
  DecodeResult r;
  FrameHeader h;
  r.status = decode_header(data, n, h);
  if (r.status != DecodeStatus::Ok) return r;

  switch (h.type) {
    case MsgType::Agree:
      r.msg = Message::agree();
      r.consumed = kTagLen;
      return r;
    case MsgType::Init:
      r.msg = Message::init(h.length);
      r.consumed = kHeaderLen;
      return r;
    case MsgType::Request:
    case MsgType::Answer:
      break;
  }

  if (n - kHeaderLen < h.length) {
    r.status = DecodeStatus::NeedMoreData;
    return r;
  }

  Bytes payload(data + kHeaderLen, data + kHeaderLen + h.length);
  r.msg = (h.type == MsgType::Request) ? Message::request(std::move(payload))
                                       : Message::answer(std::move(payload));
  r.consumed = kHeaderLen + h.length;
  return r;
}

DecodeResult decode(const Bytes& data) {
  return decode(data.data(), data.size());
}

} // namespace reverso
