#pragma once
#include "reverso.hpp"
#include <cstddef>
#include <cstdint>
#include <string>

namespace reverso {

static constexpr std::size_t kTagLen = 2;
static constexpr std::size_t kHeaderLen = 6;               // tag + u32 length
static constexpr std::uint32_t kMaxPayload = 16 * 1024 * 1024;

enum class MsgType : std::uint16_t {
  Init    = 1,  // c->s: number of blocks that follow
  Agree   = 2,  // s->c: handshake accepted
  Request = 3,  // c->s: text to reverse
  Answer  = 4   // s->c: reversed text
};

struct Message {
  MsgType type{MsgType::Agree};
  std::uint32_t block_count{0};  // Init only
  Bytes payload;                 // Request / Answer only

  static Message init(std::uint32_t block_count);
  static Message agree();
  static Message request(Bytes payload);
  static Message answer(Bytes payload);

  bool operator==(const Message& o) const;
  bool operator!=(const Message& o) const { return !(*this == o); }
};

struct FrameHeader {
  MsgType type{MsgType::Agree};
  std::uint32_t length{0};  // block count for Init, payload size for Request/Answer
};

enum class DecodeStatus { Ok, NeedMoreData, Invalid };

struct DecodeResult {
  DecodeStatus status{DecodeStatus::NeedMoreData};
  Message msg;
  std::size_t consumed{0};  // bytes used by msg when status == Ok
};

bool is_known_type(std::uint16_t tag);

// Init, Request and Answer carry a u32 after the tag; Agree does not.
bool has_length_field(MsgType t);

const char* to_string(MsgType t);

// kTagLen for Agree, kHeaderLen for the others.
std::size_t header_len(MsgType t);

// Wire bytes of h alone, without any payload.
Bytes encode_header(const FrameHeader& h);

// Parses the header at the front of data into out. NeedMoreData until the
// whole header is present; Invalid on an unknown tag or a Request/Answer
// length over kMaxPayload.
DecodeStatus decode_header(const std::uint8_t* data, std::size_t n, FrameHeader& out);

// Wire bytes for m. Throws on an unknown type or oversized payload.
Bytes encode(const Message& m);

// Decodes one message from the front of data. Never throws on short input.
DecodeResult decode(const std::uint8_t* data, std::size_t n);
DecodeResult decode(const Bytes& data);

} // namespace reverso
