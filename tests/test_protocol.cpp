#include "reverso/protocol.hpp"

#include <gtest/gtest.h>

#include <stdexcept>
#include <string>
#include <vector>

using namespace reverso;

static Bytes B(const std::string& s) { return Bytes(s.begin(), s.end()); }

static std::vector<Message> sample_messages() {
  return {
    Message::init(0),
    Message::init(3),
    Message::init(0xFFFFFFFFu),
    Message::agree(),
    Message::request(Bytes{}),
    Message::request(B("hello")),
    Message::answer(B("olleh")),
    Message::answer(B(std::string(1000, 'x'))),
  };
}

TEST(Protocol, InitWireLayout) {
  Bytes wire = encode(Message::init(3));
  EXPECT_EQ(wire, (Bytes{0x00, 0x01, 0x00, 0x00, 0x00, 0x03}));
}

TEST(Protocol, AgreeIsTwoBytes) {
  EXPECT_EQ(encode(Message::agree()), (Bytes{0x00, 0x02}));
}

TEST(Protocol, RequestAndAnswerLayout) {
  Bytes req = encode(Message::request(B("ab")));
  EXPECT_EQ(req, (Bytes{0x00, 0x03, 0x00, 0x00, 0x00, 0x02, 'a', 'b'}));

  Bytes ans = encode(Message::answer(B("ba")));
  EXPECT_EQ(ans, (Bytes{0x00, 0x04, 0x00, 0x00, 0x00, 0x02, 'b', 'a'}));
}

TEST(Protocol, LengthIsBigEndian) {
  Bytes wire = encode(Message::request(Bytes(0x0102, 'a')));
  ASSERT_GE(wire.size(), kHeaderLen);
  EXPECT_EQ(wire[2], 0x00);
  EXPECT_EQ(wire[3], 0x00);
  EXPECT_EQ(wire[4], 0x01);
  EXPECT_EQ(wire[5], 0x02);
}

TEST(Protocol, DecodeInvertsEncode) {
  for (const auto& m : sample_messages()) {
    Bytes wire = encode(m);
    DecodeResult r = decode(wire);
    ASSERT_EQ(r.status, DecodeStatus::Ok) << to_string(m.type);
    EXPECT_EQ(r.msg, m);
    EXPECT_EQ(r.consumed, wire.size());
  }
}

TEST(Protocol, EveryStrictPrefixNeedsMoreData) {
  for (const auto& m : sample_messages()) {
    Bytes wire = encode(m);
    for (std::size_t n = 0; n < wire.size(); ++n) {
      DecodeResult r = decode(wire.data(), n);
      EXPECT_EQ(r.status, DecodeStatus::NeedMoreData)
          << to_string(m.type) << " prefix of " << n << " bytes";
    }
  }
}

TEST(Protocol, TrailingBytesAreLeftForTheCaller) {
  Bytes wire = encode(Message::request(B("abc")));
  Bytes next = encode(Message::agree());
  wire.insert(wire.end(), next.begin(), next.end());

  DecodeResult r = decode(wire);
  ASSERT_EQ(r.status, DecodeStatus::Ok);
  EXPECT_EQ(r.msg, Message::request(B("abc")));
  EXPECT_EQ(r.consumed, kHeaderLen + 3);

  DecodeResult r2 = decode(wire.data() + r.consumed, wire.size() - r.consumed);
  ASSERT_EQ(r2.status, DecodeStatus::Ok);
  EXPECT_EQ(r2.msg, Message::agree());
}

TEST(Protocol, UnknownTagIsInvalid) {
  EXPECT_EQ(decode(Bytes{0x00, 0x00}).status, DecodeStatus::Invalid);
  EXPECT_EQ(decode(Bytes{0x00, 0x05, 0x00, 0x00, 0x00, 0x00}).status, DecodeStatus::Invalid);
  EXPECT_EQ(decode(Bytes{0xFF, 0xFF}).status, DecodeStatus::Invalid);
}

TEST(Protocol, OversizedLengthIsInvalid) {
  Bytes wire{0x00, 0x03, 0xFF, 0xFF, 0xFF, 0xFF};
  EXPECT_EQ(decode(wire).status, DecodeStatus::Invalid);

  Bytes just_over{0x00, 0x04, 0x01, 0x00, 0x00, 0x01};  // kMaxPayload + 1
  EXPECT_EQ(decode(just_over).status, DecodeStatus::Invalid);
}

TEST(Protocol, InitCountIsNotAPayloadLength) {
  DecodeResult r = decode(Bytes{0x00, 0x01, 0xFF, 0xFF, 0xFF, 0xFF});
  ASSERT_EQ(r.status, DecodeStatus::Ok);
  EXPECT_EQ(r.msg.block_count, 0xFFFFFFFFu);
}

TEST(Protocol, HeaderDecodesAheadOfThePayload) {
  Bytes wire = encode(Message::request(B("abc")));
  FrameHeader h;
  EXPECT_EQ(decode_header(wire.data(), 1, h), DecodeStatus::NeedMoreData);
  EXPECT_EQ(decode_header(wire.data(), 5, h), DecodeStatus::NeedMoreData);
  ASSERT_EQ(decode_header(wire.data(), kHeaderLen, h), DecodeStatus::Ok);
  EXPECT_EQ(h.type, MsgType::Request);
  EXPECT_EQ(h.length, 3u);
  EXPECT_EQ(encode_header(h), Bytes(wire.begin(), wire.begin() + kHeaderLen));

  Bytes agree = encode(Message::agree());
  ASSERT_EQ(decode_header(agree.data(), agree.size(), h), DecodeStatus::Ok);
  EXPECT_EQ(h.type, MsgType::Agree);
  EXPECT_EQ(header_len(h.type), kTagLen);
  EXPECT_EQ(encode_header(h), agree);

  Bytes big{0x00, 0x04, 0x01, 0x00, 0x00, 0x01};
  EXPECT_EQ(decode_header(big.data(), big.size(), h), DecodeStatus::Invalid);
  Bytes unknown{0x00, 0x09};
  EXPECT_EQ(decode_header(unknown.data(), unknown.size(), h), DecodeStatus::Invalid);
}

TEST(Protocol, PayloadIsOpaqueToTheCodec) {
  Bytes raw{0x00, 0xFF, 0x80, '\n'};
  DecodeResult r = decode(encode(Message::answer(raw)));
  ASSERT_EQ(r.status, DecodeStatus::Ok);
  EXPECT_EQ(r.msg.payload, raw);
}

TEST(Protocol, EncodeRejectsUnknownType) {
  Message m;
  m.type = (MsgType)9;
  EXPECT_THROW(encode(m), std::runtime_error);
}

TEST(Protocol, KnownTypes) {
  EXPECT_FALSE(is_known_type(0));
  EXPECT_TRUE(is_known_type(1));
  EXPECT_TRUE(is_known_type(4));
  EXPECT_FALSE(is_known_type(5));
  EXPECT_FALSE(has_length_field(MsgType::Agree));
  EXPECT_TRUE(has_length_field(MsgType::Init));
  EXPECT_STREQ(to_string(MsgType::Request), "Request");
}
