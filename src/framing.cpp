#include "reverso/framing.hpp"
#include "reverso/transport.hpp"
#include "reverso/util.hpp"
#include <string>

namespace reverso {

void send_msg(ITransport& t, const Message& m) {
  Bytes wire = encode(m);
  t.send_all(wire.data(), wire.size());
}

FrameHeader recv_header(ITransport& t) {
  std::uint8_t buf[kHeaderLen];
  t.recv_all(buf, kTagLen);

  FrameHeader h;
  DecodeStatus st = decode_header(buf, kTagLen, h);
  if (st == DecodeStatus::Invalid) throw ProtocolError("unknown message type");
  if (st == DecodeStatus::NeedMoreData) {
    t.recv_all(buf + kTagLen, kHeaderLen - kTagLen);
    if (decode_header(buf, kHeaderLen, h) != DecodeStatus::Ok) {
      throw ProtocolError("declared payload length too large");
    }
  }
  return h;
}

Message recv_body(ITransport& t, const FrameHeader& h) {
  // Rebuild the wire image so the codec does the final parse.
  Bytes wire = encode_header(h);
  if (h.type == MsgType::Request || h.type == MsgType::Answer) {
    wire.resize(kHeaderLen + h.length);
    if (h.length) t.recv_all(wire.data() + kHeaderLen, h.length);
  }

  DecodeResult r = decode(wire);
  if (r.status != DecodeStatus::Ok || r.consumed != wire.size()) {
    throw ProtocolError(std::string("malformed ") + to_string(h.type) + " message");
  }
  return r.msg;
}

Message recv_msg(ITransport& t) {
  return recv_body(t, recv_header(t));
}

Message expect_msg(ITransport& t, MsgType want) {
  FrameHeader h = recv_header(t);
  if (h.type != want) {
    throw ProtocolError(std::string("expected ") + to_string(want) + ", got " + to_string(h.type));
  }
  return recv_body(t, h);
}

} // namespace reverso
