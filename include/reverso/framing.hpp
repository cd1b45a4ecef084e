#pragma once
#include "protocol.hpp"
#include <cstdint>

namespace reverso {

class ITransport;

// Writes encode(m) in one go.
void send_msg(ITransport& t, const Message& m);

// Reads the tag and, for kinds that carry one, the u32 that follows.
// Throws ProtocolError on an unknown tag or a payload length over kMaxPayload.
FrameHeader recv_header(ITransport& t);

// Reads the payload announced by h (nothing for Init/Agree) and decodes it.
Message recv_body(ITransport& t, const FrameHeader& h);

// recv_body(t, recv_header(t))
Message recv_msg(ITransport& t);

// Receives one message and requires it to be of kind want.
Message expect_msg(ITransport& t, MsgType want);

} // namespace reverso
