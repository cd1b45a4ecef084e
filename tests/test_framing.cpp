#include "reverso/framing.hpp"
#include "reverso/util.hpp"
#include "test_support.hpp"

#include <gtest/gtest.h>

#include <chrono>
#include <thread>

using namespace reverso;
using namespace reverso::test;
using namespace std::chrono_literals;

TEST(Framing, MessagesCrossTheSocketIntact) {
  auto pr = transport_pair();
  TcpTransport& a = *pr.first;
  TcpTransport& b = *pr.second;

  send_msg(a, Message::init(2));
  send_msg(a, Message::request(bytes_of("hello")));
  send_msg(b, Message::agree());

  EXPECT_EQ(recv_msg(b), Message::init(2));
  EXPECT_EQ(recv_msg(b), Message::request(bytes_of("hello")));
  EXPECT_EQ(recv_msg(a), Message::agree());
}

TEST(Framing, ShortWritesAreAccumulated) {
  auto pr = transport_pair();
  TcpTransport& a = *pr.first;
  TcpTransport& b = *pr.second;
  Bytes wire = encode(Message::answer(bytes_of("dlrow olleh")));

  std::thread writer([&] {
    for (std::uint8_t byte : wire) {
      a.send_all(&byte, 1);
      std::this_thread::sleep_for(2ms);
    }
  });
  Message m = recv_msg(b);
  writer.join();

  EXPECT_EQ(m, Message::answer(bytes_of("dlrow olleh")));
}

TEST(Framing, HeaderThenBody) {
  auto pr = transport_pair();
  TcpTransport& a = *pr.first;
  TcpTransport& b = *pr.second;
  send_msg(a, Message::request(bytes_of("abc")));

  FrameHeader h = recv_header(b);
  EXPECT_EQ(h.type, MsgType::Request);
  EXPECT_EQ(h.length, 3u);
  EXPECT_EQ(recv_body(b, h).payload, bytes_of("abc"));
}

TEST(Framing, UnknownTagIsProtocolError) {
  auto pr = transport_pair();
  TcpTransport& a = *pr.first;
  TcpTransport& b = *pr.second;
  send_raw(a, Bytes{0x00, 0x07, 0x00, 0x00, 0x00, 0x00});
  EXPECT_THROW(recv_msg(b), ProtocolError);
}

TEST(Framing, OversizedLengthIsProtocolError) {
  auto pr = transport_pair();
  TcpTransport& a = *pr.first;
  TcpTransport& b = *pr.second;
  send_raw(a, Bytes{0x00, 0x03, 0x7F, 0xFF, 0xFF, 0xFF});
  EXPECT_THROW(recv_header(b), ProtocolError);
}

TEST(Framing, CloseBeforeDeclaredLengthIsTransportError) {
  auto pr = transport_pair();
  TcpTransport& a = *pr.first;
  TcpTransport& b = *pr.second;
  send_raw(a, Bytes{0x00, 0x03, 0x00, 0x00, 0x00, 0x0A, 'a', 'b', 'c'});
  a.close();
  EXPECT_THROW(recv_msg(b), TransportError);
}

TEST(Framing, ExpectMsgRejectsOtherKinds) {
  auto pr = transport_pair();
  TcpTransport& a = *pr.first;
  TcpTransport& b = *pr.second;
  send_msg(a, Message::answer(bytes_of("x")));
  EXPECT_THROW(expect_msg(b, MsgType::Agree), ProtocolError);
}

TEST(Framing, ReceiveTimeout) {
  auto pr = transport_pair();
  TcpTransport& b = *pr.second;
  b.set_recv_timeout(100ms);
  auto t0 = std::chrono::steady_clock::now();
  EXPECT_THROW(recv_msg(b), TransportError);
  EXPECT_LT(std::chrono::steady_clock::now() - t0, 5s);
}

TEST(Framing, ShutdownUnblocksAPendingRead) {
  auto pr = transport_pair();
  TcpTransport& b = *pr.second;
  std::thread closer([&] {
    std::this_thread::sleep_for(100ms);
    b.shutdown();
  });
  EXPECT_THROW(recv_msg(b), TransportError);
  closer.join();
}
