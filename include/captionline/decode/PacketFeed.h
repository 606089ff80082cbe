// Repository: captionline
// Component: Packet Feed
// Purpose: Send/receive handshake used to push one packet into a decoder.
// Copyright (c) 2025 captionline authors

#ifndef CAPTIONLINE_DECODE_PACKET_FEED_H_
#define CAPTIONLINE_DECODE_PACKET_FEED_H_

namespace captionline::decode {

struct PacketFeedResult {
  int send_result = 0;  // Last send return; negative on failure
  int drained = 0;      // Frames received while making room
};

// Sends one packet. When the decoder refuses input with `again_code` its
// pending output is drained and the same packet is sent once more. The caller
// must keep the packet referenced until this returns.
//
// SendFn: int() returning the send status.
// DrainFn: int() returning the number of frames received.
template <typename SendFn, typename DrainFn>
PacketFeedResult FeedPacket(SendFn send, DrainFn drain, int again_code) {
  PacketFeedResult result;
  result.send_result = send();
  if (result.send_result == again_code) {
    result.drained = drain();
    result.send_result = send();
  }
  return result;
}

}  // namespace captionline::decode

#endif  // CAPTIONLINE_DECODE_PACKET_FEED_H_
