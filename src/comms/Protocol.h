#pragma once

#include <stddef.h>
#include <stdint.h>

#include "comms/Messages.h"

/*
===============================================================================
  Protocol.h
===============================================================================

  PURPOSE
  -------
  Encode/decode helpers for the Laptop <-> Nucleo wire protocol.

  Wire format:
    - Newline-delimited JSON (one object per line)

  Encoders write one JSON object into buf WITHOUT the trailing '\n' and
  return its length. They return 0 (and leave buf empty) if the object does
  not fit in cap bytes including the terminator.
===============================================================================
*/

namespace protocol {

/*=============================================================================
  ENCODE (Nucleo -> Laptop)
=============================================================================*/

size_t encodeAck(const AckFrame& a, char* buf, size_t cap);
size_t encodeSample(const SampleFrame& s, char* buf, size_t cap);
size_t encodeEnd(const EndFrame& e, char* buf, size_t cap);
size_t encodeHeartbeat(const HeartbeatFrame& h, char* buf, size_t cap);
size_t encodeLog(const LogFrame& l, char* buf, size_t cap);


/*=============================================================================
  DECODE (Laptop -> Nucleo)
=============================================================================*/

/*
  Attempts to parse one command JSON line.

  Returns:
    - true if decoded into out_cmd (and out_cmd.valid will be true)
    - false otherwise; out_cmd.error says why, and out_cmd.has_seq tells
      whether the sequence number could still be read for a NACK
*/
bool decodeCommandLine(const char* line, CommandFrame& out_cmd);


/*=============================================================================
  HOST SIDE
=============================================================================*/

size_t encodeRunCommand(uint32_t seq, float kp, uint32_t period_ms,
                        char* buf, size_t cap);
size_t encodeStopCommand(uint32_t seq, char* buf, size_t cap);
size_t encodeStatusCommand(uint32_t seq, char* buf, size_t cap);

// Parses one reply line. Returns false for anything that is not a
// well-formed reply (out.type is then UNKNOWN).
bool decodeReplyLine(const char* line, ReplyFrame& out);

}  // namespace protocol
