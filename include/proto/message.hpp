#pragma once
#include <cstddef>
#include <cstdint>
#include <string>
#include <string_view>

/*
TX (one QR code per line):
  -----BEGIN XFER MESSAGE-----
  -----BEGIN XFER HEADER-----
  LEN:<chunk count>
  HASH:<hex digest of the whole buffer>
  -----END XFER HEADER-----
  0000000000:<base64 of bytes [0, n)>
  0000000001:<base64 of bytes [n, 2n)>
  ...
  -----END XFER MESSAGE-----

RX:
scanner.on_decode(text)
  -> classify(text)            // stateless, never fails
      -> session.apply(Message) // state machine, chunk store
           -> TransferEnd ? reassemble + verify -> Result
*/

namespace xfer
{

// --- Protocol constants ---
inline constexpr std::string_view MESSAGE_BEGIN = "-----BEGIN XFER MESSAGE-----";
inline constexpr std::string_view MESSAGE_END   = "-----END XFER MESSAGE-----";
inline constexpr std::string_view HEADER_BEGIN  = "-----BEGIN XFER HEADER-----";
inline constexpr std::string_view HEADER_END    = "-----END XFER HEADER-----";
inline constexpr std::string_view FIELD_LEN     = "LEN";
inline constexpr std::string_view FIELD_HASH    = "HASH";
inline constexpr std::size_t      SEQ_DIGITS    = 10;
inline constexpr std::uint64_t    MAX_SEQUENCE  = 9999999999ULL;  // 10 decimal digits

struct Chunk
{
    std::uint64_t seq{0};
    std::string   payload;  // base64 text, decoded only at reassembly
};

enum class Kind
{
    TransferBegin,
    HeaderBegin,
    HeaderField,
    HeaderEnd,
    DataChunk,
    TransferEnd,
    Unrecognized
};

struct Message
{
    Kind        kind{Kind::Unrecognized};
    std::string name;   // HeaderField: "LEN" or "HASH"
    std::string value;  // HeaderField: text after the first ':'
    Chunk       chunk;  // DataChunk
};

// Total over all strings: junk comes back as Kind::Unrecognized.
Message     classify(std::string_view text);
const char *kind_name(Kind k);

}  // namespace xfer
