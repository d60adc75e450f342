#include <cctype>

#include "proto/message.hpp"

namespace xfer
{

static bool starts_with(std::string_view s, std::string_view prefix)
{
    return s.size() >= prefix.size() && s.compare(0, prefix.size(), prefix) == 0;
}

static Message header_field(std::string_view name, std::string_view text)
{
    Message m;
    m.kind  = Kind::HeaderField;
    m.name  = std::string(name);
    m.value = std::string(text.substr(name.size() + 1));  // skip "NAME:"
    return m;
}

// ^(\d{10}):(.+)$ with '.' not matching line terminators
static bool parse_data_chunk(std::string_view text, Chunk &out)
{
    if (text.size() < SEQ_DIGITS + 2)
        return false;
    if (text[SEQ_DIGITS] != ':')
        return false;

    std::uint64_t seq = 0;
    for (std::size_t i = 0; i < SEQ_DIGITS; i++)
    {
        unsigned char c = static_cast<unsigned char>(text[i]);
        if (!std::isdigit(c))
            return false;
        seq = seq * 10 + static_cast<std::uint64_t>(c - '0');
    }

    std::string_view payload = text.substr(SEQ_DIGITS + 1);
    if (payload.find_first_of("\r\n") != std::string_view::npos)
        return false;

    out.seq = seq;
    out.payload.assign(payload.data(), payload.size());
    return true;
}

Message classify(std::string_view text)
{
    Message m;
    if (text == MESSAGE_BEGIN)
    {
        m.kind = Kind::TransferBegin;
        return m;
    }
    if (text == MESSAGE_END)
    {
        m.kind = Kind::TransferEnd;
        return m;
    }
    if (text == HEADER_BEGIN)
    {
        m.kind = Kind::HeaderBegin;
        return m;
    }
    if (text == HEADER_END)
    {
        m.kind = Kind::HeaderEnd;
        return m;
    }

    if (starts_with(text, "LEN:"))
        return header_field(FIELD_LEN, text);
    if (starts_with(text, "HASH:"))
        return header_field(FIELD_HASH, text);

    if (parse_data_chunk(text, m.chunk))
    {
        m.kind = Kind::DataChunk;
        return m;
    }

    m.kind = Kind::Unrecognized;
    return m;
}

const char *kind_name(Kind k)
{
    switch (k)
    {
        case Kind::TransferBegin:
            return "TransferBegin";
        case Kind::HeaderBegin:
            return "HeaderBegin";
        case Kind::HeaderField:
            return "HeaderField";
        case Kind::HeaderEnd:
            return "HeaderEnd";
        case Kind::DataChunk:
            return "DataChunk";
        case Kind::TransferEnd:
            return "TransferEnd";
        case Kind::Unrecognized:
            return "Unrecognized";
    }
    return "?";
}

}  // namespace xfer
