/**
 * @file WireFormat.cpp
 * @brief Implementation of the BACnet/IP framing primitives.
 */

#include "domain/bacnet/WireFormat.hpp"

namespace bacnetinventory::domain::bacnet {

void PutU16(Bytes& out, std::uint16_t v) {
    out.push_back(static_cast<std::uint8_t>((v >> 8) & 0xFF));
    out.push_back(static_cast<std::uint8_t>(v & 0xFF));
}

void PutU32(Bytes& out, std::uint32_t v) {
    out.push_back(static_cast<std::uint8_t>((v >> 24) & 0xFF));
    out.push_back(static_cast<std::uint8_t>((v >> 16) & 0xFF));
    out.push_back(static_cast<std::uint8_t>((v >> 8) & 0xFF));
    out.push_back(static_cast<std::uint8_t>(v & 0xFF));
}

std::uint32_t ReadUnsigned(const std::uint8_t* p, std::size_t count) {
    std::uint32_t v = 0;
    for (std::size_t i = 0; i < count; ++i) {
        v = (v << 8) | p[i];
    }
    return v;
}

std::optional<Tag> ReadTag(const Bytes& frame, std::size_t pos, std::size_t end) {
    if (end > frame.size() || pos >= end) return std::nullopt;

    Tag tag;
    const std::uint8_t first = frame[pos];
    std::size_t i = pos + 1;

    tag.number = static_cast<std::uint8_t>(first >> 4);
    tag.isContext = (first & 0x08) != 0;
    tag.lvt = static_cast<std::uint8_t>(first & 0x07);

    if (tag.number == 0x0F) {
        if (i >= end) return std::nullopt;
        tag.number = frame[i++];
    }

    if (tag.isContext && tag.lvt == 6) {
        tag.isOpening = true;
    } else if (tag.isContext && tag.lvt == 7) {
        tag.isClosing = true;
    } else if (!tag.isContext && tag.number == AppTag::Boolean) {
        tag.length = 0;
    } else if (tag.lvt == 5) {
        if (i >= end) return std::nullopt;
        const std::uint8_t ext = frame[i++];
        if (ext == 254) {
            if (i + 2 > end) return std::nullopt;
            tag.length = ReadUnsigned(&frame[i], 2);
            i += 2;
        } else if (ext == 255) {
            if (i + 4 > end) return std::nullopt;
            tag.length = ReadUnsigned(&frame[i], 4);
            i += 4;
        } else {
            tag.length = ext;
        }
    } else {
        tag.length = tag.lvt;
    }

    tag.headerSize = i - pos;
    if (static_cast<std::uint64_t>(i) + tag.length > end) return std::nullopt;
    return tag;
}

void PutTag(Bytes& out, std::uint8_t number, bool isContext, std::uint32_t length) {
    std::uint8_t first = isContext ? 0x08 : 0x00;
    const bool extendedNumber = number >= 0x0F;
    first |= static_cast<std::uint8_t>((extendedNumber ? 0x0F : number) << 4);

    if (length <= 4) {
        out.push_back(static_cast<std::uint8_t>(first | length));
        if (extendedNumber) out.push_back(number);
        return;
    }

    out.push_back(static_cast<std::uint8_t>(first | 0x05));
    if (extendedNumber) out.push_back(number);
    if (length <= 253) {
        out.push_back(static_cast<std::uint8_t>(length));
    } else if (length <= 0xFFFF) {
        out.push_back(254);
        PutU16(out, static_cast<std::uint16_t>(length));
    } else {
        out.push_back(255);
        PutU32(out, length);
    }
}

void PutUnsignedTagged(Bytes& out, std::uint8_t number, bool isContext, std::uint32_t value) {
    std::uint32_t len = 1;
    if (value > 0xFFFFFF) len = 4;
    else if (value > 0xFFFF) len = 3;
    else if (value > 0xFF) len = 2;

    PutTag(out, number, isContext, len);
    for (std::uint32_t i = len; i > 0; --i) {
        out.push_back(static_cast<std::uint8_t>((value >> ((i - 1) * 8)) & 0xFF));
    }
}

std::optional<std::size_t> LocateApdu(const Bytes& frame) {
    if (frame.size() < 6 || frame[0] != kBvlcType) return std::nullopt;

    const std::size_t end = frame.size();
    std::size_t i = 4;
    if (frame[1] == 0x04) {
        i += 6;
    }
    if (i + 2 > end || frame[i] != kNpduVersion) return std::nullopt;

    const std::uint8_t control = frame[i + 1];
    i += 2;

    // NPCI order: DNET/DLEN/DADR, SNET/SLEN/SADR, then the hop count.
    const bool hasDestination = (control & 0x20) != 0;
    if (hasDestination) {
        if (i + 3 > end) return std::nullopt;
        const std::uint8_t dlen = frame[i + 2];
        i += 3 + dlen;
    }

    if (control & 0x08) {
        if (i + 3 > end) return std::nullopt;
        const std::uint8_t slen = frame[i + 2];
        i += 3 + slen;
    }

    if (hasDestination) {
        if (i + 1 > end) return std::nullopt;
        i += 1;
    }

    if (control & 0x80) return std::nullopt;
    if (i >= end) return std::nullopt;
    return i;
}

void FinishBvlc(Bytes& frame) {
    if (frame.size() < 4) return;
    const std::uint16_t len = static_cast<std::uint16_t>(frame.size());
    frame[2] = static_cast<std::uint8_t>((len >> 8) & 0xFF);
    frame[3] = static_cast<std::uint8_t>(len & 0xFF);
}

} // namespace bacnetinventory::domain::bacnet
