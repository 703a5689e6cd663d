/**
 * @file ApduCodec.cpp
 * @brief Implementation of ApduCodec.
 */

#include "domain/bacnet/ApduCodec.hpp"
#include <cmath>
#include <cstring>
#include <type_traits>

namespace bacnetinventory::domain::bacnet {

namespace {

constexpr std::uint8_t kServiceReadProperty = 0x0C;
constexpr std::uint8_t kPduConfirmedRequest = 0x0;
constexpr std::uint8_t kPduComplexAck = 0x3;
constexpr std::uint8_t kPduError = 0x5;
constexpr std::uint8_t kPduReject = 0x6;
constexpr std::uint8_t kPduAbort = 0x7;
constexpr std::uint8_t kSegmentedFlag = 0x08;

constexpr std::uint8_t kCharsetUtf8 = 0;
constexpr std::uint8_t kCharsetUcs2 = 4;
constexpr std::uint8_t kCharsetIso8859 = 5;

const char* const kReplacement = "\xEF\xBF\xBD";

void AppendUtf8(std::string& out, std::uint32_t cp) {
    if (cp < 0x80) {
        out.push_back(static_cast<char>(cp));
    } else if (cp < 0x800) {
        out.push_back(static_cast<char>(0xC0 | (cp >> 6)));
        out.push_back(static_cast<char>(0x80 | (cp & 0x3F)));
    } else if (cp < 0x10000) {
        out.push_back(static_cast<char>(0xE0 | (cp >> 12)));
        out.push_back(static_cast<char>(0x80 | ((cp >> 6) & 0x3F)));
        out.push_back(static_cast<char>(0x80 | (cp & 0x3F)));
    } else {
        out.push_back(static_cast<char>(0xF0 | (cp >> 18)));
        out.push_back(static_cast<char>(0x80 | ((cp >> 12) & 0x3F)));
        out.push_back(static_cast<char>(0x80 | ((cp >> 6) & 0x3F)));
        out.push_back(static_cast<char>(0x80 | (cp & 0x3F)));
    }
}

/** Copies valid UTF-8 through, replacing each invalid sequence with U+FFFD. */
std::string ValidateUtf8(const std::uint8_t* p, std::size_t n) {
    std::string out;
    out.reserve(n);
    std::size_t i = 0;
    while (i < n) {
        const std::uint8_t b = p[i];
        std::size_t extra = 0;
        std::uint32_t cp = 0;
        std::uint32_t minimum = 0;
        if (b < 0x80) {
            out.push_back(static_cast<char>(b));
            ++i;
            continue;
        } else if ((b & 0xE0) == 0xC0) {
            extra = 1; cp = b & 0x1F; minimum = 0x80;
        } else if ((b & 0xF0) == 0xE0) {
            extra = 2; cp = b & 0x0F; minimum = 0x800;
        } else if ((b & 0xF8) == 0xF0) {
            extra = 3; cp = b & 0x07; minimum = 0x10000;
        } else {
            out += kReplacement;
            ++i;
            continue;
        }

        bool valid = i + extra < n;
        if (valid) {
            for (std::size_t k = 1; k <= extra; ++k) {
                if ((p[i + k] & 0xC0) != 0x80) { valid = false; break; }
                cp = (cp << 6) | (p[i + k] & 0x3F);
            }
        }
        if (!valid || cp < minimum || cp > 0x10FFFF || (cp >= 0xD800 && cp <= 0xDFFF)) {
            out += kReplacement;
            ++i;
            continue;
        }
        AppendUtf8(out, cp);
        i += extra + 1;
    }
    return out;
}

Bytes StartFrame(bool expectingReply) {
    return Bytes{kBvlcType, kBvlcOriginalUnicast, 0x00, 0x00,
                 kNpduVersion, static_cast<std::uint8_t>(expectingReply ? 0x04 : 0x00)};
}

void PutObjectReference(Bytes& frame, const ObjectId& object, std::uint32_t property,
                        const std::optional<std::uint32_t>& arrayIndex) {
    PutTag(frame, 0, true, 4);
    PutU32(frame, object.packed());
    PutUnsignedTagged(frame, 1, true, property);
    if (arrayIndex) {
        PutUnsignedTagged(frame, 2, true, *arrayIndex);
    }
}

/**
 * Reads context tags 0, 1 and optional 2 starting at @p pos.
 * On success @p pos points past the last consumed tag.
 */
bool ReadObjectReference(const Bytes& frame, std::size_t& pos, ObjectId& object,
                         std::uint32_t& property, std::optional<std::uint32_t>& arrayIndex) {
    auto t0 = ReadTag(frame, pos, frame.size());
    if (!t0 || !t0->isContext || t0->number != 0 || t0->length != 4) return false;
    object = ObjectId::FromPacked(ReadUnsigned(&frame[pos + t0->headerSize], 4));
    pos += t0->headerSize + 4;

    auto t1 = ReadTag(frame, pos, frame.size());
    if (!t1 || !t1->isContext || t1->number != 1 || t1->length < 1 || t1->length > 4) return false;
    property = ReadUnsigned(&frame[pos + t1->headerSize], t1->length);
    pos += t1->headerSize + t1->length;

    arrayIndex.reset();
    if (pos < frame.size()) {
        auto t2 = ReadTag(frame, pos, frame.size());
        if (t2 && t2->isContext && !t2->isOpening && !t2->isClosing && t2->number == 2) {
            if (t2->length < 1 || t2->length > 4) return false;
            arrayIndex = ReadUnsigned(&frame[pos + t2->headerSize], t2->length);
            pos += t2->headerSize + t2->length;
        }
    }
    return true;
}

std::uint64_t ReadUnsigned64(const std::uint8_t* p, std::size_t count) {
    std::uint64_t v = 0;
    for (std::size_t i = 0; i < count; ++i) {
        v = (v << 8) | p[i];
    }
    return v;
}

/** Decodes one primitive application value; nullopt for types the inventory ignores. */
std::optional<PropertyValue> DecodeApplicationValue(const Tag& tag, const std::uint8_t* p) {
    switch (tag.number) {
        case AppTag::Boolean:
            return NumberValue{tag.lvt ? 1.0 : 0.0};
        case AppTag::Unsigned:
            if (tag.length < 1 || tag.length > 8) return std::nullopt;
            return NumberValue{static_cast<double>(ReadUnsigned64(p, tag.length))};
        case AppTag::Signed: {
            if (tag.length < 1 || tag.length > 8) return std::nullopt;
            std::uint64_t raw = ReadUnsigned64(p, tag.length);
            const unsigned bits = static_cast<unsigned>(tag.length * 8);
            std::int64_t value = 0;
            if (bits < 64 && (raw & (std::uint64_t{1} << (bits - 1)))) {
                value = static_cast<std::int64_t>(raw) - static_cast<std::int64_t>(std::uint64_t{1} << bits);
            } else {
                value = static_cast<std::int64_t>(raw);
            }
            return NumberValue{static_cast<double>(value)};
        }
        case AppTag::Real: {
            if (tag.length != 4) return std::nullopt;
            std::uint32_t raw = ReadUnsigned(p, 4);
            float f = 0.0f;
            std::memcpy(&f, &raw, sizeof(f));
            return NumberValue{static_cast<double>(f)};
        }
        case AppTag::Double: {
            if (tag.length != 8) return std::nullopt;
            std::uint64_t raw = ReadUnsigned64(p, 8);
            double d = 0.0;
            std::memcpy(&d, &raw, sizeof(d));
            return NumberValue{d};
        }
        case AppTag::CharacterString:
            if (tag.length < 1) return std::nullopt;
            return TextValue{ApduCodec::DecodeCharacterString(p, tag.length)};
        case AppTag::Enumerated:
            if (tag.length < 1 || tag.length > 4) return std::nullopt;
            return EnumeratedValue{ReadUnsigned(p, tag.length)};
        case AppTag::ObjectIdentifier:
            if (tag.length != 4) return std::nullopt;
            return ObjectIdValue{ObjectId::FromPacked(ReadUnsigned(p, 4))};
        default:
            return std::nullopt;
    }
}

} // namespace

Bytes ApduCodec::EncodeReadPropertyRequest(const ReadPropertyRequest& request) {
    Bytes frame = StartFrame(true);
    frame.push_back(kPduConfirmedRequest << 4);
    frame.push_back(0x05);  // max APDU accepted: 1476
    frame.push_back(request.invokeId);
    frame.push_back(kServiceReadProperty);
    PutObjectReference(frame, request.object, request.property, request.arrayIndex);
    FinishBvlc(frame);
    return frame;
}

std::optional<ReadPropertyRequest> ApduCodec::TryDecodeReadPropertyRequest(const Bytes& frame) {
    auto apdu = LocateApdu(frame);
    if (!apdu || *apdu + 4 > frame.size()) return std::nullopt;
    std::size_t pos = *apdu;
    if ((frame[pos] >> 4) != kPduConfirmedRequest || (frame[pos] & kSegmentedFlag)) return std::nullopt;
    if (frame[pos + 3] != kServiceReadProperty) return std::nullopt;

    ReadPropertyRequest request;
    request.invokeId = frame[pos + 2];
    pos += 4;
    if (!ReadObjectReference(frame, pos, request.object, request.property, request.arrayIndex)) {
        return std::nullopt;
    }
    return request;
}

std::optional<ReadPropertyReply> ApduCodec::TryDecodeReply(const Bytes& frame) {
    auto apdu = LocateApdu(frame);
    if (!apdu || *apdu + 3 > frame.size()) return std::nullopt;
    std::size_t pos = *apdu;
    const std::uint8_t pduType = frame[pos] >> 4;

    ReadPropertyReply reply;
    reply.invokeId = frame[pos + 1];

    switch (pduType) {
        case kPduReject:
            reply.kind = ReplyKind::Reject;
            reply.reason = frame[pos + 2];
            return reply;
        case kPduAbort:
            reply.kind = ReplyKind::Abort;
            reply.reason = frame[pos + 2];
            return reply;
        case kPduError: {
            reply.kind = ReplyKind::Error;
            pos += 3;
            auto classTag = ReadTag(frame, pos, frame.size());
            if (classTag && !classTag->isContext && classTag->number == AppTag::Enumerated &&
                classTag->length >= 1 && classTag->length <= 4) {
                reply.errorClass = ReadUnsigned(&frame[pos + classTag->headerSize], classTag->length);
                pos += classTag->headerSize + classTag->length;
                auto codeTag = ReadTag(frame, pos, frame.size());
                if (codeTag && !codeTag->isContext && codeTag->number == AppTag::Enumerated &&
                    codeTag->length >= 1 && codeTag->length <= 4) {
                    reply.errorCode = ReadUnsigned(&frame[pos + codeTag->headerSize], codeTag->length);
                }
            }
            return reply;
        }
        case kPduComplexAck:
            break;
        default:
            return std::nullopt;
    }

    if ((frame[pos] & kSegmentedFlag) || frame[pos + 2] != kServiceReadProperty) {
        reply.kind = ReplyKind::Unsupported;
        return reply;
    }
    pos += 3;

    if (!ReadObjectReference(frame, pos, reply.object, reply.property, reply.arrayIndex)) {
        return std::nullopt;
    }

    auto open = ReadTag(frame, pos, frame.size());
    if (!open || !open->isOpening || open->number != 3) return std::nullopt;
    pos += open->headerSize;

    int depth = 0;
    while (true) {
        auto tag = ReadTag(frame, pos, frame.size());
        if (!tag) return std::nullopt;
        if (tag->isClosing) {
            pos += tag->headerSize;
            if (depth == 0) {
                if (tag->number != 3) return std::nullopt;
                break;
            }
            --depth;
            continue;
        }
        if (tag->isOpening) {
            ++depth;
            pos += tag->headerSize;
            continue;
        }

        const std::uint8_t* content = frame.data() + pos + tag->headerSize;
        if (!tag->isContext && depth == 0) {
            auto value = DecodeApplicationValue(*tag, content);
            if (value) {
                reply.values.push_back(std::move(*value));
            }
        }
        pos += tag->headerSize + tag->length;
    }

    reply.kind = ReplyKind::Ack;
    return reply;
}

Bytes ApduCodec::EncodeReadPropertyAck(const ReadPropertyRequest& request,
                                       const std::vector<PropertyValue>& values) {
    Bytes frame = StartFrame(false);
    frame.push_back(kPduComplexAck << 4);
    frame.push_back(request.invokeId);
    frame.push_back(kServiceReadProperty);
    PutObjectReference(frame, request.object, request.property, request.arrayIndex);

    frame.push_back(0x3E);
    for (const auto& value : values) {
        std::visit([&frame](const auto& v) {
            using T = std::decay_t<decltype(v)>;
            if constexpr (std::is_same_v<T, TextValue>) {
                PutTag(frame, AppTag::CharacterString, false, static_cast<std::uint32_t>(v.text.size() + 1));
                frame.push_back(kCharsetUtf8);
                frame.insert(frame.end(), v.text.begin(), v.text.end());
            } else if constexpr (std::is_same_v<T, NumberValue>) {
                if (v.number >= 0.0 && v.number <= 4294967295.0 && std::floor(v.number) == v.number) {
                    PutUnsignedTagged(frame, AppTag::Unsigned, false, static_cast<std::uint32_t>(v.number));
                } else {
                    float f = static_cast<float>(v.number);
                    std::uint32_t raw = 0;
                    std::memcpy(&raw, &f, sizeof(raw));
                    PutTag(frame, AppTag::Real, false, 4);
                    PutU32(frame, raw);
                }
            } else if constexpr (std::is_same_v<T, EnumeratedValue>) {
                PutUnsignedTagged(frame, AppTag::Enumerated, false, v.code);
            } else {
                PutTag(frame, AppTag::ObjectIdentifier, false, 4);
                PutU32(frame, v.id.packed());
            }
        }, value);
    }
    frame.push_back(0x3F);

    FinishBvlc(frame);
    return frame;
}

Bytes ApduCodec::EncodeError(std::uint8_t invokeId, std::uint32_t errorClass, std::uint32_t errorCode) {
    Bytes frame = StartFrame(false);
    frame.push_back(kPduError << 4);
    frame.push_back(invokeId);
    frame.push_back(kServiceReadProperty);
    PutUnsignedTagged(frame, AppTag::Enumerated, false, errorClass);
    PutUnsignedTagged(frame, AppTag::Enumerated, false, errorCode);
    FinishBvlc(frame);
    return frame;
}

Bytes ApduCodec::EncodeReject(std::uint8_t invokeId, std::uint8_t reason) {
    Bytes frame = StartFrame(false);
    frame.push_back(kPduReject << 4);
    frame.push_back(invokeId);
    frame.push_back(reason);
    FinishBvlc(frame);
    return frame;
}

std::string ApduCodec::DecodeCharacterString(const std::uint8_t* data, std::size_t length) {
    if (length == 0) return "";
    const std::uint8_t charset = data[0];
    const std::uint8_t* p = data + 1;
    const std::size_t n = length - 1;

    std::string out;
    switch (charset) {
        case kCharsetUtf8:
            return ValidateUtf8(p, n);
        case kCharsetUcs2:
            for (std::size_t i = 0; i + 1 < n; i += 2) {
                const std::uint32_t cp = (static_cast<std::uint32_t>(p[i]) << 8) | p[i + 1];
                if (cp >= 0xD800 && cp <= 0xDFFF) {
                    out += kReplacement;
                } else {
                    AppendUtf8(out, cp);
                }
            }
            if (n % 2 != 0) out += kReplacement;
            return out;
        case kCharsetIso8859:
            for (std::size_t i = 0; i < n; ++i) {
                AppendUtf8(out, p[i]);
            }
            return out;
        default:
            return kReplacement;
    }
}

} // namespace bacnetinventory::domain::bacnet
