#undef NDEBUG
#include <cassert>
#include <iostream>
#include <string>
#include "domain/PointText.hpp"
#include "domain/bacnet/ApduCodec.hpp"

using namespace bacnetinventory::domain;
using namespace bacnetinventory::domain::bacnet;

static ReadPropertyRequest MakeRequest(std::uint8_t invokeId, ObjectId object, std::uint32_t property,
                                       std::optional<std::uint32_t> index = std::nullopt) {
    ReadPropertyRequest request;
    request.invokeId = invokeId;
    request.object = object;
    request.property = property;
    request.arrayIndex = index;
    return request;
}

static void TestRequestEncoding() {
    std::cout << "[Test] ReadProperty request layout..." << std::endl;
    auto frame = ApduCodec::EncodeReadPropertyRequest(MakeRequest(9, ObjectId{8, 1234}, 76, 0u));

    assert(frame[0] == 0x81 && frame[1] == 0x0A);
    assert(frame[2] * 256 + frame[3] == static_cast<int>(frame.size()));
    assert(frame[4] == 0x01 && frame[5] == 0x04);           // expecting reply
    assert(frame[6] == 0x00 && frame[7] == 0x05);           // confirmed request, max APDU 1476
    assert(frame[8] == 9 && frame[9] == 0x0C);              // invoke id, ReadProperty
    assert(frame[10] == 0x0C);                              // context 0, length 4
    assert(frame[15] == 0x19 && frame[16] == 76);           // context 1, property
    assert(frame[17] == 0x29 && frame[18] == 0);            // context 2, array index
    assert(frame.size() == 19);

    auto decoded = ApduCodec::TryDecodeReadPropertyRequest(frame);
    assert(decoded.has_value());
    assert(decoded->invokeId == 9);
    assert(decoded->object == (ObjectId{8, 1234}));
    assert(decoded->property == 76);
    assert(decoded->arrayIndex && *decoded->arrayIndex == 0);

    auto noIndex = ApduCodec::TryDecodeReadPropertyRequest(
        ApduCodec::EncodeReadPropertyRequest(MakeRequest(200, ObjectId{19, 3}, 110)));
    assert(noIndex.has_value());
    assert(!noIndex->arrayIndex.has_value());
    assert(noIndex->property == 110);
}

static void TestAckDecoding() {
    std::cout << "[Test] ReadProperty-ACK values..." << std::endl;
    const auto request = MakeRequest(17, ObjectId{0, 12}, 85);
    auto frame = ApduCodec::EncodeReadPropertyAck(request, {NumberValue{21.5}, NumberValue{40000.0},
                                                           EnumeratedValue{62}, TextValue{"Zone"},
                                                           ObjectIdValue{ObjectId{13, 4}}});
    auto reply = ApduCodec::TryDecodeReply(frame);
    assert(reply.has_value());
    assert(reply->kind == ReplyKind::Ack);
    assert(reply->invokeId == 17);
    assert(reply->object == (ObjectId{0, 12}));
    assert(reply->property == 85);
    assert(reply->values.size() == 5);
    assert(std::get<NumberValue>(reply->values[0]).number == 21.5);
    assert(std::get<NumberValue>(reply->values[1]).number == 40000.0);
    assert(std::get<EnumeratedValue>(reply->values[2]).code == 62);
    assert(std::get<TextValue>(reply->values[3]).text == "Zone");
    assert(std::get<ObjectIdValue>(reply->values[4]).id == (ObjectId{13, 4}));
}

static void TestExtendedLengthString() {
    std::cout << "[Test] Character string longer than 253 bytes..." << std::endl;
    std::string longName(300, 'x');
    longName[0] = 'A';
    longName[299] = 'Z';
    auto frame = ApduCodec::EncodeReadPropertyAck(MakeRequest(1, ObjectId{2, 7}, 77), {TextValue{longName}});
    auto reply = ApduCodec::TryDecodeReply(frame);
    assert(reply && reply->kind == ReplyKind::Ack);
    assert(reply->values.size() == 1);
    assert(std::get<TextValue>(reply->values[0]).text == longName);
}

static void TestErrorRejectAbort() {
    std::cout << "[Test] Error, Reject, Abort and segmented replies..." << std::endl;
    auto error = ApduCodec::TryDecodeReply(ApduCodec::EncodeError(33, 2, 32));
    assert(error && error->kind == ReplyKind::Error);
    assert(error->invokeId == 33);
    assert(error->errorClass == 2 && error->errorCode == 32);

    auto reject = ApduCodec::TryDecodeReply(ApduCodec::EncodeReject(34, 9));
    assert(reject && reject->kind == ReplyKind::Reject);
    assert(reject->invokeId == 34 && reject->reason == 9);

    Bytes abortFrame{0x81, 0x0A, 0x00, 0x09, 0x01, 0x00, 0x70, 35, 4};
    auto abort = ApduCodec::TryDecodeReply(abortFrame);
    assert(abort && abort->kind == ReplyKind::Abort);
    assert(abort->invokeId == 35 && abort->reason == 4);

    auto segmented = ApduCodec::EncodeReadPropertyAck(MakeRequest(36, ObjectId{0, 1}, 77), {TextValue{"A"}});
    segmented[6] |= 0x08;
    auto unsupported = ApduCodec::TryDecodeReply(segmented);
    assert(unsupported && unsupported->kind == ReplyKind::Unsupported);
}

static void TestMalformedReplies() {
    std::cout << "[Test] Malformed replies are rejected..." << std::endl;
    auto frame = ApduCodec::EncodeReadPropertyAck(MakeRequest(5, ObjectId{0, 1}, 77), {TextValue{"Name"}});
    for (std::size_t len = 0; len < frame.size(); ++len) {
        Bytes truncated(frame.begin(), frame.begin() + static_cast<long>(len));
        auto reply = ApduCodec::TryDecodeReply(truncated);
        assert(!reply.has_value() || reply->kind != ReplyKind::Ack);
    }

    // A confirmed request is not a reply.
    auto request = ApduCodec::EncodeReadPropertyRequest(MakeRequest(5, ObjectId{0, 1}, 77));
    assert(!ApduCodec::TryDecodeReply(request).has_value());
    assert(!ApduCodec::TryDecodeReadPropertyRequest(frame).has_value());
}

static void TestCharacterSets() {
    std::cout << "[Test] Character set conversion..." << std::endl;
    const std::uint8_t utf8[] = {0, 'T', 0xC3, 0xA9};
    assert(ApduCodec::DecodeCharacterString(utf8, sizeof(utf8)) == "T\xC3\xA9");

    const std::uint8_t ucs2[] = {4, 0x00, 'A', 0x00, 0xE9};
    assert(ApduCodec::DecodeCharacterString(ucs2, sizeof(ucs2)) == "A\xC3\xA9");

    const std::uint8_t latin1[] = {5, 0xB0, 'C'};
    assert(ApduCodec::DecodeCharacterString(latin1, sizeof(latin1)) == "\xC2\xB0" "C");

    const std::uint8_t brokenUtf8[] = {0, 'A', 0xC3};
    const std::string decoded = ApduCodec::DecodeCharacterString(brokenUtf8, sizeof(brokenUtf8));
    assert(decoded == "A\xEF\xBF\xBD");
    assert(PointText::Sanitize(decoded).empty());

    const std::uint8_t unknownCharset[] = {3, 'a', 'b'};
    assert(ApduCodec::DecodeCharacterString(unknownCharset, sizeof(unknownCharset)) == "\xEF\xBF\xBD");
}

int main() {
    std::cout << "[Test] ApduCodec" << std::endl;
    TestRequestEncoding();
    TestAckDecoding();
    TestExtendedLengthString();
    TestErrorRejectAbort();
    TestMalformedReplies();
    TestCharacterSets();
    std::cout << "[PASS] ApduCodec" << std::endl;
    return 0;
}
