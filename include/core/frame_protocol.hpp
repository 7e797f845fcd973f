#pragma once

#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

namespace sttmon {
namespace core {

/**
 * Length-prefixed frame protocol shared by the STT feed, the monitor and
 * the subtitle output server. All integers are little-endian int32.
 *
 *   request:  checkcode | requestCode | dataSize | payload[dataSize]
 *   response: checkcode | requestCode | status (uint8, 0 = OK)
 */
constexpr int32_t kRequestSubtitle = 0x01;
constexpr int32_t kSubtitleResponseCheckcode = 0x01350126;
constexpr uint8_t kStatusOk = 0;
constexpr uint8_t kStatusError = 1;

constexpr size_t kRequestHeaderSize = 12;
constexpr size_t kResponseSize = 9;
constexpr int32_t kMaxPayloadSize = 16 * 1024 * 1024;

struct FrameHeader {
    int32_t checkcode = 0;
    int32_t requestCode = 0;
    int32_t dataSize = 0;
};

struct FrameResponse {
    int32_t checkcode = 0;
    int32_t requestCode = 0;
    uint8_t status = kStatusOk;
};

class FrameCodec {
public:
    // Throws ProtocolException when the payload exceeds kMaxPayloadSize
    static std::vector<uint8_t> encodeRequest(int32_t checkcode, int32_t requestCode,
                                              const std::string& payload);
    static std::vector<uint8_t> encodeResponse(int32_t checkcode, int32_t requestCode,
                                               uint8_t status);

    // Both throw ProtocolException on short input; decodeHeader also on a
    // negative or oversized dataSize
    static FrameHeader decodeHeader(const uint8_t* data, size_t size);
    static FrameResponse decodeResponse(const uint8_t* data, size_t size);

    static void writeInt32(std::vector<uint8_t>& out, int32_t value);
    static int32_t readInt32(const uint8_t* data);
};

} // namespace core
} // namespace sttmon
