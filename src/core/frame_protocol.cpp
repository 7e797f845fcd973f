#include "core/frame_protocol.hpp"
#include "utils/error_handler.hpp"

namespace sttmon {
namespace core {

void FrameCodec::writeInt32(std::vector<uint8_t>& out, int32_t value) {
    uint32_t bits = static_cast<uint32_t>(value);
    out.push_back(static_cast<uint8_t>(bits & 0xFF));
    out.push_back(static_cast<uint8_t>((bits >> 8) & 0xFF));
    out.push_back(static_cast<uint8_t>((bits >> 16) & 0xFF));
    out.push_back(static_cast<uint8_t>((bits >> 24) & 0xFF));
}

int32_t FrameCodec::readInt32(const uint8_t* data) {
    uint32_t bits = static_cast<uint32_t>(data[0])
                  | (static_cast<uint32_t>(data[1]) << 8)
                  | (static_cast<uint32_t>(data[2]) << 16)
                  | (static_cast<uint32_t>(data[3]) << 24);
    return static_cast<int32_t>(bits);
}

std::vector<uint8_t> FrameCodec::encodeRequest(int32_t checkcode, int32_t requestCode,
                                               const std::string& payload) {
    if (payload.size() > static_cast<size_t>(kMaxPayloadSize)) {
        throw utils::ProtocolException("Payload too large",
                                       std::to_string(payload.size()) + " bytes");
    }
    
    std::vector<uint8_t> frame;
    frame.reserve(kRequestHeaderSize + payload.size());
    writeInt32(frame, checkcode);
    writeInt32(frame, requestCode);
    writeInt32(frame, static_cast<int32_t>(payload.size()));
    frame.insert(frame.end(), payload.begin(), payload.end());
    return frame;
}

std::vector<uint8_t> FrameCodec::encodeResponse(int32_t checkcode, int32_t requestCode,
                                                uint8_t status) {
    std::vector<uint8_t> frame;
    frame.reserve(kResponseSize);
    writeInt32(frame, checkcode);
    writeInt32(frame, requestCode);
    frame.push_back(status);
    return frame;
}

FrameHeader FrameCodec::decodeHeader(const uint8_t* data, size_t size) {
    if (data == nullptr || size < kRequestHeaderSize) {
        throw utils::ProtocolException("Truncated request header",
                                       std::to_string(size) + " bytes");
    }
    
    FrameHeader header;
    header.checkcode = readInt32(data);
    header.requestCode = readInt32(data + 4);
    header.dataSize = readInt32(data + 8);
    
    if (header.dataSize < 0 || header.dataSize > kMaxPayloadSize) {
        throw utils::ProtocolException("Invalid data size",
                                       std::to_string(header.dataSize));
    }
    return header;
}

FrameResponse FrameCodec::decodeResponse(const uint8_t* data, size_t size) {
    if (data == nullptr || size < kResponseSize) {
        throw utils::ProtocolException("Truncated response",
                                       std::to_string(size) + " bytes");
    }
    
    FrameResponse response;
    response.checkcode = readInt32(data);
    response.requestCode = readInt32(data + 4);
    response.status = data[8];
    return response;
}

} // namespace core
} // namespace sttmon
