#include "error.hpp"

namespace tw {

const char* describe(ErrorCode code) noexcept {
    switch (code) {
        case ErrorCode::Ok: return "ok";
        case ErrorCode::ShortBuffer: return "buffer too small for operation";
        case ErrorCode::CrcMismatch: return "CRC32C checksum verification failed";
        case ErrorCode::InvalidMagic: return "invalid magic number in frame header";
        case ErrorCode::UnsupportedVersion: return "unsupported protocol version";
        case ErrorCode::UnexpectedEof: return "unexpected end of frame data";
        case ErrorCode::Overflow: return "integer overflow in calculations";
        case ErrorCode::FlagConflict: return "conflicting flags in frame header";
        case ErrorCode::DecodeInvariant: return "decode invariant violated";
        case ErrorCode::UnsupportedMsgType: return "unsupported message type";
        case ErrorCode::InvalidVarint: return "invalid varint encoding";
    }
    return "unknown error";
}

const char* error_name(ErrorCode code) noexcept {
    switch (code) {
        case ErrorCode::Ok: return "ok";
        case ErrorCode::ShortBuffer: return "short_buffer";
        case ErrorCode::CrcMismatch: return "crc_mismatch";
        case ErrorCode::InvalidMagic: return "invalid_magic";
        case ErrorCode::UnsupportedVersion: return "unsupported_version";
        case ErrorCode::UnexpectedEof: return "unexpected_eof";
        case ErrorCode::Overflow: return "overflow";
        case ErrorCode::FlagConflict: return "flag_conflict";
        case ErrorCode::DecodeInvariant: return "decode_invariant";
        case ErrorCode::UnsupportedMsgType: return "unsupported_msg_type";
        case ErrorCode::InvalidVarint: return "invalid_varint";
    }
    return "unknown";
}

} // namespace tw
