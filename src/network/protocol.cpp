#include "peerlink/network/protocol.hpp"
#include "peerlink/crypto/hash.hpp"
#include <boost/crc.hpp>
#include <algorithm>

namespace peerlink::network {

namespace {
    constexpr std::size_t HEADER_CRC_OFFSET = MESSAGE_HEADER_SIZE - 4;
    constexpr std::uint32_t MAX_STRING_SIZE = 4096;
    constexpr std::uint32_t MAX_CHECKSUM_SIZE = 64;

    std::uint32_t calculate_crc32(std::span<const std::uint8_t> data) {
        boost::crc_32_type crc;
        crc.process_bytes(data.data(), data.size());
        return crc.checksum();
    }

    // Big-endian integer fields.
    template<typename T>
    void put(std::vector<std::uint8_t>& buffer, T value) {
        for (int shift = static_cast<int>(sizeof(T) - 1) * 8; shift >= 0; shift -= 8) {
            buffer.push_back(static_cast<std::uint8_t>(value >> shift));
        }
    }

    template<typename T>
    T take(std::span<const std::uint8_t>& data) {
        if (data.size() < sizeof(T)) {
            throw ProtocolError("Payload truncated");
        }
        T value = 0;
        for (std::size_t i = 0; i < sizeof(T); ++i) {
            value = static_cast<T>((value << 8) | data[i]);
        }
        data = data.subspan(sizeof(T));
        return value;
    }

    // Length-prefixed byte fields.
    void put_bytes(std::vector<std::uint8_t>& buffer, std::span<const std::uint8_t> bytes) {
        put<std::uint32_t>(buffer, static_cast<std::uint32_t>(bytes.size()));
        buffer.insert(buffer.end(), bytes.begin(), bytes.end());
    }

    void put_string(std::vector<std::uint8_t>& buffer, const std::string& text) {
        put_bytes(buffer, {reinterpret_cast<const std::uint8_t*>(text.data()), text.size()});
    }

    std::span<const std::uint8_t> take_field(std::span<const std::uint8_t>& data, std::uint32_t limit) {
        auto length = take<std::uint32_t>(data);
        if (length > limit) {
            throw ProtocolError("Field of " + std::to_string(length) + " bytes exceeds limit");
        }
        if (data.size() < length) {
            throw ProtocolError("Payload truncated");
        }
        auto field = data.first(length);
        data = data.subspan(length);
        return field;
    }

    std::vector<std::uint8_t> take_bytes(std::span<const std::uint8_t>& data, std::uint32_t limit) {
        auto field = take_field(data, limit);
        return {field.begin(), field.end()};
    }

    std::string take_string(std::span<const std::uint8_t>& data) {
        auto field = take_field(data, MAX_STRING_SIZE);
        return {field.begin(), field.end()};
    }

    void expect_consumed(std::span<const std::uint8_t> rest, const char* what) {
        if (!rest.empty()) {
            throw ProtocolError(std::string("Trailing bytes after ") + what + " payload");
        }
    }
}

std::string to_hex(const JobId& id) {
    return crypto::hash_utils::to_hex(id);
}

std::optional<JobId> job_id_from_hex(const std::string& hex) {
    auto bytes = crypto::hash_utils::from_hex(hex);
    if (!bytes || bytes->size() != JOB_ID_SIZE) {
        return std::nullopt;
    }
    JobId id;
    std::copy(bytes->begin(), bytes->end(), id.begin());
    return id;
}

bool is_known_message_type(std::uint8_t raw) {
    switch (static_cast<MessageType>(raw)) {
        case MessageType::HELLO:
        case MessageType::HEARTBEAT:
        case MessageType::FILE_START:
        case MessageType::CHUNK:
        case MessageType::CHUNK_ACK:
        case MessageType::FILE_COMPLETE:
        case MessageType::FILE_ABORT:
            return true;
    }
    return false;
}

const char* to_string(MessageType type) {
    switch (type) {
        case MessageType::HELLO:         return "HELLO";
        case MessageType::HEARTBEAT:     return "HEARTBEAT";
        case MessageType::FILE_START:    return "FILE_START";
        case MessageType::CHUNK:         return "CHUNK";
        case MessageType::CHUNK_ACK:     return "CHUNK_ACK";
        case MessageType::FILE_COMPLETE: return "FILE_COMPLETE";
        case MessageType::FILE_ABORT:    return "FILE_ABORT";
    }
    return "UNKNOWN";
}

const char* to_string(ChecksumAlgorithm algorithm) {
    switch (algorithm) {
        case ChecksumAlgorithm::BLAKE2B_256: return "blake2b";
        case ChecksumAlgorithm::CRC32:       return "crc32";
    }
    return "unknown";
}

std::optional<ChecksumAlgorithm> parse_checksum_algorithm(const std::string& name) {
    if (name == "blake2b" || name == "blake2b-256") {
        return ChecksumAlgorithm::BLAKE2B_256;
    }
    if (name == "crc32") {
        return ChecksumAlgorithm::CRC32;
    }
    return std::nullopt;
}

const char* to_string(ReasonCode code) {
    switch (code) {
        case ReasonCode::NONE:              return "none";
        case ReasonCode::CANCELLED:         return "cancelled";
        case ReasonCode::PAUSED:            return "paused";
        case ReasonCode::RETRIES_EXHAUSTED: return "retries exhausted";
        case ReasonCode::CHECKSUM_MISMATCH: return "checksum mismatch";
        case ReasonCode::DISK_FULL:         return "disk full";
        case ReasonCode::PERMISSION_DENIED: return "permission denied";
        case ReasonCode::WRITE_FAILED:      return "write failed";
        case ReasonCode::READ_FAILED:       return "read failed";
        case ReasonCode::PROTOCOL_ERROR:    return "protocol error";
        case ReasonCode::TIMEOUT:           return "timeout";
        case ReasonCode::REJECTED:          return "rejected";
        case ReasonCode::INTERNAL_ERROR:    return "internal error";
    }
    return "unknown";
}

MessageHeader::MessageHeader()
    : magic(PROTOCOL_MAGIC)
    , version(PROTOCOL_VERSION)
    , type(MessageType::HEARTBEAT)
    , flags(0)
    , job_id{}
    , payload_size(0)
    , header_crc(0) {
}

MessageHeader::MessageHeader(MessageType msg_type, const JobId& id, std::uint32_t payload_len)
    : magic(PROTOCOL_MAGIC)
    , version(PROTOCOL_VERSION)
    , type(msg_type)
    , flags(0)
    , job_id(id)
    , payload_size(payload_len)
    , header_crc(0) {
}

std::vector<std::uint8_t> MessageHeader::serialize() const {
    std::vector<std::uint8_t> buffer;
    buffer.reserve(MESSAGE_HEADER_SIZE);

    put<std::uint32_t>(buffer, magic);
    put<std::uint16_t>(buffer, version);
    buffer.push_back(static_cast<std::uint8_t>(type));
    buffer.push_back(flags);
    buffer.insert(buffer.end(), job_id.begin(), job_id.end());
    put<std::uint32_t>(buffer, payload_size);
    put<std::uint32_t>(buffer, calculate_crc32(std::span(buffer.data(), HEADER_CRC_OFFSET)));

    return buffer;
}

MessageHeader MessageHeader::deserialize(std::span<const std::uint8_t> data) {
    if (data.size() < MESSAGE_HEADER_SIZE) {
        throw ProtocolError("Insufficient data for message header");
    }

    MessageHeader header;
    auto span = data.first(MESSAGE_HEADER_SIZE);

    header.magic = take<std::uint32_t>(span);
    if (header.magic != PROTOCOL_MAGIC) {
        throw ProtocolError("Bad protocol magic");
    }

    header.version = take<std::uint16_t>(span);
    if (header.version != PROTOCOL_VERSION) {
        throw ProtocolError("Unsupported protocol version " + std::to_string(header.version));
    }

    auto raw_type = take<std::uint8_t>(span);
    header.flags = take<std::uint8_t>(span);
    std::copy(span.begin(), span.begin() + JOB_ID_SIZE, header.job_id.begin());
    span = span.subspan(JOB_ID_SIZE);
    header.payload_size = take<std::uint32_t>(span);
    header.header_crc = take<std::uint32_t>(span);

    if (header.header_crc != calculate_crc32(data.first(HEADER_CRC_OFFSET))) {
        throw ProtocolError("Header CRC mismatch");
    }
    if (!is_known_message_type(raw_type)) {
        throw ProtocolError("Unknown message type " + std::to_string(raw_type));
    }
    if (header.payload_size > MAX_PAYLOAD_SIZE) {
        throw ProtocolError("Payload size " + std::to_string(header.payload_size) + " exceeds limit");
    }

    header.type = static_cast<MessageType>(raw_type);
    return header;
}

std::vector<std::uint8_t> HelloMessage::serialize() const {
    std::vector<std::uint8_t> buffer;
    put_string(buffer, peer_name);
    put<std::uint16_t>(buffer, listen_port);
    return buffer;
}

HelloMessage HelloMessage::deserialize(std::span<const std::uint8_t> data) {
    HelloMessage msg;
    auto span = data;
    msg.peer_name = take_string(span);
    msg.listen_port = take<std::uint16_t>(span);
    expect_consumed(span, "HELLO");
    if (msg.peer_name.empty()) {
        throw ProtocolError("HELLO without peer name");
    }
    return msg;
}

std::vector<std::uint8_t> HeartbeatMessage::serialize() const {
    std::vector<std::uint8_t> buffer;
    put<std::uint64_t>(buffer, timestamp_ms);
    return buffer;
}

HeartbeatMessage HeartbeatMessage::deserialize(std::span<const std::uint8_t> data) {
    HeartbeatMessage msg;
    auto span = data;
    msg.timestamp_ms = take<std::uint64_t>(span);
    expect_consumed(span, "HEARTBEAT");
    return msg;
}

std::vector<std::uint8_t> FileStartMessage::serialize() const {
    std::vector<std::uint8_t> buffer;
    put_string(buffer, filename);
    put<std::uint64_t>(buffer, total_size);
    put<std::uint32_t>(buffer, chunk_size);
    buffer.push_back(static_cast<std::uint8_t>(checksum_algo));
    put<std::uint64_t>(buffer, resume_from_seq);
    put<std::uint32_t>(buffer, static_cast<std::uint32_t>(confirmed_beyond.size()));
    for (auto seq : confirmed_beyond) {
        put<std::uint64_t>(buffer, seq);
    }
    return buffer;
}

FileStartMessage FileStartMessage::deserialize(std::span<const std::uint8_t> data) {
    FileStartMessage msg;
    auto span = data;
    msg.filename = take_string(span);
    msg.total_size = take<std::uint64_t>(span);
    msg.chunk_size = take<std::uint32_t>(span);

    auto algo = take<std::uint8_t>(span);
    if (algo != static_cast<std::uint8_t>(ChecksumAlgorithm::BLAKE2B_256) &&
        algo != static_cast<std::uint8_t>(ChecksumAlgorithm::CRC32)) {
        throw ProtocolError("Unknown checksum algorithm " + std::to_string(algo));
    }
    msg.checksum_algo = static_cast<ChecksumAlgorithm>(algo);

    msg.resume_from_seq = take<std::uint64_t>(span);
    auto count = take<std::uint32_t>(span);
    if (static_cast<std::uint64_t>(count) * 8 > span.size()) {
        throw ProtocolError("Confirmed sequence list truncated");
    }
    msg.confirmed_beyond.reserve(count);
    for (std::uint32_t i = 0; i < count; ++i) {
        msg.confirmed_beyond.push_back(take<std::uint64_t>(span));
    }
    expect_consumed(span, "FILE_START");

    if (msg.chunk_size == 0 || msg.chunk_size > MAX_PAYLOAD_SIZE / 2) {
        throw ProtocolError("Invalid chunk size " + std::to_string(msg.chunk_size));
    }
    return msg;
}

std::vector<std::uint8_t> ChunkMessage::serialize() const {
    std::vector<std::uint8_t> buffer;
    buffer.reserve(payload.size() + checksum.size() + 16);
    put<std::uint64_t>(buffer, sequence);
    put_bytes(buffer, payload);
    put_bytes(buffer, checksum);
    return buffer;
}

ChunkMessage ChunkMessage::deserialize(std::span<const std::uint8_t> data) {
    ChunkMessage msg;
    auto span = data;
    msg.sequence = take<std::uint64_t>(span);
    msg.payload = take_bytes(span, MAX_PAYLOAD_SIZE);
    msg.checksum = take_bytes(span, MAX_CHECKSUM_SIZE);
    expect_consumed(span, "CHUNK");
    return msg;
}

std::vector<std::uint8_t> ChunkAckMessage::serialize() const {
    std::vector<std::uint8_t> buffer;
    put<std::uint64_t>(buffer, sequence);
    buffer.push_back(static_cast<std::uint8_t>(status));
    return buffer;
}

ChunkAckMessage ChunkAckMessage::deserialize(std::span<const std::uint8_t> data) {
    ChunkAckMessage msg;
    auto span = data;
    msg.sequence = take<std::uint64_t>(span);
    auto status = take<std::uint8_t>(span);
    if (status > static_cast<std::uint8_t>(AckStatus::CHECKSUM_MISMATCH)) {
        throw ProtocolError("Unknown ack status " + std::to_string(status));
    }
    msg.status = static_cast<AckStatus>(status);
    expect_consumed(span, "CHUNK_ACK");
    return msg;
}

std::vector<std::uint8_t> FileCompleteMessage::serialize() const {
    std::vector<std::uint8_t> buffer;
    put_bytes(buffer, whole_file_checksum);
    return buffer;
}

FileCompleteMessage FileCompleteMessage::deserialize(std::span<const std::uint8_t> data) {
    FileCompleteMessage msg;
    auto span = data;
    msg.whole_file_checksum = take_bytes(span, MAX_CHECKSUM_SIZE);
    expect_consumed(span, "FILE_COMPLETE");
    return msg;
}

std::vector<std::uint8_t> FileAbortMessage::serialize() const {
    std::vector<std::uint8_t> buffer;
    put<std::uint32_t>(buffer, static_cast<std::uint32_t>(reason));
    return buffer;
}

FileAbortMessage FileAbortMessage::deserialize(std::span<const std::uint8_t> data) {
    FileAbortMessage msg;
    auto span = data;
    msg.reason = static_cast<ReasonCode>(take<std::uint32_t>(span));
    expect_consumed(span, "FILE_ABORT");
    return msg;
}

std::vector<std::uint8_t> Frame::encode() const {
    auto buffer = header.serialize();
    buffer.insert(buffer.end(), payload.begin(), payload.end());
    return buffer;
}

}
