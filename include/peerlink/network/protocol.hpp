#pragma once

#include <cstdint>
#include <array>
#include <vector>
#include <span>
#include <string>
#include <optional>
#include <concepts>
#include <stdexcept>

namespace peerlink::network {

constexpr std::uint32_t PROTOCOL_MAGIC = 0x504C4E4B; // "PLNK"
constexpr std::uint16_t PROTOCOL_VERSION = 1;
constexpr std::size_t MESSAGE_HEADER_SIZE = 32;
constexpr std::size_t JOB_ID_SIZE = 16;
constexpr std::uint32_t MAX_PAYLOAD_SIZE = 8 * 1024 * 1024;
constexpr std::uint16_t DEFAULT_PORT = 12345;

using JobId = std::array<std::uint8_t, JOB_ID_SIZE>;

constexpr JobId CONNECTION_JOB_ID{};

std::string to_hex(const JobId& id);
std::optional<JobId> job_id_from_hex(const std::string& hex);

// Malformed frame header, unknown message type or undecodable payload.
// Always fatal to the connection it was read from.
class ProtocolError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

enum class MessageType : std::uint8_t {
    HELLO           = 0x01,
    HEARTBEAT       = 0x02,

    FILE_START      = 0x10,
    CHUNK           = 0x11,
    CHUNK_ACK       = 0x12,
    FILE_COMPLETE   = 0x13,
    FILE_ABORT      = 0x14
};

bool is_known_message_type(std::uint8_t raw);
const char* to_string(MessageType type);

enum class ChecksumAlgorithm : std::uint8_t {
    BLAKE2B_256 = 1,
    CRC32       = 2
};

const char* to_string(ChecksumAlgorithm algorithm);
std::optional<ChecksumAlgorithm> parse_checksum_algorithm(const std::string& name);

enum class ReasonCode : std::uint32_t {
    NONE                = 0,
    CANCELLED           = 1,
    PAUSED              = 2,
    RETRIES_EXHAUSTED   = 3,
    CHECKSUM_MISMATCH   = 4,
    DISK_FULL           = 5,
    PERMISSION_DENIED   = 6,
    WRITE_FAILED        = 7,
    READ_FAILED         = 8,
    PROTOCOL_ERROR      = 9,
    TIMEOUT             = 10,
    REJECTED            = 11,
    INTERNAL_ERROR      = 99
};

const char* to_string(ReasonCode code);

struct MessageHeader {
    std::uint32_t magic;
    std::uint16_t version;
    MessageType type;
    std::uint8_t flags;
    JobId job_id;
    std::uint32_t payload_size;
    std::uint32_t header_crc;      // CRC-32 of the preceding 28 bytes

    MessageHeader();
    MessageHeader(MessageType msg_type, const JobId& id, std::uint32_t payload_len);

    std::vector<std::uint8_t> serialize() const;

    // Throws ProtocolError on bad magic, version, CRC, type or size.
    static MessageHeader deserialize(std::span<const std::uint8_t> data);
};

template<typename T>
concept MessagePayload = requires(T t) {
    { T::TYPE } -> std::convertible_to<MessageType>;
    { t.serialize() } -> std::convertible_to<std::vector<std::uint8_t>>;
    { T::deserialize(std::declval<std::span<const std::uint8_t>>()) } -> std::same_as<T>;
};

struct HelloMessage {
    static constexpr MessageType TYPE = MessageType::HELLO;

    std::string peer_name;
    std::uint16_t listen_port;

    std::vector<std::uint8_t> serialize() const;
    static HelloMessage deserialize(std::span<const std::uint8_t> data);
};

struct HeartbeatMessage {
    static constexpr MessageType TYPE = MessageType::HEARTBEAT;

    std::uint64_t timestamp_ms;

    std::vector<std::uint8_t> serialize() const;
    static HeartbeatMessage deserialize(std::span<const std::uint8_t> data);
};

// Sent by the sender to offer a file and echoed back by the receiver with the
// resume point it wants: everything below resume_from_seq plus the listed
// sequences is already on disk.
struct FileStartMessage {
    static constexpr MessageType TYPE = MessageType::FILE_START;

    std::string filename;
    std::uint64_t total_size;
    std::uint32_t chunk_size;
    ChecksumAlgorithm checksum_algo;
    std::uint64_t resume_from_seq;
    std::vector<std::uint64_t> confirmed_beyond;

    std::vector<std::uint8_t> serialize() const;
    static FileStartMessage deserialize(std::span<const std::uint8_t> data);
};

struct ChunkMessage {
    static constexpr MessageType TYPE = MessageType::CHUNK;

    std::uint64_t sequence;
    std::vector<std::uint8_t> payload;
    std::vector<std::uint8_t> checksum;

    std::vector<std::uint8_t> serialize() const;
    static ChunkMessage deserialize(std::span<const std::uint8_t> data);
};

enum class AckStatus : std::uint8_t {
    OK                = 0,
    CHECKSUM_MISMATCH = 1
};

struct ChunkAckMessage {
    static constexpr MessageType TYPE = MessageType::CHUNK_ACK;

    std::uint64_t sequence;
    AckStatus status;

    std::vector<std::uint8_t> serialize() const;
    static ChunkAckMessage deserialize(std::span<const std::uint8_t> data);
};

struct FileCompleteMessage {
    static constexpr MessageType TYPE = MessageType::FILE_COMPLETE;

    std::vector<std::uint8_t> whole_file_checksum;

    std::vector<std::uint8_t> serialize() const;
    static FileCompleteMessage deserialize(std::span<const std::uint8_t> data);
};

struct FileAbortMessage {
    static constexpr MessageType TYPE = MessageType::FILE_ABORT;

    ReasonCode reason;

    std::vector<std::uint8_t> serialize() const;
    static FileAbortMessage deserialize(std::span<const std::uint8_t> data);
};

// A decoded header plus its raw payload, as it travels between the socket
// and the per-job protocol handlers.
struct Frame {
    MessageHeader header;
    std::vector<std::uint8_t> payload;

    MessageType type() const { return header.type; }
    const JobId& job_id() const { return header.job_id; }

    template<MessagePayload T>
    T decode() const {
        if (header.type != T::TYPE) {
            throw ProtocolError(std::string("Frame is ") + to_string(header.type) +
                                ", expected " + to_string(T::TYPE));
        }
        return T::deserialize(payload);
    }

    template<MessagePayload T>
    static Frame make(const JobId& id, const T& message) {
        Frame frame;
        frame.payload = message.serialize();
        frame.header = MessageHeader(T::TYPE, id, static_cast<std::uint32_t>(frame.payload.size()));
        return frame;
    }

    // Header followed by payload, ready for the socket.
    std::vector<std::uint8_t> encode() const;
};

}

static_assert(peerlink::network::MessagePayload<peerlink::network::HelloMessage>);
static_assert(peerlink::network::MessagePayload<peerlink::network::FileStartMessage>);
static_assert(peerlink::network::MessagePayload<peerlink::network::ChunkMessage>);
static_assert(peerlink::network::MessagePayload<peerlink::network::ChunkAckMessage>);
