#include <gtest/gtest.h>
#include "peerlink/network/protocol.hpp"

using namespace peerlink::network;

class ProtocolTest : public ::testing::Test {
protected:
    JobId job_id() const {
        JobId id{};
        for (std::size_t i = 0; i < id.size(); ++i) {
            id[i] = static_cast<std::uint8_t>(i + 1);
        }
        return id;
    }
};

TEST_F(ProtocolTest, HeaderLayout) {
    MessageHeader header(MessageType::CHUNK, job_id(), 1234);
    auto bytes = header.serialize();

    ASSERT_EQ(bytes.size(), MESSAGE_HEADER_SIZE);
    EXPECT_EQ(bytes[0], 0x50);
    EXPECT_EQ(bytes[1], 0x4C);
    EXPECT_EQ(bytes[2], 0x4E);
    EXPECT_EQ(bytes[3], 0x4B);
    EXPECT_EQ(bytes[6], static_cast<std::uint8_t>(MessageType::CHUNK));

    auto decoded = MessageHeader::deserialize(bytes);
    EXPECT_EQ(decoded.type, MessageType::CHUNK);
    EXPECT_EQ(decoded.job_id, job_id());
    EXPECT_EQ(decoded.payload_size, 1234u);
}

TEST_F(ProtocolTest, HeaderCrcDetectsCorruption) {
    auto bytes = MessageHeader(MessageType::CHUNK_ACK, job_id(), 9).serialize();
    bytes[10] ^= 0x01;
    EXPECT_THROW(MessageHeader::deserialize(bytes), ProtocolError);
}

TEST_F(ProtocolTest, BadMagicRejected) {
    auto bytes = MessageHeader(MessageType::HEARTBEAT, CONNECTION_JOB_ID, 8).serialize();
    bytes[0] = 'X';
    EXPECT_THROW(MessageHeader::deserialize(bytes), ProtocolError);
}

TEST_F(ProtocolTest, ShortHeaderRejected) {
    auto bytes = MessageHeader(MessageType::HEARTBEAT, CONNECTION_JOB_ID, 8).serialize();
    bytes.resize(MESSAGE_HEADER_SIZE - 1);
    EXPECT_THROW(MessageHeader::deserialize(bytes), ProtocolError);
}

TEST_F(ProtocolTest, OversizedPayloadRejected) {
    auto bytes = MessageHeader(MessageType::CHUNK, job_id(), MAX_PAYLOAD_SIZE + 1).serialize();
    EXPECT_THROW(MessageHeader::deserialize(bytes), ProtocolError);
}

TEST_F(ProtocolTest, UnknownTypeRejected) {
    EXPECT_FALSE(is_known_message_type(0x7F));
    EXPECT_TRUE(is_known_message_type(0x11));
}

TEST_F(ProtocolTest, FileStartCarriesResumePoint) {
    FileStartMessage original{"report.pdf", 10 * 1024 * 1024, 65536, ChecksumAlgorithm::BLAKE2B_256, 64, {66, 70}};

    auto frame = Frame::make(job_id(), original);
    EXPECT_EQ(frame.type(), MessageType::FILE_START);
    EXPECT_EQ(frame.header.payload_size, frame.payload.size());

    auto decoded = frame.decode<FileStartMessage>();
    EXPECT_EQ(decoded.filename, "report.pdf");
    EXPECT_EQ(decoded.total_size, original.total_size);
    EXPECT_EQ(decoded.chunk_size, 65536u);
    EXPECT_EQ(decoded.checksum_algo, ChecksumAlgorithm::BLAKE2B_256);
    EXPECT_EQ(decoded.resume_from_seq, 64u);
    EXPECT_EQ(decoded.confirmed_beyond, (std::vector<std::uint64_t>{66, 70}));
}

TEST_F(ProtocolTest, FileStartRejectsZeroChunkSize) {
    FileStartMessage offer{"a", 10, 0, ChecksumAlgorithm::CRC32, 0, {}};
    EXPECT_THROW(FileStartMessage::deserialize(offer.serialize()), ProtocolError);
}

TEST_F(ProtocolTest, TrailingBytesRejected) {
    auto bytes = ChunkAckMessage{3, AckStatus::OK}.serialize();
    bytes.push_back(0);
    EXPECT_THROW(ChunkAckMessage::deserialize(bytes), ProtocolError);
}

TEST_F(ProtocolTest, TruncatedChunkRejected) {
    ChunkMessage chunk{5, std::vector<std::uint8_t>(100, 0xAB), std::vector<std::uint8_t>(32, 0x01)};
    auto bytes = chunk.serialize();
    bytes.resize(bytes.size() - 10);
    EXPECT_THROW(ChunkMessage::deserialize(bytes), ProtocolError);
}

TEST_F(ProtocolTest, UnknownAckStatusRejected) {
    auto bytes = ChunkAckMessage{3, AckStatus::OK}.serialize();
    bytes.back() = 7;
    EXPECT_THROW(ChunkAckMessage::deserialize(bytes), ProtocolError);
}

TEST_F(ProtocolTest, HelloRequiresName) {
    HelloMessage hello{"", 12345};
    EXPECT_THROW(HelloMessage::deserialize(hello.serialize()), ProtocolError);
}

TEST_F(ProtocolTest, DecodeWrongTypeThrows) {
    auto frame = Frame::make(job_id(), FileAbortMessage{ReasonCode::CANCELLED});
    EXPECT_EQ(frame.decode<FileAbortMessage>().reason, ReasonCode::CANCELLED);
    EXPECT_THROW(frame.decode<ChunkAckMessage>(), ProtocolError);
}

TEST_F(ProtocolTest, EncodeIsHeaderThenPayload) {
    auto frame = Frame::make(job_id(), ChunkAckMessage{42, AckStatus::CHECKSUM_MISMATCH});
    auto wire = frame.encode();

    ASSERT_EQ(wire.size(), MESSAGE_HEADER_SIZE + frame.payload.size());
    auto header = MessageHeader::deserialize(wire);
    EXPECT_EQ(header.type, MessageType::CHUNK_ACK);

    auto ack = ChunkAckMessage::deserialize(std::span(wire).subspan(MESSAGE_HEADER_SIZE));
    EXPECT_EQ(ack.sequence, 42u);
    EXPECT_EQ(ack.status, AckStatus::CHECKSUM_MISMATCH);
}

TEST_F(ProtocolTest, JobIdHex) {
    auto hex = to_hex(job_id());
    EXPECT_EQ(hex, "0102030405060708090a0b0c0d0e0f10");

    auto parsed = job_id_from_hex(hex);
    ASSERT_TRUE(parsed.has_value());
    EXPECT_EQ(*parsed, job_id());
    EXPECT_FALSE(job_id_from_hex("0102").has_value());
}

TEST_F(ProtocolTest, ChecksumAlgorithmNames) {
    EXPECT_EQ(parse_checksum_algorithm("blake2b"), ChecksumAlgorithm::BLAKE2B_256);
    EXPECT_EQ(parse_checksum_algorithm("crc32"), ChecksumAlgorithm::CRC32);
    EXPECT_FALSE(parse_checksum_algorithm("md5").has_value());
}
