#include <gtest/gtest.h>
#include <cstring>
#include "protocol/codec.hpp"
#include "protocol/errors.hpp"

using namespace fdfs;
using namespace fdfs::protocol;

class CodecTest : public ::testing::Test {
protected:
  // Tracker style metadata body: group, ip, port and an optional path index
  Bytes endpoint_body(const std::string& group, const std::string& ip, uint64_t port, bool with_index,
                      uint8_t index = 0) {
    Bytes body;
    put_fixed_string(body, group, GROUP_NAME_MAX_LENGTH, "group name");
    put_fixed_string(body, ip, IP_ADDRESS_LENGTH, "ip address");
    put_uint64(body, port);
    if (with_index) {
      body.push_back(index);
    }
    return body;
  }

  Header response_header(std::size_t length, uint8_t status = 0) {
    return Header{length, static_cast<uint8_t>(Command::RESPONSE), status};
  }

  std::array<uint8_t, HEADER_LENGTH> raw_header(uint64_t length, uint8_t command, uint8_t status) {
    return encode_header(Header{length, command, status});
  }
};

//==============================================
// HEADER
//==============================================

TEST_F(CodecTest, HeaderLayoutIsBigEndian) {
  auto raw = encode_header(Header{0x0102030405060708ULL, 11, 0});

  const uint8_t expected[] = {0x01, 0x02, 0x03, 0x04, 0x05, 0x06, 0x07, 0x08, 11, 0};
  EXPECT_EQ(0, std::memcmp(raw.data(), expected, sizeof(expected)));
}

TEST_F(CodecTest, HeaderRoundTrip) {
  const Header headers[] = {
    {0, 100, 0},
    {40, 101, 2},
    {1ULL << 32, 14, 255},
    {MAX_BODY_LENGTH, 111, 22}
  };
  for (const auto& header : headers) {
    Header decoded = decode_header(encode_header(header));
    EXPECT_EQ(decoded.length, header.length);
    EXPECT_EQ(decoded.command, header.command);
    EXPECT_EQ(decoded.status, header.status);
  }
}

TEST_F(CodecTest, HeaderRejectsNegativeLength) {
  auto raw = raw_header(0x8000000000000000ULL, 100, 0);
  EXPECT_THROW(decode_header(raw), FrameError);
}

TEST_F(CodecTest, HeaderRejectsLengthAboveCeiling) {
  EXPECT_THROW(decode_header(raw_header(MAX_BODY_LENGTH + 1, 100, 0)), FrameError);
  EXPECT_THROW(decode_header(raw_header(1025, 100, 0), 1024), FrameError);
  EXPECT_NO_THROW(decode_header(raw_header(1024, 100, 0), 1024));
}

TEST_F(CodecTest, ResponseCommandChecked) {
  EXPECT_NO_THROW(check_response_header(Header{0, 100, 0}));
  EXPECT_THROW(check_response_header(Header{0, 11, 0}), FrameError);
  // Error answers are judged by their status alone
  EXPECT_NO_THROW(check_response_header(Header{0, 11, 2}));
}

//==============================================
// REQUEST LAYOUTS
//==============================================

TEST_F(CodecTest, QueryStoreWithoutGroupHasEmptyBody) {
  Frame frame = encode(QueryStoreRequest{});
  ASSERT_EQ(frame.size(), HEADER_LENGTH);
  EXPECT_EQ(get_uint64(frame.head.data()), 0u);
  EXPECT_EQ(frame.head[8], static_cast<uint8_t>(Command::QUERY_STORE_WITHOUT_GROUP));
}

TEST_F(CodecTest, QueryStoreWithGroupPadsGroupName) {
  Frame frame = encode(QueryStoreRequest{"group1"});
  Bytes bytes = frame.to_bytes();

  ASSERT_EQ(bytes.size(), HEADER_LENGTH + GROUP_NAME_MAX_LENGTH);
  EXPECT_EQ(bytes[7], GROUP_NAME_MAX_LENGTH);
  EXPECT_EQ(bytes[8], static_cast<uint8_t>(Command::QUERY_STORE_WITH_GROUP));
  EXPECT_EQ(std::string(bytes.begin() + 10, bytes.begin() + 16), "group1");
  for (std::size_t i = 16; i < bytes.size(); ++i) {
    EXPECT_EQ(bytes[i], 0) << "padding byte " << i;
  }
}

TEST_F(CodecTest, QueryFetchCarriesGroupAndFilename) {
  const std::string remote = "M00/00/00/abc.txt";
  Bytes bytes = encode(QueryFetchRequest{"group1", remote}).to_bytes();

  ASSERT_EQ(bytes.size(), HEADER_LENGTH + GROUP_NAME_MAX_LENGTH + remote.size());
  EXPECT_EQ(get_uint64(bytes.data()), GROUP_NAME_MAX_LENGTH + remote.size());
  EXPECT_EQ(bytes[8], static_cast<uint8_t>(Command::QUERY_FETCH_ONE));
  EXPECT_EQ(get_fixed_string(bytes.data() + 10, GROUP_NAME_MAX_LENGTH), "group1");
  EXPECT_EQ(std::string(bytes.begin() + 26, bytes.end()), remote);
}

TEST_F(CodecTest, QueryUpdateUsesItsOwnCommand) {
  Bytes bytes = encode(QueryUpdateRequest{"group1", "M00/00/00/a"}).to_bytes();
  EXPECT_EQ(bytes[8], static_cast<uint8_t>(Command::QUERY_UPDATE));
}

TEST_F(CodecTest, UploadLayout) {
  const Bytes data = {'h', 'e', 'l', 'l', 'o'};
  Frame frame = encode(UploadRequest{3, "txt", data.data(), data.size()});

  ASSERT_EQ(frame.head.size(), HEADER_LENGTH + 1 + 8 + 6);
  EXPECT_EQ(frame.payload, data.data());
  EXPECT_EQ(frame.payload_size, data.size());

  Bytes bytes = frame.to_bytes();
  EXPECT_EQ(get_uint64(bytes.data()), 1 + 8 + 6 + data.size());
  EXPECT_EQ(bytes[8], static_cast<uint8_t>(Command::UPLOAD_FILE));
  EXPECT_EQ(bytes[10], 3);
  EXPECT_EQ(get_uint64(bytes.data() + 11), data.size());
  EXPECT_EQ(get_fixed_string(bytes.data() + 19, FILE_EXT_NAME_MAX_LENGTH), "txt");
  EXPECT_EQ(Bytes(bytes.begin() + 25, bytes.end()), data);
}

TEST_F(CodecTest, EmptyUploadHasNoPayload) {
  Frame frame = encode(UploadRequest{0, "", nullptr, 0});
  EXPECT_EQ(frame.payload_size, 0u);
  EXPECT_EQ(get_uint64(frame.head.data()), 15u);
}

TEST_F(CodecTest, DownloadLayout) {
  Bytes bytes = encode(DownloadRequest{"group1", "M00/00/00/x.bin", 100, 50}).to_bytes();

  EXPECT_EQ(bytes[8], static_cast<uint8_t>(Command::DOWNLOAD_FILE));
  EXPECT_EQ(get_uint64(bytes.data() + 10), 100u);
  EXPECT_EQ(get_uint64(bytes.data() + 18), 50u);
  EXPECT_EQ(get_fixed_string(bytes.data() + 26, GROUP_NAME_MAX_LENGTH), "group1");
  EXPECT_EQ(std::string(bytes.begin() + 42, bytes.end()), "M00/00/00/x.bin");
}

TEST_F(CodecTest, DeleteAndActiveTestCommands) {
  EXPECT_EQ(encode(DeleteRequest{"g", "p"}).head[8], static_cast<uint8_t>(Command::DELETE_FILE));
  Frame active = encode(ActiveTestRequest{});
  EXPECT_EQ(active.size(), HEADER_LENGTH);
  EXPECT_EQ(active.head[8], static_cast<uint8_t>(Command::ACTIVE_TEST));
}

TEST_F(CodecTest, OversizedFieldsRejected) {
  EXPECT_THROW(encode(QueryStoreRequest{"a_group_name_too_long"}), IdentifierError);
  EXPECT_THROW(encode(UploadRequest{0, "toolong", nullptr, 0}), IdentifierError);
}

//==============================================
// RESPONSE LAYOUTS
//==============================================

TEST_F(CodecTest, DecodeStoreTarget) {
  Bytes body = endpoint_body("group1", "10.0.0.7", 23000, true, 4);
  StoreTarget target = Codec<QueryStoreRequest>::decode(response_header(body.size()), body);

  EXPECT_EQ(target.endpoint.group_name, "group1");
  EXPECT_EQ(target.endpoint.address.host, "10.0.0.7");
  EXPECT_EQ(target.endpoint.address.port, 23000);
  EXPECT_EQ(target.store_path_index, 4);
}

TEST_F(CodecTest, DecodeTrimsSpacePadding) {
  Bytes body;
  body.insert(body.end(), {'g', '1', ' ', ' '});
  body.resize(GROUP_NAME_MAX_LENGTH, ' ');
  put_fixed_string(body, "10.0.0.7", IP_ADDRESS_LENGTH, "ip address");
  put_uint64(body, 23000);

  StorageEndpoint endpoint = Codec<QueryFetchRequest>::decode(response_header(body.size()), body);
  EXPECT_EQ(endpoint.group_name, "g1");
}

TEST_F(CodecTest, DecodeRejectsWrongFixedLength) {
  Bytes body = endpoint_body("group1", "10.0.0.7", 23000, false);
  // 39 bytes where a store answer needs 40
  EXPECT_THROW(Codec<QueryStoreRequest>::decode(response_header(body.size()), body), FrameError);

  body.push_back(0);
  EXPECT_THROW(Codec<QueryUpdateRequest>::decode(response_header(body.size()), body), FrameError);
}

TEST_F(CodecTest, DecodeRejectsDeclaredLengthMismatch) {
  Bytes body = endpoint_body("group1", "10.0.0.7", 23000, false);
  EXPECT_THROW(Codec<QueryFetchRequest>::decode(response_header(body.size() + 1), body), FrameError);
  EXPECT_THROW(Codec<DownloadRequest>::decode(response_header(10), Bytes(5)), FrameError);
}

TEST_F(CodecTest, DecodeRejectsInvalidPort) {
  Bytes body = endpoint_body("group1", "10.0.0.7", 70000, false);
  EXPECT_THROW(Codec<QueryFetchRequest>::decode(response_header(body.size()), body), FrameError);
}

TEST_F(CodecTest, DecodeUploadResponse) {
  Bytes body;
  put_fixed_string(body, "group1", GROUP_NAME_MAX_LENGTH, "group name");
  const std::string remote = "M00/00/00/wKgAAF.txt";
  body.insert(body.end(), remote.begin(), remote.end());

  StoredFile stored = Codec<UploadRequest>::decode(response_header(body.size()), body);
  EXPECT_EQ(stored.group_name, "group1");
  EXPECT_EQ(stored.remote_filename, remote);
}

TEST_F(CodecTest, UploadResponseNeedsFilename) {
  Bytes body;
  put_fixed_string(body, "group1", GROUP_NAME_MAX_LENGTH, "group name");
  EXPECT_THROW(Codec<UploadRequest>::decode(response_header(body.size()), body), FrameError);
}

TEST_F(CodecTest, DeleteResponseMustBeEmpty) {
  EXPECT_NO_THROW(Codec<DeleteRequest>::decode(response_header(0), Bytes{}));
  EXPECT_THROW(Codec<DeleteRequest>::decode(response_header(1), Bytes(1)), FrameError);
}
