#include <gtest/gtest.h>
#include <gmock/gmock.h>
#include <cerrno>
#include "client/storage_client.hpp"
#include "client/tracker_client.hpp"
#include "fake_cluster.hpp"
#include "network/blocking_transport.hpp"
#include "protocol/codec.hpp"
#include "protocol/errors.hpp"
#include "test_utils.hpp"

using namespace fdfs;
using namespace fdfs::client;
using fdfs::test::FakeCluster;
using ::testing::_;
using ::testing::Return;

// Transport double returning canned responses
class MockTransport : public network::Transport {
public:
  MOCK_METHOD(network::Response, send_receive,
              (const protocol::Address& address, const protocol::Frame& frame), (override));
  MOCK_METHOD(protocol::Header, send_receive_streamed,
              (const protocol::Address& address, const protocol::Frame& frame, const network::BodySink& sink),
              (override));
};

class TrackerStorageTest : public ::testing::Test {
protected:
  network::Response status_response(uint8_t status) {
    network::Response response;
    response.header = protocol::Header{0, static_cast<uint8_t>(protocol::Command::RESPONSE), status};
    return response;
  }

  FakeCluster cluster;
  network::BlockingTransport transport;
};

//==============================================
// TRACKER CLIENT
//==============================================

TEST_F(TrackerStorageTest, QueryStoreNominatesStorage) {
  TrackerClient tracker(transport, cluster.tracker_address());

  protocol::StoreTarget any = tracker.query_store();
  EXPECT_EQ(any.endpoint.group_name, "group1");
  EXPECT_EQ(any.endpoint.address, cluster.storage_address());

  protocol::StoreTarget named = tracker.query_store("group1");
  EXPECT_EQ(named.endpoint.address, cluster.storage_address());

  auto frames = cluster.received_frames();
  ASSERT_EQ(frames.size(), 2u);
  EXPECT_EQ(frames[0][8], static_cast<uint8_t>(protocol::Command::QUERY_STORE_WITHOUT_GROUP));
  EXPECT_EQ(frames[1][8], static_cast<uint8_t>(protocol::Command::QUERY_STORE_WITH_GROUP));
}

TEST_F(TrackerStorageTest, QueryFetchAndUpdate) {
  TrackerClient tracker(transport, cluster.tracker_address());
  FileId id{"group1", "M00/00/00/a.txt"};

  EXPECT_EQ(tracker.query_fetch(id).address, cluster.storage_address());
  EXPECT_EQ(tracker.query_update(id).group_name, "group1");
}

TEST_F(TrackerStorageTest, UnknownGroupIsTrackerError) {
  TrackerClient tracker(transport, cluster.tracker_address());
  try {
    tracker.query_store("nogroup");
    FAIL() << "expected TrackerError";
  } catch (const TrackerError& e) {
    EXPECT_EQ(e.status(), ENOENT);
  }
}

TEST_F(TrackerStorageTest, TrackerStatusDistinctFromTransportError) {
  cluster.set_tracker_status(28);
  TrackerClient tracker(transport, cluster.tracker_address());
  EXPECT_THROW(tracker.query_store(), TrackerError);

  TrackerClient unreachable(transport, protocol::Address{"127.0.0.1", fdfs::test::unused_port()});
  EXPECT_THROW(unreachable.query_store(), TransportError);
}

TEST_F(TrackerStorageTest, UnknownTrackerStatusIsGeneric) {
  MockTransport mock;
  EXPECT_CALL(mock, send_receive(_, _)).WillOnce(Return(status_response(200)));

  TrackerClient tracker(mock, protocol::Address{"tracker", 22122});
  try {
    tracker.query_fetch(FileId{"group1", "M00/a"});
    FAIL() << "expected TrackerError";
  } catch (const TrackerError& e) {
    EXPECT_EQ(e.status(), 200);
  }
}

//==============================================
// STORAGE CLIENT
//==============================================

TEST_F(TrackerStorageTest, UploadDownloadDelete) {
  TrackerClient tracker(transport, cluster.tracker_address());
  protocol::StoreTarget target = tracker.query_store();
  StorageClient storage(transport, target.endpoint);

  const protocol::Bytes data = random_bytes(3000);
  FileId id = storage.upload(data.data(), data.size(), "jpg", target.store_path_index);
  EXPECT_EQ(id.group_name, "group1");
  EXPECT_NE(id.remote_filename.find(".jpg"), std::string::npos);
  EXPECT_TRUE(cluster.has_file(id.group_name, id.remote_filename));

  EXPECT_EQ(storage.download(id), data);

  DeleteResult result = storage.delete_file(id);
  EXPECT_EQ(result.status, DELETE_SUCCEEDED);
  EXPECT_EQ(result.remote_path, id.remote_filename);
  EXPECT_EQ(result.storage_host, "127.0.0.1");
  EXPECT_FALSE(cluster.has_file(id.group_name, id.remote_filename));
}

TEST_F(TrackerStorageTest, PartialDownload) {
  StorageClient storage(transport, protocol::StorageEndpoint{"group1", cluster.storage_address()});
  const protocol::Bytes data = random_bytes(1000);
  FileId id = storage.upload(data.data(), data.size(), "bin", 0);

  protocol::Bytes middle = storage.download(id, ByteRange{100, 50});
  EXPECT_EQ(middle, protocol::Bytes(data.begin() + 100, data.begin() + 150));

  protocol::Bytes tail = storage.download(id, ByteRange{900, 0});
  EXPECT_EQ(tail, protocol::Bytes(data.begin() + 900, data.end()));
}

TEST_F(TrackerStorageTest, MissingFileIsNotFound) {
  StorageClient storage(transport, protocol::StorageEndpoint{"group1", cluster.storage_address()});
  FileId missing{"group1", "M00/00/00/never-uploaded.txt"};

  try {
    storage.download(missing);
    FAIL() << "expected StorageError";
  } catch (const StorageError& e) {
    EXPECT_TRUE(e.not_found());
    EXPECT_EQ(e.code(), StorageErrorCode::NOT_FOUND);
  }

  bool sink_called = false;
  try {
    storage.download(missing, [&](const uint8_t*, std::size_t) { sink_called = true; });
    FAIL() << "expected StorageError";
  } catch (const StorageError& e) {
    EXPECT_TRUE(e.not_found());
  }
  EXPECT_FALSE(sink_called);

  try {
    storage.delete_file(missing);
    FAIL() << "expected StorageError";
  } catch (const StorageError& e) {
    EXPECT_TRUE(e.not_found());
  }
}

TEST_F(TrackerStorageTest, OtherStorageStatusIsServerError) {
  MockTransport mock;
  EXPECT_CALL(mock, send_receive(_, _)).WillOnce(Return(status_response(ENOSPC)));

  StorageClient storage(mock, protocol::StorageEndpoint{"group1", protocol::Address{"storage", 23000}});
  const protocol::Bytes data = random_bytes(10);
  try {
    storage.upload(data.data(), data.size(), "txt", 0);
    FAIL() << "expected StorageError";
  } catch (const StorageError& e) {
    EXPECT_EQ(e.code(), StorageErrorCode::SERVER_ERROR);
    EXPECT_EQ(e.status(), ENOSPC);
    EXPECT_NE(std::string(e.what()).find("Storage error"), std::string::npos);
  }
}

TEST_F(TrackerStorageTest, StorageClientTargetsNominatedEndpoint) {
  MockTransport mock;
  protocol::Address storage_address{"10.0.0.9", 23001};
  EXPECT_CALL(mock, send_receive(storage_address, _)).WillOnce(Return(status_response(0)));

  StorageClient storage(mock, protocol::StorageEndpoint{"group1", storage_address});
  DeleteResult result = storage.delete_file(FileId{"group1", "M00/00/00/a"});
  EXPECT_EQ(result.storage_host, "10.0.0.9");
}
