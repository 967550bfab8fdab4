#include <gtest/gtest.h>
#include "client/file_id.hpp"
#include "protocol/errors.hpp"

using namespace fdfs;
using namespace fdfs::client;

class FileIdTest : public ::testing::Test {};

TEST_F(FileIdTest, ParseBareForm) {
  FileId id = FileId::parse("group1/M00/00/00/wKgAAF.txt");
  EXPECT_EQ(id.group_name, "group1");
  EXPECT_EQ(id.remote_filename, "M00/00/00/wKgAAF.txt");
}

TEST_F(FileIdTest, ParseUrlDropsSchemeAndHost) {
  FileId id = FileId::parse("https://dfs.example.com/group1/M00/00/00/wKgAAF.txt");
  EXPECT_EQ(id.group_name, "group1");
  EXPECT_EQ(id.remote_filename, "M00/00/00/wKgAAF.txt");

  FileId with_port = FileId::parse("http://10.0.0.7:8080/group2/M01/a.jpg");
  EXPECT_EQ(with_port.group_name, "group2");
  EXPECT_EQ(with_port.remote_filename, "M01/a.jpg");
}

TEST_F(FileIdTest, SchemeMarkerInsidePathIsNotAUrl) {
  FileId id = FileId::parse("group1/M00/00/00/x://y.txt");
  EXPECT_EQ(id.group_name, "group1");
  EXPECT_EQ(id.remote_filename, "M00/00/00/x://y.txt");

  FileId url = FileId::parse("http://10.0.0.7/group1/M00/x://y.txt");
  EXPECT_EQ(url.group_name, "group1");
  EXPECT_EQ(url.remote_filename, "M00/x://y.txt");
}

TEST_F(FileIdTest, ParseRejectsMalformedInput) {
  EXPECT_THROW(FileId::parse(""), IdentifierError);
  EXPECT_THROW(FileId::parse("no-separator"), IdentifierError);
  EXPECT_THROW(FileId::parse("/M00/00/00/a.txt"), IdentifierError);
  EXPECT_THROW(FileId::parse("group1/"), IdentifierError);
  EXPECT_THROW(FileId::parse("https://dfs.example.com"), IdentifierError);
  EXPECT_THROW(FileId::parse("https://dfs.example.com/group1"), IdentifierError);
  EXPECT_THROW(FileId::parse("a_group_name_too_long/M00/a"), IdentifierError);
}

TEST_F(FileIdTest, FormatBareAndUrl) {
  FileId id{"group1", "M00/00/00/a.txt"};
  EXPECT_EQ(id.to_string(), "group1/M00/00/00/a.txt");
  EXPECT_EQ(id.format(""), "group1/M00/00/00/a.txt");
  EXPECT_EQ(id.format("https://dfs.example.com"), "https://dfs.example.com/group1/M00/00/00/a.txt");
  EXPECT_EQ(id.format("https://dfs.example.com/"), "https://dfs.example.com/group1/M00/00/00/a.txt");
}

TEST_F(FileIdTest, ParseInvertsFormat) {
  const FileId ids[] = {
    {"group1", "M00/00/00/a.txt"},
    {"g", "x"},
    {"sixteen_chars_gp", "M02/7F/01/wKgAAF0000000001"}
  };
  for (const auto& id : ids) {
    EXPECT_EQ(FileId::parse(id.format("https://dfs.example.com")), id);
    EXPECT_EQ(FileId::parse(id.to_string()), id);
  }
}
