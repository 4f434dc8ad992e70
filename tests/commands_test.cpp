# include <sstream>
# include <string>
# include <vector>
# include <gtest/gtest.h>
# include "args.hpp"
# include "commands.hpp"
# include "errors.hpp"
# include "png.hpp"
# include "test_util.hpp"

namespace pngmsg {
namespace {

using Types = std::vector<std::string>;

class CommandsTest : public ::testing::Test{
protected:
  test::TempDir dir_;
  std::string path_;
  void SetUp(void) override{
    path_ = dir_.file("image.png");
    test::minimal_png().write(path_);
  }
};

TEST_F(CommandsTest, EncodeThenDecode){
  commands::encode(path_, "ruSt", "hello");
  EXPECT_EQ(commands::decode(path_, "ruSt"), "hello");
  EXPECT_EQ(test::chunk_types(PNG::from_file(path_)), (Types{"IHDR", "IDAT", "ruSt", "IEND"}));
}

TEST_F(CommandsTest, DecodeReturnsMessageUnchanged){
  const std::vector<std::string> messages = {
    "",
    "The quick brown fox jumps over the lazy dog.",
    "\xE3\x81\x93\xE3\x82\x93\xE3\x81\xAB\xE3\x81\xA1\xE3\x81\xAF caf\xC3\xA9 \xF0\x9F\xA6\x80",
  };
  for(const std::string& message : messages){
    commands::encode(path_, "teSt", message);
    EXPECT_EQ(commands::decode(path_, "teSt"), message);
    commands::remove(path_, "teSt");
  }
}

TEST_F(CommandsTest, EncodeKeepsOriginalChunksIntact){
  const PNG before = PNG::from_file(path_);
  commands::encode(path_, "ruSt", "hidden");
  const PNG after = PNG::from_file(path_);
  ASSERT_EQ(after.chunks().size(), before.chunks().size() + 1);
  EXPECT_EQ(after.chunks()[0], before.chunks()[0]);
  EXPECT_EQ(after.chunks()[1], before.chunks()[1]);
  EXPECT_EQ(after.chunks().back(), before.chunks().back());
}

TEST_F(CommandsTest, EncodeToOutputFile){
  const std::vector<char> original = test::read_bytes(path_);
  const std::string out = dir_.file("out.png");
  commands::encode(path_, "ruSt", "elsewhere", out);
  EXPECT_EQ(test::read_bytes(path_), original);
  EXPECT_EQ(commands::decode(out, "ruSt"), "elsewhere");
}

TEST_F(CommandsTest, EncodeRejectsBadType){
  const std::vector<char> original = test::read_bytes(path_);
  test::expect_error([&]{ commands::encode(path_, "Ru5t", "x"); }, ErrorKind::InvalidTypeChars);
  test::expect_error([&]{ commands::encode(path_, "AB", "x"); }, ErrorKind::InvalidTypeLength);
  EXPECT_EQ(test::read_bytes(path_), original);
}

TEST_F(CommandsTest, DecodeMissingChunk){
  test::expect_error([&]{ commands::decode(path_, "ruSt"); }, ErrorKind::ChunkNotFound);
}

TEST_F(CommandsTest, DecodeBinaryChunk){
  PNG png = PNG::from_file(path_);
  png.append_chunk(Chunk{ChunkType::from_string("biNa"), {'\xFF', '\xFE', '\xFD'}});
  png.write(path_);
  test::expect_error([&]{ commands::decode(path_, "biNa"); }, ErrorKind::Utf8DecodeError);
}

TEST_F(CommandsTest, RemoveThenDecodeFails){
  commands::encode(path_, "ruSt", "hello");
  const Chunk removed = commands::remove(path_, "ruSt");
  EXPECT_EQ(removed.data_as_string(), "hello");
  test::expect_error([&]{ commands::decode(path_, "ruSt"); }, ErrorKind::ChunkNotFound);
  EXPECT_EQ(PNG::from_file(path_), test::minimal_png());
}

TEST_F(CommandsTest, RemoveMissingLeavesFileUnchanged){
  const std::vector<char> original = test::read_bytes(path_);
  test::expect_error([&]{ commands::remove(path_, "ruSt"); }, ErrorKind::ChunkNotFound);
  EXPECT_EQ(test::read_bytes(path_), original);
}

TEST_F(CommandsTest, RemoveOnlyFirstMatch){
  commands::encode(path_, "ruSt", "one");
  commands::encode(path_, "ruSt", "two");
  commands::remove(path_, "ruSt");
  EXPECT_EQ(commands::decode(path_, "ruSt"), "two");
}

TEST_F(CommandsTest, PrintListsChunks){
  commands::encode(path_, "ruSt", "hello");
  std::ostringstream os;
  commands::print(path_, os);
  const std::string out = os.str();
  const size_t ihdr = out.find("IHDR");
  const size_t idat = out.find("IDAT");
  const size_t rust = out.find("ruSt");
  const size_t iend = out.find("IEND");
  ASSERT_NE(ihdr, std::string::npos);
  ASSERT_NE(idat, std::string::npos);
  ASSERT_NE(rust, std::string::npos);
  ASSERT_NE(iend, std::string::npos);
  EXPECT_LT(ihdr, idat);
  EXPECT_LT(idat, rust);
  EXPECT_LT(rust, iend);
  EXPECT_NE(out.find("\"hello\""), std::string::npos);
}

TEST_F(CommandsTest, NotAPng){
  const std::string path = dir_.file("text.png");
  test::write_bytes(path, {'h', 'e', 'l', 'l', 'o', ' ', 'p', 'n', 'g'});
  std::ostringstream os;
  test::expect_error([&]{ commands::print(path, os); }, ErrorKind::InvalidSignature);
  test::expect_error([&]{ commands::decode(path, "ruSt"); }, ErrorKind::InvalidSignature);
}

TEST_F(CommandsTest, MissingFile){
  std::ostringstream os;
  test::expect_error([&]{ commands::print(dir_.file("missing.png"), os); }, ErrorKind::IoError);
  test::expect_error([&]{ commands::encode(dir_.file("missing.png"), "ruSt", "x"); }, ErrorKind::IoError);
}

TEST_F(CommandsTest, RunDispatchesAndReports){
  std::ostringstream os;
  commands::run(parse_args(std::vector<std::string>{"encode", path_, "ruSt", "via run"}), os);
  EXPECT_EQ(os.str(), "Encoding successful!\n");

  os.str("");
  commands::run(parse_args(std::vector<std::string>{"decode", path_, "ruSt"}), os);
  EXPECT_EQ(os.str(), "via run\n");

  os.str("");
  commands::run(parse_args(std::vector<std::string>{"remove", path_, "ruSt"}), os);
  EXPECT_EQ(os.str(), "Chunk removed! (ruSt, 7 bytes)\n");

  os.str("");
  commands::run(HelpArgs{}, os);
  EXPECT_EQ(os.str(), usage());
}

} // namespace
} // namespace pngmsg
