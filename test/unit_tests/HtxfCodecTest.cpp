#include "FakeHotlineServer.hpp"
#include "HtxfCodec.hpp"
#include "MessageReader.hpp"

using namespace hl;

TEST_CASE("Transfer handshakes", "[HtxfCodec]") {
  string file = encodeFileTransferHandshake(0x01020304, 99);
  REQUIRE(file == string("HTXF\x01\x02\x03\x04\x00\x00\x00\x63\x00\x00\x00\x00",
                         16));
  string folder = encodeFolderTransferHandshake(7);
  REQUIRE(folder ==
          string("HTXF\x00\x00\x00\x07\x00\x00\x00\x00\x00\x01\x00\x00", 16));
}

TEST_CASE("Flattened file headers", "[HtxfCodec]") {
  FlattenedFileHeader header;
  header.forkCount = 3;
  string encoded = header.encode();
  REQUIRE(encoded.length() == FlattenedFileHeader::SIZE);
  REQUIRE(encoded.substr(0, 4) == "FILP");
  REQUIRE(FlattenedFileHeader::decode(encoded).forkCount == 3);
  REQUIRE_THROWS_AS(FlattenedFileHeader::decode(string(24, 'x')),
                    std::runtime_error);

  ForkHeader fork;
  fork.type = FORK_DATA;
  fork.dataSize = 4096;
  ForkHeader decoded = ForkHeader::decode(fork.encode());
  REQUIRE(decoded.type == FORK_DATA);
  REQUIRE(decoded.dataSize == 4096);
}

TEST_CASE("INFO forks", "[HtxfCodec]") {
  FileInfoFork info;
  info.type = "TEXT";
  info.creator = "ttxt";
  info.name = "notes.txt";
  info.comment = "From the archive";
  info.modified = 983682367;
  info.created = 983682367;

  FileInfoFork decoded = FileInfoFork::decode(info.encode());
  REQUIRE(decoded.platform == PLATFORM_AMAC);
  REQUIRE(decoded.type == "TEXT");
  REQUIRE(decoded.creator == "ttxt");
  REQUIRE(decoded.name == "notes.txt");
  REQUIRE(decoded.comment == "From the archive");
  REQUIRE(decoded.modified == 983682367);

  SECTION("A comment length reading as DA is ignored") {
    info.comment = "";
    string encoded = info.encode();
    encoded.resize(encoded.length() - 2);
    encoded += "DATA";
    REQUIRE(FileInfoFork::decode(encoded).comment.empty());
  }

  SECTION("Flattened size accounts for every header") {
    REQUIRE(flattenedFileSize(info, 100) ==
            uint64_t(24 + 16 + info.encode().length() + 16 + 100));
    FileInfoFork plain;
    plain.name = "notes.txt";
    REQUIRE(flattenFile("notes.txt", string(100, 'a')).length() ==
            flattenedFileSize(plain, 100));
  }
}

TEST_CASE("Folder item headers", "[HtxfCodec]") {
  FolderItemHeader header;
  header.isFolder = false;
  header.path = {"Sub", "file.bin"};
  string encoded = header.encode();
  MessageReader reader(encoded);
  uint16_t size = reader.readPrimitive<uint16_t>();
  REQUIRE(size == encoded.length() - 2);
  FolderItemHeader decoded = FolderItemHeader::decode(encoded.substr(2));
  REQUIRE_FALSE(decoded.isFolder);
  REQUIRE(decoded.path == header.path);
}

TEST_CASE("Resume data", "[HtxfCodec]") {
  string resume = encodeResumeData(123456);
  REQUIRE(resume.substr(0, 4) == "RFLT");
  REQUIRE(resume.length() == 4 + 2 + 34 + 2 + 16 + 16);
  REQUIRE(decodeResumeData(resume) == 123456);
  REQUIRE_THROWS_AS(decodeResumeData("XXXX" + resume.substr(4)),
                    std::runtime_error);
  REQUIRE_THROWS_AS(decodeResumeData(resume.substr(0, 20)),
                    std::runtime_error);
}

TEST_CASE("Type and creator codes", "[HtxfCodec]") {
  REQUIRE(typeAndCreatorForFilename("a.TXT") ==
          make_pair(string("TEXT"), string("ttxt")));
  REQUIRE(typeAndCreatorForFilename("photo.jpeg").first == "JPEG");
  REQUIRE(typeAndCreatorForFilename("noextension") ==
          make_pair(string("BINA"), string("dosa")));
}
