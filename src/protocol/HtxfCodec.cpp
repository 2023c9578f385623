#include "HtxfCodec.hpp"

#include "HotlineObjects.hpp"
#include "MessageReader.hpp"
#include "MessageWriter.hpp"

namespace hl {
string encodeFileTransferHandshake(uint32_t referenceNumber,
                                   uint32_t dataSize) {
  MessageWriter writer;
  writer.writePrimitive<uint32_t>(HTXF_MAGIC);
  writer.writePrimitive<uint32_t>(referenceNumber);
  writer.writePrimitive<uint32_t>(dataSize);
  writer.writePrimitive<uint32_t>(0);
  return writer.finish();
}

string encodeFolderTransferHandshake(uint32_t referenceNumber) {
  MessageWriter writer;
  writer.writePrimitive<uint32_t>(HTXF_MAGIC);
  writer.writePrimitive<uint32_t>(referenceNumber);
  writer.writePrimitive<uint32_t>(0);
  writer.writePrimitive<uint16_t>(1);
  writer.writePrimitive<uint16_t>(0);
  return writer.finish();
}

string FlattenedFileHeader::encode() const {
  MessageWriter writer;
  writer.writePrimitive<uint32_t>(FILP_MAGIC);
  writer.writePrimitive<uint16_t>(version);
  writer.writeZeros(16);
  writer.writePrimitive<uint16_t>(forkCount);
  return writer.finish();
}

FlattenedFileHeader FlattenedFileHeader::decode(const string& data) {
  MessageReader reader(data);
  if (reader.readPrimitive<uint32_t>() != FILP_MAGIC) {
    throw std::runtime_error("Flattened file header has a bad magic");
  }
  FlattenedFileHeader header;
  header.version = reader.readPrimitive<uint16_t>();
  reader.skip(16);
  header.forkCount = reader.readPrimitive<uint16_t>();
  return header;
}

string ForkHeader::encode() const {
  MessageWriter writer;
  writer.writePrimitive<uint32_t>(type);
  writer.writePrimitive<uint32_t>(compression);
  writer.writePrimitive<uint32_t>(0);
  writer.writePrimitive<uint32_t>(dataSize);
  return writer.finish();
}

ForkHeader ForkHeader::decode(const string& data) {
  MessageReader reader(data);
  ForkHeader header;
  header.type = reader.readPrimitive<uint32_t>();
  header.compression = reader.readPrimitive<uint32_t>();
  reader.skip(4);
  header.dataSize = reader.readPrimitive<uint32_t>();
  return header;
}

string FileInfoFork::encode() const {
  MessageWriter writer;
  writer.writePrimitive<uint32_t>(platform);
  writer.writeFixed(type, 4, ' ');
  writer.writeFixed(creator, 4, ' ');
  writer.writePrimitive<uint32_t>(flags);
  writer.writePrimitive<uint32_t>(platformFlags);
  writer.writeZeros(32);
  writer.writeBytes(encodeHotlineDate(created));
  writer.writeBytes(encodeHotlineDate(modified));
  writer.writePrimitive<uint16_t>(0);  // name script
  string truncatedName = name.substr(0, 255);
  writer.writePrimitive<uint16_t>(uint16_t(truncatedName.length()));
  writer.writeBytes(truncatedName);
  string truncatedComment = comment.substr(0, 255);
  writer.writePrimitive<uint16_t>(uint16_t(truncatedComment.length()));
  writer.writeBytes(truncatedComment);
  return writer.finish();
}

FileInfoFork FileInfoFork::decode(const string& data) {
  MessageReader reader(data);
  FileInfoFork info;
  info.platform = reader.readPrimitive<uint32_t>();
  info.type = reader.readBytes(4);
  info.creator = reader.readBytes(4);
  info.flags = reader.readPrimitive<uint32_t>();
  info.platformFlags = reader.readPrimitive<uint32_t>();
  reader.skip(32);
  info.created = decodeHotlineDate(reader.readBytes(8));
  info.modified = decodeHotlineDate(reader.readBytes(8));
  reader.skip(2);  // name script
  uint16_t nameLength = reader.readPrimitive<uint16_t>();
  info.name = reader.readBytes(nameLength);
  if (reader.sizeRemaining() >= 2) {
    uint16_t commentLength = reader.readPrimitive<uint16_t>();
    // Some servers omit the comment and the length field lands on "DATA"
    if (commentLength != 0x4441 && commentLength <= reader.sizeRemaining()) {
      info.comment = reader.readBytes(commentLength);
    }
  }
  return info;
}

string FolderItemHeader::encode() const {
  string body;
  {
    MessageWriter writer;
    writer.writePrimitive<uint16_t>(isFolder ? 1 : 0);
    writer.writeBytes(encodeFilePath(path));
    body = writer.finish();
  }
  MessageWriter writer;
  writer.writePrimitive<uint16_t>(uint16_t(body.length()));
  writer.writeBytes(body);
  return writer.finish();
}

FolderItemHeader FolderItemHeader::decode(const string& data) {
  MessageReader reader(data);
  FolderItemHeader header;
  header.isFolder = (reader.readPrimitive<uint16_t>() == 1);
  header.path = decodeFilePath(reader.readBytes(reader.sizeRemaining()));
  return header;
}

uint64_t flattenedFileSize(const FileInfoFork& info, uint64_t dataForkSize) {
  return FlattenedFileHeader::SIZE + ForkHeader::SIZE + info.encode().length() +
         ForkHeader::SIZE + dataForkSize;
}

string encodeResumeData(uint32_t dataForkOffset) {
  MessageWriter writer;
  writer.writePrimitive<uint32_t>(RFLT_MAGIC);
  writer.writePrimitive<uint16_t>(1);
  writer.writeZeros(34);
  writer.writePrimitive<uint16_t>(2);
  writer.writePrimitive<uint32_t>(FORK_DATA);
  writer.writePrimitive<uint32_t>(dataForkOffset);
  writer.writeZeros(8);
  writer.writePrimitive<uint32_t>(FORK_MACR);
  writer.writeZeros(12);
  return writer.finish();
}

uint32_t decodeResumeData(const string& data) {
  MessageReader reader(data);
  if (reader.readPrimitive<uint32_t>() != RFLT_MAGIC) {
    throw std::runtime_error("Resume data has a bad magic");
  }
  reader.skip(2 + 34);
  uint16_t forkCount = reader.readPrimitive<uint16_t>();
  for (int a = 0; a < forkCount; a++) {
    uint32_t forkType = reader.readPrimitive<uint32_t>();
    uint32_t offset = reader.readPrimitive<uint32_t>();
    reader.skip(8);
    if (forkType == FORK_DATA) {
      return offset;
    }
  }
  return 0;
}

pair<string, string> typeAndCreatorForFilename(const string& filename) {
  static const map<string, pair<string, string>> knownExtensions = {
      {"txt", {"TEXT", "ttxt"}}, {"jpg", {"JPEG", "ogle"}},
      {"jpeg", {"JPEG", "ogle"}}, {"png", {"PNGf", "ogle"}},
      {"gif", {"GIFf", "ogle"}},  {"pdf", {"PDF ", "CARO"}},
      {"zip", {"ZIP ", "SITx"}},  {"sit", {"SIT!", "SIT!"}},
      {"mp3", {"MP3 ", "TVOD"}},  {"mov", {"MooV", "TVOD"}},
      {"html", {"TEXT", "MOSS"}},
  };
  auto dot = filename.rfind('.');
  if (dot != string::npos) {
    string extension = filename.substr(dot + 1);
    transform(extension.begin(), extension.end(), extension.begin(),
              [](unsigned char c) { return char(tolower(c)); });
    auto it = knownExtensions.find(extension);
    if (it != knownExtensions.end()) {
      return it->second;
    }
  }
  return make_pair(string("BINA"), string("dosa"));
}
}  // namespace hl
