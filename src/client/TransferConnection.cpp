#include "TransferConnection.hpp"

#include "MessageReader.hpp"
#include "MessageWriter.hpp"

namespace hl {
namespace {
// Folder items come from the server; never let one escape the target.
void checkRelativePath(const vector<string>& path) {
  for (const auto& segment : path) {
    if (segment.empty() || segment == "." || segment == ".." ||
        segment.find('/') != string::npos) {
      throw HotlineError(ErrorKind::TRANSFER,
                         "Refusing folder item path " + joinRemotePath(path));
    }
  }
}

uint64_t localFileSize(const fs::path& path) {
  std::error_code ec;
  uint64_t size = fs::file_size(path, ec);
  if (ec) {
    throw HotlineError(ErrorKind::TRANSFER,
                       "Cannot read " + path.string() + ": " + ec.message());
  }
  return size;
}

void makeDirectories(const fs::path& path) {
  std::error_code ec;
  fs::create_directories(path, ec);
  if (ec) {
    throw HotlineError(ErrorKind::TRANSFER,
                       "Cannot create " + path.string() + ": " + ec.message());
  }
}

void walkLocalFolder(const fs::path& dir, const vector<string>& relativePath,
                     vector<FolderUploadItem>* items) {
  vector<fs::directory_entry> entries;
  std::error_code ec;
  for (fs::directory_iterator it(dir, ec), end; !ec && it != end;
       it.increment(ec)) {
    string name = it->path().filename().string();
    if (name.empty() || name[0] == '.') {
      continue;
    }
    entries.push_back(*it);
  }
  if (ec) {
    throw HotlineError(ErrorKind::TRANSFER,
                       "Cannot list " + dir.string() + ": " + ec.message());
  }
  sort(entries.begin(), entries.end(),
       [](const fs::directory_entry& a, const fs::directory_entry& b) {
         return a.path().filename() < b.path().filename();
       });
  for (const auto& entry : entries) {
    auto status = entry.symlink_status();
    FolderUploadItem item;
    item.relativePath = relativePath;
    item.relativePath.push_back(entry.path().filename().string());
    item.localPath = entry.path();
    if (fs::is_directory(status)) {
      item.isFolder = true;
      items->push_back(item);
      walkLocalFolder(entry.path(), item.relativePath, items);
    } else if (fs::is_regular_file(status)) {
      item.size = flattenedFileSize(TransferConnection::describeLocalFile(
                                        entry.path()),
                                    localFileSize(entry.path()));
      items->push_back(item);
    } else {
      VLOG(1) << "Skipping " << entry.path() << " (not a file or folder)";
    }
  }
}
}  // namespace

TransferConnection::TransferConnection(shared_ptr<SocketHandler> _socketHandler,
                                       int _fd, TransferSink* _sink)
    : socketHandler(_socketHandler), fd(_fd), sink(_sink) {}

FileInfoFork TransferConnection::describeLocalFile(const fs::path& path) {
  struct stat st;
  if (::stat(path.c_str(), &st) == -1) {
    throw HotlineError(ErrorKind::TRANSFER,
                       "Cannot stat " + path.string() + ": " + strerror(errno));
  }
  FileInfoFork info;
  info.name = path.filename().string();
  auto typeAndCreator = typeAndCreatorForFilename(info.name);
  info.type = typeAndCreator.first;
  info.creator = typeAndCreator.second;
  info.created = st.st_mtime;
  info.modified = st.st_mtime;
  return info;
}

vector<FolderUploadItem> TransferConnection::listLocalFolder(
    const fs::path& root) {
  vector<FolderUploadItem> items;
  walkLocalFolder(root, {}, &items);
  return items;
}

void TransferConnection::checkCancelled(uint64_t count) {
  if (!sink->bytesMoved(count)) {
    throw HotlineError(ErrorKind::CANCELLED, "Transfer cancelled");
  }
}

string TransferConnection::readCounted(size_t count) {
  string s = socketHandler->readString(fd, count, true);
  checkCancelled(count);
  return s;
}

void TransferConnection::writeCounted(const string& s) {
  socketHandler->writeString(fd, s, true);
  checkCancelled(s.length());
}

void TransferConnection::sendAction(FolderAction action,
                                    const string& payload) {
  MessageWriter writer;
  writer.writePrimitive<uint16_t>(uint16_t(action));
  if (!payload.empty()) {
    writer.writePrimitive<uint16_t>(uint16_t(payload.length()));
    writer.writeBytes(payload);
  }
  VLOG(2) << "Folder action " << uint16_t(action);
  socketHandler->writeString(fd, writer.finish(), true);
}

FolderAction TransferConnection::readAction() {
  MessageReader reader(socketHandler->readString(fd, 2, true));
  uint16_t action = reader.readPrimitive<uint16_t>();
  if (action < uint16_t(FolderAction::SEND_FILE) ||
      action > uint16_t(FolderAction::NEXT_FILE)) {
    throw HotlineError(ErrorKind::TRANSFER,
                       "Unknown folder action " + to_string(action));
  }
  return FolderAction(action);
}

void TransferConnection::downloadFile(uint32_t referenceNumber,
                                      const fs::path& target,
                                      uint64_t resumeOffset) {
  socketHandler->writeString(fd, encodeFileTransferHandshake(referenceNumber, 0),
                             true);
  readFlattenedFile(target, resumeOffset);
}

void TransferConnection::readFlattenedFile(const fs::path& target,
                                           uint64_t resumeOffset) {
  FlattenedFileHeader header =
      FlattenedFileHeader::decode(readCounted(FlattenedFileHeader::SIZE));
  bool wroteData = false;
  vector<char> buffer(CHUNK_SIZE);
  for (int a = 0; a < header.forkCount; a++) {
    ForkHeader fork = ForkHeader::decode(readCounted(ForkHeader::SIZE));
    if (fork.type == FORK_INFO) {
      FileInfoFork info = FileInfoFork::decode(readCounted(fork.dataSize));
      VLOG(1) << "Receiving " << info.name << " (" << info.type << "/"
              << info.creator << ")";
    } else if (fork.type == FORK_DATA) {
      ofstream out(target,
                   ios::binary | (resumeOffset ? ios::app : ios::trunc));
      if (!out) {
        throw HotlineError(ErrorKind::TRANSFER,
                           "Cannot write " + target.string());
      }
      uint64_t remaining = fork.dataSize;
      while (remaining) {
        size_t n = size_t(min<uint64_t>(remaining, CHUNK_SIZE));
        socketHandler->readAll(fd, &buffer[0], n, true);
        out.write(&buffer[0], n);
        if (!out) {
          throw HotlineError(ErrorKind::TRANSFER,
                             "Write to " + target.string() + " failed");
        }
        checkCancelled(n);
        remaining -= n;
      }
      wroteData = true;
    } else {
      // Resource forks have no meaning on this platform
      VLOG(1) << "Skipping fork " << fork.type << " of " << fork.dataSize
              << " bytes";
      uint64_t remaining = fork.dataSize;
      while (remaining) {
        size_t n = size_t(min<uint64_t>(remaining, CHUNK_SIZE));
        socketHandler->readAll(fd, &buffer[0], n, true);
        checkCancelled(n);
        remaining -= n;
      }
    }
  }
  if (!wroteData && !resumeOffset) {
    ofstream out(target, ios::binary | ios::trunc);
    if (!out) {
      throw HotlineError(ErrorKind::TRANSFER, "Cannot write " + target.string());
    }
  }
}

string TransferConnection::downloadPreview(uint32_t referenceNumber,
                                           uint64_t size) {
  socketHandler->writeString(fd, encodeFileTransferHandshake(referenceNumber, 0),
                             true);
  string data;
  data.reserve(size_t(size));
  vector<char> buffer(CHUNK_SIZE);
  uint64_t remaining = size;
  while (remaining) {
    size_t n = size_t(min<uint64_t>(remaining, CHUNK_SIZE));
    socketHandler->readAll(fd, &buffer[0], n, true);
    data.append(&buffer[0], n);
    checkCancelled(n);
    remaining -= n;
  }
  return data;
}

void TransferConnection::uploadFile(uint32_t referenceNumber,
                                    const fs::path& source,
                                    uint64_t resumeOffset) {
  uint64_t fileSize = localFileSize(source);
  if (resumeOffset > fileSize) {
    throw HotlineError(ErrorKind::TRANSFER,
                       "Server holds more of " + source.string() +
                           " than exists locally");
  }
  uint64_t total =
      flattenedFileSize(describeLocalFile(source), fileSize - resumeOffset);
  socketHandler->writeString(
      fd, encodeFileTransferHandshake(referenceNumber, uint32_t(total)), true);
  writeFlattenedFile(source, resumeOffset);
}

void TransferConnection::writeFlattenedFile(const fs::path& source,
                                            uint64_t resumeOffset) {
  FileInfoFork info = describeLocalFile(source);
  uint64_t dataSize = localFileSize(source) - resumeOffset;

  FlattenedFileHeader header;
  header.forkCount = 2;
  writeCounted(header.encode());

  string infoData = info.encode();
  ForkHeader infoHeader;
  infoHeader.type = FORK_INFO;
  infoHeader.dataSize = uint32_t(infoData.length());
  writeCounted(infoHeader.encode());
  writeCounted(infoData);

  ForkHeader dataHeader;
  dataHeader.type = FORK_DATA;
  dataHeader.dataSize = uint32_t(dataSize);
  writeCounted(dataHeader.encode());

  ifstream in(source, ios::binary);
  if (!in) {
    throw HotlineError(ErrorKind::TRANSFER, "Cannot open " + source.string());
  }
  in.seekg(std::streamoff(resumeOffset));
  vector<char> buffer(CHUNK_SIZE);
  uint64_t remaining = dataSize;
  while (remaining) {
    size_t n = size_t(min<uint64_t>(remaining, CHUNK_SIZE));
    in.read(&buffer[0], n);
    if (size_t(in.gcount()) != n) {
      throw HotlineError(ErrorKind::TRANSFER,
                         source.string() + " changed during the upload");
    }
    socketHandler->writeAllOrThrow(fd, &buffer[0], n, true);
    checkCancelled(n);
    remaining -= n;
  }
}

void TransferConnection::downloadFolder(uint32_t referenceNumber,
                                        const fs::path& targetDir,
                                        int itemCount, bool resume) {
  makeDirectories(targetDir);
  MessageWriter writer;
  writer.writeBytes(encodeFolderTransferHandshake(referenceNumber));
  writer.writePrimitive<uint16_t>(uint16_t(FolderAction::NEXT_FILE));
  socketHandler->writeString(fd, writer.finish(), true);

  for (int item = 0; item < itemCount; item++) {
    MessageReader sizeReader(socketHandler->readString(fd, 2, true));
    uint16_t headerSize = sizeReader.readPrimitive<uint16_t>();
    FolderItemHeader header;
    try {
      header = FolderItemHeader::decode(
          socketHandler->readString(fd, headerSize, true));
    } catch (const std::runtime_error& re) {
      throw HotlineError(ErrorKind::TRANSFER,
                         string("Bad folder item header: ") + re.what());
    }
    checkRelativePath(header.path);
    bool more = item + 1 < itemCount;

    fs::path local = targetDir;
    for (const auto& segment : header.path) {
      local /= segment;
    }
    if (header.isFolder) {
      VLOG(1) << "Creating folder " << local;
      makeDirectories(local);
      if (more) sendAction(FolderAction::NEXT_FILE);
      continue;
    }
    if (header.path.empty()) {
      throw HotlineError(ErrorKind::TRANSFER, "Folder item without a name");
    }
    makeDirectories(local.parent_path());

    uint64_t offset = 0;
    if (resume && fs::is_regular_file(local)) {
      offset = localFileSize(local);
    }
    if (offset) {
      LOG(INFO) << "Resuming " << local << " at " << offset;
      sendAction(FolderAction::RESUME_FILE, encodeResumeData(uint32_t(offset)));
    } else {
      sendAction(FolderAction::SEND_FILE);
    }
    MessageReader fileSizeReader(socketHandler->readString(fd, 4, true));
    uint32_t fileSize = fileSizeReader.readPrimitive<uint32_t>();
    sink->itemStarted(header.path, fileSize);
    readFlattenedFile(local, offset);
    sink->itemFinished();
    if (more) sendAction(FolderAction::NEXT_FILE);
  }
}

void TransferConnection::uploadFolder(uint32_t referenceNumber,
                                      const vector<FolderUploadItem>& items,
                                      bool resume) {
  socketHandler->writeString(fd, encodeFolderTransferHandshake(referenceNumber),
                             true);
  size_t index = 0;
  bool awaitNextFile = true;
  while (true) {
    if (awaitNextFile && readAction() != FolderAction::NEXT_FILE) {
      throw HotlineError(ErrorKind::TRANSFER,
                         "Server asked for a file out of turn");
    }
    awaitNextFile = true;
    if (index == items.size()) {
      break;
    }
    const FolderUploadItem& item = items[index++];
    FolderItemHeader header;
    header.isFolder = item.isFolder;
    header.path = item.relativePath;
    socketHandler->writeString(fd, header.encode(), true);
    if (item.isFolder) {
      continue;
    }

    FolderAction action = readAction();
    if (action == FolderAction::NEXT_FILE) {
      VLOG(1) << "Server skipped " << item.localPath;
      sink->itemStarted(item.relativePath, 0);
      sink->itemFinished();
      awaitNextFile = false;
      continue;
    }
    uint64_t offset = 0;
    if (action == FolderAction::RESUME_FILE) {
      MessageReader lengthReader(socketHandler->readString(fd, 2, true));
      string resumeData = socketHandler->readString(
          fd, lengthReader.readPrimitive<uint16_t>(), true);
      if (resume) {
        try {
          offset = decodeResumeData(resumeData);
        } catch (const std::runtime_error& re) {
          throw HotlineError(ErrorKind::TRANSFER,
                             string("Bad resume data: ") + re.what());
        }
        LOG(INFO) << "Resuming " << item.localPath << " at " << offset;
      }
    }
    uint64_t fileSize = localFileSize(item.localPath);
    if (offset > fileSize) {
      throw HotlineError(ErrorKind::TRANSFER,
                         "Server holds more of " + item.localPath.string() +
                             " than exists locally");
    }
    uint64_t flattened =
        flattenedFileSize(describeLocalFile(item.localPath), fileSize - offset);
    MessageWriter sizeWriter;
    sizeWriter.writePrimitive<uint32_t>(uint32_t(flattened));
    socketHandler->writeString(fd, sizeWriter.finish(), true);
    sink->itemStarted(item.relativePath, flattened);
    writeFlattenedFile(item.localPath, offset);
    sink->itemFinished();
  }
}
}  // namespace hl
