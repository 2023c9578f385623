#ifndef __HL_HTXF_CODEC_H__
#define __HL_HTXF_CODEC_H__

#include "Headers.hpp"

namespace hl {
const uint32_t HTXF_MAGIC = 0x48545846;     // "HTXF"
const uint32_t FILP_MAGIC = 0x46494C50;     // "FILP"
const uint32_t FORK_INFO = 0x494E464F;      // "INFO"
const uint32_t FORK_DATA = 0x44415441;      // "DATA"
const uint32_t FORK_MACR = 0x4D414352;      // "MACR"
const uint32_t PLATFORM_AMAC = 0x414D4143;  // "AMAC"
const uint32_t RFLT_MAGIC = 0x52464C54;     // "RFLT"

/** @brief FileTransferOptions value that asks for a raw preview. */
const uint16_t TRANSFER_OPTION_PREVIEW = 2;

/** @brief Actions exchanged during folder transfers. */
enum class FolderAction : uint16_t {
  SEND_FILE = 1,
  RESUME_FILE = 2,
  NEXT_FILE = 3,
};

/** @brief "HTXF" ref size 0: opens a file download (size 0) or upload. */
string encodeFileTransferHandshake(uint32_t referenceNumber,
                                   uint32_t dataSize);
/** @brief "HTXF" ref 0 u16 1 u16 0: opens a folder transfer. */
string encodeFolderTransferHandshake(uint32_t referenceNumber);

/** @brief The 24 byte "FILP" header of a flattened file object. */
struct FlattenedFileHeader {
  static const int SIZE = 24;
  uint16_t version = 1;
  uint16_t forkCount = 2;

  string encode() const;
  /** @throws std::runtime_error when the magic is not "FILP". */
  static FlattenedFileHeader decode(const string& data);
};

/** @brief 16 byte header that precedes every fork. */
struct ForkHeader {
  static const int SIZE = 16;
  uint32_t type = FORK_DATA;
  uint32_t compression = 0;
  uint32_t dataSize = 0;

  string encode() const;
  static ForkHeader decode(const string& data);
};

/** @brief Contents of the INFO fork. */
struct FileInfoFork {
  uint32_t platform = PLATFORM_AMAC;
  string type = "????";
  string creator = "????";
  uint32_t flags = 0;
  uint32_t platformFlags = 0;
  time_t created = 0;
  time_t modified = 0;
  string name;
  string comment;

  string encode() const;
  /**
   * @brief Parses an INFO fork.  A comment whose length reads as "DA"
   * (the start of the following DATA fork header) is treated as absent.
   */
  static FileInfoFork decode(const string& data);
};

/**
 * @brief Per item header of a folder transfer: u16 size of what follows,
 * u16 type (1 folder, 0 file), then the encoded relative path.
 */
struct FolderItemHeader {
  bool isFolder = false;
  vector<string> path;

  string encode() const;
  /** @brief Parses the bytes that follow the leading size field. */
  static FolderItemHeader decode(const string& data);
};

/**
 * @brief Bytes announced in the upload handshake for a flattened file with
 * the given INFO fork and data fork sizes.
 */
uint64_t flattenedFileSize(const FileInfoFork& info, uint64_t dataForkSize);

/**
 * @brief Builds FileResumeData ("RFLT") asking for the DATA fork from
 * `dataForkOffset` on and no resource fork.
 */
string encodeResumeData(uint32_t dataForkOffset);
/**
 * @brief Offset of the DATA fork inside FileResumeData, 0 when the record
 * has no DATA entry.
 * @throws std::runtime_error on a bad magic or truncated record.
 */
uint32_t decodeResumeData(const string& data);

/** @brief Type/creator codes guessed from a file extension. */
pair<string, string> typeAndCreatorForFilename(const string& filename);
}  // namespace hl

#endif  // __HL_HTXF_CODEC_H__
