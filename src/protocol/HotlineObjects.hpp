#ifndef __HL_HOTLINE_OBJECTS_H__
#define __HL_HOTLINE_OBJECTS_H__

#include "Headers.hpp"

namespace hl {
/**
 * @brief Applies the Hotline login obfuscation (each byte XOR 0xFF).  The
 * operation is its own inverse.
 */
string encodeHotlineString(const string& s);

/** @brief u16 count, then per segment u16 0, u8 length, bytes. */
string encodeFilePath(const vector<string>& path);
/** @throws std::runtime_error on truncated data. */
vector<string> decodeFilePath(const string& data);

/**
 * @brief Hotline dates are 8 bytes: u16 year, u16 milliseconds, u32
 * seconds since January 1 of that year (UTC).
 * @return Unix time, or 0 when the year is 0 (unknown date).
 */
time_t decodeHotlineDate(const string& data);
string encodeHotlineDate(time_t t);

struct FileEntry {
  string name;
  /** @brief Folder holding the entry; the root folder is empty. */
  vector<string> path;
  bool isFolder = false;
  /** @brief Byte size for files, item count for folders. */
  uint64_t size = 0;
  string type;
  string creator;
  string comment;
  time_t created = 0;
  time_t modified = 0;

  /** @brief Path of the entry itself (path + name). */
  vector<string> fullPath() const {
    vector<string> p = path;
    p.push_back(name);
    return p;
  }

  bool operator==(const FileEntry& other) const {
    return name == other.name && path == other.path &&
           isFolder == other.isFolder && size == other.size &&
           type == other.type && creator == other.creator;
  }
};

/**
 * @brief Parses a FileNameWithInfo record: type[4], creator[4], size u32,
 * reserved u32, name script u16, name length u16, name.
 */
FileEntry parseFileNameWithInfo(const string& data,
                                const vector<string>& parentPath);

/** @brief User list flag bits. */
const uint16_t USER_FLAG_AWAY = 0x0001;
const uint16_t USER_FLAG_ADMIN = 0x0002;
const uint16_t USER_FLAG_REFUSE_PRIVATE_MESSAGES = 0x0004;
const uint16_t USER_FLAG_REFUSE_PRIVATE_CHAT = 0x0008;

struct UserEntry {
  uint16_t id = 0;
  uint16_t iconId = 0;
  uint16_t flags = 0;
  string name;

  bool isAdmin() const { return flags & USER_FLAG_ADMIN; }
  bool isAway() const { return flags & USER_FLAG_AWAY; }
};

/** @brief id u16, icon u16, flags u16, name length u16, name. */
UserEntry parseUserNameWithInfo(const string& data);

enum class NewsCategoryType : uint16_t {
  BUNDLE = 2,
  CATEGORY = 3,
};

struct NewsCategoryEntry {
  NewsCategoryType type = NewsCategoryType::CATEGORY;
  /** @brief Number of children (categories for a bundle, articles for a
   * category). */
  uint16_t count = 0;
  string name;
};

/**
 * @brief Parses one NewsCatListData15 record.  Bundles keep their name at
 * offset 4, categories at offset 28 (after a GUID and two serial numbers).
 */
NewsCategoryEntry parseNewsCategory(const string& data);

struct NewsArticleEntry {
  uint32_t id = 0;
  /** @brief Parent article id, 0 for a thread root. */
  uint32_t parentId = 0;
  uint32_t flags = 0;
  time_t date = 0;
  string title;
  string poster;
  /** @brief (mime flavor, byte size) pairs, usually one "text/plain". */
  vector<pair<string, uint16_t>> flavors;
};

/**
 * @brief Parses NewsArtListData: list id u32, article count u32, name and
 * description pstrings, then the articles in server order.
 */
vector<NewsArticleEntry> parseNewsArticleList(const string& data);

/**
 * @brief Splits a message board blob into posts.  Posts are separated by
 * lines made only of underscores; empty posts are dropped.
 */
vector<string> splitMessageBoard(const string& text);
}  // namespace hl

#endif  // __HL_HOTLINE_OBJECTS_H__
