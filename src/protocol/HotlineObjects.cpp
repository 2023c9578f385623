#include "HotlineObjects.hpp"

#include "MessageReader.hpp"
#include "MessageWriter.hpp"

namespace hl {
string encodeHotlineString(const string& s) {
  string retval = s;
  for (auto& c : retval) {
    c = char(0xFF ^ (unsigned char)c);
  }
  return retval;
}

string encodeFilePath(const vector<string>& path) {
  MessageWriter writer;
  writer.writePrimitive<uint16_t>(uint16_t(path.size()));
  for (const auto& segment : path) {
    writer.writePrimitive<uint16_t>(0);
    writer.writePString(segment);
  }
  return writer.finish();
}

vector<string> decodeFilePath(const string& data) {
  vector<string> path;
  if (data.empty()) {
    return path;
  }
  MessageReader reader(data);
  uint16_t count = reader.readPrimitive<uint16_t>();
  for (int a = 0; a < count; a++) {
    reader.skip(2);
    path.push_back(reader.readPString());
  }
  return path;
}

time_t decodeHotlineDate(const string& data) {
  MessageReader reader(data);
  uint16_t year = reader.readPrimitive<uint16_t>();
  reader.skip(2);  // milliseconds
  uint32_t seconds = reader.readPrimitive<uint32_t>();
  if (year == 0) {
    return 0;
  }
  struct tm startOfYear;
  memset(&startOfYear, 0, sizeof(startOfYear));
  startOfYear.tm_year = year - 1900;
  startOfYear.tm_mday = 1;
  return timegm(&startOfYear) + time_t(seconds);
}

string encodeHotlineDate(time_t t) {
  struct tm utc;
  gmtime_r(&t, &utc);
  struct tm startOfYear;
  memset(&startOfYear, 0, sizeof(startOfYear));
  startOfYear.tm_year = utc.tm_year;
  startOfYear.tm_mday = 1;
  MessageWriter writer;
  writer.writePrimitive<uint16_t>(uint16_t(utc.tm_year + 1900));
  writer.writePrimitive<uint16_t>(0);
  writer.writePrimitive<uint32_t>(uint32_t(t - timegm(&startOfYear)));
  return writer.finish();
}

FileEntry parseFileNameWithInfo(const string& data,
                                const vector<string>& parentPath) {
  MessageReader reader(data);
  FileEntry entry;
  entry.path = parentPath;
  entry.type = reader.readBytes(4);
  entry.creator = reader.readBytes(4);
  entry.size = reader.readPrimitive<uint32_t>();
  reader.skip(4);
  reader.skip(2);  // name script
  uint16_t nameLength = reader.readPrimitive<uint16_t>();
  entry.name = reader.readBytes(nameLength);
  entry.isFolder = (entry.type == "fldr");
  return entry;
}

UserEntry parseUserNameWithInfo(const string& data) {
  MessageReader reader(data);
  UserEntry user;
  user.id = reader.readPrimitive<uint16_t>();
  user.iconId = reader.readPrimitive<uint16_t>();
  user.flags = reader.readPrimitive<uint16_t>();
  uint16_t nameLength = reader.readPrimitive<uint16_t>();
  user.name = reader.readBytes(nameLength);
  return user;
}

NewsCategoryEntry parseNewsCategory(const string& data) {
  MessageReader reader(data);
  NewsCategoryEntry entry;
  uint16_t type = reader.readPrimitive<uint16_t>();
  entry.count = reader.readPrimitive<uint16_t>();
  if (type == uint16_t(NewsCategoryType::BUNDLE)) {
    entry.type = NewsCategoryType::BUNDLE;
  } else if (type == uint16_t(NewsCategoryType::CATEGORY)) {
    entry.type = NewsCategoryType::CATEGORY;
    reader.skip(16 + 4 + 4);  // GUID, add serial, delete serial
  } else {
    throw std::runtime_error("Unknown news category type " + to_string(type));
  }
  entry.name = reader.readPString();
  return entry;
}

vector<NewsArticleEntry> parseNewsArticleList(const string& data) {
  MessageReader reader(data);
  reader.skip(4);  // list id
  uint32_t count = reader.readPrimitive<uint32_t>();
  reader.readPString();  // name
  reader.readPString();  // description
  vector<NewsArticleEntry> articles;
  for (uint32_t a = 0; a < count; a++) {
    NewsArticleEntry article;
    article.id = reader.readPrimitive<uint32_t>();
    article.date = decodeHotlineDate(reader.readBytes(8));
    article.parentId = reader.readPrimitive<uint32_t>();
    article.flags = reader.readPrimitive<uint32_t>();
    uint16_t flavorCount = reader.readPrimitive<uint16_t>();
    article.title = reader.readPString();
    article.poster = reader.readPString();
    for (int b = 0; b < flavorCount; b++) {
      string flavor = reader.readPString();
      uint16_t size = reader.readPrimitive<uint16_t>();
      article.flavors.push_back(make_pair(flavor, size));
    }
    articles.push_back(article);
  }
  return articles;
}

vector<string> splitMessageBoard(const string& text) {
  string normalized = text;
  std::replace(normalized.begin(), normalized.end(), '\r', '\n');
  vector<string> posts;
  string current;
  auto flush = [&]() {
    auto first = current.find_first_not_of(" \n\t");
    if (first != string::npos) {
      auto last = current.find_last_not_of(" \n\t");
      posts.push_back(current.substr(first, last - first + 1));
    }
    current.clear();
  };
  for (const auto& line : split(normalized, '\n')) {
    auto trimmed = line;
    trimmed.erase(std::remove(trimmed.begin(), trimmed.end(), ' '), trimmed.end());
    if (trimmed.length() >= 3 &&
        trimmed.find_first_not_of('_') == string::npos) {
      flush();
      continue;
    }
    current += line + "\n";
  }
  flush();
  return posts;
}
}  // namespace hl
