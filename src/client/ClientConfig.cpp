#include "ClientConfig.hpp"

#include <SimpleIni.h>

#include "LogHandler.hpp"

namespace hl {
namespace {
int parseConfigInt(const char* section, const char* key, const char* value,
                   int minimum, int maximum) {
  int result = 0;
  try {
    size_t consumed = 0;
    result = stoi(value, &consumed);
    if (consumed != strlen(value)) {
      throw std::invalid_argument(value);
    }
  } catch (const std::logic_error&) {
    throw HotlineError(ErrorKind::INVALID_ARGUMENT,
                       string("[") + section + "] " + key +
                           " is not a number: " + value);
  }
  if (result < minimum || result > maximum) {
    throw HotlineError(ErrorKind::INVALID_ARGUMENT,
                       string("[") + section + "] " + key +
                           " is out of range: " + value);
  }
  return result;
}
}  // namespace

bool parseConfigBool(const string& value) {
  string lower = value;
  transform(lower.begin(), lower.end(), lower.begin(),
            [](unsigned char c) { return char(tolower(c)); });
  return lower == "1" || lower == "true" || lower == "yes" || lower == "on";
}

ClientConfig::ClientConfig()
    : port(HOTLINE_DEFAULT_PORT),
      login("guest"),
      nickname("unnamed"),
      iconId(HOTLINE_DEFAULT_ICON),
      downloadDir(sago::getDownloadFolder()),
      workers(4),
      resume(false),
      verbose(0),
      logDir(LogHandler::defaultLogDirectory()) {}

ClientConfig::~ClientConfig() {
  if (!password.empty()) {
    sodium_memzero(&password[0], password.size());
  }
}

void ClientConfig::loadFile(const string& filename) {
  CSimpleIniA ini(true, false, false);
  SI_Error rc = ini.LoadFile(filename.c_str());
  if (rc < 0) {
    throw HotlineError(ErrorKind::INVALID_ARGUMENT,
                       "Cannot read config file " + filename);
  }
  LOG(INFO) << "Loading config file " << filename;

  const char* value = ini.GetValue("Server", "host", NULL);
  if (value) {
    host = value;
  }
  value = ini.GetValue("Server", "port", NULL);
  if (value) {
    port = parseConfigInt("Server", "port", value, 1, 65534);
  }
  value = ini.GetValue("Server", "login", NULL);
  if (value) {
    login = value;
  }
  value = ini.GetValue("Server", "password", NULL);
  if (value) {
    password = value;
  }
  value = ini.GetValue("Server", "nick", NULL);
  if (value) {
    nickname = value;
  }
  value = ini.GetValue("Server", "icon", NULL);
  if (value) {
    iconId = uint16_t(parseConfigInt("Server", "icon", value, 0, 0xFFFF));
  }

  value = ini.GetValue("Transfers", "download_dir", NULL);
  if (value) {
    downloadDir = value;
  }
  value = ini.GetValue("Transfers", "workers", NULL);
  if (value) {
    workers = parseConfigInt("Transfers", "workers", value, 1, 64);
  }
  value = ini.GetValue("Transfers", "resume", NULL);
  if (value) {
    resume = parseConfigBool(value);
  }

  value = ini.GetValue("Debug", "verbose", NULL);
  if (value) {
    verbose = parseConfigInt("Debug", "verbose", value, 0, 9);
  }
  value = ini.GetValue("Debug", "logdir", NULL);
  if (value) {
    logDir = value;
  }
}

SocketEndpoint ClientConfig::getEndpoint() const {
  if (host.empty()) {
    throw HotlineError(ErrorKind::INVALID_ARGUMENT, "No server given");
  }
  return SocketEndpoint(host, port);
}

Credentials ClientConfig::getCredentials() const {
  Credentials credentials;
  credentials.login = login;
  credentials.password = password;
  credentials.nickname = nickname;
  credentials.iconId = iconId;
  return credentials;
}
}  // namespace hl
