#include "JsonOutput.hpp"
#include "TestHeaders.hpp"

using namespace hl;

TEST_CASE("Listings as JSON", "[JsonOutput]") {
  FileEntry file;
  file.name = "a.txt";
  file.path = {"Docs"};
  file.size = 42;
  file.type = "TEXT";
  file.creator = "ttxt";
  json j = file;
  REQUIRE(j["name"] == "a.txt");
  REQUIRE(j["path"] == "/Docs/a.txt");
  REQUIRE(j["size"] == 42);
  REQUIRE_FALSE(j["folder"].get<bool>());
  REQUIRE_FALSE(j.contains("items"));
  REQUIRE_FALSE(j.contains("comment"));

  FileEntry folder;
  folder.name = "Uploads";
  folder.isFolder = true;
  folder.size = 7;
  j = folder;
  REQUIRE(j["items"] == 7);
  REQUIRE_FALSE(j.contains("size"));
}

TEST_CASE("Transfers and errors as JSON", "[JsonOutput]") {
  Transfer transfer;
  transfer.id = 3;
  transfer.title = "song.txt";
  transfer.direction = TransferDirection::UPLOAD;
  transfer.state = TransferState::FAILED;
  transfer.totalSize = 100;
  transfer.transferredBytes = 40;
  transfer.error = HotlineError(ErrorKind::TRANSFER, "Socket closed");
  json j = transfer;
  REQUIRE(j["direction"] == "upload");
  REQUIRE(j["state"] == "Failed");
  REQUIRE(j["transferred"] == 40);
  REQUIRE(j["error"]["kind"] == "TransferError");
  REQUIRE(j["error"]["message"] == "Socket closed");
  REQUIRE_FALSE(j.contains("bytesPerSecond"));
}

TEST_CASE("Events as JSON", "[JsonOutput]") {
  ServerEvent event;
  event.type = ServerEventType::PERMISSIONS_CHANGED;
  event.permissions = permissionMaskOf(
      {Capability::DOWNLOAD_FILE, Capability::SEND_CHAT});
  json j = event;
  REQUIRE(j["event"] == "permissions-changed");
  REQUIRE(j["allowed"] == json({"download-file", "send-chat"}));

  event.type = ServerEventType::PRIVATE_MESSAGE;
  event.text = "psst";
  event.user.id = 7;
  event.user.name = "Alice";
  j = event;
  REQUIRE(j["text"] == "psst");
  REQUIRE(j["user"]["name"] == "Alice");
  REQUIRE(j["user"]["id"] == 7);
}
