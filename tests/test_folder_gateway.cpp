#include <catch2/catch.hpp>

#include <utime.h>

#include "core/Errors.hpp"
#include "core/device/FolderGateway.hpp"
#include "test_support.hpp"

using psm_test::TempDir;

namespace {

void stamp(const std::string& path, std::time_t t) {
  utimbuf times{t, t};
  REQUIRE(::utime(path.c_str(), &times) == 0);
}

} // namespace

TEST_CASE("a missing directory enumerates no devices", "[folder]") {
  TempDir tmp;
  psm::FolderGateway gw(tmp.str("not-there"));
  CHECK(gw.enumerate().empty());
}

TEST_CASE("a directory is exposed as one device", "[folder]") {
  TempDir tmp;
  psm_test::write_file(tmp.path() / "card" / "IMG_B.JPG", "b");
  psm_test::write_file(tmp.path() / "card" / "IMG_A.JPG", "a");
  psm_test::write_file(tmp.path() / "card" / "DCIM" / "100" / "IMG_C.JPG", "c");
  stamp(tmp.str("card/IMG_A.JPG"), 1700000000);
  stamp(tmp.str("card/DCIM/100/IMG_C.JPG"), 1700000500);

  psm::FolderGateway gw(tmp.str("card"));
  const auto devices = gw.enumerate();
  REQUIRE(devices.size() == 1);
  CHECK(devices[0].index == 0);
  CHECK(devices[0].manufacturer == "Local");
  CHECK(devices[0].product == "card");
  CHECK(devices[0].port == "disk:" + tmp.str("card"));

  const auto files = gw.listFiles(devices[0]);
  REQUIRE(files.size() == 3);
  CHECK(files[0].path == "/IMG_A.JPG");
  CHECK(files[1].path == "/IMG_B.JPG");
  CHECK(files[2].path == "/DCIM/100/IMG_C.JPG");
  CHECK(files[0].mtime == 1700000000);
  CHECK(files[2].mtime == 1700000500);

  CHECK(gw.fetch(devices[0], files[2]) == "c");

  SECTION("fetching a vanished file is a transport error") {
    CHECK_THROWS_AS(gw.fetch(devices[0], psm::RemoteFile{"/GONE.JPG", 0}), psm::TransportError);
  }

  SECTION("removing the directory detaches the device") {
    std::filesystem::remove_all(tmp.path() / "card");
    CHECK_THROWS_AS(gw.listFiles(devices[0]), psm::DeviceIndexError);
  }
}

TEST_CASE("symlinks on the card are not followed", "[folder]") {
  TempDir tmp;
  const auto card = tmp.path() / "card";
  psm_test::write_file(card / "IMG0.JPG", "0");
  psm_test::write_file(card / "DCIM" / "IMG1.JPG", "1");

  SECTION("a dangling link is skipped") {
    std::filesystem::create_symlink(card / "gone.JPG", card / "dangling.JPG");
  }
  SECTION("a link back up the tree does not loop") {
    std::filesystem::create_directory_symlink("..", card / "DCIM" / "loop");
  }
  SECTION("a link to a sibling folder does not list its files twice") {
    std::filesystem::create_directory_symlink(card / "DCIM", card / "ALIAS");
  }
  SECTION("a link to a file is skipped") {
    std::filesystem::create_symlink(card / "IMG0.JPG", card / "COPY.JPG");
  }

  psm::FolderGateway gw(card.string());
  const auto files = gw.listFiles(gw.enumerate().at(0));

  REQUIRE(files.size() == 2);
  CHECK(files[0].path == "/IMG0.JPG");
  CHECK(files[1].path == "/DCIM/IMG1.JPG");
}
