#include <catch2/catch.hpp>

#include <filesystem>
#include <functional>

#include "core/Errors.hpp"
#include "core/metadata/Catalog.hpp"
#include "core/metadata/InitDb.hpp"
#include "core/metadata/MetadataExtractor.hpp"
#include "test_support.hpp"

namespace fs = std::filesystem;
using psm::Catalog;
using psm::MetadataRecord;
using psm_test::TempDir;

namespace {

MetadataRecord record(const std::string& name) {
  MetadataRecord r;
  r.file_name = name;
  r.rating = 4;
  r.aperture = 1.8;
  r.lens_id = "85 85 1.8 1.8";
  r.capture_time = "2024:06:02 18:30:00";
  r.focal_length = 85.0;
  r.exposure_time = 0.002;
  r.color_temperature = 5200;
  return r;
}

} // namespace

TEST_CASE("upsertAll is idempotent and last write wins", "[catalog]") {
  Catalog catalog(":memory:");
  const auto a = record("A.JPG");
  const auto b = record("B.JPG");

  catalog.upsertAll({a, b});
  catalog.upsertAll({a, b});
  CHECK(catalog.count() == 2);

  auto changed = a;
  changed.rating = 1;
  changed.lens_id = "50 50 1.4 1.4";
  catalog.upsertAll({changed});

  REQUIRE(catalog.count() == 2);
  const auto stored = catalog.find("A.JPG");
  REQUIRE(stored);
  CHECK(*stored == changed);

  SECTION("an empty batch changes nothing") {
    catalog.upsertAll({});
    CHECK(catalog.count() == 2);
  }
}

TEST_CASE("all() returns records ordered by file name", "[catalog]") {
  Catalog catalog(":memory:");
  catalog.upsertAll({record("C.JPG"), record("A.JPG"), record("B.JPG")});

  const auto rows = catalog.all();
  REQUIRE(rows.size() == 3);
  CHECK(rows[0].file_name == "A.JPG");
  CHECK(rows[1].file_name == "B.JPG");
  CHECK(rows[2].file_name == "C.JPG");
  CHECK(rows[0] == record("A.JPG"));
  CHECK_FALSE(catalog.find("D.JPG"));
}

TEST_CASE("fingerprint matches ignore the file name only", "[catalog]") {
  Catalog catalog(":memory:");
  catalog.upsertAll({record("A.JPG")});

  CHECK(catalog.containsByFingerprint(record("A.JPG")));
  CHECK(catalog.containsByFingerprint(record("RENAMED.JPG")));

  const std::vector<std::pair<const char*, std::function<void(MetadataRecord&)>>> changes = {
    {"rating", [](MetadataRecord& r) { r.rating = 5; }},
    {"aperture", [](MetadataRecord& r) { r.aperture = 2.0; }},
    {"lens_id", [](MetadataRecord& r) { r.lens_id = "other"; }},
    {"capture_time", [](MetadataRecord& r) { r.capture_time = "2024:06:02 18:30:01"; }},
    {"focal_length", [](MetadataRecord& r) { r.focal_length = 86.0; }},
    {"exposure_time", [](MetadataRecord& r) { r.exposure_time = 0.001; }},
    {"color_temperature", [](MetadataRecord& r) { r.color_temperature = 5300; }},
  };
  for (const auto& [field, change] : changes) {
    INFO(field);
    auto r = record("A.JPG");
    change(r);
    CHECK_FALSE(catalog.containsByFingerprint(r));
  }

  SECTION("an empty catalog matches nothing") {
    catalog.clear();
    CHECK(catalog.count() == 0);
    CHECK_FALSE(catalog.containsByFingerprint(record("A.JPG")));
  }
}

TEST_CASE("the catalog survives reopening", "[catalog]") {
  TempDir tmp;
  const std::string db = tmp.str("nested/dir/catalog.db");

  {
    Catalog catalog(db);
    catalog.upsertAll({record("A.JPG"), record("B.JPG")});
  }
  REQUIRE(fs::exists(db));

  Catalog again(db);
  CHECK(again.count() == 2);
  CHECK(again.path() == db);

  SECTION("initDatabase on an existing store keeps its rows") {
    CHECK(psm::initDatabase(db));
    CHECK(again.count() == 2);
  }
}

TEST_CASE("initDatabase creates the file and its directories", "[catalog]") {
  TempDir tmp;
  const std::string db = tmp.str("a/b/photo-catalog.db");
  REQUIRE(psm::initDatabase(db));
  CHECK(fs::exists(db));
  REQUIRE(psm::initDatabase(db));

  Catalog catalog(db);
  CHECK(catalog.count() == 0);
}

TEST_CASE("rebuild replaces the catalog with what can be read", "[catalog]") {
  TempDir tmp;
  psm_test::FakeReader reader;
  psm::MetadataExtractor extractor(reader);

  std::vector<std::string> paths;
  for (int i = 0; i < 6; ++i) {
    const std::string name = "IMG_" + std::to_string(i) + ".JPG";
    paths.push_back(tmp.str(name));
    if (i % 3 != 0) reader.tags[name] = psm_test::sample_tags(i);  // IMG_0 and IMG_3 fail
  }

  Catalog catalog(":memory:");
  catalog.upsertAll({record("STALE.JPG")});

  const auto stored = catalog.rebuild(paths, extractor, 3);
  CHECK(stored == 4);
  CHECK(catalog.count() == 4);
  CHECK_FALSE(catalog.find("STALE.JPG"));
  CHECK_FALSE(catalog.find("IMG_0.JPG"));

  const auto img2 = catalog.find("IMG_2.JPG");
  REQUIRE(img2);
  CHECK(img2->rating == 2);
  CHECK(img2->aperture == Approx(2.8));

  SECTION("rebuilding from nothing empties the catalog") {
    CHECK(catalog.rebuild({}, extractor) == 0);
    CHECK(catalog.count() == 0);
  }
}
