#include <catch2/catch.hpp>

#include <chrono>

#include "core/metadata/ExtractionPool.hpp"
#include "core/metadata/MetadataExtractor.hpp"
#include "test_support.hpp"

using namespace std::chrono_literals;
using psm::ExtractionPool;
using psm_test::FakeReader;

TEST_CASE("outcomes are keyed by path whatever the completion order", "[pool]") {
  FakeReader reader;
  std::vector<std::string> paths;
  for (int i = 0; i < 8; ++i) {
    const std::string name = "IMG_" + std::to_string(i) + ".JPG";
    paths.push_back("in/" + name);
    reader.tags[name] = psm_test::sample_tags(i);
    reader.delays[name] = std::chrono::milliseconds((8 - i) * 5);  // earlier files finish last
  }
  reader.tags.erase("IMG_5.JPG");

  psm::MetadataExtractor extractor(reader);
  ExtractionPool pool(extractor, 4);
  const auto outcomes = pool.run(paths);

  REQUIRE(outcomes.size() == paths.size());
  for (int i = 0; i < 8; ++i) {
    const auto& o = outcomes.at(paths[static_cast<size_t>(i)]);
    if (i == 5) {
      CHECK_FALSE(o.record);
      CHECK_FALSE(o.error.empty());
    } else {
      REQUIRE(o.record);
      CHECK(o.record->rating == i);
      CHECK(o.error.empty());
    }
  }

  const auto ok = ExtractionPool::successes(paths, outcomes);
  REQUIRE(ok.size() == 7);
  CHECK(ok.front().file_name == "IMG_0.JPG");
  CHECK(ok[5].file_name == "IMG_6.JPG");
  CHECK(ok.back().file_name == "IMG_7.JPG");
}

TEST_CASE("no more than width extractions run at once", "[pool]") {
  FakeReader reader;
  std::vector<std::string> paths;
  for (int i = 0; i < 12; ++i) {
    const std::string name = "P" + std::to_string(i) + ".JPG";
    paths.push_back(name);
    reader.tags[name] = psm_test::sample_tags();
    reader.delays[name] = 10ms;
  }
  psm::MetadataExtractor extractor(reader);

  SECTION("width 3") {
    ExtractionPool pool(extractor, 3);
    CHECK(pool.run(paths).size() == 12);
    CHECK(reader.peak.load() <= 3);
  }
  SECTION("width 1 runs serially") {
    ExtractionPool pool(extractor, 1);
    CHECK(pool.run(paths).size() == 12);
    CHECK(reader.peak.load() == 1);
  }
  SECTION("width 0 is raised to 1") {
    ExtractionPool pool(extractor, 0);
    CHECK(pool.width() == 1);
    CHECK(pool.run(paths).size() == 12);
  }
  CHECK(reader.calls.load() == 12);
}

TEST_CASE("duplicate and empty inputs", "[pool]") {
  FakeReader reader;
  reader.tags["A.JPG"] = psm_test::sample_tags();
  psm::MetadataExtractor extractor(reader);
  ExtractionPool pool(extractor);

  CHECK(pool.width() == ExtractionPool::kDefaultWidth);
  CHECK(pool.run({}).empty());

  const auto outcomes = pool.run({"A.JPG", "A.JPG"});
  CHECK(outcomes.size() == 1);
  CHECK(reader.calls.load() == 1);
}
