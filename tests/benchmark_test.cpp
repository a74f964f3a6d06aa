#include <benchmark/benchmark.h>
#include <gtest/gtest.h>

#include <memory>
#include <random>
#include <string>
#include <vector>

#include "../include/logger.hpp"
#include "../include/reconciler.hpp"

using namespace meshlink;

namespace meshlink::benchmark {

// Fetcher returning one prebuilt document for every source.
class FixedFetcher : public TopologyFetcher {
 public:
  explicit FixedFetcher(std::string document) : document_(std::move(document)) {}

  arrow::Result<std::string> fetch(const TopologySource &) const override {
    return document_;
  }

 private:
  std::string document_;
};

std::string ip_of(int i) {
  return "10." + std::to_string(i / 65536 % 256) + "." +
         std::to_string(i / 256 % 256) + "." + std::to_string(i % 256);
}

/**
 * Mesh of `size` nodes with one wireless endpoint each, wired as a ring plus
 * random chords.
 */
class BenchmarkFixture {
 private:
  std::shared_ptr<AddressIndex> index_;
  std::shared_ptr<LinkStore> store_;
  std::unique_ptr<TopologyReconciler> reconciler_;
  std::string document_;
  mutable std::mt19937 rng_;

 public:
  explicit BenchmarkFixture(int size) : rng_(42) {
    Logger::getInstance().setLevel(LogLevel::ERROR);
    index_ = std::make_shared<AddressIndex>();
    index_->add_layer(1, "default", "Default").ValueOrDie();
    for (int i = 1; i <= size; ++i) {
      index_
          ->add_node(i, "node-" + std::to_string(i), "Node " + std::to_string(i),
                     GeoPoint{41.0 + i * 1e-4, 12.0}, 1)
          .ValueOrDie();
      index_->add_endpoint(i, i, "", InterfaceType::WIRELESS, {ip_of(i)})
          .ValueOrDie();
    }
    document_ = make_graph(size);
    reset_store();
  }

  void reset_store() {
    store_ = std::make_shared<LinkStore>(
        index_, make_config().with_reversion_enabled(false).build());
    reconciler_ = std::make_unique<TopologyReconciler>(
        index_, store_, std::make_shared<FixedFetcher>(document_));
  }

  std::string make_graph(int size) const {
    nlohmann::json doc;
    doc["nodes"] = nlohmann::json::array();
    doc["links"] = nlohmann::json::array();
    std::uniform_int_distribution<int> pick(1, size);
    std::uniform_real_distribution<double> weight(1.0, 3.0);
    for (int i = 1; i <= size; ++i) {
      doc["nodes"].push_back({{"id", ip_of(i)}});
      const int next = i % size + 1;
      if (next != i) {
        doc["links"].push_back({{"source", ip_of(i)},
                                {"target", ip_of(next)},
                                {"weight", weight(rng_)}});
      }
      const int chord = pick(rng_);
      if (chord != i && chord != next) {
        doc["links"].push_back({{"source", ip_of(i)},
                                {"target", ip_of(chord)},
                                {"weight", weight(rng_)}});
      }
    }
    return doc.dump();
  }

  TopologyReconciler &reconciler() { return *reconciler_; }
  LinkStore &store() { return *store_; }
};

const TopologySource kSource{1, "memory", "OLSR", "0.6", "ETX"};

void BM_FirstPass(::benchmark::State &state) {
  BenchmarkFixture fixture(static_cast<int>(state.range(0)));
  for (auto _ : state) {
    state.PauseTiming();
    fixture.reset_store();
    state.ResumeTiming();

    auto report = fixture.reconciler().update(kSource);
    if (!report.ok() || report->created == 0) {
      state.SkipWithError("Reconciliation failed");
    }
  }
  state.SetItemsProcessed(state.iterations() * state.range(0));
}

void BM_SteadyStatePass(::benchmark::State &state) {
  BenchmarkFixture fixture(static_cast<int>(state.range(0)));
  fixture.reconciler().update(kSource).ValueOrDie();
  for (auto _ : state) {
    auto report = fixture.reconciler().update(kSource);
    if (!report.ok() || report->created != 0) {
      state.SkipWithError("Steady state pass created links");
    }
  }
  state.SetItemsProcessed(state.iterations() * state.range(0));
}

void BM_Export(::benchmark::State &state) {
  BenchmarkFixture fixture(static_cast<int>(state.range(0)));
  fixture.reconciler().update(kSource).ValueOrDie();
  for (auto _ : state) {
    ::benchmark::DoNotOptimize(fixture.reconciler().export_graph(kSource));
  }
}

void BM_LinksTable(::benchmark::State &state) {
  BenchmarkFixture fixture(static_cast<int>(state.range(0)));
  fixture.reconciler().update(kSource).ValueOrDie();
  for (auto _ : state) {
    // every pass bumps the store version, so the table is rebuilt
    state.PauseTiming();
    fixture.reconciler().update(kSource).ValueOrDie();
    state.ResumeTiming();
    ::benchmark::DoNotOptimize(fixture.store().get_table().ValueOrDie());
  }
}

class SmallMeshTest : public ::testing::Test {
 protected:
  void SetUp() override { fixture = std::make_unique<BenchmarkFixture>(100); }

  std::unique_ptr<BenchmarkFixture> fixture;
};

TEST_F(SmallMeshTest, FirstPassCreatesEveryEdge) {
  auto report = fixture->reconciler().update(kSource);
  ASSERT_TRUE(report.ok());
  EXPECT_GE(report->created, 100);
  EXPECT_EQ(report->failed, 0);
  EXPECT_EQ(fixture->store().count(), report->created);
}

TEST_F(SmallMeshTest, SecondPassOnlyUpdates) {
  auto first = fixture->reconciler().update(kSource).ValueOrDie();
  auto second = fixture->reconciler().update(kSource).ValueOrDie();
  EXPECT_EQ(second.created, 0);
  EXPECT_EQ(second.disconnected, 0);
  EXPECT_EQ(fixture->store().count(), first.created);
}

TEST_F(SmallMeshTest, ExportMatchesStore) {
  auto report = fixture->reconciler().update(kSource).ValueOrDie();
  auto doc = fixture->reconciler().export_graph(kSource);
  EXPECT_EQ(doc["links"].size(), report.created);
  EXPECT_EQ(doc["nodes"].size(), 100);
}

}  // namespace meshlink::benchmark

BENCHMARK(meshlink::benchmark::BM_FirstPass)
    ->RangeMultiplier(10)
    ->Range(10, 10000)
    ->Unit(::benchmark::kMicrosecond);

BENCHMARK(meshlink::benchmark::BM_SteadyStatePass)
    ->RangeMultiplier(10)
    ->Range(10, 10000)
    ->Unit(::benchmark::kMicrosecond);

BENCHMARK(meshlink::benchmark::BM_Export)
    ->RangeMultiplier(10)
    ->Range(10, 10000)
    ->Unit(::benchmark::kMicrosecond);

BENCHMARK(meshlink::benchmark::BM_LinksTable)
    ->RangeMultiplier(10)
    ->Range(100, 10000)
    ->Unit(::benchmark::kMicrosecond);

// Runs the gtest suite, or the benchmarks when --benchmark is given.
int main(int argc, char **argv) {
  ::testing::InitGoogleTest(&argc, argv);

  bool run_benchmarks = false;
  for (int i = 1; i < argc; ++i) {
    if (std::string(argv[i]) == "--benchmark") {
      run_benchmarks = true;
      break;
    }
  }

  if (run_benchmarks) {
    std::vector<char *> filtered_args;
    filtered_args.push_back(argv[0]);
    for (int i = 1; i < argc; ++i) {
      if (std::string(argv[i]) != "--benchmark") {
        filtered_args.push_back(argv[i]);
      }
    }

    int filtered_argc = static_cast<int>(filtered_args.size());
    char **filtered_argv = filtered_args.data();

    ::benchmark::Initialize(&filtered_argc, filtered_argv);
    if (::benchmark::ReportUnrecognizedArguments(filtered_argc,
                                                 filtered_argv)) {
      return 1;
    }
    ::benchmark::RunSpecifiedBenchmarks();
    return 0;
  }
  return RUN_ALL_TESTS();
}
