#include <gtest/gtest.h>

#include <atomic>
#include <thread>
#include <vector>

#include "errors.hpp"
#include "link_store.hpp"
#include "mesh_fixture.hpp"

namespace meshlink {

class LinkStoreTest : public ::testing::Test {
 protected:
  void SetUp() override {
    index = test::make_mesh_index();
    store = std::make_unique<LinkStore>(index);
  }

  static Link make_link(int64_t a, int64_t b,
                   std::optional<int64_t> topology_id = std::nullopt) {
    Link link;
    link.status = LinkStatus::ACTIVE;
    link.endpoint_a_id = a;
    link.endpoint_b_id = b;
    link.topology_id = topology_id;
    return link;
  }

  std::shared_ptr<AddressIndex> index;
  std::unique_ptr<LinkStore> store;
};

TEST_F(LinkStoreTest, CreateAssignsIdsAndDerives) {
  auto first = store->create(make_link(10, 20));
  ASSERT_TRUE(first.ok()) << first.status().ToString();
  auto second = store->create(make_link(20, 30));
  ASSERT_TRUE(second.ok()) << second.status().ToString();

  EXPECT_GT(second->id, first->id);
  EXPECT_EQ(first->type, LinkType::RADIO);
  ASSERT_NE(first->node_a, nullptr);
  EXPECT_EQ(first->node_a->id, 1);
  EXPECT_EQ(first->published, true);
  EXPECT_EQ(store->count(), 2);

  auto loaded = store->get(first->id);
  ASSERT_TRUE(loaded.ok());
  EXPECT_EQ(loaded->data.node_b_name, "Node B");
}

TEST_F(LinkStoreTest, CreateRejectsExistingId) {
  auto link = make_link(10, 20);
  link.id = 7;
  EXPECT_TRUE(store->create(link).status().IsInvalid());
}

TEST_F(LinkStoreTest, ValidationFailureStoresNothing) {
  auto res = store->create(make_link(10, 21));
  ASSERT_FALSE(res.ok());
  EXPECT_TRUE(is_error(res.status(), ErrorKind::VALIDATION_FAILED));
  EXPECT_EQ(store->count(), 0);
}

TEST_F(LinkStoreTest, PairIsUniquePerSource) {
  ASSERT_TRUE(store->create(make_link(10, 20, 1)).ok());

  auto reversed = store->create(make_link(20, 10, 1));
  ASSERT_FALSE(reversed.ok());
  EXPECT_TRUE(reversed.status().IsAlreadyExists());

  // other sources and manual links have their own scope
  EXPECT_TRUE(store->create(make_link(20, 10, 2)).ok());
  EXPECT_TRUE(store->create(make_link(10, 20)).ok());
  EXPECT_FALSE(store->create(make_link(10, 20)).ok());
  EXPECT_EQ(store->count(), 3);
}

TEST_F(LinkStoreTest, FindByEndpointPairIgnoresOrientation) {
  auto created = store->create(make_link(10, 20, 1)).ValueOrDie();

  auto forward = store->find_by_endpoint_pair(10, 20);
  auto backward = store->find_by_endpoint_pair(20, 10);
  ASSERT_TRUE(forward.has_value());
  ASSERT_TRUE(backward.has_value());
  EXPECT_EQ(forward->id, created.id);
  EXPECT_EQ(backward->id, created.id);

  EXPECT_TRUE(store->find_by_endpoint_pair(20, 10, 1).has_value());
  EXPECT_FALSE(store->find_by_endpoint_pair(20, 10, 2).has_value());
  EXPECT_FALSE(store->find_by_endpoint_pair(20, 10, std::nullopt).has_value());
  EXPECT_FALSE(store->find_by_endpoint_pair(10, 30).has_value());
}

TEST_F(LinkStoreTest, UnscopedLookupReturnsOldest) {
  auto oldest = store->create(make_link(10, 20, 2)).ValueOrDie();
  ASSERT_TRUE(store->create(make_link(10, 20, 1)).ok());
  EXPECT_EQ(store->find_by_endpoint_pair(20, 10)->id, oldest.id);
}

TEST_F(LinkStoreTest, SaveUpdatesAndKeepsRevisions) {
  auto link = store->create(make_link(10, 20, 1)).ValueOrDie();
  const int64_t version = store->get_version();

  link.status = LinkStatus::DISCONNECTED;
  link.metric_value = 2.5;
  auto saved = store->save(link);
  ASSERT_TRUE(saved.ok()) << saved.status().ToString();

  EXPECT_GT(store->get_version(), version);
  EXPECT_EQ(store->get(link.id)->status, LinkStatus::DISCONNECTED);
  EXPECT_EQ(store->count(), 1);

  auto history = store->revisions(link.id);
  ASSERT_EQ(history.size(), 1);
  EXPECT_EQ(history[0].status, LinkStatus::ACTIVE);
}

TEST_F(LinkStoreTest, NoRevisionsWhenDisabled) {
  LinkStore plain(index, make_config()
                             .with_reversion_enabled(false)
                             .with_published_default(false)
                             .build());
  auto link = plain.create(make_link(10, 20)).ValueOrDie();
  EXPECT_EQ(link.published, false);
  link.status = LinkStatus::DOWN;
  ASSERT_TRUE(plain.save(link).ok());
  EXPECT_TRUE(plain.revisions(link.id).empty());
}

TEST_F(LinkStoreTest, SightingRefreshAddsNoRevision) {
  auto link = store->create(make_link(10, 20, 1)).ValueOrDie();
  for (int64_t seen = 1; seen <= 5; ++seen) {
    link.last_seen = seen * 1000;
    link.metric_value = 1.0 + static_cast<double>(seen);
    link = store->save(link).ValueOrDie();
  }
  EXPECT_TRUE(store->revisions(link.id).empty());
  EXPECT_EQ(store->get(link.id)->last_seen, 5000);

  link.metric_type = "hop";
  ASSERT_TRUE(store->save(link).ok());
  auto history = store->revisions(link.id);
  ASSERT_EQ(history.size(), 1);
  EXPECT_EQ(history[0].last_seen, 5000);
  EXPECT_FALSE(history[0].metric_type.has_value());
}

TEST_F(LinkStoreTest, RevisionsAreCappedPerLink) {
  LinkStore capped(index, make_config().with_max_revisions(3).build());
  auto link = capped.create(make_link(10, 20)).ValueOrDie();
  for (int64_t rate = 1; rate <= 10; ++rate) {
    link.max_rate = rate;
    link = capped.save(link).ValueOrDie();
  }

  auto history = capped.revisions(link.id);
  ASSERT_EQ(history.size(), 3);
  EXPECT_EQ(history[0].max_rate, 7);
  EXPECT_EQ(history[2].max_rate, 9);
  EXPECT_EQ(capped.get(link.id)->max_rate, 10);

  LinkStore none(index, make_config().with_max_revisions(0).build());
  auto other = none.create(make_link(10, 20)).ValueOrDie();
  other.status = LinkStatus::DOWN;
  ASSERT_TRUE(none.save(other).ok());
  EXPECT_TRUE(none.revisions(other.id).empty());
}

TEST_F(LinkStoreTest, SaveUnknownIdFails) {
  auto link = make_link(10, 20);
  link.id = 99;
  EXPECT_TRUE(store->save(link).status().IsKeyError());
}

TEST_F(LinkStoreTest, SaveCannotMoveOntoTakenPair) {
  ASSERT_TRUE(store->create(make_link(10, 20, 1)).ok());
  auto other = store->create(make_link(10, 30, 1)).ValueOrDie();
  other.endpoint_b_id = 20;
  other.endpoint_b.reset();
  EXPECT_TRUE(store->save(other).status().IsAlreadyExists());
  EXPECT_EQ(store->get(other.id)->endpoint_b_id, 30);
}

TEST_F(LinkStoreTest, FiltersBySourceStatusAndNode) {
  ASSERT_TRUE(store->create(make_link(10, 20, 1)).ok());
  auto down = make_link(20, 30, 1);
  down.status = LinkStatus::DISCONNECTED;
  ASSERT_TRUE(store->create(down).ok());
  ASSERT_TRUE(store->create(make_link(11, 21, 2)).ok());

  EXPECT_EQ(store->count(LinkFilter{1, std::nullopt}), 2);
  EXPECT_EQ(store->count(LinkFilter{1, LinkStatus::ACTIVE}), 1);
  EXPECT_EQ(store->count(LinkFilter{std::nullopt, LinkStatus::ACTIVE}), 2);
  EXPECT_EQ(store->by_source(2).size(), 1);
  EXPECT_EQ(store->all().size(), 3);

  // node 2 owns endpoints 20 and 21
  EXPECT_EQ(store->by_node(2).size(), 3);
  EXPECT_EQ(store->by_node(3).size(), 1);
  EXPECT_TRUE(store->by_node(42).empty());
}

TEST_F(LinkStoreTest, DeleteAll) {
  ASSERT_TRUE(store->create(make_link(10, 20)).ok());
  store->delete_all();
  EXPECT_EQ(store->count(), 0);
  EXPECT_FALSE(store->find_by_endpoint_pair(10, 20).has_value());
  EXPECT_TRUE(store->create(make_link(10, 20)).ok());
}

TEST_F(LinkStoreTest, TableIsCachedUntilChange) {
  LinkStore chunked(index, make_config().with_chunk_size(2).build());
  ASSERT_TRUE(chunked.create(make_link(10, 20, 1)).ok());
  ASSERT_TRUE(chunked.create(make_link(20, 30, 1)).ok());
  ASSERT_TRUE(chunked.create(make_link(11, 21)).ok());

  auto table = chunked.get_table().ValueOrDie();
  EXPECT_EQ(table->num_rows(), 3);
  EXPECT_EQ(table->num_columns(), 11);
  EXPECT_EQ(table->GetColumnByName("id")->num_chunks(), 2);
  EXPECT_EQ(table->GetColumnByName("topology_id")->null_count(), 1);

  EXPECT_EQ(chunked.get_table().ValueOrDie(), table);

  ASSERT_TRUE(chunked.create(make_link(10, 30)).ok());
  auto refreshed = chunked.get_table().ValueOrDie();
  EXPECT_NE(refreshed, table);
  EXPECT_EQ(refreshed->num_rows(), 4);
}

TEST_F(LinkStoreTest, EmptyTable) {
  auto table = store->get_table().ValueOrDie();
  EXPECT_EQ(table->num_rows(), 0);
  EXPECT_EQ(table->schema()->field(0)->name(), "id");
}

TEST_F(LinkStoreTest, ConcurrentCreateOfSamePairHasOneWinner) {
  constexpr int kThreads = 8;
  std::atomic<int> created{0};
  std::atomic<int> conflicts{0};
  std::vector<std::thread> threads;
  for (int i = 0; i < kThreads; ++i) {
    threads.emplace_back([&, i]() {
      auto res = store->create(i % 2 == 0 ? make_link(10, 20, 1) : make_link(20, 10, 1));
      if (res.ok()) {
        created++;
      } else if (res.status().IsAlreadyExists()) {
        conflicts++;
      }
    });
  }
  for (auto &t : threads) {
    t.join();
  }
  EXPECT_EQ(created.load(), 1);
  EXPECT_EQ(conflicts.load(), kThreads - 1);
  EXPECT_EQ(store->count(), 1);
}

}  // namespace meshlink
