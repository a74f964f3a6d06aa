#ifndef CONCURRENCY_HPP
#define CONCURRENCY_HPP

#include <tbb/concurrent_hash_map.h>

#include <algorithm>
#include <memory>
#include <mutex>
#include <variant>
#include <vector>

namespace meshlink {

/**
 * @brief Thread-safe set backed by tbb::concurrent_hash_map
 *
 * Used to collect ids from several threads, e.g. the links touched by one
 * reconciliation pass.
 */
template <typename T>
class ConcurrentSet {
 private:
  tbb::concurrent_hash_map<T, std::monostate> data_;

 public:
  ConcurrentSet() = default;

  // Returns true if inserted, false if already present
  bool insert(const T& t) {
    typename tbb::concurrent_hash_map<T, std::monostate>::accessor acc;
    return data_.insert(acc, t);
  }

  bool contains(const T& t) const {
    typename tbb::concurrent_hash_map<T, std::monostate>::const_accessor acc;
    return data_.find(acc, t);
  }

  bool remove(const T& t) { return data_.erase(t); }

  size_t size() const { return data_.size(); }

  bool empty() const { return data_.empty(); }

  /**
   * @brief Sorted copy of the elements
   *
   * Not a consistent snapshot while other threads keep inserting.
   */
  std::vector<T> sorted() const {
    std::vector<T> result;
    result.reserve(data_.size());
    for (auto it = data_.begin(); it != data_.end(); ++it) {
      result.push_back(it->first);
    }
    std::sort(result.begin(), result.end());
    return result;
  }

  void clear() { data_.clear(); }
};

/**
 * @brief One mutex per key, created on first use
 *
 * Serializes work on the same key (a topology source) while different keys
 * proceed in parallel. Mutexes are never released, the key space is small.
 */
template <typename Key>
class LockRegistry {
 public:
  std::shared_ptr<std::mutex> get(const Key& key) {
    typename tbb::concurrent_hash_map<Key, std::shared_ptr<std::mutex>>::accessor
        acc;
    if (locks_.insert(acc, key)) {
      acc->second = std::make_shared<std::mutex>();
    }
    return acc->second;
  }

  size_t size() const { return locks_.size(); }

 private:
  tbb::concurrent_hash_map<Key, std::shared_ptr<std::mutex>> locks_;
};

}  // namespace meshlink

#endif  // CONCURRENCY_HPP
