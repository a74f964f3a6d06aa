#include "link_store.hpp"

#include <algorithm>

#include "errors.hpp"
#include "logger.hpp"

namespace meshlink {

arrow::Result<Link> LinkStore::create(Link fields) {
  if (fields.id != 0) {
    return arrow::Status::Invalid("Link to create already has id=", fields.id);
  }
  return save(std::move(fields));
}

arrow::Result<Link> LinkStore::save(Link link) {
  // load by id always wins over whatever object the caller cached
  ARROW_RETURN_NOT_OK(link.load_endpoints(*index_));
  ARROW_RETURN_NOT_OK(link.validate());
  ARROW_RETURN_NOT_OK(link.derive(*index_));

  std::unique_lock<std::shared_mutex> lock(mutex_);

  if (link.id == 0) {
    if (int64_t conflict = find_conflict(link); conflict != 0) {
      return arrow::Status::AlreadyExists(
          "Link ", conflict, " already joins endpoints ", link.endpoint_a_id,
          " and ", link.endpoint_b_id);
    }
    link.id = link_id_counter_.fetch_add(1, std::memory_order_acq_rel);
    if (!link.published.has_value()) {
      link.published = config_.is_published_default();
    }
    index_link(link);
    links_.emplace(link.id, link);
    log_debug("Created link {} ({})", link.id, link.to_string());
  } else {
    auto it = links_.find(link.id);
    if (it == links_.end()) {
      return arrow::Status::KeyError("Link not found with id=", link.id);
    }
    if (int64_t conflict = find_conflict(link); conflict != 0) {
      return arrow::Status::AlreadyExists(
          "Link ", conflict, " already joins endpoints ", link.endpoint_a_id,
          " and ", link.endpoint_b_id);
    }
    if (!link.published.has_value()) {
      link.published = it->second.published;
    }
    if (config_.is_reversion_enabled() && link.differs_from(it->second)) {
      record_revision(it->second);
    }
    unindex_link(it->second);
    index_link(link);
    it->second = link;
  }

  version_.fetch_add(1, std::memory_order_acq_rel);
  return link;
}

void LinkStore::record_revision(const Link &previous) {
  const size_t limit = config_.get_max_revisions();
  if (limit == 0) {
    return;
  }
  auto &history = revisions_[previous.id];
  history.push_back(previous);
  if (history.size() > limit) {
    history.erase(history.begin(),
                  history.begin() + (history.size() - limit));
  }
}

arrow::Result<Link> LinkStore::get(int64_t id) const {
  std::shared_lock<std::shared_mutex> lock(mutex_);
  auto it = links_.find(id);
  if (it == links_.end()) {
    return arrow::Status::KeyError("Link not found with id=", id);
  }
  return it->second;
}

std::optional<Link> LinkStore::find_by_endpoint_pair(
    int64_t endpoint_a_id, int64_t endpoint_b_id) const {
  std::shared_lock<std::shared_mutex> lock(mutex_);
  auto it = by_pair_.find(make_pair_key(endpoint_a_id, endpoint_b_id));
  if (it == by_pair_.end() || it->second.empty()) {
    return std::nullopt;
  }
  return links_.at(*it->second.begin());
}

std::optional<Link> LinkStore::find_by_endpoint_pair(
    int64_t endpoint_a_id, int64_t endpoint_b_id,
    std::optional<int64_t> topology_id) const {
  std::shared_lock<std::shared_mutex> lock(mutex_);
  auto it = by_pair_.find(make_pair_key(endpoint_a_id, endpoint_b_id));
  if (it == by_pair_.end()) {
    return std::nullopt;
  }
  for (int64_t id : it->second) {
    const auto &link = links_.at(id);
    if (link.topology_id == topology_id) {
      return link;
    }
  }
  return std::nullopt;
}

std::vector<Link> LinkStore::find(const LinkFilter &filter) const {
  std::shared_lock<std::shared_mutex> lock(mutex_);
  std::vector<Link> result;
  for (const auto &[id, link] : links_) {
    if (filter.matches(link)) {
      result.push_back(link);
    }
  }
  return result;
}

std::vector<Link> LinkStore::by_node(int64_t node_id) const {
  std::shared_lock<std::shared_mutex> lock(mutex_);
  std::vector<Link> result;
  auto it = by_node_.find(node_id);
  if (it == by_node_.end()) {
    return result;
  }
  result.reserve(it->second.size());
  for (int64_t id : it->second) {
    result.push_back(links_.at(id));
  }
  return result;
}

size_t LinkStore::count(const LinkFilter &filter) const {
  std::shared_lock<std::shared_mutex> lock(mutex_);
  if (!filter.topology_id.has_value() && !filter.status.has_value()) {
    return links_.size();
  }
  return std::count_if(links_.begin(), links_.end(), [&filter](const auto &kv) {
    return filter.matches(kv.second);
  });
}

std::vector<Link> LinkStore::revisions(int64_t id) const {
  std::shared_lock<std::shared_mutex> lock(mutex_);
  auto it = revisions_.find(id);
  if (it == revisions_.end()) {
    return {};
  }
  return it->second;
}

void LinkStore::delete_all() {
  std::unique_lock<std::shared_mutex> lock(mutex_);
  log_info("Deleting all {} links", links_.size());
  links_.clear();
  by_pair_.clear();
  by_node_.clear();
  revisions_.clear();
  version_.fetch_add(1, std::memory_order_acq_rel);
}

int64_t LinkStore::find_conflict(const Link &link) const {
  if (!has_pair(link)) {
    return 0;
  }
  auto it = by_pair_.find(make_pair_key(link.endpoint_a_id, link.endpoint_b_id));
  if (it == by_pair_.end()) {
    return 0;
  }
  for (int64_t id : it->second) {
    if (id != link.id && links_.at(id).topology_id == link.topology_id) {
      return id;
    }
  }
  return 0;
}

void LinkStore::index_link(const Link &link) {
  if (has_pair(link)) {
    by_pair_[make_pair_key(link.endpoint_a_id, link.endpoint_b_id)].insert(
        link.id);
  }
  if (link.node_a) {
    by_node_[link.node_a->id].insert(link.id);
  }
  if (link.node_b) {
    by_node_[link.node_b->id].insert(link.id);
  }
}

void LinkStore::unindex_link(const Link &link) {
  if (has_pair(link)) {
    auto it =
        by_pair_.find(make_pair_key(link.endpoint_a_id, link.endpoint_b_id));
    if (it != by_pair_.end()) {
      it->second.erase(link.id);
      if (it->second.empty()) {
        by_pair_.erase(it);
      }
    }
  }
  for (const auto &node : {link.node_a, link.node_b}) {
    if (!node) continue;
    auto it = by_node_.find(node->id);
    if (it != by_node_.end()) {
      it->second.erase(link.id);
    }
  }
}

namespace {

std::shared_ptr<arrow::Schema> links_schema() {
  static auto schema = arrow::schema({
      arrow::field("id", arrow::int64(), false),
      arrow::field("topology_id", arrow::int64()),
      arrow::field("endpoint_a_id", arrow::int64()),
      arrow::field("endpoint_b_id", arrow::int64()),
      arrow::field("node_a_id", arrow::int64()),
      arrow::field("node_b_id", arrow::int64()),
      arrow::field("status", arrow::utf8(), false),
      arrow::field("type", arrow::utf8()),
      arrow::field("metric_value", arrow::float64()),
      arrow::field("first_seen", arrow::int64()),
      arrow::field("last_seen", arrow::int64()),
  });
  return schema;
}

arrow::Status append_id(arrow::Int64Builder &builder, int64_t id) {
  return id != 0 ? builder.Append(id) : builder.AppendNull();
}

template <typename Builder, typename T>
arrow::Status append_optional(Builder &builder, const std::optional<T> &value) {
  return value.has_value() ? builder.Append(*value) : builder.AppendNull();
}

// Builders for one chunk of the links table.
struct LinkColumns {
  arrow::Int64Builder id;
  arrow::Int64Builder topology_id;
  arrow::Int64Builder endpoint_a_id;
  arrow::Int64Builder endpoint_b_id;
  arrow::Int64Builder node_a_id;
  arrow::Int64Builder node_b_id;
  arrow::StringBuilder status;
  arrow::StringBuilder type;
  arrow::DoubleBuilder metric_value;
  arrow::Int64Builder first_seen;
  arrow::Int64Builder last_seen;

  arrow::Status append(const Link &link) {
    ARROW_RETURN_NOT_OK(id.Append(link.id));
    ARROW_RETURN_NOT_OK(append_optional(topology_id, link.topology_id));
    ARROW_RETURN_NOT_OK(append_id(endpoint_a_id, link.endpoint_a_id));
    ARROW_RETURN_NOT_OK(append_id(endpoint_b_id, link.endpoint_b_id));
    ARROW_RETURN_NOT_OK(append_id(node_a_id, link.node_a ? link.node_a->id : 0));
    ARROW_RETURN_NOT_OK(append_id(node_b_id, link.node_b ? link.node_b->id : 0));
    ARROW_RETURN_NOT_OK(status.Append(to_string(link.status)));
    if (link.type) {
      ARROW_RETURN_NOT_OK(type.Append(to_string(*link.type)));
    } else {
      ARROW_RETURN_NOT_OK(type.AppendNull());
    }
    ARROW_RETURN_NOT_OK(append_optional(metric_value, link.metric_value));
    ARROW_RETURN_NOT_OK(append_optional(first_seen, link.first_seen));
    ARROW_RETURN_NOT_OK(append_optional(last_seen, link.last_seen));
    return arrow::Status::OK();
  }

  // Appends one finished array per column, leaving the builders reset.
  arrow::Status finish(
      std::vector<std::vector<std::shared_ptr<arrow::Array>>> &chunks) {
    std::vector<arrow::ArrayBuilder *> builders = {
        &id,        &topology_id, &endpoint_a_id, &endpoint_b_id,
        &node_a_id, &node_b_id,   &status,        &type,
        &metric_value, &first_seen, &last_seen};
    for (size_t i = 0; i < builders.size(); ++i) {
      std::shared_ptr<arrow::Array> array;
      ARROW_RETURN_NOT_OK(builders[i]->Finish(&array));
      chunks[i].push_back(array);
    }
    return arrow::Status::OK();
  }
};

}  // namespace

arrow::Result<std::shared_ptr<arrow::Table>> LinkStore::generate_table() const {
  std::vector<Link> selected = find();
  log_debug("Generating links table with {} rows", selected.size());

  auto schema = links_schema();
  std::vector<std::vector<std::shared_ptr<arrow::Array>>> chunks(
      schema->num_fields());
  LinkColumns columns;
  const size_t chunk_size = std::max<size_t>(1, config_.get_chunk_size());

  size_t current_chunk_size = 0;
  for (const auto &link : selected) {
    ARROW_RETURN_NOT_OK(columns.append(link));
    if (++current_chunk_size >= chunk_size) {
      ARROW_RETURN_NOT_OK(columns.finish(chunks));
      current_chunk_size = 0;
    }
  }
  if (current_chunk_size > 0 || selected.empty()) {
    ARROW_RETURN_NOT_OK(columns.finish(chunks));
  }

  std::vector<std::shared_ptr<arrow::ChunkedArray>> chunked;
  chunked.reserve(chunks.size());
  for (size_t i = 0; i < chunks.size(); ++i) {
    chunked.push_back(std::make_shared<arrow::ChunkedArray>(
        chunks[i], schema->field(static_cast<int>(i))->type()));
  }
  return arrow::Table::Make(schema, chunked);
}

arrow::Result<std::shared_ptr<arrow::Table>> LinkStore::get_table() {
  std::lock_guard<std::mutex> lock(table_lock_);
  const int64_t latest_version = get_version();
  if (table_ != nullptr && table_version_ == latest_version) {
    return table_;
  }

  ARROW_ASSIGN_OR_RAISE(auto table, generate_table());
  table_ = table;
  table_version_ = latest_version;
  return table;
}

}  // namespace meshlink
