#include "mongo_storage_backend.hpp"
#include "analytics/metric_key.hpp"
#include "analytics/statistics.hpp"
#include "core/logger.hpp"
#include "io/db/mongo_manager.hpp"
#include "utils/utils.hpp"

#include <bsoncxx/builder/basic/array.hpp>
#include <bsoncxx/builder/basic/document.hpp>
#include <bsoncxx/builder/basic/kvp.hpp>
#include <bsoncxx/types.hpp>
#include <mongocxx/exception/exception.hpp>
#include <mongocxx/options/find.hpp>

#include <chrono>
#include <map>
#include <string_view>

namespace storage {

using bsoncxx::builder::basic::kvp;
using bsoncxx::builder::basic::make_document;

namespace {

constexpr uint64_t kMillisPerDay = 24ULL * 60 * 60 * 1000;

double get_double(const bsoncxx::document::view &doc, const char *key) {
  auto element = doc[key];
  if (!element)
    return 0.0;
  switch (element.type()) {
  case bsoncxx::type::k_double:
    return element.get_double().value;
  case bsoncxx::type::k_int64:
    return static_cast<double>(element.get_int64().value);
  case bsoncxx::type::k_int32:
    return static_cast<double>(element.get_int32().value);
  default:
    return 0.0;
  }
}

uint64_t get_uint64(const bsoncxx::document::view &doc, const char *key) {
  auto element = doc[key];
  if (!element)
    return 0;
  switch (element.type()) {
  case bsoncxx::type::k_int64:
    return static_cast<uint64_t>(element.get_int64().value);
  case bsoncxx::type::k_int32:
    return static_cast<uint64_t>(element.get_int32().value);
  case bsoncxx::type::k_double:
    return static_cast<uint64_t>(element.get_double().value);
  default:
    return 0;
  }
}

std::string get_string(const bsoncxx::document::view &doc, const char *key) {
  auto element = doc[key];
  if (element && element.type() == bsoncxx::type::k_string)
    return std::string(std::string_view(element.get_string().value));
  return "";
}

bsoncxx::document::value time_range_filter(const char *op_low, uint64_t low,
                                           const char *op_high,
                                           uint64_t high) {
  bsoncxx::builder::basic::document range{};
  if (op_low)
    range.append(kvp(op_low, static_cast<int64_t>(low)));
  if (op_high)
    range.append(kvp(op_high, static_cast<int64_t>(high)));
  return range.extract();
}

} // namespace

MongoStorageBackend::MongoStorageBackend(
    const Config::MongoStorageConfig &config, uint32_t baseline_lookback_days)
    : config_(config), baseline_lookback_days_(baseline_lookback_days) {}

std::shared_ptr<MongoManager> MongoStorageBackend::manager() const {
  std::lock_guard<std::mutex> lock(manager_mutex_);
  if (!manager_)
    throw StorageError("MongoDB backend is not open");
  return manager_;
}

void MongoStorageBackend::open() {
  auto manager = std::make_shared<MongoManager>(config_.uri);

  std::string error;
  if (!manager->ping(error))
    throw StorageError("MongoDB ping failed: " + error);

  try {
    auto client = manager->get_client();
    auto collection = (*client)[config_.database][config_.collection];

    bsoncxx::builder::basic::document key_index{};
    key_index.append(kvp("metric_key", 1), kvp("end_time_ms", 1));
    collection.create_index(key_index.view());

    bsoncxx::builder::basic::document name_index{};
    name_index.append(kvp("metric_name", 1), kvp("end_time_ms", 1));
    collection.create_index(name_index.view());
  } catch (const mongocxx::exception &e) {
    throw StorageError(std::string("MongoDB index creation failed: ") +
                       e.what());
  }

  {
    std::lock_guard<std::mutex> lock(manager_mutex_);
    manager_ = std::move(manager);
  }
  LOG(LogLevel::INFO, LogComponent::STORAGE_MONGO,
      "Using " << config_.database << "." << config_.collection
               << " for aggregations");
}

void MongoStorageBackend::close() {
  std::lock_guard<std::mutex> lock(manager_mutex_);
  manager_.reset();
}

void MongoStorageBackend::persist_aggregation(
    const std::string &metric_name, const analytics::Tags &tags,
    const analytics::Aggregation &aggregation) {
  auto mongo = manager();

  bsoncxx::builder::basic::document tags_builder{};
  for (const auto &[key, value] : tags)
    tags_builder.append(kvp(key, value));

  auto tags_doc = tags_builder.extract();

  bsoncxx::builder::basic::array pairs_builder{};
  for (const auto &[key, value] : tags) {
    auto pair = make_document(kvp("k", key), kvp("v", value));
    pairs_builder.append(pair.view());
  }
  auto tag_pairs = pairs_builder.extract();

  bsoncxx::builder::basic::document doc{};
  doc.append(
      kvp("metric_name", metric_name),
      kvp("metric_key", analytics::canonical_key(metric_name, tags)),
      kvp("tags", tags_doc.view()), kvp("tag_pairs", tag_pairs.view()),
      kvp("count", static_cast<int64_t>(aggregation.count)),
      kvp("sum", aggregation.sum), kvp("min", aggregation.min),
      kvp("max", aggregation.max), kvp("avg", aggregation.avg),
      kvp("last", aggregation.last), kvp("p50", aggregation.p50),
      kvp("p95", aggregation.p95), kvp("p99", aggregation.p99),
      kvp("sum_squares", aggregation.sum_squares), kvp("m2", aggregation.m2),
      kvp("start_time_ms", static_cast<int64_t>(aggregation.start_time_ms)),
      kvp("end_time_ms", static_cast<int64_t>(aggregation.end_time_ms)),
      kvp("time_bucket",
          bsoncxx::types::b_date(
              std::chrono::milliseconds(aggregation.end_time_ms))));

  try {
    auto client = mongo->get_client();
    (*client)[config_.database][config_.collection].insert_one(doc.view());
  } catch (const mongocxx::exception &e) {
    throw StorageError("MongoDB insert for " + metric_name +
                       " failed: " + e.what());
  }
}

analytics::Aggregation
MongoStorageBackend::document_to_aggregation(const bsoncxx::document::view &doc) {
  analytics::Aggregation aggregation;
  aggregation.count = get_uint64(doc, "count");
  aggregation.sum = get_double(doc, "sum");
  aggregation.min = get_double(doc, "min");
  aggregation.max = get_double(doc, "max");
  aggregation.avg = get_double(doc, "avg");
  aggregation.last = get_double(doc, "last");
  aggregation.p50 = get_double(doc, "p50");
  aggregation.p95 = get_double(doc, "p95");
  aggregation.p99 = get_double(doc, "p99");
  aggregation.sum_squares = get_double(doc, "sum_squares");
  aggregation.m2 = get_double(doc, "m2");
  aggregation.start_time_ms = get_uint64(doc, "start_time_ms");
  aggregation.end_time_ms = get_uint64(doc, "end_time_ms");
  return aggregation;
}

BaselineEntries MongoStorageBackend::load_baseline_stats() {
  auto mongo = manager();

  uint64_t cutoff = 0;
  const uint64_t now = Utils::get_current_time_ms();
  const uint64_t lookback = baseline_lookback_days_ * kMillisPerDay;
  if (baseline_lookback_days_ > 0 && now > lookback)
    cutoff = now - lookback;

  auto since = time_range_filter("$gte", cutoff, nullptr, 0);
  bsoncxx::builder::basic::document filter{};
  filter.append(kvp("end_time_ms", since.view()));

  mongocxx::options::find opts{};
  bsoncxx::builder::basic::document sort_builder{};
  sort_builder.append(kvp("end_time_ms", 1));
  opts.sort(sort_builder.view());

  std::map<std::string, analytics::BaselineStats> folded;
  size_t documents = 0;
  try {
    auto client = mongo->get_client();
    auto collection = (*client)[config_.database][config_.collection];
    for (const auto &doc : collection.find(filter.view(), opts)) {
      std::string key = get_string(doc, "metric_key");
      if (key.empty())
        continue;
      folded[key] =
          analytics::fold_aggregation(folded[key], document_to_aggregation(doc));
      ++documents;
    }
  } catch (const mongocxx::exception &e) {
    throw StorageError(std::string("MongoDB baseline load failed: ") +
                       e.what());
  }

  LOG(LogLevel::DEBUG, LogComponent::STORAGE_MONGO,
      "Folded " << documents << " aggregations into " << folded.size()
                << " baselines");
  return BaselineEntries(folded.begin(), folded.end());
}

bsoncxx::document::value
MongoStorageBackend::history_filter(const std::string &metric_name,
                                    const analytics::Tags &tags,
                                    const analytics::TimeRange &range) {
  bsoncxx::builder::basic::document filter{};
  filter.append(kvp("metric_name", metric_name));

  // Tag keys are user data; matching on tag_pairs keeps a '.' or '$' in a
  // key from turning into a field path or an operator.
  if (!tags.empty()) {
    bsoncxx::builder::basic::array matchers{};
    for (const auto &[key, value] : tags) {
      auto pair = make_document(kvp("k", key), kvp("v", value));
      auto matcher = make_document(kvp("$elemMatch", pair.view()));
      matchers.append(matcher.view());
    }
    auto required = matchers.extract();
    auto all = make_document(kvp("$all", required.view()));
    filter.append(kvp("tag_pairs", all.view()));
  }

  auto window =
      time_range_filter("$gte", range.start_ms, "$lte", range.end_ms);
  filter.append(kvp("end_time_ms", window.view()));
  return filter.extract();
}

std::vector<analytics::HistoryRow> MongoStorageBackend::query_history(
    const std::string &metric_name, const analytics::Tags &tags,
    const analytics::TimeRange &range, analytics::Granularity granularity) {
  auto mongo = manager();
  auto filter = history_filter(metric_name, tags, range);

  std::vector<analytics::Aggregation> aggregations;
  try {
    auto client = mongo->get_client();
    auto collection = (*client)[config_.database][config_.collection];
    for (const auto &doc : collection.find(filter.view()))
      aggregations.push_back(document_to_aggregation(doc));
  } catch (const mongocxx::exception &e) {
    throw StorageError("MongoDB history query for " + metric_name +
                       " failed: " + e.what());
  }

  return analytics::roll_up_history(aggregations, granularity);
}

size_t MongoStorageBackend::purge_before(uint64_t cutoff_ms) {
  auto mongo = manager();

  auto before = time_range_filter("$lt", cutoff_ms, nullptr, 0);
  bsoncxx::builder::basic::document filter{};
  filter.append(kvp("end_time_ms", before.view()));

  try {
    auto client = mongo->get_client();
    auto result =
        (*client)[config_.database][config_.collection].delete_many(
            filter.view());
    return result ? static_cast<size_t>(result->deleted_count()) : 0;
  } catch (const mongocxx::exception &e) {
    throw StorageError(std::string("MongoDB purge failed: ") + e.what());
  }
}

} // namespace storage
