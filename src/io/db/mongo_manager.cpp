#include "mongo_manager.hpp"
#include "core/logger.hpp"
#include "storage/storage_backend.hpp"

#include <bsoncxx/builder/basic/document.hpp>
#include <bsoncxx/builder/basic/kvp.hpp>
#include <mongocxx/exception/exception.hpp>

mongocxx::instance MongoManager::instance_{};

MongoManager::MongoManager(const std::string &uri) {
  try {
    mongocxx::uri mongo_uri(uri);
    pool_ = std::make_unique<mongocxx::pool>(mongo_uri);
  } catch (const mongocxx::exception &e) {
    LOG(LogLevel::ERROR, LogComponent::STORAGE_MONGO,
        "Could not initialize MongoDB connection pool. Error: " << e.what());
    throw storage::StorageError("Invalid MongoDB URI '" + uri +
                                "': " + e.what());
  }
  LOG(LogLevel::INFO, LogComponent::STORAGE_MONGO,
      "MongoDB connection pool initialized for URI: " << uri);
}

mongocxx::pool::entry MongoManager::get_client() { return pool_->acquire(); }

bool MongoManager::ping(std::string &error) {
  try {
    auto client = pool_->acquire();

    bsoncxx::builder::basic::document doc_builder{};
    doc_builder.append(bsoncxx::builder::basic::kvp("ping", 1));
    (*client)["admin"].run_command(doc_builder.view());

    LOG(LogLevel::TRACE, LogComponent::STORAGE_MONGO,
        "MongoDB server is reachable and responsive.");
    return true;
  } catch (const mongocxx::exception &e) {
    error = e.what();
    LOG(LogLevel::ERROR, LogComponent::STORAGE_MONGO,
        "MongoDB server is unreachable. Error: " << e.what());
    return false;
  }
}
