#ifndef MONGO_MANAGER_HPP
#define MONGO_MANAGER_HPP

#include <memory>
#include <mongocxx/client.hpp>
#include <mongocxx/instance.hpp>
#include <mongocxx/pool.hpp>
#include <mongocxx/uri.hpp>
#include <string>

// Owns the driver instance and a client pool for one URI.
class MongoManager {
public:
  // Throws storage::StorageError for a malformed URI.
  explicit MongoManager(const std::string &uri);

  mongocxx::pool::entry get_client();

  // Runs the server's ping command; on failure `error` holds the reason.
  bool ping(std::string &error);

private:
  static mongocxx::instance instance_;
  std::unique_ptr<mongocxx::pool> pool_;
};

#endif // MONGO_MANAGER_HPP
