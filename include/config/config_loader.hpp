#pragma once

#include <cstddef>
#include <memory>
#include <stdexcept>
#include <string>
#include <boost/asio/any_io_executor.hpp>
#include <boost/asio/thread_pool.hpp>
#include "gridfs/grid_store.hpp"
#include "logger/logger.hpp"
#include "storage/collection.hpp"

namespace gridstore {
namespace config {

class ConfigError : public std::runtime_error {
public:
  explicit ConfigError(const std::string& message) : std::runtime_error("Config error: " + message) {}
};

enum class Backend {
  MEMORY,
  DISK
};

struct Settings {
  // [storage]
  Backend backend = Backend::MEMORY;
  std::string storage_path = "./data/gridstore";
  // [gridfs]
  std::string bucket = gridfs::DEFAULT_BUCKET;
  std::size_t chunk_size = gridfs::DEFAULT_CHUNK_SIZE;
  bool compute_md5 = true;
  // [logging]
  std::string log_file = "./data/gridstore.log";
  logging::severity_level log_level = boost::log::trivial::info;
  // [runtime]
  std::size_t threads = 2;
};

// Reads an INI file. A missing file yields the defaults; unreadable files
// and invalid values throw ConfigError.
Settings load_settings(const std::string& path);

// Database for the configured backend
std::shared_ptr<storage::Database> make_database(const Settings& settings);

// Sends log records to settings.log_file at settings.log_level
void init_logging(const Settings& settings);

// Worker pool with settings.threads threads for the store's operations
std::unique_ptr<boost::asio::thread_pool> make_thread_pool(const Settings& settings);

// Store configuration over database, running on executor
gridfs::GridStoreConfig make_store_config(const Settings& settings,
                                          std::shared_ptr<storage::Database> database,
                                          boost::asio::any_io_executor executor);

} // namespace config
} // namespace gridstore
