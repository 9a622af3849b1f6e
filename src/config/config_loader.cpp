#include "config/config_loader.hpp"
#include <filesystem>
#include <boost/log/trivial.hpp>
#include <boost/property_tree/ini_parser.hpp>
#include <boost/property_tree/ptree.hpp>
#include "storage/disk_collection.hpp"
#include "storage/memory_collection.hpp"

namespace gridstore {
namespace config {

namespace {

// Converts key when present, keeps fallback otherwise. Throws ConfigError
// when the text does not convert to T.
template <typename T>
T typed_value(const boost::property_tree::ptree& tree, const std::string& key, const T& fallback) {
  auto text = tree.get_optional<std::string>(key);
  if (!text) {
    return fallback;
  }
  try {
    return tree.get<T>(key);
  } catch (const boost::property_tree::ptree_bad_data&) {
    throw ConfigError(key + " has invalid value '" + *text + "'");
  }
}

std::size_t bounded_size(const boost::property_tree::ptree& tree, const std::string& key,
                         std::size_t fallback, std::size_t max) {
  auto value = typed_value<long long>(tree, key, static_cast<long long>(fallback));
  if (value <= 0) {
    throw ConfigError(key + " must be positive, got " + std::to_string(value));
  }
  if (static_cast<unsigned long long>(value) > max) {
    throw ConfigError(key + " must not exceed " + std::to_string(max) + ", got " + std::to_string(value));
  }
  return static_cast<std::size_t>(value);
}

// Upper bound on runtime.threads
constexpr std::size_t MAX_THREADS = 1024;

Backend parse_backend(const std::string& name) {
  if (name == "memory") {
    return Backend::MEMORY;
  }
  if (name == "disk") {
    return Backend::DISK;
  }
  throw ConfigError("unknown storage.backend '" + name + "'");
}

} // namespace

Settings load_settings(const std::string& path) {
  Settings settings;

  if (!std::filesystem::exists(path)) {
    BOOST_LOG_TRIVIAL(warning) << "Config: Unable to open config file " << path << ", falling back to defaults";
    return settings;
  }

  boost::property_tree::ptree tree;
  try {
    boost::property_tree::read_ini(path, tree);
  } catch (const boost::property_tree::ini_parser_error& e) {
    throw ConfigError(std::string("failed to parse ") + path + ": " + e.what());
  }

  try {
    settings.backend = parse_backend(tree.get<std::string>("storage.backend", "memory"));
    settings.storage_path = tree.get<std::string>("storage.path", settings.storage_path);

    settings.bucket = tree.get<std::string>("gridfs.bucket", settings.bucket);
    if (settings.bucket.empty()) {
      throw ConfigError("gridfs.bucket must not be empty");
    }
    settings.chunk_size = bounded_size(tree, "gridfs.chunk_size", settings.chunk_size, gridfs::MAX_CHUNK_SIZE);
    settings.compute_md5 = typed_value<bool>(tree, "gridfs.md5", settings.compute_md5);

    settings.log_file = tree.get<std::string>("logging.file", settings.log_file);
    std::string level = tree.get<std::string>("logging.level", "info");
    auto parsed = logging::parse_log_level(level);
    if (!parsed) {
      throw ConfigError("unknown logging.level '" + level + "'");
    }
    settings.log_level = *parsed;

    settings.threads = bounded_size(tree, "runtime.threads", settings.threads, MAX_THREADS);
  } catch (const boost::property_tree::ptree_error& e) {
    throw ConfigError(std::string("invalid value in ") + path + ": " + e.what());
  }

  BOOST_LOG_TRIVIAL(info) << "Config: Loaded " << path;
  return settings;
}

std::shared_ptr<storage::Database> make_database(const Settings& settings) {
  switch (settings.backend) {
    case Backend::MEMORY:
      BOOST_LOG_TRIVIAL(info) << "Config: Using in-memory storage";
      return std::make_shared<storage::MemoryDatabase>();
    case Backend::DISK:
      BOOST_LOG_TRIVIAL(info) << "Config: Using disk storage at " << settings.storage_path;
      return std::make_shared<storage::DiskDatabase>(settings.storage_path);
    default:
      throw ConfigError("unsupported storage backend");
  }
}

void init_logging(const Settings& settings) {
  logging::init_logging(settings.log_file, settings.log_level);
}

std::unique_ptr<boost::asio::thread_pool> make_thread_pool(const Settings& settings) {
  BOOST_LOG_TRIVIAL(info) << "Config: Starting " << settings.threads << " worker threads";
  return std::make_unique<boost::asio::thread_pool>(settings.threads);
}

gridfs::GridStoreConfig make_store_config(const Settings& settings,
                                          std::shared_ptr<storage::Database> database,
                                          boost::asio::any_io_executor executor) {
  gridfs::GridStoreConfig config;
  config.database = std::move(database);
  config.bucket_name = settings.bucket;
  config.chunk_size = settings.chunk_size;
  config.compute_md5 = settings.compute_md5;
  config.executor = std::move(executor);
  return config;
}

} // namespace config
} // namespace gridstore
