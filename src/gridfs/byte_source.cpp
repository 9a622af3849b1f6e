#include "gridfs/byte_source.hpp"
#include <stdexcept>
#include <boost/log/trivial.hpp>

namespace gridstore {
namespace gridfs {

ByteSource from_buffers(std::vector<Buffer> buffers) {
  auto pending = std::make_shared<std::vector<Buffer>>(std::move(buffers));
  auto position = std::make_shared<std::size_t>(0);

  return [pending, position](Buffer& out) {
    if (*position >= pending->size()) {
      return false;
    }
    out = (*pending)[(*position)++];
    return true;
  };
}

ByteSource from_strings(std::vector<std::string> parts) {
  std::vector<Buffer> buffers;
  buffers.reserve(parts.size());
  for (const auto& part : parts) {
    buffers.emplace_back(part.begin(), part.end());
  }
  return from_buffers(std::move(buffers));
}

ByteSource from_stream(std::shared_ptr<std::istream> input, std::size_t read_size) {
  if (!input) {
    throw std::invalid_argument("Byte source: Input stream is null");
  }
  if (read_size == 0) {
    throw std::invalid_argument("Byte source: Read size must be positive");
  }

  return [input, read_size](Buffer& out) {
    if (input->bad()) {
      throw std::runtime_error("Byte source: Input stream failed");
    }
    if (input->eof()) {
      return false;
    }

    out.resize(read_size);
    input->read(reinterpret_cast<char*>(out.data()), static_cast<std::streamsize>(read_size));
    if (input->bad()) {
      BOOST_LOG_TRIVIAL(error) << "Byte source: Read from input stream failed";
      throw std::runtime_error("Byte source: Input stream failed");
    }

    auto bytes_read = static_cast<std::size_t>(input->gcount());
    out.resize(bytes_read);
    return bytes_read > 0;
  };
}

} // namespace gridfs
} // namespace gridstore
