#pragma once

#include <cstddef>
#include <cstdint>
#include <functional>
#include <istream>
#include <memory>
#include <string>
#include <vector>

namespace gridstore {
namespace gridfs {

using Buffer = std::vector<uint8_t>;

// Producer of byte buffers of arbitrary sizes. Each call replaces the
// contents of the buffer and returns true, or returns false once the input
// is exhausted. A producer reports a failing input by throwing.
using ByteSource = std::function<bool(Buffer&)>;

constexpr std::size_t DEFAULT_READ_SIZE = 64 * 1024;

// Yields each buffer in turn
ByteSource from_buffers(std::vector<Buffer> buffers);
// Yields each string's bytes in turn
ByteSource from_strings(std::vector<std::string> parts);
// Reads input in pieces of at most read_size bytes. Throws
// std::runtime_error if the stream enters the bad state.
ByteSource from_stream(std::shared_ptr<std::istream> input, std::size_t read_size = DEFAULT_READ_SIZE);

} // namespace gridfs
} // namespace gridstore
