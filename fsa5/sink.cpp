#include "sink.hpp"

#include <string>

namespace fsa5 {
void write_bytes(std::ostream& stream, std::span<uint8_t const> const bytes) {
    stream.write(reinterpret_cast<char const*>(bytes.data()),
                 static_cast<std::streamsize>(bytes.size()));
    if (!stream) {
        throw SinkFailure{bytes.size()};
    }
}

SinkFailure::SinkFailure(size_t const numBytes)
    : std::runtime_error{"Failed to write " + std::to_string(numBytes) +
                         " bytes to the output stream"} {}
} // namespace fsa5
