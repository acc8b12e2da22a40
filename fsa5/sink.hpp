#ifndef fsa5_sink_hpp
#define fsa5_sink_hpp

#include <cstddef>
#include <cstdint>
#include <ostream>
#include <span>
#include <stdexcept>

namespace fsa5 {
// Write bytes to stream as one unit.  Throws SinkFailure if the stream is in a
// failed state afterwards.
void write_bytes(std::ostream& stream, std::span<uint8_t const> bytes);

struct SinkFailure : std::runtime_error {
    SinkFailure(size_t numBytes);
};
} // namespace fsa5

#endif // include guard
