#ifndef fsa5_test_serialize_bytes_hpp
#define fsa5_test_serialize_bytes_hpp

#include "../serialize.hpp"
#include "Fsa5Reader.hpp"

#include <sstream>

namespace fsa5::test {
inline Bytes serialize_bytes(SerializeConfig const& config,
                             Automaton const&       fsa) {
    std::ostringstream stream;
    serialize(stream, config, fsa);
    return to_bytes(stream.str());
}

inline Bytes serialize_bytes(Automaton const& fsa) {
    return serialize_bytes(SerializeConfig{}, fsa);
}
} // namespace fsa5::test

#endif // include guard
