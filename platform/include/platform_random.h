#ifndef SENDKEY_PLATFORM_RANDOM_H
#define SENDKEY_PLATFORM_RANDOM_H

#include <cstddef>
#include <cstdint>

namespace sendkey::platform {

// Kernel CSPRNG. Returns false if the full length could not be read.
bool RandomBytes(std::uint8_t* out, std::size_t len);
bool RandomUint32(std::uint32_t& out);

}  // namespace sendkey::platform

#endif  // SENDKEY_PLATFORM_RANDOM_H
