#include "random_source.h"

#include "platform_random.h"

namespace sendkey::server {

bool OsRandomSource::Fill(std::uint8_t* out, std::size_t len) {
  return sendkey::platform::RandomBytes(out, len);
}

}  // namespace sendkey::server
