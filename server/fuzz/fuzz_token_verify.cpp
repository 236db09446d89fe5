#include <cstddef>
#include <cstdint>
#include <fstream>
#include <iterator>
#include <string>
#include <string_view>
#include <vector>

#include "json_util.h"
#include "memory_store.h"
#include "random_source.h"
#include "token_manager.h"

namespace {

constexpr std::size_t kMaxTokenBytes = 8192;

}  // namespace

extern "C" int LLVMFuzzerTestOneInput(const std::uint8_t* data,
                                      std::size_t size) {
  if (!data || size == 0 || size > kMaxTokenBytes) {
    return 0;
  }
  static sendkey::server::MemoryStore store;
  static sendkey::server::OsRandomSource random;
  static const sendkey::server::TokenManager tokens(
      &store, &random, sendkey::server::TokenManagerConfig{"fuzz-key"});

  const std::string_view input(reinterpret_cast<const char*>(data), size);
  (void)tokens.VerifyAccessToken(input);

  sendkey::server::FlatJsonObject obj;
  std::string error;
  (void)sendkey::server::ParseFlatJsonObject(input, obj, error);
  return 0;
}

#if defined(SENDKEY_FUZZ_STANDALONE)
int main(int argc, char** argv) {
  if (argc < 2 || !argv[1]) {
    return 0;
  }
  std::ifstream ifs(argv[1], std::ios::binary);
  if (!ifs) {
    return 0;
  }
  std::vector<std::uint8_t> data((std::istreambuf_iterator<char>(ifs)),
                                 std::istreambuf_iterator<char>());
  if (data.empty()) {
    return 0;
  }
  (void)LLVMFuzzerTestOneInput(data.data(), data.size());
  return 0;
}
#endif
