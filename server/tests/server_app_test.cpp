#include <cassert>
#include <chrono>
#include <fstream>
#include <string>

#include "memory_store.h"
#include "server_app.h"
#include "test_support.h"

using sendkey::server::CreateEntryRequest;
using sendkey::server::CreateEntryResult;
using sendkey::server::CreateUserRequest;
using sendkey::server::CreateUserResult;
using sendkey::server::MemoryStore;
using sendkey::server::ServerApp;
using sendkey::server::StoreMode;
using sendkey::server::testing::ManualClock;

namespace {

void WriteFile(const std::string& path, const std::string& content) {
  std::ofstream f(path, std::ios::binary);
  f << content;
}

}  // namespace

int main() {
  std::string err;

  {
    ServerApp app;
    assert(!app.RunOnce(err));
    assert(err == "server not initialized");
    assert(!app.Init("does_not_exist.ini", err));
  }

  const std::string path = "tmp_server_app.ini";
  WriteFile(path,
            "[mode]\nmode=1\n"
            "[entries]\n"
            "master_key_hex=00112233445566778899aabbccddeeff\n"
            "max_invalid_attempts=2\n"
            "sweep_interval_sec=30\n"
            "[auth]\nsigning_key=app-test-key\n"
            "password_blocks=8\npassword_passes=1\n");

  ManualClock clock;
  ServerApp app(clock.Fn());
  assert(app.Init(path, err));
  assert(app.config().mode == StoreMode::kMemory);
  assert(app.entries()->max_attempts() == 2);
  auto* store = dynamic_cast<MemoryStore*>(app.store());
  assert(store != nullptr);

  CreateUserResult user;
  CreateUserRequest user_req;
  user_req.email = "sender@example.com";
  user_req.password = "pw";
  assert(app.users()->CreateUser(user_req, user, err));
  assert(user.success);

  CreateEntryRequest req;
  req.name = "wifi";
  req.sender_id = user.user->id;
  req.send_to_email = "friend@example.com";
  req.value = "hunter2";
  req.secret = "phrase";
  req.duration = std::chrono::seconds(10);
  CreateEntryResult created;
  assert(app.entries()->CreateEntry(req, created, err));
  assert(created.success);
  assert(store->ActiveEntryCount() == 1);

  // First call sweeps; nothing has expired yet.
  assert(app.RunOnce(err));
  assert(store->ActiveEntryCount() == 1);

  // Expired, but the interval has not elapsed since the last sweep.
  clock.Advance(std::chrono::seconds(20));
  assert(app.RunOnce(err));
  assert(store->ActiveEntryCount() == 1);

  clock.Advance(std::chrono::seconds(10));
  assert(app.RunOnce(err));
  assert(store->ActiveEntryCount() == 0);

  // The session stack is wired to the same store and clock.
  sendkey::server::AuthLoginResult login;
  assert(app.auth()->Login({"sender@example.com", "pw"}, login, err));
  assert(login.success);
  assert(app.auth()->Authenticate("Bearer " + login.access_token.token).ok());
  assert(store->RefreshTokenCount() == 1);

  return 0;
}
