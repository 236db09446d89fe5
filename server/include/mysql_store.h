#pragma once

#include <memory>
#include <string>

#include "config.h"
#include "repositories.h"

namespace sendkey::server {

// Connects, creates the tables when missing and returns a store backed by
// one connection. Returns nullptr with `error` set on failure, or when the
// build has no MySQL support.
std::unique_ptr<Store> CreateMysqlStore(const MySqlConfig& cfg,
                                        std::string& error);

}  // namespace sendkey::server
