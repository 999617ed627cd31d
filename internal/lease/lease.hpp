#pragma once

#include <chrono>
#include <string>

namespace saga::lease {

/*
  Exclusive, time-bounded claim on one execution.

  Held by exactly one worker while it runs a single step call; an expired
  lease is treated as released so a crashed holder never blocks recovery.
*/
struct Lease {
  std::string lease_id;
  std::string execution_id;
  std::string owner;

  std::chrono::steady_clock::time_point expires_at;
};

}
