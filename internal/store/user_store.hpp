#pragma once

#include <cstdint>
#include <string>
#include <vector>

#include "internal/db/api/repository.hpp"
#include "internal/db/model/user_record.hpp"

namespace gemfeed::store {

class UserStore {
 public:
  explicit UserStore(db::Repository& repository);

  int64_t CreateUser(const std::string& username);

  // Throws util::NotFound.
  db::model::UserRecord GetUser(const std::string& username);

  // Find-or-create in one transaction.
  db::model::UserRecord SelectUser(const std::string& username);

  std::vector<db::model::UserRecord> ListUsers();

  // Also drops the user's subscriptions and views.
  void DeleteUser(int64_t id);

 private:
  db::Repository& repository_;
};

} // namespace gemfeed::store
