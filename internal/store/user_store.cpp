#include "user_store.hpp"

#include "db_errors.hpp"
#include "internal/observability/logging.hpp"
#include "internal/util/errors.hpp"

namespace gemfeed::store {

namespace {

void ValidateUsername(const std::string& username) {
  if (username.empty()) {
    throw util::InvalidArgument("username must not be empty");
  }
}

} // namespace

UserStore::UserStore(db::Repository& repository) : repository_(repository) {
}

int64_t UserStore::CreateUser(const std::string& username) {
  ValidateUsername(username);

  db::model::UserRecord record;
  record.username = username;

  auto tx = repository_.Begin();
  ThrowIfDbError(repository_.InsertUser(*tx, record), "create user " + username);
  tx->Commit();

  GEMFEED_LOG_INFO("User created", {observability::IntField("user_id", record.id),
                                    observability::StringField("username", username)});
  return record.id;
}

db::model::UserRecord UserStore::GetUser(const std::string& username) {
  auto tx   = repository_.Begin();
  auto user = repository_.GetUserByName(*tx, username);
  tx->Commit();

  if (!user) {
    throw util::NotFound("user " + username);
  }
  return *user;
}

db::model::UserRecord UserStore::SelectUser(const std::string& username) {
  ValidateUsername(username);

  auto tx = repository_.Begin();
  if (auto existing = repository_.GetUserByName(*tx, username)) {
    tx->Commit();
    return *existing;
  }

  db::model::UserRecord record;
  record.username = username;
  ThrowIfDbError(repository_.InsertUser(*tx, record), "select user " + username);
  tx->Commit();

  GEMFEED_LOG_INFO("User created", {observability::IntField("user_id", record.id),
                                    observability::StringField("username", username)});
  return record;
}

std::vector<db::model::UserRecord> UserStore::ListUsers() {
  auto tx    = repository_.Begin();
  auto users = repository_.ListUsers(*tx);
  tx->Commit();
  return users;
}

void UserStore::DeleteUser(int64_t id) {
  auto tx = repository_.Begin();
  ThrowIfDbError(repository_.DeleteUser(*tx, id), "delete user " + std::to_string(id));
  tx->Commit();

  GEMFEED_LOG_INFO("User deleted", {observability::IntField("user_id", id)});
}

} // namespace gemfeed::store
