#include "commands.hpp"

#include <charconv>
#include <cstdint>
#include <optional>

#include "internal/store/seed_fixture.hpp"

namespace gemfeed::cli {

void PrintUsage(std::ostream& out) {
  out << "Usage:\n"
      << "  gemfeedctl [--config <config.yaml>] setup [--destroy-data]\n"
      << "  gemfeedctl [--config <config.yaml>] migrate\n"
      << "  gemfeedctl [--config <config.yaml>] seed\n"
      << "  gemfeedctl [--config <config.yaml>] feeds\n"
      << "  gemfeedctl [--config <config.yaml>] add-feed <url> [name]\n"
      << "  gemfeedctl [--config <config.yaml>] remove-feed <feed_id>\n"
      << "  gemfeedctl [--config <config.yaml>] add-user <username>\n"
      << "  gemfeedctl [--config <config.yaml>] subscribe <username> <feed_id>\n"
      << "  gemfeedctl [--config <config.yaml>] unsubscribe <username> <feed_id>\n"
      << "  gemfeedctl [--config <config.yaml>] record <feed_id> <published_at> <url> <title...>\n"
      << "  gemfeedctl [--config <config.yaml>] entries <feed_id> [since]\n"
      << "  gemfeedctl [--config <config.yaml>] unread <username>\n"
      << "  gemfeedctl [--config <config.yaml>] mark-read <username> <entry_id>\n"
      << "\n"
      << "GEMFEED_DATABASE_URL overrides the configured database\n"
      << "(sqlite://<path>, postgres://..., or memory:// for a throwaway store).\n";
}

namespace {

int UsageError(std::ostream& out) {
  PrintUsage(out);
  return 1;
}

std::optional<int64_t> ParseId(const std::string& s) {
  int64_t    value = 0;
  const auto end   = s.data() + s.size();
  auto [ptr, ec]   = std::from_chars(s.data(), end, value);
  if (ec != std::errc() || ptr != end || value <= 0) {
    return std::nullopt;
  }
  return value;
}

void PrintEntries(std::ostream& out, const std::vector<db::model::FeedEntryRecord>& entries) {
  for (const auto& e : entries) {
    out << e.id << "\t" << e.feed_id << "\t" << e.published_at << "\t" << e.url << "\t" << e.title << "\n";
  }
}

} // namespace

int RunCommand(factory::Application& app, const std::vector<std::string>& args, std::ostream& out,
               std::ostream& err) {
  if (args.empty()) return UsageError(out);
  const auto& cmd = args[0];

  // ------------------------------------------------------------

  if (cmd == "setup") {
    const bool destroy = args.size() >= 2 && args[1] == "--destroy-data";
    if (args.size() >= 2 && !destroy) return UsageError(out);

    if (!destroy && (!app.feeds.ListFeeds().empty() || !app.users.ListUsers().empty())) {
      err << "database already holds feeds or users; rerun with --destroy-data to wipe it\n";
      return 1;
    }
    store::SeedFixture(*app.repository, true);
    out << "database reset and seeded\n";
    return 0;
  }

  if (cmd == "migrate") {
    // BuildRepository already migrated to the latest version
    out << "schema up to date\n";
    return 0;
  }

  if (cmd == "seed") {
    store::SeedFixture(*app.repository, false);
    out << "seeded\n";
    return 0;
  }

  // ------------------------------------------------------------

  if (cmd == "feeds") {
    for (const auto& feed : app.feeds.ListFeeds()) {
      out << feed.id << "\t" << feed.url << "\t" << feed.name << "\n";
    }
    return 0;
  }

  if (cmd == "add-feed") {
    if (args.size() < 2) return UsageError(out);
    const auto id = app.feeds.CreateFeed(args[1], args.size() >= 3 ? args[2] : "");
    out << id << "\n";
    return 0;
  }

  if (cmd == "remove-feed") {
    const auto id = args.size() >= 2 ? ParseId(args[1]) : std::nullopt;
    if (!id) return UsageError(out);
    app.feeds.DeleteFeed(*id);
    out << "removed feed " << *id << "\n";
    return 0;
  }

  if (cmd == "add-user") {
    if (args.size() < 2) return UsageError(out);
    out << app.users.CreateUser(args[1]) << "\n";
    return 0;
  }

  // ------------------------------------------------------------

  if (cmd == "subscribe" || cmd == "unsubscribe") {
    const auto feed_id = args.size() >= 3 ? ParseId(args[2]) : std::nullopt;
    if (!feed_id) return UsageError(out);

    const auto user = app.users.GetUser(args[1]);
    if (cmd == "subscribe") {
      const bool added = app.subscriptions.Subscribe(user.id, *feed_id);
      out << (added ? "subscribed\n" : "already subscribed\n");
    } else {
      const bool removed = app.subscriptions.Unsubscribe(user.id, *feed_id);
      out << (removed ? "unsubscribed\n" : "not subscribed\n");
    }
    return 0;
  }

  // ------------------------------------------------------------

  if (cmd == "record") {
    const auto feed_id = args.size() >= 5 ? ParseId(args[1]) : std::nullopt;
    if (!feed_id) return UsageError(out);

    std::string title = args[4];
    for (size_t i = 5; i < args.size(); ++i) {
      title += " " + args[i];
    }

    const auto result = app.entries.RecordEntry(*feed_id, title, args[2], args[3]);
    out << result.entry_id << (result.status == store::RecordStatus::kDuplicateEntry ? "\tduplicate" : "\tinserted")
        << "\n";
    return 0;
  }

  if (cmd == "entries") {
    const auto feed_id = args.size() >= 2 ? ParseId(args[1]) : std::nullopt;
    if (!feed_id) return UsageError(out);

    std::optional<std::string> since;
    if (args.size() >= 3) since = args[2];
    PrintEntries(out, app.entries.ListEntries(*feed_id, since));
    return 0;
  }

  if (cmd == "unread") {
    if (args.size() < 2) return UsageError(out);
    PrintEntries(out, app.views.ListUnviewedEntries(app.users.GetUser(args[1]).id));
    return 0;
  }

  if (cmd == "mark-read") {
    const auto entry_id = args.size() >= 3 ? ParseId(args[2]) : std::nullopt;
    if (!entry_id) return UsageError(out);

    const bool marked = app.views.MarkViewed(app.users.GetUser(args[1]).id, *entry_id);
    out << (marked ? "marked read\n" : "already read\n");
    return 0;
  }

  return UsageError(out);
}

} // namespace gemfeed::cli
