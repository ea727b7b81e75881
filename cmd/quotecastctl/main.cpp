#include <cstdio>
#include <iostream>
#include <optional>
#include <set>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include "internal/config/config_loader.hpp"
#include "internal/factory.hpp"
#include "internal/observability/logging.hpp"
#include "internal/util/parse.hpp"
#include "internal/util/time.hpp"

using quotecast::core::ScheduleStore;
using quotecast::model::DeliveryMethod;
using quotecast::model::Quote;
using quotecast::model::Schedule;
using quotecast::util::ParseInt;

static void Usage() {
  std::cout << "Usage:\n"
            << "  quotecastctl <config.yaml> list\n"
            << "  quotecastctl <config.yaml> show <id>\n"
            << "  quotecastctl <config.yaml> create <HH:MM> [--method notification|widget|both] [--favorites]\n"
            << "                                     [--category c]... [--exclude-days n] [--days 1,2,...]\n"
            << "  quotecastctl <config.yaml> enable <id>\n"
            << "  quotecastctl <config.yaml> disable <id>\n"
            << "  quotecastctl <config.yaml> set-time <id> <HH:MM>\n"
            << "  quotecastctl <config.yaml> delete <id>\n"
            << "  quotecastctl <config.yaml> ensure-default\n"
            << "  quotecastctl <config.yaml> add-quote <author> <text> [--favorite] [--category c]...\n"
            << "  quotecastctl <config.yaml> deliver\n"
            << "  quotecastctl <config.yaml> next <id>\n"
            << "  quotecastctl <config.yaml> activity <kind>\n"
            << "  quotecastctl <config.yaml> streak [kind]\n"
            << "  quotecastctl <config.yaml> stats\n";
}

static std::optional<std::pair<int, int>> ParseTime(std::string_view text) {
  const auto colon = text.find(':');
  if (colon == std::string_view::npos) {
    return std::nullopt;
  }
  auto hour   = ParseInt(text.substr(0, colon));
  auto minute = ParseInt(text.substr(colon + 1));
  if (!hour || !minute) {
    return std::nullopt;
  }
  return std::make_pair(*hour, *minute);
}

static std::optional<std::set<int>> ParseDays(std::string_view text) {
  std::set<int> days;
  while (!text.empty()) {
    const auto comma = text.find(',');
    auto       day   = ParseInt(text.substr(0, comma));
    if (!day) {
      return std::nullopt;
    }
    days.insert(*day);
    if (comma == std::string_view::npos) break;
    text.remove_prefix(comma + 1);
  }
  return days;
}

static std::string FormatTime(int hour, int minute) {
  char buf[8];
  std::snprintf(buf, sizeof(buf), "%02d:%02d", hour, minute);
  return buf;
}

static void PrintSchedule(const Schedule& s, const quotecast::util::TimeZone& zone) {
  std::cout << s.id << " " << FormatTime(s.scheduled_hour, s.scheduled_minute) << " " << (s.is_enabled ? "enabled" : "disabled") << " "
            << quotecast::model::ToString(s.delivery_method);
  if (s.is_default) std::cout << " default";
  if (s.favorites_only) std::cout << " favorites";
  for (const auto& c : s.categories) std::cout << " #" << c;
  if (!s.active_days.empty()) {
    std::cout << " days=";
    bool first = true;
    for (int d : s.active_days) {
      std::cout << (first ? "" : ",") << d;
      first = false;
    }
  }
  std::cout << " exclude_days=" << s.exclude_recent_days;
  if (s.last_delivery_date) {
    std::cout << " last=" << quotecast::util::FormatDate(zone.LocalDate(*s.last_delivery_date));
    if (s.last_delivered_quote_id) std::cout << "/" << *s.last_delivered_quote_id;
  }
  std::cout << "\n";
}

static int Fail(const quotecast::util::Status& status) {
  std::cerr << status.ToString() << "\n";
  return 2;
}

int main(int argc, char** argv) {
  if (argc < 3) {
    Usage();
    return 1;
  }

  const std::string config_path = argv[1];
  const std::string cmd         = argv[2];
  std::vector<std::string> args(argv + 3, argv + argc);

  quotecast::factory::Application app;
  try {
    auto config = quotecast::config::ConfigLoader::LoadFromYaml(config_path);
    quotecast::observability::InitializeLogging(config);
    app = quotecast::factory::Build(config);
  } catch (const std::exception& e) {
    std::cerr << "startup failed: " << e.what() << "\n";
    return 2;
  }

  ScheduleStore& store = *app.store;
  const auto&    zone  = store.zone();

  // ------------------------------------------------------------

  if (cmd == "list") {
    auto schedules = store.ListSchedules();
    if (!schedules.ok()) return Fail(schedules.status());
    for (const auto& s : *schedules) PrintSchedule(s, zone);
    return 0;
  }

  // ------------------------------------------------------------

  if (cmd == "show") {
    if (args.size() != 1) return 1;

    auto schedule = store.GetSchedule(args[0]);
    if (!schedule.ok()) return Fail(schedule.status());
    PrintSchedule(*schedule, zone);
    return 0;
  }

  // ------------------------------------------------------------

  if (cmd == "create") {
    if (args.empty()) return 1;

    auto time = ParseTime(args[0]);
    if (!time) {
      std::cerr << "invalid time: " << args[0] << "\n";
      return 1;
    }

    Schedule schedule;
    schedule.scheduled_hour   = time->first;
    schedule.scheduled_minute = time->second;

    for (size_t i = 1; i < args.size(); ++i) {
      const auto& flag     = args[i];
      const bool  has_next = i + 1 < args.size();
      if (flag == "--favorites") {
        schedule.favorites_only = true;
      } else if (flag == "--method" && has_next) {
        auto method = quotecast::model::DeliveryMethodFromString(args[++i]);
        if (!method) {
          std::cerr << "unsupported method: " << args[i] << "\n";
          return 1;
        }
        schedule.delivery_method = *method;
      } else if (flag == "--category" && has_next) {
        schedule.categories.insert(args[++i]);
      } else if (flag == "--exclude-days" && has_next) {
        auto days = ParseInt(args[++i]);
        if (!days) {
          std::cerr << "invalid day count: " << args[i] << "\n";
          return 1;
        }
        schedule.exclude_recent_days = *days;
      } else if (flag == "--days" && has_next) {
        auto days = ParseDays(args[++i]);
        if (!days) {
          std::cerr << "invalid weekday list: " << args[i] << "\n";
          return 1;
        }
        schedule.active_days = *days;
      } else {
        std::cerr << "unknown option: " << flag << "\n";
        return 1;
      }
    }

    auto created = store.CreateSchedule(schedule);
    if (!created.ok()) return Fail(created.status());
    PrintSchedule(*created, zone);
    return 0;
  }

  // ------------------------------------------------------------

  if (cmd == "enable" || cmd == "disable") {
    if (args.size() != 1) return 1;

    auto updated = store.SetEnabled(args[0], cmd == "enable");
    if (!updated.ok()) return Fail(updated.status());
    PrintSchedule(*updated, zone);
    return 0;
  }

  // ------------------------------------------------------------

  if (cmd == "set-time") {
    if (args.size() != 2) return 1;

    auto time = ParseTime(args[1]);
    if (!time) {
      std::cerr << "invalid time: " << args[1] << "\n";
      return 1;
    }

    auto updated = store.SetScheduledTime(args[0], time->first, time->second);
    if (!updated.ok()) return Fail(updated.status());
    PrintSchedule(*updated, zone);
    return 0;
  }

  // ------------------------------------------------------------

  if (cmd == "delete") {
    if (args.size() != 1) return 1;

    auto status = store.DeleteSchedule(args[0]);
    if (!status.ok()) return Fail(status);
    std::cout << "deleted\n";
    return 0;
  }

  // ------------------------------------------------------------

  if (cmd == "ensure-default") {
    auto schedule = store.EnsureDefaultSchedule();
    if (!schedule.ok()) return Fail(schedule.status());
    PrintSchedule(*schedule, zone);
    return 0;
  }

  // ------------------------------------------------------------

  if (cmd == "add-quote") {
    if (args.size() < 2) return 1;

    Quote quote;
    quote.author = args[0];
    quote.text   = args[1];
    for (size_t i = 2; i < args.size(); ++i) {
      if (args[i] == "--favorite") {
        quote.is_favorite = true;
      } else if (args[i] == "--category" && i + 1 < args.size()) {
        quote.categories.insert(args[++i]);
      } else {
        std::cerr << "unknown option: " << args[i] << "\n";
        return 1;
      }
    }

    auto stored = store.UpsertQuote(quote);
    if (!stored.ok()) return Fail(stored.status());
    std::cout << stored->id << "\n";
    return 0;
  }

  // ------------------------------------------------------------

  if (cmd == "deliver") {
    auto report = store.DeliverDueQuotes();
    if (!report.ok()) return Fail(report.status());

    for (const auto& outcome : report->outcomes) {
      std::cout << outcome.schedule_id << " " << quotecast::core::ToString(outcome.kind);
      if (outcome.quote_id) std::cout << " " << *outcome.quote_id;
      if (!outcome.status.ok()) std::cout << " " << outcome.status.ToString();
      std::cout << "\n";
    }
    std::cout << "delivered=" << report->Count(quotecast::core::DeliveryOutcomeKind::kDelivered) << " ready=" << report->outcomes.size()
              << "\n";
    return 0;
  }

  // ------------------------------------------------------------

  if (cmd == "next") {
    if (args.size() != 1) return 1;

    auto next = store.NextDeliveryTime(args[0]);
    if (!next.ok()) return Fail(next.status());
    if (!next.value()) {
      std::cout << "none\n";
      return 0;
    }
    std::cout << quotecast::util::FormatTimestamp(**next) << "\n";
    return 0;
  }

  // ------------------------------------------------------------

  if (cmd == "activity") {
    if (args.size() != 1) return 1;

    auto status = store.RecordActivity(args[0]);
    if (!status.ok()) return Fail(status);
    std::cout << "recorded\n";
    return 0;
  }

  // ------------------------------------------------------------

  if (cmd == "streak") {
    std::optional<std::string> kind;
    if (!args.empty()) kind = args[0];

    auto summary = store.StreakSummary(kind);
    if (!summary.ok()) return Fail(summary.status());
    std::cout << "current=" << summary->current << " longest=" << summary->longest << " unique_days=" << summary->unique_days << "\n";
    return 0;
  }

  // ------------------------------------------------------------

  if (cmd == "stats") {
    auto total   = store.ScheduleCount();
    auto enabled = store.EnabledScheduleCount();
    auto latest  = store.MostRecentDeliveryDate();
    if (!total.ok()) return Fail(total.status());
    if (!enabled.ok()) return Fail(enabled.status());
    if (!latest.ok()) return Fail(latest.status());

    std::cout << "schedules=" << *total << " enabled=" << *enabled << " last_delivery=";
    if (latest.value()) {
      std::cout << quotecast::util::FormatTimestamp(**latest);
    } else {
      std::cout << "never";
    }
    std::cout << "\n";

    for (const auto& [type, stats] : app.cache->AllStats()) {
      std::cout << "cache." << quotecast::cache::ToString(type) << " size=" << stats.size << "/" << stats.capacity << " hits=" << stats.hits
                << " misses=" << stats.misses << "\n";
    }
    return 0;
  }

  Usage();
  return 1;
}
