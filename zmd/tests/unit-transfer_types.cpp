#define DOCTEST_CONFIG_IMPLEMENT_WITH_MAIN
#include "doctest_compatibility.h"

#include "zmd/logger.hpp"
#include "zmd/transfer_id.hpp"
#include "zmd/transfer_job.hpp"
#include "zmd/transfer_types.hpp"

#include <array>
#include <memory>
#include <set>
#include <string>
#include <string_view>
#include <utility>

#include <spdlog/sinks/null_sink.h>
#include <spdlog/spdlog.h>

using namespace std::string_view_literals;

using zmd::transfer::TransferKind;
using zmd::transfer::TransferState;

namespace {

constexpr std::array kAllStates{
    TransferState::Pending,
    TransferState::Running,
    TransferState::Paused,
    TransferState::Completed,
    TransferState::Failed,
    TransferState::Stopped,
};

}  // namespace

TEST_CASE("transfer state names")
{
  for (const auto state : kAllStates) {
    const auto name   = zmd::transfer::transfer_state_to_string(state);
    const auto parsed = zmd::transfer::transfer_state_from_string(name);
    REQUIRE(parsed.has_value());
    REQUIRE_EQ(*parsed, state);
  }
  REQUIRE(!zmd::transfer::transfer_state_from_string("Running"sv).has_value());
  REQUIRE_EQ(zmd::transfer::error_code_to_string(zmd::transfer::ErrorCode::ResumeUnavailable), "resume_unavailable"sv);
  REQUIRE_EQ(zmd::transfer::error_code_from_string("remote_rejected"sv), zmd::transfer::ErrorCode::RemoteRejected);
  REQUIRE(!zmd::transfer::transfer_kind_from_string("everything"sv).has_value());
}

TEST_CASE("listing buckets partition the states")
{
  for (const auto state : kAllStates) {
    std::size_t buckets{};
    for (const auto kind : {TransferKind::Active, TransferKind::Completed, TransferKind::Failed}) {
      if (zmd::transfer::kind_contains(kind, state)) {
        ++buckets;
      }
    }
    REQUIRE_EQ(buckets, 1);
    REQUIRE(zmd::transfer::kind_contains(TransferKind::All, state));
  }
  REQUIRE(zmd::transfer::kind_contains(TransferKind::Active, TransferState::Paused));
  REQUIRE(zmd::transfer::kind_contains(TransferKind::Failed, TransferState::Stopped));
}

TEST_CASE("state transitions")
{
  SECTION("terminal states are final")
  {
    for (const auto from : {TransferState::Completed, TransferState::Failed, TransferState::Stopped}) {
      REQUIRE(zmd::transfer::is_terminal(from));
      for (const auto to : kAllStates) {
        REQUIRE_FALSE(zmd::transfer::can_transition(from, to));
      }
    }
  }
  SECTION("nothing returns to pending")
  {
    for (const auto from : kAllStates) {
      REQUIRE_FALSE(zmd::transfer::can_transition(from, TransferState::Pending));
    }
  }
  SECTION("pause and resume")
  {
    REQUIRE(zmd::transfer::can_transition(TransferState::Running, TransferState::Paused));
    REQUIRE(zmd::transfer::can_transition(TransferState::Paused, TransferState::Running));
    REQUIRE_FALSE(zmd::transfer::can_transition(TransferState::Pending, TransferState::Paused));
    REQUIRE_FALSE(zmd::transfer::can_transition(TransferState::Paused, TransferState::Completed));
    REQUIRE_FALSE(zmd::transfer::can_transition(TransferState::Paused, TransferState::Failed));
    REQUIRE(zmd::transfer::can_transition(TransferState::Paused, TransferState::Stopped));
  }
}

TEST_CASE("transfer job transitions")
{
  auto null_sink = std::make_shared<spdlog::sinks::null_sink_mt>();
  auto logger    = std::make_shared<spdlog::logger>("default", null_sink);
  spdlog::set_default_logger(logger);
  zmd::logger::set_logger(logger);

  zmd::transfer::TransferJob job{zmd::transfer::TransferInfo{.id = "0190a5c8-7a3b-7000-8000-000000000001", .revision = 1}};

  REQUIRE(job.transition(TransferState::Running));
  REQUIRE(job.info.started_at.has_value());
  REQUIRE_EQ(job.info.revision, 2);

  job.info.resume_token = "1-token";
  REQUIRE(job.transition(TransferState::Paused));
  REQUIRE_EQ(job.info.resume_token, "1-token");
  REQUIRE(job.info.last_paused_at.has_value());

  REQUIRE(job.transition(TransferState::Running));
  REQUIRE(!job.info.resume_token.has_value());

  REQUIRE(job.transition(TransferState::Completed));
  REQUIRE(job.info.ended_at.has_value());

  const auto revision = job.info.revision;
  REQUIRE_FALSE(job.transition(TransferState::Running));
  REQUIRE_EQ(job.info.state, TransferState::Completed);
  REQUIRE_EQ(job.info.revision, revision);
}

TEST_CASE("transfer ids")
{
  zmd::transfer::TransferIdGenerator generator{};

  SECTION("fresh, ordered and well formed")
  {
    std::set<std::string> seen{};
    std::string previous{};
    for (int i = 0; i < 2000; ++i) {
      auto id = generator.next();
      REQUIRE(zmd::transfer::is_valid_transfer_id(id));
      REQUIRE(id > previous);
      REQUIRE(seen.insert(id).second);
      REQUIRE(generator.is_reserved(id));
      previous = std::move(id);
    }
  }
  SECTION("reserved ids are never issued")
  {
    const auto restored = "ffffffff-ffff-7fff-bfff-ffffffffffff"sv;
    generator.reserve(restored);
    REQUIRE(generator.is_reserved(restored));
    for (int i = 0; i < 100; ++i) {
      REQUIRE_NE(generator.next(), restored);
    }
  }
  SECTION("validation")
  {
    REQUIRE(zmd::transfer::is_valid_transfer_id("0190a5c8-7a3b-7000-8000-000000000001"sv));
    REQUIRE_FALSE(zmd::transfer::is_valid_transfer_id(""sv));
    REQUIRE_FALSE(zmd::transfer::is_valid_transfer_id("0190A5C8-7A3B-7000-8000-000000000001"sv));
    REQUIRE_FALSE(zmd::transfer::is_valid_transfer_id("0190a5c8-7a3b-7000-8000-00000000000"sv));
    REQUIRE_FALSE(zmd::transfer::is_valid_transfer_id("../../etc/passwd-0000-0000-000000000000"sv));
  }
}
