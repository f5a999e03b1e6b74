#define DOCTEST_CONFIG_IMPLEMENT_WITH_MAIN
#include "doctest_compatibility.h"

#include "zmd/transfer_outcome.hpp"

#include <optional>
#include <string>
#include <string_view>

using namespace std::string_literals;
using namespace std::string_view_literals;

using zmd::transfer::CancelIntent;
using zmd::transfer::ErrorCode;
using zmd::transfer::PipelineResult;
using zmd::transfer::ProcessStatus;
using zmd::transfer::TransferState;

namespace {

constexpr ProcessStatus kExitedOk{.launched = true, .exit_code = 0};
constexpr ProcessStatus kExitedFailed{.launched = true, .exit_code = 1};
constexpr ProcessStatus kInterrupted{.launched = true, .term_signal = 2};

}  // namespace

TEST_CASE("outcome classification")
{
  SECTION("both sides succeeded")
  {
    const PipelineResult result{.send = kExitedOk, .receive = kExitedOk};
    const auto outcome = zmd::transfer::classify_outcome(result, CancelIntent::None, std::nullopt);
    REQUIRE_EQ(outcome.state, TransferState::Completed);
    REQUIRE(!outcome.error.has_value());
    REQUIRE_FALSE(zmd::transfer::needs_resume_token(result, CancelIntent::PauseRequested, true));
  }
  SECTION("success wins over a late pause")
  {
    const PipelineResult result{.send = kExitedOk, .receive = kExitedOk, .signaled_intent = CancelIntent::PauseRequested};
    const auto outcome = zmd::transfer::classify_outcome(result, CancelIntent::PauseRequested, std::nullopt);
    REQUIRE_EQ(outcome.state, TransferState::Completed);
  }
  SECTION("stop always ends stopped")
  {
    const PipelineResult result{.send = kInterrupted, .receive = kInterrupted, .signaled_intent = CancelIntent::StopRequested};
    const auto outcome = zmd::transfer::classify_outcome(result, CancelIntent::StopRequested, "1-token"s);
    REQUIRE_EQ(outcome.state, TransferState::Stopped);
    REQUIRE(!outcome.error.has_value());
    REQUIRE(!outcome.resume_token.has_value());
    REQUIRE_FALSE(zmd::transfer::needs_resume_token(result, CancelIntent::StopRequested, true));
  }
  SECTION("pause with a token")
  {
    const PipelineResult result{.send = kInterrupted, .receive = kInterrupted, .signaled_intent = CancelIntent::PauseRequested};
    REQUIRE(zmd::transfer::needs_resume_token(result, CancelIntent::PauseRequested, true));
    const auto outcome = zmd::transfer::classify_outcome(result, CancelIntent::PauseRequested, "1-e604ea4bf"s);
    REQUIRE_EQ(outcome.state, TransferState::Paused);
    REQUIRE_EQ(outcome.resume_token, "1-e604ea4bf");
    REQUIRE(!outcome.error.has_value());
  }
  SECTION("pause without a token")
  {
    const PipelineResult result{.send = kInterrupted, .receive = kInterrupted, .signaled_intent = CancelIntent::PauseRequested};
    REQUIRE_FALSE(zmd::transfer::needs_resume_token(result, CancelIntent::PauseRequested, false));
    const auto outcome = zmd::transfer::classify_outcome(result, CancelIntent::PauseRequested, std::nullopt);
    REQUIRE_EQ(outcome.state, TransferState::Failed);
    REQUIRE(outcome.error.has_value());
    REQUIRE_EQ(outcome.error->code, ErrorCode::ResumeUnavailable);
    REQUIRE(!outcome.resume_token.has_value());
  }
  SECTION("launch failure")
  {
    const PipelineResult result{.launch_error = "failed to exec 'zfs': No such file or directory"s};
    const auto outcome = zmd::transfer::classify_outcome(result, CancelIntent::None, std::nullopt);
    REQUIRE_EQ(outcome.state, TransferState::Failed);
    REQUIRE_EQ(outcome.error->code, ErrorCode::ProcessLaunchError);
    REQUIRE(outcome.error->message.contains("No such file"sv));
    REQUIRE_FALSE(zmd::transfer::needs_resume_token(result, CancelIntent::PauseRequested, true));
  }
  SECTION("destination refused the stream")
  {
    const PipelineResult result{
      .send         = kExitedFailed,
      .receive      = kExitedFailed,
      .receive_tail = {"cannot receive new filesystem stream: destination 'backup/data' exists"s, "must specify -F to overwrite it"s},
    };
    const auto outcome = zmd::transfer::classify_outcome(result, CancelIntent::None, std::nullopt);
    REQUIRE_EQ(outcome.state, TransferState::Failed);
    REQUIRE_EQ(outcome.error->code, ErrorCode::RemoteRejected);
    REQUIRE_EQ(outcome.error->exit_code, 1);
    REQUIRE(outcome.error->output.contains("must specify -F"sv));
  }
  SECTION("source failed")
  {
    const PipelineResult result{
      .send      = ProcessStatus{.launched = true, .exit_code = 1},
      .receive   = kExitedOk,
      .send_tail = {"cannot open 'pool/data@snap9': dataset does not exist"s},
    };
    const auto outcome = zmd::transfer::classify_outcome(result, CancelIntent::None, std::nullopt);
    REQUIRE_EQ(outcome.state, TransferState::Failed);
    REQUIRE_EQ(outcome.error->code, ErrorCode::StreamError);
    REQUIRE(outcome.error->message.contains("send"sv));
    REQUIRE(outcome.error->output.contains("does not exist"sv));
  }
  SECTION("interrupted receive reports its token")
  {
    const PipelineResult result{
      .send         = kExitedFailed,
      .receive      = kExitedFailed,
      .receive_tail = {"cannot receive: checksum mismatch or incomplete stream."s,
        "Partially received snapshot is saved.", "A resuming stream can be generated on the sending system by running:"s,
        "    zfs send -t 1-f1a2b3c4"s},
    };
    REQUIRE(zmd::transfer::reports_partial_state(result.receive_tail));
    REQUIRE(zmd::transfer::needs_resume_token(result, CancelIntent::None, true));

    const auto outcome = zmd::transfer::classify_outcome(result, CancelIntent::None, "1-f1a2b3c4"s);
    REQUIRE_EQ(outcome.state, TransferState::Failed);
    REQUIRE_EQ(outcome.error->code, ErrorCode::StreamError);
    REQUIRE_EQ(outcome.error->resume_token, "1-f1a2b3c4");
    REQUIRE(!outcome.resume_token.has_value());
  }
}

TEST_CASE("rejection messages")
{
  REQUIRE(zmd::transfer::reports_rejection({"cannot receive incremental stream: destination backup/data has been modified"s}));
  REQUIRE(zmd::transfer::reports_rejection({"cannot receive new filesystem stream: destination already exists"s}));
  REQUIRE_FALSE(zmd::transfer::reports_rejection({"cannot open 'backup/data': dataset does not exist"s}));
  REQUIRE_FALSE(zmd::transfer::reports_rejection({}));
}
