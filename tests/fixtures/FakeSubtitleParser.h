// Repository: captionline
// Component: Fake Subtitle Parser
// Purpose: Test double for ISubtitleParser with immediate or deferred completion.
// Copyright (c) 2025 captionline authors

#ifndef CAPTIONLINE_TESTS_FIXTURES_FAKE_SUBTITLE_PARSER_H_
#define CAPTIONLINE_TESTS_FIXTURES_FAKE_SUBTITLE_PARSER_H_

#include <cstddef>
#include <cstdint>
#include <string>
#include <utility>
#include <vector>

#include "captionline/subtitles/ISubtitleParser.h"

namespace captionline::tests::fixtures
{

  // One Parse() call. The continuity entry is snapshotted at call time.
  struct RecordedParse
  {
    std::string text;  // Payload bytes as text
    int64_t reference_pts = 0;
    int32_t cc = 0;
    bool had_continuity_entry = false;
    timeline::DiscontinuitySegment segment;
  };

  // FakeSubtitleParser answers with a fixed cue list per call.
  //
  // Immediate mode: completes before Parse() returns.
  // Deferred mode: holds the callbacks until CompleteNext()/FailNext().
  class FakeSubtitleParser : public subtitles::ISubtitleParser
  {
  public:
    FakeSubtitleParser() = default;

    void Parse(const timeline::Payload &payload,
               int64_t reference_pts,
               timeline::ContinuityMap &continuity_map,
               int32_t cc,
               subtitles::ParseSuccessCallback on_success,
               subtitles::ParseErrorCallback on_error) override
    {
      RecordedParse call;
      call.text.assign(payload.begin(), payload.end());
      call.reference_pts = reference_pts;
      call.cc = cc;
      if (const auto *segment = continuity_map.Find(cc))
      {
        call.had_continuity_entry = true;
        call.segment = *segment;
      }
      calls_.push_back(call);

      if (deferred_)
      {
        pending_.push_back(Pending{std::move(on_success), std::move(on_error)});
        return;
      }
      if (fail_)
      {
        on_error("fake parse failure");
        return;
      }
      on_success(cues_);
    }

    void SetCues(std::vector<timeline::Cue> cues) { cues_ = std::move(cues); }
    void SetDeferred(bool deferred) { deferred_ = deferred; }
    void SetFail(bool fail) { fail_ = fail; }

    // Completes the oldest deferred parse with the configured cues.
    bool CompleteNext()
    {
      if (pending_.empty())
      {
        return false;
      }
      Pending next = std::move(pending_.front());
      pending_.erase(pending_.begin());
      next.on_success(cues_);
      return true;
    }

    // Fails the oldest deferred parse.
    bool FailNext(const std::string &reason = "fake parse failure")
    {
      if (pending_.empty())
      {
        return false;
      }
      Pending next = std::move(pending_.front());
      pending_.erase(pending_.begin());
      next.on_error(reason);
      return true;
    }

    const std::vector<RecordedParse> &GetCalls() const { return calls_; }
    size_t GetPendingCount() const { return pending_.size(); }

  private:
    struct Pending
    {
      subtitles::ParseSuccessCallback on_success;
      subtitles::ParseErrorCallback on_error;
    };

    std::vector<timeline::Cue> cues_;
    bool deferred_ = false;
    bool fail_ = false;
    std::vector<RecordedParse> calls_;
    std::vector<Pending> pending_;
  };

  inline timeline::Cue MakeCue(const std::string &id, double start, double end,
                               const std::string &payload = "")
  {
    timeline::Cue cue;
    cue.id = id;
    cue.start_time = start;
    cue.end_time = end;
    cue.payload = payload;
    return cue;
  }

} // namespace captionline::tests::fixtures

#endif // CAPTIONLINE_TESTS_FIXTURES_FAKE_SUBTITLE_PARSER_H_
