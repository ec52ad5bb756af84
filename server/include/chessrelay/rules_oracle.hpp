/*
 * 설명: 수 합법성/다음 국면/종국 판정을 맡는 외부 규칙 판정기 인터페이스를 정의한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 */
#pragma once

#include <string>

namespace chessrelay {

enum class GameResult { kNone, kWhiteWon, kBlackWon, kDraw };

struct MoveApplication {
  bool accepted{false};
  std::string position;
  std::string error;
};

struct OutcomeReport {
  bool terminal{false};
  GameResult result{GameResult::kNone};
  std::string method;
};

class RulesOracle {
 public:
  virtual ~RulesOracle() = default;

  virtual std::string NewGame() const = 0;
  virtual MoveApplication ApplyMove(const std::string& position, const std::string& move_text) const = 0;
  virtual OutcomeReport Outcome(const std::string& position) const = 0;
  virtual std::string RenderPosition(const std::string& position) const = 0;
};

}  // namespace chessrelay
