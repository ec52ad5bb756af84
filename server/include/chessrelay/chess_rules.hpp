/*
 * 설명: FEN 국면 위에서 표준 체스 규칙(SAN/UCI 수 해석, 합법수 생성, 종국 판정)을 제공한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: server/tests/unit/chess_rules_test.cpp
 */
#pragma once

#include <array>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "chessrelay/rules_oracle.hpp"
#include "chessrelay/types.hpp"

namespace chessrelay {

struct ChessMove {
  int from{0};
  int to{0};
  char promotion{0};
  bool castle{false};
  bool en_passant{false};
  bool double_push{false};
};

// 칸 인덱스는 a1=0 ... h8=63.
struct Board {
  std::array<char, 64> squares{};
  Color side_to_move{Color::kWhite};
  bool white_king_side{false};
  bool white_queen_side{false};
  bool black_king_side{false};
  bool black_queen_side{false};
  int en_passant{-1};
  int halfmove_clock{0};
  int fullmove_number{1};

  static std::optional<Board> FromFen(std::string_view fen, std::string& error);
  std::string ToFen() const;
};

class ChessRules : public RulesOracle {
 public:
  static constexpr std::string_view kStartFen = "rnbqkbnr/pppppppp/8/8/8/8/PPPPPPPP/RNBQKBNR w KQkq - 0 1";

  std::string NewGame() const override;
  MoveApplication ApplyMove(const std::string& position, const std::string& move_text) const override;
  OutcomeReport Outcome(const std::string& position) const override;
  std::string RenderPosition(const std::string& position) const override;

  static std::vector<ChessMove> LegalMoves(const Board& board);
  static bool InCheck(const Board& board, Color color);
  static Board Play(const Board& board, const ChessMove& move);
  static std::optional<ChessMove> ParseMove(const Board& board, std::string_view text, std::string& error);

 private:
  static void PseudoLegalMoves(const Board& board, std::vector<ChessMove>& out);
  static bool IsAttacked(const Board& board, int square, Color by);
  static bool InsufficientMaterial(const Board& board);
  static std::optional<ChessMove> ParseUci(const Board& board, const std::vector<ChessMove>& legal,
                                           std::string_view text);
  static std::optional<ChessMove> ParseSan(const Board& board, const std::vector<ChessMove>& legal,
                                           std::string_view text, std::string& error);
};

}  // namespace chessrelay
