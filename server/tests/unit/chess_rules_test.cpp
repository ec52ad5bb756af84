#include <string>
#include <vector>

#include <gtest/gtest.h>

#include "chessrelay/chess_rules.hpp"

namespace {

using chessrelay::Board;
using chessrelay::ChessRules;
using chessrelay::Color;
using chessrelay::GameResult;

std::string PlayAll(const ChessRules& rules, const std::vector<std::string>& moves) {
  std::string position = rules.NewGame();
  for (const auto& move : moves) {
    auto applied = rules.ApplyMove(position, move);
    EXPECT_TRUE(applied.accepted) << move << ": " << applied.error;
    if (!applied.accepted) {
      break;
    }
    position = applied.position;
  }
  return position;
}

TEST(ChessRulesTest, NewGameIsStandardStartPosition) {
  ChessRules rules;
  EXPECT_EQ(rules.NewGame(), "rnbqkbnr/pppppppp/8/8/8/8/PPPPPPPP/RNBQKBNR w KQkq - 0 1");
  std::string error;
  auto board = Board::FromFen(rules.NewGame(), error);
  ASSERT_TRUE(board.has_value()) << error;
  EXPECT_EQ(ChessRules::LegalMoves(*board).size(), 20u);
}

TEST(ChessRulesTest, SanAndUciProduceSamePosition) {
  ChessRules rules;
  auto san = rules.ApplyMove(rules.NewGame(), "e4");
  auto uci = rules.ApplyMove(rules.NewGame(), "e2e4");
  ASSERT_TRUE(san.accepted);
  ASSERT_TRUE(uci.accepted);
  EXPECT_EQ(san.position, "rnbqkbnr/pppppppp/8/8/4P3/8/PPPP1PPP/RNBQKBNR b KQkq e3 0 1");
  EXPECT_EQ(san.position, uci.position);
}

TEST(ChessRulesTest, RejectsIllegalAndMalformedMoves) {
  ChessRules rules;
  auto illegal = rules.ApplyMove(rules.NewGame(), "e5");
  EXPECT_FALSE(illegal.accepted);
  EXPECT_NE(illegal.error.find("illegal move"), std::string::npos);

  auto garbage = rules.ApplyMove(rules.NewGame(), "hello");
  EXPECT_FALSE(garbage.accepted);
  EXPECT_FALSE(garbage.error.empty());

  auto wrong_side = rules.ApplyMove(rules.NewGame(), "e7e5");
  EXPECT_FALSE(wrong_side.accepted);

  auto empty = rules.ApplyMove(rules.NewGame(), "   ");
  EXPECT_FALSE(empty.accepted);
}

TEST(ChessRulesTest, FoolsMateIsCheckmateForBlack) {
  ChessRules rules;
  auto position = PlayAll(rules, {"f3", "e5", "g4", "Qh4#"});
  auto outcome = rules.Outcome(position);
  EXPECT_TRUE(outcome.terminal);
  EXPECT_EQ(outcome.result, GameResult::kBlackWon);
  EXPECT_EQ(outcome.method, "checkmate");
}

TEST(ChessRulesTest, ScholarsMateIsCheckmateForWhite) {
  ChessRules rules;
  auto position = PlayAll(rules, {"e4", "e5", "Bc4", "Nc6", "Qh5", "Nf6", "Qxf7#"});
  auto outcome = rules.Outcome(position);
  EXPECT_TRUE(outcome.terminal);
  EXPECT_EQ(outcome.result, GameResult::kWhiteWon);
  EXPECT_EQ(outcome.method, "checkmate");
}

TEST(ChessRulesTest, OngoingGameIsNotTerminal) {
  ChessRules rules;
  auto position = PlayAll(rules, {"e4", "e5", "Nf3"});
  EXPECT_FALSE(rules.Outcome(position).terminal);
}

TEST(ChessRulesTest, CastlingMovesRookAndClearsRights) {
  ChessRules rules;
  auto applied = rules.ApplyMove("r3k2r/8/8/8/8/8/8/R3K2R w KQkq - 0 1", "O-O");
  ASSERT_TRUE(applied.accepted) << applied.error;
  EXPECT_EQ(applied.position, "r3k2r/8/8/8/8/8/8/R4RK1 b kq - 1 1");

  auto queen_side = rules.ApplyMove("r3k2r/8/8/8/8/8/8/R3K2R b KQkq - 0 1", "e8c8");
  ASSERT_TRUE(queen_side.accepted) << queen_side.error;
  EXPECT_EQ(queen_side.position, "2kr3r/8/8/8/8/8/8/R3K2R w KQ - 1 2");
}

TEST(ChessRulesTest, CannotCastleThroughAttackedSquare) {
  ChessRules rules;
  const std::string position = "4k3/8/8/8/8/8/5r2/R3K2R w KQ - 0 1";
  EXPECT_FALSE(rules.ApplyMove(position, "O-O").accepted);
  EXPECT_TRUE(rules.ApplyMove(position, "O-O-O").accepted);
}

TEST(ChessRulesTest, EnPassantRemovesCapturedPawn) {
  ChessRules rules;
  auto applied = rules.ApplyMove("4k3/8/8/3pP3/8/8/8/4K3 w - d6 0 1", "exd6");
  ASSERT_TRUE(applied.accepted) << applied.error;
  EXPECT_EQ(applied.position, "4k3/8/3P4/8/8/8/8/4K3 b - - 0 1");
}

TEST(ChessRulesTest, PromotionRequiresPiece) {
  ChessRules rules;
  const std::string position = "8/4P3/8/8/8/8/k7/4K3 w - - 0 1";
  EXPECT_FALSE(rules.ApplyMove(position, "e8").accepted);

  auto queen = rules.ApplyMove(position, "e8=Q");
  ASSERT_TRUE(queen.accepted) << queen.error;
  EXPECT_EQ(queen.position, "4Q3/8/8/8/8/8/k7/4K3 b - - 0 1");

  auto knight = rules.ApplyMove(position, "e7e8n");
  ASSERT_TRUE(knight.accepted) << knight.error;
  EXPECT_EQ(knight.position, "4N3/8/8/8/8/8/k7/4K3 b - - 0 1");
}

TEST(ChessRulesTest, PinnedPieceCannotMove) {
  ChessRules rules;
  const std::string position = "4k3/4r3/8/8/8/8/4B3/4K3 w - - 0 1";
  EXPECT_FALSE(rules.ApplyMove(position, "Bd3").accepted);
  EXPECT_TRUE(rules.ApplyMove(position, "Kd1").accepted);
}

TEST(ChessRulesTest, AmbiguousSanNeedsDisambiguation) {
  ChessRules rules;
  const std::string position = "4k3/8/8/8/8/8/4K3/R6R w - - 0 1";
  auto ambiguous = rules.ApplyMove(position, "Rd1");
  EXPECT_FALSE(ambiguous.accepted);
  EXPECT_NE(ambiguous.error.find("ambiguous"), std::string::npos);
  EXPECT_TRUE(rules.ApplyMove(position, "Rad1").accepted);
  EXPECT_TRUE(rules.ApplyMove(position, "Rhd1").accepted);
}

TEST(ChessRulesTest, DetectsStalemate) {
  ChessRules rules;
  auto outcome = rules.Outcome("7k/5Q2/6K1/8/8/8/8/8 b - - 0 1");
  EXPECT_TRUE(outcome.terminal);
  EXPECT_EQ(outcome.result, GameResult::kDraw);
  EXPECT_EQ(outcome.method, "stalemate");
}

TEST(ChessRulesTest, DetectsInsufficientMaterial) {
  ChessRules rules;
  auto knight = rules.Outcome("8/8/8/4k3/8/8/8/4K2N w - - 0 1");
  EXPECT_TRUE(knight.terminal);
  EXPECT_EQ(knight.method, "insufficient material");

  auto bare = rules.Outcome("8/8/8/4k3/8/8/8/4K3 w - - 0 1");
  EXPECT_TRUE(bare.terminal);
  EXPECT_EQ(bare.result, GameResult::kDraw);

  auto rook = rules.Outcome("8/8/8/4k3/8/8/8/R3K3 w - - 0 1");
  EXPECT_FALSE(rook.terminal);
}

TEST(ChessRulesTest, SeventyFiveMoveRuleEndsGame) {
  ChessRules rules;
  auto outcome = rules.Outcome("4k3/8/8/8/8/8/8/R3K3 w - - 150 90");
  EXPECT_TRUE(outcome.terminal);
  EXPECT_EQ(outcome.result, GameResult::kDraw);
  EXPECT_EQ(outcome.method, "seventy-five-move rule");
}

TEST(ChessRulesTest, FenRoundTripAndValidation) {
  std::string error;
  auto board = Board::FromFen("r3k2r/8/8/8/8/8/8/R3K2R b Kq e3 12 40", error);
  ASSERT_TRUE(board.has_value()) << error;
  EXPECT_EQ(board->side_to_move, Color::kBlack);
  EXPECT_EQ(board->ToFen(), "r3k2r/8/8/8/8/8/8/R3K2R b Kq e3 12 40");

  EXPECT_FALSE(Board::FromFen("not a fen", error).has_value());
  EXPECT_FALSE(Board::FromFen("8/8/8/8/8/8/8 w - - 0 1", error).has_value());
  EXPECT_FALSE(Board::FromFen("rnbqkbnr/pppppppp/8/8/8/8/PPPPPPPP/RNBQKBNR x KQkq - 0 1", error).has_value());
}

TEST(ChessRulesTest, InCheckSeesSlidingAttack) {
  std::string error;
  auto board = Board::FromFen("4k3/8/8/8/8/8/8/4R1K1 b - - 0 1", error);
  ASSERT_TRUE(board.has_value());
  EXPECT_TRUE(ChessRules::InCheck(*board, Color::kBlack));
  EXPECT_FALSE(ChessRules::InCheck(*board, Color::kWhite));
}

}  // namespace
