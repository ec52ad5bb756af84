/*
 * 설명: FEN 국면 해석, 합법수 생성, SAN/UCI 수 해석, 종국 판정을 구현한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: server/tests/unit/chess_rules_test.cpp
 */
#include "chessrelay/chess_rules.hpp"

#include <algorithm>
#include <cctype>
#include <sstream>

namespace chessrelay {
namespace {
constexpr char kEmpty = '.';

constexpr int kKnightSteps[8][2] = {{1, 2}, {2, 1}, {2, -1}, {1, -2}, {-1, -2}, {-2, -1}, {-2, 1}, {-1, 2}};
constexpr int kKingSteps[8][2] = {{1, 0}, {1, 1}, {0, 1}, {-1, 1}, {-1, 0}, {-1, -1}, {0, -1}, {1, -1}};
constexpr int kRookDirs[4][2] = {{1, 0}, {-1, 0}, {0, 1}, {0, -1}};
constexpr int kBishopDirs[4][2] = {{1, 1}, {1, -1}, {-1, 1}, {-1, -1}};

int FileOf(int square) { return square % 8; }
int RankOf(int square) { return square / 8; }
int SquareAt(int file, int rank) { return rank * 8 + file; }
bool OnBoard(int file, int rank) { return file >= 0 && file < 8 && rank >= 0 && rank < 8; }

bool IsWhitePiece(char piece) { return piece != kEmpty && std::isupper(static_cast<unsigned char>(piece)); }
bool IsBlackPiece(char piece) { return piece != kEmpty && std::islower(static_cast<unsigned char>(piece)); }
bool Owns(char piece, Color color) { return color == Color::kWhite ? IsWhitePiece(piece) : IsBlackPiece(piece); }
char KindOf(char piece) { return static_cast<char>(std::toupper(static_cast<unsigned char>(piece))); }
char PieceFor(char kind, Color color) {
  return color == Color::kWhite ? static_cast<char>(std::toupper(static_cast<unsigned char>(kind)))
                                : static_cast<char>(std::tolower(static_cast<unsigned char>(kind)));
}

std::optional<int> ParseSquare(std::string_view text) {
  if (text.size() != 2 || text[0] < 'a' || text[0] > 'h' || text[1] < '1' || text[1] > '8') {
    return std::nullopt;
  }
  return SquareAt(text[0] - 'a', text[1] - '1');
}

std::string SquareName(int square) {
  std::string name;
  name.push_back(static_cast<char>('a' + FileOf(square)));
  name.push_back(static_cast<char>('1' + RankOf(square)));
  return name;
}

void PushPawnMove(std::vector<ChessMove>& out, int from, int to, Color color, bool en_passant) {
  int last_rank = color == Color::kWhite ? 7 : 0;
  if (RankOf(to) == last_rank) {
    for (char promo : {'q', 'r', 'b', 'n'}) {
      out.push_back(ChessMove{from, to, promo, false, false, false});
    }
    return;
  }
  out.push_back(ChessMove{from, to, 0, false, en_passant, false});
}
}  // namespace

std::optional<Board> Board::FromFen(std::string_view fen, std::string& error) {
  std::istringstream iss{std::string(fen)};
  std::string placement;
  std::string side;
  std::string castling;
  std::string en_passant;
  if (!(iss >> placement >> side >> castling >> en_passant)) {
    error = "FEN 필드가 부족합니다";
    return std::nullopt;
  }
  Board board;
  board.squares.fill(kEmpty);
  int rank = 7;
  int file = 0;
  for (char c : placement) {
    if (c == '/') {
      if (file != 8 || rank == 0) {
        error = "FEN 배치가 올바르지 않습니다";
        return std::nullopt;
      }
      --rank;
      file = 0;
      continue;
    }
    if (c >= '1' && c <= '8') {
      file += c - '0';
    } else if (std::string_view("PNBRQKpnbrqk").find(c) != std::string_view::npos) {
      if (file >= 8) {
        error = "FEN 배치가 올바르지 않습니다";
        return std::nullopt;
      }
      board.squares[SquareAt(file, rank)] = c;
      ++file;
    } else {
      error = "FEN 배치에 알 수 없는 문자가 있습니다";
      return std::nullopt;
    }
    if (file > 8) {
      error = "FEN 배치가 올바르지 않습니다";
      return std::nullopt;
    }
  }
  if (rank != 0 || file != 8) {
    error = "FEN 배치가 올바르지 않습니다";
    return std::nullopt;
  }
  if (side == "w") {
    board.side_to_move = Color::kWhite;
  } else if (side == "b") {
    board.side_to_move = Color::kBlack;
  } else {
    error = "FEN 차례 표기가 올바르지 않습니다";
    return std::nullopt;
  }
  if (castling != "-") {
    for (char c : castling) {
      switch (c) {
        case 'K': board.white_king_side = true; break;
        case 'Q': board.white_queen_side = true; break;
        case 'k': board.black_king_side = true; break;
        case 'q': board.black_queen_side = true; break;
        default:
          error = "FEN 캐슬링 표기가 올바르지 않습니다";
          return std::nullopt;
      }
    }
  }
  if (en_passant != "-") {
    auto square = ParseSquare(en_passant);
    if (!square) {
      error = "FEN 앙파상 칸이 올바르지 않습니다";
      return std::nullopt;
    }
    board.en_passant = *square;
  }
  int halfmove = 0;
  int fullmove = 1;
  if (iss >> halfmove) {
    if (!(iss >> fullmove)) {
      fullmove = 1;
    }
  }
  board.halfmove_clock = std::max(0, halfmove);
  board.fullmove_number = std::max(1, fullmove);
  return board;
}

std::string Board::ToFen() const {
  std::string fen;
  for (int rank = 7; rank >= 0; --rank) {
    int empty = 0;
    for (int file = 0; file < 8; ++file) {
      char piece = squares[SquareAt(file, rank)];
      if (piece == kEmpty) {
        ++empty;
        continue;
      }
      if (empty > 0) {
        fen.push_back(static_cast<char>('0' + empty));
        empty = 0;
      }
      fen.push_back(piece);
    }
    if (empty > 0) {
      fen.push_back(static_cast<char>('0' + empty));
    }
    if (rank > 0) {
      fen.push_back('/');
    }
  }
  fen += side_to_move == Color::kWhite ? " w " : " b ";
  std::string rights;
  if (white_king_side) rights.push_back('K');
  if (white_queen_side) rights.push_back('Q');
  if (black_king_side) rights.push_back('k');
  if (black_queen_side) rights.push_back('q');
  fen += rights.empty() ? "-" : rights;
  fen += " ";
  fen += en_passant >= 0 ? SquareName(en_passant) : "-";
  fen += " " + std::to_string(halfmove_clock) + " " + std::to_string(fullmove_number);
  return fen;
}

std::string ChessRules::NewGame() const { return std::string(kStartFen); }

MoveApplication ChessRules::ApplyMove(const std::string& position, const std::string& move_text) const {
  std::string error;
  auto board = Board::FromFen(position, error);
  if (!board) {
    return MoveApplication{false, "", "invalid position: " + error};
  }
  auto move = ParseMove(*board, move_text, error);
  if (!move) {
    return MoveApplication{false, "", error};
  }
  return MoveApplication{true, Play(*board, *move).ToFen(), ""};
}

OutcomeReport ChessRules::Outcome(const std::string& position) const {
  std::string error;
  auto board = Board::FromFen(position, error);
  if (!board) {
    return OutcomeReport{};
  }
  if (LegalMoves(*board).empty()) {
    if (InCheck(*board, board->side_to_move)) {
      return OutcomeReport{true, board->side_to_move == Color::kWhite ? GameResult::kBlackWon : GameResult::kWhiteWon,
                           "checkmate"};
    }
    return OutcomeReport{true, GameResult::kDraw, "stalemate"};
  }
  if (InsufficientMaterial(*board)) {
    return OutcomeReport{true, GameResult::kDraw, "insufficient material"};
  }
  if (board->halfmove_clock >= 150) {
    return OutcomeReport{true, GameResult::kDraw, "seventy-five-move rule"};
  }
  return OutcomeReport{};
}

std::string ChessRules::RenderPosition(const std::string& position) const {
  std::string error;
  auto board = Board::FromFen(position, error);
  return board ? board->ToFen() : position;
}

bool ChessRules::IsAttacked(const Board& board, int square, Color by) {
  const int file = FileOf(square);
  const int rank = RankOf(square);

  // 공격하는 폰은 공격 측 진행 방향의 반대편 대각선에 있다.
  const int pawn_rank = by == Color::kWhite ? rank - 1 : rank + 1;
  for (int df : {-1, 1}) {
    if (OnBoard(file + df, pawn_rank) && board.squares[SquareAt(file + df, pawn_rank)] == PieceFor('P', by)) {
      return true;
    }
  }
  for (const auto& step : kKnightSteps) {
    int f = file + step[0];
    int r = rank + step[1];
    if (OnBoard(f, r) && board.squares[SquareAt(f, r)] == PieceFor('N', by)) {
      return true;
    }
  }
  for (const auto& step : kKingSteps) {
    int f = file + step[0];
    int r = rank + step[1];
    if (OnBoard(f, r) && board.squares[SquareAt(f, r)] == PieceFor('K', by)) {
      return true;
    }
  }
  auto slides = [&](const int (&dirs)[4][2], char kind) {
    for (const auto& dir : dirs) {
      int f = file + dir[0];
      int r = rank + dir[1];
      while (OnBoard(f, r)) {
        char piece = board.squares[SquareAt(f, r)];
        if (piece != kEmpty) {
          if (piece == PieceFor(kind, by) || piece == PieceFor('Q', by)) {
            return true;
          }
          break;
        }
        f += dir[0];
        r += dir[1];
      }
    }
    return false;
  };
  return slides(kRookDirs, 'R') || slides(kBishopDirs, 'B');
}

bool ChessRules::InCheck(const Board& board, Color color) {
  const char king = PieceFor('K', color);
  for (int square = 0; square < 64; ++square) {
    if (board.squares[square] == king) {
      return IsAttacked(board, square, Opposite(color));
    }
  }
  return false;
}

void ChessRules::PseudoLegalMoves(const Board& board, std::vector<ChessMove>& out) {
  const Color us = board.side_to_move;
  const Color them = Opposite(us);
  for (int from = 0; from < 64; ++from) {
    const char piece = board.squares[from];
    if (!Owns(piece, us)) {
      continue;
    }
    const int file = FileOf(from);
    const int rank = RankOf(from);
    switch (KindOf(piece)) {
      case 'P': {
        const int dir = us == Color::kWhite ? 1 : -1;
        const int start_rank = us == Color::kWhite ? 1 : 6;
        if (OnBoard(file, rank + dir) && board.squares[SquareAt(file, rank + dir)] == kEmpty) {
          PushPawnMove(out, from, SquareAt(file, rank + dir), us, false);
          if (rank == start_rank && board.squares[SquareAt(file, rank + 2 * dir)] == kEmpty) {
            out.push_back(ChessMove{from, SquareAt(file, rank + 2 * dir), 0, false, false, true});
          }
        }
        for (int df : {-1, 1}) {
          if (!OnBoard(file + df, rank + dir)) {
            continue;
          }
          const int to = SquareAt(file + df, rank + dir);
          if (Owns(board.squares[to], them)) {
            PushPawnMove(out, from, to, us, false);
          } else if (to == board.en_passant) {
            PushPawnMove(out, from, to, us, true);
          }
        }
        break;
      }
      case 'N':
        for (const auto& step : kKnightSteps) {
          int f = file + step[0];
          int r = rank + step[1];
          if (OnBoard(f, r) && !Owns(board.squares[SquareAt(f, r)], us)) {
            out.push_back(ChessMove{from, SquareAt(f, r)});
          }
        }
        break;
      case 'K': {
        for (const auto& step : kKingSteps) {
          int f = file + step[0];
          int r = rank + step[1];
          if (OnBoard(f, r) && !Owns(board.squares[SquareAt(f, r)], us)) {
            out.push_back(ChessMove{from, SquareAt(f, r)});
          }
        }
        const int home = us == Color::kWhite ? 4 : 60;
        if (from != home || IsAttacked(board, home, them)) {
          break;
        }
        const bool king_side = us == Color::kWhite ? board.white_king_side : board.black_king_side;
        const bool queen_side = us == Color::kWhite ? board.white_queen_side : board.black_queen_side;
        if (king_side && board.squares[home + 3] == PieceFor('R', us) && board.squares[home + 1] == kEmpty &&
            board.squares[home + 2] == kEmpty && !IsAttacked(board, home + 1, them) &&
            !IsAttacked(board, home + 2, them)) {
          out.push_back(ChessMove{from, home + 2, 0, true, false, false});
        }
        if (queen_side && board.squares[home - 4] == PieceFor('R', us) && board.squares[home - 1] == kEmpty &&
            board.squares[home - 2] == kEmpty && board.squares[home - 3] == kEmpty &&
            !IsAttacked(board, home - 1, them) && !IsAttacked(board, home - 2, them)) {
          out.push_back(ChessMove{from, home - 2, 0, true, false, false});
        }
        break;
      }
      default: {
        const char kind = KindOf(piece);
        auto slide = [&](const int (&dirs)[4][2]) {
          for (const auto& dir : dirs) {
            int f = file + dir[0];
            int r = rank + dir[1];
            while (OnBoard(f, r)) {
              const char target = board.squares[SquareAt(f, r)];
              if (Owns(target, us)) {
                break;
              }
              out.push_back(ChessMove{from, SquareAt(f, r)});
              if (target != kEmpty) {
                break;
              }
              f += dir[0];
              r += dir[1];
            }
          }
        };
        if (kind == 'R' || kind == 'Q') {
          slide(kRookDirs);
        }
        if (kind == 'B' || kind == 'Q') {
          slide(kBishopDirs);
        }
        break;
      }
    }
  }
}

Board ChessRules::Play(const Board& board, const ChessMove& move) {
  Board next = board;
  const Color us = board.side_to_move;
  const char piece = board.squares[move.from];
  const bool capture = board.squares[move.to] != kEmpty || move.en_passant;

  next.en_passant = -1;
  next.halfmove_clock = (KindOf(piece) == 'P' || capture) ? 0 : board.halfmove_clock + 1;

  if (move.en_passant) {
    next.squares[us == Color::kWhite ? move.to - 8 : move.to + 8] = kEmpty;
  }
  next.squares[move.to] = move.promotion != 0 ? PieceFor(move.promotion, us) : piece;
  next.squares[move.from] = kEmpty;

  if (move.castle) {
    if (move.to == move.from + 2) {
      next.squares[move.from + 1] = next.squares[move.from + 3];
      next.squares[move.from + 3] = kEmpty;
    } else {
      next.squares[move.from - 1] = next.squares[move.from - 4];
      next.squares[move.from - 4] = kEmpty;
    }
  }
  if (move.double_push) {
    next.en_passant = (move.from + move.to) / 2;
  }

  if (KindOf(piece) == 'K') {
    if (us == Color::kWhite) {
      next.white_king_side = next.white_queen_side = false;
    } else {
      next.black_king_side = next.black_queen_side = false;
    }
  }
  for (int square : {move.from, move.to}) {
    switch (square) {
      case 0: next.white_queen_side = false; break;
      case 7: next.white_king_side = false; break;
      case 56: next.black_queen_side = false; break;
      case 63: next.black_king_side = false; break;
      default: break;
    }
  }

  if (us == Color::kBlack) {
    ++next.fullmove_number;
  }
  next.side_to_move = Opposite(us);
  return next;
}

std::vector<ChessMove> ChessRules::LegalMoves(const Board& board) {
  std::vector<ChessMove> pseudo;
  pseudo.reserve(64);
  PseudoLegalMoves(board, pseudo);
  std::vector<ChessMove> legal;
  legal.reserve(pseudo.size());
  for (const auto& move : pseudo) {
    if (!InCheck(Play(board, move), board.side_to_move)) {
      legal.push_back(move);
    }
  }
  return legal;
}

std::optional<ChessMove> ChessRules::ParseMove(const Board& board, std::string_view text, std::string& error) {
  while (!text.empty() && std::isspace(static_cast<unsigned char>(text.front()))) {
    text.remove_prefix(1);
  }
  while (!text.empty() && std::isspace(static_cast<unsigned char>(text.back()))) {
    text.remove_suffix(1);
  }
  if (text.empty()) {
    error = "empty move";
    return std::nullopt;
  }
  const auto legal = LegalMoves(board);
  if (auto uci = ParseUci(board, legal, text)) {
    return uci;
  }
  return ParseSan(board, legal, text, error);
}

std::optional<ChessMove> ChessRules::ParseUci(const Board& /*board*/, const std::vector<ChessMove>& legal,
                                              std::string_view text) {
  if (text.size() != 4 && text.size() != 5) {
    return std::nullopt;
  }
  auto from = ParseSquare(text.substr(0, 2));
  auto to = ParseSquare(text.substr(2, 2));
  if (!from || !to) {
    return std::nullopt;
  }
  char promotion = 0;
  if (text.size() == 5) {
    promotion = static_cast<char>(std::tolower(static_cast<unsigned char>(text[4])));
    if (std::string_view("qrbn").find(promotion) == std::string_view::npos) {
      return std::nullopt;
    }
  }
  for (const auto& move : legal) {
    if (move.from == *from && move.to == *to && move.promotion == promotion) {
      return move;
    }
  }
  return std::nullopt;
}

std::optional<ChessMove> ChessRules::ParseSan(const Board& board, const std::vector<ChessMove>& legal,
                                              std::string_view text, std::string& error) {
  std::string san(text);
  while (!san.empty() && std::string_view("+#!?").find(san.back()) != std::string_view::npos) {
    san.pop_back();
  }

  if (san == "O-O" || san == "0-0" || san == "O-O-O" || san == "0-0-0") {
    const bool king_side = san.size() == 3;
    for (const auto& move : legal) {
      if (move.castle && (king_side ? move.to == move.from + 2 : move.to == move.from - 2)) {
        return move;
      }
    }
    error = "illegal move: " + std::string(text);
    return std::nullopt;
  }

  char promotion = 0;
  auto eq = san.find('=');
  if (eq != std::string::npos) {
    if (eq + 2 != san.size()) {
      error = "malformed move: " + std::string(text);
      return std::nullopt;
    }
    promotion = san[eq + 1];
    san.erase(eq);
  } else if (san.size() >= 3 && std::string_view("QRBN").find(san.back()) != std::string_view::npos &&
             std::isdigit(static_cast<unsigned char>(san[san.size() - 2]))) {
    promotion = san.back();
    san.pop_back();
  }
  if (promotion != 0) {
    promotion = static_cast<char>(std::tolower(static_cast<unsigned char>(promotion)));
    if (std::string_view("qrbn").find(promotion) == std::string_view::npos) {
      error = "malformed move: " + std::string(text);
      return std::nullopt;
    }
  }

  if (san.size() < 2) {
    error = "malformed move: " + std::string(text);
    return std::nullopt;
  }
  auto to = ParseSquare(std::string_view(san).substr(san.size() - 2));
  if (!to) {
    error = "malformed move: " + std::string(text);
    return std::nullopt;
  }
  std::string prefix = san.substr(0, san.size() - 2);

  char kind = 'P';
  if (!prefix.empty() && std::string_view("KQRBN").find(prefix.front()) != std::string_view::npos) {
    kind = prefix.front();
    prefix.erase(0, 1);
  }
  bool capture = false;
  if (!prefix.empty() && (prefix.back() == 'x' || prefix.back() == ':')) {
    capture = true;
    prefix.pop_back();
  }
  int from_file = -1;
  int from_rank = -1;
  for (char c : prefix) {
    if (c >= 'a' && c <= 'h' && from_file < 0) {
      from_file = c - 'a';
    } else if (c >= '1' && c <= '8' && from_rank < 0) {
      from_rank = c - '1';
    } else {
      error = "malformed move: " + std::string(text);
      return std::nullopt;
    }
  }
  if (kind == 'P' && capture && from_file < 0) {
    error = "malformed move: " + std::string(text);
    return std::nullopt;
  }

  std::vector<ChessMove> matches;
  for (const auto& move : legal) {
    if (move.to != *to || move.castle || KindOf(board.squares[move.from]) != kind) {
      continue;
    }
    if (from_file >= 0 && FileOf(move.from) != from_file) {
      continue;
    }
    if (from_rank >= 0 && RankOf(move.from) != from_rank) {
      continue;
    }
    if (move.promotion != promotion) {
      continue;
    }
    if (capture && board.squares[move.to] == kEmpty && !move.en_passant) {
      continue;
    }
    matches.push_back(move);
  }
  if (matches.empty()) {
    error = "illegal move: " + std::string(text);
    return std::nullopt;
  }
  if (matches.size() > 1) {
    error = "ambiguous move: " + std::string(text);
    return std::nullopt;
  }
  return matches.front();
}

bool ChessRules::InsufficientMaterial(const Board& board) {
  int minors = 0;
  int bishops_light = 0;
  int bishops_dark = 0;
  int knights = 0;
  for (int square = 0; square < 64; ++square) {
    const char piece = board.squares[square];
    if (piece == kEmpty) {
      continue;
    }
    switch (KindOf(piece)) {
      case 'K':
        break;
      case 'B':
        ++minors;
        ((FileOf(square) + RankOf(square)) % 2 == 0 ? bishops_dark : bishops_light)++;
        break;
      case 'N':
        ++minors;
        ++knights;
        break;
      default:
        return false;
    }
  }
  if (minors <= 1) {
    return true;
  }
  return knights == 0 && (bishops_light == 0 || bishops_dark == 0);
}

}  // namespace chessrelay
