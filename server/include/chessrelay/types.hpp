/*
 * 설명: 인증 주체, 연결 핸들, 진영 색 등 컴포넌트 공통 타입을 정의한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 */
#pragma once

#include <cstdint>
#include <functional>
#include <optional>
#include <string>
#include <string_view>

namespace chessrelay {

// 외부 인증 계층이 연결마다 한 번 붙여주는 신원. 연결 수명 동안 불변이다.
struct Principal {
  std::string id;
  std::string display_name;

  bool operator==(const Principal& other) const { return id == other.id && display_name == other.display_name; }
};

// 소켓 하나를 가리키는 불투명 식별자. 소유권은 ConnectionRegistry에만 있다.
class ConnectionHandle {
 public:
  constexpr ConnectionHandle() = default;
  constexpr explicit ConnectionHandle(std::uint64_t value) : value_(value) {}

  constexpr std::uint64_t value() const { return value_; }
  constexpr bool valid() const { return value_ != 0; }

  constexpr bool operator==(const ConnectionHandle& other) const { return value_ == other.value_; }
  constexpr bool operator!=(const ConnectionHandle& other) const { return value_ != other.value_; }

 private:
  std::uint64_t value_{0};
};

enum class Color { kWhite, kBlack };

constexpr Color Opposite(Color color) { return color == Color::kWhite ? Color::kBlack : Color::kWhite; }
constexpr std::string_view ColorName(Color color) { return color == Color::kWhite ? "white" : "black"; }

}  // namespace chessrelay

template <>
struct std::hash<chessrelay::ConnectionHandle> {
  std::size_t operator()(const chessrelay::ConnectionHandle& handle) const noexcept {
    return std::hash<std::uint64_t>{}(handle.value());
  }
};
