/*
 * 설명: 서버 진입점으로 환경설정을 로드해 실행한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: server/tests/e2e/session_flow_test.cpp
 */
#include <exception>
#include <iostream>

#include "chessrelay/app.hpp"

int main() {
  using namespace chessrelay;
  AppConfig config;
  try {
    config = LoadConfigFromEnv();
  } catch (const std::exception& ex) {
    std::cerr << "환경설정 오류: " << ex.what() << "\n";
    return 1;
  }
  if (config.jwt_secret.empty()) {
    std::cerr << "JWT_SECRET_KEY가 비어 있어 모든 WS 업그레이드가 거부됩니다\n";
  }

  try {
    ServerApp app(config);
    app.Run();
  } catch (const std::exception& ex) {
    std::cerr << "서버 실행 중 예외: " << ex.what() << "\n";
    return 1;
  }
  return 0;
}
