#include <gtest/gtest.h>
#include "Logger.h"

// Google Test 실행을 위한 main 함수
int main(int argc, char **argv) {
    // 표준 출력으로 로그 출력
    hapble::Logger::registerConsoleReceivers();
    hapble::Logger::setLogLevel(hapble::Logger::Level::DEBUG);

    hapble::Logger::info("Logger initialized for tests");

    ::testing::InitGoogleTest(&argc, argv);
    return RUN_ALL_TESTS();
}
