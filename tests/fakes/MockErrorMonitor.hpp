#pragma once
/** @file  MockErrorMonitor.hpp
 *  @brief gMock double for ErrorMonitor escalation checks.
 *
 *  © 2025 Milo Medical — MIT-licensed.
 */

#include <string>

#include <gmock/gmock.h>

#include "core/ErrorMonitor.hpp"

namespace linkbridge {
  namespace test {

    class MockErrorMonitor : public linkbridge::core::ErrorMonitor {
    public:
      MOCK_METHOD(void, notifyFailure, (const std::string&), (override));
    };

  } // namespace test
} // namespace linkbridge
