#pragma once

#include <gmock/gmock.h>

#include <string>
#include <vector>

#include "kb_core/llm/embedding_provider.hpp"

namespace kb_tests {

/**
 * Mock EmbeddingProvider for tests that need to script provider failures or
 * malformed responses.
 */
class MockEmbeddingProvider : public kb_core::EmbeddingProvider {
 public:
  explicit MockEmbeddingProvider(const std::string &model = "mock-embed") {
    ON_CALL(*this, identity()).WillByDefault(testing::Return(model));
  }

  MOCK_METHOD(std::vector<std::vector<float>>, embed, (const std::vector<std::string> &texts),
              (override));
  MOCK_METHOD(std::string, identity, (), (const, override));
};

}  // namespace kb_tests
