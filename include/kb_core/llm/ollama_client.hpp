#pragma once

#include <string>
#include <vector>

#include "kb_core/llm/embedding_provider.hpp"

namespace kb_core {

class OllamaClient : public EmbeddingProvider {
 public:
  // Throws ProviderError if no Ollama server answers at ollama_url.
  OllamaClient(const std::string &ollama_url, const std::string &embedding_model);
  ~OllamaClient() override = default;

  // Disable copy constructor and assignment
  OllamaClient(const OllamaClient &) = delete;
  OllamaClient &operator=(const OllamaClient &) = delete;

  // Get a normalized embedding for a single text
  virtual std::vector<float> get_embedding(const std::string &text);

  std::vector<std::vector<float>> embed(const std::vector<std::string> &texts) override;

  std::string identity() const override {
    return embedding_model_;
  }

  virtual bool is_server_available();

 private:
  std::string ollama_url_;
  std::string embedding_model_;

  void setup_server_connection();
  static void normalize(std::vector<float> &vector);
};

}  // namespace kb_core
