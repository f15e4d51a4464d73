#include "kb_core/llm/ollama_client.hpp"

#include <cmath>

#include "kb_core/errors.hpp"
#include "ollama.hpp"

namespace kb_core {

OllamaClient::OllamaClient(const std::string &ollama_url, const std::string &embedding_model)
    : ollama_url_(ollama_url), embedding_model_(embedding_model) {
  setup_server_connection();
}

void OllamaClient::setup_server_connection() {
  ollama::setServerURL(ollama_url_);
  if (!ollama::is_running()) {
    throw ProviderError("Ollama server is not running at " + ollama_url_);
  }
}

std::vector<float> OllamaClient::get_embedding(const std::string &text) {
  std::vector<float> embedding;
  try {
    ollama::response response = ollama::generate_embeddings(embedding_model_, text);
    auto json_response = response.as_json();

    if (!json_response.contains("embeddings")) {
      throw ProviderError("Response does not contain embeddings field");
    }

    // Handle different embedding response formats
    auto embeddings = json_response["embeddings"];
    if (!embeddings.is_array() || embeddings.empty()) {
      throw ProviderError("Embeddings field is not a non-empty array");
    }
    if (embeddings[0].is_array()) {
      embedding = embeddings[0].get<std::vector<float>>();
    } else {
      embedding = embeddings.get<std::vector<float>>();
    }
  } catch (const ollama::exception &e) {
    throw ProviderError("Embedding generation failed: " + std::string(e.what()));
  } catch (const nlohmann::json::exception &e) {
    throw ProviderError("Malformed embedding response: " + std::string(e.what()));
  }

  normalize(embedding);
  return embedding;
}

// The server embeds one input per request; batching is a loop here so that
// callers can still hand over whole sub-batches.
std::vector<std::vector<float>> OllamaClient::embed(const std::vector<std::string> &texts) {
  std::vector<std::vector<float>> vectors;
  vectors.reserve(texts.size());
  for (const auto &text : texts) {
    vectors.push_back(get_embedding(text));
  }
  return vectors;
}

void OllamaClient::normalize(std::vector<float> &vector) {
  if (vector.empty()) {
    throw ProviderError("Embedding model returned an empty vector");
  }
  double sum = 0.0;
  for (float v : vector) {
    sum += static_cast<double>(v) * v;
  }
  const double norm = std::sqrt(sum);
  if (norm == 0.0) {
    throw ProviderError("Embedding model returned a zero vector");
  }
  for (float &v : vector) {
    v = static_cast<float>(v / norm);
  }
}

bool OllamaClient::is_server_available() {
  return ollama::is_running();
}

}  // namespace kb_core
