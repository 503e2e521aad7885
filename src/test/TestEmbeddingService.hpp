#pragma once
#include <atomic>
#include <cctype>
#include <cstdint>
#include <mutex>
#include <string>
#include <vector>
#include "domain/EmbeddingService.hpp"

// Deterministic bag-of-words embedding: every lowercase alphanumeric token is
// hashed (FNV-1a) into one of kDimensions buckets. Texts sharing tokens get a
// positive cosine similarity; texts sharing none are orthogonal.
class TestEmbeddingService : public ssdverifier::domain::EmbeddingService {
public:
    static constexpr size_t kDimensions = 512;

    std::vector<Embedding> embedBatch(const std::vector<std::string>& texts,
                                      std::chrono::milliseconds) override {
        ++m_calls;
        {
            std::lock_guard<std::mutex> lock(m_mutex);
            m_textsSeen += texts.size();
            for (const auto& text : texts) {
                if (!m_failOn.empty() && text.find(m_failOn) != std::string::npos) {
                    throw ssdverifier::domain::EmbeddingError("Simulated provider timeout");
                }
            }
        }
        std::vector<Embedding> out;
        out.reserve(texts.size());
        for (const auto& text : texts) out.push_back(Embed(text));
        return out;
    }

    std::string getModelName() const override { return "test-bow"; }

    // Any batch containing a text with this substring fails.
    void failOn(const std::string& marker) {
        std::lock_guard<std::mutex> lock(m_mutex);
        m_failOn = marker;
    }

    int calls() const { return m_calls.load(); }

    size_t textsSeen() const {
        std::lock_guard<std::mutex> lock(m_mutex);
        return m_textsSeen;
    }

    static Embedding Embed(const std::string& text) {
        Embedding v(kDimensions, 0.0f);
        std::string token;
        auto flush = [&]() {
            if (token.empty()) return;
            uint32_t h = 2166136261u;
            for (unsigned char c : token) {
                h ^= c;
                h *= 16777619u;
            }
            v[h % kDimensions] += 1.0f;
            token.clear();
        };
        for (unsigned char c : text) {
            if (std::isalnum(c)) {
                token.push_back(static_cast<char>(std::tolower(c)));
            } else {
                flush();
            }
        }
        flush();
        return v;
    }

private:
    std::atomic<int> m_calls{0};
    mutable std::mutex m_mutex;
    std::string m_failOn;
    size_t m_textsSeen = 0;
};
