#pragma once
#include <cstdint>
#include <random>
#include <string>
#include <vector>

namespace genstream {

// Source of the text the prompt cycle publishes. generate() may throw; the
// scheduler reports the failure and carries on with the next cycle.
class TextGenerator {
public:
    virtual ~TextGenerator() = default;
    virtual std::string generate() = 0;
};

// Picks one of a fixed list of "thinking" lines.
class ThoughtPatterns : public TextGenerator {
public:
    explicit ThoughtPatterns(uint64_t seed);
    ThoughtPatterns(std::vector<std::string> patterns, uint64_t seed);

    std::string generate() override;

    const std::vector<std::string>& patterns() const { return patterns_; }

private:
    std::vector<std::string> patterns_;
    std::mt19937_64 rng_;
};

// Fills one of a few prompt templates with random picks from word lists.
// Placeholders are written as {name}.
class TemplatePromptGenerator : public TextGenerator {
public:
    explicit TemplatePromptGenerator(uint64_t seed);

    std::string generate() override;

private:
    const std::string& pick(const std::vector<std::string>& list);

    std::vector<std::string> templates_;
    std::vector<std::string> adjectives_;
    std::vector<std::string> settings_;
    std::vector<std::string> elements_;
    std::vector<std::string> styles_;
    std::mt19937_64 rng_;
};

} // namespace genstream
