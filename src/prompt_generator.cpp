#include "prompt_generator.hpp"
#include "util.hpp"

#include <stdexcept>

namespace genstream {

static std::vector<std::string> default_thoughts() {
    return {
        "Analyzing visual aesthetics and trending motifs...",
        "Considering color palettes that evoke specific emotions...",
        "Exploring dynamic camera movements and transitions...",
        "Thinking about narrative elements to enhance engagement...",
        "Evaluating lighting conditions for dramatic effect...",
        "Contemplating abstract vs realistic visual approaches...",
        "Processing feedback from previous generations...",
        "Adjusting parameters for optimal visual impact...",
    };
}

ThoughtPatterns::ThoughtPatterns(uint64_t seed)
    : ThoughtPatterns(default_thoughts(), seed)
{}

ThoughtPatterns::ThoughtPatterns(std::vector<std::string> patterns, uint64_t seed)
    : patterns_(std::move(patterns)), rng_(seed)
{}

std::string ThoughtPatterns::generate() {
    if (patterns_.empty())
        throw std::runtime_error("No thought patterns configured");
    std::uniform_int_distribution<size_t> dist(0, patterns_.size() - 1);
    return patterns_[dist(rng_)];
}

TemplatePromptGenerator::TemplatePromptGenerator(uint64_t seed)
    : templates_{
          "A {adjective} {setting} with {elements}, {style} style, {technical_specs}",
          "{action} in a {environment}, featuring {visual_elements}, {atmosphere}",
          "{concept} with {colors} and {effects}, {mood} lighting, {format}",
      }
    , adjectives_{"cyberpunk", "ethereal", "dramatic", "surreal", "vibrant", "mystical"}
    , settings_{"cityscape", "forest", "ocean depths", "space station", "mountain peak", "desert"}
    , elements_{"neon lights", "floating particles", "energy beams", "crystal formations",
                "smoke effects"}
    , styles_{"cinematic", "80s retro", "abstract art", "photorealistic", "anime-inspired"}
    , rng_(seed)
{}

const std::string& TemplatePromptGenerator::pick(const std::vector<std::string>& list) {
    std::uniform_int_distribution<size_t> dist(0, list.size() - 1);
    return list[dist(rng_)];
}

std::string TemplatePromptGenerator::generate() {
    std::string prompt = pick(templates_);

    prompt = replace_all(prompt, "{adjective}", pick(adjectives_));
    prompt = replace_all(prompt, "{setting}", pick(settings_));
    prompt = replace_all(prompt, "{elements}", pick(elements_));
    prompt = replace_all(prompt, "{style}", pick(styles_));
    prompt = replace_all(prompt, "{technical_specs}", "4K resolution, smooth motion");
    prompt = replace_all(prompt, "{action}", "Dynamic movement");
    prompt = replace_all(prompt, "{environment}", pick(settings_));
    prompt = replace_all(prompt, "{visual_elements}", pick(elements_));
    prompt = replace_all(prompt, "{atmosphere}", pick(adjectives_) + " atmosphere");
    prompt = replace_all(prompt, "{concept}", "Abstract visualization");
    prompt = replace_all(prompt, "{colors}", "vibrant neon colors");
    prompt = replace_all(prompt, "{effects}", "particle effects");
    prompt = replace_all(prompt, "{mood}", "dramatic");
    prompt = replace_all(prompt, "{format}", "seamless loop");
    return prompt;
}

} // namespace genstream
