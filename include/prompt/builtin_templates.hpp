#pragma once

#include "prompt/prompt_template.hpp"

namespace promptguard {

// Built-in detector prompts. Wording is frozen per version: evaluation
// datasets are scored against each version's exact text.

/// v1: baseline injection / jailbreak detector
class DetectorPromptV1 : public IPromptTemplate {
public:
    [[nodiscard]] std::string version() const override { return "v1"; }
    [[nodiscard]] std::string render(std::string_view text) const override;
};

/// v2: adds developer-mode, fictional-scenario and hidden-instruction cues
class DetectorPromptV2 : public IPromptTemplate {
public:
    [[nodiscard]] std::string version() const override { return "v2"; }
    [[nodiscard]] std::string render(std::string_view text) const override;
};

/// v3: enumerated threat patterns (command execution, privileged files, ...)
class DetectorPromptV3 : public IPromptTemplate {
public:
    [[nodiscard]] std::string version() const override { return "v3"; }
    [[nodiscard]] std::string render(std::string_view text) const override;
};

} // namespace promptguard
