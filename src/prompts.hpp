#pragma once

#include <chrono>
#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>

#include "file_copier.hpp"

class ProgressAggregator;

// y/yes, n/no, a/all, q/quit, case-insensitive, surrounding blanks ignored.
std::optional<OverwriteDecision> parse_overwrite_answer(const std::string& answer);

// y/yes -> true; n/no or an empty line -> false; anything else -> nullopt.
std::optional<bool> parse_confirmation(const std::string& answer);

// One line from the terminal through readline; nullopt at end of input.
std::optional<std::string> read_answer(const std::string& prompt);

// Asks "Overwrite '<path>'? [y/n/a/q]:" on the row above the progress line,
// repeating on invalid input. End of input counts as quit.
class ReadlineOverwritePolicy : public OverwritePolicy {
public:
  explicit ReadlineOverwritePolicy(ProgressAggregator* aggregator = nullptr) : aggregator_(aggregator) {}

  OverwriteDecision decide(const std::filesystem::path& destination) override;

private:
  OverwriteDecision ask(const std::filesystem::path& destination, int row);

  ProgressAggregator* aggregator_;
};

// Countdown, then "Continue? [y/N]:" until the answer is valid.
bool confirm_deletion(std::chrono::seconds countdown = std::chrono::seconds(3));
