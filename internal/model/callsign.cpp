#include "internal/model/callsign.hpp"

#include <array>
#include <cctype>
#include <utility>

namespace awacs::model {

namespace {

constexpr std::array<std::pair<std::string_view, char>, 12> kSpokenDigits = {{
    {"zero", '0'},
    {"one", '1'},
    {"two", '2'},
    {"three", '3'},
    {"tree", '3'},
    {"four", '4'},
    {"five", '5'},
    {"fife", '5'},
    {"six", '6'},
    {"seven", '7'},
    {"eight", '8'},
    {"niner", '9'},
}};

std::string FoldWord(const std::string& word) {
  if (word == "nine") {
    return "9";
  }
  for (const auto& [spoken, digit] : kSpokenDigits) {
    if (word == spoken) {
      return std::string(1, digit);
    }
  }
  return word;
}

} // namespace

std::string NormalizeCallsign(std::string_view callsign) {
  std::string out;
  std::string word;
  out.reserve(callsign.size());

  auto flush = [&]() {
    if (!word.empty()) {
      out += FoldWord(word);
      word.clear();
    }
  };

  for (char c : callsign) {
    const auto uc = static_cast<unsigned char>(c);
    if (std::isalpha(uc)) {
      word.push_back(static_cast<char>(std::tolower(uc)));
    } else if (std::isdigit(uc)) {
      flush();
      out.push_back(c);
    } else {
      flush();
    }
  }
  flush();
  return out;
}

bool SameCallsign(std::string_view a, std::string_view b) {
  const auto na = NormalizeCallsign(a);
  return !na.empty() && na == NormalizeCallsign(b);
}

} // namespace awacs::model
