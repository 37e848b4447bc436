#include "asterism/core/Args.h"

#include <charconv>
#include <cmath>
#include <cstdlib>
#include <system_error>

namespace asterism::core {
namespace {

bool isOptionWord(std::string_view word) { return word.size() >= 2 && word.substr(0, 2) == "--"; }

} // namespace

void Args::parse(int argc, char** argv) {
  *this = Args{};
  if (argc <= 0 || !argv) return;
  if (argv[0]) program_ = argv[0];

  bool literal = false;
  for (int i = 1; i < argc; ++i) {
    if (!argv[i]) continue;
    const std::string_view word = argv[i];
    if (word.empty()) continue;

    if (literal || !isOptionWord(word)) {
      positional_.emplace_back(word);
      continue;
    }
    if (word == "--") {
      literal = true;
      continue;
    }

    const std::string_view body = word.substr(2);
    if (const auto eq = body.find('='); eq != std::string_view::npos) {
      options_[std::string(body.substr(0, eq))].emplace_back(body.substr(eq + 1));
    } else if (i + 1 < argc && argv[i + 1] && !isOptionWord(argv[i + 1])) {
      options_[std::string(body)].emplace_back(argv[++i]);
    } else {
      switches_.emplace(body);
    }
  }
}

const std::vector<std::string>* Args::values(std::string_view name) const {
  const auto it = options_.find(name);
  return it == options_.end() ? nullptr : &it->second;
}

bool Args::get(std::string_view name, std::string& out) const {
  const auto* all = values(name);
  if (!all || all->empty()) return false;
  out = all->back();
  return true;
}

bool Args::getInt(std::string_view name, std::int64_t& out) const {
  std::string text;
  if (!get(name, text) || text.empty()) return false;
  std::int64_t v = 0;
  const char* end = text.data() + text.size();
  const auto [ptr, ec] = std::from_chars(text.data(), end, v);
  if (ec != std::errc{} || ptr != end) return false;
  out = v;
  return true;
}

bool Args::getDouble(std::string_view name, double& out) const {
  std::string text;
  if (!get(name, text) || text.empty()) return false;
  char* end = nullptr;
  const double v = std::strtod(text.c_str(), &end);
  if (end != text.c_str() + text.size() || !std::isfinite(v)) return false;
  out = v;
  return true;
}

} // namespace asterism::core
