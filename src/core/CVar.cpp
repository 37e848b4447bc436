#include "asterism/core/CVar.h"

#include "asterism/core/Log.h"

#include <algorithm>
#include <cctype>
#include <charconv>
#include <cmath>
#include <cstdio>
#include <cstdlib>
#include <fstream>
#include <system_error>

namespace asterism::core {
namespace {

bool isBlank(char c) { return std::isspace(static_cast<unsigned char>(c)) != 0; }

std::string_view stripBlanks(std::string_view s) {
  const auto first = std::find_if_not(s.begin(), s.end(), isBlank);
  const auto last = std::find_if_not(s.rbegin(), s.rend(), isBlank).base();
  return first < last ? std::string_view(&*first, static_cast<std::size_t>(last - first)) : std::string_view{};
}

std::string lowered(std::string_view s) {
  std::string out;
  out.reserve(s.size());
  for (char c : s) out.push_back(static_cast<char>(std::tolower(static_cast<unsigned char>(c))));
  return out;
}

void fail(std::string* outError, std::string msg) {
  if (outError) *outError = std::move(msg);
}

std::string unknownName(std::string_view name) { return "unknown cvar: " + std::string(name); }

std::optional<CVarValue> parseAs(CVarType type, std::string_view raw) {
  const std::string_view text = stripBlanks(raw);
  switch (type) {
    case CVarType::Bool: {
      const std::string k = lowered(text);
      if (k == "1" || k == "true" || k == "on" || k == "yes") return CVarValue{true};
      if (k == "0" || k == "false" || k == "off" || k == "no") return CVarValue{false};
      return std::nullopt;
    }
    case CVarType::Int: {
      std::int64_t i = 0;
      const char* end = text.data() + text.size();
      const auto [ptr, ec] = std::from_chars(text.data(), end, i);
      if (text.empty() || ec != std::errc{} || ptr != end) return std::nullopt;
      return CVarValue{i};
    }
    case CVarType::Float: {
      if (text.empty()) return std::nullopt;
      const std::string buf(text);
      char* stop = nullptr;
      const double d = std::strtod(buf.c_str(), &stop);
      if (stop != buf.c_str() + buf.size() || !std::isfinite(d)) return std::nullopt;
      return CVarValue{d};
    }
    case CVarType::String: {
      std::string_view s = text;
      const bool quoted = s.size() >= 2 && (s.front() == '"' || s.front() == '\'') && s.back() == s.front();
      if (quoted) s = s.substr(1, s.size() - 2);
      return CVarValue{std::string(s)};
    }
  }
  return std::nullopt;
}

} // namespace

const char* toString(CVarType type) {
  switch (type) {
    case CVarType::Bool:   return "bool";
    case CVarType::Int:    return "int";
    case CVarType::Float:  return "float";
    case CVarType::String: return "string";
  }
  return "?";
}

std::string formatValue(const CVar& var) {
  if (const auto* b = std::get_if<bool>(&var.value)) return *b ? "true" : "false";
  if (const auto* i = std::get_if<std::int64_t>(&var.value)) return std::to_string(*i);
  if (const auto* d = std::get_if<double>(&var.value)) {
    char buf[40];
    std::snprintf(buf, sizeof(buf), "%.17g", *d);
    return buf;
  }
  return '"' + std::get<std::string>(var.value) + '"';
}

CVar* CVarRegistry::define(std::string_view name, CVarValue defaultValue, const CVarSpec& spec) {
  const auto type = static_cast<CVarType>(defaultValue.index());
  std::optional<std::string> waiting;
  CVar* var = nullptr;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    if (auto it = vars_.find(name); it != vars_.end()) {
      if (it->second.type == type) return &it->second;
      log(LogLevel::Error, "cvar " + std::string(name) + " is " + toString(it->second.type) +
                               ", cannot redefine as " + toString(type));
      return nullptr;
    }

    CVar fresh;
    fresh.name.assign(name);
    fresh.help.assign(spec.help);
    fresh.type = type;
    fresh.flags = spec.flags;
    fresh.value = defaultValue;
    fresh.defaultValue = std::move(defaultValue);
    var = &vars_.emplace(fresh.name, std::move(fresh)).first->second;

    if (auto p = pending_.find(name); p != pending_.end()) {
      waiting = std::move(p->second);
      pending_.erase(p);
    }
  }

  if (!waiting) return var;

  if (auto parsed = parseAs(type, *waiting)) {
    std::lock_guard<std::mutex> lock(mutex_);
    var->value = std::move(*parsed);
  } else {
    log(LogLevel::Warn, "cvar " + std::string(name) + ": dropping loaded value '" + *waiting +
                            "', not a " + toString(type));
  }
  return var;
}

CVar* CVarRegistry::defineBool(std::string_view name, bool defaultValue, CVarSpec spec) {
  return define(name, defaultValue, spec);
}

CVar* CVarRegistry::defineInt(std::string_view name, std::int64_t defaultValue, CVarSpec spec) {
  return define(name, defaultValue, spec);
}

CVar* CVarRegistry::defineFloat(std::string_view name, double defaultValue, CVarSpec spec) {
  return define(name, defaultValue, spec);
}

CVar* CVarRegistry::defineString(std::string_view name, std::string defaultValue, CVarSpec spec) {
  return define(name, std::move(defaultValue), spec);
}

const CVar* CVarRegistry::find(std::string_view name) const {
  std::lock_guard<std::mutex> lock(mutex_);
  const auto it = vars_.find(name);
  return it != vars_.end() ? &it->second : nullptr;
}

std::size_t CVarRegistry::size() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return vars_.size();
}

bool CVarRegistry::getBool(std::string_view name, bool fallback) const {
  std::lock_guard<std::mutex> lock(mutex_);
  const auto it = vars_.find(name);
  if (it == vars_.end()) return fallback;
  const bool* v = std::get_if<bool>(&it->second.value);
  return v ? *v : fallback;
}

std::int64_t CVarRegistry::getInt(std::string_view name, std::int64_t fallback) const {
  std::lock_guard<std::mutex> lock(mutex_);
  const auto it = vars_.find(name);
  if (it == vars_.end()) return fallback;
  const std::int64_t* v = std::get_if<std::int64_t>(&it->second.value);
  return v ? *v : fallback;
}

double CVarRegistry::getFloat(std::string_view name, double fallback) const {
  std::lock_guard<std::mutex> lock(mutex_);
  const auto it = vars_.find(name);
  if (it == vars_.end()) return fallback;
  if (const double* d = std::get_if<double>(&it->second.value)) return *d;
  if (const std::int64_t* i = std::get_if<std::int64_t>(&it->second.value)) return static_cast<double>(*i);
  return fallback;
}

std::string CVarRegistry::getString(std::string_view name, std::string_view fallback) const {
  std::lock_guard<std::mutex> lock(mutex_);
  const auto it = vars_.find(name);
  if (it == vars_.end()) return std::string(fallback);
  const std::string* v = std::get_if<std::string>(&it->second.value);
  return v ? *v : std::string(fallback);
}

bool CVarRegistry::store(std::string_view name, CVarValue v, std::string* outError) {
  std::vector<CVarListener> notify;
  CVar changed;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    const auto it = vars_.find(name);
    if (it == vars_.end()) {
      fail(outError, unknownName(name));
      return false;
    }
    CVar& var = it->second;
    if (hasFlag(var.flags, CVarFlag::ReadOnly)) {
      fail(outError, var.name + " is read-only");
      return false;
    }
    if (v.index() != static_cast<std::size_t>(var.type)) {
      fail(outError, var.name + " expects a " + toString(var.type));
      return false;
    }
    var.value = std::move(v);
    notify = var.listeners;
    changed = var;
  }
  for (const auto& fn : notify) {
    if (fn) fn(changed);
  }
  return true;
}

bool CVarRegistry::setBool(std::string_view name, bool v, std::string* outError) {
  return store(name, v, outError);
}

bool CVarRegistry::setInt(std::string_view name, std::int64_t v, std::string* outError) {
  return store(name, v, outError);
}

bool CVarRegistry::setFloat(std::string_view name, double v, std::string* outError) {
  if (std::isfinite(v)) return store(name, v, outError);
  fail(outError, std::string(name) + " rejects non-finite values");
  return false;
}

bool CVarRegistry::setString(std::string_view name, std::string v, std::string* outError) {
  return store(name, std::move(v), outError);
}

bool CVarRegistry::setFromString(std::string_view name, std::string_view text, std::string* outError) {
  const CVar* var = find(name);
  if (!var) {
    fail(outError, unknownName(name));
    return false;
  }
  // Type never changes after definition, so reading it unlocked is safe.
  const CVarType type = var->type;
  auto parsed = parseAs(type, text);
  if (!parsed) {
    fail(outError, std::string(name) + ": '" + std::string(stripBlanks(text)) + "' is not a " + toString(type));
    return false;
  }
  return store(name, std::move(*parsed), outError);
}

bool CVarRegistry::reset(std::string_view name, std::string* outError) {
  CVarValue initial;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    const auto it = vars_.find(name);
    if (it == vars_.end()) {
      fail(outError, unknownName(name));
      return false;
    }
    initial = it->second.defaultValue;
  }
  return store(name, std::move(initial), outError);
}

bool CVarRegistry::addListener(std::string_view name, CVarListener listener, std::string* outError) {
  std::lock_guard<std::mutex> lock(mutex_);
  const auto it = vars_.find(name);
  if (it == vars_.end()) {
    fail(outError, unknownName(name));
    return false;
  }
  it->second.listeners.push_back(std::move(listener));
  return true;
}

std::vector<const CVar*> CVarRegistry::list(std::string_view filter) const {
  const std::string needle = lowered(filter);
  std::lock_guard<std::mutex> lock(mutex_);
  std::vector<const CVar*> out;
  for (const auto& entry : vars_) {
    if (needle.empty() || lowered(entry.first).find(needle) != std::string::npos) out.push_back(&entry.second);
  }
  return out;
}

bool CVarRegistry::loadFile(const std::string& path, std::string* outError) {
  std::ifstream in(path);
  if (!in) {
    fail(outError, "cannot open " + path);
    return false;
  }

  std::string problems;
  auto report = [&](int lineNo, const std::string& why) {
    problems += path + ":" + std::to_string(lineNo) + ": " + why + "\n";
  };

  std::string raw;
  for (int lineNo = 1; std::getline(in, raw); ++lineNo) {
    const std::string_view line = stripBlanks(raw);
    if (line.empty() || line.front() == '#' || line.substr(0, 2) == "//") continue;

    const std::size_t eq = line.find('=');
    if (eq == std::string_view::npos) {
      report(lineNo, "expected name = value");
      continue;
    }
    const std::string name(stripBlanks(line.substr(0, eq)));
    const std::string_view text = stripBlanks(line.substr(eq + 1));
    if (name.empty()) {
      report(lineNo, "empty name");
      continue;
    }

    {
      std::lock_guard<std::mutex> lock(mutex_);
      if (vars_.find(name) == vars_.end()) {
        pending_[name] = std::string(text);
        continue;
      }
    }

    std::string why;
    if (!setFromString(name, text, &why)) report(lineNo, why);
  }

  if (problems.empty()) return true;
  fail(outError, std::move(problems));
  return false;
}

bool CVarRegistry::saveFile(const std::string& path, std::string* outError) const {
  std::ofstream out(path, std::ios::trunc);
  if (!out) {
    fail(outError, "cannot write " + path);
    return false;
  }

  out << "# asterism cvars\n";
  for (const CVar* var : list()) {
    if (!hasFlag(var->flags, CVarFlag::Archive)) continue;
    if (!var->help.empty()) out << "# " << var->help << '\n';
    out << var->name << " = " << formatValue(*var) << '\n';
  }

  out.flush();
  if (out) return true;
  fail(outError, "write failed: " + path);
  return false;
}

bool CVarRegistry::hasPending(std::string_view name) const {
  return pendingValue(name).has_value();
}

std::optional<std::string> CVarRegistry::pendingValue(std::string_view name) const {
  std::lock_guard<std::mutex> lock(mutex_);
  const auto it = pending_.find(name);
  if (it == pending_.end()) return std::nullopt;
  return it->second;
}

} // namespace asterism::core
