#pragma once

#include <cstdint>
#include <functional>
#include <map>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

namespace asterism::core {

// Typed runtime settings ("cvars") with a plain-text persistence format:
//
//   # comment            // comment
//   nebula.scale = 0.05
//   universe.seed = "haunting beauty"
//
// A file may mention names nobody has defined yet; those assignments wait as
// pending and are applied when the variable is defined.

enum class CVarType : std::uint8_t { Bool, Int, Float, String };

enum class CVarFlag : std::uint32_t {
  None     = 0,
  Archive  = 1u << 0, // written by saveFile()
  ReadOnly = 1u << 1, // fixed after definition
};

constexpr CVarFlag operator|(CVarFlag a, CVarFlag b) {
  return static_cast<CVarFlag>(static_cast<std::uint32_t>(a) | static_cast<std::uint32_t>(b));
}

constexpr bool hasFlag(CVarFlag set, CVarFlag f) {
  return (static_cast<std::uint32_t>(set) & static_cast<std::uint32_t>(f)) != 0;
}

// Presentation and persistence of one variable.
struct CVarSpec {
  CVarFlag flags{CVarFlag::Archive};
  std::string_view help{};
};

// Alternative index matches CVarType.
using CVarValue = std::variant<bool, std::int64_t, double, std::string>;

struct CVar;
using CVarListener = std::function<void(const CVar&)>;

struct CVar {
  std::string name;
  std::string help;
  CVarType type{CVarType::String};
  CVarFlag flags{CVarFlag::None};
  CVarValue value{};
  CVarValue defaultValue{};
  std::vector<CVarListener> listeners;
};

const char* toString(CVarType type);

// Text form as saveFile() writes it; strings are quoted.
std::string formatValue(const CVar& var);

class CVarRegistry {
public:
  CVarRegistry() = default;
  CVarRegistry(const CVarRegistry&) = delete;
  CVarRegistry& operator=(const CVarRegistry&) = delete;

  // Redefining a name with the same type returns the existing variable
  // untouched; a different type is refused with nullptr.
  CVar* defineBool(std::string_view name, bool defaultValue, CVarSpec spec = {});
  CVar* defineInt(std::string_view name, std::int64_t defaultValue, CVarSpec spec = {});
  CVar* defineFloat(std::string_view name, double defaultValue, CVarSpec spec = {});
  CVar* defineString(std::string_view name, std::string defaultValue, CVarSpec spec = {});

  const CVar* find(std::string_view name) const;
  std::size_t size() const;

  // The fallback is returned for unknown names and type mismatches.
  // getFloat also reads Int variables.
  bool         getBool(std::string_view name, bool fallback = false) const;
  std::int64_t getInt(std::string_view name, std::int64_t fallback = 0) const;
  double       getFloat(std::string_view name, double fallback = 0.0) const;
  std::string  getString(std::string_view name, std::string_view fallback = {}) const;

  // Setters fail on unknown names, read-only variables, type mismatches and
  // non-finite floats. Listeners run after a successful change, unlocked.
  bool setBool(std::string_view name, bool v, std::string* outError = nullptr);
  bool setInt(std::string_view name, std::int64_t v, std::string* outError = nullptr);
  bool setFloat(std::string_view name, double v, std::string* outError = nullptr);
  bool setString(std::string_view name, std::string v, std::string* outError = nullptr);
  bool setFromString(std::string_view name, std::string_view text, std::string* outError = nullptr);
  bool reset(std::string_view name, std::string* outError = nullptr);

  bool addListener(std::string_view name, CVarListener listener, std::string* outError = nullptr);

  // Sorted by name. `filter` is a case-insensitive substring.
  std::vector<const CVar*> list(std::string_view filter = {}) const;

  // Applies every parsable line. Bad lines are collected into outError as
  // "path:line: reason" and make the call return false.
  bool loadFile(const std::string& path, std::string* outError = nullptr);
  bool saveFile(const std::string& path, std::string* outError = nullptr) const;

  bool hasPending(std::string_view name) const;
  std::optional<std::string> pendingValue(std::string_view name) const;

private:
  CVar* define(std::string_view name, CVarValue defaultValue, const CVarSpec& spec);
  bool store(std::string_view name, CVarValue v, std::string* outError);

  mutable std::mutex mutex_;
  std::map<std::string, CVar, std::less<>> vars_;
  std::map<std::string, std::string, std::less<>> pending_;
};

} // namespace asterism::core
