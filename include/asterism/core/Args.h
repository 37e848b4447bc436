#pragma once

#include <cstdint>
#include <map>
#include <set>
#include <string>
#include <string_view>
#include <vector>

namespace asterism::core {

// Command line of the sandbox tool. Recognised shapes:
//
//   --name value   option; the next word is its value unless it begins "--"
//   --name=value   option
//   --name         switch
//   --             the rest is positional
//
// Options may repeat; get() reports the last occurrence.
class Args {
public:
  Args() = default;
  Args(int argc, char** argv) { parse(argc, argv); }

  void parse(int argc, char** argv);

  const std::string& program() const { return program_; }
  const std::vector<std::string>& positional() const { return positional_; }

  bool hasFlag(std::string_view name) const { return switches_.count(name) != 0; }
  bool has(std::string_view name) const { return hasFlag(name) || options_.count(name) != 0; }

  // Every value given for `name` in order, or nullptr.
  const std::vector<std::string>* values(std::string_view name) const;

  // These leave `out` alone and return false when the option is absent or
  // its last value does not parse completely.
  bool get(std::string_view name, std::string& out) const;
  bool getInt(std::string_view name, std::int64_t& out) const;
  bool getDouble(std::string_view name, double& out) const;

private:
  std::string program_;
  std::map<std::string, std::vector<std::string>, std::less<>> options_;
  std::set<std::string, std::less<>> switches_;
  std::vector<std::string> positional_;
};

} // namespace asterism::core
