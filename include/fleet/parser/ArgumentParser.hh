#pragma once

#include "fleet/utils/ErrorHandling.hh"

#include <string>
#include <unordered_map>
#include <vector>

namespace fleet {

// Minimal "--flag" / "--option value" command-line parser. Options may repeat;
// every value is kept in order.
class ArgumentParser {
  public:
    void addArgument(const std::string& name, const std::string& description, bool takesValue = false);

    Result<void> parse(int argc, const char* const* argv);

    bool hasArgument(const std::string& name) const;

    // Last value given for an option, or empty when absent.
    std::string getValue(const std::string& name) const;
    std::vector<std::string> getValues(const std::string& name) const;

    std::string usage(const std::string& program) const;

  private:
    struct ArgumentSpec {
        std::string name;
        std::string description;
        bool takesValue = false;
    };

    std::vector<ArgumentSpec> specs;
    std::unordered_map<std::string, std::vector<std::string>> values;
};

} // namespace fleet
