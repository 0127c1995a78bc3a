#include "fleet/parser/ArgumentParser.hh"

#include <algorithm>
#include <sstream>

namespace fleet {

void ArgumentParser::addArgument(const std::string& name, const std::string& description, bool takesValue) {
    specs.push_back(ArgumentSpec{name, description, takesValue});
}

Result<void> ArgumentParser::parse(int argc, const char* const* argv) {
    values.clear();

    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        auto spec = std::find_if(specs.begin(), specs.end(), [&arg](const ArgumentSpec& s) { return s.name == arg; });
        if (spec == specs.end()) {
            return Result<void>::error(ErrorCode::InvalidArgument, "unknown argument '" + arg + "'");
        }

        if (!spec->takesValue) {
            values[arg];
            continue;
        }

        if (i + 1 >= argc) {
            return Result<void>::error(ErrorCode::InvalidArgument, "argument '" + arg + "' requires a value");
        }
        values[arg].emplace_back(argv[++i]);
    }

    return Result<void>::ok();
}

bool ArgumentParser::hasArgument(const std::string& name) const {
    return values.find(name) != values.end();
}

std::string ArgumentParser::getValue(const std::string& name) const {
    auto it = values.find(name);
    if (it == values.end() || it->second.empty()) {
        return {};
    }
    return it->second.back();
}

std::vector<std::string> ArgumentParser::getValues(const std::string& name) const {
    auto it = values.find(name);
    if (it == values.end()) {
        return {};
    }
    return it->second;
}

std::string ArgumentParser::usage(const std::string& program) const {
    std::ostringstream oss;
    oss << "Usage: " << program << " [options]\n";
    oss << "Options:\n";
    for (const auto& spec : specs) {
        std::string left = spec.name + (spec.takesValue ? " <value>" : "");
        oss << "  " << left;
        if (left.size() < 22) {
            oss << std::string(22 - left.size(), ' ');
        } else {
            oss << "  ";
        }
        oss << spec.description << "\n";
    }
    return oss.str();
}

} // namespace fleet
